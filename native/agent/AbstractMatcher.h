/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef AbstractMatcher_H_
#define AbstractMatcher_H_

#include "../Base.h"
#include "../desc/ResolvedTarget.h"
#include "../device/DeviceCommander.h"
#include "../events/Preference.h"
#include "../query/QueryNormalizer.h"

namespace tapsight {

    /**
     * @brief Base class of every resolution tier
     *
     * A matcher looks for the element a query describes and, when its own
     * acceptance gate passes, taps it and returns the ResolvedTarget. A
     * matcher never returns a target below its gate and never throws:
     * attempt() is the tier boundary where transport faults and any other
     * std::exception are logged and turned into a miss.
     *
     * Subclasses implement:
     * - getTier(): which cascade step this is
     * - doAttempt(): the tier's matching algorithm
     * - isAvailable(): whether the collaborators the tier needs are usable
     */
    class AbstractMatcher {
    public:
        /**
         * @brief Run this tier once for the query
         *
         * @return the tapped target, or nullptr when the tier found nothing it
         *         trusts or failed
         */
        ResolvedTargetPtr attempt(const NormalizedQuery &query);

        /// Tiers whose collaborator is missing are skipped by the cascade
        virtual bool isAvailable() const { return true; }

        virtual ResolveTier getTier() const = 0;

        const std::string &getName() const { return tierName[this->getTier()]; }

        virtual ~AbstractMatcher() = default;

    protected:
        AbstractMatcher(PreferencePtr preference, DeviceCommanderPtr device);

        virtual ResolvedTargetPtr doAttempt(const NormalizedQuery &query) = 0;

        /// Issue the tap and build the result; only called once the gate has passed
        ResolvedTargetPtr tapAndResolve(const Point &point, const std::string &label, double score);

        PreferencePtr _preference;
        DeviceCommanderPtr _device;
    };

    typedef std::shared_ptr<AbstractMatcher> AbstractMatcherPtr;
    typedef std::vector<AbstractMatcherPtr> AbstractMatcherPtrVec;

}

#endif //AbstractMatcher_H_
