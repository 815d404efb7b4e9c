/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef OrdinalItemFinder_H_
#define OrdinalItemFinder_H_

#include "AbstractMatcher.h"
#include "VisionMatcher.h"
#include "../device/UiTreeSource.h"

namespace tapsight {

    /**
     * @brief Resolves "the Nth <item type>" queries
     *
     * Uses the tree source's list item detection first. When the position
     * is not in the detected list and vision is available, the query is
     * asked again in words ("the second video") through the vision tier and
     * its gate.
     */
    class OrdinalItemFinder : public AbstractMatcher {
    public:
        /// @param visionMatcher may be null
        OrdinalItemFinder(PreferencePtr preference, DeviceCommanderPtr device, UiTreeSourcePtr treeSource,
                          VisionMatcherPtr visionMatcher);

        ResolveTier getTier() const override { return ResolveTier::ORDINAL_LIST; }

        /**
         * @brief List index for a 1-based position or LastPosition
         *
         * @return -1 when the position falls outside a list of this size
         */
        static int resolveIndex(int position, size_t size);

    protected:
        ResolvedTargetPtr doAttempt(const NormalizedQuery &query) override;

    private:
        UiTreeSourcePtr _treeSource;
        VisionMatcherPtr _visionMatcher;
    };

}

#endif //OrdinalItemFinder_H_
