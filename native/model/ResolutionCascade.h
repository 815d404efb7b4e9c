/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ResolutionCascade_H_
#define ResolutionCascade_H_

#include "../agent/MatcherFactory.h"
#include "../query/QueryNormalizer.h"
#include <string>
#include <vector>

namespace tapsight {

    /**
     * @brief Turns a natural-language query into a tap, cheapest tier first
     *
     * Order of one resolution:
     * 1. normalize the query
     * 2. ordinal queries ("the second video") go to the ordinal item finder only
     * 3. vision-only queries ("red car") go to the vision tier only
     * 4. otherwise knowledge map, ui tree, ocr, vision, skipping tiers whose
     *    collaborator is unavailable
     *
     * Every tier runs at most once and the first success ends the
     * resolution. The tap is issued by the succeeding tier. Resolution runs
     * on the caller's thread; the only concurrent activity is the optional
     * background screenshot refresh of the vision engine.
     */
    class ResolutionCascade {
    public:
        /**
         * @brief Wire a cascade
         *
         * @param ocrEngine optional, null disables the optical tier
         * @param visionEngine optional, null disables the vision tier
         * @param screenshots shared capture cache; created from device when null
         */
        static std::shared_ptr<ResolutionCascade> create(const PreferencePtr &preference,
                                                         const DeviceCommanderPtr &device,
                                                         const UiTreeSourcePtr &treeSource,
                                                         const OcrEnginePtr &ocrEngine,
                                                         const VisionEnginePtr &visionEngine,
                                                         ScreenshotCachePtr screenshots = nullptr);

        explicit ResolutionCascade(const MatcherContext &context);

        /// @return true when some tier accepted a target and tapped it
        bool resolveAndTap(const std::string &query);

        /// Same as resolveAndTap, reporting what was tapped
        ResolvedTargetPtr resolve(const std::string &query);

        /// Texts longer than one character on the current screen; empty when the tree cannot be read
        std::vector<std::string> listVisibleText();

        /// Summary of the current screen for diagnostics
        std::string describeScreen();

        /// Start the vision engine's background screenshot refresh
        void startWatching();

        void stopWatching();

        const QueryNormalizer &getNormalizer() const { return this->_normalizer; }

        virtual ~ResolutionCascade();

    protected:
        ResolvedTargetPtr resolveNormalized(const NormalizedQuery &query);

    private:
        UiSnapshotPtr captureTreeSafely();

        MatcherContext _context;
        QueryNormalizer _normalizer;
        AbstractMatcherPtrVec _cascade;
        AbstractMatcherPtr _visionMatcher;
        AbstractMatcherPtr _ordinalFinder;
    };

    typedef std::shared_ptr<ResolutionCascade> ResolutionCascadePtr;

}

#endif //ResolutionCascade_H_
