/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef VisionMatcher_H_
#define VisionMatcher_H_

#include "AbstractMatcher.h"
#include "../device/VisionEngine.h"

namespace tapsight {

    /**
     * @brief Tier 3: element localization by the vision model
     *
     * A result is accepted only with coordinates, a confidence strictly
     * above tapsight.vision.minConfidence and, when the screen size is
     * known, a point at least tapsight.vision.edgeMargin pixels away from
     * every screen edge.
     */
    class VisionMatcher : public AbstractMatcher {
    public:
        VisionMatcher(PreferencePtr preference, DeviceCommanderPtr device, VisionEnginePtr visionEngine);

        bool isAvailable() const override;

        ResolveTier getTier() const override { return ResolveTier::VISION; }

        /// Ask the model for an arbitrary description and tap it if the result passes the gate
        ResolvedTargetPtr locate(const std::string &description);

        bool accepts(const VisionResult &result, const ScreenSize &screenSize) const;

    protected:
        ResolvedTargetPtr doAttempt(const NormalizedQuery &query) override;

    private:
        ScreenSize currentScreenSize();

        VisionEnginePtr _visionEngine;
    };

    typedef std::shared_ptr<VisionMatcher> VisionMatcherPtr;

}

#endif //VisionMatcher_H_
