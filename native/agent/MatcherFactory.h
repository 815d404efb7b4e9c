/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef MatcherFactory_H_
#define MatcherFactory_H_

#include "AbstractMatcher.h"
#include "../device/OcrEngine.h"
#include "../device/ScreenshotCache.h"
#include "../device/UiTreeSource.h"
#include "../device/VisionEngine.h"

namespace tapsight {

    /**
     * @brief Collaborators shared by every tier of one cascade
     *
     * ocrEngine and visionEngine may be null; the tiers that need them then
     * report themselves unavailable.
     */
    struct MatcherContext {
        PreferencePtr preference;
        DeviceCommanderPtr device;
        UiTreeSourcePtr treeSource;
        OcrEnginePtr ocrEngine;
        VisionEnginePtr visionEngine;
        ScreenshotCachePtr screenshots;
    };

    /**
     * @brief Builds the matcher of each tier
     */
    class MatcherFactory {
    public:
        /**
         * @brief Create the matcher of one tier
         *
         * ORDINAL_LIST gets its own vision matcher for the worded fallback.
         */
        static AbstractMatcherPtr create(ResolveTier tier, const MatcherContext &context);

        /// The general cascade in cost order: knowledge map, ui tree, ocr, vision
        static AbstractMatcherPtrVec createCascade(const MatcherContext &context);
    };

}

#endif //MatcherFactory_H_
