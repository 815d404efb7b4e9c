/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef OcrMatcher_H_
#define OcrMatcher_H_

#include "AbstractMatcher.h"
#include "../device/OcrEngine.h"
#include "../device/ScreenshotCache.h"

namespace tapsight {

    /**
     * @brief Tier 2: text recognized on the cached screenshot
     *
     * Exact (substring) search first, then fuzzy search at
     * tapsight.ocr.fuzzyThreshold. The best hit of whichever search finds
     * something is tapped.
     */
    class OcrMatcher : public AbstractMatcher {
    public:
        OcrMatcher(PreferencePtr preference, DeviceCommanderPtr device, OcrEnginePtr ocrEngine,
                   ScreenshotCachePtr screenshots);

        bool isAvailable() const override;

        ResolveTier getTier() const override { return ResolveTier::OCR; }

    protected:
        ResolvedTargetPtr doAttempt(const NormalizedQuery &query) override;

    private:
        OcrEnginePtr _ocrEngine;
        ScreenshotCachePtr _screenshots;
    };

}

#endif //OcrMatcher_H_
