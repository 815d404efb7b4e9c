/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "OcrMatcher.h"
#include "../utils.hpp"

namespace tapsight {

    OcrMatcher::OcrMatcher(PreferencePtr preference, DeviceCommanderPtr device, OcrEnginePtr ocrEngine,
                           ScreenshotCachePtr screenshots)
            : AbstractMatcher(std::move(preference), std::move(device)), _ocrEngine(std::move(ocrEngine)),
              _screenshots(std::move(screenshots)) {
    }

    bool OcrMatcher::isAvailable() const {
        return nullptr != this->_ocrEngine && nullptr != this->_screenshots && this->_ocrEngine->isAvailable();
    }

    ResolvedTargetPtr OcrMatcher::doAttempt(const NormalizedQuery &query) {
        if (query.searchText.empty())
            return nullptr;
        ScreenCapturePtr capture = this->_screenshots->get();
        if (nullptr == capture) {
            LOGW("%s", "no screenshot, optical tier has no evidence");
            return nullptr;
        }
        OcrMatchPtrVec exact = this->_ocrEngine->findText(capture, query.searchText);
        if (!exact.empty()) {
            const OcrMatchPtr &match = exact.front();
            return this->tapAndResolve(match->center(), match->text, match->confidence);
        }
        ScoredOcrMatchVec fuzzy = this->_ocrEngine->findTextFuzzy(capture, query.searchText,
                                                                  this->_preference->getOcrFuzzyThreshold());
        if (!fuzzy.empty()) {
            const OcrMatchPtr &match = fuzzy.front().second;
            return this->tapAndResolve(match->center(), match->text, fuzzy.front().first);
        }
        return nullptr;
    }

}
