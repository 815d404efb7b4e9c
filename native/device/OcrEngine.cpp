/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "OcrEngine.h"
#include "../utils.hpp"
#include <algorithm>

namespace tapsight {

    OcrEngine::OcrEngine(double minConfidence)
            : _minConfidence(minConfidence) {
    }

    OcrMatchPtrVec OcrEngine::findText(const ScreenCapturePtr &capture, const std::string &query) {
        OcrMatchPtrVec results;
        if (nullptr == capture || query.empty())
            return results;
        std::string queryLower = toLowerCopy(query);
        for (const auto &match: this->extractText(capture)) {
            if (match->confidence < this->_minConfidence)
                continue;
            if (toLowerCopy(match->text).find(queryLower) != std::string::npos)
                results.push_back(match);
        }
        std::stable_sort(results.begin(), results.end(), [](const OcrMatchPtr &a, const OcrMatchPtr &b) {
            return a->confidence > b->confidence;
        });
        BDLOG("ocr exact search '%s': %zu hits", query.c_str(), results.size());
        return results;
    }

    ScoredOcrMatchVec OcrEngine::findTextFuzzy(const ScreenCapturePtr &capture, const std::string &query,
                                               double threshold) {
        ScoredOcrMatchVec results;
        if (nullptr == capture || query.empty())
            return results;
        std::string queryLower = toLowerCopy(query);
        for (const auto &match: this->extractText(capture)) {
            if (match->confidence < this->_minConfidence)
                continue;
            double similarity = sequenceSimilarity(queryLower, toLowerCopy(match->text));
            if (similarity >= threshold)
                results.emplace_back(similarity, match);
        }
        std::stable_sort(results.begin(), results.end(),
                         [](const std::pair<double, OcrMatchPtr> &a, const std::pair<double, OcrMatchPtr> &b) {
                             return a.first > b.first;
                         });
        BDLOG("ocr fuzzy search '%s' at %.2f: %zu hits", query.c_str(), threshold, results.size());
        return results;
    }

}
