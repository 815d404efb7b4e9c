/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef OcrMatch_H_
#define OcrMatch_H_

#include "../Base.h"
#include <string>
#include <utility>
#include <vector>

namespace tapsight {

    /**
     * @brief One recognized text run of a screenshot's OCR pass
     */
    class OcrMatch : public Serializable {
    public:
        OcrMatch(std::string text, double confidence, const Rect &bounds)
                : text(std::move(text)), confidence(confidence), bounds(bounds) {}

        Point center() const { return this->bounds.center(); }

        std::string toString() const override {
            return "OcrMatch(text='" + this->text + "', conf=" + std::to_string(this->confidence)
                   + ", bounds=" + this->bounds.toString() + ")";
        }

        std::string text;

        /// Recognition confidence in [0, 1]
        double confidence;

        Rect bounds;
    };

    typedef std::shared_ptr<OcrMatch> OcrMatchPtr;
    typedef std::vector<OcrMatchPtr> OcrMatchPtrVec;
    /// (similarity, match) pairs produced by fuzzy search, best first
    typedef std::vector<std::pair<double, OcrMatchPtr>> ScoredOcrMatchVec;

}

#endif //OcrMatch_H_
