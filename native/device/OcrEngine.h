/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef OcrEngine_H_
#define OcrEngine_H_

#include "../desc/OcrMatch.h"
#include "ScreenshotCache.h"
#include <string>

namespace tapsight {

    /**
     * @brief Optical text recognition over a screen capture
     *
     * Subclasses only recognize text; the search rules shared by every
     * engine live here.
     */
    class OcrEngine {
    public:
        /// @param minConfidence recognized runs below this confidence (0-1) are never matched
        explicit OcrEngine(double minConfidence);

        /// False when the engine could not be initialized; the optical tier is skipped then
        virtual bool isAvailable() const = 0;

        /// Every recognized text run of the capture, with confidence in [0, 1]
        virtual OcrMatchPtrVec extractText(const ScreenCapturePtr &capture) = 0;

        /**
         * @brief Runs containing the query, case-insensitive
         *
         * @return matches sorted by recognition confidence, highest first
         */
        OcrMatchPtrVec findText(const ScreenCapturePtr &capture, const std::string &query);

        /**
         * @brief Runs whose similarity ratio to the query reaches threshold
         *
         * @return (ratio, match) pairs sorted by ratio, highest first
         */
        ScoredOcrMatchVec findTextFuzzy(const ScreenCapturePtr &capture, const std::string &query,
                                        double threshold);

        double getMinConfidence() const { return this->_minConfidence; }

        virtual ~OcrEngine() = default;

    private:
        double _minConfidence;
    };

    typedef std::shared_ptr<OcrEngine> OcrEnginePtr;

}

#endif //OcrEngine_H_
