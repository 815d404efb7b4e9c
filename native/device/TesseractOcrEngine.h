/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef TesseractOcrEngine_H_
#define TesseractOcrEngine_H_

#ifdef TAPSIGHT_OCR_ENABLED

#include "OcrEngine.h"
#include <mutex>
#include <string>

namespace tesseract {
    class TessBaseAPI;
}

namespace tapsight {

    /**
     * @brief OcrEngine running Tesseract in sparse text mode
     *
     * The last pass is kept and reused while the same capture (by
     * fingerprint) is asked for again.
     */
    class TesseractOcrEngine : public OcrEngine {
    public:
        /**
         * @param language traineddata name, e.g. "eng"
         * @param minConfidence see OcrEngine
         * @param dataPath tessdata directory, empty for the library default
         */
        TesseractOcrEngine(const std::string &language, double minConfidence,
                           const std::string &dataPath = "");

        bool isAvailable() const override { return this->_available; }

        OcrMatchPtrVec extractText(const ScreenCapturePtr &capture) override;

        ~TesseractOcrEngine() override;

    private:
        OcrMatchPtrVec recognize(const std::string &imageBytes);

        std::unique_ptr<tesseract::TessBaseAPI> _api;
        bool _available;

        std::mutex _passMutex;
        bool _hasLastPass;
        uint64_t _lastFingerprint;
        OcrMatchPtrVec _lastMatches;
    };

}

#endif //TAPSIGHT_OCR_ENABLED

#endif //TesseractOcrEngine_H_
