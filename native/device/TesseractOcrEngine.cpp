/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifdef TAPSIGHT_OCR_ENABLED

#include "TesseractOcrEngine.h"
#include "../utils.hpp"
#include <tesseract/baseapi.h>
#include <leptonica/allheaders.h>

namespace tapsight {

    TesseractOcrEngine::TesseractOcrEngine(const std::string &language, double minConfidence,
                                           const std::string &dataPath)
            : OcrEngine(minConfidence), _api(new tesseract::TessBaseAPI()), _available(false),
              _hasLastPass(false), _lastFingerprint(0) {
        const char *tessdata = dataPath.empty() ? nullptr : dataPath.c_str();
        if (this->_api->Init(tessdata, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
            BLOGE("could not initialize tesseract with language %s", language.c_str());
            this->_api.reset();
            return;
        }
        this->_api->SetPageSegMode(tesseract::PSM_SPARSE_TEXT);
        this->_available = true;
        BLOG("tesseract %s ready, language %s", tesseract::TessBaseAPI::Version(), language.c_str());
    }

    TesseractOcrEngine::~TesseractOcrEngine() {
        if (this->_api)
            this->_api->End();
    }

    OcrMatchPtrVec TesseractOcrEngine::extractText(const ScreenCapturePtr &capture) {
        if (!this->_available || nullptr == capture)
            return OcrMatchPtrVec();
        std::lock_guard<std::mutex> passLock(this->_passMutex);
        if (this->_hasLastPass && this->_lastFingerprint == capture->getFingerprint()) {
            BDLOG("%s", "reuse previous ocr pass");
            return this->_lastMatches;
        }
        this->_lastMatches = this->recognize(capture->getBytes());
        this->_lastFingerprint = capture->getFingerprint();
        this->_hasLastPass = true;
        return this->_lastMatches;
    }

    OcrMatchPtrVec TesseractOcrEngine::recognize(const std::string &imageBytes) {
        OcrMatchPtrVec matches;
        Pix *image = pixReadMem(reinterpret_cast<const l_uint8 *>(imageBytes.data()), imageBytes.size());
        if (nullptr == image) {
            BLOGE("%s", "screenshot is not a readable image");
            return matches;
        }
        this->_api->SetImage(image);
        if (this->_api->Recognize(nullptr) != 0) {
            BLOGE("%s", "tesseract recognition failed");
            pixDestroy(&image);
            return matches;
        }
        std::unique_ptr<tesseract::ResultIterator> iterator(this->_api->GetIterator());
        const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
        if (iterator) {
            do {
                std::unique_ptr<char[]> word(iterator->GetUTF8Text(level));
                if (!word)
                    continue;
                std::string text(word.get());
                trimString(text);
                float confidence = iterator->Confidence(level);
                if (text.empty() || confidence < OcrMinRunConfidence)
                    continue;
                int left = 0, top = 0, right = 0, bottom = 0;
                iterator->BoundingBox(level, &left, &top, &right, &bottom);
                matches.push_back(std::make_shared<OcrMatch>(text, confidence / 100.0,
                                                             Rect(left, top, right, bottom)));
            } while (iterator->Next(level));
        }
        this->_api->Clear();
        pixDestroy(&image);
        BDLOG("ocr pass found %zu text runs", matches.size());
        return matches;
    }

}

#endif //TAPSIGHT_OCR_ENABLED
