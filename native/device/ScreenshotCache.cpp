/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "ScreenshotCache.h"
#include "../utils.hpp"
#include <xxhash.h>

namespace tapsight {

    ScreenCapture::ScreenCapture(std::string bytes, std::chrono::steady_clock::time_point capturedAt)
            : _bytes(std::move(bytes)), _capturedAt(capturedAt),
              _fingerprint(XXH64(_bytes.data(), _bytes.size(), 0)) {
    }

    ScreenshotCache::ScreenshotCache(DeviceCommanderPtr device, std::chrono::milliseconds ttl, Clock clock)
            : _device(std::move(device)), _ttl(ttl), _clock(std::move(clock)), _captureCount(0) {
        if (nullptr == this->_clock)
            this->_clock = []() { return std::chrono::steady_clock::now(); };
    }

    bool ScreenshotCache::isFresh(const ScreenCapturePtr &capture,
                                  std::chrono::steady_clock::time_point now) const {
        return nullptr != capture && now - capture->getCapturedAt() < this->_ttl;
    }

    ScreenCapturePtr ScreenshotCache::peek() const {
        return std::atomic_load(&this->_slot);
    }

    ScreenCapturePtr ScreenshotCache::get(bool force) {
        if (!force) {
            ScreenCapturePtr current = std::atomic_load(&this->_slot);
            if (this->isFresh(current, this->_clock()))
                return current;
        }
        std::lock_guard<std::mutex> captureLock(this->_captureMutex);
        if (!force) {
            // another reader may have refreshed while we waited
            ScreenCapturePtr current = std::atomic_load(&this->_slot);
            if (this->isFresh(current, this->_clock()))
                return current;
        }
        std::string bytes;
        try {
            this->_captureCount++;
            bytes = this->_device->captureScreenshot();
        } catch (const std::exception &ex) {
            BLOGE("screenshot capture failed: %s", ex.what());
            return nullptr;
        }
        if (bytes.empty()) {
            BLOGE("%s", "screenshot capture returned no data");
            return nullptr;
        }
        ScreenCapturePtr capture = std::make_shared<ScreenCapture>(std::move(bytes), this->_clock());
        std::atomic_store(&this->_slot, capture);
        BDLOG("screenshot cached, %zu bytes, fingerprint %016llx", capture->getBytes().size(),
              static_cast<unsigned long long>(capture->getFingerprint()));
        return capture;
    }

}
