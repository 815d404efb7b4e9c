/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ScreenshotCache_H_
#define ScreenshotCache_H_

#include "DeviceCommander.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace tapsight {

    /**
     * @brief One complete screen capture
     *
     * Never modified after construction; replaced as a whole.
     */
    class ScreenCapture {
    public:
        ScreenCapture(std::string bytes, std::chrono::steady_clock::time_point capturedAt);

        const std::string &getBytes() const { return this->_bytes; }

        std::chrono::steady_clock::time_point getCapturedAt() const { return this->_capturedAt; }

        /// xxHash64 of the bytes, used to key per-image work such as OCR passes
        uint64_t getFingerprint() const { return this->_fingerprint; }

    private:
        std::string _bytes;
        std::chrono::steady_clock::time_point _capturedAt;
        uint64_t _fingerprint;
    };

    typedef std::shared_ptr<const ScreenCapture> ScreenCapturePtr;

    /**
     * @brief Time-windowed single slot holding the latest screen capture
     *
     * Readers load the slot pointer atomically and either see the previous
     * capture or the complete new one. Captures are serialized by a mutex so
     * that concurrent expired reads cost one device round trip, not several.
     */
    class ScreenshotCache {
    public:
        typedef std::function<std::chrono::steady_clock::time_point()> Clock;

        /**
         * @param device source of captures
         * @param ttl how long a capture is served without a new round trip
         * @param clock time source, steady_clock::now when null
         */
        ScreenshotCache(DeviceCommanderPtr device, std::chrono::milliseconds ttl, Clock clock = nullptr);

        /**
         * @brief Current capture, taking a new one when the slot is expired or force is set
         *
         * @return nullptr when a needed capture failed; the old slot is kept in that case
         */
        ScreenCapturePtr get(bool force = false);

        /// Unconditional capture, used by the background pre-capture loop
        ScreenCapturePtr refresh() { return this->get(true); }

        /// Whatever the slot holds now, without any device round trip
        ScreenCapturePtr peek() const;

        /// Number of device captures issued so far
        int getCaptureCount() const { return this->_captureCount.load(); }

        std::chrono::milliseconds getTtl() const { return this->_ttl; }

    private:
        bool isFresh(const ScreenCapturePtr &capture, std::chrono::steady_clock::time_point now) const;

        DeviceCommanderPtr _device;
        std::chrono::milliseconds _ttl;
        Clock _clock;

        std::mutex _captureMutex;
        ScreenCapturePtr _slot;
        std::atomic<int> _captureCount;
    };

    typedef std::shared_ptr<ScreenshotCache> ScreenshotCachePtr;

}

#endif //ScreenshotCache_H_
