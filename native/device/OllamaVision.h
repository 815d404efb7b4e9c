/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef OllamaVision_H_
#define OllamaVision_H_

#include "VisionEngine.h"
#include "ScreenshotCache.h"
#include "../events/Preference.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace tapsight {

    /**
     * @brief VisionEngine talking to a local Ollama server
     *
     * Screenshots come from the shared ScreenshotCache. While background
     * capture runs, one worker thread refreshes that cache every
     * precapture interval so findElement usually finds a warm capture.
     */
    class OllamaVision : public VisionEngine {
    public:
        OllamaVision(PreferencePtr preference, ScreenshotCachePtr screenshots);

        /// Probes the server once: reachable and the configured model is pulled
        bool isAvailable() const override;

        VisionResultPtr findElement(const std::string &description) override;

        void setScreenSize(const ScreenSize &screenSize) override;

        ScreenSize getScreenSize() const;

        void startBackgroundCapture() override;

        /// Wakes and joins the worker; safe to call when it is not running
        void stopBackgroundCapture() override;

        bool isCapturing() const { return this->_capturing.load(); }

        ~OllamaVision() override;

        /// JSON-only localization prompt for one element description
        static std::string buildFindPrompt(const std::string &description, const ScreenSize &screenSize);

        /**
         * @brief Turn the model's reply into a VisionResult
         *
         * The reply should be {"found", "x", "y", "confidence" (0-100), "description"}.
         * When no JSON object can be read, coordinates are pulled from free
         * text with confidence 0.6. Coordinates outside a known screen are dropped.
         */
        static VisionResultPtr parseFindResponse(const std::string &content, const std::string &description,
                                                 const ScreenSize &screenSize);

        /// Free-text coordinate patterns: "coordinates (x, y)", "position x, y", "x: .. y: ..", "(x, y)"
        static PointPtr extractCoordinatesFromText(const std::string &text, const ScreenSize &screenSize);

    protected:
        bool probeServer() const;

        /// GET when body is null, JSON POST otherwise; false on any transport or HTTP error
        bool httpRequest(const std::string &path, const std::string *body, std::string &response,
                         long timeoutSec) const;

    private:
        void captureLoop();

        PreferencePtr _preference;
        ScreenshotCachePtr _screenshots;

        mutable std::once_flag _probeOnce;
        mutable bool _available;

        mutable std::mutex _sizeMutex;
        ScreenSize _screenSize;

        std::mutex _loopMutex;
        std::condition_variable _loopCondition;
        bool _stopRequested;
        std::atomic<bool> _capturing;
        std::thread _captureThread;
    };

    typedef std::shared_ptr<OllamaVision> OllamaVisionPtr;

}

#endif //OllamaVision_H_
