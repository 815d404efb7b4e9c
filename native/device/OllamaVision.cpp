/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "OllamaVision.h"
#include "../utils.hpp"
#include <cmath>
#include <regex>
#include <stdexcept>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace tapsight {

    namespace {
        // Screen assumed in prompts until the device reports its own size
        const ScreenSize DefaultScreenHint{1080, 2400};

        const long ProbeTimeoutSec = 5;
        const long ConnectTimeoutSec = 5;
        const double TextCoordinateConfidence = 0.6;
        const double UnparsedReplyConfidence = 0.3;

        size_t writeCallback(void *contents, size_t size, size_t nmemb, std::string *output) {
            size_t totalSize = size * nmemb;
            output->append(static_cast<char *>(contents), totalSize);
            return totalSize;
        }

        const std::vector<std::regex> &getCoordinateRegexes() {
            static const std::vector<std::regex> patterns = {
                    std::regex("coordinates?\\s*\\(?\\s*(\\d+)\\s*,\\s*(\\d+)\\s*\\)?", std::regex::icase),
                    std::regex("position\\s*\\(?\\s*(\\d+)\\s*,\\s*(\\d+)\\s*\\)?", std::regex::icase),
                    std::regex("x\\s*[:=]\\s*(\\d+).*?y\\s*[:=]\\s*(\\d+)", std::regex::icase),
                    std::regex("\\((\\d+)\\s*,\\s*(\\d+)\\)", std::regex::icase),
            };
            return patterns;
        }

        bool insideScreen(int x, int y, const ScreenSize &screenSize) {
            if (!screenSize.isKnown())
                return true;
            return x >= 0 && x <= screenSize.width && y >= 0 && y <= screenSize.height;
        }
    }

    OllamaVision::OllamaVision(PreferencePtr preference, ScreenshotCachePtr screenshots)
            : _preference(std::move(preference)), _screenshots(std::move(screenshots)), _available(false),
              _screenSize(DefaultScreenHint), _stopRequested(false), _capturing(false) {
        static std::once_flag curlInitOnce;
        std::call_once(curlInitOnce, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    OllamaVision::~OllamaVision() {
        this->stopBackgroundCapture();
    }

    bool OllamaVision::httpRequest(const std::string &path, const std::string *body, std::string &response,
                                   long timeoutSec) const {
        CURL *curl = curl_easy_init();
        if (nullptr == curl) {
            BLOGE("%s", "curl_easy_init failed");
            return false;
        }
        std::string url = this->_preference->getVisionEndpoint() + path;
        struct curl_slist *headers = nullptr;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSec);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, ConnectTimeoutSec);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (nullptr != body) {
            headers = curl_slist_append(headers, "Content-Type: application/json");
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        }
        CURLcode res = curl_easy_perform(curl);
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        if (res != CURLE_OK) {
            BLOGE("request %s failed: %s", url.c_str(), curl_easy_strerror(res));
            return false;
        }
        if (httpCode != 200) {
            BLOGE("request %s answered http %ld", url.c_str(), httpCode);
            return false;
        }
        return true;
    }

    bool OllamaVision::probeServer() const {
        std::string response;
        if (!this->httpRequest("/api/tags", nullptr, response, ProbeTimeoutSec)) {
            LOGW("could not connect to ollama at %s", this->_preference->getVisionEndpoint().c_str());
            return false;
        }
        const std::string &model = this->_preference->getVisionModel();
        try {
            nlohmann::json tags = nlohmann::json::parse(response);
            auto models = tags.find("models");
            if (models != tags.end() && models->is_array()) {
                for (const auto &entry: *models) {
                    std::string name = getJsonValue<std::string>(entry, "name", "");
                    if (name.find(model) != std::string::npos)
                        return true;
                }
            }
        } catch (const nlohmann::json::exception &ex) {
            BLOGE("parse ollama tags error happened: id,%d: %s", ex.id, ex.what());
            return false;
        }
        LOGW("model '%s' not found locally, run: ollama pull %s", model.c_str(), model.c_str());
        return false;
    }

    bool OllamaVision::isAvailable() const {
        std::call_once(this->_probeOnce, [this]() {
            this->_available = this->probeServer();
            BLOG("vision model %s available: %d", this->_preference->getVisionModel().c_str(),
                 this->_available);
        });
        return this->_available;
    }

    void OllamaVision::setScreenSize(const ScreenSize &screenSize) {
        if (!screenSize.isKnown())
            return;
        std::lock_guard<std::mutex> lock(this->_sizeMutex);
        this->_screenSize = screenSize;
    }

    ScreenSize OllamaVision::getScreenSize() const {
        std::lock_guard<std::mutex> lock(this->_sizeMutex);
        return this->_screenSize;
    }

    std::string OllamaVision::buildFindPrompt(const std::string &description, const ScreenSize &screenSize) {
        const std::string width = std::to_string(screenSize.width);
        const std::string height = std::to_string(screenSize.height);
        return "You are analyzing a mobile app screenshot (resolution: " + width + "x" + height + ").\n"
               "\n"
               "Find the element: \"" + description + "\"\n"
               "\n"
               "Respond ONLY with valid JSON in this exact format:\n"
               "{\n"
               "    \"found\": true/false,\n"
               "    \"x\": pixel_x_coordinate,\n"
               "    \"y\": pixel_y_coordinate,\n"
               "    \"confidence\": 0-100,\n"
               "    \"description\": \"brief description of what you found\"\n"
               "}\n"
               "\n"
               "Rules:\n"
               "- x must be between 0 and " + width + "\n"
               "- y must be between 0 and " + height + "\n"
               "- If not found, set found=false and omit x,y\n"
               "- Return ONLY the JSON, no other text";
    }

    PointPtr OllamaVision::extractCoordinatesFromText(const std::string &text, const ScreenSize &screenSize) {
        for (const auto &pattern: getCoordinateRegexes()) {
            std::smatch result;
            if (!std::regex_search(text, result, pattern) || result.size() < 3)
                continue;
            try {
                int x = std::stoi(result[1].str());
                int y = std::stoi(result[2].str());
                if (insideScreen(x, y, screenSize))
                    return std::make_shared<Point>(x, y);
            } catch (const std::out_of_range &) {
                continue;
            }
        }
        return nullptr;
    }

    VisionResultPtr OllamaVision::parseFindResponse(const std::string &content, const std::string &description,
                                                    const ScreenSize &screenSize) {
        auto open = content.find('{');
        auto close = content.rfind('}');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            try {
                nlohmann::json data = nlohmann::json::parse(content.substr(open, close - open + 1));
                if (data.is_object()) {
                    if (!getJsonValue<bool>(data, "found", false))
                        return std::make_shared<VisionResult>("Could not find: " + description, 0.0);
                    double confidence = getJsonValue<double>(data, "confidence", 50.0) / 100.0;
                    std::string found = getJsonValue<std::string>(data, "description", description);
                    auto xIter = data.find("x");
                    auto yIter = data.find("y");
                    if (xIter == data.end() || yIter == data.end()
                        || !xIter->is_number() || !yIter->is_number()) {
                        return std::make_shared<VisionResult>(found, confidence);
                    }
                    int x = static_cast<int>(std::lround(xIter->get<double>()));
                    int y = static_cast<int>(std::lround(yIter->get<double>()));
                    if (!insideScreen(x, y, screenSize)) {
                        LOGW("vision coordinates (%d, %d) outside %dx%d", x, y, screenSize.width, screenSize.height);
                        return std::make_shared<VisionResult>(found, confidence);
                    }
                    return std::make_shared<VisionResult>(found, Point(x, y), confidence);
                }
            } catch (const nlohmann::json::exception &ex) {
                BDLOG("vision reply is not json: %s", ex.what());
            }
        }
        PointPtr coordinates = extractCoordinatesFromText(content, screenSize);
        if (nullptr != coordinates)
            return std::make_shared<VisionResult>(description, *coordinates, TextCoordinateConfidence);
        return std::make_shared<VisionResult>(content, UnparsedReplyConfidence);
    }

    VisionResultPtr OllamaVision::findElement(const std::string &description) {
        if (!this->isAvailable())
            return std::make_shared<VisionResult>("Vision model not available", 0.0);
        ScreenCapturePtr capture = this->_screenshots->get();
        if (nullptr == capture)
            return std::make_shared<VisionResult>("No screenshot available", 0.0);

        ScreenSize screenSize = this->getScreenSize();
        nlohmann::json request;
        request["model"] = this->_preference->getVisionModel();
        request["stream"] = false;
        request["options"] = {{"temperature", 0.1}};
        nlohmann::json message;
        message["role"] = "user";
        message["content"] = buildFindPrompt(description, screenSize);
        message["images"] = nlohmann::json::array({base64Encode(capture->getBytes())});
        request["messages"] = nlohmann::json::array({message});
        std::string body = request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        BLOG("asking %s for '%s'", this->_preference->getVisionModel().c_str(), description.c_str());
        std::string response;
        if (!this->httpRequest("/api/chat", &body, response, this->_preference->getVisionTimeoutSec()))
            throw std::runtime_error("ollama chat request failed");

        std::string content;
        try {
            nlohmann::json reply = nlohmann::json::parse(response);
            content = reply.at("message").at("content").get<std::string>();
        } catch (const nlohmann::json::exception &ex) {
            BLOGE("parse ollama reply error happened: id,%d: %s", ex.id, ex.what());
            return std::make_shared<VisionResult>("Unreadable vision reply", 0.0);
        }
        trimString(content);
        logLongStringInfo(content);
        return parseFindResponse(content, description, screenSize);
    }

    void OllamaVision::startBackgroundCapture() {
        std::lock_guard<std::mutex> lock(this->_loopMutex);
        if (this->_captureThread.joinable())
            return;
        this->_stopRequested = false;
        this->_capturing = true;
        this->_captureThread = std::thread(&OllamaVision::captureLoop, this);
        BLOG("background capture started, every %d ms", this->_preference->getVisionPrecaptureIntervalMs());
    }

    void OllamaVision::stopBackgroundCapture() {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(this->_loopMutex);
            this->_stopRequested = true;
            worker = std::move(this->_captureThread);
        }
        this->_loopCondition.notify_all();
        if (worker.joinable()) {
            worker.join();
            BLOG("%s", "background capture stopped");
        }
        this->_capturing = false;
    }

    void OllamaVision::captureLoop() {
        const std::chrono::milliseconds interval(this->_preference->getVisionPrecaptureIntervalMs());
        std::unique_lock<std::mutex> lock(this->_loopMutex);
        while (!this->_stopRequested) {
            lock.unlock();
            this->_screenshots->refresh();
            lock.lock();
            this->_loopCondition.wait_for(lock, interval, [this]() { return this->_stopRequested; });
        }
    }

}
