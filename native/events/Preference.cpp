/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include <stdexcept>
#include "../utils.hpp"
#include "Preference.h"
#include <nlohmann/json.hpp>

namespace tapsight {

    namespace {
        const std::vector<KnowledgeEntry> &defaultKnowledge() {
            static const std::vector<KnowledgeEntry> knowledge = {
                    {"send",          {"Send",          "send message",      "Send message"}},
                    {"search",        {"Search",        "search",            "Search button"}},
                    {"back",          {"Back",          "Navigate up",       "Go back"}},
                    {"close",         {"Close",         "Dismiss",           "Cancel"}},
                    {"more",          {"More options",  "More",              "Overflow"}},
                    {"menu",          {"More options",  "Menu",              "Navigation"}},
                    {"settings",      {"Settings",      "Preferences"}},
                    {"play",          {"Play",          "Play video"}},
                    {"pause",         {"Pause",         "Pause video"}},
                    {"like",          {"Like",          "Like button",       "Heart"}},
                    {"share",         {"Share",         "Share button"}},
                    {"subscribe",     {"Subscribe",     "Subscribe button",  "SUBSCRIBE"}},
                    {"unsubscribe",   {"Unsubscribe",   "Unsubscribe button", "UNSUBSCRIBE"}},
                    {"follow",        {"Follow",        "FOLLOW"}},
                    {"unfollow",      {"Unfollow",      "Unfollow button",   "UNFOLLOW"}},
                    {"download",      {"Download",      "Save"}},
                    {"shutter",       {"Shutter",       "Capture",           "Take photo"}},
                    {"switch camera", {"Switch camera", "Flip"}},
                    {"flash",         {"Flash",         "Flash toggle"}},
                    {"add",           {"Add",           "Create",            "New", "Compose"}},
                    {"delete",        {"Delete",        "Remove",            "Trash"}},
                    {"edit",          {"Edit",          "Modify"}},
                    {"save",          {"Save",          "Done"}},
                    {"cancel",        {"Cancel",        "Dismiss"}},
                    {"refresh",       {"Refresh",       "Reload"}},
                    {"comment",       {"Comment",       "Comments"}},
                    {"profile",       {"Profile",       "Account",           "Avatar"}},
                    {"home",          {"Home",          "Home tab"}},
                    {"notifications", {"Notifications", "Alerts"}},
                    {"copy",          {"Copy",          "Copy link",         "Copy text"}},
                    {"paste",         {"Paste"}},
                    {"forward",       {"Forward"}},
                    {"reply",         {"Reply"}},
                    {"attach",        {"Attach",        "Attachment",        "Attach file"}},
            };
            return knowledge;
        }

        const std::set<std::string> DefaultStripWords = {
                "click", "tap", "select", "press", "on", "the", "a", "an",
                "that", "this", "with", "video", "post", "button", "icon",
                "link", "image", "photo", "picture", "thumbnail", "item",
                "reel", "story", "pin", "result", "it",
        };

        const std::set<std::string> DefaultVerbWords = {
                "click", "tap", "select", "press", "open", "find", "choose",
        };

        const std::vector<std::string> DefaultVisionOnlyWords = {
                "red", "blue", "green", "yellow", "orange", "purple", "pink",
                "color", "colored", "car", "cat", "dog", "person", "face",
                "photo of", "image of", "picture of", "thumbnail",
        };

        double parseDouble(const std::string &key, const std::string &value, double fallback) {
            try {
                size_t used = 0;
                double parsed = std::stod(value, &used);
                if (used == value.size())
                    return parsed;
            } catch (const std::exception &ex) {
                BDLOG("config %s: %s", key.c_str(), ex.what());
            }
            LOGW("config %s has invalid number '%s', keep %f", key.c_str(), value.c_str(), fallback);
            return fallback;
        }

        long parseLong(const std::string &key, const std::string &value, long fallback) {
            try {
                size_t used = 0;
                long parsed = std::stol(value, &used);
                if (used == value.size())
                    return parsed;
            } catch (const std::exception &ex) {
                BDLOG("config %s: %s", key.c_str(), ex.what());
            }
            LOGW("config %s has invalid integer '%s', keep %ld", key.c_str(), value.c_str(), fallback);
            return fallback;
        }

        std::vector<std::string> readWordList(const nlohmann::json &array) {
            std::vector<std::string> words;
            for (const auto &item: array) {
                if (!item.is_string())
                    continue;
                std::string word = toLowerCopy(item.get<std::string>());
                trimString(word);
                if (!word.empty())
                    words.push_back(word);
            }
            return words;
        }
    }

#define UiTreeMinScoreSTR        "tapsight.uiTree.minScore"
#define UiTreeLongTextBonusSTR   "tapsight.uiTree.longTextBonus"
#define UiTreeLongTextLengthSTR  "tapsight.uiTree.longTextLength"
#define UiTreeClickableBonusSTR  "tapsight.uiTree.clickableBonus"
#define OcrFuzzyThresholdSTR     "tapsight.ocr.fuzzyThreshold"
#define OcrMinConfidenceSTR      "tapsight.ocr.minConfidence"
#define OcrLanguageSTR           "tapsight.ocr.language"
#define VisionMinConfidenceSTR   "tapsight.vision.minConfidence"
#define VisionEdgeMarginSTR      "tapsight.vision.edgeMargin"
#define VisionModelSTR           "tapsight.vision.model"
#define VisionEndpointSTR        "tapsight.vision.endpoint"
#define VisionTimeoutSTR         "tapsight.vision.timeoutSec"
#define VisionPrecaptureSTR      "tapsight.vision.precaptureIntervalMs"
#define ScreenshotTtlSTR         "tapsight.screenshot.ttlMs"
#define AdbPathSTR               "tapsight.adb.path"
#define AdbSerialSTR             "tapsight.adb.serial"

    Preference::Preference()
            : _stripWords(DefaultStripWords), _verbWords(DefaultVerbWords),
              _visionOnlyWords(DefaultVisionOnlyWords),
              _uiTreeMinScore(0.5), _uiTreeLongTextBonus(0.1), _uiTreeLongTextLength(20),
              _uiTreeClickableBonus(0.05),
              _ocrFuzzyThreshold(0.7), _ocrMinConfidence(0.6), _ocrLanguage("eng"),
              _visionMinConfidence(0.4), _visionEdgeMargin(10), _visionModel("llava-phi3"),
              _visionEndpoint("http://127.0.0.1:11434"), _visionTimeoutSec(60),
              _visionPrecaptureIntervalMs(1500),
              _screenshotTtlMs(3000), _adbPath("adb") {
        this->setKnowledge(defaultKnowledge());
    }

    PreferencePtr Preference::defaults() {
        static const PreferencePtr builtIn = std::make_shared<Preference>();
        return builtIn;
    }

    PreferencePtr Preference::load(const std::string &baseConfigPath, const std::string &knowledgePath) {
        std::string configContent;
        std::string knowledgeContent;
        if (!baseConfigPath.empty()) {
            configContent = loadFileContent(baseConfigPath);
            if (configContent.empty())
                LOGW("base config %s is missing or empty, using defaults", baseConfigPath.c_str());
        }
        if (!knowledgePath.empty()) {
            knowledgeContent = loadFileContent(knowledgePath);
            if (knowledgeContent.empty())
                LOGW("knowledge file %s is missing or empty, using built-in map", knowledgePath.c_str());
        }
        return parse(configContent, knowledgeContent);
    }

    PreferencePtr Preference::parse(const std::string &baseConfigContent, const std::string &knowledgeContent) {
        auto preference = std::make_shared<Preference>();
        preference->loadBaseConfig(baseConfigContent);
        preference->loadKnowledge(knowledgeContent);
        return preference;
    }

    const KnowledgeEntry *Preference::findKnowledge(const std::string &key) const {
        auto iter = this->_knowledgeIndex.find(key);
        if (iter == this->_knowledgeIndex.end())
            return nullptr;
        return &this->_knowledge[iter->second];
    }

    void Preference::setKnowledge(std::vector<KnowledgeEntry> knowledge) {
        this->_knowledge = std::move(knowledge);
        this->_knowledgeIndex.clear();
        for (size_t i = 0; i < this->_knowledge.size(); i++) {
            // first definition of a key wins, like the lookup order
            this->_knowledgeIndex.emplace(this->_knowledge[i].first, i);
        }
    }

    void Preference::loadBaseConfig(const std::string &configContent) {
        if (configContent.empty())
            return;
        std::vector<std::string> lines;
        splitString(configContent, lines, '\n');
        for (std::string line: lines) {
            trimString(line);
            if (line.empty() || line[0] == '#')
                continue;
            auto separator = line.find('=');
            if (separator == std::string::npos)
                continue;
            std::string key = line.substr(0, separator);
            std::string value = line.substr(separator + 1);
            trimString(key);
            trimString(value);
            BDLOG("base config key:-%s- value:-%s-", key.c_str(), value.c_str());
            if (UiTreeMinScoreSTR == key) {
                this->_uiTreeMinScore = parseDouble(key, value, this->_uiTreeMinScore);
            } else if (UiTreeLongTextBonusSTR == key) {
                this->_uiTreeLongTextBonus = parseDouble(key, value, this->_uiTreeLongTextBonus);
            } else if (UiTreeLongTextLengthSTR == key) {
                this->_uiTreeLongTextLength = static_cast<int>(parseLong(key, value, this->_uiTreeLongTextLength));
            } else if (UiTreeClickableBonusSTR == key) {
                this->_uiTreeClickableBonus = parseDouble(key, value, this->_uiTreeClickableBonus);
            } else if (OcrFuzzyThresholdSTR == key) {
                this->_ocrFuzzyThreshold = parseDouble(key, value, this->_ocrFuzzyThreshold);
            } else if (OcrMinConfidenceSTR == key) {
                this->_ocrMinConfidence = parseDouble(key, value, this->_ocrMinConfidence);
            } else if (OcrLanguageSTR == key) {
                if (!value.empty())
                    this->_ocrLanguage = value;
            } else if (VisionMinConfidenceSTR == key) {
                this->_visionMinConfidence = parseDouble(key, value, this->_visionMinConfidence);
            } else if (VisionEdgeMarginSTR == key) {
                this->_visionEdgeMargin = static_cast<int>(parseLong(key, value, this->_visionEdgeMargin));
            } else if (VisionModelSTR == key) {
                if (!value.empty())
                    this->_visionModel = value;
            } else if (VisionEndpointSTR == key) {
                if (!value.empty())
                    this->_visionEndpoint = value;
            } else if (VisionTimeoutSTR == key) {
                this->_visionTimeoutSec = parseLong(key, value, this->_visionTimeoutSec);
            } else if (VisionPrecaptureSTR == key) {
                this->_visionPrecaptureIntervalMs = static_cast<int>(parseLong(key, value,
                                                                               this->_visionPrecaptureIntervalMs));
            } else if (ScreenshotTtlSTR == key) {
                this->_screenshotTtlMs = static_cast<int>(parseLong(key, value, this->_screenshotTtlMs));
            } else if (AdbPathSTR == key) {
                if (!value.empty())
                    this->_adbPath = value;
            } else if (AdbSerialSTR == key) {
                this->_adbSerial = value;
            } else {
                LOGW("unknown base config key %s", key.c_str());
            }
        }
    }

    void Preference::loadKnowledge(const std::string &knowledgeContent) {
        if (knowledgeContent.empty())
            return;
        try {
            nlohmann::json knowledgeJson = nlohmann::json::parse(knowledgeContent);
            if (!knowledgeJson.is_object()) {
                BLOGE("%s", "knowledge file must hold a json object");
                return;
            }
            auto knowledgeIter = knowledgeJson.find("knowledge");
            if (knowledgeIter != knowledgeJson.end() && knowledgeIter->is_array()) {
                std::vector<KnowledgeEntry> knowledge;
                for (const auto &entry: *knowledgeIter) {
                    std::string key = toLowerCopy(getJsonValue<std::string>(entry, "key", ""));
                    trimString(key);
                    auto labelsIter = entry.find("labels");
                    if (key.empty() || labelsIter == entry.end() || !labelsIter->is_array()) {
                        LOGW("skip knowledge entry %s", entry.dump().c_str());
                        continue;
                    }
                    std::vector<std::string> labels;
                    for (const auto &label: *labelsIter) {
                        if (label.is_string() && !label.get<std::string>().empty())
                            labels.push_back(label.get<std::string>());
                    }
                    if (labels.empty())
                        continue;
                    knowledge.emplace_back(key, labels);
                }
                BLOG("loaded %zu knowledge keys", knowledge.size());
                this->setKnowledge(std::move(knowledge));
            }
            auto stripIter = knowledgeJson.find("stripWords");
            if (stripIter != knowledgeJson.end() && stripIter->is_array()) {
                std::vector<std::string> words = readWordList(*stripIter);
                this->_stripWords = std::set<std::string>(words.begin(), words.end());
            }
            auto verbIter = knowledgeJson.find("verbWords");
            if (verbIter != knowledgeJson.end() && verbIter->is_array()) {
                std::vector<std::string> words = readWordList(*verbIter);
                this->_verbWords = std::set<std::string>(words.begin(), words.end());
            }
            auto visionIter = knowledgeJson.find("visionOnlyWords");
            if (visionIter != knowledgeJson.end() && visionIter->is_array()) {
                this->_visionOnlyWords = readWordList(*visionIter);
            }
        } catch (const nlohmann::json::exception &ex) {
            BLOGE("parse knowledge file error happened: id,%d: %s", ex.id, ex.what());
        }
    }

}
