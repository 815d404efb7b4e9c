/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Preference_H_
#define Preference_H_

#include "../Base.h"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tapsight {

    class Preference;

    typedef std::shared_ptr<const Preference> PreferencePtr;

    /// Canonical action key and its ordered accessibility label synonyms
    typedef std::pair<std::string, std::vector<std::string>> KnowledgeEntry;

    /**
     * @brief Run-time configuration of the resolver
     *
     * Built once at startup from an optional key=value base config and an
     * optional JSON knowledge file, then shared read-only. Every lookup table
     * the matchers use (knowledge map, stop words, verbs, visual lexicon) and
     * every tier threshold lives here.
     *
     * Base config keys (prefix "tapsight."):
     *   uiTree.minScore, uiTree.longTextBonus, uiTree.longTextLength, uiTree.clickableBonus,
     *   ocr.fuzzyThreshold, ocr.minConfidence, ocr.language,
     *   vision.minConfidence, vision.edgeMargin, vision.model, vision.endpoint,
     *   vision.timeoutSec, vision.precaptureIntervalMs,
     *   screenshot.ttlMs, adb.path, adb.serial
     *
     * Knowledge file:
     *   {"knowledge": [{"key": "send", "labels": ["Send", "Send message"]}, ...],
     *    "stripWords": [...], "verbWords": [...], "visionOnlyWords": [...]}
     * Any section that is present replaces the built-in one.
     */
    class Preference {
    public:
        /// Built-in knowledge map, lexicons and thresholds
        static PreferencePtr defaults();

        /**
         * @brief Read both files and overlay them on the defaults
         *
         * An empty path, a missing file or a malformed file leaves the
         * corresponding defaults in place and is logged.
         */
        static PreferencePtr load(const std::string &baseConfigPath, const std::string &knowledgePath);

        /// Same as load() but from in-memory contents
        static PreferencePtr parse(const std::string &baseConfigContent, const std::string &knowledgeContent);

        Preference();

        const std::vector<KnowledgeEntry> &getKnowledge() const { return this->_knowledge; }

        /// Entry of an exact knowledge key, nullptr when the key is unknown
        const KnowledgeEntry *findKnowledge(const std::string &key) const;

        bool isStripWord(const std::string &word) const { return this->_stripWords.count(word) > 0; }

        bool isVerbWord(const std::string &word) const { return this->_verbWords.count(word) > 0; }

        /// Single words and multi-word phrases that only a vision model can resolve
        const std::vector<std::string> &getVisionOnlyWords() const { return this->_visionOnlyWords; }

        double getUiTreeMinScore() const { return this->_uiTreeMinScore; }

        double getUiTreeLongTextBonus() const { return this->_uiTreeLongTextBonus; }

        int getUiTreeLongTextLength() const { return this->_uiTreeLongTextLength; }

        double getUiTreeClickableBonus() const { return this->_uiTreeClickableBonus; }

        double getOcrFuzzyThreshold() const { return this->_ocrFuzzyThreshold; }

        double getOcrMinConfidence() const { return this->_ocrMinConfidence; }

        const std::string &getOcrLanguage() const { return this->_ocrLanguage; }

        double getVisionMinConfidence() const { return this->_visionMinConfidence; }

        int getVisionEdgeMargin() const { return this->_visionEdgeMargin; }

        const std::string &getVisionModel() const { return this->_visionModel; }

        const std::string &getVisionEndpoint() const { return this->_visionEndpoint; }

        long getVisionTimeoutSec() const { return this->_visionTimeoutSec; }

        int getVisionPrecaptureIntervalMs() const { return this->_visionPrecaptureIntervalMs; }

        int getScreenshotTtlMs() const { return this->_screenshotTtlMs; }

        const std::string &getAdbPath() const { return this->_adbPath; }

        const std::string &getAdbSerial() const { return this->_adbSerial; }

    protected:
        void loadBaseConfig(const std::string &configContent);

        void loadKnowledge(const std::string &knowledgeContent);

        void setKnowledge(std::vector<KnowledgeEntry> knowledge);

    private:
        std::vector<KnowledgeEntry> _knowledge;
        std::map<std::string, size_t> _knowledgeIndex;

        std::set<std::string> _stripWords;
        std::set<std::string> _verbWords;
        std::vector<std::string> _visionOnlyWords;

        double _uiTreeMinScore;
        double _uiTreeLongTextBonus;
        int _uiTreeLongTextLength;
        double _uiTreeClickableBonus;

        double _ocrFuzzyThreshold;
        double _ocrMinConfidence;
        std::string _ocrLanguage;

        double _visionMinConfidence;
        int _visionEdgeMargin;
        std::string _visionModel;
        std::string _visionEndpoint;
        long _visionTimeoutSec;
        int _visionPrecaptureIntervalMs;

        int _screenshotTtlMs;

        std::string _adbPath;
        std::string _adbSerial;
    };

}

#endif //Preference_H_
