/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "QueryNormalizer.h"
#include "../utils.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>

namespace tapsight {

    namespace {
        const std::regex &getOrdinalRegex() {
            static const std::regex r("^(?:the\\s+)?(\\w+)\\s+(.+)$");
            return r;
        }

        // Verbs that may lead an ordinal query; "open first aid kit" stays a label
        bool isTapVerb(const std::string &word) {
            static const std::set<std::string> tapVerbs = {"click", "tap", "select", "press", "touch"};
            return tapVerbs.count(word) > 0;
        }

        // Letters and digits only; everything else separates tokens
        std::vector<std::string> visualTokens(const std::string &text) {
            std::string spaced(text);
            for (char &ch: spaced) {
                if (!std::isalnum(static_cast<unsigned char>(ch)))
                    ch = ' ';
            }
            return splitWords(spaced);
        }
    }

    std::string NormalizedQuery::toString() const {
        std::string ordinalDesc = "none";
        if (this->ordinal)
            ordinalDesc = std::to_string(this->ordinal->position) + " '" + this->ordinal->itemType + "'";
        return "{working: '" + this->working + "', search: '" + this->searchText + "', vision: "
               + (this->requiresVision ? "true" : "false") + ", ordinal: " + ordinalDesc + "}";
    }

    QueryNormalizer::QueryNormalizer(PreferencePtr preference)
            : _preference(std::move(preference)) {
        if (nullptr == this->_preference)
            this->_preference = Preference::defaults();
    }

    NormalizedQueryPtr QueryNormalizer::normalize(const std::string &rawQuery) const {
        auto query = std::make_shared<NormalizedQuery>();
        query->raw = rawQuery;
        trimString(query->raw);
        query->working = joinWords(splitWords(toLowerCopy(query->raw)));
        if (query->working.empty())
            return query;
        query->ordinal = this->detectOrdinal(query->working);
        query->requiresVision = this->requiresVision(query->working);
        query->searchText = this->cleanSearchText(query->working);
        BDLOG("normalized %s", query->toString().c_str());
        return query;
    }

    int QueryNormalizer::ordinalPosition(const std::string &word) {
        static const std::map<std::string, int> ordinals = {
                {"first",  1},
                {"second", 2},
                {"third",  3},
                {"fourth", 4},
                {"fifth",  5},
                {"1st",    1},
                {"2nd",    2},
                {"3rd",    3},
                {"4th",    4},
                {"5th",    5},
                {"last",   LastPosition},
        };
        auto iter = ordinals.find(word);
        return iter == ordinals.end() ? 0 : iter->second;
    }

    OrdinalQueryPtr QueryNormalizer::detectOrdinal(const std::string &working) const {
        std::string candidate = working;
        std::vector<std::string> words = splitWords(working);
        // "tap the second video", "click on the last post"
        if (words.size() > 2 && isTapVerb(words[0])) {
            size_t skip = (words[1] == "on") ? 2 : 1;
            candidate = joinWords(std::vector<std::string>(words.begin() + skip, words.end()));
        }
        std::smatch result;
        if (!std::regex_match(candidate, result, getOrdinalRegex()) || result.size() < 3)
            return nullptr;
        int position = ordinalPosition(result[1].str());
        if (0 == position)
            return nullptr;
        std::string itemType = result[2].str();
        trimString(itemType);
        if (itemType.empty())
            return nullptr;
        return std::make_shared<OrdinalQuery>(position, itemType);
    }

    bool QueryNormalizer::requiresVision(const std::string &working) const {
        std::vector<std::string> tokens = visualTokens(working);
        for (const std::string &entry: this->_preference->getVisionOnlyWords()) {
            std::vector<std::string> phrase = visualTokens(entry);
            if (phrase.empty() || phrase.size() > tokens.size())
                continue;
            for (size_t start = 0; start + phrase.size() <= tokens.size(); start++) {
                if (std::equal(phrase.begin(), phrase.end(), tokens.begin() + start)) {
                    BDLOG("query '%s' needs vision for '%s'", working.c_str(), entry.c_str());
                    return true;
                }
            }
        }
        return false;
    }

    std::string QueryNormalizer::cleanSearchText(const std::string &working) const {
        std::vector<std::string> words = splitWords(working);
        std::vector<std::string> cleaned;
        for (const auto &word: words) {
            if (!this->_preference->isStripWord(word))
                cleaned.push_back(word);
        }
        if (cleaned.empty()) {
            for (const auto &word: words) {
                if (!this->_preference->isVerbWord(word))
                    cleaned.push_back(word);
            }
        }
        if (cleaned.empty())
            return working;
        return joinWords(cleaned);
    }

    std::string QueryNormalizer::ordinalPhrase(int position, const std::string &itemType) {
        static const char *const words[] = {"first", "second", "third", "fourth", "fifth"};
        std::string ordinalWord;
        if (LastPosition == position)
            ordinalWord = "last";
        else if (position >= 1 && position <= 5)
            ordinalWord = words[position - 1];
        else
            ordinalWord = std::to_string(position) + "th";
        return "the " + ordinalWord + " " + itemType;
    }

}
