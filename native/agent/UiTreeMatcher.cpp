/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "UiTreeMatcher.h"
#include "../utils.hpp"

namespace tapsight {

    UiTreeMatcher::UiTreeMatcher(PreferencePtr preference, DeviceCommanderPtr device, UiTreeSourcePtr treeSource)
            : AbstractMatcher(std::move(preference), std::move(device)), _treeSource(std::move(treeSource)) {
    }

    double UiTreeMatcher::overlapScore(const std::set<std::string> &queryWords, const UIElement &element,
                                       const Preference &preference) {
        if (queryWords.empty())
            return 0.0;
        const std::string &text = element.getText();
        const std::string &desc = element.getContentDesc();
        std::vector<std::string> elementWords = splitWords(toLowerCopy(text) + " " + toLowerCopy(desc));
        if (elementWords.empty())
            return 0.0;
        std::set<std::string> elementWordSet(elementWords.begin(), elementWords.end());
        size_t overlap = 0;
        for (const auto &word: queryWords) {
            if (elementWordSet.count(word) > 0)
                overlap++;
        }
        if (0 == overlap)
            return 0.0;
        double score = static_cast<double>(overlap) / static_cast<double>(queryWords.size());
        // the separator used for tokenizing is not part of the length
        if (text.size() + desc.size() > static_cast<size_t>(preference.getUiTreeLongTextLength()))
            score += preference.getUiTreeLongTextBonus();
        if (element.getClickable())
            score += preference.getUiTreeClickableBonus();
        return score;
    }

    ResolvedTargetPtr UiTreeMatcher::doAttempt(const NormalizedQuery &query) {
        const std::string &searchText = query.searchText;
        if (searchText.empty())
            return nullptr;
        UiSnapshotPtr snapshot = this->_treeSource->captureTree();
        if (nullptr == snapshot || snapshot->empty()) {
            LOGW("%s", "ui tree is empty!");
            return nullptr;
        }
        BDLOG("checking %zu elements in ui tree", snapshot->size());

        for (const auto &element: snapshot->getElements()) {
            if (!element->getText().empty()
                && toLowerCopy(element->getText()).find(searchText) != std::string::npos)
                return this->tapAndResolve(element->getCenter(), element->getText(), 1.0);
        }
        for (const auto &element: snapshot->getElements()) {
            if (!element->getContentDesc().empty()
                && toLowerCopy(element->getContentDesc()).find(searchText) != std::string::npos)
                return this->tapAndResolve(element->getCenter(), element->getContentDesc(), 1.0);
        }

        std::vector<std::string> words = splitWords(searchText);
        std::set<std::string> queryWords(words.begin(), words.end());
        UIElementPtr bestElement = nullptr;
        double bestScore = 0.0;
        for (const auto &element: snapshot->getElements()) {
            double score = overlapScore(queryWords, *element, *this->_preference);
            if (score > bestScore) {
                bestScore = score;
                bestElement = element;
            }
        }
        if (nullptr == bestElement || bestScore < this->_preference->getUiTreeMinScore()) {
            BDLOG("best overlap %.2f is below %.2f", bestScore, this->_preference->getUiTreeMinScore());
            return nullptr;
        }
        std::string label = bestElement->getText().empty() ? bestElement->getContentDesc() : bestElement->getText();
        return this->tapAndResolve(bestElement->getCenter(), label, bestScore);
    }

}
