/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "KnowledgeMapMatcher.h"
#include "../utils.hpp"

namespace tapsight {

    KnowledgeMapMatcher::KnowledgeMapMatcher(PreferencePtr preference, DeviceCommanderPtr device,
                                             UiTreeSourcePtr treeSource)
            : AbstractMatcher(std::move(preference), std::move(device)), _treeSource(std::move(treeSource)) {
    }

    const KnowledgeEntry *KnowledgeMapMatcher::lookup(const std::string &searchText) const {
        if (searchText.empty())
            return nullptr;
        const KnowledgeEntry *exact = this->_preference->findKnowledge(searchText);
        if (nullptr != exact)
            return exact;
        for (const auto &entry: this->_preference->getKnowledge()) {
            if (searchText.find(entry.first) != std::string::npos
                || entry.first.find(searchText) != std::string::npos)
                return &entry;
        }
        return nullptr;
    }

    ResolvedTargetPtr KnowledgeMapMatcher::doAttempt(const NormalizedQuery &query) {
        const KnowledgeEntry *known = this->lookup(query.searchText);
        if (nullptr == known)
            return nullptr;
        BDLOG("knowledge key '%s' for '%s'", known->first.c_str(), query.searchText.c_str());

        UiSnapshotPtr snapshot = this->_treeSource->captureTree();
        if (nullptr == snapshot || snapshot->empty()) {
            LOGW("%s", "ui tree is empty, knowledge map has no evidence");
            return nullptr;
        }
        std::vector<std::string> labels;
        for (const auto &label: known->second)
            labels.push_back(toLowerCopy(label));

        for (const auto &element: snapshot->getElements()) {
            if (element->getContentDesc().empty())
                continue;
            if (!element->getClickable() && !element->isButton())
                continue;
            std::string desc = toLowerCopy(element->getContentDesc());
            for (const auto &label: labels) {
                if (desc.find(label) != std::string::npos || label.find(desc) != std::string::npos) {
                    return this->tapAndResolve(element->getCenter(), element->getContentDesc(), 1.0);
                }
            }
        }
        return nullptr;
    }

}
