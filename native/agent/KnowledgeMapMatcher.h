/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef KnowledgeMapMatcher_H_
#define KnowledgeMapMatcher_H_

#include "AbstractMatcher.h"
#include "../device/UiTreeSource.h"

namespace tapsight {

    /**
     * @brief Tier 0: canonical action words mapped to known accessibility labels
     *
     * "subscribe" is looked up in the knowledge map, then the first
     * clickable element whose content description contains (or is contained
     * by) one of the key's labels is tapped. Matches are definitional and
     * carry score 1.0.
     */
    class KnowledgeMapMatcher : public AbstractMatcher {
    public:
        KnowledgeMapMatcher(PreferencePtr preference, DeviceCommanderPtr device, UiTreeSourcePtr treeSource);

        ResolveTier getTier() const override { return ResolveTier::KNOWLEDGE_MAP; }

        /// Exact key first, then the first key contained in the query or containing it
        const KnowledgeEntry *lookup(const std::string &searchText) const;

    protected:
        ResolvedTargetPtr doAttempt(const NormalizedQuery &query) override;

    private:
        UiTreeSourcePtr _treeSource;
    };

}

#endif //KnowledgeMapMatcher_H_
