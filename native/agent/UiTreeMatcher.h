/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef UiTreeMatcher_H_
#define UiTreeMatcher_H_

#include "AbstractMatcher.h"
#include "../device/UiTreeSource.h"
#include <set>

namespace tapsight {

    /**
     * @brief Tier 1: text and content description search over a fresh tree capture
     *
     * Three passes, first hit wins:
     * 1. query is a substring of an element's text
     * 2. query is a substring of an element's content description
     * 3. best word-overlap score, accepted at tapsight.uiTree.minScore
     *
     * The overlap score is the fraction of query words found in the
     * element's text and description words, plus a bonus when that combined
     * text is long (content rather than chrome) and a bonus when the element
     * is clickable. Bonuses count toward the acceptance floor.
     */
    class UiTreeMatcher : public AbstractMatcher {
    public:
        UiTreeMatcher(PreferencePtr preference, DeviceCommanderPtr device, UiTreeSourcePtr treeSource);

        ResolveTier getTier() const override { return ResolveTier::UI_TREE; }

        /// 0 when the element shares no word with the query or has no text at all
        static double overlapScore(const std::set<std::string> &queryWords, const UIElement &element,
                                   const Preference &preference);

    protected:
        ResolvedTargetPtr doAttempt(const NormalizedQuery &query) override;

    private:
        UiTreeSourcePtr _treeSource;
    };

}

#endif //UiTreeMatcher_H_
