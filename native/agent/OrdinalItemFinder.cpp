/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "OrdinalItemFinder.h"
#include "../utils.hpp"

namespace tapsight {

    OrdinalItemFinder::OrdinalItemFinder(PreferencePtr preference, DeviceCommanderPtr device,
                                         UiTreeSourcePtr treeSource, VisionMatcherPtr visionMatcher)
            : AbstractMatcher(std::move(preference), std::move(device)), _treeSource(std::move(treeSource)),
              _visionMatcher(std::move(visionMatcher)) {
    }

    int OrdinalItemFinder::resolveIndex(int position, size_t size) {
        long index = -1;
        if (position > 0)
            index = position - 1;
        else if (LastPosition == position)
            index = static_cast<long>(size) - 1;
        if (index < 0 || index >= static_cast<long>(size))
            return -1;
        return static_cast<int>(index);
    }

    ResolvedTargetPtr OrdinalItemFinder::doAttempt(const NormalizedQuery &query) {
        if (!query.isOrdinal())
            return nullptr;
        const int position = query.ordinal->position;
        const std::string &itemType = query.ordinal->itemType;
        BLOG("finding #%d %s", position, itemType.c_str());

        UIElementPtrVec items;
        try {
            items = this->_treeSource->detectListItems(itemType);
        } catch (const std::exception &ex) {
            BLOGE("list item detection failed, no items: %s", ex.what());
        }
        int index = resolveIndex(position, items.size());
        if (index >= 0) {
            const UIElementPtr &item = items[static_cast<size_t>(index)];
            return this->tapAndResolve(item->getCenter(), item->getLabel(), 1.0);
        }
        BDLOG("position %d not in %zu detected items", position, items.size());

        if (nullptr != this->_visionMatcher && this->_visionMatcher->isAvailable()) {
            std::string phrase = QueryNormalizer::ordinalPhrase(position, itemType);
            BLOG("using vision for '%s'", phrase.c_str());
            ResolvedTargetPtr target = this->_visionMatcher->locate(phrase);
            if (nullptr != target)
                return target;
        }
        BLOGE("could not find #%d %s", position, itemType.c_str());
        return nullptr;
    }

}
