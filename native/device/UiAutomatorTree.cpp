/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "UiAutomatorTree.h"
#include "../utils.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace tapsight {

    namespace {
        const char *const UiDumpPath = "/sdcard/ui_dump.xml";

        int roundToBucket(int side) {
            return static_cast<int>(std::nearbyint(static_cast<double>(side) / ListItemSizeBucket))
                   * ListItemSizeBucket;
        }
    }

    UiAutomatorTree::UiAutomatorTree(DeviceCommanderPtr device)
            : _device(std::move(device)) {
    }

    UiSnapshotPtr UiAutomatorTree::captureTree() {
        this->_device->shell(std::string("uiautomator dump ") + UiDumpPath);
        std::string xmlContent = this->_device->shell(std::string("cat ") + UiDumpPath);
        // the dump is written on one line; drop anything adb put before the prolog
        auto start = xmlContent.find('<');
        if (start == std::string::npos) {
            BLOGE("%s", "ui dump has no xml content");
            return nullptr;
        }
        UiSnapshotPtr snapshot = UiSnapshot::fromXml(xmlContent.substr(start));
        if (nullptr == snapshot || snapshot->empty()) {
            BLOGE("%s", "ui dump could not be parsed");
            return nullptr;
        }
        BDLOG("captured ui tree with %zu elements", snapshot->size());
        return snapshot;
    }

    UIElementPtrVec UiAutomatorTree::detectListItems(const std::string &itemType) {
        UIElementPtrVec items = selectListItems(this->captureTree());
        BLOG("found %zu '%s' items via ui tree", items.size(), itemType.c_str());
        for (size_t i = 0; i < items.size() && i < 3; i++) {
            BDLOG("  #%zu: %s %s", i + 1, items[i]->getLabel().substr(0, 50).c_str(),
                  items[i]->getBounds().toString().c_str());
        }
        return items;
    }

    UIElementPtrVec UiAutomatorTree::selectListItems(const UiSnapshotPtr &snapshot) {
        if (nullptr == snapshot)
            return UIElementPtrVec();
        std::vector<std::pair<std::pair<int, int>, UIElementPtrVec>> groups;
        for (const auto &element: snapshot->getElements()) {
            int width = element->getBounds().width();
            int height = element->getBounds().height();
            if (width < ListItemMinSide || height < ListItemMinSide)
                continue;
            if (width > ListItemMaxWidth || height > ListItemMaxHeight)
                continue;
            std::pair<int, int> sizeKey(roundToBucket(width), roundToBucket(height));
            auto groupIter = std::find_if(groups.begin(), groups.end(),
                                          [&sizeKey](const std::pair<std::pair<int, int>, UIElementPtrVec> &group) {
                                              return group.first == sizeKey;
                                          });
            if (groupIter == groups.end())
                groups.emplace_back(sizeKey, UIElementPtrVec{element});
            else
                groupIter->second.push_back(element);
        }
        const UIElementPtrVec *largest = nullptr;
        for (const auto &group: groups) {
            if (nullptr == largest || group.second.size() > largest->size())
                largest = &group.second;
        }
        if (nullptr == largest || largest->size() < ListItemMinCount)
            return UIElementPtrVec();
        UIElementPtrVec items(*largest);
        std::stable_sort(items.begin(), items.end(), [](const UIElementPtr &a, const UIElementPtr &b) {
            if (a->getBounds().top != b->getBounds().top)
                return a->getBounds().top < b->getBounds().top;
            return a->getBounds().left < b->getBounds().left;
        });
        return items;
    }

}
