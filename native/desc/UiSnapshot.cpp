/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "UiSnapshot.h"
#include "../utils.hpp"
#include <map>
#include <sstream>

namespace tapsight {

    UiSnapshot::UiSnapshot(const UIElementPtr &root)
            : _root(root) {
        if (nullptr == root)
            return;
        this->_elements.push_back(root);
        root->recursiveElements([](const UIElementPtr &) { return true; }, this->_elements);
    }

    UiSnapshot::UiSnapshot(UIElementPtrVec elements)
            : _elements(std::move(elements)) {
    }

    UiSnapshotPtr UiSnapshot::fromXml(const std::string &xmlContent) {
        UIElementPtr root = UIElement::createFromXml(xmlContent);
        if (nullptr == root)
            return nullptr;
        return std::make_shared<UiSnapshot>(root);
    }

    std::vector<std::string> UiSnapshot::visibleTexts() const {
        std::vector<std::string> texts;
        for (const auto &element: this->_elements) {
            if (element->getText().size() > 1)
                texts.push_back(element->getText());
        }
        return texts;
    }

    std::string UiSnapshot::describe() const {
        if (this->_elements.empty())
            return "Unable to analyze screen (UI tree empty)";

        std::map<std::string, int> packageCounts;
        std::string mainPackage;
        int buttons = 0, textViews = 0, images = 0;
        std::vector<std::string> texts;
        for (const auto &element: this->_elements) {
            const std::string &package = element->getPackageName();
            if (!package.empty()) {
                int count = ++packageCounts[package];
                if (mainPackage.empty() || count > packageCounts[mainPackage])
                    mainPackage = package;
            }
            const std::string &clazz = element->getClassname();
            if (clazz.find("Button") != std::string::npos) buttons++;
            if (clazz.find("TextView") != std::string::npos) textViews++;
            if (clazz.find("Image") != std::string::npos) images++;
            if (element->getText().size() > 1 && element->getBounds().width() > 50)
                texts.push_back(element->getText());
        }

        std::stringstream description;
        description << "Screen Analysis:\n";
        description << "- App: " << (mainPackage.empty() ? "unknown" : mainPackage) << "\n";
        description << "- Elements: " << buttons << " buttons, " << textViews << " text views, "
                    << images << " images\n";
        if (!texts.empty()) {
            description << "- Visible text (" << texts.size() << " items):\n";
            for (size_t i = 0; i < texts.size() && i < DescribeMaxTexts; i++) {
                description << "  " << (i + 1) << ". " << texts[i] << "\n";
            }
            if (texts.size() > DescribeMaxTexts)
                description << "  ... and " << (texts.size() - DescribeMaxTexts) << " more\n";
        }
        return description.str();
    }

}
