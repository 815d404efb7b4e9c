/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef UiSnapshot_H_
#define UiSnapshot_H_

#include "UIElement.h"
#include <string>
#include <vector>

namespace tapsight {

    /**
     * @brief Flat, document-ordered view of one accessibility tree capture
     *
     * Elements appear in the order uiautomator wrote them (root first, then a
     * pre-order walk), which is also the order matchers scan them in.
     */
    class UiSnapshot {
    public:
        explicit UiSnapshot(const UIElementPtr &root);

        explicit UiSnapshot(UIElementPtrVec elements);

        const UIElementPtrVec &getElements() const { return this->_elements; }

        const UIElementPtr &getRoot() const { return this->_root; }

        bool empty() const { return this->_elements.empty(); }

        size_t size() const { return this->_elements.size(); }

        /// Visible labels longer than one character, in document order
        std::vector<std::string> visibleTexts() const;

        /// Human-readable summary used by diagnostic dumps
        std::string describe() const;

        static std::shared_ptr<UiSnapshot> fromXml(const std::string &xmlContent);

    private:
        UIElementPtr _root;
        UIElementPtrVec _elements;
    };

    typedef std::shared_ptr<UiSnapshot> UiSnapshotPtr;

}

#endif //UiSnapshot_H_
