/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef UIElement_H_
#define UIElement_H_

#include "../Base.h"
#include <string>
#include <utility>
#include <vector>
#include <memory>
#include <functional>

namespace tinyxml2 {
    class XMLElement;

    class XMLDocument;
}


namespace tapsight {

    class UIElement;

    typedef std::shared_ptr<UIElement> UIElementPtr;
    typedef std::vector<UIElementPtr> UIElementPtrVec;

    /**
     * @brief One accessible node of a uiautomator hierarchy dump
     *
     * A UIElement is an immutable snapshot of the node at capture time. The
     * whole tree is owned by one capture cycle and is replaced, never mutated,
     * by the next capture.
     */
    class UIElement : public Serializable, public std::enable_shared_from_this<UIElement> {
    public:
        UIElement();

        /// Build a detached leaf, mostly for tests and synthetic trees
        UIElement(std::string text, std::string contentDesc, std::string classname,
                  const Rect &bounds, bool clickable);

        const std::vector<UIElementPtr> &getChildren() const { return this->_children; }

        std::weak_ptr<UIElement> getParent() const { return this->_parent; }

        /// Pre-order walk of every descendant, collecting those accepted by func
        void recursiveElements(const std::function<bool(const UIElementPtr &)> &func,
                               std::vector<UIElementPtr> &result) const;

        const std::string &getClassname() const { return this->_classname; }

        const std::string &getResourceID() const { return this->_resourceID; }

        const std::string &getText() const { return this->_text; }

        const std::string &getContentDesc() const { return this->_contentDesc; }

        const std::string &getPackageName() const { return this->_packageName; }

        const Rect &getBounds() const { return this->_bounds; }

        Point getCenter() const { return this->_bounds.center(); }

        int getIndex() const { return this->_index; }

        bool getClickable() const { return this->_clickable; }

        bool getScrollable() const { return this->_scrollable; }

        bool getCheckable() const { return this->_checkable; }

        bool getChecked() const { return this->_checked; }

        bool getEnable() const { return this->_enabled; }

        bool isButton() const;

        /// Text, then content description, then class name: the first non-empty one
        std::string getLabel() const;

        std::string toJson() const;

        std::string toString() const override;

        /**
         * @brief Parse a uiautomator dump
         *
         * @return Root of the tree (the <hierarchy> node), or nullptr when the
         *         content is empty or not well-formed XML
         */
        static UIElementPtr createFromXml(const std::string &xmlContent);

        static UIElementPtr createFromXml(const tinyxml2::XMLDocument &doc);

        /// Parse "[l,t][r,b]"; anything malformed yields an empty rect
        static Rect parseBounds(const char *boundsStr);

        virtual ~UIElement() = default;

    protected:
        void fromXMLNode(const tinyxml2::XMLElement *xmlNode,
                         const std::shared_ptr<UIElement> &parentOfNode);

        std::string _resourceID;
        std::string _classname;
        std::string _packageName;
        std::string _text;
        std::string _contentDesc;

        bool _enabled;
        bool _checked;
        bool _checkable;
        bool _clickable;
        bool _scrollable;
        int _index;

        Rect _bounds;
        std::vector<std::shared_ptr<UIElement> > _children;
        std::weak_ptr<UIElement> _parent;
    };

}

#endif //UIElement_H_
