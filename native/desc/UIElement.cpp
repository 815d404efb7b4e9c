/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef UIElement_CPP_
#define UIElement_CPP_

#include "../utils.hpp"
#include "UIElement.h"
#include <tinyxml2.h>
#include <nlohmann/json.hpp>


namespace tapsight {

    /// Parse one integer (optional '-', then digits) and advance p past it. Used for bounds "[xl,yl][xr,yr]".
    static bool parseIntAndAdvance(const char *&p, int &value) {
        bool neg = (*p == '-');
        if (neg) ++p;
        if (*p < '0' || *p > '9')
            return false;
        int v = 0;
        while (*p >= '0' && *p <= '9')
            v = v * 10 + (*p++ - '0');
        value = neg ? -v : v;
        return true;
    }

    UIElement::UIElement()
            : _enabled(false), _checked(false), _checkable(false), _clickable(false),
              _scrollable(false), _index(0) {
    }

    UIElement::UIElement(std::string text, std::string contentDesc, std::string classname,
                         const Rect &bounds, bool clickable)
            : _classname(std::move(classname)), _text(std::move(text)),
              _contentDesc(std::move(contentDesc)),
              _enabled(true), _checked(false), _checkable(false), _clickable(clickable),
              _scrollable(false), _index(0), _bounds(bounds) {
    }

    void UIElement::recursiveElements(const std::function<bool(const UIElementPtr &)> &func,
                                      std::vector<UIElementPtr> &result) const {
        if (func == nullptr)
            return;
        for (const auto &child: this->_children) {
            if (func(child)) {
                result.push_back(child);
            }
            child->recursiveElements(func, result);
        }
    }

    bool UIElement::isButton() const {
        return this->_classname.find("Button") != std::string::npos;
    }

    std::string UIElement::getLabel() const {
        if (!this->_text.empty())
            return this->_text;
        if (!this->_contentDesc.empty())
            return this->_contentDesc;
        return this->_classname;
    }

    Rect UIElement::parseBounds(const char *boundsStr) {
        if (nullptr == boundsStr || *boundsStr != '[')
            return Rect();
        const char *p = boundsStr + 1;
        int xl = 0, yl = 0, xr = 0, yr = 0;
        if (!parseIntAndAdvance(p, xl) || *p++ != ',')
            return Rect();
        if (!parseIntAndAdvance(p, yl) || p[0] != ']' || p[1] != '[')
            return Rect();
        p += 2;
        if (!parseIntAndAdvance(p, xr) || *p++ != ',')
            return Rect();
        if (!parseIntAndAdvance(p, yr) || *p != ']')
            return Rect();
        return Rect(xl, yl, xr, yr);
    }

    UIElementPtr UIElement::createFromXml(const std::string &xmlContent) {
        BLOG("ui dump size=%zu", xmlContent.size());
        if (xmlContent.empty()) {
            BLOGE("%s", "ui dump is empty");
            return nullptr;
        }
        tinyxml2::XMLDocument doc;
        tinyxml2::XMLError errXml = doc.Parse(xmlContent.c_str(), xmlContent.size());
        if (errXml != tinyxml2::XML_SUCCESS) {
            BLOGE("parse xml error %d", static_cast<int>(errXml));
            return nullptr;
        }
        return createFromXml(doc);
    }

    UIElementPtr UIElement::createFromXml(const tinyxml2::XMLDocument &doc) {
        const tinyxml2::XMLElement *rootNode = doc.RootElement();
        if (nullptr == rootNode) {
            BLOGE("%s", "ui dump has no root element");
            return nullptr;
        }
        UIElementPtr elementPtr = std::make_shared<UIElement>();
        elementPtr->fromXMLNode(rootNode, nullptr);
        return elementPtr;
    }

    void UIElement::fromXMLNode(const tinyxml2::XMLElement *xmlNode, const UIElementPtr &parentOfNode) {
        if (nullptr == xmlNode)
            return;
        if (parentOfNode)
            this->_parent = parentOfNode;
        int indexOfNode = 0;
        if (xmlNode->QueryIntAttribute("index", &indexOfNode) == tinyxml2::XML_SUCCESS) {
            this->_index = indexOfNode;
        }
        this->_bounds = parseBounds(xmlNode->Attribute("bounds"));

        // tinyxml2 hands out pointers into its own buffer, so every attribute is copied
        const char *attr = xmlNode->Attribute("text");
        if (attr && *attr != '\0')
            this->_text = attr;
        attr = xmlNode->Attribute("resource-id");
        if (attr && *attr != '\0')
            this->_resourceID = attr;
        attr = xmlNode->Attribute("class");
        if (attr && *attr != '\0')
            this->_classname = attr;
        attr = xmlNode->Attribute("package");
        if (attr && *attr != '\0')
            this->_packageName = attr;
        attr = xmlNode->Attribute("content-desc");
        if (attr && *attr != '\0')
            this->_contentDesc = attr;

        bool b = false;
        if (xmlNode->QueryBoolAttribute("checkable", &b) == tinyxml2::XML_SUCCESS) this->_checkable = b;
        if (xmlNode->QueryBoolAttribute("checked", &b) == tinyxml2::XML_SUCCESS) this->_checked = b;
        if (xmlNode->QueryBoolAttribute("clickable", &b) == tinyxml2::XML_SUCCESS) this->_clickable = b;
        if (xmlNode->QueryBoolAttribute("enabled", &b) == tinyxml2::XML_SUCCESS) this->_enabled = b;
        if (xmlNode->QueryBoolAttribute("scrollable", &b) == tinyxml2::XML_SUCCESS) this->_scrollable = b;

        if (!xmlNode->NoChildren()) {
            const UIElementPtr self = shared_from_this();
            for (const tinyxml2::XMLElement *childNode = xmlNode->FirstChildElement();
                 childNode != nullptr; childNode = childNode->NextSiblingElement()) {
                UIElementPtr childElement = std::make_shared<UIElement>();
                this->_children.emplace_back(childElement);
                childElement->fromXMLNode(childNode, self);
            }
        }
    }

    std::string UIElement::toJson() const {
        nlohmann::json j;
        j["bounds"] = this->_bounds.toString();
        j["index"] = this->_index;
        j["class"] = this->_classname;
        j["resource-id"] = this->_resourceID;
        j["package"] = this->_packageName;
        j["text"] = this->_text;
        j["content-desc"] = this->_contentDesc;
        j["clickable"] = this->_clickable;
        j["scrollable"] = this->_scrollable;
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::string UIElement::toString() const {
        return this->toJson();
    }

}

#endif //UIElement_CPP_
