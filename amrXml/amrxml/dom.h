// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef DOM_H_1192837465019283
#define DOM_H_1192837465019283

#include <list>
#include <string>
#include <unordered_map>
#include "cvrt.h"


namespace amr
{
/// An XML element
class XmlElement
{
public:
    XmlElement() {}
    explicit XmlElement(std::string name) : name_(std::move(name)) {}

    const std::string& getName() const { return name_; }

    ///Element text, empty for structured elements
    const std::string& getValue() const { return value_; }
    void setValue(std::string&& value) { value_ = std::move(value); }

    ///Retrieve an attribute by name.
    /**
      \tparam T String-convertible user data type: see cvrt.h
      \return "true" if value was retrieved successfully.
    */
    template <class T>
    bool getAttribute(const std::string& name, T& value) const
    {
        auto it = attributes_.find(name);
        return it == attributes_.end() ? false : readText(it->second, value);
    }

    bool hasAttribute(const std::string& name) const { return attributes_.contains(name); }

    void setAttribute(const std::string& name, std::string value) { attributes_[name] = std::move(value); }

    XmlElement& addChild(std::string name)
    {
        childElements_.emplace_back(std::move(name));
        XmlElement& newElement = childElements_.back();
        childElementByName_.emplace(newElement.getName(), &newElement); //first child wins
        static_assert(std::is_same_v<decltype(childElements_), std::list<XmlElement>>); //must NOT invalidate pointers in "childElementByName_"!
        return newElement;
    }

    ///Retrieve the (first) child element with the given name.
    /**
      \return A pointer to the child element or nullptr if none was found.
    */
    const XmlElement* getChild(const std::string& name) const
    {
        auto it = childElementByName_.find(name);
        return it == childElementByName_.end() ? nullptr : it->second;
    }

    const std::list<XmlElement>& getChildren() const { return childElements_; }

    void swapSubtree(XmlElement& other) noexcept
    {
        name_              .swap(other.name_);
        value_             .swap(other.value_);
        attributes_        .swap(other.attributes_);
        childElements_     .swap(other.childElements_);
        childElementByName_.swap(other.childElementByName_);
    }

private:
    XmlElement           (const XmlElement&) = delete;
    XmlElement& operator=(const XmlElement&) = delete;

    std::string name_;
    std::string value_;
    std::unordered_map<std::string, std::string> attributes_;

    std::list<XmlElement>                               childElements_;      //child elements in document order
    std::unordered_map<std::string, const XmlElement*> childElementByName_; //alternate view for lookup of *first* child by name
};


///The complete XML document
class XmlDoc
{
public:
    XmlDoc() {}
    XmlDoc(XmlDoc&& tmp) noexcept { swap(tmp); }
    XmlDoc& operator=(XmlDoc&& tmp) noexcept { swap(tmp); return *this; }

    const XmlElement& root() const { return root_; }
    XmlElement& root() { return root_; }

    const std::string& getEncoding() const { return encoding_; }
    void setEncoding(const std::string& encoding) { encoding_ = encoding; }

    void swap(XmlDoc& other) noexcept
    {
        encoding_.swap(other.encoding_);
        root_.swapSubtree(other.root_);
    }

private:
    XmlDoc           (const XmlDoc&) = delete;
    XmlDoc& operator=(const XmlDoc&) = delete;

    std::string encoding_{"utf-8"};
    XmlElement root_{"Root"};
};
}

#endif //DOM_H_1192837465019283
