// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef XML_H_8830192746510293
#define XML_H_8830192746510293

#include <unordered_set>
#include <amr/file_io.h>
#include <amr/format_unit.h>
#include <amr/stl_tools.h>
#include "parser.h"


/// The amr::Xml namespace
namespace amr
{
///Load XML document from a file
/**
\throw FileError
*/
XmlDoc loadXml(const Zstring& filePath); //throw FileError


///Read user data from an XML element
/**
  Value elements are converted via readText(), std::vector<T> via one child element per item.
  \return "true" if value was read successfully.
*/
template <class T> bool readStruc(const XmlElement& input, T& value);


///Proxy class to conveniently convert XML structure to user data
class XmlIn
{
    struct ErrorLog;

public:
    /**
    \code
        amr::XmlIn in(doc);
        in["BaseUrl"](cfg.baseUrl);                         //read element value
        in["Parallel"].attribute("Transfer", cfg.parallel); //read attribute
        if (!in.getErrors().empty()) ...
    \endcode
    */
    explicit XmlIn(const XmlDoc& doc) : XmlIn(&doc.root(), '<' + doc.root().getName() + '>', makeSharedRef<ErrorLog>()) {}

    ///Retrieve a handle to an XML child element for reading
    /**
    It is \b not an error if the child element does not exist, but only later if a conversion to user data is attempted.
    */
    XmlIn operator[](const std::string& name) const
    {
        return XmlIn(elem_ ? elem_->getChild(name) : nullptr, elementNameFmt_ + " <" + name + '>', log_);
    }

    ///Test whether the underlying XML element exists
    explicit operator bool() const { return elem_; }

    template <class T>
    bool operator()(T& value) const
    {
        if (elem_)
        {
            if (readStruc(*elem_, value))
                return true;

            logElementError(elementNameFmt_); //conversion error
        }
        else
            logElementError(elementNameFmt_); //missing element

        return false;
    }

    bool hasAttribute(const std::string& name) const { return elem_ && elem_->hasAttribute(name); }

    template <class T>
    bool attribute(const std::string& name, T& value) const
    {
        if (elem_)
        {
            if (elem_->getAttribute(name, value))
                return true;

            logElementError(elementNameFmt_ + " @" + name);
        }
        else
            logElementError(elementNameFmt_);

        return false;
    }

    ///Get a list of XML element and attribute names which failed to convert to user data.
    /**
    Error logging is shared by each hiearchy of XmlIn proxy instances that are created from each other.
    \returns A list of XML element and attribute names, empty if no errors occured.
    */
    const std::wstring& getErrors() const { return log_.ref().failedElements; }

private:
    XmlIn(const XmlElement* elem,
          const std::string& elementNameFmt,
          const SharedRef<ErrorLog>& sharedlog) : log_(sharedlog), elem_(elem), elementNameFmt_(elementNameFmt) {}

    struct ErrorLog
    {
        std::wstring failedElements; //unique list of failed elements
        std::unordered_set<std::string> usedElements;
    };

    void logElementError(const std::string& elementName) const
    {
        if (const auto [it, inserted] = log_.ref().usedElements.insert(elementName);
            inserted)
        {
            if (!log_.ref().failedElements.empty())
                log_.ref().failedElements += L'\n';
            log_.ref().failedElements += utfTo<std::wstring>(elementName);
        }
    }

    mutable SharedRef<ErrorLog> log_;
    const XmlElement* elem_;
    std::string elementNameFmt_; //e.g. "<ArchiveMirror> <Exclude>"
};








//---------------------------- implementation ----------------------------
namespace xml_impl
{
template <class T>
struct IsVector : std::false_type {};

template <class T, class Alloc>
struct IsVector<std::vector<T, Alloc>> : std::true_type {};
}


template <class T> inline
bool readStruc(const XmlElement& input, T& value)
{
    if constexpr (xml_impl::IsVector<T>::value)
    {
        value.clear();
        bool success = true;
        for (const XmlElement& child : input.getChildren())
        {
            typename T::value_type childVal{};
            if (readStruc(child, childVal))
                value.push_back(std::move(childVal));
            else
                success = false;
        }
        return success;
    }
    else
        return readText(input.getValue(), value);
}


inline
XmlDoc loadXml(const Zstring& filePath) //throw FileError
{
    const std::string stream = getFileContent(filePath); //throw FileError

    //quick test whether input is an XML: avoid obscure parser errors for unrelated files
    std::string_view header = stream;
    if (startsWith(header, xml_impl::BYTE_ORDER_MARK_UTF8))
        header.remove_prefix(xml_impl::BYTE_ORDER_MARK_UTF8.size());
    if (!startsWith(trimCpy(header, TrimSide::left), '<'))
        throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)));

    try
    {
        XmlDoc doc = parseXml(stream); //throw XmlParsingError

        if (const std::string& encoding = doc.getEncoding();
            !encoding.empty() && !equalAsciiNoCase(encoding, "utf-8"))
            throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)),
                            replaceCpy<std::wstring>(L"Unsupported encoding %x.", L"%x", utfTo<std::wstring>(encoding)));
        return doc;
    }
    catch (const XmlParsingError& e)
    {
        throw FileError(
            replaceCpy(replaceCpy(replaceCpy(_("Error parsing file %x, row %y, column %z."),
                                             L"%x", fmtPath(filePath)),
                                  L"%y", formatNumber(e.row + 1)),
                       L"%z", formatNumber(e.col + 1)));
    }
}
}

#endif //XML_H_8830192746510293
