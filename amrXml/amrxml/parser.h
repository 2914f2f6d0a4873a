// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef PARSER_H_3349102837465019
#define PARSER_H_3349102837465019

#include <algorithm>
#include <amr/string_tools.h>
#include "dom.h"


namespace amr
{
///Exception thrown due to an XML parsing error
struct XmlParsingError
{
    XmlParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    const size_t row; //beginning with 0
    const size_t col; //
};

///Load XML document from a byte stream
/**
Supports the subset needed for configuration files: declaration, comments,
nested elements, attributes, text values and the predefined entities.
No support for mixed-mode content, DTDs or CDATA sections.
\throw XmlParsingError
*/
XmlDoc parseXml(const std::string& stream); //throw XmlParsingError








//---------------------------- implementation ----------------------------
//see: https://www.w3.org/TR/xml/

namespace xml_impl
{
const std::string_view BYTE_ORDER_MARK_UTF8 = "\xEF\xBB\xBF";


inline
std::string decodeEntities(const std::string_view& str)
{
    std::string output;
    for (size_t i = 0; i < str.size(); ++i)
    {
        const char c = str[i];
        if (c == '&')
        {
            const std::string_view tail = str.substr(i);
            auto tryEntity = [&](const std::string_view entity, char replacement)
            {
                if (!startsWith(tail, entity))
                    return false;
                output += replacement;
                i += entity.size() - 1;
                return true;
            };

            if (tryEntity("&amp;",  '&' ) ||
                tryEntity("&lt;",   '<' ) ||
                tryEntity("&gt;",   '>' ) ||
                tryEntity("&apos;", '\'') ||
                tryEntity("&quot;", '"' ))
                continue;

            if (tail.size() >= 6 && tail[1] == '#' && tail[2] == 'x' &&
                isHexDigit(tail[3]) && isHexDigit(tail[4]) && tail[5] == ';')
            {
                output += unhexify(tail[3], tail[4]);
                i += 5;
                continue;
            }
            output += c; //unexpected char!
        }
        else if (c == '\r') //map all end-of-line characters to \n https://www.w3.org/TR/xml/#sec-line-ends
        {
            if (i + 1 < str.size() && str[i + 1] == '\n')
                ++i;
            output += '\n';
        }
        else
            output += c;
    }
    return output;
}


class XmlParser
{
public:
    explicit XmlParser(const std::string& stream) : stream_(stream)
    {
        if (startsWith(stream_, BYTE_ORDER_MARK_UTF8))
            pos_ = BYTE_ORDER_MARK_UTF8.size();
    }

    XmlDoc parse() //throw XmlParsingError
    {
        XmlDoc doc;
        skipMisc();

        if (tryConsume("<?xml")) //declaration (optional)
        {
            XmlElement decl;
            parseAttributes(decl); //throw XmlParsingError
            expect("?>");          //
            std::string encoding;
            if (decl.getAttribute("encoding", encoding))
                doc.setEncoding(encoding);
            skipMisc();
        }

        parseElement(doc.root()); //throw XmlParsingError
        skipMisc();

        if (pos_ != stream_.size()) //trailing garbage
            throw XmlParsingError(posRow(), posCol());
        return doc;
    }

private:
    XmlParser           (const XmlParser&) = delete;
    XmlParser& operator=(const XmlParser&) = delete;

    void parseElement(XmlElement& element) //throw XmlParsingError
    {
        expect("<");
        XmlElement newElement(parseName()); //throw XmlParsingError
        parseAttributes(newElement);        //

        if (tryConsume("/>")) //empty element
        {
            element.swapSubtree(newElement);
            return;
        }
        expect(">");

        const size_t valueBegin = pos_;
        skipMisc();

        if (startsWith(rest(), "<") && !startsWith(rest(), "</")) //structured element
            do
            {
                XmlElement child;
                parseElement(child); //throw XmlParsingError
                newElement.addChild(child.getName()).swapSubtree(child);
                skipMisc();
            }
            while (!startsWith(rest(), "</"));
        else //value element
        {
            pos_ = valueBegin;
            const size_t valueEnd = std::min(stream_.find('<', pos_), stream_.size());
            newElement.setValue(decodeEntities(std::string_view(stream_).substr(pos_, valueEnd - pos_)));
            pos_ = valueEnd;
        }

        expect("</");
        if (parseName() != newElement.getName()) //throw XmlParsingError
            throw XmlParsingError(posRow(), posCol());
        skipWhiteSpace();
        expect(">");

        element.swapSubtree(newElement);
    }

    void parseAttributes(XmlElement& element) //throw XmlParsingError
    {
        for (;;)
        {
            skipWhiteSpace();
            if (pos_ == stream_.size() || !isNameChar(stream_[pos_]))
                return;

            const std::string attribName = parseName(); //throw XmlParsingError
            skipWhiteSpace();
            expect("=");
            skipWhiteSpace();

            if (pos_ == stream_.size() || (stream_[pos_] != '"' && stream_[pos_] != '\''))
                throw XmlParsingError(posRow(), posCol());
            const char quote = stream_[pos_++];

            const size_t valueEnd = stream_.find(quote, pos_);
            if (valueEnd == std::string::npos)
                throw XmlParsingError(posRow(), posCol());

            element.setAttribute(attribName, decodeEntities(std::string_view(stream_).substr(pos_, valueEnd - pos_)));
            pos_ = valueEnd + 1;
        }
    }

    std::string parseName() //throw XmlParsingError
    {
        const size_t nameEnd = std::find_if_not(stream_.begin() + pos_, stream_.end(), isNameChar) - stream_.begin();
        if (nameEnd == pos_)
            throw XmlParsingError(posRow(), posCol());

        std::string name = stream_.substr(pos_, nameEnd - pos_);
        pos_ = nameEnd;
        return name;
    }

    static bool isNameChar(char c)
    {
        return !isWhiteSpace(c) &&
               c != '<'  && c != '>' && c != '=' && c != '/' &&
               c != '\'' && c != '"' && c != '?';
    }

    //skip whitespace and comments
    void skipMisc() //throw XmlParsingError
    {
        for (;;)
        {
            skipWhiteSpace();
            if (!tryConsume("<!--"))
                return;

            const size_t commentEnd = stream_.find("-->", pos_);
            if (commentEnd == std::string::npos)
                throw XmlParsingError(posRow(), posCol());
            pos_ = commentEnd + 3;
        }
    }

    void skipWhiteSpace()
    {
        while (pos_ < stream_.size() && isWhiteSpace(stream_[pos_]))
            ++pos_;
    }

    bool tryConsume(const std::string_view& token)
    {
        if (!startsWith(rest(), token))
            return false;
        pos_ += token.size();
        return true;
    }

    void expect(const std::string_view& token) //throw XmlParsingError
    {
        if (!tryConsume(token))
            throw XmlParsingError(posRow(), posCol());
    }

    std::string_view rest() const { return std::string_view(stream_).substr(pos_); }

    size_t posRow() const //current row beginning with 0
    {
        return std::count(stream_.begin(), stream_.begin() + pos_, '\n');
    }

    size_t posCol() const //current col beginning with 0
    {
        if (pos_ == 0)
            return 0;
        const size_t lineStart = stream_.rfind('\n', pos_ - 1);
        return lineStart == std::string::npos ? pos_ : pos_ - lineStart - 1;
    }

    const std::string& stream_;
    size_t pos_ = 0;
};
}


inline
XmlDoc parseXml(const std::string& stream) //throw XmlParsingError
{
    return xml_impl::XmlParser(stream).parse(); //throw XmlParsingError
}
}

#endif //PARSER_H_3349102837465019
