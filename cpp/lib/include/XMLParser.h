/** \file   XMLParser.h
 *  \brief  Pull-style wrapper around the Xerces SAX parser for small in-memory documents.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <deque>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <xercesc/framework/MemBufInputSource.hpp>
#include <xercesc/framework/XMLPScanToken.hpp>
#include <xercesc/parsers/SAXParser.hpp>
#include <xercesc/sax/HandlerBase.hpp>
#include <xercesc/sax/SAXParseException.hpp>
#include <xercesc/util/XMLException.hpp>


/** \class  XMLParser
 *  \brief  Hands out the opening tags, closing tags and character data of an XML document one at a time.
 *  \note   Entity and character references are resolved by Xerces, all strings are UTF-8.  External DTDs are never
 *          loaded.
 */
class XMLParser final {
public:
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string &message): std::runtime_error(message) { }
    };
    typedef std::map<std::string, std::string> Attributes;

    struct Options {
        /** \brief Combine consecutive CHARACTERS parts and skip those that only contain whitespace (default true). */
        bool ignore_whitespace_;
    };

    static const Options DEFAULT_OPTIONS;

    struct XMLPart {
        enum Type { UNINITIALISED, OPENING_TAG, CLOSING_TAG, CHARACTERS };
        Type type_ = UNINITIALISED;
        std::string data_; // The tag name, including any namespace prefix, or the character data.
        Attributes attributes_;

        inline bool isOpeningTag() const { return type_ == OPENING_TAG; }
        inline bool isClosingTag() const { return type_ == CLOSING_TAG; }
        inline bool isCharacters() const { return type_ == CHARACTERS; }

        /** \return The tag name w/o a namespace prefix, e.g. "Key" for "s3:Key". */
        std::string getLocalName() const;
    };

private:
    class Handler : public xercesc::HandlerBase {
        XMLParser *parser_;
    public:
        explicit Handler(XMLParser * const parser): parser_(parser) { }
        void characters(const XMLCh * const chars, const XMLSize_t length) override;
        void endElement(const XMLCh * const name) override;
        void ignorableWhitespace(const XMLCh * const chars, const XMLSize_t length) override;
        void startElement(const XMLCh * const name, xercesc::AttributeList &attributes) override;
    };

    class ErrorHandler : public xercesc::ErrorHandler {
    public:
        void warning(const xercesc::SAXParseException &exc) override;
        void error(const xercesc::SAXParseException &exc) override;
        [[noreturn]] void fatalError(const xercesc::SAXParseException &exc) override;
        void resetErrors() override { }
    };

    const std::string xml_string_;
    const Options options_;
    std::unique_ptr<xercesc::MemBufInputSource> input_source_;
    std::unique_ptr<Handler> handler_;
    std::unique_ptr<ErrorHandler> error_handler_;
    std::unique_ptr<xercesc::SAXParser> parser_; // Must be destroyed before the input source and the handlers.
    xercesc::XMLPScanToken token_;
    bool prolog_parsing_done_;
    bool body_has_more_contents_;
    std::deque<XMLPart> buffer_;

public:
    /** \param xml_string  The complete document.
     *  \param description  Used in error messages, e.g. "ListObjectsV2 response".
     */
    XMLParser(const std::string &xml_string, const std::string &description, const Options &options = DEFAULT_OPTIONS);
    XMLParser(const XMLParser &rhs) = delete;
    ~XMLParser();

    /** \return False at the end of the document, o/w true.
     *  \throws XMLParser::Error if the document is not well-formed.
     */
    bool getNext(XMLPart * const next);

    /** \brief  Converts a Xerces string to UTF-8. */
    static std::string ToStdString(const XMLCh * const xmlch, const XMLSize_t length);
    static std::string ToStdString(const XMLCh * const xmlch);

private:
    bool getNextRaw(XMLPart * const next);
    inline void appendToBuffer(const XMLPart &xml_part) { buffer_.emplace_back(xml_part); }
};
