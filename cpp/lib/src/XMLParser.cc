/** \file   XMLParser.cc
 *  \brief  Implementation of class XMLParser.
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
#include "XMLParser.h"
#include <xercesc/util/PlatformUtils.hpp>
#include <xercesc/util/TransService.hpp>
#include "StringUtil.h"
#include "util.h"


namespace {


// Process-wide Xerces initialisation.  Terminate() runs when the static is destroyed at exit.
class XercesPlatform {
public:
    XercesPlatform() { xercesc::XMLPlatformUtils::Initialize(); }
    ~XercesPlatform() { xercesc::XMLPlatformUtils::Terminate(); }
};


void InitXercesPlatform() {
    try {
        static XercesPlatform xerces_platform;
    } catch (const xercesc::XMLException &exc) {
        throw XMLParser::Error("Xerces initialisation failed: " + XMLParser::ToStdString(exc.getMessage()));
    }
}


std::string DescribeParseException(const xercesc::SAXParseException &exc) {
    return "line " + std::to_string(exc.getLineNumber()) + ", col " + std::to_string(exc.getColumnNumber()) + ": "
           + XMLParser::ToStdString(exc.getMessage());
}


} // unnamed namespace


const XMLParser::Options XMLParser::DEFAULT_OPTIONS{
    /* ignore_whitespace_ = */ true,
};


std::string XMLParser::ToStdString(const XMLCh * const xmlch, const XMLSize_t length) {
    if (xmlch == nullptr or length == 0)
        return "";

    xercesc::TranscodeToStr utf8(xmlch, length, "UTF-8");
    return std::string(reinterpret_cast<const char *>(utf8.str()), utf8.length());
}


std::string XMLParser::ToStdString(const XMLCh * const xmlch) {
    return xmlch == nullptr ? "" : ToStdString(xmlch, xercesc::XMLString::stringLen(xmlch));
}


std::string XMLParser::XMLPart::getLocalName() const {
    const auto colon_pos(data_.rfind(':'));
    return colon_pos == std::string::npos ? data_ : data_.substr(colon_pos + 1);
}


void XMLParser::Handler::startElement(const XMLCh * const name, xercesc::AttributeList &attributes) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::OPENING_TAG;
    xml_part.data_ = XMLParser::ToStdString(name);
    for (XMLSize_t i(0); i < attributes.getLength(); ++i)
        xml_part.attributes_[XMLParser::ToStdString(attributes.getName(i))] = XMLParser::ToStdString(attributes.getValue(i));
    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::endElement(const XMLCh * const name) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::CLOSING_TAG;
    xml_part.data_ = XMLParser::ToStdString(name);
    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::characters(const XMLCh * const chars, const XMLSize_t length) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::CHARACTERS;
    xml_part.data_ = XMLParser::ToStdString(chars, length);
    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::ignorableWhitespace(const XMLCh * const chars, const XMLSize_t length) {
    characters(chars, length);
}


void XMLParser::ErrorHandler::warning(const xercesc::SAXParseException &exc) {
    LOG_WARNING(DescribeParseException(exc));
}


void XMLParser::ErrorHandler::error(const xercesc::SAXParseException &exc) {
    LOG_WARNING(DescribeParseException(exc));
}


void XMLParser::ErrorHandler::fatalError(const xercesc::SAXParseException &exc) {
    throw XMLParser::Error(DescribeParseException(exc));
}


XMLParser::XMLParser(const std::string &xml_string, const std::string &description, const Options &options)
    : xml_string_(xml_string), options_(options), prolog_parsing_done_(false), body_has_more_contents_(false)
{
    InitXercesPlatform();

    parser_.reset(new xercesc::SAXParser());
    handler_.reset(new Handler(this));
    error_handler_.reset(new ErrorHandler());
    parser_->setDocumentHandler(handler_.get());
    parser_->setErrorHandler(error_handler_.get());
    parser_->setValidationScheme(xercesc::SAXParser::Val_Never);
    parser_->setDoNamespaces(false);
    parser_->setDoSchema(false);
    parser_->setLoadExternalDTD(false);
    parser_->setDisableDefaultEntityResolution(true);

    input_source_.reset(new xercesc::MemBufInputSource(reinterpret_cast<const XMLByte *>(xml_string_.data()), xml_string_.size(),
                                                       description.c_str()));
}


XMLParser::~XMLParser() {
    if (prolog_parsing_done_ and body_has_more_contents_) {
        try {
            parser_->parseReset(token_);
        } catch (const xercesc::XMLException &exc) {
            LOG_WARNING("parseReset failed: " + ToStdString(exc.getMessage()));
        }
    }
}


bool XMLParser::getNextRaw(XMLPart * const next) {
    try {
        if (not prolog_parsing_done_) {
            prolog_parsing_done_ = true;
            body_has_more_contents_ = parser_->parseFirst(*input_source_, token_);
            if (unlikely(not body_has_more_contents_))
                throw Error("error parsing the document prolog!");
        }

        while (buffer_.empty() and body_has_more_contents_)
            body_has_more_contents_ = parser_->parseNext(token_);
    } catch (const xercesc::SAXParseException &exc) {
        body_has_more_contents_ = false;
        throw Error(DescribeParseException(exc));
    } catch (const xercesc::XMLException &exc) {
        body_has_more_contents_ = false;
        throw Error("line " + std::to_string(exc.getSrcLine()) + ": " + ToStdString(exc.getMessage()));
    } catch (const Error &) {
        body_has_more_contents_ = false;
        throw;
    }

    if (buffer_.empty())
        return false;

    *next = buffer_.front();
    buffer_.pop_front();
    return true;
}


bool XMLParser::getNext(XMLPart * const next) {
    for (;;) {
        if (not getNextRaw(next))
            return false;
        if (not options_.ignore_whitespace_ or not next->isCharacters())
            return true;

        // Xerces may report character data in several pieces:
        XMLPart following;
        while (getNextRaw(&following)) {
            if (not following.isCharacters()) {
                buffer_.emplace_front(following);
                break;
            }
            next->data_ += following.data_;
        }

        if (not StringUtil::IsWhitespace(next->data_))
            return true;
    }
}
