/** \file   IniFile.cc
 *  \brief  Implementation of class IniFile.
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
#include "IniFile.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstring>
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &comment) {
    if (unlikely(hasEntry(variable_name)))
        throw std::runtime_error("in IniFile::Section::insert: attempting to insert a duplicate variable name: \"" + variable_name
                                 + "\" in section \"" + section_name_ + "\"!");

    entries_.emplace_back(variable_name, value, comment);
}


void IniFile::Section::replace(const std::string &variable_name, const std::string &value, const std::string &comment) {
    const auto existing_entry(std::find_if(entries_.begin(), entries_.end(),
                                           [&variable_name](const Entry &entry) { return entry.name_ == variable_name; }));
    if (existing_entry == entries_.end())
        entries_.emplace_back(variable_name, value, comment);
    else {
        existing_entry->value_ = value;
        existing_entry->comment_ = comment;
    }
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    return (existing_entry == end()) ? default_value : existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const std::string value(getString(variable_name));

    unsigned number;
    if (not StringUtil::ToUnsigned(value, &number))
        throw std::runtime_error("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned &default_value) const {
    return hasEntry(variable_name) ? getUnsigned(variable_name) : default_value;
}


uint64_t IniFile::Section::getUint64T(const std::string &variable_name) const {
    const std::string value(getString(variable_name));

    uint64_t number;
    if (not StringUtil::ToUInt64T(value, &number))
        throw std::runtime_error("invalid uint64_t entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


uint64_t IniFile::Section::getUint64T(const std::string &variable_name, const uint64_t &default_value) const {
    return hasEntry(variable_name) ? getUint64T(variable_name) : default_value;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const std::string value(getString(variable_name));

    bool retval;
    if (not StringUtil::ToBool(value, &retval))
        throw std::runtime_error("invalid boolean value in section \"" + section_name_ + "\", entry \"" + variable_name
                                 + "\" (bad value is \"" + value + "\")!");

    return retval;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    return hasEntry(variable_name) ? getBool(variable_name) : default_value;
}


int IniFile::Section::getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map) const {
    const std::string value(getString(variable_name));

    const auto name_and_int_value(string_to_value_map.find(value));
    if (name_and_int_value == string_to_value_map.end())
        throw std::runtime_error("in section \"" + section_name_ + "\": invalid enum value \"" + value + "\" for entry \"" + variable_name
                                 + "\"!");

    return name_and_int_value->second;
}


int IniFile::Section::getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map,
                              const int default_value) const
{
    return hasEntry(variable_name) ? getEnum(variable_name, string_to_value_map) : default_value;
}


std::vector<std::string> IniFile::Section::getEntryNames() const {
    std::vector<std::string> entry_names;
    for (const auto &entry : entries_) {
        if (not entry.name_.empty())
            entry_names.emplace_back(entry.name_);
    }

    return entry_names;
}


namespace {


bool NeedsQuotes(const std::string &value) {
    if (value.empty())
        return false;
    if (std::isspace(static_cast<unsigned char>(value.front())) or std::isspace(static_cast<unsigned char>(value.back())))
        return true;
    return value.find_first_of("\"#\\\n") != std::string::npos;
}


std::string Escape(const std::string &value) {
    std::string escaped;
    for (const char ch : value) {
        if (ch == '"' or ch == '\\')
            escaped += '\\';
        if (ch == '\n')
            escaped += "\\n";
        else
            escaped += ch;
    }

    return escaped;
}


// \return False if "quoted_value" ends in a lone backslash.
bool Unescape(const std::string &quoted_value, std::string * const value) {
    value->clear();
    for (auto ch(quoted_value.cbegin()); ch != quoted_value.cend(); ++ch) {
        if (*ch != '\\') {
            *value += *ch;
            continue;
        }

        if (++ch == quoted_value.cend())
            return false;
        *value += (*ch == 'n') ? '\n' : *ch;
    }

    return true;
}


// Only allow names that start with a letter followed by letters, digits, hyphens, underscores and periods.
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not std::isalpha(static_cast<unsigned char>(*ch)))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not std::isalnum(static_cast<unsigned char>(*ch)) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


// Removes an unquoted trailing comment from "line" and stores it in "comment".
void StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '\\' and inside_string_literal) {
            if (character + 1 != line->end())
                ++character;
        } else if (*character == '"')
            inside_string_literal = not inside_string_literal;
        else if (*character == '#' and not inside_string_literal) {
            const auto comment_start_pos(std::distance(line->begin(), character));
            *comment = line->substr(comment_start_pos);
            line->resize(comment_start_pos);
            return;
        }
    }
}


} // unnamed namespace


void IniFile::Section::write(std::string * const output) const {
    if (not section_name_.empty())
        *output += "[" + section_name_ + "]\n";

    // Align all the equal signs in a section:
    size_t max_name_length(0);
    for (const auto &entry : entries_)
        max_name_length = std::max(max_name_length, entry.name_.length());

    for (const auto &entry : entries_) {
        if (entry.name_.empty()) {
            *output += entry.comment_ + "\n";
            continue;
        }

        std::string line(entry.name_);
        line += std::string(max_name_length - entry.name_.length(), ' ');
        line += " = ";
        if (NeedsQuotes(entry.value_))
            line += "\"" + Escape(entry.value_) + "\"";
        else
            line += entry.value_;
        if (not entry.comment_.empty())
            line += " " + entry.comment_;
        *output += line + "\n";
    }

    *output += "\n";
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_lineno_(0) {
    std::ifstream ini_file(ini_file_name_);
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::IniFile: can't open \"" + ini_file_name_ + "\"! (" + std::string(std::strerror(errno)) + ")");

    processStream(ini_file);
}


IniFile IniFile::FromString(const std::string &contents, const std::string &name) {
    IniFile ini_file;
    ini_file.ini_file_name_ = name;
    std::istringstream input(contents);
    ini_file.processStream(input);

    return ini_file;
}


std::string IniFile::getLocation() const {
    return "line " + std::to_string(current_lineno_) + " in \"" + ini_file_name_ + "\"";
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on " + getLocation() + "!");

    const std::string section_name(StringUtil::Trim(line.substr(1, line.length() - 2)));
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on " + getLocation() + "!");

    if (sectionIsDefined(section_name))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" on " + getLocation() + "!");
    sections_.emplace_back(section_name);
}


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos)
        throw std::runtime_error("in IniFile::processSectionEntry: missing '=' on " + getLocation() + "!");

    const std::string variable_name(StringUtil::Trim(line.substr(0, equal_sign)));
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on " + getLocation()
                                 + "!");

    std::string value(StringUtil::Trim(line.substr(equal_sign + 1)));
    if (not value.empty() and value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on " + getLocation() + "!");

        const std::string quoted_value(value.substr(1, value.length() - 2));
        if (not Unescape(quoted_value, &value))
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape on " + getLocation() + "!");
    }

    try {
        sections_.back().insert(variable_name, value, comment);
    } catch (const std::runtime_error &x) {
        throw std::runtime_error(std::string(x.what()) + " (" + getLocation() + ")");
    }
}


void IniFile::processStream(std::istream &input) {
    std::string buf;
    while (std::getline(input, buf)) {
        ++current_lineno_;

        std::string line(buf), comment;
        StripComment(&line, &comment);
        line = StringUtil::Trim(line);
        if (line.empty())
            continue;

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line, StringUtil::Trim(comment));
        }
    }

    if (input.bad())
        throw std::runtime_error("in IniFile::processStream: read error on \"" + ini_file_name_ + "\"!");
}


std::vector<std::string> IniFile::getSections() const {
    std::vector<std::string> section_names;
    for (const auto &section : sections_)
        section_names.emplace_back(section.getSectionName());

    return section_names;
}


bool IniFile::sectionIsDefined(const std::string &section_name) const {
    return std::find(sections_.cbegin(), sections_.cend(), section_name) != sections_.cend();
}


const IniFile::Section &IniFile::getSection(const std::string &section_name) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    if (unlikely(section == sections_.cend()))
        throw std::runtime_error("no such section: \"" + section_name + "\" in \"" + ini_file_name_ + "\"!");

    return *section;
}


IniFile::Section &IniFile::appendSection(const std::string &section_name) {
    if (unlikely(sectionIsDefined(section_name)))
        throw std::runtime_error("in IniFile::appendSection: duplicate section \"" + section_name + "\"!");

    sections_.emplace_back(section_name);
    return sections_.back();
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    if (section == sections_.cend())
        return false;

    return section->lookup(variable_name, s);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name,
                               const std::string &default_value) const
{
    std::string value;
    return lookup(section_name, variable_name, &value) ? value : default_value;
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned &default_value) const {
    return sectionIsDefined(section_name) ? getSection(section_name).getUnsigned(variable_name, default_value) : default_value;
}


std::string IniFile::toString() const {
    std::string output;
    for (const auto &section : sections_)
        section.write(&output);

    return output;
}
