/** \file   IniFile.h
 *  \brief  Declaration of class IniFile, a reader and writer for sectioned name/value files.
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


#include <algorithm>
#include <istream>
#include <map>
#include <string>
#include <vector>
#include <cinttypes>


/** \class IniFile
 *  \brief Parses and writes files consisting of "[section name]" headers followed by "name = value" lines.
 *  \note  Values containing spaces, double quotes or hash characters may be enclosed in double quotes, in which case
 *         backslash escapes are honoured.  Everything following an unquoted '#' is a comment.
 *  \note  All getters throw a std::runtime_error if a required entry is missing or can't be converted.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;

    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }
        Section() = default;

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const std::string &getSectionName() const { return section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }
        inline size_t size() const { return entries_.size(); }

        /** \throws std::runtime_error if "variable_name" already exists in this section. */
        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        /** Like insert() but overwrites existing entries. */
        void replace(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        bool lookup(const std::string &variable_name, std::string * const s) const;

        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        unsigned getUnsigned(const std::string &variable_name) const;
        unsigned getUnsigned(const std::string &variable_name, const unsigned &default_value) const;

        uint64_t getUint64T(const std::string &variable_name) const;
        uint64_t getUint64T(const std::string &variable_name, const uint64_t &default_value) const;

        /** \return True if the value was "true", "yes" or "on" and false if it was "false", "no" or "off". */
        bool getBool(const std::string &variable_name) const;
        bool getBool(const std::string &variable_name, const bool default_value) const;

        int getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map) const;
        int getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map,
                    const int default_value) const;

        std::vector<std::string> getEntryNames() const;

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }

    private:
        void write(std::string * const output) const;
    };

public:
    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;

protected:
    Sections sections_;
    std::string ini_file_name_;
    unsigned current_lineno_;

public:
    /** \throws std::runtime_error if "ini_file_name" can't be read or contains syntax errors. */
    explicit IniFile(const std::string &ini_file_name);

    /** Creates an empty instance that can be populated with appendSection(). */
    IniFile(): current_lineno_(0) { }

    /** \brief  Parses "contents" as if it had been read from a file.
     *  \param  name  Used in error messages only.
     */
    static IniFile FromString(const std::string &contents, const std::string &name = "<string>");

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    const std::string &getFilename() const { return ini_file_name_; }

    std::vector<std::string> getSections() const;
    bool sectionIsDefined(const std::string &section_name) const;

    /** \throws std::runtime_error if there is no section named "section_name". */
    const Section &getSection(const std::string &section_name) const;

    /** \return A reference to the new section.
     *  \throws std::runtime_error if the section already exists.
     *  \note   The reference is only valid until the next call to appendSection().
     */
    Section &appendSection(const std::string &section_name);

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    std::string getString(const std::string &section_name, const std::string &variable_name) const
        { return getSection(section_name).getString(variable_name); }
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;

    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name) const
        { return getSection(section_name).getUnsigned(variable_name); }
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned &default_value) const;

    /** \return The serialised form, parseable by FromString(). */
    std::string toString() const;

private:
    void processStream(std::istream &input);
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line, const std::string &comment);
    std::string getLocation() const;
};
