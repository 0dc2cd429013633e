/** \file   StringUtil.h
 *  \brief  String conversion and manipulation helpers.
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


#include <memory>
#include <string>
#include <vector>
#include <cinttypes>


// Forward declaration:
struct evp_md_ctx_st;


namespace StringUtil {


/** \brief   Convert a string into an unsigned number.
 *  \param   s     The string to convert.
 *  \param   n     Number that will hold the result.
 *  \param   base  The base of the string representation.
 *  \return  true if the conversion was successful, false otherwise.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


/** \throws std::runtime_error if "s" can't be converted. */
unsigned ToUnsigned(const std::string &s, const unsigned base = 10);


/** \brief   Convert a string into a uint64_t.
 *  \return  true if the conversion was successful, false otherwise.
 */
bool ToUInt64T(const std::string &s, uint64_t * const n, const unsigned base = 10);


/** \brief  Converts "true", "yes", "on", "false", "no" and "off", regardless of case, to a boolean.
 *  \return True if "s" was one of the recognised values, else false.
 */
bool ToBool(const std::string &s, bool * const b);


std::string ToLower(const std::string &s);
std::string ToUpper(const std::string &s);


/** Removes leading and trailing whitespace. */
std::string Trim(const std::string &s);


/** \return True if "s" is empty or only contains characters for which isspace(3) is true. */
bool IsWhitespace(const std::string &s);


inline bool StartsWith(const std::string &s, const std::string &prefix) {
    return s.length() >= prefix.length() and s.compare(0, prefix.length(), prefix) == 0;
}


/** \brief  Splits "s" on each occurrence of "separator".
 *  \param  parts                      Where the pieces will be stored.  Previous contents are discarded.
 *  \param  suppress_empty_components  If true, empty pieces will not be returned.
 *  \return The number of pieces.
 */
size_t Split(const std::string &s, const char separator, std::vector<std::string> * const parts,
             const bool suppress_empty_components = false);


/** \brief  Like Split() but each piece is trimmed and empty pieces are always suppressed. */
size_t SplitThenTrim(const std::string &s, const char separator, std::vector<std::string> * const parts);


std::string Join(const std::vector<std::string> &parts, const std::string &separator);


/** Converts "s" (a memory block) to a string consisting of lowercase hexadecimal numbers (one per nibble). */
std::string ToHexString(const std::string &s);


/** \brief Pads "s" on the left w/ "pad" until it is at least "min_length" characters long. */
std::string PadLeading(const std::string &s, const std::string::size_type min_length, const char pad = ' ');


/** \return The binary SHA-256 digest of "s". */
std::string Sha256(const std::string &s);


/** \class  Sha256Accumulator
 *  \brief  Computes a SHA-256 digest over data that arrives in pieces.
 */
class Sha256Accumulator {
    struct ContextDeleter {
        void operator()(evp_md_ctx_st * const context) const;
    };
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> context_;
    bool finalised_;
public:
    Sha256Accumulator();

    void update(const char * const data, const size_t data_size);
    inline void update(const std::string &data) { update(data.data(), data.size()); }

    /** \return The binary digest.  No further updates are allowed afterwards. */
    std::string finalise();
};


} // namespace StringUtil
