/** \file   StringUtil.cc
 *  \brief  Implementation of string conversion and manipulation helpers.
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
#include "StringUtil.h"
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <openssl/evp.h>
#include "util.h"


namespace StringUtil {


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and std::isspace(static_cast<unsigned char>(*ch)))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, base));
    const bool success((*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX));
    errno = 0;
    if (success)
        *n = static_cast<unsigned>(ul);

    return success;
}


unsigned ToUnsigned(const std::string &s, const unsigned base) {
    unsigned n;
    if (unlikely(not ToUnsigned(s, &n, base)))
        throw std::runtime_error("in StringUtil::ToUnsigned: can't convert \"" + s + "\" to an unsigned!");

    return n;
}


bool ToUInt64T(const std::string &s, uint64_t * const n, const unsigned base) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and std::isspace(static_cast<unsigned char>(*ch)))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long long temp(std::strtoull(s.c_str(), &end_ptr, base));
    const bool success((*end_ptr == '\0') and (errno == 0) and (temp <= UINT64_MAX));
    errno = 0;
    if (success)
        *n = static_cast<uint64_t>(temp);

    return success;
}


bool ToBool(const std::string &s, bool * const b) {
    const std::string lowercase_s(ToLower(Trim(s)));
    if (lowercase_s == "true" or lowercase_s == "yes" or lowercase_s == "on") {
        *b = true;
        return true;
    }
    if (lowercase_s == "false" or lowercase_s == "no" or lowercase_s == "off") {
        *b = false;
        return true;
    }

    return false;
}


std::string ToLower(const std::string &s) {
    std::string lowercase_s(s);
    std::transform(lowercase_s.begin(), lowercase_s.end(), lowercase_s.begin(),
                   [](const unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowercase_s;
}


std::string ToUpper(const std::string &s) {
    std::string uppercase_s(s);
    std::transform(uppercase_s.begin(), uppercase_s.end(), uppercase_s.begin(),
                   [](const unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return uppercase_s;
}


std::string Trim(const std::string &s) {
    std::string::size_type first(0);
    while (first < s.length() and std::isspace(static_cast<unsigned char>(s[first])))
        ++first;
    if (first == s.length())
        return "";

    std::string::size_type last(s.length() - 1);
    while (last > first and std::isspace(static_cast<unsigned char>(s[last])))
        --last;

    return s.substr(first, last - first + 1);
}


bool IsWhitespace(const std::string &s) {
    return std::all_of(s.cbegin(), s.cend(), [](const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
}


size_t Split(const std::string &s, const char separator, std::vector<std::string> * const parts, const bool suppress_empty_components) {
    parts->clear();

    std::string::size_type start(0);
    for (;;) {
        const std::string::size_type separator_pos(s.find(separator, start));
        const std::string part(s.substr(start, separator_pos == std::string::npos ? std::string::npos : separator_pos - start));
        if (not part.empty() or not suppress_empty_components)
            parts->emplace_back(part);
        if (separator_pos == std::string::npos)
            break;
        start = separator_pos + 1;
    }

    return parts->size();
}


size_t SplitThenTrim(const std::string &s, const char separator, std::vector<std::string> * const parts) {
    std::vector<std::string> untrimmed_parts;
    Split(s, separator, &untrimmed_parts);

    parts->clear();
    for (const auto &untrimmed_part : untrimmed_parts) {
        const std::string trimmed_part(Trim(untrimmed_part));
        if (not trimmed_part.empty())
            parts->emplace_back(trimmed_part);
    }

    return parts->size();
}


std::string Join(const std::vector<std::string> &parts, const std::string &separator) {
    std::string joined;
    for (auto part(parts.cbegin()); part != parts.cend(); ++part) {
        if (part != parts.cbegin())
            joined += separator;
        joined += *part;
    }

    return joined;
}


std::string ToHexString(const std::string &s) {
    static const char HEX_DIGITS[] = "0123456789abcdef";

    std::string hex_string;
    hex_string.reserve(s.length() * 2);
    for (const unsigned char ch : s) {
        hex_string += HEX_DIGITS[ch >> 4u];
        hex_string += HEX_DIGITS[ch & 0xFu];
    }

    return hex_string;
}


std::string PadLeading(const std::string &s, const std::string::size_type min_length, const char pad) {
    if (s.length() >= min_length)
        return s;
    return std::string(min_length - s.length(), pad) + s;
}


std::string Sha256(const std::string &s) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned digest_length;
    if (unlikely(::EVP_Digest(s.data(), s.size(), digest, &digest_length, ::EVP_sha256(), nullptr) != 1))
        throw std::runtime_error("in StringUtil::Sha256: EVP_Digest failed!");

    return std::string(reinterpret_cast<const char *>(digest), digest_length);
}


void Sha256Accumulator::ContextDeleter::operator()(evp_md_ctx_st * const context) const {
    ::EVP_MD_CTX_free(context);
}


Sha256Accumulator::Sha256Accumulator(): context_(::EVP_MD_CTX_new()), finalised_(false) {
    if (unlikely(context_ == nullptr))
        throw std::runtime_error("in StringUtil::Sha256Accumulator::Sha256Accumulator: EVP_MD_CTX_new failed!");
    if (unlikely(::EVP_DigestInit_ex(context_.get(), ::EVP_sha256(), nullptr) != 1))
        throw std::runtime_error("in StringUtil::Sha256Accumulator::Sha256Accumulator: EVP_DigestInit_ex failed!");
}


void Sha256Accumulator::update(const char * const data, const size_t data_size) {
    if (unlikely(finalised_))
        throw std::runtime_error("in StringUtil::Sha256Accumulator::update: already finalised!");
    if (unlikely(::EVP_DigestUpdate(context_.get(), data, data_size) != 1))
        throw std::runtime_error("in StringUtil::Sha256Accumulator::update: EVP_DigestUpdate failed!");
}


std::string Sha256Accumulator::finalise() {
    if (unlikely(finalised_))
        throw std::runtime_error("in StringUtil::Sha256Accumulator::finalise: already finalised!");
    finalised_ = true;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned digest_length;
    if (unlikely(::EVP_DigestFinal_ex(context_.get(), digest, &digest_length) != 1))
        throw std::runtime_error("in StringUtil::Sha256Accumulator::finalise: EVP_DigestFinal_ex failed!");

    return std::string(reinterpret_cast<const char *>(digest), digest_length);
}


} // namespace StringUtil
