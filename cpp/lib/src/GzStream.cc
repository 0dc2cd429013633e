/** \file    GzStream.cc
 *  \brief   Implementation of class GzStream.
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
#include "GzStream.h"
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include "util.h"


GzStream::GzStream(const Type type, const int compression_level): type_(type) {
    std::memset(&stream_, '\0', sizeof stream_);

    if (type_ == COMPRESS) {
        const int retcode(::deflateInit(&stream_, compression_level));
        switch (retcode) {
        case Z_OK:
            return;
        case Z_STREAM_ERROR:
            throw std::runtime_error("in GzStream::GzStream: invalid compression level " + std::to_string(compression_level) + "!");
        case Z_MEM_ERROR:
            throw std::runtime_error("in GzStream::GzStream: not enough memory for deflation!");
        case Z_VERSION_ERROR:
            throw std::runtime_error("in GzStream::GzStream: invalid library version for deflation!");
        default:
            throw std::runtime_error("in GzStream::GzStream: unknown error code " + std::to_string(retcode) + " for deflateInit()!");
        }
    } else {
        const int retcode(::inflateInit(&stream_));
        switch (retcode) {
        case Z_OK:
            return;
        case Z_MEM_ERROR:
            throw std::runtime_error("in GzStream::GzStream: not enough memory for inflation!");
        case Z_VERSION_ERROR:
            throw std::runtime_error("in GzStream::GzStream: invalid library version for inflation!");
        default:
            throw std::runtime_error("in GzStream::GzStream: unknown error code " + std::to_string(retcode) + " for inflateInit()!");
        }
    }
}


GzStream::~GzStream() {
    if (type_ == COMPRESS)
        ::deflateEnd(&stream_);
    else
        ::inflateEnd(&stream_);
}


bool GzStream::compress(const char * const input_data, unsigned input_data_size, char * const output_data,
                        unsigned output_data_size, unsigned * const bytes_consumed, unsigned * const bytes_produced)
{
    stream_.next_in   = reinterpret_cast<Bytef *>(const_cast<char *>(input_data));
    stream_.avail_in  = (input_data == nullptr) ? 0 : input_data_size;
    stream_.next_out  = reinterpret_cast<Bytef *>(output_data);
    stream_.avail_out = output_data_size;
    const int retval(::deflate(&stream_, (input_data == nullptr) ? Z_FINISH : Z_NO_FLUSH));
    *bytes_consumed = ((input_data == nullptr) ? 0 : input_data_size) - stream_.avail_in;
    *bytes_produced = output_data_size - stream_.avail_out;

    switch (retval) {
    case Z_OK:
    case Z_BUF_ERROR: // Not fatal, we just need to be called again.
        return true;
    case Z_STREAM_END:
        return false;
    case Z_STREAM_ERROR:
        throw std::runtime_error("in GzStream::compress: inconsistent stream state!");
    }

    throw std::runtime_error("in GzStream::compress: we should *never* get here (return code = " + std::to_string(retval) + ")!");
}


bool GzStream::decompress(const char * const input_data, unsigned input_data_size, char * const output_data,
                          unsigned output_data_size, unsigned * const bytes_consumed, unsigned * const bytes_produced)
{
    stream_.next_in   = reinterpret_cast<Bytef *>(const_cast<char *>(input_data));
    stream_.avail_in  = (input_data == nullptr) ? 0 : input_data_size;
    stream_.next_out  = reinterpret_cast<Bytef *>(output_data);
    stream_.avail_out = output_data_size;
    const int retval(::inflate(&stream_, Z_NO_FLUSH));
    *bytes_consumed = ((input_data == nullptr) ? 0 : input_data_size) - stream_.avail_in;
    *bytes_produced = output_data_size - stream_.avail_out;

    switch (retval) {
    case Z_OK:
        return true;
    case Z_STREAM_END:
        return false;
    case Z_BUF_ERROR:
        if (*bytes_consumed == 0 and *bytes_produced == 0)
            throw std::runtime_error("in GzStream::decompress: truncated input, no progress possible!");
        return true;
    case Z_NEED_DICT:
    case Z_DATA_ERROR:
        throw std::runtime_error("in GzStream::decompress: corrupt input data!");
    case Z_MEM_ERROR:
        throw std::runtime_error("in GzStream::decompress: out of memory!");
    case Z_STREAM_ERROR:
        throw std::runtime_error("in GzStream::decompress: inconsistent stream state!");
    }

    throw std::runtime_error("in GzStream::decompress: we should *never* get here (return code = " + std::to_string(retval) + ")!");
}


std::string GzStream::CompressString(const std::string &input, const int compression_level) {
    std::string compressed_output;
    compressed_output.reserve(::compressBound(static_cast<uLong>(input.length())));

    GzStream stream(COMPRESS, compression_level);
    char compressed_data[64 * 1024];
    unsigned bytes_consumed, bytes_produced;
    size_t total_processed(0);

    while (total_processed < input.length()) {
        const size_t remaining(input.length() - total_processed);
        stream.compress(input.data() + total_processed, static_cast<unsigned>(std::min<size_t>(remaining, 1u << 30u)),
                        compressed_data, sizeof(compressed_data), &bytes_consumed, &bytes_produced);
        compressed_output.append(compressed_data, bytes_produced);
        total_processed += bytes_consumed;
    }

    // Flush whatever is still buffered inside of zlib:
    bool more(true);
    while (more) {
        more = stream.compress(nullptr, 0, compressed_data, sizeof(compressed_data), &bytes_consumed, &bytes_produced);
        compressed_output.append(compressed_data, bytes_produced);
    }

    return compressed_output;
}


std::string GzStream::DecompressString(const std::string &input) {
    std::string decompressed_output;

    GzStream stream(DECOMPRESS);
    char decompressed_data[64 * 1024];
    unsigned bytes_consumed, bytes_produced;
    size_t total_processed(0);

    bool more(true);
    while (more) {
        const size_t remaining(input.length() - total_processed);
        more = stream.decompress(input.data() + total_processed, static_cast<unsigned>(std::min<size_t>(remaining, 1u << 30u)),
                                 decompressed_data, sizeof(decompressed_data), &bytes_consumed, &bytes_produced);
        decompressed_output.append(decompressed_data, bytes_produced);
        total_processed += bytes_consumed;
    }

    if (unlikely(total_processed != input.length()))
        throw std::runtime_error("in GzStream::DecompressString: trailing garbage after the end of the compressed data!");

    return decompressed_output;
}
