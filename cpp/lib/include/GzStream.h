/** \file    GzStream.h
 *  \brief   Declaration of class GzStream, a thin wrapper around zlib's deflate and inflate.
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


#include <string>
#include <zlib.h>


/** \class  GzStream
 *  \brief  Incremental zlib compression or decompression.  All errors are reported as std::runtime_error.
 */
class GzStream {
    z_stream stream_;
public:
    enum Type { COMPRESS, DECOMPRESS };
private:
    Type type_;
public:
    explicit GzStream(const Type type, const int compression_level = Z_DEFAULT_COMPRESSION);
    GzStream(const GzStream &rhs) = delete;
    ~GzStream();

    /** \brief  Compresses bytes taken from "input_data" and deposits the compressed output into "output_data".
     *  \param  bytes_consumed   The actual number for bytes from "input_data" that have been compressed.
     *  \param  bytes_produced   The length of the compressed output "output_data" actually used.
     *  \return Returns true if more compressed data can be retrieved and false otherwise.
     *  \note   After passing in all data to be compressed you must call "compress" with "input_data" set to
     *          nullptr and retrieve "output_data" until "compress" returns false.
     */
    bool compress(const char * const input_data, unsigned input_data_size, char * const output_data,
                  unsigned output_data_size, unsigned * const bytes_consumed, unsigned * const bytes_produced);

    /** \brief  Decompresses bytes taken from "input_data" and deposits the decompressed output into "output_data".
     *  \return Returns false once the end of the compressed stream has been reached and true otherwise.
     *  \throws std::runtime_error if the input is not a valid zlib stream.
     */
    bool decompress(const char * const input_data, unsigned input_data_size, char * const output_data,
                    unsigned output_data_size, unsigned * const bytes_consumed, unsigned * const bytes_produced);

    static std::string CompressString(const std::string &input, const int compression_level = Z_DEFAULT_COMPRESSION);

    /** \throws std::runtime_error if "input" is corrupt, truncated or followed by trailing garbage. */
    static std::string DecompressString(const std::string &input);
};
