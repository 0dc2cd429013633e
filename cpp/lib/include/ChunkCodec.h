/** \file   ChunkCodec.h
 *  \brief  Turns a byte stream into checksummed, optionally compressed chunks and back.
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
#include <cinttypes>
#include "StringUtil.h"


namespace ChunkCodec {


enum Compression { NONE, ZLIB };


std::string CompressionToString(const Compression compression);

/** \return False if "s" is neither "none" nor "zlib". */
bool StringToCompression(const std::string &s, Compression * const compression);


struct ChunkDescriptor {
    unsigned sequence_number_;
    uint64_t length_;        // Raw, i.e. uncompressed, length.
    uint64_t stored_length_; // Length of the stored object.
    std::string checksum_;   // Lowercase hex SHA-256 of the stored object.
    std::string key_;        // Bridge store key of the stored object.
public:
    ChunkDescriptor(): sequence_number_(0), length_(0), stored_length_(0) { }
};


struct Chunk {
    ChunkDescriptor descriptor_;
    std::string stored_bytes_;
};


/** \return "<job>/<manifest_id>/chunk-<sequence_number as 8 decimal digits>". */
std::string GetChunkKey(const std::string &job_name, const std::string &manifest_id, const unsigned sequence_number);


/** \return The lowercase hex SHA-256 checksum of "data". */
inline std::string Checksum(const std::string &data) { return StringUtil::ToHexString(StringUtil::Sha256(data)); }


/** \class  Encoder
 *  \brief  Assigns consecutive sequence numbers, starting at 0, to the slices of one stream and keeps track of the
 *          aggregate length and checksum of the raw stream.
 */
class Encoder {
    std::string job_name_, manifest_id_;
    Compression compression_;
    unsigned next_sequence_number_;
    uint64_t total_length_;
    StringUtil::Sha256Accumulator stream_checksum_;
public:
    Encoder(const std::string &job_name, const std::string &manifest_id, const Compression compression);

    /** \brief  Encodes the next slice of the stream.
     *  \note   "raw_bytes" must not be empty.
     */
    Chunk encode(const std::string &raw_bytes);

    inline unsigned getChunkCount() const { return next_sequence_number_; }
    inline uint64_t getTotalLength() const { return total_length_; }

    /** \return The hex SHA-256 checksum of everything passed to encode().  May only be called once. */
    std::string finaliseStreamChecksum() { return StringUtil::ToHexString(stream_checksum_.finalise()); }
};


/** \class  Decoder
 *  \brief  The inverse of Encoder.  Insists on ascending, gapless sequence numbers and on matching checksums.
 */
class Decoder {
    Compression compression_;
    unsigned expected_sequence_number_;
    uint64_t total_length_;
    StringUtil::Sha256Accumulator stream_checksum_;
public:
    explicit Decoder(const Compression compression);

    /** \brief  Verifies "stored_bytes" against "descriptor" and returns the raw bytes.
     *  \throws DumpBridge::IntegrityError on any checksum or length mismatch or if the stored object can't be
     *          decompressed, DumpBridge::ManifestCorruptError if "descriptor" is out of sequence.
     */
    std::string decode(const ChunkDescriptor &descriptor, const std::string &stored_bytes);

    /** \throws DumpBridge::IntegrityError if the decoded stream doesn't have the expected length and checksum. */
    void verifyStream(const uint64_t expected_total_length, const std::string &expected_checksum);
};


} // namespace ChunkCodec
