/** \file   ChunkCodec.cc
 *  \brief  Implementation of the chunk encoder and decoder.
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
#include "ChunkCodec.h"
#include <stdexcept>
#include "DumpBridgeErrors.h"
#include "GzStream.h"
#include "util.h"


namespace ChunkCodec {


std::string CompressionToString(const Compression compression) {
    return compression == ZLIB ? "zlib" : "none";
}


bool StringToCompression(const std::string &s, Compression * const compression) {
    if (s == "zlib")
        *compression = ZLIB;
    else if (s == "none")
        *compression = NONE;
    else
        return false;

    return true;
}


std::string GetChunkKey(const std::string &job_name, const std::string &manifest_id, const unsigned sequence_number) {
    return job_name + "/" + manifest_id + "/chunk-" + StringUtil::PadLeading(std::to_string(sequence_number), 8, '0');
}


Encoder::Encoder(const std::string &job_name, const std::string &manifest_id, const Compression compression)
    : job_name_(job_name), manifest_id_(manifest_id), compression_(compression), next_sequence_number_(0), total_length_(0)
{
}


Chunk Encoder::encode(const std::string &raw_bytes) {
    if (unlikely(raw_bytes.empty()))
        throw std::runtime_error("in ChunkCodec::Encoder::encode: refusing to encode an empty chunk!");

    stream_checksum_.update(raw_bytes);
    total_length_ += raw_bytes.size();

    Chunk chunk;
    chunk.stored_bytes_ = (compression_ == ZLIB) ? GzStream::CompressString(raw_bytes) : raw_bytes;
    chunk.descriptor_.sequence_number_ = next_sequence_number_;
    chunk.descriptor_.length_          = raw_bytes.size();
    chunk.descriptor_.stored_length_   = chunk.stored_bytes_.size();
    chunk.descriptor_.checksum_        = Checksum(chunk.stored_bytes_);
    chunk.descriptor_.key_             = GetChunkKey(job_name_, manifest_id_, next_sequence_number_);
    ++next_sequence_number_;

    return chunk;
}


Decoder::Decoder(const Compression compression): compression_(compression), expected_sequence_number_(0), total_length_(0) {
}


std::string Decoder::decode(const ChunkDescriptor &descriptor, const std::string &stored_bytes) {
    if (unlikely(descriptor.sequence_number_ != expected_sequence_number_))
        throw DumpBridge::ManifestCorruptError("expected chunk " + std::to_string(expected_sequence_number_) + " but got chunk "
                                               + std::to_string(descriptor.sequence_number_) + "!");

    const std::string chunk_name("chunk " + std::to_string(descriptor.sequence_number_) + " (" + descriptor.key_ + ")");
    if (unlikely(stored_bytes.size() != descriptor.stored_length_))
        throw DumpBridge::IntegrityError(chunk_name + " has " + std::to_string(stored_bytes.size()) + " bytes, expected "
                                         + std::to_string(descriptor.stored_length_) + "!");
    const std::string actual_checksum(Checksum(stored_bytes));
    if (unlikely(actual_checksum != descriptor.checksum_))
        throw DumpBridge::IntegrityError("checksum mismatch for " + chunk_name + ": expected " + descriptor.checksum_ + ", got "
                                         + actual_checksum + "!");

    std::string raw_bytes;
    if (compression_ == ZLIB) {
        try {
            raw_bytes = GzStream::DecompressString(stored_bytes);
        } catch (const std::runtime_error &x) {
            throw DumpBridge::IntegrityError("can't decompress " + chunk_name + ": " + std::string(x.what()));
        }
    } else
        raw_bytes = stored_bytes;

    if (unlikely(raw_bytes.size() != descriptor.length_))
        throw DumpBridge::IntegrityError(chunk_name + " decodes to " + std::to_string(raw_bytes.size()) + " bytes, expected "
                                         + std::to_string(descriptor.length_) + "!");

    stream_checksum_.update(raw_bytes);
    total_length_ += raw_bytes.size();
    ++expected_sequence_number_;

    return raw_bytes;
}


void Decoder::verifyStream(const uint64_t expected_total_length, const std::string &expected_checksum) {
    if (unlikely(total_length_ != expected_total_length))
        throw DumpBridge::IntegrityError("restored stream has " + std::to_string(total_length_) + " bytes, expected "
                                         + std::to_string(expected_total_length) + "!");

    const std::string actual_checksum(StringUtil::ToHexString(stream_checksum_.finalise()));
    if (unlikely(actual_checksum != expected_checksum))
        throw DumpBridge::IntegrityError("aggregate checksum mismatch: expected " + expected_checksum + ", got " + actual_checksum + "!");
}


} // namespace ChunkCodec
