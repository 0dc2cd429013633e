/** \file   Manifest.cc
 *  \brief  Implementation of class Manifest.
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
#include "Manifest.h"
#include <algorithm>
#include <stdexcept>
#include <openssl/rand.h>
#include "BridgeStore.h"
#include "DumpBridgeErrors.h"
#include "IniFile.h"
#include "StringUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


const std::string MANIFEST_SECTION("manifest");
const std::string CHUNK_SECTION_PREFIX("chunk ");
const std::string MANIFEST_FILENAME("manifest.ini");


bool IsHexChecksum(const std::string &checksum) {
    return checksum.length() == 64 and checksum.find_first_not_of("0123456789abcdef") == std::string::npos;
}


} // unnamed namespace


Manifest::Manifest(const std::string &job_name, const time_t created, const ChunkCodec::Compression compression,
                   const uint64_t chunk_size, const unsigned created_microseconds)
    : id_(GenerateId(created, created_microseconds)), job_name_(job_name), created_(created), status_(PENDING), compression_(compression),
      chunk_size_(chunk_size), total_length_(0)
{
}


std::string Manifest::toString() const {
    IniFile ini_file;

    IniFile::Section &manifest_section(ini_file.appendSection(MANIFEST_SECTION));
    manifest_section.insert("id", id_);
    manifest_section.insert("job", job_name_);
    manifest_section.insert("created", TimeUtil::TimeTToZuluString(created_));
    manifest_section.insert("status", StatusToString(status_));
    manifest_section.insert("compression", ChunkCodec::CompressionToString(compression_));
    manifest_section.insert("chunk_size", std::to_string(chunk_size_));
    manifest_section.insert("total_length", std::to_string(total_length_));
    manifest_section.insert("checksum", checksum_);
    manifest_section.insert("chunk_count", std::to_string(chunks_.size()));
    if (not failure_reason_.empty())
        manifest_section.insert("failure_reason", failure_reason_);

    for (const auto &chunk : chunks_) {
        IniFile::Section &chunk_section(ini_file.appendSection(CHUNK_SECTION_PREFIX + std::to_string(chunk.sequence_number_)));
        chunk_section.insert("length", std::to_string(chunk.length_));
        chunk_section.insert("stored_length", std::to_string(chunk.stored_length_));
        chunk_section.insert("checksum", chunk.checksum_);
        chunk_section.insert("key", chunk.key_);
    }

    return ini_file.toString();
}


Manifest Manifest::FromString(const std::string &serialised_manifest, const std::string &origin) {
    Manifest manifest;
    try {
        const IniFile ini_file(IniFile::FromString(serialised_manifest, origin));
        if (unlikely(not ini_file.sectionIsDefined(MANIFEST_SECTION)))
            throw std::runtime_error("missing [" + MANIFEST_SECTION + "] section");

        const IniFile::Section &manifest_section(ini_file.getSection(MANIFEST_SECTION));
        manifest.id_       = manifest_section.getString("id");
        manifest.job_name_ = manifest_section.getString("job");
        if (unlikely(not TimeUtil::Iso8601StringToTimeT(manifest_section.getString("created"), &manifest.created_)))
            throw std::runtime_error("invalid creation time \"" + manifest_section.getString("created") + "\"");
        if (unlikely(not StringToStatus(manifest_section.getString("status"), &manifest.status_)))
            throw std::runtime_error("invalid status \"" + manifest_section.getString("status") + "\"");
        if (unlikely(not ChunkCodec::StringToCompression(manifest_section.getString("compression"), &manifest.compression_)))
            throw std::runtime_error("invalid compression \"" + manifest_section.getString("compression") + "\"");
        manifest.chunk_size_     = manifest_section.getUint64T("chunk_size");
        manifest.total_length_   = manifest_section.getUint64T("total_length");
        manifest.checksum_       = manifest_section.getString("checksum", "");
        manifest.failure_reason_ = manifest_section.getString("failure_reason", "");
        const unsigned chunk_count(manifest_section.getUnsigned("chunk_count"));

        // Every chunk section must be one of [chunk 0] through [chunk <chunk_count - 1>]:
        unsigned chunk_section_count(0);
        for (const auto &section : ini_file) {
            if (section.getSectionName() == MANIFEST_SECTION)
                continue;
            unsigned sequence_number;
            if (unlikely(not StringUtil::StartsWith(section.getSectionName(), CHUNK_SECTION_PREFIX)
                         or not StringUtil::ToUnsigned(section.getSectionName().substr(CHUNK_SECTION_PREFIX.length()), &sequence_number)))
                throw std::runtime_error("unexpected section [" + section.getSectionName() + "]");
            if (unlikely(sequence_number >= chunk_count))
                throw std::runtime_error("chunk " + std::to_string(sequence_number) + " is beyond the chunk count of "
                                         + std::to_string(chunk_count));
            ++chunk_section_count;
        }
        if (unlikely(chunk_section_count != chunk_count))
            throw std::runtime_error("expected " + std::to_string(chunk_count) + " chunks, found " + std::to_string(chunk_section_count));

        uint64_t sum_of_chunk_lengths(0);
        for (unsigned sequence_number(0); sequence_number < chunk_count; ++sequence_number) {
            const std::string section_name(CHUNK_SECTION_PREFIX + std::to_string(sequence_number));
            if (unlikely(not ini_file.sectionIsDefined(section_name)))
                throw std::runtime_error("missing chunk " + std::to_string(sequence_number));
            const IniFile::Section &chunk_section(ini_file.getSection(section_name));

            ChunkCodec::ChunkDescriptor chunk;
            chunk.sequence_number_ = sequence_number;
            chunk.length_          = chunk_section.getUint64T("length");
            chunk.stored_length_   = chunk_section.getUint64T("stored_length");
            chunk.checksum_        = chunk_section.getString("checksum");
            chunk.key_             = chunk_section.getString("key");
            if (unlikely(chunk.length_ == 0 or (manifest.chunk_size_ > 0 and chunk.length_ > manifest.chunk_size_)))
                throw std::runtime_error("chunk " + std::to_string(sequence_number) + " has an invalid length");
            if (unlikely(not IsHexChecksum(chunk.checksum_)))
                throw std::runtime_error("chunk " + std::to_string(sequence_number) + " has an invalid checksum");
            if (unlikely(chunk.key_.empty()))
                throw std::runtime_error("chunk " + std::to_string(sequence_number) + " has no key");

            sum_of_chunk_lengths += chunk.length_;
            manifest.chunks_.emplace_back(chunk);
        }

        if (manifest.status_ == COMPLETE) {
            if (unlikely(sum_of_chunk_lengths != manifest.total_length_))
                throw std::runtime_error("chunk lengths add up to " + std::to_string(sum_of_chunk_lengths) + " instead of "
                                         + std::to_string(manifest.total_length_));
            if (unlikely(not IsHexChecksum(manifest.checksum_)))
                throw std::runtime_error("invalid aggregate checksum");
        }
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ManifestCorruptError("corrupt manifest \"" + origin + "\": " + std::string(x.what()));
    }

    return manifest;
}


std::string Manifest::StatusToString(const Status status) {
    switch (status) {
    case PENDING:
        return "pending";
    case COMPLETE:
        return "complete";
    case FAILED:
        return "failed";
    }

    return "unknown";
}


bool Manifest::StringToStatus(const std::string &s, Status * const status) {
    if (s == "pending")
        *status = PENDING;
    else if (s == "complete")
        *status = COMPLETE;
    else if (s == "failed")
        *status = FAILED;
    else
        return false;

    return true;
}


std::string Manifest::GenerateId(const time_t now, const unsigned microseconds) {
    if (unlikely(microseconds >= 1000000u))
        throw std::runtime_error("in Manifest::GenerateId: microseconds out of range: " + std::to_string(microseconds) + "!");

    unsigned char random_bytes[3];
    if (unlikely(::RAND_bytes(random_bytes, sizeof random_bytes) != 1))
        throw std::runtime_error("in Manifest::GenerateId: RAND_bytes failed!");

    return TimeUtil::TimeTToUtcString(now, TimeUtil::COMPACT_FORMAT) + "." + StringUtil::PadLeading(std::to_string(microseconds), 6, '0')
           + "Z-" + StringUtil::ToHexString(std::string(reinterpret_cast<const char *>(random_bytes), sizeof random_bytes));
}


std::string Manifest::GetKey(const std::string &job_name, const std::string &manifest_id) {
    return job_name + "/" + manifest_id + "/" + MANIFEST_FILENAME;
}


void Manifest::Store(BridgeStore * const bridge_store, const Manifest &manifest, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    bridge_store->put(GetKey(manifest.job_name_, manifest.id_), manifest.toString(), cancellation_token);
}


Manifest Manifest::Load(BridgeStore * const bridge_store, const std::string &job_name, const std::string &manifest_id,
                        const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    const std::string key(GetKey(job_name, manifest_id));
    const Manifest manifest(FromString(bridge_store->getString(key, cancellation_token), key));
    if (unlikely(manifest.id_ != manifest_id or manifest.job_name_ != job_name))
        throw DumpBridge::ManifestCorruptError("manifest \"" + key + "\" claims to be \"" + GetKey(manifest.job_name_, manifest.id_) + "\"!");

    return manifest;
}


std::vector<std::string> Manifest::ListIds(BridgeStore * const bridge_store, const std::string &job_name,
                                           const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    std::vector<std::string> manifest_ids;
    for (const auto &key : bridge_store->list(job_name + "/", cancellation_token)) {
        std::vector<std::string> key_components;
        StringUtil::Split(key, '/', &key_components);
        if (key_components.size() == 3 and key_components[0] == job_name and key_components[2] == MANIFEST_FILENAME)
            manifest_ids.emplace_back(key_components[1]);
    }
    std::sort(manifest_ids.begin(), manifest_ids.end());

    return manifest_ids;
}


bool Manifest::SelectLatestComplete(BridgeStore * const bridge_store, const std::string &job_name, Manifest * const manifest,
                                    const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    const std::vector<std::string> manifest_ids(ListIds(bridge_store, job_name, cancellation_token));
    for (auto manifest_id(manifest_ids.crbegin()); manifest_id != manifest_ids.crend(); ++manifest_id) {
        const std::string key(GetKey(job_name, *manifest_id));
        const std::string serialised_manifest(bridge_store->getString(key, cancellation_token));
        try {
            *manifest = FromString(serialised_manifest, key);
        } catch (const DumpBridge::ManifestCorruptError &x) {
            // A corrupt manifest that doesn't even claim to be complete was never eligible.
            std::string status;
            try {
                IniFile::FromString(serialised_manifest, key).lookup(MANIFEST_SECTION, "status", &status);
            } catch (const std::runtime_error &) {
                status.clear();
            }
            if (status == StatusToString(COMPLETE))
                throw;
            LOG_WARNING("ignoring unreadable manifest: " + std::string(x.what()));
            continue;
        }

        if (manifest->isComplete()) {
            if (unlikely(manifest->id_ != *manifest_id or manifest->job_name_ != job_name))
                throw DumpBridge::ManifestCorruptError("manifest \"" + key + "\" claims to be \"" + GetKey(manifest->job_name_, manifest->id_)
                                                       + "\"!");
            return true;
        }
        LOG_DEBUG("skipping " + StatusToString(manifest->status_) + " manifest \"" + key + "\"");
    }

    return false;
}
