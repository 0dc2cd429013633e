/** \file   Manifest.h
 *  \brief  The descriptor of one dump artifact and its persistence in a bridge store.
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
#include <ctime>
#include "ChunkCodec.h"
#include "ThreadUtil.h"


// Forward declaration:
class BridgeStore;


/** \class  Manifest
 *  \brief  Lists the chunks of one dump run, in sequence order, together w/ the run's status.
 *  \note   A manifest is written to the bridge store exactly once, after all of its chunks have been stored.  Readers
 *          therefore never see a manifest whose chunks are incomplete.
 */
class Manifest {
public:
    enum Status { PENDING, COMPLETE, FAILED };

    std::string id_;
    std::string job_name_;
    time_t created_;
    Status status_;
    ChunkCodec::Compression compression_;
    uint64_t chunk_size_;
    uint64_t total_length_;
    std::string checksum_; // Hex SHA-256 of the whole raw stream, empty unless complete.
    std::string failure_reason_;
    std::vector<ChunkCodec::ChunkDescriptor> chunks_;

public:
    Manifest(): created_(0), status_(PENDING), compression_(ChunkCodec::NONE), chunk_size_(0), total_length_(0) { }
    Manifest(const std::string &job_name, const time_t created, const ChunkCodec::Compression compression, const uint64_t chunk_size,
             const unsigned created_microseconds = 0);

    inline bool isComplete() const { return status_ == COMPLETE; }

    /** \return The serialised manifest, parseable by FromString(). */
    std::string toString() const;

    /** \brief  Parses and validates a serialised manifest.
     *  \param  origin  Used in error messages, typically the storage key.
     *  \throws DumpBridge::ManifestCorruptError if anything is missing, unparseable or inconsistent, e.g. if the chunk
     *          sequence numbers are not contiguous starting at 0.
     */
    static Manifest FromString(const std::string &serialised_manifest, const std::string &origin);

    static std::string StatusToString(const Status status);
    static bool StringToStatus(const std::string &s, Status * const status);

    /** \return A new manifest ID of the form YYYYMMDDTHHMMSS.uuuuuuZ-<6 random hex digits>, lexically ordered by "now" and
     *          "microseconds".
     */
    static std::string GenerateId(const time_t now, const unsigned microseconds = 0);

    /** \return "<job>/<manifest_id>/manifest.ini". */
    static std::string GetKey(const std::string &job_name, const std::string &manifest_id);

    /** \brief  Writes "manifest" under its key.  This single put is the visibility point of the whole artifact. */
    static void Store(BridgeStore * const bridge_store, const Manifest &manifest,
                      const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr);

    /** \throws DumpBridge::DownloadError if there is no such manifest, DumpBridge::ManifestCorruptError if it can't be
     *          parsed or doesn't belong to "job_name".
     */
    static Manifest Load(BridgeStore * const bridge_store, const std::string &job_name, const std::string &manifest_id,
                         const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr);

    /** \return The IDs of all manifests stored for "job_name" regardless of their status, oldest first. */
    static std::vector<std::string> ListIds(BridgeStore * const bridge_store, const std::string &job_name,
                                            const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr);

    /** \brief  Finds the most recent complete manifest of "job_name".  Pending and failed manifests are never selected.
     *  \return False if there is no complete manifest.
     *  \throws DumpBridge::ManifestCorruptError if the newest manifest claiming to be complete is corrupt.
     */
    static bool SelectLatestComplete(BridgeStore * const bridge_store, const std::string &job_name, Manifest * const manifest,
                                     const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr);
};
