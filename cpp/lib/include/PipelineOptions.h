/** \file   PipelineOptions.h
 *  \brief  Tunables shared by the dump and the restore pipeline.
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


#include <cstddef>
#include "ChunkCodec.h"
#include "DumpBridgeErrors.h"


struct PipelineOptions {
    static constexpr size_t DEFAULT_CHUNK_SIZE  = 1024 * 1024;
    static constexpr size_t DEFAULT_QUEUE_DEPTH = 2;

    size_t chunk_size_;                    // Upper bound for the raw length of a chunk.
    size_t queue_depth_;                   // Chunks buffered between the producing and the consuming thread.
    ChunkCodec::Compression compression_;  // Only used when dumping, restores use the manifest's compression.
    DumpBridge::RetryPolicy retry_policy_; // For single chunk and manifest transfers.
public:
    PipelineOptions(): chunk_size_(DEFAULT_CHUNK_SIZE), queue_depth_(DEFAULT_QUEUE_DEPTH), compression_(ChunkCodec::ZLIB) { }
};
