/** \brief Test cases for the restore pipeline
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
#include <memory>
#include <string>
#include <ctime>
#include "DumpBridgeErrors.h"
#include "DumpPipeline.h"
#include "Manifest.h"
#include "RestorePipeline.h"
#include "TestConnectors.h"
#include "UnitTest.h"


namespace {


const size_t CHUNK_SIZE(64 * 1024);


PipelineOptions TestOptions() {
    PipelineOptions options;
    options.chunk_size_   = CHUNK_SIZE;
    options.retry_policy_ = FastRetryPolicy();
    return options;
}


// Stores "data" as an artifact of "job_name" created at "created", w/ the given final status.
Manifest StoreArtifact(BridgeStore * const store, const std::string &job_name, const time_t created, const std::string &data,
                       const Manifest::Status status = Manifest::COMPLETE)
{
    Manifest manifest(job_name, created, ChunkCodec::ZLIB, CHUNK_SIZE);
    ChunkCodec::Encoder encoder(job_name, manifest.id_, ChunkCodec::ZLIB);
    for (size_t offset(0); offset < data.size(); offset += CHUNK_SIZE) {
        const ChunkCodec::Chunk chunk(encoder.encode(data.substr(offset, CHUNK_SIZE)));
        store->put(chunk.descriptor_.key_, chunk.stored_bytes_);
        manifest.chunks_.emplace_back(chunk.descriptor_);
    }
    manifest.total_length_ = encoder.getTotalLength();
    manifest.status_       = status;
    if (status == Manifest::COMPLETE)
        manifest.checksum_ = encoder.finaliseStreamChecksum();
    else if (status == Manifest::FAILED)
        manifest.failure_reason_ = "source went away";
    Manifest::Store(store, manifest);

    return manifest;
}


const time_t JAN_2026(1767225600); // 2026-01-01T00:00:00Z


} // unnamed namespace


TEST(DumpThenRestoreIsByteIdentical) {
    MemoryBridgeStore store;
    const std::string data(MakeTestData(5 * CHUNK_SIZE / 2));
    MemorySourceConnector source(data);
    const Manifest dumped(DumpPipeline(&store, TestOptions()).run("production", &source, nullptr));

    MemoryDestinationConnector destination;
    const Manifest restored(RestorePipeline(&store, TestOptions()).run("production", "", &destination, nullptr));
    CHECK_EQ(restored.id_, dumped.id_);
    CHECK_TRUE(destination.received_ == data);
    CHECK_TRUE(destination.closed_);
    CHECK_FALSE(destination.aborted_);
    CHECK_EQ(destination.write_count_, 3u);
}


TEST(LatestCompleteManifestIsSelected) {
    MemoryBridgeStore store;
    StoreArtifact(&store, "job", JAN_2026, MakeTestData(1000, 1));
    const Manifest newest_complete(StoreArtifact(&store, "job", JAN_2026 + 3600, MakeTestData(1000, 2)));
    StoreArtifact(&store, "job", JAN_2026 + 7200, MakeTestData(1000, 3), Manifest::FAILED);
    StoreArtifact(&store, "job", JAN_2026 + 10800, MakeTestData(1000, 4), Manifest::PENDING);

    MemoryDestinationConnector destination;
    RestorePipeline pipeline(&store, TestOptions());
    CHECK_EQ(pipeline.selectManifest("job", "", nullptr).id_, newest_complete.id_);
    CHECK_EQ(pipeline.run("job", "", &destination, nullptr).id_, newest_complete.id_);
    CHECK_TRUE(destination.received_ == MakeTestData(1000, 2));
}


TEST(BackToBackDumpsRestoreTheLastOne) {
    // Consecutive dumps usually finish within the same second.
    for (unsigned round(0); round < 40; ++round) {
        MemoryBridgeStore store;
        DumpPipeline dump_pipeline(&store, TestOptions());
        MemorySourceConnector first_source(MakeTestData(1000, 2 * round + 1));
        const Manifest first(dump_pipeline.run("job", &first_source, nullptr));
        MemorySourceConnector second_source(MakeTestData(1000, 2 * round + 2));
        const Manifest second(dump_pipeline.run("job", &second_source, nullptr));
        CHECK_LT(first.id_, second.id_);

        MemoryDestinationConnector destination;
        CHECK_EQ(RestorePipeline(&store, TestOptions()).run("job", "", &destination, nullptr).id_, second.id_);
        CHECK_TRUE(destination.received_ == MakeTestData(1000, 2 * round + 2));
    }
}


TEST(PinnedManifest) {
    MemoryBridgeStore store;
    const Manifest older(StoreArtifact(&store, "job", JAN_2026, MakeTestData(3 * CHUNK_SIZE, 1)));
    StoreArtifact(&store, "job", JAN_2026 + 60, MakeTestData(1000, 2));
    const Manifest failed(StoreArtifact(&store, "job", JAN_2026 + 120, MakeTestData(1000, 3), Manifest::FAILED));

    RestorePipeline pipeline(&store, TestOptions());
    MemoryDestinationConnector destination;
    CHECK_EQ(pipeline.run("job", older.id_, &destination, nullptr).id_, older.id_);
    CHECK_TRUE(destination.received_ == MakeTestData(3 * CHUNK_SIZE, 1));

    MemoryDestinationConnector destination2;
    CHECK_THROW(pipeline.run("job", failed.id_, &destination2, nullptr), DumpBridge::DownloadError);
    CHECK_FALSE(destination2.opened_);
    CHECK_THROW(pipeline.run("job", "20260101T000000.000000Z-000000", &destination2, nullptr), DumpBridge::DownloadError);
}


TEST(NothingToRestore) {
    MemoryBridgeStore store;
    StoreArtifact(&store, "job", JAN_2026, MakeTestData(1000), Manifest::FAILED);

    MemoryDestinationConnector destination;
    RestorePipeline pipeline(&store, TestOptions());
    try {
        pipeline.run("job", "", &destination, nullptr);
        CHECK_TRUE(false);
    } catch (const DumpBridge::DownloadError &x) {
        CHECK_FALSE(x.isTransient());
    }
    CHECK_FALSE(destination.opened_);
}


TEST(CorruptedChunkIsNeverForwarded) {
    MemoryBridgeStore store;
    const Manifest manifest(StoreArtifact(&store, "job", JAN_2026, MakeTestData(3 * CHUNK_SIZE)));

    // Flip a single byte of the first chunk:
    const std::string &first_chunk_key(manifest.chunks_.front().key_);
    std::string stored_bytes(store.getString(first_chunk_key));
    stored_bytes[stored_bytes.size() / 2] ^= 0x20;
    store.put(first_chunk_key, stored_bytes);

    MemoryDestinationConnector destination;
    RestorePipeline pipeline(&store, TestOptions());
    CHECK_THROW(pipeline.run("job", manifest.id_, &destination, nullptr), DumpBridge::IntegrityError);
    CHECK_TRUE(destination.received_.empty());
    CHECK_TRUE(destination.aborted_);
    CHECK_FALSE(destination.closed_);
}


TEST(CorruptionInALaterChunkAbortsTheDestination) {
    MemoryBridgeStore store;
    const Manifest manifest(StoreArtifact(&store, "job", JAN_2026, MakeTestData(3 * CHUNK_SIZE)));
    store.put(manifest.chunks_.back().key_, "garbage");

    MemoryDestinationConnector destination;
    CHECK_THROW(RestorePipeline(&store, TestOptions()).run("job", "", &destination, nullptr), DumpBridge::IntegrityError);
    CHECK_TRUE(destination.aborted_);
    CHECK_FALSE(destination.closed_);
    CHECK_LE(destination.received_.size(), 2 * CHUNK_SIZE);
}


TEST(MissingChunk) {
    MemoryBridgeStore store;
    const Manifest manifest(StoreArtifact(&store, "job", JAN_2026, MakeTestData(2 * CHUNK_SIZE)));
    store.remove(manifest.chunks_[1].key_);

    MemoryDestinationConnector destination;
    CHECK_THROW(RestorePipeline(&store, TestOptions()).run("job", "", &destination, nullptr), DumpBridge::DownloadError);
    CHECK_TRUE(destination.aborted_);
}


TEST(TransientDownloadFailuresAreRetried) {
    FaultInjectingBridgeStore store;
    const std::string data(MakeTestData(2 * CHUNK_SIZE + 1));
    StoreArtifact(&store, "job", JAN_2026, data);
    store.transient_get_failures_ = 3;

    MemoryDestinationConnector destination;
    RestorePipeline(&store, TestOptions()).run("job", "", &destination, nullptr);
    CHECK_TRUE(destination.received_ == data);
    CHECK_TRUE(destination.closed_);
}


TEST(CorruptCompleteManifestIsAnError) {
    MemoryBridgeStore store;
    StoreArtifact(&store, "job", JAN_2026, MakeTestData(1000));
    const Manifest newest(StoreArtifact(&store, "job", JAN_2026 + 60, MakeTestData(1000)));
    std::string serialised_manifest(store.getString(Manifest::GetKey("job", newest.id_)));
    serialised_manifest += "[chunk 1]\nlength = 1\n";
    store.put(Manifest::GetKey("job", newest.id_), serialised_manifest);

    MemoryDestinationConnector destination;
    CHECK_THROW(RestorePipeline(&store, TestOptions()).run("job", "", &destination, nullptr), DumpBridge::ManifestCorruptError);
}


TEST_MAIN(RestorePipeline)
