/** \brief Test cases for manifest (de)serialisation and selection
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
#include <string>
#include <stdexcept>
#include <vector>
#include "BridgeStore.h"
#include "DumpBridgeErrors.h"
#include "Manifest.h"
#include "UnitTest.h"


namespace {


const time_t OCT_19_2026(1792368000); // 2026-10-19T00:00:00Z


Manifest MakeManifest(const std::string &job_name, const time_t created, const Manifest::Status status, const unsigned chunk_count = 2) {
    Manifest manifest(job_name, created, ChunkCodec::ZLIB, 1000);
    for (unsigned sequence_number(0); sequence_number < chunk_count; ++sequence_number) {
        ChunkCodec::ChunkDescriptor chunk;
        chunk.sequence_number_ = sequence_number;
        chunk.length_          = 1000;
        chunk.stored_length_   = 400 + sequence_number;
        chunk.checksum_        = ChunkCodec::Checksum(std::to_string(sequence_number));
        chunk.key_             = ChunkCodec::GetChunkKey(job_name, manifest.id_, sequence_number);
        manifest.chunks_.emplace_back(chunk);
        manifest.total_length_ += chunk.length_;
    }
    manifest.status_ = status;
    if (status == Manifest::COMPLETE)
        manifest.checksum_ = ChunkCodec::Checksum("whole stream");
    else if (status == Manifest::FAILED)
        manifest.failure_reason_ = "pg_dump exited w/ code 1 # and a \"quoted\" detail";

    return manifest;
}


} // unnamed namespace


TEST(Ids) {
    const std::string id(Manifest::GenerateId(OCT_19_2026 + 3 * 3600 + 25 * 60 + 7, 4711));
    CHECK_EQ(id.length(), 30u);
    CHECK_EQ(id.substr(0, 24), "20261019T032507.004711Z-");
    CHECK_EQ(id.substr(24).find_first_not_of("0123456789abcdef"), std::string::npos);
    CHECK_LT(Manifest::GenerateId(OCT_19_2026), Manifest::GenerateId(OCT_19_2026 + 1));
    CHECK_LT(Manifest::GenerateId(OCT_19_2026, 999999), Manifest::GenerateId(OCT_19_2026 + 1));

    // Sub-second order must not depend on the random suffix:
    for (unsigned i(0); i < 50; ++i)
        CHECK_LT(Manifest::GenerateId(OCT_19_2026, 1), Manifest::GenerateId(OCT_19_2026, 2));
    CHECK_THROW(Manifest::GenerateId(OCT_19_2026, 1000000), std::runtime_error);
    CHECK_EQ(Manifest::GetKey("production", id), "production/" + id + "/manifest.ini");
}


TEST(SerialisationPreservesEverything) {
    const Manifest original(MakeManifest("production", OCT_19_2026, Manifest::FAILED));
    const Manifest parsed(Manifest::FromString(original.toString(), "test"));

    CHECK_EQ(parsed.id_, original.id_);
    CHECK_EQ(parsed.job_name_, "production");
    CHECK_EQ(parsed.created_, OCT_19_2026);
    CHECK_EQ(parsed.status_, Manifest::FAILED);
    CHECK_EQ(parsed.compression_, ChunkCodec::ZLIB);
    CHECK_EQ(parsed.chunk_size_, 1000u);
    CHECK_EQ(parsed.total_length_, 2000u);
    CHECK_EQ(parsed.failure_reason_, original.failure_reason_);
    CHECK_EQ(parsed.chunks_.size(), 2u);
    if (parsed.chunks_.size() == 2) {
        CHECK_EQ(parsed.chunks_[1].sequence_number_, 1u);
        CHECK_EQ(parsed.chunks_[1].stored_length_, 401u);
        CHECK_EQ(parsed.chunks_[1].checksum_, original.chunks_[1].checksum_);
        CHECK_EQ(parsed.chunks_[1].key_, original.chunks_[1].key_);
    }
}


TEST(StructurallyInvalidManifestsAreRejected) {
    const std::string valid(MakeManifest("job", OCT_19_2026, Manifest::COMPLETE).toString());
    CHECK_NO_THROW(Manifest::FromString(valid, "valid"));

    CHECK_THROW(Manifest::FromString("", "empty"), DumpBridge::ManifestCorruptError);
    CHECK_THROW(Manifest::FromString("not an ini file", "garbage"), DumpBridge::ManifestCorruptError);

    // A gap in the sequence numbers:
    std::string gap(valid);
    gap.replace(gap.find("[chunk 1]"), 9, "[chunk 2]");
    CHECK_THROW(Manifest::FromString(gap, "gap"), DumpBridge::ManifestCorruptError);

    // A duplicate sequence number:
    std::string duplicate(valid);
    duplicate.replace(duplicate.find("[chunk 1]"), 9, "[chunk 0]");
    CHECK_THROW(Manifest::FromString(duplicate, "duplicate"), DumpBridge::ManifestCorruptError);

    // Missing chunk:
    const Manifest complete(MakeManifest("job", OCT_19_2026, Manifest::COMPLETE));
    std::string missing(complete.toString());
    missing.erase(missing.find("[chunk 1]"));
    CHECK_THROW(Manifest::FromString(missing, "missing"), DumpBridge::ManifestCorruptError);

    // Lengths that don't add up:
    Manifest bad_total(complete);
    ++bad_total.total_length_;
    CHECK_THROW(Manifest::FromString(bad_total.toString(), "bad total"), DumpBridge::ManifestCorruptError);

    Manifest bad_checksum(complete);
    bad_checksum.chunks_[0].checksum_ = "abc";
    CHECK_THROW(Manifest::FromString(bad_checksum.toString(), "bad checksum"), DumpBridge::ManifestCorruptError);

    Manifest oversized_chunk(complete);
    oversized_chunk.chunks_[0].length_ = 1001;
    oversized_chunk.total_length_ += 1;
    CHECK_THROW(Manifest::FromString(oversized_chunk.toString(), "oversized"), DumpBridge::ManifestCorruptError);

    Manifest no_aggregate_checksum(complete);
    no_aggregate_checksum.checksum_.clear();
    CHECK_THROW(Manifest::FromString(no_aggregate_checksum.toString(), "no aggregate"), DumpBridge::ManifestCorruptError);
}


TEST(LoadChecksTheIdentity) {
    MemoryBridgeStore store;
    const Manifest manifest(MakeManifest("job", OCT_19_2026, Manifest::COMPLETE));
    Manifest::Store(&store, manifest);
    CHECK_EQ(Manifest::Load(&store, "job", manifest.id_).id_, manifest.id_);

    // The same manifest under somebody else's key:
    store.put(Manifest::GetKey("other", manifest.id_), manifest.toString());
    CHECK_THROW(Manifest::Load(&store, "other", manifest.id_), DumpBridge::ManifestCorruptError);

    CHECK_THROW(Manifest::Load(&store, "job", "20260101T000000.000000Z-000000"), DumpBridge::DownloadError);
}


TEST(ListIds) {
    MemoryBridgeStore store;
    const Manifest newer(MakeManifest("job", OCT_19_2026 + 60, Manifest::COMPLETE));
    const Manifest older(MakeManifest("job", OCT_19_2026, Manifest::FAILED));
    Manifest::Store(&store, newer);
    Manifest::Store(&store, older);
    Manifest::Store(&store, MakeManifest("job2", OCT_19_2026, Manifest::COMPLETE));
    store.put(newer.chunks_[0].key_, "chunk");
    store.put("job/stray/file", "x");

    const std::vector<std::string> expected_ids{ older.id_, newer.id_ };
    CHECK_TRUE(Manifest::ListIds(&store, "job") == expected_ids);
    CHECK_TRUE(Manifest::ListIds(&store, "nobody").empty());
}


TEST(SelectLatestComplete) {
    MemoryBridgeStore store;
    Manifest selected;
    CHECK_FALSE(Manifest::SelectLatestComplete(&store, "job", &selected));

    const Manifest oldest_complete(MakeManifest("job", OCT_19_2026, Manifest::COMPLETE));
    const Manifest newer_complete(MakeManifest("job", OCT_19_2026 + 60, Manifest::COMPLETE, 0));
    Manifest::Store(&store, oldest_complete);
    Manifest::Store(&store, newer_complete);
    Manifest::Store(&store, MakeManifest("job", OCT_19_2026 + 120, Manifest::FAILED));
    Manifest::Store(&store, MakeManifest("job", OCT_19_2026 + 180, Manifest::PENDING));
    CHECK_TRUE(Manifest::SelectLatestComplete(&store, "job", &selected));
    CHECK_EQ(selected.id_, newer_complete.id_);
    CHECK_TRUE(selected.chunks_.empty());

    // An unreadable manifest that doesn't claim to be complete is skipped...
    store.put(Manifest::GetKey("job", Manifest::GenerateId(OCT_19_2026 + 240)), "[manifest]\nstatus = failed\n");
    CHECK_TRUE(Manifest::SelectLatestComplete(&store, "job", &selected));
    CHECK_EQ(selected.id_, newer_complete.id_);

    // ...but a corrupt one claiming to be complete is an error:
    store.put(Manifest::GetKey("job", Manifest::GenerateId(OCT_19_2026 + 300)), "[manifest]\nstatus = complete\n");
    CHECK_THROW(Manifest::SelectLatestComplete(&store, "job", &selected), DumpBridge::ManifestCorruptError);
}


TEST(StatusNames) {
    Manifest::Status status;
    CHECK_TRUE(Manifest::StringToStatus("pending", &status));
    CHECK_EQ(status, Manifest::PENDING);
    CHECK_TRUE(Manifest::StringToStatus("failed", &status));
    CHECK_EQ(status, Manifest::FAILED);
    CHECK_FALSE(Manifest::StringToStatus("COMPLETE", &status));
    CHECK_EQ(Manifest::StatusToString(Manifest::COMPLETE), "complete");
}


TEST_MAIN(Manifest)
