/** \brief Test cases for the bridge store implementations
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
#include <vector>
#include "BridgeStore.h"
#include "DumpBridgeErrors.h"
#include "FileUtil.h"
#include "S3BridgeStore.h"
#include "UnitTest.h"


namespace {


// Common behaviour every bridge store has to show.
void ExerciseStore(BridgeStore * const store) {
    store->put("job/b/manifest.ini", "second");
    store->put("job/a/chunk-00000000", std::string("\0binary\xff", 8));
    store->put("other/a/manifest.ini", "other");
    store->put("jobber/a/manifest.ini", "prefix trap");

    CHECK_EQ(store->getString("job/b/manifest.ini"), "second");
    CHECK_EQ(store->getString("job/a/chunk-00000000"), std::string("\0binary\xff", 8));
    CHECK_TRUE(store->exists("job/b/manifest.ini"));
    CHECK_FALSE(store->exists("job/c/manifest.ini"));

    const std::vector<std::string> expected_keys{ "job/a/chunk-00000000", "job/b/manifest.ini" };
    CHECK_TRUE(store->list("job/") == expected_keys);
    CHECK_TRUE(store->list("nothing/").empty());

    store->put("job/b/manifest.ini", "replaced");
    CHECK_EQ(store->getString("job/b/manifest.ini"), "replaced");

    try {
        store->getString("job/c/manifest.ini");
        CHECK_TRUE(false);
    } catch (const DumpBridge::DownloadError &x) {
        CHECK_FALSE(x.isTransient());
    }

    CHECK_THROW(store->put("/absolute", "x"), DumpBridge::ConfigurationError);
    CHECK_THROW(store->put("job/../escape", "x"), DumpBridge::ConfigurationError);
    CHECK_THROW(store->put("job//empty", "x"), DumpBridge::ConfigurationError);
}


// Once its token has been cancelled, no operation of a bridge store may proceed.
void ExerciseCancellation(BridgeStore * const store) {
    store->put("job/a/manifest.ini", "stored");
    const std::shared_ptr<ThreadUtil::CancellationToken> token(std::make_shared<ThreadUtil::CancellationToken>());
    CHECK_EQ(store->getString("job/a/manifest.ini", token), "stored");
    token->cancel();

    CHECK_THROW(store->put("job/b/manifest.ini", "never stored", token), DumpBridge::CancelledError);
    CHECK_THROW(store->getString("job/a/manifest.ini", token), DumpBridge::CancelledError);
    CHECK_THROW(store->list("job/", token), DumpBridge::CancelledError);
    CHECK_THROW(store->exists("job/a/manifest.ini", token), DumpBridge::CancelledError);
    CHECK_FALSE(store->exists("job/b/manifest.ini"));
}


} // unnamed namespace


TEST(MemoryStore) {
    MemoryBridgeStore store;
    ExerciseStore(&store);
    CHECK_TRUE(store.remove("other/a/manifest.ini"));
    CHECK_FALSE(store.remove("other/a/manifest.ini"));
}


TEST(LocalStore) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/LocalBridgeStoreTest");
    LocalBridgeStore store(temp_directory.getDirectoryPath() + "/bridge/");
    CHECK_EQ(store.getRootDirectory(), temp_directory.getDirectoryPath() + "/bridge");
    ExerciseStore(&store);

    // Leftovers of an interrupted put are invisible:
    CHECK_TRUE(FileUtil::WriteString(store.getRootDirectory() + "/job/a/.tmp-abcdef", "partial"));
    CHECK_EQ(store.list("job/a/").size(), 1u);

    // A second instance sees everything the first one stored:
    LocalBridgeStore reopened_store(store.getRootDirectory());
    CHECK_EQ(reopened_store.getString("job/b/manifest.ini"), "replaced");
}


TEST(CancelledOperations) {
    MemoryBridgeStore memory_store;
    ExerciseCancellation(&memory_store);

    const FileUtil::AutoTempDirectory temp_directory("/tmp/LocalBridgeStoreTest");
    LocalBridgeStore local_store(temp_directory.getDirectoryPath());
    ExerciseCancellation(&local_store);
}


TEST(EmptyObjects) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/LocalBridgeStoreTest");
    LocalBridgeStore local_store(temp_directory.getDirectoryPath());
    local_store.put("job/empty", "");
    CHECK_TRUE(local_store.exists("job/empty"));
    CHECK_EQ(local_store.getString("job/empty"), "");
}


TEST(Create) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/LocalBridgeStoreTest");

    IniFile::Section local_section("bridge");
    local_section.insert("type", "local");
    local_section.insert("directory", temp_directory.getDirectoryPath());
    CHECK_EQ(BridgeStore::Create(local_section)->getType(), "local");

    IniFile::Section memory_section("bridge");
    memory_section.insert("type", "memory");
    CHECK_EQ(BridgeStore::Create(memory_section)->getType(), "memory");

    IniFile::Section s3_section("bridge");
    s3_section.insert("type", "s3");
    s3_section.insert("bucket", "dumps");
    s3_section.insert("endpoint", "http://localhost:9000/");
    s3_section.insert("access_key_id", "minio");
    s3_section.insert("secret_access_key", "minio123");
    CHECK_EQ(BridgeStore::Create(s3_section)->getType(), "s3");

    IniFile::Section incomplete_s3_section("bridge");
    incomplete_s3_section.insert("type", "s3");
    incomplete_s3_section.insert("bucket", "dumps");
    CHECK_THROW(BridgeStore::Create(incomplete_s3_section), DumpBridge::ConfigurationError);

    IniFile::Section unknown_section("bridge");
    unknown_section.insert("type", "tape");
    CHECK_THROW(BridgeStore::Create(unknown_section), DumpBridge::ConfigurationError);

    CHECK_THROW(BridgeStore::Create(IniFile::Section("bridge")), DumpBridge::ConfigurationError);

    BridgeStore::RegisterFactory("tape", [](const IniFile::Section &/*section*/) {
        return std::unique_ptr<BridgeStore>(new MemoryBridgeStore());
    });
    CHECK_EQ(BridgeStore::Create(unknown_section)->getType(), "memory");
}


TEST(S3ListResponses) {
    std::vector<std::string> keys;
    std::string continuation_token;

    const std::string truncated_response(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
        "<Name>dumps</Name><Prefix>job/</Prefix><KeyCount>2</KeyCount><MaxKeys>2</MaxKeys>"
        "<IsTruncated>true</IsTruncated>"
        "<Contents><Key>job/a/chunk-00000000</Key><Size>12</Size></Contents>"
        "<Contents><Key>job/a/b&amp;c</Key><Size>3</Size></Contents>"
        "<NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>"
        "</ListBucketResult>");
    CHECK_TRUE(S3BridgeStore::ParseListResponse(truncated_response, &keys, &continuation_token));
    CHECK_EQ(keys.size(), 2u);
    if (keys.size() == 2) {
        CHECK_EQ(keys[0], "job/a/chunk-00000000");
        CHECK_EQ(keys[1], "job/a/b&c");
    }
    CHECK_EQ(continuation_token, "1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=");

    const std::string last_response("<ListBucketResult><IsTruncated>false</IsTruncated>"
                                    "<Contents><Key>job/b/manifest.ini</Key></Contents></ListBucketResult>");
    CHECK_TRUE(S3BridgeStore::ParseListResponse(last_response, &keys, &continuation_token));
    CHECK_EQ(keys.size(), 1u);
    CHECK_TRUE(continuation_token.empty());

    CHECK_TRUE(S3BridgeStore::ParseListResponse("<ListBucketResult><IsTruncated>false</IsTruncated></ListBucketResult>", &keys,
                                                &continuation_token));
    CHECK_TRUE(keys.empty());

    // Character references, nested elements named like ours and namespace prefixes:
    const std::string prefixed_response(
        "<s3:ListBucketResult xmlns:s3=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
        "<s3:IsTruncated>false</s3:IsTruncated>"
        "<s3:Contents><s3:Key>job&#x2F;c/manifest.ini</s3:Key><s3:Owner><s3:ID>x</s3:ID></s3:Owner></s3:Contents>"
        "<s3:Contents><s3:Key> job/d/manifest.ini </s3:Key><s3:Owner><s3:Key>nested</s3:Key></s3:Owner></s3:Contents>"
        "</s3:ListBucketResult>");
    CHECK_TRUE(S3BridgeStore::ParseListResponse(prefixed_response, &keys, &continuation_token));
    CHECK_EQ(keys.size(), 2u);
    if (keys.size() == 2) {
        CHECK_EQ(keys[0], "job/c/manifest.ini");
        CHECK_EQ(keys[1], " job/d/manifest.ini ");
    }
    CHECK_TRUE(continuation_token.empty());

    CHECK_FALSE(S3BridgeStore::ParseListResponse("<Error><Code>AccessDenied</Code></Error>", &keys, &continuation_token));
    CHECK_FALSE(S3BridgeStore::ParseListResponse("<ListBucketResult><Contents><Key>job/a</Contents></ListBucketResult>", &keys,
                                                 &continuation_token));
    CHECK_FALSE(S3BridgeStore::ParseListResponse("<ListBucketResult><Contents><Size>1</Size></Contents></ListBucketResult>", &keys,
                                                 &continuation_token));
    CHECK_FALSE(S3BridgeStore::ParseListResponse("", &keys, &continuation_token));
    CHECK_FALSE(S3BridgeStore::ParseListResponse("<ListBucketResult><IsTruncated>true</IsTruncated></ListBucketResult>", &keys,
                                                 &continuation_token));
}


TEST_MAIN(BridgeStore)
