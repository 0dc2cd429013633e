/** \brief Test cases for loading configuration files
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
#include "Config.h"
#include "DumpBridgeErrors.h"
#include "FileUtil.h"
#include "Manifest.h"
#include "Scheduler.h"
#include "TestConnectors.h"
#include "UnitTest.h"


namespace {


const std::string MINIMAL_BRIDGE("[bridge]\ntype = memory\n");


Config ConfigFromString(const std::string &contents) {
    return Config(IniFile::FromString(contents, "test.conf"));
}


} // unnamed namespace


TEST(Defaults) {
    const Config config(ConfigFromString(MINIMAL_BRIDGE));
    CHECK_EQ(config.pipeline_options_.chunk_size_, PipelineOptions::DEFAULT_CHUNK_SIZE);
    CHECK_EQ(config.pipeline_options_.queue_depth_, PipelineOptions::DEFAULT_QUEUE_DEPTH);
    CHECK_EQ(config.pipeline_options_.compression_, ChunkCodec::ZLIB);
    CHECK_EQ(config.max_concurrent_jobs_, 2u);
    CHECK_EQ(config.overflow_policy_, Scheduler::QUEUE);
    CHECK_TRUE(config.source_jobs_.empty());
    CHECK_TRUE(config.destination_jobs_.empty());
    CHECK_EQ(config.createBridgeStore()->getType(), "memory");
}


TEST(FullConfiguration) {
    const Config config(ConfigFromString(
        "[general]\n"
        "chunk_size           = 4194304\n"
        "queue_depth          = 4\n"
        "compression          = no\n"
        "max_retries          = 5\n"
        "retry_backoff_ms     = 100\n"
        "max_retry_backoff_ms = 1000\n"
        "max_concurrent_jobs  = 1\n"
        "overflow_policy      = drop\n"
        "\n"
        "[bridge]\n"
        "type      = local\n"
        "directory = /tmp\n"
        "\n"
        "[source production]\n"
        "type           = postgres\n"
        "connection_uri = postgresql://dumper@db.example.com/app\n"
        "cron           = 0 3 * * *\n"
        "\n"
        "[destination staging]\n"
        "type           = postgres\n"
        "connection_uri = postgresql://restorer@staging.example.com/app\n"
        "cron           = 30 3 * * *\n"
        "source         = production\n"
        "\n"
        "[destination archive]\n"
        "type        = file\n"
        "path        = /var/backups/app.sql\n"
        "cron        = @weekly\n"
        "source      = production\n"
        "manifest_id = 20261019T030000.000000Z-abcdef\n"
        "\n"
        "[comments]\n"
        "unknown = sections are ignored\n"));

    CHECK_EQ(config.pipeline_options_.chunk_size_, 4194304u);
    CHECK_EQ(config.pipeline_options_.queue_depth_, 4u);
    CHECK_EQ(config.pipeline_options_.compression_, ChunkCodec::NONE);
    CHECK_EQ(config.pipeline_options_.retry_policy_.max_retries_, 5u);
    CHECK_EQ(config.pipeline_options_.retry_policy_.initial_backoff_ms_, 100u);
    CHECK_EQ(config.pipeline_options_.retry_policy_.max_backoff_ms_, 1000u);
    CHECK_EQ(config.max_concurrent_jobs_, 1u);
    CHECK_EQ(config.overflow_policy_, Scheduler::DROP);

    CHECK_EQ(config.source_jobs_.size(), 1u);
    CHECK_EQ(config.source_jobs_[0].name_, "production");
    CHECK_EQ(config.source_jobs_[0].schedule_.toString(), "0 3 * * *");
    CHECK_EQ(config.destination_jobs_.size(), 2u);
    CHECK_EQ(config.destination_jobs_[0].name_, "staging");
    CHECK_EQ(config.destination_jobs_[0].source_job_name_, "production");
    CHECK_TRUE(config.destination_jobs_[0].manifest_id_.empty());
    CHECK_EQ(config.destination_jobs_[1].manifest_id_, "20261019T030000.000000Z-abcdef");

    CHECK_TRUE(config.isSourceJob("production"));
    CHECK_FALSE(config.isSourceJob("staging"));
    CHECK_TRUE(config.isDestinationJob("archive"));
    CHECK_FALSE(config.isDestinationJob("comments"));
}


TEST(InvalidConfigurations) {
    const std::string FILE_SOURCE("type = file\npath = /tmp/x\ncron = @daily\n");

    CHECK_THROW(ConfigFromString(""), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString("[bridge]\ntype = ftp\n").createBridgeStore(), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString("[general]\nchunk_size = 0\n" + MINIMAL_BRIDGE), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString("[general]\nqueue_depth = lots\n" + MINIMAL_BRIDGE), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString("[general]\ncompression = gzip\n" + MINIMAL_BRIDGE), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString("[general]\nmax_concurrent_jobs = 0\n" + MINIMAL_BRIDGE), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString("[general]\noverflow_policy = block\n" + MINIMAL_BRIDGE), DumpBridge::ConfigurationError);

    // Sources:
    CHECK_NO_THROW(ConfigFromString(MINIMAL_BRIDGE + "[source a]\n" + FILE_SOURCE));
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[source a]\ntype = file\npath = /tmp/x\n"), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[source a]\ntype = file\npath = /tmp/x\ncron = 61 * * * *\n"),
                DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[source a]\ntype = oracle\ncron = @daily\n"), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[source a]\ntype = postgres\ncron = @daily\n"), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[source a/b]\n" + FILE_SOURCE), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[source .]\n" + FILE_SOURCE), DumpBridge::ConfigurationError);

    // Destinations:
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[destination b]\n" + FILE_SOURCE), DumpBridge::ConfigurationError);
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[destination b]\n" + FILE_SOURCE + "source = ../etc\n"), DumpBridge::ConfigurationError);
    CHECK_NO_THROW(ConfigFromString(MINIMAL_BRIDGE + "[destination b]\n" + FILE_SOURCE + "source = elsewhere\n"));

    // Job names are shared by both roles:
    CHECK_THROW(ConfigFromString(MINIMAL_BRIDGE + "[source a]\n" + FILE_SOURCE + "[destination a]\n" + FILE_SOURCE + "source = a\n"),
                DumpBridge::ConfigurationError);

    CHECK_THROW(Config::FromFile("/no/such/dumpbridge.conf"), DumpBridge::ConfigurationError);
}


TEST(ValidateJobName) {
    CHECK_NO_THROW(Config::ValidateJobName("production-db_1.main"));
    CHECK_THROW(Config::ValidateJobName(""), DumpBridge::ConfigurationError);
    CHECK_THROW(Config::ValidateJobName("a/b"), DumpBridge::ConfigurationError);
    CHECK_THROW(Config::ValidateJobName(".."), DumpBridge::ConfigurationError);
}


TEST(DumpAndRestoreThroughTheScheduler) {
    const FileUtil::AutoTempDirectory temp_directory("/tmp/ConfigTest");
    const std::string source_path(temp_directory.getDirectoryPath() + "/source.sql");
    const std::string destination_path(temp_directory.getDirectoryPath() + "/restored.sql");
    const std::string config_path(temp_directory.getDirectoryPath() + "/dumpbridge.conf");
    const std::string data(MakeTestData(300000));
    CHECK_TRUE(FileUtil::WriteString(source_path, data));
    CHECK_TRUE(FileUtil::WriteString(config_path,
                                     "[general]\n"
                                     "chunk_size = 65536\n"
                                     "\n"
                                     "[bridge]\n"
                                     "type      = local\n"
                                     "directory = " + temp_directory.getDirectoryPath() + "/bridge\n"
                                     "\n"
                                     "[source nightly]\n"
                                     "type = file\n"
                                     "path = " + source_path + "\n"
                                     "cron = 0 0 1 1 *\n"
                                     "\n"
                                     "[destination copy]\n"
                                     "type   = file\n"
                                     "path   = " + destination_path + "\n"
                                     "cron   = 0 0 1 1 *\n"
                                     "source = nightly\n"));

    const Config config(Config::FromFile(config_path));
    const std::shared_ptr<BridgeStore> bridge_store(config.createBridgeStore());
    Scheduler scheduler(config.max_concurrent_jobs_, config.overflow_policy_);
    config.registerJobs(&scheduler, bridge_store);

    // Nothing to restore yet:
    const RunEvent failed_restore(scheduler.runNow("copy", nullptr));
    CHECK_EQ(failed_restore.outcome_, RunEvent::FAILED);
    CHECK_FALSE(FileUtil::Exists(destination_path));

    const RunEvent dump(scheduler.runNow("nightly", nullptr));
    CHECK_EQ(dump.outcome_, RunEvent::SUCCESS);
    const Manifest manifest(Manifest::Load(bridge_store.get(), "nightly", dump.manifest_id_));
    CHECK_EQ(manifest.chunks_.size(), 5u);
    CHECK_EQ(scheduler.getContext().getLastManifestId("nightly"), dump.manifest_id_);

    const RunEvent restore(scheduler.runNow("copy", nullptr));
    CHECK_EQ(restore.outcome_, RunEvent::SUCCESS);
    CHECK_EQ(restore.manifest_id_, dump.manifest_id_);
    CHECK_TRUE(FileUtil::ReadStringOrThrow(destination_path) == data);

    // Restoring again replaces the file w/ identical contents:
    CHECK_EQ(scheduler.runNow("copy", nullptr).outcome_, RunEvent::SUCCESS);
    CHECK_TRUE(FileUtil::ReadStringOrThrow(destination_path) == data);
}


TEST_MAIN(Config)
