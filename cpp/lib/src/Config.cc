/** \file   Config.cc
 *  \brief  Implementation of the Config class.
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
#include "Config.h"
#include <map>
#include <set>
#include "Connector.h"
#include "DumpBridgeErrors.h"
#include "DumpPipeline.h"
#include "RestorePipeline.h"
#include "StringUtil.h"
#include "util.h"


const std::string Config::GENERAL_SECTION("general");
const std::string Config::BRIDGE_SECTION("bridge");
const std::string Config::SOURCE_SECTION_PREFIX("source ");
const std::string Config::DESTINATION_SECTION_PREFIX("destination ");


namespace {


CronExpression ParseSchedule(const IniFile::Section &section) {
    const std::string cron(section.getString("cron", ""));
    if (unlikely(cron.empty()))
        throw DumpBridge::ConfigurationError("missing \"cron\" in section \"" + section.getSectionName() + "\"!");

    try {
        return CronExpression(cron);
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ConfigurationError("bad \"cron\" in section \"" + section.getSectionName() + "\": " + std::string(x.what()));
    }
}


void LoadGeneralSection(const IniFile::Section &section, PipelineOptions * const pipeline_options, size_t * const max_concurrent_jobs,
                        Scheduler::OverflowPolicy * const overflow_policy)
{
    pipeline_options->chunk_size_ = section.getUint64T("chunk_size", PipelineOptions::DEFAULT_CHUNK_SIZE);
    if (unlikely(pipeline_options->chunk_size_ == 0))
        throw std::runtime_error("\"chunk_size\" must be positive");
    pipeline_options->queue_depth_ = section.getUnsigned("queue_depth", PipelineOptions::DEFAULT_QUEUE_DEPTH);
    if (unlikely(pipeline_options->queue_depth_ == 0))
        throw std::runtime_error("\"queue_depth\" must be positive");
    pipeline_options->compression_ = section.getBool("compression", true) ? ChunkCodec::ZLIB : ChunkCodec::NONE;

    pipeline_options->retry_policy_.max_retries_        = section.getUnsigned("max_retries", pipeline_options->retry_policy_.max_retries_);
    pipeline_options->retry_policy_.initial_backoff_ms_ = section.getUnsigned("retry_backoff_ms",
                                                                             pipeline_options->retry_policy_.initial_backoff_ms_);
    pipeline_options->retry_policy_.max_backoff_ms_     = section.getUnsigned("max_retry_backoff_ms",
                                                                             pipeline_options->retry_policy_.max_backoff_ms_);

    *max_concurrent_jobs = section.getUnsigned("max_concurrent_jobs", 2);
    if (unlikely(*max_concurrent_jobs == 0))
        throw std::runtime_error("\"max_concurrent_jobs\" must be positive");
    const std::string overflow_policy_name(section.getString("overflow_policy", "queue"));
    if (unlikely(not Scheduler::StringToOverflowPolicy(overflow_policy_name, overflow_policy)))
        throw std::runtime_error("\"overflow_policy\" must be \"queue\" or \"drop\", found \"" + overflow_policy_name + "\"");
}


} // unnamed namespace


Config::Config(const IniFile &ini_file): max_concurrent_jobs_(2), overflow_policy_(Scheduler::QUEUE) {
    try {
        if (ini_file.sectionIsDefined(GENERAL_SECTION))
            LoadGeneralSection(ini_file.getSection(GENERAL_SECTION), &pipeline_options_, &max_concurrent_jobs_, &overflow_policy_);
    } catch (const DumpBridge::Error &) {
        throw;
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ConfigurationError("bad [" + GENERAL_SECTION + "] section in \"" + ini_file.getFilename() + "\": "
                                             + std::string(x.what()));
    }

    if (unlikely(not ini_file.sectionIsDefined(BRIDGE_SECTION)))
        throw DumpBridge::ConfigurationError("missing [" + BRIDGE_SECTION + "] section in \"" + ini_file.getFilename() + "\"!");
    bridge_section_ = ini_file.getSection(BRIDGE_SECTION);

    std::set<std::string> job_names;
    for (const auto &section : ini_file) {
        const std::string &section_name(section.getSectionName());
        if (section_name == GENERAL_SECTION or section_name == BRIDGE_SECTION)
            continue;

        try {
            if (StringUtil::StartsWith(section_name, SOURCE_SECTION_PREFIX)) {
                const std::string job_name(StringUtil::Trim(section_name.substr(SOURCE_SECTION_PREFIX.length())));
                ValidateJobName(job_name);
                if (unlikely(not job_names.emplace(job_name).second))
                    throw DumpBridge::ConfigurationError("duplicate job name \"" + job_name + "\"!");
                SourceConnector::Create(section); // Fails early on unknown types and missing entries.
                source_jobs_.emplace_back(job_name, section, ParseSchedule(section));
            } else if (StringUtil::StartsWith(section_name, DESTINATION_SECTION_PREFIX)) {
                const std::string job_name(StringUtil::Trim(section_name.substr(DESTINATION_SECTION_PREFIX.length())));
                ValidateJobName(job_name);
                if (unlikely(not job_names.emplace(job_name).second))
                    throw DumpBridge::ConfigurationError("duplicate job name \"" + job_name + "\"!");
                DestinationConnector::Create(section);
                const std::string source_job_name(section.getString("source", ""));
                if (unlikely(source_job_name.empty()))
                    throw DumpBridge::ConfigurationError("missing \"source\" in section \"" + section_name + "\"!");
                ValidateJobName(source_job_name);
                destination_jobs_.emplace_back(job_name, section, ParseSchedule(section), source_job_name,
                                               section.getString("manifest_id", ""));
            } else
                LOG_WARNING("ignoring unknown section [" + section_name + "] in \"" + ini_file.getFilename() + "\"");
        } catch (const DumpBridge::Error &) {
            throw;
        } catch (const std::runtime_error &x) {
            throw DumpBridge::ConfigurationError("bad section [" + section_name + "] in \"" + ini_file.getFilename() + "\": "
                                                 + std::string(x.what()));
        }
    }
}


Config Config::FromFile(const std::string &path) {
    std::unique_ptr<IniFile> ini_file;
    try {
        ini_file.reset(new IniFile(path));
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ConfigurationError(x.what());
    }

    return Config(*ini_file);
}


std::shared_ptr<BridgeStore> Config::createBridgeStore() const {
    return std::shared_ptr<BridgeStore>(BridgeStore::Create(bridge_section_));
}


bool Config::isSourceJob(const std::string &job_name) const {
    for (const auto &source_job : source_jobs_) {
        if (source_job.name_ == job_name)
            return true;
    }

    return false;
}


bool Config::isDestinationJob(const std::string &job_name) const {
    for (const auto &destination_job : destination_jobs_) {
        if (destination_job.name_ == job_name)
            return true;
    }

    return false;
}


void Config::registerJobs(Scheduler * const scheduler, const std::shared_ptr<BridgeStore> &bridge_store) const {
    const PipelineOptions pipeline_options(pipeline_options_);

    for (const auto &source_job : source_jobs_) {
        const std::string job_name(source_job.name_);
        const IniFile::Section section(source_job.section_);
        scheduler->registerJob(Job(job_name, source_job.schedule_,
                                   [bridge_store, pipeline_options, job_name, section](const std::shared_ptr<ThreadUtil::CancellationToken> &token) {
                                       const std::unique_ptr<SourceConnector> source(SourceConnector::Create(section));
                                       DumpPipeline pipeline(bridge_store.get(), pipeline_options);
                                       return pipeline.run(job_name, source.get(), token).id_;
                                   }));
    }

    for (const auto &destination_job : destination_jobs_) {
        const std::string source_job_name(destination_job.source_job_name_), manifest_id(destination_job.manifest_id_);
        const IniFile::Section section(destination_job.section_);
        scheduler->registerJob(Job(destination_job.name_, destination_job.schedule_,
                                   [bridge_store, pipeline_options, source_job_name, manifest_id,
                                    section](const std::shared_ptr<ThreadUtil::CancellationToken> &token) {
                                       const std::unique_ptr<DestinationConnector> destination(DestinationConnector::Create(section));
                                       RestorePipeline pipeline(bridge_store.get(), pipeline_options);
                                       return pipeline.run(source_job_name, manifest_id, destination.get(), token).id_;
                                   }));
    }
}


void Config::ValidateJobName(const std::string &job_name) {
    if (unlikely(job_name.empty() or job_name.find('/') != std::string::npos or job_name == "." or job_name == ".."))
        throw DumpBridge::ConfigurationError("invalid job name \"" + job_name + "\"!");
}
