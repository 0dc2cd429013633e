/** \file   Config.h
 *  \brief  Loads the dumpbridge configuration file and turns it into scheduled jobs.
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
#include "BridgeStore.h"
#include "CronExpression.h"
#include "IniFile.h"
#include "PipelineOptions.h"
#include "Scheduler.h"


/** \class  Config
 *  \brief  The contents of a configuration file w/ a "[general]" and a "[bridge]" section and any number of
 *          "[source NAME]" and "[destination NAME]" sections.
 *  \note   Every source section becomes a dump job and every destination section a restore job, named NAME.
 */
class Config {
public:
    struct SourceJob {
        std::string name_;
        IniFile::Section section_;
        CronExpression schedule_;
    public:
        SourceJob(const std::string &name, const IniFile::Section &section, const CronExpression &schedule)
            : name_(name), section_(section), schedule_(schedule) { }
    };

    struct DestinationJob {
        std::string name_;
        IniFile::Section section_;
        CronExpression schedule_;
        std::string source_job_name_; // Whose manifests to restore.
        std::string manifest_id_;     // If empty, the latest complete manifest is restored.
    public:
        DestinationJob(const std::string &name, const IniFile::Section &section, const CronExpression &schedule,
                       const std::string &source_job_name, const std::string &manifest_id)
            : name_(name), section_(section), schedule_(schedule), source_job_name_(source_job_name), manifest_id_(manifest_id) { }
    };

    static const std::string GENERAL_SECTION;
    static const std::string BRIDGE_SECTION;
    static const std::string SOURCE_SECTION_PREFIX;
    static const std::string DESTINATION_SECTION_PREFIX;

    PipelineOptions pipeline_options_;
    size_t max_concurrent_jobs_;
    Scheduler::OverflowPolicy overflow_policy_;
    IniFile::Section bridge_section_;
    std::vector<SourceJob> source_jobs_;
    std::vector<DestinationJob> destination_jobs_;

public:
    /** \throws DumpBridge::ConfigurationError for missing or invalid entries, unknown connector types or bad schedules. */
    explicit Config(const IniFile &ini_file);

    /** \throws DumpBridge::ConfigurationError, also if "path" can't be read or parsed. */
    static Config FromFile(const std::string &path);

    /** \throws DumpBridge::ConfigurationError or DumpBridge::ConnectionError. */
    std::shared_ptr<BridgeStore> createBridgeStore() const;

    bool isSourceJob(const std::string &job_name) const;
    bool isDestinationJob(const std::string &job_name) const;

    /** Registers a dump job for each source and a restore job for each destination, all using "bridge_store". */
    void registerJobs(Scheduler * const scheduler, const std::shared_ptr<BridgeStore> &bridge_store) const;

    /** \throws DumpBridge::ConfigurationError if "job_name" is empty, contains a slash or is "." or "..". */
    static void ValidateJobName(const std::string &job_name);
};
