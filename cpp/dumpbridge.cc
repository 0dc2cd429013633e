/** \file    dumpbridge.cc
 *  \brief   Moves database dumps from sources to destinations through an intermediate object store.
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
#include <atomic>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include "Config.h"
#include "DumpBridgeErrors.h"
#include "Manifest.h"
#include "Scheduler.h"
#include "SignalUtil.h"
#include "StringUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--run-once job_name | --list-manifests job_name] config_file\n"
            "Without options, runs all configured jobs on their schedules until SIGTERM or SIGINT.\n"
            "--run-once runs a single dump or restore job immediately and exits w/ its status.\n"
            "--list-manifests lists all manifests stored for a dump job, including incomplete ones.");
}


const std::set<int> TERMINATION_SIGNALS{ SIGINT, SIGTERM };


void ListManifests(BridgeStore * const bridge_store, const std::string &job_name) {
    const std::vector<std::string> manifest_ids(Manifest::ListIds(bridge_store, job_name));
    if (manifest_ids.empty()) {
        std::cout << "no manifests for \"" << job_name << "\"\n";
        return;
    }

    for (const auto &manifest_id : manifest_ids) {
        try {
            const Manifest manifest(Manifest::Load(bridge_store, job_name, manifest_id));
            std::cout << manifest.id_ << '\t' << Manifest::StatusToString(manifest.status_) << '\t'
                      << TimeUtil::TimeTToZuluString(manifest.created_) << '\t' << manifest.total_length_ << " bytes\t"
                      << manifest.chunks_.size() << " chunk(s)";
            if (not manifest.failure_reason_.empty())
                std::cout << '\t' << manifest.failure_reason_;
            std::cout << '\n';
        } catch (const DumpBridge::ManifestCorruptError &x) {
            std::cout << manifest_id << "\tcorrupt\t" << x.what() << '\n';
        }
    }
}


int RunOnce(Scheduler * const scheduler, const std::string &job_name) {
    const std::shared_ptr<ThreadUtil::CancellationToken> cancellation_token(std::make_shared<ThreadUtil::CancellationToken>());
    RunEvent event(job_name, RunEvent::FAILED, "did not run");
    std::atomic<bool> done(false);
    std::thread worker([scheduler, &job_name, &cancellation_token, &event, &done]() {
        event = scheduler->runNow(job_name, cancellation_token);
        done = true;
    });

    while (not done) {
        const int signal_no(SignalUtil::WaitForSignal(TERMINATION_SIGNALS, 200));
        if (signal_no != 0) {
            LOG_INFO("received " + std::string(::strsignal(signal_no)) + ", cancelling \"" + job_name + "\"");
            cancellation_token->cancel();
        }
    }
    worker.join();

    return (event.outcome_ == RunEvent::SUCCESS) ? EXIT_SUCCESS : EXIT_FAILURE;
}


void RunScheduler(Scheduler * const scheduler) {
    scheduler->start();

    int signal_no;
    while ((signal_no = SignalUtil::WaitForSignal(TERMINATION_SIGNALS, 1000)) == 0)
        /* Intentionally empty! */;

    LOG_INFO("received " + std::string(::strsignal(signal_no)) + ", shutting down");
    scheduler->stop();
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    std::string config_path, run_once_job_name, list_manifests_job_name;
    if (argc == 2)
        config_path = argv[1];
    else if (argc == 4 and std::strcmp(argv[1], "--run-once") == 0) {
        run_once_job_name = argv[2];
        config_path = argv[3];
    } else if (argc == 4 and std::strcmp(argv[1], "--list-manifests") == 0) {
        list_manifests_job_name = argv[2];
        config_path = argv[3];
    } else
        Usage();

    // Must happen before any thread is started so that every thread inherits the mask.
    const SignalUtil::SignalBlocker signal_blocker(TERMINATION_SIGNALS);

    std::unique_ptr<Config> config;
    std::shared_ptr<BridgeStore> bridge_store;
    try {
        config.reset(new Config(Config::FromFile(config_path)));
        bridge_store = config->createBridgeStore();
    } catch (const DumpBridge::Error &x) {
        LOG_ERROR(DumpBridge::ErrorKindToString(x.getKind()) + " error: " + std::string(x.what()));
    }

    if (not list_manifests_job_name.empty()) {
        Config::ValidateJobName(list_manifests_job_name);
        ListManifests(bridge_store.get(), list_manifests_job_name);
        return EXIT_SUCCESS;
    }

    Scheduler scheduler(config->max_concurrent_jobs_, config->overflow_policy_);
    config->registerJobs(&scheduler, bridge_store);

    if (not run_once_job_name.empty()) {
        if (not scheduler.getContext().hasJob(run_once_job_name))
            LOG_ERROR("no job named \"" + run_once_job_name + "\" in \"" + config_path + "\"!");
        return RunOnce(&scheduler, run_once_job_name);
    }

    RunScheduler(&scheduler);
    return EXIT_SUCCESS;
}
