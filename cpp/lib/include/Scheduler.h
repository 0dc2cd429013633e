/** \file   Scheduler.h
 *  \brief  Fires dump and restore runs according to their cron schedules.
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


#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <ctime>
#include "CronExpression.h"
#include "ThreadUtil.h"


/** \class  Job
 *  \brief  A named, scheduled piece of work, typically a dump or restore pipeline bound to its connector and bridge.
 */
class Job {
public:
    /** Performs one run and returns the ID of the manifest that was written or restored.  Failures are exceptions. */
    typedef std::function<std::string(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)> Runner;

    std::string name_;
    CronExpression schedule_;
    Runner runner_;
public:
    Job(const std::string &name, const CronExpression &schedule, const Runner &runner): name_(name), schedule_(schedule), runner_(runner) { }
};


struct RunEvent {
    enum Outcome { SUCCESS, SKIPPED, FAILED };

    std::string job_name_;
    Outcome outcome_;
    std::string reason_;      // Why a run was skipped or failed.
    std::string manifest_id_; // Only set on success.
    time_t time_;
public:
    RunEvent(const std::string &job_name, const Outcome outcome, const std::string &reason = "", const std::string &manifest_id = "")
        : job_name_(job_name), outcome_(outcome), reason_(reason), manifest_id_(manifest_id), time_(std::time(nullptr)) { }

    static std::string OutcomeToString(const Outcome outcome);

    /** \return "SUCCESS", "SKIPPED: <reason>" or "FAILED: <reason>". */
    std::string toString() const;
};


/** \class  SchedulerContext
 *  \brief  The registered jobs and their mutable state.  The "running" flag of a job is set from the moment a fire has
 *          been accepted, including while it waits for a free slot, until the run has finished.
 */
class SchedulerContext {
    struct JobState {
        Job job_;
        bool running_;
        std::string last_manifest_id_;
    public:
        explicit JobState(const Job &job): job_(job), running_(false) { }
    };

    mutable std::mutex mutex_;
    std::map<std::string, JobState> job_names_to_states_map_;
public:
    /** \throws std::runtime_error if there already is a job w/ the same name. */
    void addJob(const Job &job);

    bool hasJob(const std::string &job_name) const;
    std::vector<std::string> getJobNames() const;

    /** \throws std::runtime_error if there is no such job. */
    Job getJob(const std::string &job_name) const;

    /** \return True if the running flag of "job_name" was clear and has now been set, false if it was already set. */
    bool tryAcquire(const std::string &job_name);

    /** \brief  Clears the running flag of "job_name".
     *  \param  manifest_id  If not empty, becomes the job's last successful manifest.
     */
    void release(const std::string &job_name, const std::string &manifest_id);

    bool isRunning(const std::string &job_name) const;
    std::string getLastManifestId(const std::string &job_name) const;
};


/** \class  Scheduler
 *  \brief  Runs one timer thread per job and every accepted fire on a thread of its own.
 *  \note   Overlapping fires of the same job are always skipped.  Fires beyond max_concurrent_jobs are queued or dropped,
 *          depending on the overflow policy.  A failing run is reported but never affects later fires.
 */
class Scheduler {
public:
    enum OverflowPolicy { QUEUE, DROP };
    typedef std::function<void(const RunEvent &event)> EventListener;
private:
    const size_t max_concurrent_jobs_;
    const OverflowPolicy overflow_policy_;
    const EventListener event_listener_;
    SchedulerContext context_;

    std::mutex mutex_;
    std::condition_variable idle_condition_;
    bool started_, stopped_;
    size_t active_run_count_;
    std::deque<std::string> queued_job_names_;
    unsigned next_run_id_;
    std::map<unsigned, std::thread> run_ids_to_threads_map_;
    std::map<unsigned, std::shared_ptr<ThreadUtil::CancellationToken>> run_ids_to_tokens_map_;
    std::vector<unsigned> finished_run_ids_;

    std::shared_ptr<ThreadUtil::CancellationToken> stop_token_;
    std::vector<std::thread> timer_threads_;
public:
    /** \param event_listener  If set, called for each run outcome, possibly from several threads at once. */
    Scheduler(const size_t max_concurrent_jobs, const OverflowPolicy overflow_policy, const EventListener &event_listener = nullptr);
    Scheduler(const Scheduler &rhs) = delete;
    ~Scheduler() { stop(); }

    /** \throws std::runtime_error if the job's name is already taken or the scheduler has been started. */
    void registerJob(const Job &job);

    /** Starts the timer threads. */
    void start();

    /** Stops all timers, cancels all runs and waits for them to finish.  May be called more than once. */
    void stop();

    /** \brief  Fires "job_name" as if its schedule had triggered, w/o waiting for the run.
     *  \throws std::runtime_error if there is no such job.
     */
    void fireNow(const std::string &job_name);

    /** \brief  Performs a run of "job_name" on the calling thread, honouring the running flag but not the concurrency limit.
     *  \param  cancellation_token  May be null.
     */
    RunEvent runNow(const std::string &job_name, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token);

    /** Blocks until no run is active or queued. */
    void waitUntilIdle();

    inline const SchedulerContext &getContext() const { return context_; }

    static bool StringToOverflowPolicy(const std::string &s, OverflowPolicy * const overflow_policy);
    static std::string OverflowPolicyToString(const OverflowPolicy overflow_policy);
private:
    void timerLoop(const std::string &job_name);
    void fire(const std::string &job_name);
    void startRun(const std::string &job_name); // Requires a locked mutex_.
    void performRun(const unsigned run_id, const std::string &job_name, const std::shared_ptr<ThreadUtil::CancellationToken> &token);
    RunEvent executeRunner(const std::string &job_name, const std::shared_ptr<ThreadUtil::CancellationToken> &token);
    void report(const RunEvent &event);
};
