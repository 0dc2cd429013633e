/** \file   Scheduler.cc
 *  \brief  Implementation of the Scheduler and its context.
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
#include "Scheduler.h"
#include <stdexcept>
#include "TimeUtil.h"
#include "util.h"


std::string RunEvent::OutcomeToString(const Outcome outcome) {
    switch (outcome) {
    case SUCCESS:
        return "SUCCESS";
    case SKIPPED:
        return "SKIPPED";
    case FAILED:
        return "FAILED";
    }

    throw std::runtime_error("in RunEvent::OutcomeToString: unknown outcome " + std::to_string(outcome) + "!");
}


std::string RunEvent::toString() const {
    return (outcome_ == SUCCESS) ? OutcomeToString(outcome_) : OutcomeToString(outcome_) + ": " + reason_;
}


void SchedulerContext::addJob(const Job &job) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    if (unlikely(not job_names_to_states_map_.emplace(job.name_, JobState(job)).second))
        throw std::runtime_error("in SchedulerContext::addJob: duplicate job \"" + job.name_ + "\"!");
}


bool SchedulerContext::hasJob(const std::string &job_name) const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    return job_names_to_states_map_.find(job_name) != job_names_to_states_map_.cend();
}


std::vector<std::string> SchedulerContext::getJobNames() const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    std::vector<std::string> job_names;
    for (const auto &job_name_and_state : job_names_to_states_map_)
        job_names.emplace_back(job_name_and_state.first);

    return job_names;
}


Job SchedulerContext::getJob(const std::string &job_name) const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const auto job_name_and_state(job_names_to_states_map_.find(job_name));
    if (unlikely(job_name_and_state == job_names_to_states_map_.cend()))
        throw std::runtime_error("in SchedulerContext::getJob: unknown job \"" + job_name + "\"!");

    return job_name_and_state->second.job_;
}


bool SchedulerContext::tryAcquire(const std::string &job_name) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const auto job_name_and_state(job_names_to_states_map_.find(job_name));
    if (unlikely(job_name_and_state == job_names_to_states_map_.end()))
        throw std::runtime_error("in SchedulerContext::tryAcquire: unknown job \"" + job_name + "\"!");
    if (job_name_and_state->second.running_)
        return false;

    job_name_and_state->second.running_ = true;
    return true;
}


void SchedulerContext::release(const std::string &job_name, const std::string &manifest_id) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const auto job_name_and_state(job_names_to_states_map_.find(job_name));
    if (unlikely(job_name_and_state == job_names_to_states_map_.end()))
        throw std::runtime_error("in SchedulerContext::release: unknown job \"" + job_name + "\"!");

    job_name_and_state->second.running_ = false;
    if (not manifest_id.empty())
        job_name_and_state->second.last_manifest_id_ = manifest_id;
}


bool SchedulerContext::isRunning(const std::string &job_name) const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const auto job_name_and_state(job_names_to_states_map_.find(job_name));
    return job_name_and_state != job_names_to_states_map_.cend() and job_name_and_state->second.running_;
}


std::string SchedulerContext::getLastManifestId(const std::string &job_name) const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const auto job_name_and_state(job_names_to_states_map_.find(job_name));
    return (job_name_and_state == job_names_to_states_map_.cend()) ? "" : job_name_and_state->second.last_manifest_id_;
}


Scheduler::Scheduler(const size_t max_concurrent_jobs, const OverflowPolicy overflow_policy, const EventListener &event_listener)
    : max_concurrent_jobs_(max_concurrent_jobs == 0 ? 1 : max_concurrent_jobs), overflow_policy_(overflow_policy),
      event_listener_(event_listener), started_(false), stopped_(false), active_run_count_(0), next_run_id_(0),
      stop_token_(std::make_shared<ThreadUtil::CancellationToken>())
{
}


void Scheduler::registerJob(const Job &job) {
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        if (unlikely(started_ or stopped_))
            throw std::runtime_error("in Scheduler::registerJob: can't register \"" + job.name_ + "\" after start()!");
    }
    context_.addJob(job);
}


void Scheduler::start() {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    if (unlikely(started_ or stopped_))
        throw std::runtime_error("in Scheduler::start: already started!");
    started_ = true;

    for (const auto &job_name : context_.getJobNames()) {
        LOG_INFO("scheduling \"" + job_name + "\" w/ \"" + context_.getJob(job_name).schedule_.toString() + "\" (UTC)");
        timer_threads_.emplace_back(&Scheduler::timerLoop, this, job_name);
    }
}


void Scheduler::stop() {
    stop_token_->cancel();
    for (auto &timer_thread : timer_threads_)
        timer_thread.join();
    timer_threads_.clear();

    std::vector<std::shared_ptr<ThreadUtil::CancellationToken>> run_tokens;
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        stopped_ = true;
        for (const auto &queued_job_name : queued_job_names_)
            context_.release(queued_job_name, "");
        queued_job_names_.clear();
        for (const auto &run_id_and_token : run_ids_to_tokens_map_)
            run_tokens.emplace_back(run_id_and_token.second);
    }
    for (const auto &run_token : run_tokens)
        run_token->cancel();

    std::map<unsigned, std::thread> run_ids_to_threads_map;
    {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        idle_condition_.wait(mutex_locker, [this]() { return active_run_count_ == 0; });
        run_ids_to_threads_map.swap(run_ids_to_threads_map_);
        finished_run_ids_.clear();
    }
    for (auto &run_id_and_thread : run_ids_to_threads_map)
        run_id_and_thread.second.join();
}


void Scheduler::fireNow(const std::string &job_name) {
    if (unlikely(not context_.hasJob(job_name)))
        throw std::runtime_error("in Scheduler::fireNow: unknown job \"" + job_name + "\"!");
    fire(job_name);
}


RunEvent Scheduler::runNow(const std::string &job_name, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    if (not context_.tryAcquire(job_name)) {
        const RunEvent event(job_name, RunEvent::SKIPPED, "overlapping run");
        report(event);
        return event;
    }

    const RunEvent event(executeRunner(job_name, cancellation_token));
    context_.release(job_name, event.manifest_id_);
    report(event);
    return event;
}


void Scheduler::waitUntilIdle() {
    std::unique_lock<std::mutex> mutex_locker(mutex_);
    idle_condition_.wait(mutex_locker, [this]() { return active_run_count_ == 0 and queued_job_names_.empty(); });
}


bool Scheduler::StringToOverflowPolicy(const std::string &s, OverflowPolicy * const overflow_policy) {
    if (s == "queue")
        *overflow_policy = QUEUE;
    else if (s == "drop")
        *overflow_policy = DROP;
    else
        return false;

    return true;
}


std::string Scheduler::OverflowPolicyToString(const OverflowPolicy overflow_policy) {
    return (overflow_policy == QUEUE) ? "queue" : "drop";
}


void Scheduler::timerLoop(const std::string &job_name) {
    const Job job(context_.getJob(job_name));
    while (not stop_token_->isCancelled()) {
        const time_t next_fire_time(job.schedule_.nextFireTime(std::time(nullptr)));
        if (unlikely(next_fire_time == TimeUtil::BAD_TIME_T)) {
            LOG_WARNING("\"" + job_name + "\" will never fire again!");
            return;
        }
        LOG_DEBUG("next run of \"" + job_name + "\" at " + TimeUtil::TimeTToZuluString(next_fire_time));

        for (time_t now(std::time(nullptr)); now < next_fire_time; now = std::time(nullptr)) {
            if (not stop_token_->sleepFor(std::chrono::milliseconds(1000 * (next_fire_time - now))))
                return;
        }
        fire(job_name);
    }
}


void Scheduler::fire(const std::string &job_name) {
    std::string skip_reason;
    std::vector<std::thread> finished_threads;
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        for (const auto run_id : finished_run_ids_) {
            const auto run_id_and_thread(run_ids_to_threads_map_.find(run_id));
            if (run_id_and_thread != run_ids_to_threads_map_.end()) {
                finished_threads.emplace_back(std::move(run_id_and_thread->second));
                run_ids_to_threads_map_.erase(run_id_and_thread);
            }
        }
        finished_run_ids_.clear();

        if (stopped_)
            skip_reason = "scheduler is stopping";
        else if (not context_.tryAcquire(job_name))
            skip_reason = "overlapping run";
        else if (active_run_count_ < max_concurrent_jobs_)
            startRun(job_name);
        else if (overflow_policy_ == QUEUE) {
            queued_job_names_.emplace_back(job_name);
            LOG_INFO("queued \"" + job_name + "\", " + std::to_string(active_run_count_) + " run(s) active");
        } else {
            context_.release(job_name, "");
            skip_reason = "concurrency limit of " + std::to_string(max_concurrent_jobs_) + " reached";
        }
    }

    for (auto &finished_thread : finished_threads)
        finished_thread.join();
    if (not skip_reason.empty())
        report(RunEvent(job_name, RunEvent::SKIPPED, skip_reason));
}


void Scheduler::startRun(const std::string &job_name) {
    ++active_run_count_;
    const unsigned run_id(next_run_id_++);
    const std::shared_ptr<ThreadUtil::CancellationToken> run_token(std::make_shared<ThreadUtil::CancellationToken>());
    run_ids_to_tokens_map_[run_id] = run_token;
    run_ids_to_threads_map_[run_id] = std::thread(&Scheduler::performRun, this, run_id, job_name, run_token);
}


void Scheduler::performRun(const unsigned run_id, const std::string &job_name, const std::shared_ptr<ThreadUtil::CancellationToken> &token) {
    const RunEvent event(executeRunner(job_name, token));
    context_.release(job_name, event.manifest_id_);
    report(event);

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    run_ids_to_tokens_map_.erase(run_id);
    --active_run_count_;
    finished_run_ids_.emplace_back(run_id);
    if (not stopped_ and not queued_job_names_.empty()) {
        const std::string next_job_name(queued_job_names_.front());
        queued_job_names_.pop_front();
        startRun(next_job_name);
    }
    idle_condition_.notify_all();
}


RunEvent Scheduler::executeRunner(const std::string &job_name, const std::shared_ptr<ThreadUtil::CancellationToken> &token) {
    LOG_INFO("starting \"" + job_name + "\"");
    try {
        const Job job(context_.getJob(job_name));
        return RunEvent(job_name, RunEvent::SUCCESS, "", job.runner_(token));
    } catch (const std::exception &x) {
        return RunEvent(job_name, RunEvent::FAILED, x.what());
    }
}


void Scheduler::report(const RunEvent &event) {
    const std::string message("\"" + event.job_name_ + "\": " + event.toString()
                              + (event.manifest_id_.empty() ? std::string() : " (manifest " + event.manifest_id_ + ")"));
    if (event.outcome_ == RunEvent::FAILED)
        LOG_WARNING(message);
    else
        LOG_INFO(message);

    if (event_listener_)
        event_listener_(event);
}
