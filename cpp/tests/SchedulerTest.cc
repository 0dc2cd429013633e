/** \brief Test cases for the job scheduler
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
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "DumpBridgeErrors.h"
#include "Scheduler.h"
#include "UnitTest.h"


namespace {


// Never fires while the tests run.
const CronExpression NEW_YEAR("0 0 1 1 *");


// Blocks callers of wait() until open() has been called.
class Gate {
    std::mutex mutex_;
    std::condition_variable condition_;
    bool open_;
public:
    Gate(): open_(false) { }

    void open() {
        {
            std::lock_guard<std::mutex> mutex_locker(mutex_);
            open_ = true;
        }
        condition_.notify_all();
    }

    bool wait(const std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        return condition_.wait_for(mutex_locker, timeout, [this]() { return open_; });
    }
};


class EventLog {
    std::mutex mutex_;
    std::condition_variable condition_;
    std::vector<RunEvent> events_;
public:
    void record(const RunEvent &event) {
        {
            std::lock_guard<std::mutex> mutex_locker(mutex_);
            events_.emplace_back(event);
        }
        condition_.notify_all();
    }

    Scheduler::EventListener listener() { return [this](const RunEvent &event) { record(event); }; }

    bool waitForEvents(const size_t count, const std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        return condition_.wait_for(mutex_locker, timeout, [this, count]() { return events_.size() >= count; });
    }

    std::vector<RunEvent> getEvents() {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        return events_;
    }

    size_t count(const std::string &job_name, const RunEvent::Outcome outcome) {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        size_t matches(0);
        for (const auto &event : events_) {
            if (event.job_name_ == job_name and event.outcome_ == outcome)
                ++matches;
        }
        return matches;
    }
};


// Signals "started" and then waits for "release".
Job::Runner BlockingRunner(Gate * const started, Gate * const release, const std::string &manifest_id) {
    return [started, release, manifest_id](const std::shared_ptr<ThreadUtil::CancellationToken> &) {
        started->open();
        if (not release->wait())
            throw std::runtime_error("gate never opened");
        return manifest_id;
    };
}


} // unnamed namespace


TEST(OverlappingFiresAreSkipped) {
    EventLog event_log;
    Gate started, release;
    Scheduler scheduler(2, Scheduler::QUEUE, event_log.listener());
    scheduler.registerJob(Job("nightly", NEW_YEAR, BlockingRunner(&started, &release, "m1")));

    scheduler.fireNow("nightly");
    CHECK_TRUE(started.wait());
    CHECK_TRUE(scheduler.getContext().isRunning("nightly"));
    scheduler.fireNow("nightly");
    CHECK_EQ(event_log.count("nightly", RunEvent::SKIPPED), 1u);
    if (event_log.getEvents().size() == 1)
        CHECK_EQ(event_log.getEvents().front().toString(), "SKIPPED: overlapping run");

    release.open();
    scheduler.waitUntilIdle();
    CHECK_EQ(event_log.count("nightly", RunEvent::SUCCESS), 1u);
    CHECK_EQ(event_log.getEvents().size(), 2u);
    CHECK_FALSE(scheduler.getContext().isRunning("nightly"));
    CHECK_EQ(scheduler.getContext().getLastManifestId("nightly"), "m1");
}


TEST(DropPolicy) {
    EventLog event_log;
    Gate started, release, b_started;
    Scheduler scheduler(1, Scheduler::DROP, event_log.listener());
    scheduler.registerJob(Job("a", NEW_YEAR, BlockingRunner(&started, &release, "ma")));
    scheduler.registerJob(Job("b", NEW_YEAR, BlockingRunner(&b_started, &release, "mb")));

    scheduler.fireNow("a");
    CHECK_TRUE(started.wait());
    scheduler.fireNow("b");
    CHECK_EQ(event_log.count("b", RunEvent::SKIPPED), 1u);
    CHECK_FALSE(scheduler.getContext().isRunning("b"));
    const std::vector<RunEvent> events(event_log.getEvents());
    if (events.size() == 1)
        CHECK_EQ(events.front().reason_, "concurrency limit of 1 reached");

    release.open();
    scheduler.waitUntilIdle();
    CHECK_EQ(event_log.count("a", RunEvent::SUCCESS), 1u);
    CHECK_EQ(event_log.count("b", RunEvent::SUCCESS), 0u);
    CHECK_EQ(scheduler.getContext().getLastManifestId("b"), "");
}


TEST(QueuePolicy) {
    EventLog event_log;
    Gate a_started, release, b_started;
    Scheduler scheduler(1, Scheduler::QUEUE, event_log.listener());
    scheduler.registerJob(Job("a", NEW_YEAR, BlockingRunner(&a_started, &release, "ma")));
    scheduler.registerJob(Job("b", NEW_YEAR, BlockingRunner(&b_started, &release, "mb")));

    scheduler.fireNow("a");
    CHECK_TRUE(a_started.wait());
    scheduler.fireNow("b");
    CHECK_TRUE(scheduler.getContext().isRunning("b")); // Queued counts as running...
    scheduler.fireNow("b");                             // ...so this one is an overlap.
    CHECK_EQ(event_log.count("b", RunEvent::SKIPPED), 1u);
    CHECK_FALSE(b_started.wait(std::chrono::milliseconds(100)));

    release.open();
    scheduler.waitUntilIdle();
    CHECK_EQ(event_log.count("a", RunEvent::SUCCESS), 1u);
    CHECK_EQ(event_log.count("b", RunEvent::SUCCESS), 1u);
    CHECK_EQ(scheduler.getContext().getLastManifestId("b"), "mb");
}


TEST(FailuresDoNotAffectLaterRuns) {
    EventLog event_log;
    std::atomic<unsigned> call_count(0);
    Scheduler scheduler(2, Scheduler::QUEUE, event_log.listener());
    scheduler.registerJob(Job("flaky", NEW_YEAR, [&call_count](const std::shared_ptr<ThreadUtil::CancellationToken> &) {
        if (++call_count % 2 == 0)
            throw DumpBridge::StreamInterruptedError("source went away");
        return "m" + std::to_string(call_count);
    }));

    CHECK_EQ(scheduler.runNow("flaky", nullptr).outcome_, RunEvent::SUCCESS);
    CHECK_EQ(scheduler.getContext().getLastManifestId("flaky"), "m1");

    const RunEvent failure(scheduler.runNow("flaky", nullptr));
    CHECK_EQ(failure.toString(), "FAILED: source went away");
    CHECK_TRUE(failure.manifest_id_.empty());
    CHECK_EQ(scheduler.getContext().getLastManifestId("flaky"), "m1");
    CHECK_FALSE(scheduler.getContext().isRunning("flaky"));

    scheduler.fireNow("flaky");
    scheduler.waitUntilIdle();
    CHECK_EQ(event_log.count("flaky", RunEvent::SUCCESS), 2u);
    CHECK_EQ(event_log.count("flaky", RunEvent::FAILED), 1u);
    CHECK_EQ(scheduler.getContext().getLastManifestId("flaky"), "m3");
}


TEST(RunNowHonoursTheRunningFlag) {
    EventLog event_log;
    Gate started, release;
    Scheduler scheduler(2, Scheduler::QUEUE, event_log.listener());
    scheduler.registerJob(Job("job", NEW_YEAR, BlockingRunner(&started, &release, "m")));

    scheduler.fireNow("job");
    CHECK_TRUE(started.wait());
    CHECK_EQ(scheduler.runNow("job", nullptr).outcome_, RunEvent::SKIPPED);
    release.open();
    scheduler.waitUntilIdle();
    CHECK_EQ(scheduler.runNow("job", nullptr).outcome_, RunEvent::SUCCESS);
}


TEST(StopCancelsRunningJobs) {
    EventLog event_log;
    Gate started;
    Scheduler scheduler(2, Scheduler::QUEUE, event_log.listener());
    scheduler.registerJob(Job("long", NEW_YEAR, [&started](const std::shared_ptr<ThreadUtil::CancellationToken> &token) -> std::string {
        started.open();
        if (not token->sleepFor(std::chrono::milliseconds(60000)))
            throw DumpBridge::CancelledError();
        return "m";
    }));
    scheduler.start();

    scheduler.fireNow("long");
    CHECK_TRUE(started.wait());
    scheduler.stop();
    CHECK_EQ(event_log.count("long", RunEvent::FAILED), 1u);
    CHECK_FALSE(scheduler.getContext().isRunning("long"));

    scheduler.fireNow("long");
    const std::vector<RunEvent> events(event_log.getEvents());
    CHECK_EQ(events.size(), 2u);
    if (events.size() == 2)
        CHECK_EQ(events.back().toString(), "SKIPPED: scheduler is stopping");
    scheduler.stop();
}


TEST(TimersFire) {
    EventLog event_log;
    Scheduler scheduler(1, Scheduler::QUEUE, event_log.listener());
    scheduler.registerJob(Job("every-second", CronExpression("* * * * * *"),
                              [](const std::shared_ptr<ThreadUtil::CancellationToken> &) { return std::string("m"); }));
    scheduler.start();
    CHECK_TRUE(event_log.waitForEvents(2, std::chrono::milliseconds(5000)));
    scheduler.stop();
    CHECK_GE(event_log.count("every-second", RunEvent::SUCCESS), 2u);
}


TEST(Registration) {
    Scheduler scheduler(1, Scheduler::QUEUE);
    const Job::Runner runner([](const std::shared_ptr<ThreadUtil::CancellationToken> &) { return std::string(); });
    scheduler.registerJob(Job("job", NEW_YEAR, runner));
    CHECK_THROW(scheduler.registerJob(Job("job", NEW_YEAR, runner)), std::runtime_error);
    CHECK_THROW(scheduler.fireNow("unknown"), std::runtime_error);
    CHECK_TRUE(scheduler.getContext().hasJob("job"));
    CHECK_FALSE(scheduler.getContext().hasJob("unknown"));

    scheduler.start();
    CHECK_THROW(scheduler.registerJob(Job("late", NEW_YEAR, runner)), std::runtime_error);
    scheduler.stop();
}


TEST(OverflowPolicyNames) {
    Scheduler::OverflowPolicy overflow_policy;
    CHECK_TRUE(Scheduler::StringToOverflowPolicy("drop", &overflow_policy));
    CHECK_EQ(overflow_policy, Scheduler::DROP);
    CHECK_TRUE(Scheduler::StringToOverflowPolicy("queue", &overflow_policy));
    CHECK_EQ(overflow_policy, Scheduler::QUEUE);
    CHECK_FALSE(Scheduler::StringToOverflowPolicy("Drop", &overflow_policy));
    CHECK_EQ(Scheduler::OverflowPolicyToString(Scheduler::DROP), "drop");
    CHECK_EQ(RunEvent("job", RunEvent::SUCCESS, "", "m").toString(), "SUCCESS");
}


TEST_MAIN(Scheduler)
