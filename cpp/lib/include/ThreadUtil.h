/** \file    ThreadUtil.h
 *  \brief   Various classes and utility functions for multithreaded programs.
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


#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include "util.h"


namespace ThreadUtil {


/** \class  CancellationToken
 *  \brief  A flag that one thread raises to ask others to stop what they are doing.
 *  \note   Instances are shared via std::shared_ptr between the party that requests cancellation and the workers that
 *          honour it.  Workers either poll isCancelled(), wait in sleepFor() or register a callback that will be
 *          invoked exactly once from within cancel(), e.g. to kill a child process that is blocking a read.
 */
class CancellationToken {
    mutable std::mutex mutex_;
    std::mutex callback_execution_mutex_; // Held while callbacks run so that removeCallback() waits for them.
    std::condition_variable condition_;
    bool cancelled_;
    unsigned next_callback_id_;
    std::map<unsigned, std::function<void()>> callbacks_;
public:
    CancellationToken(): cancelled_(false), next_callback_id_(0) { }
    CancellationToken(const CancellationToken &rhs) = delete;

    /** Raises the flag, wakes up sleepers and runs all registered callbacks.  Subsequent calls are no-ops. */
    void cancel();

    bool isCancelled() const;

    /** \brief  Blocks for "duration" or until cancel() has been called, whatever happens first.
     *  \return True if the full duration elapsed, false if we were cancelled.
     */
    bool sleepFor(const std::chrono::milliseconds duration);

    /** \brief  Registers "callback" to be run upon cancellation.  If the token has already been cancelled, "callback" runs
     *          immediately.
     *  \return An ID that can be passed to removeCallback().
     */
    unsigned addCallback(const std::function<void()> &callback);
    /** \note Blocks while callbacks are being executed by cancel(). */
    void removeCallback(const unsigned callback_id);
};


/** Registers a cancellation callback for the lifetime of an instance of this class. */
class ScopedCancellationCallback {
    std::shared_ptr<CancellationToken> token_;
    unsigned callback_id_;
public:
    ScopedCancellationCallback(const std::shared_ptr<CancellationToken> &token, const std::function<void()> &callback)
        : token_(token), callback_id_(token_ == nullptr ? 0 : token_->addCallback(callback)) { }
    ScopedCancellationCallback(const ScopedCancellationCallback &rhs) = delete;
    ~ScopedCancellationCallback() { if (token_ != nullptr) token_->removeCallback(callback_id_); }
};


} // namespace ThreadUtil
