/** \file    ThreadUtil.cc
 *  \brief   Implementation of thread-related utility classes.
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
#include "ThreadUtil.h"
#include <vector>


namespace ThreadUtil {


void CancellationToken::cancel() {
    std::lock_guard<std::mutex> callback_execution_locker(callback_execution_mutex_);
    std::map<unsigned, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        if (cancelled_)
            return;
        cancelled_ = true;
        callbacks.swap(callbacks_);
    }
    condition_.notify_all();

    // Run the callbacks w/o holding our mutex so that they may safely call back into us.
    for (const auto &id_and_callback : callbacks)
        id_and_callback.second();
}


bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    return cancelled_;
}


bool CancellationToken::sleepFor(const std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> mutex_locker(mutex_);
    return not condition_.wait_for(mutex_locker, duration, [this]() { return cancelled_; });
}


unsigned CancellationToken::addCallback(const std::function<void()> &callback) {
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        if (not cancelled_) {
            const unsigned callback_id(++next_callback_id_);
            callbacks_.emplace(callback_id, callback);
            return callback_id;
        }
    }

    callback();
    return 0;
}


void CancellationToken::removeCallback(const unsigned callback_id) {
    std::lock_guard<std::mutex> callback_execution_locker(callback_execution_mutex_);
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    callbacks_.erase(callback_id);
}


} // namespace ThreadUtil
