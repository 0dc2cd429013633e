/** \file   SharedBuffer.h
 *  \brief  Template class of a bounded buffer that can be used to communicate safely between multiple threads.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <mutex>


/** \brief  Implements a bounded queue that can be shared between a producer and a consumer thread.
 *  \note   A full buffer blocks the producer and an empty buffer blocks the consumer.  Either side may close() the
 *          buffer which wakes up everybody who is waiting.  After a close the consumer may still drain whatever was
 *          pushed before, after an abort() the remaining items are discarded.
 */
template <typename ItemType>
class SharedBuffer {
    const size_t max_size_;
    std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<ItemType> buffer_;
    bool closed_, aborted_;

public:
    explicit SharedBuffer(const size_t max_size): max_size_(max_size == 0 ? 1 : max_size), closed_(false), aborted_(false) { }

    bool empty() {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        return buffer_.empty();
    }

    size_t size() {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        return buffer_.size();
    }

    inline size_t capacity() const { return max_size_; }

    /** \return False if the buffer was closed or aborted before "new_item" could be added, o/w true. */
    bool push_back(ItemType new_item) {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        condition_.wait(mutex_locker, [this]() { return buffer_.size() < max_size_ or closed_ or aborted_; });
        if (closed_ or aborted_)
            return false;
        buffer_.emplace_back(std::move(new_item));
        mutex_locker.unlock();
        condition_.notify_all();
        return true;
    }

    /** \return False if there is nothing left to consume because the buffer has been closed or aborted, o/w true. */
    bool pop_front(ItemType * const item) {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        condition_.wait(mutex_locker, [this]() { return not buffer_.empty() or closed_ or aborted_; });
        if (aborted_ or buffer_.empty())
            return false;
        *item = std::move(buffer_.front());
        buffer_.pop_front();
        mutex_locker.unlock();
        condition_.notify_all();
        return true;
    }

    /** No more items will be accepted. Items already in the buffer can still be consumed. */
    void close() {
        {
            std::unique_lock<std::mutex> mutex_locker(mutex_);
            closed_ = true;
        }
        condition_.notify_all();
    }

    /** Like close() but also discards all buffered items. */
    void abort() {
        {
            std::unique_lock<std::mutex> mutex_locker(mutex_);
            aborted_ = true;
            buffer_.clear();
        }
        condition_.notify_all();
    }
};
