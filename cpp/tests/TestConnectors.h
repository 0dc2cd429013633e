/** \file   TestConnectors.h
 *  \brief  In-process connectors and bridge stores for the pipeline and scheduler tests.
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


#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cstring>
#include "BridgeStore.h"
#include "Connector.h"
#include "DumpBridgeErrors.h"


/** \return "size" bytes of deterministic, poorly compressible data. */
inline std::string MakeTestData(const size_t size, unsigned seed = 4711) {
    std::string data;
    data.reserve(size);
    for (size_t i(0); i < size; ++i) {
        seed = seed * 1103515245u + 12345u;
        data += static_cast<char>((seed >> 16) & 0xFFu);
    }

    return data;
}


/** \class  MemorySourceConnector
 *  \brief  Serves a string in small pieces and optionally breaks off after "fail_after" bytes.
 */
class MemorySourceConnector : public SourceConnector {
    std::string data_;
    size_t fail_after_, read_size_, position_;
    bool open_;
public:
    unsigned open_count_, close_count_;
public:
    explicit MemorySourceConnector(const std::string &data, const size_t fail_after = std::string::npos, const size_t read_size = 65536)
        : data_(data), fail_after_(fail_after), read_size_(read_size), position_(0), open_(false), open_count_(0), close_count_(0) { }

    std::string getType() const override { return "memory"; }

    void open(const std::shared_ptr<ThreadUtil::CancellationToken> &/*cancellation_token*/) override {
        position_ = 0;
        open_ = true;
        ++open_count_;
    }

    size_t read(char * const buffer, const size_t buffer_size) override {
        if (not open_)
            throw DumpBridge::StreamInterruptedError("not open");
        if (position_ >= fail_after_)
            throw DumpBridge::StreamInterruptedError("connection reset by peer after " + std::to_string(position_) + " bytes");

        size_t count(std::min(std::min(buffer_size, read_size_), data_.size() - position_));
        if (fail_after_ != std::string::npos)
            count = std::min(count, fail_after_ - position_);
        std::memcpy(buffer, data_.data() + position_, count);
        position_ += count;
        return count;
    }

    void close() override {
        if (open_)
            ++close_count_;
        open_ = false;
    }
};


/** \class  MemoryDestinationConnector
 *  \brief  Collects everything that is written and records how the stream ended.
 */
class MemoryDestinationConnector : public DestinationConnector {
public:
    std::string received_;
    bool opened_, closed_, aborted_;
    unsigned write_count_;
public:
    MemoryDestinationConnector(): opened_(false), closed_(false), aborted_(false), write_count_(0) { }

    std::string getType() const override { return "memory"; }

    void open(const std::shared_ptr<ThreadUtil::CancellationToken> &/*cancellation_token*/) override {
        received_.clear();
        opened_ = true;
        closed_ = aborted_ = false;
    }

    void write(const char * const data, const size_t data_size) override {
        received_.append(data, data_size);
        ++write_count_;
    }

    void close() override { closed_ = true; }
    void abort() override { aborted_ = true; }
};


/** \class  FaultInjectingBridgeStore
 *  \brief  Wraps a MemoryBridgeStore, records the order of all puts and fails or stalls puts or gets on request.
 */
class FaultInjectingBridgeStore : public BridgeStore {
    std::mutex mutex_;
public:
    MemoryBridgeStore store_;
    std::vector<std::string> put_keys_;    // In the order of successful puts.
    unsigned transient_put_failures_;      // The next this many puts fail w/ a transient error.
    std::string failing_put_key_fragment_; // Puts of keys containing this always fail.
    unsigned transient_get_failures_;
    bool stall_puts_until_cancelled_;      // Puts hang like an unresponsive server until their token is cancelled.
    std::atomic<unsigned> stalled_puts_;   // The number of puts currently hanging.
public:
    FaultInjectingBridgeStore()
        : transient_put_failures_(0), transient_get_failures_(0), stall_puts_until_cancelled_(false), stalled_puts_(0) { }

    std::string getType() const override { return "fault-injecting"; }

    void put(const std::string &key, const std::string &data,
             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override
    {
        if (stall_puts_until_cancelled_) {
            if (cancellation_token == nullptr)
                throw DumpBridge::UploadError("a stalled put of \"" + key + "\" can never finish", /* transient = */false);
            ++stalled_puts_;
            while (cancellation_token->sleepFor(std::chrono::milliseconds(10)))
                /* Intentionally empty! */;
            --stalled_puts_;
        }

        DumpBridge::ThrowIfCancelled(cancellation_token);
        {
            std::lock_guard<std::mutex> mutex_locker(mutex_);
            if (transient_put_failures_ > 0) {
                --transient_put_failures_;
                throw DumpBridge::UploadError("simulated timeout");
            }
            if (not failing_put_key_fragment_.empty() and key.find(failing_put_key_fragment_) != std::string::npos)
                throw DumpBridge::UploadError("simulated permanent failure", /* transient = */false);
            put_keys_.emplace_back(key);
        }
        store_.put(key, data, cancellation_token);
    }

    void get(const std::string &key, const DataConsumer &consumer,
             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override
    {
        DumpBridge::ThrowIfCancelled(cancellation_token);
        {
            std::lock_guard<std::mutex> mutex_locker(mutex_);
            if (transient_get_failures_ > 0) {
                --transient_get_failures_;
                throw DumpBridge::DownloadError("simulated timeout");
            }
        }
        store_.get(key, consumer, cancellation_token);
    }

    std::vector<std::string> list(const std::string &prefix,
                                  const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override
    {
        return store_.list(prefix, cancellation_token);
    }

    bool exists(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override {
        return store_.exists(key, cancellation_token);
    }
};


/** \return A retry policy that doesn't make the tests wait. */
inline DumpBridge::RetryPolicy FastRetryPolicy(const unsigned max_retries = 3) {
    return DumpBridge::RetryPolicy(max_retries, /* initial_backoff_ms = */1, /* max_backoff_ms = */2);
}
