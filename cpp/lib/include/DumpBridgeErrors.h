/** \file   DumpBridgeErrors.h
 *  \brief  The exceptions that dump and restore runs report their failures with and the retry logic that acts upon them.
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
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "ThreadUtil.h"
#include "util.h"


namespace DumpBridge {


enum ErrorKind { CONNECTION, STREAM_INTERRUPTED, UPLOAD, DOWNLOAD, INTEGRITY, MANIFEST_CORRUPT, CONFIGURATION, CANCELLED };


std::string ErrorKindToString(const ErrorKind error_kind);


/** \class  Error
 *  \brief  Base class of everything that can go wrong during a dump or restore run.
 *  \note   Transient errors, e.g. a network hiccup during a single chunk upload, may succeed when retried.  All others
 *          abort the current run immediately.
 */
class Error : public std::runtime_error {
    ErrorKind kind_;
    bool transient_;
public:
    Error(const ErrorKind kind, const std::string &message, const bool transient)
        : std::runtime_error(message), kind_(kind), transient_(transient) { }

    inline ErrorKind getKind() const { return kind_; }
    inline bool isTransient() const { return transient_; }
};


// Cannot open a source, destination or bridge store, also used for authentication failures.
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string &message, const bool transient = false): Error(CONNECTION, message, transient) { }
};


// The source died in the middle of a dump.  Never to be confused w/ a clean end-of-stream.
class StreamInterruptedError : public Error {
public:
    explicit StreamInterruptedError(const std::string &message): Error(STREAM_INTERRUPTED, message, /* transient = */false) { }
};


class UploadError : public Error {
public:
    explicit UploadError(const std::string &message, const bool transient = true): Error(UPLOAD, message, transient) { }
};


class DownloadError : public Error {
public:
    explicit DownloadError(const std::string &message, const bool transient = true): Error(DOWNLOAD, message, transient) { }
};


// A checksum or length mismatch between a stored chunk and its descriptor.
class IntegrityError : public Error {
public:
    explicit IntegrityError(const std::string &message): Error(INTEGRITY, message, /* transient = */false) { }
};


// A structurally invalid manifest, e.g. w/ missing or out-of-order sequence numbers.
class ManifestCorruptError : public Error {
public:
    explicit ManifestCorruptError(const std::string &message): Error(MANIFEST_CORRUPT, message, /* transient = */false) { }
};


class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string &message): Error(CONFIGURATION, message, /* transient = */false) { }
};


class CancelledError : public Error {
public:
    explicit CancelledError(const std::string &message = "run cancelled"): Error(CANCELLED, message, /* transient = */false) { }
};


/** \brief  Throws a CancelledError if "cancellation_token" is non-null and has been cancelled. */
inline void ThrowIfCancelled(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    if (cancellation_token != nullptr and cancellation_token->isCancelled())
        throw CancelledError();
}


struct RetryPolicy {
    unsigned max_retries_;        // Additional attempts after the first one.
    unsigned initial_backoff_ms_; // Doubled after each failed attempt...
    unsigned max_backoff_ms_;     // ...but never beyond this.
public:
    explicit RetryPolicy(const unsigned max_retries = 3, const unsigned initial_backoff_ms = 500, const unsigned max_backoff_ms = 30000)
        : max_retries_(max_retries), initial_backoff_ms_(initial_backoff_ms), max_backoff_ms_(max_backoff_ms) { }
};


/** \brief  Calls "operation" until it succeeds, throws a non-transient error or the retries in "retry_policy" are used up.
 *  \param  description         Used in log messages, e.g. "upload of chunk 3".
 *  \param  cancellation_token  May be null.  If cancelled while we back off a CancelledError is thrown.
 *  \return Whatever "operation" returns.
 */
template <typename Operation>
auto WithRetries(const RetryPolicy &retry_policy, const std::string &description,
                 const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token, Operation operation) -> decltype(operation())
{
    unsigned backoff_ms(retry_policy.initial_backoff_ms_);
    for (unsigned attempt(0); /* Intentionally empty! */; ++attempt) {
        ThrowIfCancelled(cancellation_token);
        try {
            return operation();
        } catch (const Error &error) {
            if (not error.isTransient() or attempt >= retry_policy.max_retries_)
                throw;
            LOG_WARNING(description + " failed (attempt " + std::to_string(attempt + 1) + " of "
                        + std::to_string(retry_policy.max_retries_ + 1) + "): " + std::string(error.what()) + ", retrying in "
                        + std::to_string(backoff_ms) + " ms");
        }

        if (cancellation_token != nullptr) {
            if (not cancellation_token->sleepFor(std::chrono::milliseconds(backoff_ms)))
                throw CancelledError();
        } else
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        backoff_ms = std::min(backoff_ms * 2, retry_policy.max_backoff_ms_);
    }
}


} // namespace DumpBridge
