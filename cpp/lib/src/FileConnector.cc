/** \file   FileConnector.cc
 *  \brief  Implementation of the file connectors.
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
#include "FileConnector.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include "DumpBridgeErrors.h"
#include "util.h"


namespace {


// How long a read waits for data before it checks for cancellation again.
const int POLL_INTERVAL_MS(200);


} // unnamed namespace


FileSourceConnector::FileSourceConnector(const std::string &path): path_(path), fd_(-1) {
    if (unlikely(path_.empty()))
        throw DumpBridge::ConfigurationError("file source needs a non-empty path!");
}


void FileSourceConnector::open(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    close();
    cancellation_token_ = cancellation_token;
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (unlikely(fd_ == -1)) {
        const int saved_errno(errno);
        throw DumpBridge::ConnectionError("can't open \"" + path_ + "\" for reading! (" + std::string(std::strerror(saved_errno)) + ")",
                                          /* transient = */saved_errno == EINTR or saved_errno == EAGAIN);
    }
    LOG_DEBUG("opened \"" + path_ + "\"");
}


size_t FileSourceConnector::read(char * const buffer, const size_t buffer_size) {
    if (unlikely(fd_ == -1))
        throw DumpBridge::StreamInterruptedError("read from \"" + path_ + "\" w/o a prior open!");

    // A FIFO whose writer has stalled would block a plain read() forever.
    for (;;) {
        DumpBridge::ThrowIfCancelled(cancellation_token_);
        struct pollfd poll_fd;
        poll_fd.fd      = fd_;
        poll_fd.events  = POLLIN;
        poll_fd.revents = 0;
        const int ready_count(::poll(&poll_fd, 1, POLL_INTERVAL_MS));
        if (ready_count > 0)
            break;
        if (unlikely(ready_count == -1 and errno != EINTR))
            throw DumpBridge::StreamInterruptedError("poll on \"" + path_ + "\" failed! (" + std::string(std::strerror(errno)) + ")");
    }

    ssize_t bytes_read;
    while ((bytes_read = ::read(fd_, buffer, buffer_size)) == -1 and errno == EINTR)
        /* Intentionally empty! */;
    if (unlikely(bytes_read == -1))
        throw DumpBridge::StreamInterruptedError("read from \"" + path_ + "\" failed! (" + std::string(std::strerror(errno)) + ")");

    return static_cast<size_t>(bytes_read);
}


void FileSourceConnector::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    cancellation_token_.reset();
}


FileDestinationConnector::FileDestinationConnector(const std::string &path): path_(path) {
    if (unlikely(path_.empty()))
        throw DumpBridge::ConfigurationError("file destination needs a non-empty path!");
}


void FileDestinationConnector::open(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    cancellation_token_ = cancellation_token;
    try {
        writer_.reset(new FileUtil::AtomicFileWriter(path_));
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ConnectionError(x.what());
    }
}


void FileDestinationConnector::write(const char * const data, const size_t data_size) {
    if (unlikely(writer_ == nullptr))
        throw DumpBridge::ConnectionError("write to \"" + path_ + "\" w/o a prior open!");
    DumpBridge::ThrowIfCancelled(cancellation_token_);

    if (unlikely(not writer_->write(data, data_size)))
        throw DumpBridge::ConnectionError("write to \"" + path_ + "\" failed! (" + std::string(std::strerror(errno)) + ")");
}


void FileDestinationConnector::close() {
    if (unlikely(writer_ == nullptr))
        throw DumpBridge::ConnectionError("close of \"" + path_ + "\" w/o a prior open!");

    std::unique_ptr<FileUtil::AtomicFileWriter> writer(std::move(writer_));
    if (unlikely(not writer->commit()))
        throw DumpBridge::ConnectionError("can't replace \"" + path_ + "\"! (" + std::string(std::strerror(errno)) + ")");
    LOG_DEBUG("replaced \"" + path_ + "\"");
}
