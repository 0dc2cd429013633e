/** \file   FileConnector.h
 *  \brief  Connectors that read a dump from, or write it to, a local file.
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


#include <memory>
#include <string>
#include "Connector.h"
#include "FileUtil.h"


class FileSourceConnector : public SourceConnector {
    std::string path_;
    int fd_;
    std::shared_ptr<ThreadUtil::CancellationToken> cancellation_token_;
public:
    explicit FileSourceConnector(const std::string &path);
    ~FileSourceConnector() override { close(); }

    std::string getType() const override { return "file"; }
    void open(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) override;
    size_t read(char * const buffer, const size_t buffer_size) override;
    void close() override;
};


/** \class  FileDestinationConnector
 *  \brief  Replaces the contents of a file w/ the restored stream.
 *  \note   The file is only replaced when close() succeeds, so reapplying a stream is always safe.
 */
class FileDestinationConnector : public DestinationConnector {
    std::string path_;
    std::unique_ptr<FileUtil::AtomicFileWriter> writer_;
    std::shared_ptr<ThreadUtil::CancellationToken> cancellation_token_;
public:
    explicit FileDestinationConnector(const std::string &path);

    std::string getType() const override { return "file"; }
    void open(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) override;
    void write(const char * const data, const size_t data_size) override;
    void close() override;
    void abort() override { writer_.reset(); }
};
