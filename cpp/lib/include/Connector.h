/** \file   Connector.h
 *  \brief  The capability interfaces for the ends of a replication: where dumps come from and where they go to.
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


#include <functional>
#include <memory>
#include <string>
#include "IniFile.h"
#include "ThreadUtil.h"


/** \class  SourceConnector
 *  \brief  Produces one complete logical dump of a source as a finite, non-restartable byte stream.
 */
class SourceConnector {
public:
    /** Creates a connector from a "[source NAME]" section. */
    typedef std::function<std::unique_ptr<SourceConnector>(const IniFile::Section &section)> Factory;

public:
    virtual ~SourceConnector() = default;

    virtual std::string getType() const = 0;

    /** \brief  Connects to the source and starts the dump.
     *  \param  cancellation_token  May be null.  Cancelling it must unblock a pending read().
     *  \throws DumpBridge::ConnectionError.
     */
    virtual void open(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) = 0;

    /** \brief  Reads the next piece of the dump.
     *  \return The number of bytes stored in "buffer", 0 at the clean end of the stream.
     *  \throws DumpBridge::StreamInterruptedError if the stream broke off before its end.
     */
    virtual size_t read(char * const buffer, const size_t buffer_size) = 0;

    /** Releases everything acquired by open().  A dump that has not been read to its end is abandoned.  Never throws. */
    virtual void close() = 0;

    /** Makes "factory" available under "type" for Create(). */
    static void RegisterFactory(const std::string &type, const Factory &factory);

    /** \throws DumpBridge::ConfigurationError if the type is missing or unknown or if the factory rejects "section". */
    static std::unique_ptr<SourceConnector> Create(const IniFile::Section &section);
};


/** \class  DestinationConnector
 *  \brief  Applies a dump stream to a destination.
 *  \note   Implementations must tolerate a complete reapplication of a stream that has been applied before, possibly
 *          partially.  A restore that failed is always retried from the very beginning.
 */
class DestinationConnector {
public:
    /** Creates a connector from a "[destination NAME]" section. */
    typedef std::function<std::unique_ptr<DestinationConnector>(const IniFile::Section &section)> Factory;

public:
    virtual ~DestinationConnector() = default;

    virtual std::string getType() const = 0;

    /** \throws DumpBridge::ConnectionError. */
    virtual void open(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) = 0;

    /** \throws DumpBridge::ConnectionError if the destination refused the data. */
    virtual void write(const char * const data, const size_t data_size) = 0;

    /** \brief  Signals the end of the stream and waits until the destination has applied everything.
     *  \throws DumpBridge::ConnectionError.
     */
    virtual void close() = 0;

    /** Gives up on the current stream, discarding what can be discarded.  Never throws. */
    virtual void abort() = 0;

    static void RegisterFactory(const std::string &type, const Factory &factory);

    /** \throws DumpBridge::ConfigurationError if the type is missing or unknown or if the factory rejects "section". */
    static std::unique_ptr<DestinationConnector> Create(const IniFile::Section &section);
};
