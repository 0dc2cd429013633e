/** \file   BridgeStore.h
 *  \brief  The durable object store that decouples the dumping from the restoring side.
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
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "IniFile.h"
#include "ThreadUtil.h"


/** \class  BridgeStore
 *  \brief  A key/value object store.
 *  \note   put() must be all-or-nothing from the point of view of a concurrent or later get(): a partially written
 *          object must never be observable.  No guarantees are made across keys.
 *  \note   Implementations must be safe to use from multiple threads at once.
 *  \note   Every operation takes an optional cancellation token.  Once it is cancelled, an operation in progress gives up
 *          as soon as it can and throws DumpBridge::CancelledError.
 */
class BridgeStore {
public:
    /** Receives consecutive pieces of an object's contents. */
    typedef std::function<void(const char * const data, const size_t data_size)> DataConsumer;

    /** Creates a store from the "[bridge]" section of a configuration file. */
    typedef std::function<std::unique_ptr<BridgeStore>(const IniFile::Section &section)> Factory;

public:
    virtual ~BridgeStore() = default;

    virtual std::string getType() const = 0;

    /** \throws DumpBridge::UploadError or DumpBridge::ConnectionError. */
    virtual void put(const std::string &key, const std::string &data,
                     const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) = 0;

    /** \brief  Streams the contents of the object stored under "key" into "consumer".
     *  \throws DumpBridge::DownloadError (not transient if "key" does not exist) or DumpBridge::ConnectionError.
     */
    virtual void get(const std::string &key, const DataConsumer &consumer,
                     const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) = 0;

    /** Convenience wrapper around get() for small objects. */
    std::string getString(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr);

    /** \return All keys starting with "prefix", in lexical order. */
    virtual std::vector<std::string> list(const std::string &prefix,
                                          const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) = 0;

    virtual bool exists(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) = 0;

    /** \brief  Makes "factory" available under "type" for Create().  Replaces any previous registration. */
    static void RegisterFactory(const std::string &type, const Factory &factory);

    /** \brief  Instantiates the store named by the "type" entry of "section".
     *  \throws DumpBridge::ConfigurationError if the type is missing or unknown or if the factory rejects "section".
     */
    static std::unique_ptr<BridgeStore> Create(const IniFile::Section &section);

    /** \throws DumpBridge::ConfigurationError if "key" is empty, absolute or contains empty, "." or ".." components. */
    static void ValidateKey(const std::string &key);
};


/** \class  LocalBridgeStore
 *  \brief  Stores each object as a file below a root directory.  Puts go through a temporary file, fsync(2) and
 *          rename(2).
 */
class LocalBridgeStore : public BridgeStore {
    std::string root_directory_;
public:
    /** \throws DumpBridge::ConnectionError if "root_directory" can't be created. */
    explicit LocalBridgeStore(const std::string &root_directory);

    std::string getType() const override { return "local"; }
    void put(const std::string &key, const std::string &data,
             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    void get(const std::string &key, const DataConsumer &consumer,
             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    std::vector<std::string> list(const std::string &prefix,
                                  const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    bool exists(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;

    inline const std::string &getRootDirectory() const { return root_directory_; }
};


/** \class  MemoryBridgeStore
 *  \brief  Keeps all objects in a map.  Useful for tests and dry runs.
 */
class MemoryBridgeStore : public BridgeStore {
    std::mutex mutex_;
    std::map<std::string, std::string> keys_to_objects_map_;
public:
    std::string getType() const override { return "memory"; }
    void put(const std::string &key, const std::string &data,
             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    void get(const std::string &key, const DataConsumer &consumer,
             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    std::vector<std::string> list(const std::string &prefix,
                                  const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    bool exists(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;

    /** Removes an object, returns false if there was none. */
    bool remove(const std::string &key);
};
