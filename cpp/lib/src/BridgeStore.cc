/** \file   BridgeStore.cc
 *  \brief  Implementation of the bridge store registry and of the local and in-memory stores.
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
#include "BridgeStore.h"
#include <fstream>
#include <cerrno>
#include <cstring>
#include "DumpBridgeErrors.h"
#include "FileUtil.h"
#include "S3BridgeStore.h"
#include "StringUtil.h"
#include "util.h"


namespace {


std::mutex factories_mutex;


std::map<std::string, BridgeStore::Factory> &GetFactories() {
    static std::map<std::string, BridgeStore::Factory> types_to_factories_map{
        { "local", [](const IniFile::Section &section) -> std::unique_ptr<BridgeStore> {
              return std::unique_ptr<BridgeStore>(new LocalBridgeStore(section.getString("directory")));
          } },
        { "memory", [](const IniFile::Section &/*section*/) -> std::unique_ptr<BridgeStore> {
              return std::unique_ptr<BridgeStore>(new MemoryBridgeStore());
          } },
        { "s3", [](const IniFile::Section &section) -> std::unique_ptr<BridgeStore> {
              return std::unique_ptr<BridgeStore>(new S3BridgeStore(S3BridgeStore::Params(section)));
          } },
    };

    return types_to_factories_map;
}


} // unnamed namespace


std::string BridgeStore::getString(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    std::string contents;
    get(key, [&contents](const char * const data, const size_t data_size) { contents.append(data, data_size); }, cancellation_token);
    return contents;
}


void BridgeStore::RegisterFactory(const std::string &type, const Factory &factory) {
    std::lock_guard<std::mutex> mutex_locker(factories_mutex);
    GetFactories()[type] = factory;
}


std::unique_ptr<BridgeStore> BridgeStore::Create(const IniFile::Section &section) {
    const std::string type(section.getString("type", ""));
    if (unlikely(type.empty()))
        throw DumpBridge::ConfigurationError("missing \"type\" in section \"" + section.getSectionName() + "\"!");

    Factory factory;
    {
        std::lock_guard<std::mutex> mutex_locker(factories_mutex);
        const auto type_and_factory(GetFactories().find(type));
        if (unlikely(type_and_factory == GetFactories().end()))
            throw DumpBridge::ConfigurationError("unknown bridge store type \"" + type + "\" in section \"" + section.getSectionName()
                                                 + "\"!");
        factory = type_and_factory->second;
    }

    try {
        return factory(section);
    } catch (const DumpBridge::Error &) {
        throw;
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ConfigurationError("bad bridge store configuration in section \"" + section.getSectionName() + "\": "
                                             + std::string(x.what()));
    }
}


void BridgeStore::ValidateKey(const std::string &key) {
    if (unlikely(key.empty() or key[0] == '/'))
        throw DumpBridge::ConfigurationError("invalid bridge store key \"" + key + "\"!");

    std::vector<std::string> components;
    StringUtil::Split(key, '/', &components);
    for (const auto &component : components) {
        if (unlikely(component.empty() or component == "." or component == ".."))
            throw DumpBridge::ConfigurationError("invalid bridge store key \"" + key + "\"!");
    }
}


LocalBridgeStore::LocalBridgeStore(const std::string &root_directory): root_directory_(root_directory) {
    while (root_directory_.length() > 1 and root_directory_.back() == '/')
        root_directory_.pop_back();
    if (unlikely(root_directory_.empty()))
        throw DumpBridge::ConfigurationError("local bridge store needs a non-empty directory!");
    if (unlikely(not FileUtil::MakeDirectory(root_directory_, /* recursive = */true)))
        throw DumpBridge::ConnectionError("can't create bridge store directory \"" + root_directory_ + "\"! ("
                                          + std::string(std::strerror(errno)) + ")");
}


void LocalBridgeStore::put(const std::string &key, const std::string &data,
                           const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    ValidateKey(key);
    DumpBridge::ThrowIfCancelled(cancellation_token);

    const std::string path(root_directory_ + "/" + key);
    if (unlikely(not FileUtil::MakeDirectory(FileUtil::GetDirname(path), /* recursive = */true)))
        throw DumpBridge::UploadError("can't create the directory for \"" + path + "\"! (" + std::string(std::strerror(errno)) + ")");
    if (unlikely(not FileUtil::WriteStringAtomically(path, data)))
        throw DumpBridge::UploadError("can't write \"" + path + "\"! (" + std::string(std::strerror(errno)) + ")");
}


void LocalBridgeStore::get(const std::string &key, const DataConsumer &consumer,
                           const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    ValidateKey(key);
    DumpBridge::ThrowIfCancelled(cancellation_token);

    const std::string path(root_directory_ + "/" + key);
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (input.fail()) {
        if (not FileUtil::Exists(path))
            throw DumpBridge::DownloadError("no such object: \"" + key + "\"!", /* transient = */false);
        throw DumpBridge::DownloadError("can't open \"" + path + "\"! (" + std::string(std::strerror(errno)) + ")");
    }

    char buffer[64 * 1024];
    while (input) {
        DumpBridge::ThrowIfCancelled(cancellation_token);
        input.read(buffer, sizeof buffer);
        if (input.gcount() > 0)
            consumer(buffer, static_cast<size_t>(input.gcount()));
    }
    if (unlikely(input.bad()))
        throw DumpBridge::DownloadError("read error on \"" + path + "\"!");
}


std::vector<std::string> LocalBridgeStore::list(const std::string &prefix,
                                                const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    DumpBridge::ThrowIfCancelled(cancellation_token);
    std::vector<std::string> all_keys;
    if (unlikely(not FileUtil::GetRegularFilesRecursively(root_directory_, &all_keys)))
        throw DumpBridge::DownloadError("can't list the contents of \"" + root_directory_ + "\"!");

    std::vector<std::string> matching_keys;
    for (const auto &key : all_keys) {
        if (StringUtil::StartsWith(key, prefix))
            matching_keys.emplace_back(key);
    }

    return matching_keys;
}


bool LocalBridgeStore::exists(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    ValidateKey(key);
    DumpBridge::ThrowIfCancelled(cancellation_token);

    const std::string path(root_directory_ + "/" + key);
    return FileUtil::Exists(path) and not FileUtil::IsDirectory(path);
}


void MemoryBridgeStore::put(const std::string &key, const std::string &data,
                            const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    ValidateKey(key);
    DumpBridge::ThrowIfCancelled(cancellation_token);

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    keys_to_objects_map_[key] = data;
}


void MemoryBridgeStore::get(const std::string &key, const DataConsumer &consumer,
                            const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    DumpBridge::ThrowIfCancelled(cancellation_token);
    std::string object;
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        const auto key_and_object(keys_to_objects_map_.find(key));
        if (key_and_object == keys_to_objects_map_.end())
            throw DumpBridge::DownloadError("no such object: \"" + key + "\"!", /* transient = */false);
        object = key_and_object->second;
    }

    consumer(object.data(), object.size());
}


std::vector<std::string> MemoryBridgeStore::list(const std::string &prefix,
                                                 const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    DumpBridge::ThrowIfCancelled(cancellation_token);
    std::vector<std::string> matching_keys;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    for (auto key_and_object(keys_to_objects_map_.lower_bound(prefix)); key_and_object != keys_to_objects_map_.end(); ++key_and_object) {
        if (not StringUtil::StartsWith(key_and_object->first, prefix))
            break;
        matching_keys.emplace_back(key_and_object->first);
    }

    return matching_keys;
}


bool MemoryBridgeStore::exists(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    DumpBridge::ThrowIfCancelled(cancellation_token);
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    return keys_to_objects_map_.find(key) != keys_to_objects_map_.end();
}


bool MemoryBridgeStore::remove(const std::string &key) {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    return keys_to_objects_map_.erase(key) == 1;
}
