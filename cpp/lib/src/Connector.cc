/** \file   Connector.cc
 *  \brief  The connector registries.
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
#include "Connector.h"
#include <map>
#include <mutex>
#include "DumpBridgeErrors.h"
#include "FileConnector.h"
#include "PostgresConnector.h"
#include "util.h"


namespace {


std::mutex factories_mutex;


std::map<std::string, SourceConnector::Factory> &GetSourceFactories() {
    static std::map<std::string, SourceConnector::Factory> types_to_factories_map{
        { "file", [](const IniFile::Section &section) -> std::unique_ptr<SourceConnector> {
              return std::unique_ptr<SourceConnector>(new FileSourceConnector(section.getString("path")));
          } },
        { "postgres", [](const IniFile::Section &section) -> std::unique_ptr<SourceConnector> {
              return std::unique_ptr<SourceConnector>(new PostgresSourceConnector(PostgresConnectionParams(section)));
          } },
    };

    return types_to_factories_map;
}


std::map<std::string, DestinationConnector::Factory> &GetDestinationFactories() {
    static std::map<std::string, DestinationConnector::Factory> types_to_factories_map{
        { "file", [](const IniFile::Section &section) -> std::unique_ptr<DestinationConnector> {
              return std::unique_ptr<DestinationConnector>(new FileDestinationConnector(section.getString("path")));
          } },
        { "postgres", [](const IniFile::Section &section) -> std::unique_ptr<DestinationConnector> {
              return std::unique_ptr<DestinationConnector>(new PostgresDestinationConnector(PostgresConnectionParams(section)));
          } },
    };

    return types_to_factories_map;
}


// Shared by both roles.  "role" is only used in error messages.
template <typename ConnectorType>
std::unique_ptr<ConnectorType> CreateConnector(const std::string &role,
                                               const std::map<std::string, typename ConnectorType::Factory> &types_to_factories_map,
                                               const IniFile::Section &section)
{
    const std::string type(section.getString("type", ""));
    if (unlikely(type.empty()))
        throw DumpBridge::ConfigurationError("missing \"type\" in section \"" + section.getSectionName() + "\"!");

    typename ConnectorType::Factory factory;
    {
        std::lock_guard<std::mutex> mutex_locker(factories_mutex);
        const auto type_and_factory(types_to_factories_map.find(type));
        if (unlikely(type_and_factory == types_to_factories_map.end()))
            throw DumpBridge::ConfigurationError("unknown " + role + " connector type \"" + type + "\" in section \""
                                                 + section.getSectionName() + "\"!");
        factory = type_and_factory->second;
    }

    try {
        return factory(section);
    } catch (const DumpBridge::Error &) {
        throw;
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ConfigurationError("bad " + role + " configuration in section \"" + section.getSectionName() + "\": "
                                             + std::string(x.what()));
    }
}


} // unnamed namespace


void SourceConnector::RegisterFactory(const std::string &type, const Factory &factory) {
    std::lock_guard<std::mutex> mutex_locker(factories_mutex);
    GetSourceFactories()[type] = factory;
}


std::unique_ptr<SourceConnector> SourceConnector::Create(const IniFile::Section &section) {
    return CreateConnector<SourceConnector>("source", GetSourceFactories(), section);
}


void DestinationConnector::RegisterFactory(const std::string &type, const Factory &factory) {
    std::lock_guard<std::mutex> mutex_locker(factories_mutex);
    GetDestinationFactories()[type] = factory;
}


std::unique_ptr<DestinationConnector> DestinationConnector::Create(const IniFile::Section &section) {
    return CreateConnector<DestinationConnector>("destination", GetDestinationFactories(), section);
}
