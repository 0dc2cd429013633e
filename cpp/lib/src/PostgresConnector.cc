/** \file   PostgresConnector.cc
 *  \brief  Implementation of the PostgreSQL connectors.
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
#include "PostgresConnector.h"
#include <cerrno>
#include <cstring>
#include <libpq-fe.h>
#include "DumpBridgeErrors.h"
#include "StringUtil.h"
#include "util.h"


namespace {


std::string ResolveExecutable(const std::string &executable) {
    const std::string path(ExecUtil::Which(executable));
    if (unlikely(path.empty()))
        throw DumpBridge::ConfigurationError("can't find \"" + executable + "\" in the PATH!");
    return path;
}


std::string DescribeExitCode(const int exit_code) {
    if (exit_code > 128)
        return "was killed by signal " + std::to_string(exit_code - 128);
    return "exited w/ code " + std::to_string(exit_code);
}


} // unnamed namespace


PostgresConnectionParams::PostgresConnectionParams(const IniFile::Section &section)
    : connection_uri_(section.getString("connection_uri", "")), password_(section.getString("password", "")),
      pg_dump_path_(section.getString("pg_dump", "pg_dump")), psql_path_(section.getString("psql", "psql"))
{
    if (unlikely(connection_uri_.empty()))
        throw DumpBridge::ConfigurationError("missing \"connection_uri\" in section \"" + section.getSectionName() + "\"!");
    if (unlikely(not StringUtil::StartsWith(connection_uri_, "postgresql://") and not StringUtil::StartsWith(connection_uri_, "postgres://")))
        throw DumpBridge::ConfigurationError("\"connection_uri\" in section \"" + section.getSectionName()
                                             + "\" must start w/ \"postgresql://\" or \"postgres://\"!");
}


std::unordered_map<std::string, std::string> PostgresConnectionParams::getEnvironment() const {
    std::unordered_map<std::string, std::string> envs;
    if (not password_.empty())
        envs["PGPASSWORD"] = password_;
    return envs;
}


void CheckPostgresServer(const PostgresConnectionParams &params) {
    // With expand_dbname set, libpq parses "dbname" as a full connection URI.
    const char * const keywords[] = { "dbname", params.password_.empty() ? nullptr : "password", nullptr };
    const char * const values[] = { params.connection_uri_.c_str(), params.password_.c_str(), nullptr };

    switch (::PQpingParams(keywords, values, /* expand_dbname = */1)) {
    case PQPING_OK:
        break;
    case PQPING_REJECT:
        throw DumpBridge::ConnectionError("PostgreSQL server is not accepting connections", /* transient = */true);
    case PQPING_NO_RESPONSE:
        throw DumpBridge::ConnectionError("PostgreSQL server could not be reached", /* transient = */true);
    case PQPING_NO_ATTEMPT:
        throw DumpBridge::ConfigurationError("invalid PostgreSQL connection parameters");
    }

    PGconn * const pg_conn(::PQconnectdbParams(keywords, values, /* expand_dbname = */1));
    if (unlikely(pg_conn == nullptr))
        throw DumpBridge::ConnectionError("PQconnectdbParams failed to allocate a connection!", /* transient = */true);
    if (::PQstatus(pg_conn) != CONNECTION_OK) {
        const std::string error_message(StringUtil::Trim(::PQerrorMessage(pg_conn)));
        ::PQfinish(pg_conn);
        throw DumpBridge::ConnectionError("can't connect to PostgreSQL: " + error_message);
    }
    ::PQfinish(pg_conn);
}


void PostgresSourceConnector::open(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    close();
    CheckPostgresServer(params_);

    cancellation_token_ = cancellation_token;
    try {
        pg_dump_.reset(new ExecUtil::PipedChild(ResolveExecutable(params_.pg_dump_path_),
                                                { "--format=plain", "--clean", "--if-exists", "--no-password",
                                                  "--dbname=" + params_.connection_uri_ },
                                                ExecUtil::PipedChild::READ_FROM_CHILD, params_.getEnvironment()));
    } catch (const DumpBridge::Error &) {
        throw;
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ConnectionError("can't start pg_dump: " + std::string(x.what()));
    }

    ExecUtil::PipedChild * const pg_dump(pg_dump_.get());
    cancellation_callback_.reset(new ThreadUtil::ScopedCancellationCallback(cancellation_token, [pg_dump]() { pg_dump->kill(); }));
}


size_t PostgresSourceConnector::read(char * const buffer, const size_t buffer_size) {
    if (unlikely(pg_dump_ == nullptr))
        throw DumpBridge::StreamInterruptedError("read from pg_dump w/o a prior open!");

    const ssize_t bytes_read(pg_dump_->read(buffer, buffer_size));
    if (unlikely(bytes_read == -1))
        throw DumpBridge::StreamInterruptedError("read from pg_dump failed! (" + std::string(std::strerror(errno)) + ")");
    if (bytes_read > 0)
        return static_cast<size_t>(bytes_read);

    // End of output, only a zero exit code makes it a clean end of the stream:
    const int exit_code(pg_dump_->wait());
    DumpBridge::ThrowIfCancelled(cancellation_token_);
    if (unlikely(exit_code != 0))
        throw DumpBridge::StreamInterruptedError("pg_dump " + DescribeExitCode(exit_code) + "!");

    return 0;
}


void PostgresSourceConnector::close() {
    cancellation_callback_.reset();
    pg_dump_.reset(); // Kills and reaps an unfinished pg_dump.
    cancellation_token_.reset();
}


void PostgresDestinationConnector::open(const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token) {
    abort();
    CheckPostgresServer(params_);

    cancellation_token_ = cancellation_token;
    try {
        psql_.reset(new ExecUtil::PipedChild(ResolveExecutable(params_.psql_path_),
                                             { "--no-psqlrc", "--quiet", "--no-password", "--set", "ON_ERROR_STOP=1",
                                               "--output=/dev/null", "--dbname=" + params_.connection_uri_ },
                                             ExecUtil::PipedChild::WRITE_TO_CHILD, params_.getEnvironment()));
    } catch (const DumpBridge::Error &) {
        throw;
    } catch (const std::runtime_error &x) {
        throw DumpBridge::ConnectionError("can't start psql: " + std::string(x.what()));
    }

    ExecUtil::PipedChild * const psql(psql_.get());
    cancellation_callback_.reset(new ThreadUtil::ScopedCancellationCallback(cancellation_token, [psql]() { psql->kill(); }));
}


void PostgresDestinationConnector::write(const char * const data, const size_t data_size) {
    if (unlikely(psql_ == nullptr))
        throw DumpBridge::ConnectionError("write to psql w/o a prior open!");
    DumpBridge::ThrowIfCancelled(cancellation_token_);

    if (unlikely(not psql_->write(data, data_size))) {
        const std::string error_message(std::strerror(errno));
        const int exit_code(psql_->wait());
        throw DumpBridge::ConnectionError("psql stopped accepting input (" + error_message + ") and " + DescribeExitCode(exit_code) + "!");
    }
}


void PostgresDestinationConnector::close() {
    if (unlikely(psql_ == nullptr))
        throw DumpBridge::ConnectionError("close of psql w/o a prior open!");

    const int exit_code(psql_->wait());
    cancellation_callback_.reset();
    psql_.reset();
    cancellation_token_.reset();
    if (unlikely(exit_code != 0))
        throw DumpBridge::ConnectionError("psql " + DescribeExitCode(exit_code) + "!");
}


void PostgresDestinationConnector::abort() {
    cancellation_callback_.reset();
    psql_.reset(); // Kills and reaps a running psql.
    cancellation_token_.reset();
}
