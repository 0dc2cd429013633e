/** \file   S3BridgeStore.h
 *  \brief  A bridge store backed by an S3-compatible object storage service.
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


#include <string>
#include <vector>
#include <curl/curl.h>
#include "BridgeStore.h"
#include "IniFile.h"


/** \class  S3BridgeStore
 *  \brief  Talks to S3 or a compatible service (MinIO, Ceph RGW, ...) via libcurl w/ AWS Signature Version 4.
 *  \note   Objects are addressed path-style, i.e. as <endpoint>/<bucket>/<key>.  Every request uses its own easy
 *          handle so that a single instance can be shared between threads.
 */
class S3BridgeStore : public BridgeStore {
public:
    static constexpr unsigned DEFAULT_CONNECT_TIMEOUT = 10000; // In ms.
    static constexpr unsigned DEFAULT_STALL_TIMEOUT = 60;      // In s.

    struct Params {
        std::string bucket_;
        std::string region_;
        std::string endpoint_; // Scheme, host and optional port, e.g. "https://s3.eu-central-1.amazonaws.com".
        std::string access_key_id_;
        std::string secret_access_key_;
        unsigned connect_timeout_; // In ms.
        unsigned stall_timeout_;   // A transfer that moves less than 1 byte/s for this many seconds is aborted.
    public:
        Params() = default;

        /** \throws std::runtime_error if a required entry is missing. */
        explicit Params(const IniFile::Section &section);
    };

private:
    const Params params_;

public:
    explicit S3BridgeStore(const Params &params);

    std::string getType() const override { return "s3"; }
    void put(const std::string &key, const std::string &data,
             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    void get(const std::string &key, const DataConsumer &consumer,
             const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    std::vector<std::string> list(const std::string &prefix,
                                  const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;
    bool exists(const std::string &key, const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token = nullptr) override;

    /** \brief  Extracts the object keys and, if the listing was truncated, the continuation token from a ListObjectsV2
     *          response.
     *  \return False if "response" doesn't look like a ListBucketResult.
     */
    static bool ParseListResponse(const std::string &response, std::vector<std::string> * const keys,
                                  std::string * const continuation_token);

private:
    std::string getObjectUrl(const std::string &key) const;
};
