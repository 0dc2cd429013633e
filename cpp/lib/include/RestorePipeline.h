/** \file   RestorePipeline.h
 *  \brief  Applies an artifact from a bridge store to a destination connector.
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
#include "BridgeStore.h"
#include "Connector.h"
#include "Manifest.h"
#include "PipelineOptions.h"
#include "ThreadUtil.h"


class RestorePipeline {
    BridgeStore * const bridge_store_;
    const PipelineOptions options_;
public:
    RestorePipeline(BridgeStore * const bridge_store, const PipelineOptions &options): bridge_store_(bridge_store), options_(options) { }

    /** \brief  Restores an artifact of "source_job_name" into "destination".
     *  \param  manifest_id         If empty, the most recent complete manifest is used.
     *  \param  cancellation_token  May be null.
     *  \return The restored manifest.
     *  \note   Chunks are fetched and verified on a separate thread, strictly in sequence order.  No byte of a chunk is
     *          handed to "destination" before its checksum has been verified and the destination is only closed,
     *          i.e. told to commit, after the checksum of the whole stream has been verified as well.
     *  \throws DumpBridge::DownloadError if there is no eligible manifest, DumpBridge::IntegrityError,
     *          DumpBridge::ManifestCorruptError and whatever else can go wrong.
     */
    Manifest run(const std::string &source_job_name, const std::string &manifest_id, DestinationConnector * const destination,
                 const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token);

    /** \brief  Picks the manifest that run() would restore.
     *  \throws DumpBridge::DownloadError if there is none or the pinned one isn't complete.
     */
    Manifest selectManifest(const std::string &source_job_name, const std::string &manifest_id,
                            const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token);
};
