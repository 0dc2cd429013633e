/** \file   DumpPipeline.h
 *  \brief  Turns the output of a source connector into chunks and a manifest in a bridge store.
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


/** \class  DumpPipeline
 *  \brief  Reads a source in slices of at most chunk_size_ bytes on one thread while the calling thread encodes and uploads
 *          them.  The two are connected by a queue of queue_depth_ slices so memory use doesn't depend on the size of
 *          the dump.
 *  \note   The manifest is written only after every chunk it lists has been stored, so it is the single visibility point
 *          of the artifact.  After a failure a manifest w/ status "failed" is written, if possible, for diagnostics.
 */
class DumpPipeline {
    BridgeStore * const bridge_store_;
    const PipelineOptions options_;
public:
    DumpPipeline(BridgeStore * const bridge_store, const PipelineOptions &options): bridge_store_(bridge_store), options_(options) { }

    /** \brief  Dumps "source" as a new artifact of "job_name".
     *  \param  cancellation_token  May be null.
     *  \return The complete manifest.
     *  \throws DumpBridge::Error for anything that went wrong, DumpBridge::CancelledError if "cancellation_token" fired.
     */
    Manifest run(const std::string &job_name, SourceConnector * const source,
                 const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token);
};
