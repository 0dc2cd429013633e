/** \file   RestorePipeline.cc
 *  \brief  Implementation of the restore pipeline.
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
#include "RestorePipeline.h"
#include <exception>
#include <thread>
#include "SharedBuffer.h"
#include "util.h"


namespace {


void FetchChunks(BridgeStore * const bridge_store, const Manifest &manifest, const DumpBridge::RetryPolicy &retry_policy,
                 const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token, SharedBuffer<std::string> * const raw_chunks,
                 std::exception_ptr * const fetcher_exception)
{
    try {
        ChunkCodec::Decoder decoder(manifest.compression_);
        for (const auto &descriptor : manifest.chunks_) {
            DumpBridge::ThrowIfCancelled(cancellation_token);
            const std::string stored_bytes(DumpBridge::WithRetries(retry_policy, "download of chunk " + std::to_string(descriptor.sequence_number_),
                                                                   cancellation_token,
                                                                   [bridge_store, &descriptor, &cancellation_token]() {
                                                                       return bridge_store->getString(descriptor.key_, cancellation_token);
                                                                   }));
            std::string raw_bytes(decoder.decode(descriptor, stored_bytes));
            LOG_DEBUG("verified chunk " + std::to_string(descriptor.sequence_number_));
            if (not raw_chunks->push_back(std::move(raw_bytes)))
                return; // The writer gave up.
        }

        decoder.verifyStream(manifest.total_length_, manifest.checksum_);
        raw_chunks->close();
    } catch (...) {
        *fetcher_exception = std::current_exception();
        raw_chunks->abort();
    }
}


} // unnamed namespace


Manifest RestorePipeline::selectManifest(const std::string &source_job_name, const std::string &manifest_id,
                                         const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    Manifest manifest;
    if (manifest_id.empty()) {
        const bool found(DumpBridge::WithRetries(options_.retry_policy_, "selection of the latest manifest of \"" + source_job_name + "\"",
                                                 cancellation_token, [this, &source_job_name, &manifest, &cancellation_token]() {
                                                     return Manifest::SelectLatestComplete(bridge_store_, source_job_name, &manifest,
                                                                                           cancellation_token);
                                                 }));
        if (unlikely(not found))
            throw DumpBridge::DownloadError("there is no complete manifest for \"" + source_job_name + "\"!", /* transient = */false);
        return manifest;
    }

    manifest = DumpBridge::WithRetries(options_.retry_policy_, "download of manifest " + manifest_id, cancellation_token,
                                       [this, &source_job_name, &manifest_id, &cancellation_token]() {
                                           return Manifest::Load(bridge_store_, source_job_name, manifest_id, cancellation_token);
                                       });
    if (unlikely(not manifest.isComplete()))
        throw DumpBridge::DownloadError("manifest " + manifest_id + " of \"" + source_job_name + "\" is "
                                        + Manifest::StatusToString(manifest.status_) + " and can't be restored!", /* transient = */false);

    return manifest;
}


Manifest RestorePipeline::run(const std::string &source_job_name, const std::string &manifest_id, DestinationConnector * const destination,
                              const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    const std::shared_ptr<ThreadUtil::CancellationToken> run_token(std::make_shared<ThreadUtil::CancellationToken>());
    ThreadUtil::ScopedCancellationCallback cancellation_forwarder(cancellation_token, [run_token]() { run_token->cancel(); });

    const Manifest manifest(selectManifest(source_job_name, manifest_id, run_token));
    LOG_INFO("restoring manifest " + manifest.id_ + " of \"" + source_job_name + "\" (" + std::to_string(manifest.chunks_.size())
             + " chunk(s), " + std::to_string(manifest.total_length_) + " bytes)");

    DumpBridge::WithRetries(options_.retry_policy_, "opening " + destination->getType() + " destination", run_token,
                            [destination, &run_token]() { destination->open(run_token); });

    SharedBuffer<std::string> raw_chunks(options_.queue_depth_);
    std::exception_ptr fetcher_exception;
    std::thread fetcher(FetchChunks, bridge_store_, std::cref(manifest), std::cref(options_.retry_policy_), run_token, &raw_chunks,
                        &fetcher_exception);

    try {
        std::string raw_bytes;
        while (raw_chunks.pop_front(&raw_bytes)) {
            DumpBridge::ThrowIfCancelled(run_token);
            destination->write(raw_bytes.data(), raw_bytes.size());
        }

        fetcher.join();
        if (fetcher_exception != nullptr)
            std::rethrow_exception(fetcher_exception);
        DumpBridge::ThrowIfCancelled(run_token);

        destination->close();
    } catch (const std::exception &x) {
        run_token->cancel();
        raw_chunks.abort();
        if (fetcher.joinable())
            fetcher.join();
        destination->abort();
        LOG_WARNING("restore of manifest " + manifest.id_ + " failed: " + std::string(x.what()));
        throw;
    }

    LOG_INFO("restored manifest " + manifest.id_ + " of \"" + source_job_name + "\"");
    return manifest;
}
