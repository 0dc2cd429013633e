/** \file   DumpPipeline.cc
 *  \brief  Implementation of the dump pipeline.
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
#include "DumpPipeline.h"
#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <ctime>
#include "SharedBuffer.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


// Manifest IDs sort by creation time, so no two runs in this process may share a timestamp, not even if the clock steps back.
uint64_t NextCreationTime() {
    static std::mutex mutex;
    static uint64_t last_creation_time(0);

    std::lock_guard<std::mutex> mutex_locker(mutex);
    last_creation_time = std::max(TimeUtil::GetCurrentTimeInMicroseconds(), last_creation_time + 1);
    return last_creation_time;
}


// Fills "slice" w/ up to "chunk_size" bytes.  An empty slice means the source is exhausted.
void ReadSlice(SourceConnector * const source, const size_t chunk_size, std::string * const slice) {
    slice->resize(chunk_size);
    size_t filled(0);
    while (filled < chunk_size) {
        const size_t bytes_read(source->read(&(*slice)[filled], chunk_size - filled));
        if (bytes_read == 0)
            break;
        filled += bytes_read;
    }
    slice->resize(filled);
}


void ProduceSlices(SourceConnector * const source, const size_t chunk_size, SharedBuffer<std::string> * const slices,
                   std::exception_ptr * const producer_exception)
{
    try {
        for (;;) {
            std::string slice;
            ReadSlice(source, chunk_size, &slice);
            if (slice.empty()) {
                slices->close();
                return;
            }
            if (not slices->push_back(std::move(slice)))
                return; // The consumer gave up.
        }
    } catch (...) {
        *producer_exception = std::current_exception();
        slices->abort();
    }
}


} // unnamed namespace


Manifest DumpPipeline::run(const std::string &job_name, SourceConnector * const source,
                           const std::shared_ptr<ThreadUtil::CancellationToken> &cancellation_token)
{
    // Our own token lets us stop a blocked source when the upload side fails.
    const std::shared_ptr<ThreadUtil::CancellationToken> run_token(std::make_shared<ThreadUtil::CancellationToken>());
    ThreadUtil::ScopedCancellationCallback cancellation_forwarder(cancellation_token, [run_token]() { run_token->cancel(); });

    DumpBridge::WithRetries(options_.retry_policy_, "opening " + source->getType() + " source for \"" + job_name + "\"", run_token,
                            [source, &run_token]() { source->open(run_token); });

    const uint64_t creation_time(NextCreationTime());
    Manifest manifest(job_name, static_cast<time_t>(creation_time / 1000000u), options_.compression_, options_.chunk_size_,
                      static_cast<unsigned>(creation_time % 1000000u));
    LOG_INFO("dumping \"" + job_name + "\" as manifest " + manifest.id_);

    SharedBuffer<std::string> slices(options_.queue_depth_);
    std::exception_ptr producer_exception;
    std::thread producer(ProduceSlices, source, options_.chunk_size_, &slices, &producer_exception);

    bool manifest_upload_attempted(false);
    try {
        ChunkCodec::Encoder encoder(job_name, manifest.id_, options_.compression_);
        std::string slice;
        while (slices.pop_front(&slice)) {
            DumpBridge::ThrowIfCancelled(run_token);
            const ChunkCodec::Chunk chunk(encoder.encode(slice));
            DumpBridge::WithRetries(options_.retry_policy_, "upload of chunk " + std::to_string(chunk.descriptor_.sequence_number_),
                                    run_token, [this, &chunk, &run_token]() {
                                        bridge_store_->put(chunk.descriptor_.key_, chunk.stored_bytes_, run_token);
                                    });
            manifest.chunks_.emplace_back(chunk.descriptor_);
            LOG_DEBUG("stored chunk " + std::to_string(chunk.descriptor_.sequence_number_) + " (" + std::to_string(chunk.descriptor_.length_)
                      + " bytes)");
        }

        producer.join();
        source->close();
        if (producer_exception != nullptr)
            std::rethrow_exception(producer_exception);
        DumpBridge::ThrowIfCancelled(run_token);

        manifest.total_length_ = encoder.getTotalLength();
        manifest.checksum_     = encoder.finaliseStreamChecksum();
        manifest.status_       = Manifest::COMPLETE;
        manifest_upload_attempted = true;
        DumpBridge::WithRetries(options_.retry_policy_, "upload of manifest " + manifest.id_, run_token,
                                [this, &manifest, &run_token]() { Manifest::Store(bridge_store_, manifest, run_token); });
    } catch (const std::exception &x) {
        run_token->cancel();
        slices.abort();
        if (producer.joinable())
            producer.join();
        source->close();

        // Don't risk replacing a complete manifest that may have landed despite the error we got.
        if (cancellation_token != nullptr and cancellation_token->isCancelled())
            LOG_INFO("run of \"" + job_name + "\" was cancelled, not storing manifest " + manifest.id_);
        else if (not manifest_upload_attempted) {
            manifest.status_         = Manifest::FAILED;
            manifest.failure_reason_ = x.what();
            manifest.checksum_.clear();
            manifest.total_length_ = 0;
            for (const auto &chunk : manifest.chunks_)
                manifest.total_length_ += chunk.length_;
            try {
                Manifest::Store(bridge_store_, manifest);
            } catch (const std::runtime_error &store_error) {
                LOG_WARNING("can't store failed manifest " + manifest.id_ + ": " + std::string(store_error.what()));
            }
        }
        throw;
    }

    LOG_INFO("dumped \"" + job_name + "\": " + std::to_string(manifest.total_length_) + " bytes in " + std::to_string(manifest.chunks_.size())
             + " chunk(s) as manifest " + manifest.id_);
    return manifest;
}
