#include "formupload/client/chunk_scheduler.hpp"

#include <algorithm>
#include <stdexcept>

namespace formupload::client
{

    ChunkScheduler::ChunkScheduler(std::shared_ptr<TransferContext> context, std::shared_ptr<FileState> state)
        : context_(std::move(context)), state_(std::move(state)),
          pool_(std::make_shared<TaskPool>(context_->options.concurrency)) {}

    std::vector<std::uint32_t> ChunkScheduler::pending_parts() const
    {
        std::vector<std::uint32_t> pending;
        for (std::uint32_t index = 0; index < state_->total_chunks; ++index)
        {
            if (index >= state_->part_confirmations.size() || !state_->part_confirmations[index])
            {
                pending.push_back(index);
            }
        }
        return pending;
    }

    void ChunkScheduler::run(DrainedHandler on_drained)
    {
        state_->part_confirmations.resize(state_->total_chunks);
        auto self = shared_from_this();
        for (const auto chunk_index : pending_parts())
        {
            pool_->push([self, chunk_index](TaskPool::Done done)
                        { self->transfer_part(chunk_index, std::move(done)); });
        }
        pool_->run([self, on_drained = std::move(on_drained)](std::optional<TransferError> error)
                   { on_drained(std::move(error)); });
    }

    void ChunkScheduler::transfer_part(std::uint32_t chunk_index, TaskPool::Done done)
    {
        if (state_->detached)
        {
            done(TransferError{formupload::ErrorCode::Superseded, "File was replaced."});
            return;
        }

        auto detail = context_->describe(*state_);
        detail["chunkIndex"] = chunk_index;
        detail["totalChunks"] = state_->total_chunks;
        context_->reporter.emit_info("upload.chunk.start", detail);
        state_->in_flight[chunk_index] = 0.0;
        context_->publish(*state_);

        if (chunk_index >= state_->part_urls.size() || state_->part_urls[chunk_index].empty())
        {
            done(TransferError{formupload::ErrorCode::ProtocolError, "Missing part URL."});
            return;
        }

        auto bytes = read_chunk(chunk_index);
        if (!bytes)
        {
            done(TransferError{formupload::ErrorCode::MissingChunkData, "Missing chunk data."});
            return;
        }

        HttpRequest request;
        request.method = "PUT";
        request.url = state_->part_urls[chunk_index];
        request.headers.emplace_back("Content-Type", "application/octet-stream");
        request.body.assign(reinterpret_cast<const char *>(bytes->data()), bytes->size());
        bytes.reset();

        auto self = shared_from_this();
        context_->transport.async_send(
            std::move(request),
            [self, chunk_index](std::uint64_t sent, std::uint64_t total)
            {
                auto &state = *self->state_;
                if (state.detached || total == 0)
                {
                    return;
                }
                // Never let a late callback move the fraction backwards.
                auto &fraction = state.in_flight[chunk_index];
                fraction = std::max(fraction, static_cast<double>(sent) / static_cast<double>(total));
                auto progress = self->context_->describe(state);
                progress["chunkIndex"] = chunk_index;
                progress["loaded"] = sent;
                progress["total"] = total;
                self->context_->reporter.emit_info("upload.chunk.progress", std::move(progress));
                self->context_->publish(state);
            },
            [self, chunk_index, done = std::move(done)](std::error_code ec, HttpResponse response)
            {
                auto &state = *self->state_;
                if (state.detached)
                {
                    done(TransferError{formupload::ErrorCode::Superseded, "File was replaced."});
                    return;
                }
                if (ec)
                {
                    done(TransferError{formupload::ErrorCode::TransferFailed,
                                       "Chunk upload network error: " + describe_error(ec)});
                    return;
                }
                if (!response.ok())
                {
                    done(TransferError{formupload::ErrorCode::HttpStatus,
                                       "Chunk upload failed: " + std::to_string(response.status)});
                    return;
                }

                const auto part_number = chunk_index + 1;
                auto token = response.header(protocol::kConfirmationHeader);
                if (!token || token->empty())
                {
                    token = protocol::synthesized_confirmation(part_number);
                }
                state.part_confirmations[chunk_index] = std::move(token);
                state.in_flight.erase(chunk_index);
                state.uploaded_chunks = std::min(state.total_chunks, state.uploaded_chunks + 1);
                self->context_->publish(state);
                self->context_->persist(state, "Failed to update upload progress in storage; continuing in-memory.");
                self->context_->prune_chunk(state, chunk_index);

                auto detail = self->context_->describe(state);
                detail["chunkIndex"] = chunk_index;
                self->context_->reporter.emit_info("upload.chunk.complete", std::move(detail));
                done(std::nullopt);
            });
    }

    std::optional<std::vector<std::byte>> ChunkScheduler::read_chunk(std::uint32_t chunk_index)
    {
        try
        {
            if (auto stored = context_->store.get_chunk(context_->chunk_key(*state_, chunk_index)))
            {
                return stored;
            }
        }
        catch (const StoreError &ex)
        {
            auto detail = context_->describe(*state_);
            detail["chunkIndex"] = chunk_index;
            detail["error"] = ex.what();
            context_->reporter.emit_error("Failed to read stored chunk; using source slice fallback.", std::move(detail));
        }

        if (!state_->source)
        {
            return std::nullopt;
        }
        const auto offset = static_cast<std::uint64_t>(chunk_index) * state_->chunk_size;
        if (offset > state_->size)
        {
            return std::nullopt;
        }
        const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(state_->chunk_size, state_->size - offset));
        try
        {
            return state_->source->read(offset, length);
        }
        catch (const std::runtime_error &ex)
        {
            auto detail = context_->describe(*state_);
            detail["chunkIndex"] = chunk_index;
            detail["error"] = ex.what();
            context_->reporter.emit_error("Failed to read chunk from source.", std::move(detail));
            return std::nullopt;
        }
    }

} // namespace formupload::client
