#include "formupload/client/staged_adapter.hpp"

#include <algorithm>
#include <map>

#include "formupload/client/chunk_scheduler.hpp"

namespace formupload::client
{

    namespace
    {
        HttpRequest json_post(std::string url, const nlohmann::json &body)
        {
            HttpRequest request;
            request.method = "POST";
            request.url = std::move(url);
            request.headers.emplace_back("Content-Type", "application/json");
            request.body = protocol::dump_json(body);
            return request;
        }

        bool has_init_metadata(const FileState &state)
        {
            return state.staging_handle && state.part_urls.size() == state.total_chunks &&
                   std::none_of(state.part_urls.begin(), state.part_urls.end(), [](const std::string &url)
                                { return url.empty(); });
        }

    } // namespace

    StagedAdapter::StagedAdapter(std::shared_ptr<TransferContext> context)
        : context_(std::move(context)) {}

    void StagedAdapter::start(std::shared_ptr<FileState> state, TransferCompletion on_complete)
    {
        if (state->file_id)
        {
            asio::post(context_->io_context, [on_complete = std::move(on_complete), id = *state->file_id]()
                       { on_complete(id); });
            return;
        }

        Job job{std::move(state), std::move(on_complete)};
        if (has_init_metadata(*job.state))
        {
            transfer_parts(std::move(job));
            return;
        }
        request_init(std::move(job));
    }

    void StagedAdapter::request_init(Job job)
    {
        init_batch_.push_back(std::move(job));
        if (init_scheduled_)
        {
            return;
        }
        init_scheduled_ = true;
        auto self = shared_from_this();
        asio::post(context_->io_context, [self]()
                   { self->flush_init(); });
    }

    void StagedAdapter::flush_init()
    {
        init_scheduled_ = false;
        std::vector<Job> batch;
        batch.swap(init_batch_);
        batch.erase(std::remove_if(batch.begin(), batch.end(), [](const Job &job)
                                   { return job.state->detached; }),
                    batch.end());
        if (batch.empty())
        {
            return;
        }

        protocol::InitRequest request;
        for (const auto &job : batch)
        {
            const auto &state = *job.state;
            request.files.push_back(protocol::InitFile{state.input_name, state.file_name, state.size, state.mime,
                                                       state.total_chunks});
        }

        auto self = shared_from_this();
        context_->transport.async_send(
            json_post(context_->endpoint_url + std::string(protocol::kInitPath), nlohmann::json(request)), nullptr,
            [self, batch = std::move(batch)](std::error_code ec, HttpResponse response) mutable
            { self->on_init_response(std::move(batch), ec, response); });
    }

    void StagedAdapter::on_init_response(std::vector<Job> batch, const std::error_code &ec,
                                         const HttpResponse &response)
    {
        if (ec)
        {
            fail_all(batch, formupload::ErrorCode::TransferFailed, "Staged init network error: " + describe_error(ec));
            return;
        }
        if (!response.ok())
        {
            fail_all(batch, formupload::ErrorCode::HttpStatus,
                     "Staged init failed: " + std::to_string(response.status));
            return;
        }
        auto decoded = protocol::decode_init_response(response.body);
        if (const auto *error = std::get_if<protocol::ProtocolError>(&decoded))
        {
            fail_all(batch, formupload::ErrorCode::ProtocolError, error->message);
            return;
        }
        const auto &uploads = std::get<protocol::InitResponse>(decoded).uploads;

        // The n-th file of an input takes the n-th upload entry of that input.
        std::map<std::string, std::size_t> seen;
        for (auto &job : batch)
        {
            if (job.state->detached)
            {
                continue;
            }
            const auto ordinal = seen[job.state->input_name]++;
            std::size_t matched = 0;
            const protocol::InitUpload *upload = nullptr;
            for (const auto &candidate : uploads)
            {
                if (candidate.input_name == job.state->input_name && matched++ == ordinal)
                {
                    upload = &candidate;
                    break;
                }
            }
            if (upload == nullptr)
            {
                fail(job, formupload::ErrorCode::ProtocolError, "Staged init missing upload metadata.");
                continue;
            }
            if (upload->parts.size() != job.state->total_chunks)
            {
                fail(job, formupload::ErrorCode::ProtocolError, "Staged init returned mismatched part count.");
                continue;
            }
            apply_init(job, *upload);
            transfer_parts(std::move(job));
        }
    }

    void StagedAdapter::apply_init(Job &job, const protocol::InitUpload &upload)
    {
        auto &state = *job.state;
        state.staging_handle = upload.staging_handle;
        state.remote_path = upload.path ? *upload.path : synthesized_path(protocol::TransferMode::Staged, state);
        state.part_urls.clear();
        for (const auto &part : upload.parts)
        {
            state.part_urls.push_back(part.url);
        }
        state.part_confirmations.assign(state.total_chunks, std::nullopt);
        context_->persist(state, "Failed to persist staged init metadata; continuing in-memory.");
    }

    void StagedAdapter::transfer_parts(Job job)
    {
        auto &state = *job.state;
        state.status = FileStatus::Uploading;
        context_->publish(state);
        context_->persist(state, "Failed to persist upload state; continuing in-memory.");
        auto detail = context_->describe(state);
        detail["status"] = to_string(state.status);
        context_->reporter.emit_info("upload.status", std::move(detail));

        auto scheduler = std::make_shared<ChunkScheduler>(context_, job.state);
        auto self = shared_from_this();
        scheduler->run([self, job = std::move(job)](std::optional<TransferError> error) mutable
                       {
                           if (error)
                           {
                               self->fail(job, error->code, error->message);
                               return;
                           }
                           if (job.state->uploaded_chunks < job.state->total_chunks)
                           {
                               self->fail(job, formupload::ErrorCode::InternalError, "Parts drained without confirmation.");
                               return;
                           }
                           self->request_complete(std::move(job)); });
    }

    void StagedAdapter::request_complete(Job job)
    {
        complete_batch_.push_back(std::move(job));
        if (complete_scheduled_)
        {
            return;
        }
        complete_scheduled_ = true;
        auto self = shared_from_this();
        asio::post(context_->io_context, [self]()
                   { self->flush_complete(); });
    }

    void StagedAdapter::flush_complete()
    {
        complete_scheduled_ = false;
        std::vector<Job> candidates;
        candidates.swap(complete_batch_);

        std::vector<Job> batch;
        protocol::CompleteRequest request;
        for (auto &job : candidates)
        {
            auto &state = *job.state;
            if (state.detached)
            {
                continue;
            }
            protocol::CompleteUpload upload;
            upload.input_name = state.input_name;
            upload.staging_handle = state.staging_handle.value_or("");
            upload.path = state.remote_path.value_or(synthesized_path(protocol::TransferMode::Staged, state));
            bool complete = state.staging_handle.has_value() && state.part_confirmations.size() == state.total_chunks;
            for (std::uint32_t index = 0; complete && index < state.total_chunks; ++index)
            {
                if (!state.part_confirmations[index])
                {
                    complete = false;
                    break;
                }
                upload.parts.push_back(protocol::PartConfirmation{index + 1, *state.part_confirmations[index]});
            }
            if (!complete)
            {
                fail(job, formupload::ErrorCode::ProtocolError, "Missing part confirmation token.");
                continue;
            }
            state.status = FileStatus::Finalizing;
            context_->publish(state);
            context_->persist(state, "Failed to persist upload state before finalize; continuing.");
            request.uploads.push_back(std::move(upload));
            batch.push_back(std::move(job));
        }
        if (batch.empty())
        {
            return;
        }

        context_->reporter.emit_info("upload.finalize.start",
                                     {{"sessionId", context_->session_id}, {"files", batch.size()}});
        auto self = shared_from_this();
        context_->transport.async_send(
            json_post(context_->endpoint_url + std::string(protocol::kCompletePath), nlohmann::json(request)), nullptr,
            [self, batch = std::move(batch)](std::error_code ec, HttpResponse response) mutable
            { self->on_complete_response(std::move(batch), ec, response); });
    }

    void StagedAdapter::on_complete_response(std::vector<Job> batch, const std::error_code &ec,
                                             const HttpResponse &response)
    {
        if (ec)
        {
            fail_all(batch, formupload::ErrorCode::TransferFailed,
                     "Staged finalize network error: " + describe_error(ec));
            return;
        }
        if (!response.ok())
        {
            fail_all(batch, formupload::ErrorCode::HttpStatus,
                     "Staged finalize failed: " + std::to_string(response.status));
            return;
        }
        auto decoded = protocol::decode_complete_response(response.body);
        if (const auto *error = std::get_if<protocol::ProtocolError>(&decoded))
        {
            fail_all(batch, formupload::ErrorCode::ProtocolError, error->message);
            return;
        }

        std::map<std::string, std::vector<std::string>> ids;
        for (const auto &file : std::get<protocol::CompleteResponse>(decoded).files)
        {
            ids[file.input_name].push_back(*protocol::resolved_identifier(file));
        }

        for (auto &job : batch)
        {
            auto &state = *job.state;
            std::string identifier;
            if (auto it = ids.find(state.input_name); it != ids.end())
            {
                identifier = state.file_index < it->second.size() ? it->second[state.file_index] : it->second.front();
            }
            else
            {
                identifier = state.remote_path.value_or(synthesized_path(protocol::TransferMode::Staged, state));
            }
            auto detail = context_->describe(state);
            detail["fileId"] = identifier;
            context_->reporter.emit_info("upload.finalize.complete", std::move(detail));
            job.on_complete(std::move(identifier));
        }
    }

    void StagedAdapter::fail(Job &job, formupload::ErrorCode code, std::string message)
    {
        job.on_complete(TransferError{code, std::move(message)});
    }

    void StagedAdapter::fail_all(std::vector<Job> &batch, formupload::ErrorCode code, const std::string &message)
    {
        for (auto &job : batch)
        {
            fail(job, code, message);
        }
    }

} // namespace formupload::client
