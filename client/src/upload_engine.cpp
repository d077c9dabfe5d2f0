#include "formupload/client/upload_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "formupload/client/url.hpp"
#include "formupload/crypto.hpp"

namespace formupload::client
{

    namespace
    {
        constexpr auto kDefaultMime = "application/octet-stream";

        std::string strip_trailing_slash(std::string value)
        {
            while (value.size() > 1 && value.back() == '/')
            {
                value.pop_back();
            }
            return value;
        }

    } // namespace

    UploadEngine::UploadEngine(asio::io_context &io_context, HttpTransport &transport, ChunkStore &store,
                               SessionStateStore &state_store, UploadReporter &reporter, SubmissionPipeline &pipeline,
                               EngineOptions options)
        : io_context_(io_context), transport_(transport), store_(store), state_store_(state_store),
          reporter_(reporter), pipeline_(pipeline), options_(std::move(options)) {}

    std::optional<std::string> UploadEngine::attach_form(const UploadDeclaration &declaration)
    {
        auto resolution = resolve_upload_config(declaration);
        for (const auto &diagnostic : resolution.diagnostics)
        {
            reporter_.emit_error(diagnostic, {{"formId", declaration.form_id.value_or("")}});
        }
        if (!resolution.config)
        {
            return std::nullopt;
        }

        const auto session_key = session_key_for(declaration);
        std::optional<std::string> session_id;
        if (session_key)
        {
            try
            {
                session_id = state_store_.session_for_key(*session_key);
            }
            catch (const StoreError &ex)
            {
                reporter_.emit_error("Failed to read session state; starting a new session.",
                                     {{"sessionKey", *session_key}, {"error", ex.what()}});
            }
        }
        if (session_id && sessions_.count(*session_id) > 0)
        {
            return session_id;
        }
        if (!session_id)
        {
            session_id = crypto::random_uuid();
            if (session_key)
            {
                try
                {
                    state_store_.remember_session(*session_key, *session_id);
                }
                catch (const StoreError &ex)
                {
                    reporter_.emit_error("Failed to persist session identity; uploads will not resume.",
                                         {{"sessionKey", *session_key}, {"error", ex.what()}});
                }
            }
        }

        auto session = std::make_unique<UploadSession>();
        session->id = *session_id;
        session->config = std::move(*resolution.config);
        session->session_key = session_key;
        session->context = std::make_shared<TransferContext>(TransferContext{
            io_context_, transport_, store_, reporter_, session->config, options_, session->id,
            endpoint_for(session->config)});
        session->adapter = make_transfer_adapter(session->context);

        auto &attached = *session;
        sessions_.emplace(attached.id, std::move(session));
        reporter_.emit_info("upload.session.attach", {{"sessionId", attached.id},
                                                      {"formId", attached.config.form_id.value_or("")},
                                                      {"mode", protocol::to_string(attached.config.mode)},
                                                      {"endpoint", attached.context->endpoint_url}});
        resume_session(attached);
        return attached.id;
    }

    bool UploadEngine::select_files(const std::string &session_id, const std::string &input_name,
                                    std::vector<SelectedFile> files)
    {
        auto *session = lookup(session_id);
        if (session == nullptr)
        {
            reporter_.emit_error("Unknown upload session.", {{"sessionId", session_id}});
            return false;
        }
        if (files.empty())
        {
            return false;
        }
        if (input_name.find_first_not_of(" \t\r\n") == std::string::npos)
        {
            reporter_.emit_error("File input requires a name for upload.",
                                 {{"formId", session->config.form_id.value_or("")}});
            return false;
        }
        const auto &inputs = session->config.file_inputs;
        if (!inputs.empty() && std::find(inputs.begin(), inputs.end(), input_name) == inputs.end())
        {
            reporter_.emit_error("File input is not part of the form.",
                                 {{"formId", session->config.form_id.value_or("")}, {"inputName", input_name}});
            return false;
        }
        if (std::any_of(files.begin(), files.end(), [](const SelectedFile &file)
                        { return !file.source; }))
        {
            reporter_.emit_error("Selected file has no readable source.", {{"inputName", input_name}});
            return false;
        }

        for (auto it = session->files.begin(); it != session->files.end();)
        {
            if (it->second->input_name == input_name)
            {
                discard_file(*session, *it->second);
                it = session->files.erase(it);
            }
            else
            {
                ++it;
            }
        }

        const auto &config = session->config;
        const auto &context = *session->context;
        const auto started_at = now_millis();
        std::vector<std::shared_ptr<FileState>> created;
        for (std::uint32_t index = 0; index < files.size(); ++index)
        {
            auto &file = files[index];
            auto state = std::make_shared<FileState>();
            state->session_id = session->id;
            state->file_uuid = crypto::random_uuid();
            state->input_name = input_name;
            state->file_index = index;
            state->file_name = file.name;
            state->size = file.source->size();
            state->mime = file.mime.empty() ? kDefaultMime : file.mime;
            state->chunk_size = config.mode == protocol::TransferMode::Staged ? config.chunk_size_bytes : state->size;
            state->total_chunks = compute_total_chunks(config.mode, state->size, config.chunk_size_bytes);
            state->status = FileStatus::Queued;
            state->started_at = started_at;
            state->source_path = file.source->origin();
            state->key = make_file_key(input_name, index);
            state->source = std::move(file.source);

            session->files[state->key] = state;
            context.publish(*state);
            context.persist(*state, "Failed to persist upload state; continuing in-memory.");
            if (config.mode == protocol::TransferMode::Staged)
            {
                store_chunks(*session, *state);
            }
            reporter_.emit_info("upload.session.create", context.describe(*state));
            created.push_back(std::move(state));
        }

        for (const auto &state : created)
        {
            start_file(*session, state);
        }
        return true;
    }

    bool UploadEngine::drop_files(const std::string &session_id, std::vector<SelectedFile> files)
    {
        auto *session = lookup(session_id);
        if (session == nullptr || files.empty())
        {
            return false;
        }
        if (session->config.file_inputs.size() != 1)
        {
            reporter_.emit_error("Drop upload requires exactly one file input.",
                                 {{"formId", session->config.form_id.value_or("")}});
            return false;
        }
        return select_files(session_id, session->config.file_inputs.front(), std::move(files));
    }

    void UploadEngine::clear_session(const std::string &session_id)
    {
        auto *session = lookup(session_id);
        if (session == nullptr)
        {
            return;
        }
        if (session->clear_timer)
        {
            session->clear_timer->cancel();
        }
        for (auto &[key, state] : session->files)
        {
            discard_file(*session, *state);
        }
        session->files.clear();
        drop_pending(*session);
    }

    const UploadSession *UploadEngine::find_session(const std::string &session_id) const
    {
        if (auto it = sessions_.find(session_id); it != sessions_.end())
        {
            return it->second.get();
        }
        return nullptr;
    }

    bool UploadEngine::all_completed(const std::string &session_id) const
    {
        const auto *session = find_session(session_id);
        if (session == nullptr)
        {
            return false;
        }
        return std::all_of(session->files.begin(), session->files.end(), [](const auto &item)
                           { return item.second->status == FileStatus::Completed && item.second->file_id; });
    }

    bool UploadEngine::any_failed(const std::string &session_id) const
    {
        const auto *session = find_session(session_id);
        if (session == nullptr)
        {
            return false;
        }
        return std::any_of(session->files.begin(), session->files.end(), [](const auto &item)
                           { return item.second->status == FileStatus::Failed; });
    }

    UploadSession *UploadEngine::lookup(const std::string &session_id)
    {
        if (auto it = sessions_.find(session_id); it != sessions_.end())
        {
            return it->second.get();
        }
        return nullptr;
    }

    std::string UploadEngine::endpoint_for(const UploadConfig &config) const
    {
        return strip_trailing_slash(resolve_action(config.endpoint));
    }

    std::string UploadEngine::resolve_action(const std::string &action_url) const
    {
        if (parse_url(action_url) || !options_.base_url)
        {
            return action_url;
        }
        const auto base = parse_url(*options_.base_url);
        if (!base)
        {
            return action_url;
        }
        if (auto resolved = resolve_url(*base, action_url))
        {
            return resolved->to_string();
        }
        return action_url;
    }

    void UploadEngine::discard_file(UploadSession &session, FileState &state)
    {
        state.detached = true;
        state.source.reset();
        reporter_.remove_entry(session.id, state.key);
        try
        {
            store_.delete_file(session.id, state.input_name, state.file_index);
        }
        catch (const StoreError &ex)
        {
            auto detail = session.context->describe(state);
            detail["error"] = ex.what();
            reporter_.emit_error("Failed to delete stored upload; continuing.", std::move(detail));
        }
    }

    void UploadEngine::store_chunks(UploadSession &session, FileState &state)
    {
        const auto &context = *session.context;
        for (std::uint32_t index = 0; index < state.total_chunks; ++index)
        {
            const auto offset = static_cast<std::uint64_t>(index) * state.chunk_size;
            const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(state.chunk_size, state.size - offset));
            try
            {
                const auto bytes = state.source->read(offset, length);
                store_.put_chunk(context.chunk_key(state, index), bytes);
            }
            catch (const StoreError &ex)
            {
                auto detail = context.describe(state);
                detail["error"] = ex.what();
                reporter_.emit_error("Chunk store unavailable; falling back to in-memory chunks.", std::move(detail));
                return;
            }
            catch (const std::runtime_error &ex)
            {
                auto detail = context.describe(state);
                detail["error"] = ex.what();
                reporter_.emit_error("Failed to slice file for storage; chunks will be read on demand.",
                                     std::move(detail));
                return;
            }
        }
    }

    void UploadEngine::start_file(UploadSession &session, const std::shared_ptr<FileState> &state)
    {
        if (is_terminal(state->status))
        {
            return;
        }
        const auto session_id = session.id;
        session.adapter->start(state, [this, session_id, state](TransferOutcome outcome)
                               { on_transfer_finished(session_id, state, std::move(outcome)); });
    }

    void UploadEngine::on_transfer_finished(const std::string &session_id, const std::shared_ptr<FileState> &state,
                                            TransferOutcome outcome)
    {
        auto *session = lookup(session_id);
        if (session == nullptr || state->detached)
        {
            return;
        }
        if (const auto *error = std::get_if<TransferError>(&outcome))
        {
            mark_failed(*session, *state, *error);
        }
        else
        {
            const auto &context = *session->context;
            state->file_id = std::get<std::string>(std::move(outcome));
            state->status = FileStatus::Completed;
            state->uploaded_chunks = state->total_chunks;
            state->in_flight.clear();
            state->last_error.reset();
            state->source.reset();
            context.publish(*state);
            context.persist(*state, "Failed to persist finalized upload; continuing.");
            auto detail = context.describe(*state);
            detail["status"] = to_string(state->status);
            detail["fileId"] = *state->file_id;
            reporter_.emit_info("upload.status", std::move(detail));
        }
        maybe_submit_pending(*session);
    }

    void UploadEngine::mark_failed(UploadSession &session, FileState &state, const TransferError &error)
    {
        const auto &context = *session.context;
        state.status = FileStatus::Failed;
        state.last_error = error.message;
        state.in_flight.clear();
        state.source.reset();
        context.publish(state);
        context.persist(state, "Failed to persist failed upload state; continuing.");
        auto detail = context.describe(state);
        detail["error"] = error.message;
        detail["code"] = formupload::to_string(error.code);
        reporter_.emit_error("upload.failed", std::move(detail));
    }

} // namespace formupload::client
