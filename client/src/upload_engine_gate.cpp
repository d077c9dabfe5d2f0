#include "formupload/client/upload_engine.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

namespace formupload::client
{

    namespace
    {
        bool is_get(std::string method)
        {
            std::transform(method.begin(), method.end(), method.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::toupper(ch)); });
            return method == "GET";
        }

        nlohmann::json merge_payload(const nlohmann::json &payload, const nlohmann::json &files)
        {
            auto merged = payload.is_object() ? payload : nlohmann::json::object();
            for (const auto &[name, value] : files.items())
            {
                merged[name] = value;
            }
            return merged;
        }

        // Non-file portion of a submission payload.
        nlohmann::json strip_file_fields(const nlohmann::json &payload, const UploadSession &session)
        {
            auto stripped = payload.is_object() ? payload : nlohmann::json::object();
            for (const auto &input : session.config.file_inputs)
            {
                stripped.erase(input);
            }
            for (const auto &[key, state] : session.files)
            {
                stripped.erase(state->input_name);
            }
            return stripped;
        }

        const FileState *first_failed(const UploadSession &session)
        {
            for (const auto &[key, state] : session.files)
            {
                if (state->status == FileStatus::Failed)
                {
                    return state.get();
                }
            }
            return nullptr;
        }

        bool has_outstanding(const UploadSession &session)
        {
            return std::any_of(session.files.begin(), session.files.end(), [](const auto &item)
                               { return item.second->status != FileStatus::Completed || !item.second->file_id; });
        }

    } // namespace

    GateResult UploadEngine::gate(const FormSubmission &submission)
    {
        GateResult result;
        result.rewritten_payload = submission.payload;
        if (is_get(submission.method))
        {
            return result;
        }
        auto *session = lookup(submission.session_id);
        if (session == nullptr || session->files.empty())
        {
            return result;
        }

        if (const auto *failed = first_failed(*session))
        {
            reporter_.emit_error("Upload failed; submission blocked.",
                                 {{"sessionId", session->id},
                                  {"inputName", failed->input_name},
                                  {"error", failed->last_error.value_or("")}});
            result.blocked = true;
            result.rewritten_payload.reset();
            return result;
        }

        if (has_outstanding(*session))
        {
            PendingSubmission pending;
            pending.session_id = session->id;
            pending.form_id = session->config.form_id;
            pending.target_id = submission.target_id;
            pending.method = submission.method;
            pending.action_url = resolve_action(submission.action_url);
            pending.payload = strip_file_fields(submission.payload, *session);
            reporter_.emit_info("upload.pending", {{"sessionId", session->id},
                                                   {"formId", session->config.form_id.value_or("")},
                                                   {"action", pending.action_url}});
            write_pending(*session, std::move(pending));
            result.blocked = true;
            result.deferred = true;
            result.rewritten_payload.reset();
            return result;
        }

        result.rewritten_payload = merge_payload(submission.payload, file_payload(*session));
        return result;
    }

    nlohmann::json UploadEngine::file_payload(const UploadSession &session)
    {
        std::vector<const FileState *> completed;
        for (const auto &[key, state] : session.files)
        {
            if (state->file_id)
            {
                completed.push_back(state.get());
            }
        }
        std::sort(completed.begin(), completed.end(), [](const FileState *lhs, const FileState *rhs)
                  { return std::tie(lhs->input_name, lhs->file_index) < std::tie(rhs->input_name, rhs->file_index); });

        nlohmann::json payload = nlohmann::json::object();
        for (const auto *state : completed)
        {
            nlohmann::json value = {
                {"fileId", *state->file_id},
                {"contentType", state->mime},
                {"fileName", state->file_name},
                {"fileSize", state->size},
            };
            auto it = payload.find(state->input_name);
            if (it == payload.end())
            {
                payload[state->input_name] = std::move(value);
            }
            else if (it->is_array())
            {
                it->push_back(std::move(value));
            }
            else
            {
                *it = nlohmann::json::array({*it, std::move(value)});
            }
        }
        return payload;
    }

    void UploadEngine::notify_submission_succeeded(const std::string &session_id)
    {
        auto *session = lookup(session_id);
        if (session == nullptr)
        {
            return;
        }
        // A declared redirect takes over the page; clearing is skipped.
        if (session->config.after_submit != AfterSubmitAction::Clear || session->config.redirect_declared)
        {
            return;
        }
        if (!session->clear_timer)
        {
            session->clear_timer = std::make_unique<asio::steady_timer>(io_context_);
        }
        session->clear_timer->expires_after(options_.clear_delay);
        session->clear_timer->async_wait([this, session_id](const std::error_code &ec)
                                         {
                                             if (ec)
                                             {
                                                 return;
                                             }
                                             auto *current = lookup(session_id);
                                             if (current == nullptr)
                                             {
                                                 return;
                                             }
                                             clear_session(session_id);
                                             reporter_.emit_info("submit:clear",
                                                                 {{"sessionId", session_id},
                                                                  {"formId", current->config.form_id.value_or("")}}); });
    }

    void UploadEngine::maybe_submit_pending(UploadSession &session)
    {
        if (!session.pending)
        {
            return;
        }
        if (const auto *failed = first_failed(session))
        {
            reporter_.emit_error("Upload failed; pending submission blocked.",
                                 {{"sessionId", session.id}, {"inputName", failed->input_name}});
            return;
        }
        if (has_outstanding(session))
        {
            return;
        }

        auto pending = std::move(*session.pending);
        drop_pending(session);

        const auto target = pipeline_.resolve_submit_target(pending.form_id, pending.target_id);
        if (!target)
        {
            reporter_.emit_error("Pending submission target no longer exists; submission discarded.",
                                 {{"sessionId", session.id}, {"formId", pending.form_id.value_or("")}});
            return;
        }

        FormSubmission replay;
        replay.session_id = session.id;
        replay.method = pending.method;
        replay.action_url = pending.action_url;
        replay.target_id = target;
        replay.payload = merge_payload(pending.payload, file_payload(session));
        reporter_.emit_info("upload.pending.replay", {{"sessionId", session.id}, {"action", replay.action_url}});
        pipeline_.submit(replay, true);
    }

    void UploadEngine::write_pending(UploadSession &session, PendingSubmission pending)
    {
        session.pending = std::move(pending);
        try
        {
            state_store_.write_pending(*session.pending);
        }
        catch (const StoreError &ex)
        {
            reporter_.emit_error("Failed to persist pending submission; continuing in-memory.",
                                 {{"sessionId", session.id}, {"error", ex.what()}});
        }
    }

    void UploadEngine::drop_pending(UploadSession &session)
    {
        session.pending.reset();
        try
        {
            state_store_.clear_pending(session.id);
        }
        catch (const StoreError &ex)
        {
            reporter_.emit_error("Failed to clear pending submission; continuing.",
                                 {{"sessionId", session.id}, {"error", ex.what()}});
        }
    }

} // namespace formupload::client
