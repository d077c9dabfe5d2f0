#include "formupload/client/upload_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace formupload::client
{

    void UploadEngine::resume_session(UploadSession &session)
    {
        try
        {
            if (auto pending = state_store_.read_pending(session.id))
            {
                session.pending = std::move(*pending);
            }
        }
        catch (const StoreError &ex)
        {
            reporter_.emit_error("Failed to load pending submission; continuing without it.",
                                 {{"sessionId", session.id}, {"error", ex.what()}});
        }

        std::vector<FileRecord> records;
        try
        {
            records = store_.list_file_records(session.id);
        }
        catch (const StoreError &ex)
        {
            reporter_.emit_error("Failed to load stored upload records; resuming with empty queue.",
                                 {{"sessionId", session.id}, {"error", ex.what()}});
        }
        std::sort(records.begin(), records.end(), [](const FileRecord &lhs, const FileRecord &rhs)
                  { return std::tie(lhs.input_name, lhs.file_index) < std::tie(rhs.input_name, rhs.file_index); });

        std::vector<std::shared_ptr<FileState>> resumed;
        for (auto &record : records)
        {
            const auto key = make_file_key(record.input_name, record.file_index);
            if (session.files.count(key) > 0)
            {
                continue;
            }
            auto state = restore_file(session, std::move(record));
            session.files[key] = state;
            session.context->publish(*state);
            if (!is_terminal(state->status))
            {
                resumed.push_back(std::move(state));
            }
        }
        if (!records.empty())
        {
            reporter_.emit_info("upload.session.resume", {{"sessionId", session.id},
                                                          {"files", records.size()},
                                                          {"restarted", resumed.size()},
                                                          {"pendingSubmission", session.pending.has_value()}});
        }

        for (const auto &state : resumed)
        {
            start_file(session, state);
        }
        maybe_submit_pending(session);
    }

    std::shared_ptr<FileState> UploadEngine::restore_file(UploadSession &session, FileRecord record)
    {
        auto state = std::make_shared<FileState>();
        static_cast<FileRecord &>(*state) = std::move(record);
        state->session_id = session.id;
        state->key = make_file_key(state->input_name, state->file_index);

        if (session.config.mode == protocol::TransferMode::Staged && !state->part_confirmations.empty())
        {
            state->part_confirmations.resize(state->total_chunks);
            state->uploaded_chunks = confirmed_parts(*state);
        }
        if (state->file_id)
        {
            state->status = FileStatus::Completed;
            state->uploaded_chunks = state->total_chunks;
            return state;
        }
        if (state->status == FileStatus::Failed)
        {
            return state;
        }
        state->status = FileStatus::Queued;

        // Chunks pruned or lost from the store are re-read from the original file when it is unchanged.
        if (state->source_path)
        {
            try
            {
                auto source = std::make_shared<FileByteSource>(*state->source_path);
                if (source->size() == state->size)
                {
                    state->source = std::move(source);
                }
                else
                {
                    auto detail = session.context->describe(*state);
                    detail["path"] = state->source_path->string();
                    reporter_.emit_error("Source file changed since selection; relying on stored chunks.",
                                         std::move(detail));
                }
            }
            catch (const std::runtime_error &ex)
            {
                auto detail = session.context->describe(*state);
                detail["error"] = ex.what();
                reporter_.emit_error("Source file unavailable; relying on stored chunks.", std::move(detail));
            }
        }
        return state;
    }

} // namespace formupload::client
