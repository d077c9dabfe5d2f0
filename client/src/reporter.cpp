#include "formupload/client/reporter.hpp"

#include <algorithm>
#include <chrono>

namespace formupload::client
{

    namespace
    {
        constexpr std::size_t kHistoryLimit = 1000;
    }

    void to_json(nlohmann::json &json, const UploadEntry &entry)
    {
        json = {
            {"uploadUuid", entry.upload_uuid},
            {"sessionId", entry.session_id},
            {"inputName", entry.input_name},
            {"fileIndex", entry.file_index},
            {"fileName", entry.file_name},
            {"size", entry.size},
            {"mime", entry.mime},
            {"status", to_string(entry.status)},
            {"totalChunks", entry.total_chunks},
            {"uploadedChunks", entry.uploaded_chunks},
            {"progress", entry.progress},
            {"startedAt", entry.started_at},
        };
        if (entry.form_id)
        {
            json["formId"] = *entry.form_id;
        }
        if (entry.last_error)
        {
            json["lastError"] = *entry.last_error;
        }
    }

    std::string_view to_string(EventType type) noexcept
    {
        return type == EventType::Error ? "error" : "info";
    }

    std::int64_t now_millis()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    UploadReporter::UploadReporter(Logger &logger)
        : logger_(logger) {}

    void UploadReporter::upsert_entry(const FileState &state, const std::optional<std::string> &form_id)
    {
        const auto id = std::make_pair(state.session_id, state.key);
        auto it = entries_.find(id);
        if (it == entries_.end())
        {
            UploadEntry entry;
            entry.upload_uuid = state.file_uuid;
            entry.session_id = state.session_id;
            entry.form_id = form_id;
            entry.input_name = state.input_name;
            entry.file_index = state.file_index;
            entry.file_name = state.file_name;
            entry.size = state.size;
            entry.mime = state.mime;
            entry.started_at = state.started_at;
            it = entries_.emplace(id, std::move(entry)).first;
            order_.push_back(id);
        }
        auto &entry = it->second;
        entry.status = state.status;
        entry.total_chunks = state.total_chunks;
        entry.uploaded_chunks = state.uploaded_chunks;
        entry.progress = compute_progress(state);
        entry.last_error = state.last_error;
    }

    void UploadReporter::remove_entry(const std::string &session_id, const std::string &key)
    {
        const auto id = std::make_pair(session_id, key);
        if (entries_.erase(id) == 0)
        {
            return;
        }
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }

    std::vector<UploadEntry> UploadReporter::entries() const
    {
        std::vector<UploadEntry> result;
        result.reserve(order_.size());
        for (const auto &id : order_)
        {
            result.push_back(entries_.at(id));
        }
        return result;
    }

    std::optional<UploadEntry> UploadReporter::find_entry(const std::string &session_id, const std::string &key) const
    {
        if (auto it = entries_.find(std::make_pair(session_id, key)); it != entries_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    void UploadReporter::emit_info(std::string message, nlohmann::json detail)
    {
        emit(UploadEvent{EventType::Info, std::move(message), std::move(detail), now_millis()});
    }

    void UploadReporter::emit_error(std::string message, nlohmann::json detail)
    {
        emit(UploadEvent{EventType::Error, std::move(message), std::move(detail), now_millis()});
    }

    void UploadReporter::add_listener(EventListener listener)
    {
        listeners_.push_back(std::move(listener));
    }

    void UploadReporter::emit(UploadEvent event)
    {
        if (event.type == EventType::Error)
        {
            logger_.warn("upload", event.message, " ", protocol::dump_json(event.detail));
        }
        else
        {
            logger_.log("upload", event.message, " ", protocol::dump_json(event.detail));
        }
        for (const auto &listener : listeners_)
        {
            listener(event);
        }
        if (history_.size() >= kHistoryLimit)
        {
            history_.erase(history_.begin());
        }
        history_.push_back(std::move(event));
    }

} // namespace formupload::client
