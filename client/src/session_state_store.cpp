#include "formupload/client/session_state_store.hpp"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#include "formupload/client/chunk_store.hpp"
#include "formupload/protocol.hpp"

namespace formupload::client
{

    SessionStateStore::SessionStateStore(std::filesystem::path state_path)
        : state_path_(std::move(state_path)) {}

    std::optional<std::string> SessionStateStore::session_for_key(const std::string &session_key)
    {
        load();
        if (auto it = sessions_.find(session_key); it != sessions_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    void SessionStateStore::remember_session(const std::string &session_key, const std::string &session_id)
    {
        load();
        sessions_[session_key] = session_id;
        save();
    }

    std::optional<PendingSubmission> SessionStateStore::read_pending(const std::string &session_id)
    {
        load();
        if (auto it = pending_.find(session_id); it != pending_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    void SessionStateStore::write_pending(const PendingSubmission &pending)
    {
        load();
        pending_[pending.session_id] = pending;
        save();
    }

    void SessionStateStore::clear_pending(const std::string &session_id)
    {
        load();
        if (pending_.erase(session_id) > 0)
        {
            save();
        }
    }

    std::filesystem::path SessionStateStore::default_state_dir()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "FormUpload";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".formupload";
        }
        return std::filesystem::path(".formupload");
    }

    void SessionStateStore::load()
    {
        if (loaded_)
        {
            return;
        }
        // A document that fails to load is reported once; later calls work on the empty state.
        loaded_ = true;
        sessions_.clear();
        pending_.clear();
        std::error_code ec;
        if (!std::filesystem::exists(state_path_, ec))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            throw StoreError(formupload::ErrorCode::StoreUnavailable, "Failed to open " + state_path_.string());
        }
        try
        {
            nlohmann::json json;
            in >> json;
            if (!json.is_object())
            {
                throw StoreError(formupload::ErrorCode::StoreCorrupted, "Session state is not an object");
            }
            const auto sessions = json.value("sessions", nlohmann::json::object());
            for (const auto &[key, value] : sessions.items())
            {
                if (value.is_string())
                {
                    sessions_[key] = value.get<std::string>();
                }
            }
            const auto pending_entries = json.value("pending", nlohmann::json::object());
            for (const auto &item : pending_entries)
            {
                auto pending = item.get<PendingSubmission>();
                pending_[pending.session_id] = std::move(pending);
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            sessions_.clear();
            pending_.clear();
            throw StoreError(formupload::ErrorCode::StoreCorrupted,
                             "Corrupted session state " + state_path_.string() + ": " + ex.what());
        }
    }

    void SessionStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json;
        json["sessions"] = sessions_;
        json["pending"] = nlohmann::json::object();
        for (const auto &[session_id, pending] : pending_)
        {
            json["pending"][session_id] = pending;
        }
        auto temp = state_path_;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw StoreError(formupload::ErrorCode::StoreUnavailable, "Failed to open " + temp.string());
            }
            out << protocol::dump_json(json, 2);
            if (!out)
            {
                throw StoreError(formupload::ErrorCode::StoreUnavailable, "Failed to write " + temp.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, state_path_, ec);
        if (ec)
        {
            throw StoreError(formupload::ErrorCode::StoreUnavailable,
                             "Failed to commit " + state_path_.string() + ": " + ec.message());
        }
    }

} // namespace formupload::client
