#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "formupload/client/submission.hpp"

namespace formupload::client
{

    // Small JSON document beside the chunk store: form key -> session id, plus deferred submissions.
    class SessionStateStore
    {
    public:
        explicit SessionStateStore(std::filesystem::path state_path);

        std::optional<std::string> session_for_key(const std::string &session_key);
        void remember_session(const std::string &session_key, const std::string &session_id);

        std::optional<PendingSubmission> read_pending(const std::string &session_id);
        void write_pending(const PendingSubmission &pending);
        void clear_pending(const std::string &session_id);

        static std::filesystem::path default_state_dir();

    private:
        void load();
        void save() const;

        std::filesystem::path state_path_;
        bool loaded_{false};
        std::map<std::string, std::string> sessions_;
        std::map<std::string, PendingSubmission> pending_;
    };

} // namespace formupload::client
