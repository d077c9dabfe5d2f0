#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "formupload/client/file_state.hpp"
#include "formupload/client/logger.hpp"

namespace formupload::client
{

    // Read-only view of one file for progress displays.
    struct UploadEntry
    {
        std::string upload_uuid;
        std::string session_id;
        std::optional<std::string> form_id;
        std::string input_name;
        std::uint32_t file_index{};
        std::string file_name;
        std::uint64_t size{};
        std::string mime;
        FileStatus status{FileStatus::Queued};
        std::uint32_t total_chunks{};
        std::uint32_t uploaded_chunks{};
        double progress{};
        std::int64_t started_at{};
        std::optional<std::string> last_error;
    };

    void to_json(nlohmann::json &json, const UploadEntry &entry);

    enum class EventType : std::uint8_t
    {
        Info,
        Error
    };

    std::string_view to_string(EventType type) noexcept;

    struct UploadEvent
    {
        EventType type{EventType::Info};
        std::string message;
        nlohmann::json detail = nlohmann::json::object();
        std::int64_t timestamp{};
    };

    using EventListener = std::function<void(const UploadEvent &)>;

    class UploadReporter
    {
    public:
        explicit UploadReporter(Logger &logger);

        void upsert_entry(const FileState &state, const std::optional<std::string> &form_id);
        void remove_entry(const std::string &session_id, const std::string &key);

        std::vector<UploadEntry> entries() const;
        std::optional<UploadEntry> find_entry(const std::string &session_id, const std::string &key) const;

        void emit_info(std::string message, nlohmann::json detail = nlohmann::json::object());
        void emit_error(std::string message, nlohmann::json detail = nlohmann::json::object());

        void add_listener(EventListener listener);

        const std::vector<UploadEvent> &history() const noexcept { return history_; }

    private:
        void emit(UploadEvent event);

        Logger &logger_;
        std::map<std::pair<std::string, std::string>, UploadEntry> entries_;
        std::vector<std::pair<std::string, std::string>> order_;
        std::vector<EventListener> listeners_;
        std::vector<UploadEvent> history_;
    };

    std::int64_t now_millis();

} // namespace formupload::client
