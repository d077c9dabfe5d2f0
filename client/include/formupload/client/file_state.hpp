#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "formupload/client/byte_source.hpp"
#include "formupload/protocol.hpp"

namespace formupload::client
{

    enum class FileStatus : std::uint8_t
    {
        Queued,
        Uploading,
        Finalizing,
        Completed,
        Failed
    };

    std::string_view to_string(FileStatus status) noexcept;
    std::optional<FileStatus> file_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(FileStatus status) noexcept
    {
        return status == FileStatus::Completed || status == FileStatus::Failed;
    }

    // Durable part of a file transfer; everything here survives a restart.
    struct FileRecord
    {
        std::string session_id;
        std::string file_uuid;
        std::string input_name;
        std::uint32_t file_index{};
        std::string file_name;
        std::uint64_t size{};
        std::string mime;
        std::uint64_t chunk_size{};
        std::uint32_t total_chunks{};
        std::uint32_t uploaded_chunks{};
        FileStatus status{FileStatus::Queued};
        std::int64_t started_at{};
        std::optional<std::string> last_error;
        std::optional<std::string> staging_handle;
        std::optional<std::string> remote_path;
        std::vector<std::string> part_urls;
        std::vector<std::optional<std::string>> part_confirmations;
        std::optional<std::string> file_id;
        std::optional<std::filesystem::path> source_path;
    };

    void to_json(nlohmann::json &json, const FileRecord &record);
    void from_json(const nlohmann::json &json, FileRecord &record);

    struct FileState : FileRecord
    {
        std::string key;
        // chunk index -> fraction of that chunk sent so far
        std::map<std::uint32_t, double> in_flight;
        std::shared_ptr<ByteRangeSource> source;
        // Set once the file is removed from its session; late completions must not touch the store.
        bool detached{};

        const FileRecord &record() const noexcept { return *this; }
    };

    std::string make_file_key(std::string_view input_name, std::uint32_t file_index);

    // Staged: ceil(size / chunk_size), at least one part. Simple: always one.
    std::uint32_t compute_total_chunks(protocol::TransferMode mode, std::uint64_t size, std::uint64_t chunk_size);

    double compute_progress(const FileState &state);

    std::uint32_t confirmed_parts(const FileRecord &record);

    // Fallback identifier when the server names none: /<mode>/<fileUuid>/<input>/<file name>.
    std::string synthesized_path(protocol::TransferMode mode, const FileRecord &record);

} // namespace formupload::client
