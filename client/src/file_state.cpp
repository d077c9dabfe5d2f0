#include "formupload/client/file_state.hpp"

#include <algorithm>
#include <array>
#include <numeric>

#include "formupload/client/url.hpp"

namespace formupload::client
{

    namespace
    {

        struct FileStatusMapping
        {
            FileStatus status;
            std::string_view label;
        };

        constexpr std::array<FileStatusMapping, 5> kFileStatusMappings{{
            {FileStatus::Queued, "queued"},
            {FileStatus::Uploading, "uploading"},
            {FileStatus::Finalizing, "finalizing"},
            {FileStatus::Completed, "completed"},
            {FileStatus::Failed, "failed"},
        }};

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(FileStatus status) noexcept
    {
        for (const auto &mapping : kFileStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<FileStatus> file_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kFileStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const FileRecord &record)
    {
        nlohmann::json confirmations = nlohmann::json::array();
        for (const auto &token : record.part_confirmations)
        {
            confirmations.push_back(token ? nlohmann::json(*token) : nlohmann::json(nullptr));
        }
        json = {
            {"sessionId", record.session_id},
            {"fileUuid", record.file_uuid},
            {"inputName", record.input_name},
            {"fileIndex", record.file_index},
            {"fileName", record.file_name},
            {"size", record.size},
            {"mime", record.mime},
            {"chunkSize", record.chunk_size},
            {"totalChunks", record.total_chunks},
            {"uploadedChunks", record.uploaded_chunks},
            {"status", to_string(record.status)},
            {"startedAt", record.started_at},
            {"partUrls", record.part_urls},
            {"partConfirmations", confirmations},
        };
        put_optional(json, "lastError", record.last_error);
        put_optional(json, "stagingHandle", record.staging_handle);
        put_optional(json, "path", record.remote_path);
        put_optional(json, "fileId", record.file_id);
        if (record.source_path)
        {
            json["sourcePath"] = record.source_path->generic_string();
        }
    }

    void from_json(const nlohmann::json &json, FileRecord &record)
    {
        record.session_id = json.at("sessionId").get<std::string>();
        record.file_uuid = json.value("fileUuid", std::string{});
        record.input_name = json.at("inputName").get<std::string>();
        record.file_index = json.value("fileIndex", 0u);
        record.file_name = json.value("fileName", std::string{});
        record.size = json.value("size", 0ULL);
        record.mime = json.value("mime", std::string{});
        record.chunk_size = json.value("chunkSize", 0ULL);
        record.total_chunks = json.value("totalChunks", 0u);
        record.uploaded_chunks = json.value("uploadedChunks", 0u);
        record.status = file_status_from_string(json.value("status", std::string{})).value_or(FileStatus::Queued);
        record.started_at = json.value("startedAt", 0LL);
        record.last_error = optional_string(json, "lastError");
        record.staging_handle = optional_string(json, "stagingHandle");
        record.remote_path = optional_string(json, "path");
        record.file_id = optional_string(json, "fileId");
        record.part_urls = json.value("partUrls", std::vector<std::string>{});
        record.part_confirmations.clear();
        if (auto it = json.find("partConfirmations"); it != json.end() && it->is_array())
        {
            for (const auto &token : *it)
            {
                if (token.is_string() && !token.get<std::string>().empty())
                {
                    record.part_confirmations.emplace_back(token.get<std::string>());
                }
                else
                {
                    record.part_confirmations.emplace_back(std::nullopt);
                }
            }
        }
        if (auto source = optional_string(json, "sourcePath"))
        {
            record.source_path = std::filesystem::path(*source);
        }
        else
        {
            record.source_path.reset();
        }
    }

    std::string make_file_key(std::string_view input_name, std::uint32_t file_index)
    {
        return std::string(input_name) + ':' + std::to_string(file_index);
    }

    std::uint32_t compute_total_chunks(protocol::TransferMode mode, std::uint64_t size, std::uint64_t chunk_size)
    {
        if (mode == protocol::TransferMode::Simple || chunk_size == 0)
        {
            return 1;
        }
        const auto chunks = (size + chunk_size - 1) / chunk_size;
        return static_cast<std::uint32_t>(std::max<std::uint64_t>(1, chunks));
    }

    double compute_progress(const FileState &state)
    {
        if (state.total_chunks == 0)
        {
            return 0.0;
        }
        const double in_flight = std::accumulate(state.in_flight.begin(), state.in_flight.end(), 0.0,
                                                 [](double sum, const auto &item)
                                                 { return sum + item.second; });
        return std::min(1.0, (static_cast<double>(state.uploaded_chunks) + in_flight) /
                                 static_cast<double>(state.total_chunks));
    }

    std::uint32_t confirmed_parts(const FileRecord &record)
    {
        return static_cast<std::uint32_t>(std::count_if(record.part_confirmations.begin(),
                                                        record.part_confirmations.end(),
                                                        [](const auto &token)
                                                        { return token.has_value(); }));
    }

    std::string synthesized_path(protocol::TransferMode mode, const FileRecord &record)
    {
        return "/" + std::string(protocol::to_string(mode)) + "/" + record.file_uuid + "/" +
               percent_encode(record.input_name) + "/" + percent_encode(record.file_name);
    }

} // namespace formupload::client
