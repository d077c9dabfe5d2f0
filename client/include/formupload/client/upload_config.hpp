#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "formupload/protocol.hpp"

namespace formupload::client
{

    inline constexpr std::uint64_t kMiB = 1024 * 1024;
    inline constexpr double kDefaultChunkSizeMiB = 10.0;
    inline constexpr double kMinChunkSizeMiB = 5.0;
    inline constexpr double kMaxChunkSizeMiB = 5120.0;
    inline constexpr std::size_t kDefaultConcurrency = 6;
    inline constexpr std::chrono::milliseconds kDefaultClearDelay{2000};

    enum class AfterSubmitAction : std::uint8_t
    {
        Keep,
        Clear
    };

    std::string_view to_string(AfterSubmitAction action) noexcept;

    // Upload attributes of one form, already extracted from markup.
    struct UploadDeclaration
    {
        std::optional<std::string> mode;
        std::optional<std::string> endpoint;
        std::optional<std::string> form_action;
        std::optional<std::string> chunk_size_mib;
        std::optional<std::string> after_submit;
        bool redirect_declared{};
        std::optional<std::string> form_id;
        std::optional<std::string> form_name;
        std::string page_path;
        std::vector<std::string> file_inputs;
    };

    struct UploadConfig
    {
        protocol::TransferMode mode{protocol::TransferMode::Simple};
        std::string endpoint;
        std::uint64_t chunk_size_bytes{};
        AfterSubmitAction after_submit{AfterSubmitAction::Keep};
        bool redirect_declared{};
        bool redirect_conflict{};
        std::optional<std::string> form_id;
        std::vector<std::string> file_inputs;
    };

    struct EngineOptions
    {
        std::size_t concurrency{kDefaultConcurrency};
        std::chrono::milliseconds clear_delay{kDefaultClearDelay};
        // Relative endpoints and action URLs are resolved against this.
        std::optional<std::string> base_url;
    };

    struct ConfigResolution
    {
        std::optional<UploadConfig> config;
        std::vector<std::string> diagnostics;
    };

    // No config means the upload engine must not attach to the form; diagnostics explain why.
    ConfigResolution resolve_upload_config(const UploadDeclaration &declaration);

    // Stable key identifying the form across reloads, or nothing if the form has no id, name or action.
    std::optional<std::string> session_key_for(const UploadDeclaration &declaration);

} // namespace formupload::client
