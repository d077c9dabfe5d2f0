/**
 * formupload - Wire schema for the staged and simple upload protocols.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace formupload::protocol
{

    enum class TransferMode : std::uint8_t
    {
        Staged,
        Simple
    };

    std::string_view to_string(TransferMode mode) noexcept;
    std::optional<TransferMode> transfer_mode_from_string(std::string_view value) noexcept;

    inline constexpr std::string_view kConfirmationHeader = "etag";
    inline constexpr std::string_view kInitPath = "/init";
    inline constexpr std::string_view kCompletePath = "/complete";

    // Serializes json; bytes that are not valid UTF-8 (file names, OS messages) become U+FFFD instead of throwing.
    std::string dump_json(const nlohmann::json &json, int indent = -1);

    // Placeholder token used when a part response carries no confirmation header.
    std::string synthesized_confirmation(std::uint32_t part_number);

    struct ProtocolError
    {
        std::string message;
    };

    template <typename T>
    using Decoded = std::variant<T, ProtocolError>;

    struct InitFile
    {
        std::string input_name;
        std::string file_name;
        std::uint64_t size{};
        std::string mime;
        std::uint64_t chunks{};
    };

    void to_json(nlohmann::json &json, const InitFile &file);
    void from_json(const nlohmann::json &json, InitFile &file);

    struct InitRequest
    {
        std::vector<InitFile> files;
    };

    void to_json(nlohmann::json &json, const InitRequest &request);
    void from_json(const nlohmann::json &json, InitRequest &request);

    struct PartUrl
    {
        std::uint32_t part_number{};
        std::string url;
    };

    void to_json(nlohmann::json &json, const PartUrl &part);
    void from_json(const nlohmann::json &json, PartUrl &part);

    struct InitUpload
    {
        std::string input_name;
        std::string staging_handle;
        std::optional<std::string> path{};
        std::vector<PartUrl> parts;
    };

    void to_json(nlohmann::json &json, const InitUpload &upload);
    void from_json(const nlohmann::json &json, InitUpload &upload);

    struct InitResponse
    {
        std::vector<InitUpload> uploads;
    };

    void to_json(nlohmann::json &json, const InitResponse &response);
    void from_json(const nlohmann::json &json, InitResponse &response);

    struct PartConfirmation
    {
        std::uint32_t part_number{};
        std::string confirmation_token;
    };

    void to_json(nlohmann::json &json, const PartConfirmation &part);
    void from_json(const nlohmann::json &json, PartConfirmation &part);

    struct CompleteUpload
    {
        std::string input_name;
        std::string staging_handle;
        std::string path;
        std::vector<PartConfirmation> parts;
    };

    void to_json(nlohmann::json &json, const CompleteUpload &upload);
    void from_json(const nlohmann::json &json, CompleteUpload &upload);

    struct CompleteRequest
    {
        std::vector<CompleteUpload> uploads;
    };

    void to_json(nlohmann::json &json, const CompleteRequest &request);
    void from_json(const nlohmann::json &json, CompleteRequest &request);

    struct CompletedFile
    {
        std::string input_name;
        std::optional<std::string> file_id{};
        std::optional<std::string> path{};
    };

    void to_json(nlohmann::json &json, const CompletedFile &file);
    void from_json(const nlohmann::json &json, CompletedFile &file);

    // path wins over file_id when both are present.
    std::optional<std::string> resolved_identifier(const CompletedFile &file);

    struct CompleteResponse
    {
        std::vector<CompletedFile> files;
    };

    void to_json(nlohmann::json &json, const CompleteResponse &response);

    struct SimpleUploadResponse
    {
        std::optional<std::string> path{};
        std::optional<std::string> file_id{};
    };

    // Init response: a JSON object with an "uploads" array; any malformed entry rejects the whole body.
    // Part numbers of one upload must be exactly 1..n, in any order.
    Decoded<InitResponse> decode_init_response(std::string_view body);

    // Complete response: entries without an input name or identifier are skipped; an empty body is an
    // empty response.
    Decoded<CompleteResponse> decode_complete_response(std::string_view body);

    // Simple responses are advisory only; anything unparseable yields an empty result.
    SimpleUploadResponse decode_simple_response(std::string_view body) noexcept;

} // namespace formupload::protocol
