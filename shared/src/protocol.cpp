#include "formupload/protocol.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace formupload::protocol
{

    namespace
    {

        struct TransferModeMapping
        {
            TransferMode mode;
            std::string_view label;
        };

        // "s3" is accepted on input only.
        constexpr std::array<TransferModeMapping, 3> kTransferModeMappings{{
            {TransferMode::Staged, "staged"},
            {TransferMode::Simple, "simple"},
            {TransferMode::Staged, "s3"},
        }};

        std::optional<std::string> non_empty_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string())
            {
                auto value = it->get<std::string>();
                if (!value.empty())
                {
                    return value;
                }
            }
            return std::nullopt;
        }

        std::string required_string(const nlohmann::json &json, const char *key, const char *alias = nullptr)
        {
            if (auto value = non_empty_string(json, key))
            {
                return *value;
            }
            if (alias != nullptr)
            {
                if (auto value = non_empty_string(json, alias))
                {
                    return *value;
                }
            }
            throw std::runtime_error(std::string("missing field ") + key);
        }

        std::uint32_t required_part_number(const nlohmann::json &json)
        {
            const auto &value = json.at("partNumber");
            if (!value.is_number_integer() || value.get<std::int64_t>() < 1)
            {
                throw std::runtime_error("partNumber must be a positive integer");
            }
            return value.get<std::uint32_t>();
        }

    } // namespace

    std::string_view to_string(TransferMode mode) noexcept
    {
        for (const auto &mapping : kTransferModeMappings)
        {
            if (mapping.mode == mode)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<TransferMode> transfer_mode_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kTransferModeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.mode;
            }
        }
        return std::nullopt;
    }

    std::string dump_json(const nlohmann::json &json, int indent)
    {
        return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::string synthesized_confirmation(std::uint32_t part_number)
    {
        return "confirm-" + std::to_string(part_number);
    }

    void to_json(nlohmann::json &json, const InitFile &file)
    {
        json = {
            {"inputName", file.input_name},
            {"fileName", file.file_name},
            {"size", file.size},
            {"mime", file.mime},
            {"chunks", file.chunks},
        };
    }

    void from_json(const nlohmann::json &json, InitFile &file)
    {
        file.input_name = json.at("inputName").get<std::string>();
        file.file_name = json.value("fileName", std::string{});
        file.size = json.value("size", 0ULL);
        file.mime = json.value("mime", std::string{});
        file.chunks = json.value("chunks", 0ULL);
    }

    void to_json(nlohmann::json &json, const InitRequest &request)
    {
        json = {{"files", request.files}};
    }

    void from_json(const nlohmann::json &json, InitRequest &request)
    {
        request.files = json.value("files", std::vector<InitFile>{});
    }

    void to_json(nlohmann::json &json, const PartUrl &part)
    {
        json = {
            {"partNumber", part.part_number},
            {"url", part.url},
        };
    }

    void from_json(const nlohmann::json &json, PartUrl &part)
    {
        part.part_number = required_part_number(json);
        part.url = required_string(json, "url");
    }

    void to_json(nlohmann::json &json, const InitUpload &upload)
    {
        json = {
            {"inputName", upload.input_name},
            {"stagingHandle", upload.staging_handle},
            {"parts", upload.parts},
        };
        if (upload.path)
        {
            json["path"] = *upload.path;
        }
    }

    void from_json(const nlohmann::json &json, InitUpload &upload)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("upload entry must be an object");
        }
        upload.input_name = required_string(json, "inputName");
        upload.staging_handle = required_string(json, "stagingHandle", "uploadId");
        upload.path = non_empty_string(json, "path");
        if (!upload.path)
        {
            upload.path = non_empty_string(json, "s3Path");
        }
        const auto &parts = json.at("parts");
        if (!parts.is_array())
        {
            throw std::runtime_error("parts must be an array");
        }
        upload.parts = parts.get<std::vector<PartUrl>>();
        std::sort(upload.parts.begin(), upload.parts.end(), [](const PartUrl &lhs, const PartUrl &rhs)
                  { return lhs.part_number < rhs.part_number; });
        for (std::size_t index = 0; index < upload.parts.size(); ++index)
        {
            if (upload.parts[index].part_number != index + 1)
            {
                throw std::runtime_error("parts must be numbered 1.." + std::to_string(upload.parts.size()));
            }
        }
    }

    void to_json(nlohmann::json &json, const InitResponse &response)
    {
        json = {{"uploads", response.uploads}};
    }

    void from_json(const nlohmann::json &json, InitResponse &response)
    {
        const auto &uploads = json.at("uploads");
        if (!uploads.is_array())
        {
            throw std::runtime_error("uploads must be an array");
        }
        response.uploads = uploads.get<std::vector<InitUpload>>();
    }

    void to_json(nlohmann::json &json, const PartConfirmation &part)
    {
        json = {
            {"partNumber", part.part_number},
            {"confirmationToken", part.confirmation_token},
        };
    }

    void from_json(const nlohmann::json &json, PartConfirmation &part)
    {
        part.part_number = required_part_number(json);
        part.confirmation_token = required_string(json, "confirmationToken");
    }

    void to_json(nlohmann::json &json, const CompleteUpload &upload)
    {
        json = {
            {"inputName", upload.input_name},
            {"stagingHandle", upload.staging_handle},
            {"path", upload.path},
            {"parts", upload.parts},
        };
    }

    void from_json(const nlohmann::json &json, CompleteUpload &upload)
    {
        upload.input_name = json.at("inputName").get<std::string>();
        upload.staging_handle = json.at("stagingHandle").get<std::string>();
        upload.path = json.value("path", std::string{});
        upload.parts = json.value("parts", std::vector<PartConfirmation>{});
    }

    void to_json(nlohmann::json &json, const CompleteRequest &request)
    {
        json = {{"uploads", request.uploads}};
    }

    void from_json(const nlohmann::json &json, CompleteRequest &request)
    {
        request.uploads = json.value("uploads", std::vector<CompleteUpload>{});
    }

    void to_json(nlohmann::json &json, const CompletedFile &file)
    {
        json = {{"inputName", file.input_name}};
        if (file.file_id)
        {
            json["fileId"] = *file.file_id;
        }
        if (file.path)
        {
            json["path"] = *file.path;
        }
    }

    void from_json(const nlohmann::json &json, CompletedFile &file)
    {
        file.input_name = json.value("inputName", std::string{});
        file.file_id = non_empty_string(json, "fileId");
        file.path = non_empty_string(json, "path");
        if (!file.path)
        {
            file.path = non_empty_string(json, "s3Path");
        }
    }

    std::optional<std::string> resolved_identifier(const CompletedFile &file)
    {
        if (file.path)
        {
            return file.path;
        }
        return file.file_id;
    }

    void to_json(nlohmann::json &json, const CompleteResponse &response)
    {
        json = {{"files", response.files}};
    }

    Decoded<InitResponse> decode_init_response(std::string_view body)
    {
        try
        {
            const auto json = nlohmann::json::parse(body);
            if (!json.is_object())
            {
                return ProtocolError{"init response must be a JSON object"};
            }
            return json.get<InitResponse>();
        }
        catch (const std::exception &ex)
        {
            return ProtocolError{std::string("malformed init response: ") + ex.what()};
        }
    }

    Decoded<CompleteResponse> decode_complete_response(std::string_view body)
    {
        if (body.find_first_not_of(" \t\r\n") == std::string_view::npos)
        {
            return CompleteResponse{};
        }
        try
        {
            const auto json = nlohmann::json::parse(body);
            if (!json.is_object())
            {
                return ProtocolError{"complete response must be a JSON object"};
            }
            CompleteResponse response;
            const auto it = json.find("files");
            if (it == json.end())
            {
                return response;
            }
            if (!it->is_array())
            {
                return ProtocolError{"complete response files must be an array"};
            }
            for (const auto &item : *it)
            {
                if (!item.is_object())
                {
                    continue;
                }
                auto file = item.get<CompletedFile>();
                if (file.input_name.empty() || !resolved_identifier(file))
                {
                    continue;
                }
                response.files.push_back(std::move(file));
            }
            return response;
        }
        catch (const std::exception &ex)
        {
            return ProtocolError{std::string("malformed complete response: ") + ex.what()};
        }
    }

    SimpleUploadResponse decode_simple_response(std::string_view body) noexcept
    {
        SimpleUploadResponse response;
        try
        {
            const auto json = nlohmann::json::parse(body, nullptr, false);
            if (json.is_object())
            {
                response.path = non_empty_string(json, "path");
                response.file_id = non_empty_string(json, "fileId");
            }
        }
        catch (const std::exception &)
        {
            response = SimpleUploadResponse{};
        }
        return response;
    }

} // namespace formupload::protocol
