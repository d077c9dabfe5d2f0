#include "formupload/client/upload_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace formupload::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::optional<std::string> trimmed_non_empty(const std::optional<std::string> &value)
        {
            if (!value)
            {
                return std::nullopt;
            }
            auto trimmed = trim(*value);
            if (trimmed.empty())
            {
                return std::nullopt;
            }
            return trimmed;
        }

        std::string strip_trailing_slash(std::string url)
        {
            while (url.size() > 1 && url.back() == '/')
            {
                url.pop_back();
            }
            return url;
        }

        std::optional<double> parse_positive_number(const std::string &raw)
        {
            try
            {
                std::size_t consumed = 0;
                const double value = std::stod(raw, &consumed);
                if (consumed != raw.size() || !std::isfinite(value) || value <= 0.0)
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::logic_error &)
            {
                return std::nullopt;
            }
        }

        std::uint64_t resolve_chunk_size(const UploadDeclaration &declaration, std::vector<std::string> &diagnostics)
        {
            if (!declaration.chunk_size_mib)
            {
                return static_cast<std::uint64_t>(kDefaultChunkSizeMiB * static_cast<double>(kMiB));
            }
            const auto parsed = parse_positive_number(trim(*declaration.chunk_size_mib));
            if (!parsed)
            {
                diagnostics.push_back("chunk size must be a positive number (got \"" + *declaration.chunk_size_mib + "\")");
                return static_cast<std::uint64_t>(kDefaultChunkSizeMiB * static_cast<double>(kMiB));
            }
            double normalized = *parsed;
            if (normalized < kMinChunkSizeMiB)
            {
                diagnostics.push_back("chunk size must be at least 5 MiB; raised from " + trim(*declaration.chunk_size_mib));
                normalized = kMinChunkSizeMiB;
            }
            else if (normalized > kMaxChunkSizeMiB)
            {
                diagnostics.push_back("chunk size must be at most 5120 MiB; lowered from " + trim(*declaration.chunk_size_mib));
                normalized = kMaxChunkSizeMiB;
            }
            return static_cast<std::uint64_t>(std::llround(normalized * static_cast<double>(kMiB)));
        }

    } // namespace

    std::string_view to_string(AfterSubmitAction action) noexcept
    {
        return action == AfterSubmitAction::Clear ? "clear" : "keep";
    }

    ConfigResolution resolve_upload_config(const UploadDeclaration &declaration)
    {
        ConfigResolution resolution;
        auto &diagnostics = resolution.diagnostics;

        const auto raw_mode = declaration.mode ? trim(*declaration.mode) : std::string{};
        const auto mode = raw_mode.empty() ? std::optional{protocol::TransferMode::Simple}
                                           : protocol::transfer_mode_from_string(to_lower(raw_mode));
        if (!mode)
        {
            diagnostics.push_back("upload mode must be \"staged\" or \"simple\" (got \"" + raw_mode + "\")");
            return resolution;
        }

        auto endpoint = trimmed_non_empty(declaration.endpoint);
        if (!endpoint && *mode == protocol::TransferMode::Simple)
        {
            endpoint = trimmed_non_empty(declaration.form_action);
        }
        if (!endpoint)
        {
            if (*mode == protocol::TransferMode::Staged)
            {
                diagnostics.push_back("an uploader endpoint is required for staged uploads");
            }
            else
            {
                diagnostics.push_back("simple uploads require an uploader endpoint or a form action");
            }
            return resolution;
        }

        UploadConfig config;
        config.mode = *mode;
        config.endpoint = strip_trailing_slash(*endpoint);
        config.chunk_size_bytes = resolve_chunk_size(declaration, diagnostics);
        config.redirect_declared = declaration.redirect_declared;
        config.form_id = trimmed_non_empty(declaration.form_id);
        config.file_inputs = declaration.file_inputs;

        if (declaration.after_submit)
        {
            const auto action = to_lower(trim(*declaration.after_submit));
            if (action == "clear")
            {
                config.after_submit = AfterSubmitAction::Clear;
            }
            else if (action != "keep" && !action.empty())
            {
                diagnostics.push_back("after-submit action must be \"clear\" or \"keep\" (got \"" +
                                      *declaration.after_submit + "\")");
            }
        }

        if (config.after_submit == AfterSubmitAction::Clear && declaration.redirect_declared)
        {
            config.redirect_conflict = true;
            diagnostics.push_back("a redirect and after-submit \"clear\" cannot be used together");
        }

        resolution.config = std::move(config);
        return resolution;
    }

    std::optional<std::string> session_key_for(const UploadDeclaration &declaration)
    {
        const std::string prefix = declaration.page_path + ":";
        if (auto id = trimmed_non_empty(declaration.form_id))
        {
            return prefix + "form:" + *id;
        }
        if (auto name = trimmed_non_empty(declaration.form_name))
        {
            return prefix + "form-name:" + *name;
        }
        if (auto action = trimmed_non_empty(declaration.form_action))
        {
            return prefix + "form-action:" + *action;
        }
        return std::nullopt;
    }

} // namespace formupload::client
