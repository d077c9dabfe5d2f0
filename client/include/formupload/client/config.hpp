#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace formupload::client
{

    struct ClientConfig
    {
        std::string action_url;
        std::optional<std::string> endpoint;
        std::optional<std::string> mode;
        std::optional<std::string> chunk_size_mib;
        std::string method{"POST"};
        std::optional<std::string> form_id;
        std::string input_name{"file"};
        std::vector<std::pair<std::string, std::string>> fields;
        std::optional<std::filesystem::path> state_dir;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::string> after_submit;
        std::optional<std::size_t> concurrency;
        std::vector<std::filesystem::path> files;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace formupload::client
