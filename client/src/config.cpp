#include "formupload/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace formupload::client
{

    namespace
    {
        std::string read_option(int argc, char *argv[], int &index, const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }
    } // namespace

    std::string usage()
    {
        return "Usage: formupload --action <url> [--endpoint <url>] [--mode simple|staged] [--chunk-size <MiB>]\n"
               "                  [--method <verb>] [--form-id <id>] [--input <name>] [--field key=value]...\n"
               "                  [--state-dir <dir>] [--log <file>] [--after-submit keep|clear]\n"
               "                  [--concurrency <n>] [file...]";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--action")
            {
                config.action_url = read_option(argc, argv, index, arg);
            }
            else if (arg == "--endpoint")
            {
                config.endpoint = read_option(argc, argv, index, arg);
            }
            else if (arg == "--mode")
            {
                config.mode = read_option(argc, argv, index, arg);
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size_mib = read_option(argc, argv, index, arg);
            }
            else if (arg == "--method")
            {
                config.method = read_option(argc, argv, index, arg);
            }
            else if (arg == "--form-id")
            {
                config.form_id = read_option(argc, argv, index, arg);
            }
            else if (arg == "--input")
            {
                config.input_name = read_option(argc, argv, index, arg);
            }
            else if (arg == "--field")
            {
                const auto field = read_option(argc, argv, index, arg);
                const auto eq = field.find('=');
                if (eq == std::string::npos || eq == 0)
                {
                    throw std::runtime_error("--field expects key=value");
                }
                config.fields.emplace_back(field.substr(0, eq), field.substr(eq + 1));
            }
            else if (arg == "--state-dir")
            {
                config.state_dir = std::filesystem::path(read_option(argc, argv, index, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(read_option(argc, argv, index, arg));
            }
            else if (arg == "--after-submit")
            {
                config.after_submit = read_option(argc, argv, index, arg);
            }
            else if (arg == "--concurrency")
            {
                const auto value = std::stoull(read_option(argc, argv, index, arg));
                if (value == 0)
                {
                    throw std::runtime_error("--concurrency must be at least 1");
                }
                config.concurrency = static_cast<std::size_t>(value);
            }
            else if (arg == "--help" || arg == "-h")
            {
                throw std::runtime_error(usage());
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.files.emplace_back(arg);
            }
        }

        if (config.action_url.empty())
        {
            throw std::runtime_error(usage());
        }
        return config;
    }

} // namespace formupload::client
