#include "formupload/client/cli_session.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <map>

#include "formupload/version.hpp"

namespace formupload::client
{

    namespace
    {
        constexpr auto kPagePath = "cli";
        constexpr auto kDefaultFormId = "cli";
        constexpr auto kSubmitTarget = "submit";

        std::string guess_mime(const std::filesystem::path &path)
        {
            static const std::map<std::string, std::string> kMimeByExtension{
                {".txt", "text/plain"},
                {".csv", "text/csv"},
                {".json", "application/json"},
                {".pdf", "application/pdf"},
                {".png", "image/png"},
                {".jpg", "image/jpeg"},
                {".jpeg", "image/jpeg"},
                {".gif", "image/gif"},
                {".zip", "application/zip"},
                {".mp4", "video/mp4"},
            };
            auto extension = path.extension().string();
            std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            if (auto it = kMimeByExtension.find(extension); it != kMimeByExtension.end())
            {
                return it->second;
            }
            return "application/octet-stream";
        }

        std::filesystem::path state_dir_for(const ClientConfig &config)
        {
            return config.state_dir.value_or(SessionStateStore::default_state_dir());
        }

    } // namespace

    CliSession::CliSession(ClientConfig config, Logger logger)
        : config_(std::move(config)), logger_(std::move(logger)), transport_(io_context_),
          state_dir_(state_dir_for(config_)), store_(state_dir_ / "chunks"),
          state_store_(state_dir_ / "sessions.json"), reporter_(logger_)
    {
        EngineOptions options;
        if (config_.concurrency)
        {
            options.concurrency = *config_.concurrency;
        }
        options.base_url = config_.action_url;
        engine_ = std::make_unique<UploadEngine>(io_context_, transport_, store_, state_store_, reporter_, *this,
                                                 options);
        reporter_.add_listener([this](const UploadEvent &event)
                               { on_event(event); });
    }

    int CliSession::run()
    {
        logger_.log("cli", "formupload ", formupload::version(), " starting");
        auto session_id = engine_->attach_form(declaration());
        if (!session_id)
        {
            std::cerr << "ERROR: upload configuration rejected" << std::endl;
            return 2;
        }
        session_id_ = *session_id;

        const auto *session = engine_->find_session(session_id_);
        if (!config_.files.empty())
        {
            if (!select_files())
            {
                return 1;
            }
            asio::post(io_context_, [this]()
                       { submit(initial_submission(), false); });
        }
        else if (session != nullptr && session->pending)
        {
            std::cout << "Resuming deferred submission for " << session->files.size() << " file(s)" << std::endl;
            waiting_for_replay_ = true;
        }
        else if (!replay_started_)
        {
            asio::post(io_context_, [this]()
                       { submit(initial_submission(), false); });
        }

        io_context_.run();

        if (exit_code_)
        {
            return *exit_code_;
        }
        if (engine_->any_failed(session_id_))
        {
            return 1;
        }
        if (waiting_for_replay_)
        {
            std::cerr << "ERROR: uploads did not finish; deferred submission was not sent" << std::endl;
            return 1;
        }
        return 0;
    }

    std::optional<std::string> CliSession::resolve_submit_target(const std::optional<std::string> &form_id,
                                                                 const std::optional<std::string> &target_hint)
    {
        if (form_id && *form_id != config_.form_id.value_or(kDefaultFormId))
        {
            return std::nullopt;
        }
        if (target_hint && *target_hint != kSubmitTarget)
        {
            return std::nullopt;
        }
        return std::string(kSubmitTarget);
    }

    void CliSession::submit(const FormSubmission &submission, bool skip_gate)
    {
        auto payload = submission.payload;
        if (!skip_gate)
        {
            const auto result = engine_->gate(submission);
            if (result.blocked)
            {
                if (result.deferred)
                {
                    waiting_for_replay_ = true;
                    std::cout << "Submission deferred until uploads finish" << std::endl;
                }
                else
                {
                    exit_code_ = 1;
                    std::cerr << "ERROR: submission blocked by a failed upload" << std::endl;
                }
                return;
            }
            payload = result.rewritten_payload.value_or(payload);
        }
        else
        {
            replay_started_ = true;
        }
        waiting_for_replay_ = false;

        HttpRequest request;
        request.method = submission.method;
        request.url = submission.action_url;
        request.headers.emplace_back("Content-Type", "application/json");
        request.body = protocol::dump_json(payload);
        logger_.log("cli", "submitting form to ", request.url);

        const auto session_id = submission.session_id;
        transport_.async_send(std::move(request), nullptr,
                              [this, session_id](std::error_code ec, HttpResponse response)
                              {
                                  if (ec)
                                  {
                                      exit_code_ = 1;
                                      std::cerr << "ERROR: submission failed: " << ec.message() << std::endl;
                                      return;
                                  }
                                  if (!response.ok())
                                  {
                                      exit_code_ = 1;
                                      std::cerr << "ERROR: submission rejected with status " << response.status
                                                << std::endl;
                                      return;
                                  }
                                  exit_code_ = 0;
                                  std::cout << "Submitted (" << response.status << ")" << std::endl;
                                  if (!response.body.empty())
                                  {
                                      std::cout << response.body << std::endl;
                                  }
                                  engine_->notify_submission_succeeded(session_id);
                              });
    }

    UploadDeclaration CliSession::declaration() const
    {
        UploadDeclaration declaration;
        declaration.mode = config_.mode;
        declaration.endpoint = config_.endpoint;
        declaration.form_action = config_.action_url;
        declaration.chunk_size_mib = config_.chunk_size_mib;
        declaration.after_submit = config_.after_submit;
        declaration.form_id = config_.form_id.value_or(kDefaultFormId);
        declaration.page_path = kPagePath;
        declaration.file_inputs = {config_.input_name};
        return declaration;
    }

    FormSubmission CliSession::initial_submission() const
    {
        FormSubmission submission;
        submission.session_id = session_id_;
        submission.method = config_.method;
        submission.action_url = config_.action_url;
        submission.target_id = kSubmitTarget;
        for (const auto &[key, value] : config_.fields)
        {
            submission.payload[key] = value;
        }
        return submission;
    }

    bool CliSession::select_files()
    {
        std::vector<SelectedFile> files;
        for (const auto &path : config_.files)
        {
            try
            {
                auto source = std::make_shared<FileByteSource>(path);
                files.push_back(SelectedFile{path.filename().string(), guess_mime(path), std::move(source)});
            }
            catch (const std::runtime_error &ex)
            {
                std::cerr << "ERROR: " << ex.what() << std::endl;
                return false;
            }
        }
        return engine_->select_files(session_id_, config_.input_name, std::move(files));
    }

    void CliSession::on_event(const UploadEvent &event)
    {
        if (event.type == EventType::Error)
        {
            std::cerr << "ERROR: " << event.message;
            if (auto it = event.detail.find("error"); it != event.detail.end() && it->is_string())
            {
                std::cerr << ": " << it->get<std::string>();
            }
            std::cerr << std::endl;
        }
        if (event.message == "upload.status" || event.message == "upload.chunk.complete" ||
            event.message == "upload.failed")
        {
            print_progress();
        }
        else if (event.message == "submit:clear")
        {
            std::cout << "Cleared uploaded files" << std::endl;
        }
    }

    void CliSession::print_progress() const
    {
        for (const auto &entry : reporter_.entries())
        {
            std::cout << std::left << std::setw(32) << entry.file_name << ' ' << std::right << std::setw(3)
                      << static_cast<int>(entry.progress * 100.0) << "% " << entry.uploaded_chunks << '/'
                      << entry.total_chunks << ' ' << to_string(entry.status) << std::endl;
        }
    }

} // namespace formupload::client
