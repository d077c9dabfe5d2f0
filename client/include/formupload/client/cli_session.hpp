#pragma once

#include <asio.hpp>

#include <memory>
#include <optional>
#include <string>

#include "formupload/client/chunk_store.hpp"
#include "formupload/client/config.hpp"
#include "formupload/client/http_transport.hpp"
#include "formupload/client/logger.hpp"
#include "formupload/client/reporter.hpp"
#include "formupload/client/session_state_store.hpp"
#include "formupload/client/submission.hpp"
#include "formupload/client/upload_engine.hpp"

namespace formupload::client
{

    // Command-line host: one form, one file input, submission as a JSON POST to the action URL.
    class CliSession : public SubmissionPipeline
    {
    public:
        CliSession(ClientConfig config, Logger logger);

        int run();

        std::optional<std::string> resolve_submit_target(const std::optional<std::string> &form_id,
                                                         const std::optional<std::string> &target_hint) override;
        void submit(const FormSubmission &submission, bool skip_gate) override;

    private:
        UploadDeclaration declaration() const;
        FormSubmission initial_submission() const;
        bool select_files();
        void on_event(const UploadEvent &event);
        void print_progress() const;

        ClientConfig config_;
        Logger logger_;
        asio::io_context io_context_;
        AsioHttpTransport transport_;
        std::filesystem::path state_dir_;
        DiskChunkStore store_;
        SessionStateStore state_store_;
        UploadReporter reporter_;
        std::unique_ptr<UploadEngine> engine_;
        std::string session_id_;
        bool waiting_for_replay_{false};
        bool replay_started_{false};
        std::optional<int> exit_code_;
    };

} // namespace formupload::client
