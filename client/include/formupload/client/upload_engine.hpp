#pragma once

#include <asio.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "formupload/client/byte_source.hpp"
#include "formupload/client/chunk_store.hpp"
#include "formupload/client/file_state.hpp"
#include "formupload/client/http_transport.hpp"
#include "formupload/client/reporter.hpp"
#include "formupload/client/session_state_store.hpp"
#include "formupload/client/submission.hpp"
#include "formupload/client/transfer.hpp"
#include "formupload/client/upload_config.hpp"

namespace formupload::client
{

    struct SelectedFile
    {
        std::string name;
        std::string mime;
        std::shared_ptr<ByteRangeSource> source;
    };

    struct UploadSession
    {
        std::string id;
        UploadConfig config;
        std::optional<std::string> session_key;
        // make_file_key(input, index) -> state
        std::map<std::string, std::shared_ptr<FileState>> files;
        std::optional<PendingSubmission> pending;
        std::shared_ptr<TransferContext> context;
        std::shared_ptr<TransferAdapter> adapter;
        std::unique_ptr<asio::steady_timer> clear_timer;
    };

    // Owns every upload session of the process. All calls must come from the io_context thread,
    // and the engine must outlive io_context.run().
    class UploadEngine
    {
    public:
        UploadEngine(asio::io_context &io_context, HttpTransport &transport, ChunkStore &store,
                     SessionStateStore &state_store, UploadReporter &reporter, SubmissionPipeline &pipeline,
                     EngineOptions options = {});

        UploadEngine(const UploadEngine &) = delete;
        UploadEngine &operator=(const UploadEngine &) = delete;

        // Returns the session id, or nothing when the declaration does not produce a usable config.
        // Attaching restores persisted files and any deferred submission of the same form.
        std::optional<std::string> attach_form(const UploadDeclaration &declaration);

        // Replaces every file previously selected for input_name.
        bool select_files(const std::string &session_id, const std::string &input_name,
                          std::vector<SelectedFile> files);

        // Only forms with exactly one file input accept drops.
        bool drop_files(const std::string &session_id, std::vector<SelectedFile> files);

        GateResult gate(const FormSubmission &submission);

        // Schedules the post-submit clear when the form asks for it.
        void notify_submission_succeeded(const std::string &session_id);

        void clear_session(const std::string &session_id);

        const UploadSession *find_session(const std::string &session_id) const;
        bool all_completed(const std::string &session_id) const;
        bool any_failed(const std::string &session_id) const;

        // Form payload value for every completed file: { fileId, contentType, fileName, fileSize },
        // an array when an input holds several files.
        static nlohmann::json file_payload(const UploadSession &session);

    private:
        UploadSession *lookup(const std::string &session_id);
        std::string endpoint_for(const UploadConfig &config) const;
        std::string resolve_action(const std::string &action_url) const;

        void resume_session(UploadSession &session);
        std::shared_ptr<FileState> restore_file(UploadSession &session, FileRecord record);
        void discard_file(UploadSession &session, FileState &state);
        void store_chunks(UploadSession &session, FileState &state);
        void start_file(UploadSession &session, const std::shared_ptr<FileState> &state);
        void on_transfer_finished(const std::string &session_id, const std::shared_ptr<FileState> &state,
                                  TransferOutcome outcome);
        void mark_failed(UploadSession &session, FileState &state, const TransferError &error);
        void maybe_submit_pending(UploadSession &session);
        void write_pending(UploadSession &session, PendingSubmission pending);
        void drop_pending(UploadSession &session);

        asio::io_context &io_context_;
        HttpTransport &transport_;
        ChunkStore &store_;
        SessionStateStore &state_store_;
        UploadReporter &reporter_;
        SubmissionPipeline &pipeline_;
        EngineOptions options_;
        std::map<std::string, std::unique_ptr<UploadSession>> sessions_;
    };

} // namespace formupload::client
