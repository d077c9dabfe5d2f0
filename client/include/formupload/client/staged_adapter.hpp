#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "formupload/client/transfer.hpp"

namespace formupload::client
{

    // init -> parallel part PUTs -> complete. Init and complete requests are batched per event-loop turn.
    class StagedAdapter : public TransferAdapter, public std::enable_shared_from_this<StagedAdapter>
    {
    public:
        explicit StagedAdapter(std::shared_ptr<TransferContext> context);

        void start(std::shared_ptr<FileState> state, TransferCompletion on_complete) override;

    private:
        struct Job
        {
            std::shared_ptr<FileState> state;
            TransferCompletion on_complete;
        };

        void request_init(Job job);
        void flush_init();
        void on_init_response(std::vector<Job> batch, const std::error_code &ec, const HttpResponse &response);
        void apply_init(Job &job, const protocol::InitUpload &upload);

        void transfer_parts(Job job);

        void request_complete(Job job);
        void flush_complete();
        void on_complete_response(std::vector<Job> batch, const std::error_code &ec, const HttpResponse &response);

        void fail(Job &job, formupload::ErrorCode code, std::string message);
        void fail_all(std::vector<Job> &batch, formupload::ErrorCode code, const std::string &message);

        std::shared_ptr<TransferContext> context_;
        std::vector<Job> init_batch_;
        bool init_scheduled_{false};
        std::vector<Job> complete_batch_;
        bool complete_scheduled_{false};
    };

} // namespace formupload::client
