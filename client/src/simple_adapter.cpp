#include "formupload/client/simple_adapter.hpp"

#include <algorithm>
#include <stdexcept>

#include "formupload/client/multipart.hpp"
#include "formupload/crypto.hpp"

namespace formupload::client
{

    namespace
    {
        constexpr std::size_t kBoundaryBytes = 16;
    }

    SimpleAdapter::SimpleAdapter(std::shared_ptr<TransferContext> context)
        : context_(std::move(context)) {}

    void SimpleAdapter::start(std::shared_ptr<FileState> state, TransferCompletion on_complete)
    {
        if (state->file_id)
        {
            asio::post(context_->io_context, [on_complete = std::move(on_complete), id = *state->file_id]()
                       { on_complete(id); });
            return;
        }

        state->status = FileStatus::Uploading;
        context_->publish(*state);
        auto detail = context_->describe(*state);
        detail["status"] = to_string(state->status);
        context_->reporter.emit_info("upload.status", std::move(detail));

        if (!state->source)
        {
            asio::post(context_->io_context, [on_complete = std::move(on_complete)]()
                       { on_complete(TransferError{formupload::ErrorCode::MissingChunkData,
                                                   "Missing file data for simple upload."}); });
            return;
        }

        std::vector<std::byte> bytes;
        try
        {
            bytes = state->source->read(0, static_cast<std::size_t>(state->size));
        }
        catch (const std::runtime_error &ex)
        {
            asio::post(context_->io_context, [on_complete = std::move(on_complete), message = std::string(ex.what())]()
                       { on_complete(TransferError{formupload::ErrorCode::MissingChunkData, message}); });
            return;
        }

        MultipartForm form("formupload-" + crypto::random_hex(kBoundaryBytes));
        form.append_field("inputName", state->input_name);
        form.append_field("fileName", state->file_name);
        form.append_field("size", std::to_string(state->size));
        form.append_field("mime", state->mime);
        form.append_file(state->input_name, state->file_name, state->mime, bytes);
        bytes.clear();

        HttpRequest request;
        request.method = "POST";
        request.url = context_->endpoint_url;
        request.headers.emplace_back("Content-Type", form.content_type());
        request.body = form.body();

        auto context = context_;
        context_->transport.async_send(
            std::move(request),
            [context, state](std::uint64_t sent, std::uint64_t total)
            {
                if (state->detached || total == 0)
                {
                    return;
                }
                auto &fraction = state->in_flight[0];
                fraction = std::max(fraction, static_cast<double>(sent) / static_cast<double>(total));
                auto progress = context->describe(*state);
                progress["loaded"] = sent;
                progress["total"] = total;
                context->reporter.emit_info("upload.simple.progress", std::move(progress));
                context->publish(*state);
            },
            [context, state, on_complete = std::move(on_complete)](std::error_code ec, HttpResponse response)
            {
                if (ec)
                {
                    on_complete(TransferError{formupload::ErrorCode::TransferFailed,
                                              "Simple upload network error: " + describe_error(ec)});
                    return;
                }
                if (!response.ok())
                {
                    on_complete(TransferError{formupload::ErrorCode::HttpStatus,
                                              "Simple upload failed: " + std::to_string(response.status)});
                    return;
                }
                const auto decoded = protocol::decode_simple_response(response.body);
                auto identifier = decoded.path ? *decoded.path
                                               : decoded.file_id.value_or(
                                                     synthesized_path(protocol::TransferMode::Simple, *state));
                auto detail = context->describe(*state);
                detail["path"] = identifier;
                context->reporter.emit_info("upload.simple.complete", std::move(detail));
                on_complete(std::move(identifier));
            });
    }

} // namespace formupload::client
