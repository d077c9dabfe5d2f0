#pragma once

#include <asio.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "formupload/client/chunk_store.hpp"
#include "formupload/client/file_state.hpp"
#include "formupload/client/http_transport.hpp"
#include "formupload/client/reporter.hpp"
#include "formupload/client/task_pool.hpp"
#include "formupload/client/upload_config.hpp"

namespace formupload::client
{

    // Remote file identifier on success.
    using TransferOutcome = std::variant<std::string, TransferError>;
    using TransferCompletion = std::function<void(TransferOutcome)>;

    // Collaborators shared by every transfer of one session.
    struct TransferContext
    {
        asio::io_context &io_context;
        HttpTransport &transport;
        ChunkStore &store;
        UploadReporter &reporter;
        UploadConfig config;
        EngineOptions options;
        std::string session_id;
        // Absolute endpoint without trailing slash.
        std::string endpoint_url;

        // Store failures are reported as error events and otherwise ignored.
        void persist(const FileState &state, std::string_view failure_message) const;
        void publish(const FileState &state) const;
        void prune_chunk(const FileState &state, std::uint32_t chunk_index) const;

        ChunkKey chunk_key(const FileState &state, std::uint32_t chunk_index) const;
        nlohmann::json describe(const FileState &state) const;
    };

    // Moves one file's bytes to the remote store. start() on a file that already has a remote
    // identifier completes immediately with that identifier.
    class TransferAdapter
    {
    public:
        virtual ~TransferAdapter() = default;

        virtual void start(std::shared_ptr<FileState> state, TransferCompletion on_complete) = 0;
    };

    std::shared_ptr<TransferAdapter> make_transfer_adapter(std::shared_ptr<TransferContext> context);

    std::string describe_error(const std::error_code &ec);

} // namespace formupload::client
