#include "formupload/client/transfer.hpp"

#include "formupload/client/simple_adapter.hpp"
#include "formupload/client/staged_adapter.hpp"

namespace formupload::client
{

    void TransferContext::persist(const FileState &state, std::string_view failure_message) const
    {
        if (state.detached)
        {
            return;
        }
        try
        {
            store.put_file_record(state.record());
        }
        catch (const StoreError &ex)
        {
            auto detail = describe(state);
            detail["error"] = ex.what();
            detail["code"] = formupload::to_string(ex.code());
            reporter.emit_error(std::string(failure_message), std::move(detail));
        }
    }

    void TransferContext::publish(const FileState &state) const
    {
        if (!state.detached)
        {
            reporter.upsert_entry(state, config.form_id);
        }
    }

    void TransferContext::prune_chunk(const FileState &state, std::uint32_t chunk_index) const
    {
        if (state.detached)
        {
            return;
        }
        try
        {
            store.delete_chunk(chunk_key(state, chunk_index));
        }
        catch (const StoreError &ex)
        {
            auto detail = describe(state);
            detail["chunkIndex"] = chunk_index;
            detail["error"] = ex.what();
            reporter.emit_error("Failed to prune uploaded chunk; continuing.", std::move(detail));
        }
    }

    ChunkKey TransferContext::chunk_key(const FileState &state, std::uint32_t chunk_index) const
    {
        return ChunkKey{session_id, state.input_name, state.file_index, chunk_index};
    }

    nlohmann::json TransferContext::describe(const FileState &state) const
    {
        return {
            {"sessionId", session_id},
            {"uploadUuid", state.file_uuid},
            {"inputName", state.input_name},
            {"fileIndex", state.file_index},
        };
    }

    std::shared_ptr<TransferAdapter> make_transfer_adapter(std::shared_ptr<TransferContext> context)
    {
        if (context->config.mode == protocol::TransferMode::Staged)
        {
            return std::make_shared<StagedAdapter>(std::move(context));
        }
        return std::make_shared<SimpleAdapter>(std::move(context));
    }

    std::string describe_error(const std::error_code &ec)
    {
        return ec.message() + " (" + ec.category().name() + ":" + std::to_string(ec.value()) + ")";
    }

} // namespace formupload::client
