#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "formupload/client/task_pool.hpp"
#include "formupload/client/transfer.hpp"

namespace formupload::client
{

    // Drains the unconfirmed parts of one staged file through a TaskPool.
    class ChunkScheduler : public std::enable_shared_from_this<ChunkScheduler>
    {
    public:
        using DrainedHandler = std::function<void(std::optional<TransferError>)>;

        ChunkScheduler(std::shared_ptr<TransferContext> context, std::shared_ptr<FileState> state);

        void run(DrainedHandler on_drained);

        std::vector<std::uint32_t> pending_parts() const;

    private:
        void transfer_part(std::uint32_t chunk_index, TaskPool::Done done);
        std::optional<std::vector<std::byte>> read_chunk(std::uint32_t chunk_index);

        std::shared_ptr<TransferContext> context_;
        std::shared_ptr<FileState> state_;
        std::shared_ptr<TaskPool> pool_;
    };

} // namespace formupload::client
