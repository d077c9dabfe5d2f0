#include "formupload/client/task_pool.hpp"

#include <algorithm>

namespace formupload::client
{

    TaskPool::TaskPool(std::size_t slots)
        : slots_(std::max<std::size_t>(1, slots)) {}

    void TaskPool::push(Task task)
    {
        queue_.push_back(std::move(task));
        if (running_)
        {
            admit();
        }
    }

    void TaskPool::run(DrainedHandler on_drained)
    {
        on_drained_ = std::move(on_drained);
        running_ = true;
        admit();
    }

    void TaskPool::admit()
    {
        if (admitting_ || finished_)
        {
            return;
        }
        admitting_ = true;
        while (!first_error_ && in_flight_ < slots_ && !queue_.empty())
        {
            auto task = std::move(queue_.front());
            queue_.pop_front();
            ++in_flight_;
            peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
            auto self = shared_from_this();
            task([self](std::optional<TransferError> error)
                 { self->on_task_done(std::move(error)); });
        }
        admitting_ = false;

        if (in_flight_ == 0 && (queue_.empty() || first_error_))
        {
            finished_ = true;
            queue_.clear();
            if (auto handler = std::move(on_drained_))
            {
                on_drained_ = nullptr;
                handler(first_error_);
            }
        }
    }

    void TaskPool::on_task_done(std::optional<TransferError> error)
    {
        --in_flight_;
        if (error && !first_error_)
        {
            first_error_ = std::move(error);
        }
        admit();
    }

} // namespace formupload::client
