#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "formupload/error_codes.hpp"

namespace formupload::client
{

    struct TransferError
    {
        formupload::ErrorCode code{formupload::ErrorCode::TransferFailed};
        std::string message;
    };

    // Runs queued asynchronous tasks with at most `slots` of them in flight.
    // The first failure stops admission; tasks already running are allowed to finish.
    class TaskPool : public std::enable_shared_from_this<TaskPool>
    {
    public:
        using Done = std::function<void(std::optional<TransferError>)>;
        using Task = std::function<void(Done)>;
        using DrainedHandler = std::function<void(std::optional<TransferError>)>;

        explicit TaskPool(std::size_t slots);

        void push(Task task);

        // on_drained fires once, when nothing is in flight and the queue is empty or admission stopped.
        void run(DrainedHandler on_drained);

        std::size_t in_flight() const noexcept { return in_flight_; }
        std::size_t peak_in_flight() const noexcept { return peak_in_flight_; }
        bool stopped() const noexcept { return first_error_.has_value(); }

    private:
        void admit();
        void on_task_done(std::optional<TransferError> error);

        std::size_t slots_;
        std::deque<Task> queue_;
        std::size_t in_flight_{0};
        std::size_t peak_in_flight_{0};
        std::optional<TransferError> first_error_;
        DrainedHandler on_drained_;
        bool running_{false};
        bool admitting_{false};
        bool finished_{false};
    };

} // namespace formupload::client
