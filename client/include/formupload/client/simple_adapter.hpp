#pragma once

#include <memory>

#include "formupload/client/transfer.hpp"

namespace formupload::client
{

    // Whole file in one multipart POST to the endpoint.
    class SimpleAdapter : public TransferAdapter, public std::enable_shared_from_this<SimpleAdapter>
    {
    public:
        explicit SimpleAdapter(std::shared_ptr<TransferContext> context);

        void start(std::shared_ptr<FileState> state, TransferCompletion on_complete) override;

    private:
        std::shared_ptr<TransferContext> context_;
    };

} // namespace formupload::client
