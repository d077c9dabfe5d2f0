#pragma once

#include <asio.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace formupload::client
{

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
    };

    struct HttpResponse
    {
        unsigned int status{};
        // Header names are lowercased.
        std::map<std::string, std::string> headers;
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }
        std::optional<std::string> header(std::string_view name) const;
    };

    using ProgressHandler = std::function<void(std::uint64_t sent, std::uint64_t total)>;
    using ResponseHandler = std::function<void(std::error_code ec, HttpResponse response)>;

    // One request per call; the response handler runs exactly once on the owning io_context.
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual void async_send(HttpRequest request, ProgressHandler on_progress, ResponseHandler on_response) = 0;
    };

    // HTTP/1.1 over plain TCP, one connection per request. Messages are framed with Boost.Beast.
    class AsioHttpTransport : public HttpTransport
    {
    public:
        explicit AsioHttpTransport(asio::io_context &io_context);

        void async_send(HttpRequest request, ProgressHandler on_progress, ResponseHandler on_response) override;

    private:
        asio::io_context &io_context_;
    };

} // namespace formupload::client
