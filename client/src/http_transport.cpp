#include "formupload/client/http_transport.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <memory>
#include <sstream>

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include "formupload/client/url.hpp"

namespace formupload::client
{

    namespace
    {
        namespace http = boost::beast::http;

        constexpr std::size_t kWriteSegment = 64 * 1024;
        constexpr std::size_t kReadSegment = 16 * 1024;
        constexpr std::uint64_t kMaxResponseBody = 64 * 1024 * 1024;

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        std::string to_std(boost::beast::string_view value)
        {
            return std::string(value.data(), value.size());
        }

        std::error_code protocol_error()
        {
            return std::make_error_code(std::errc::protocol_error);
        }

        // Head of the outgoing request; the body is written separately so progress can be reported.
        std::string serialize_head(const Url &url, const HttpRequest &request)
        {
            http::request<http::empty_body> head;
            head.method_string(request.method);
            head.target(url.target);
            head.version(11);
            head.set(http::field::host, url.authority());
            head.set(http::field::connection, "close");
            head.content_length(request.body.size());
            for (const auto &[name, value] : request.headers)
            {
                head.set(name, value);
            }
            std::ostringstream out;
            out << head.base();
            return out.str();
        }

        class HttpExchange : public std::enable_shared_from_this<HttpExchange>
        {
        public:
            HttpExchange(asio::io_context &io_context, Url url, HttpRequest request, ProgressHandler on_progress,
                         ResponseHandler on_response)
                : resolver_(io_context), socket_(io_context), url_(std::move(url)), request_(std::move(request)),
                  on_progress_(std::move(on_progress)), on_response_(std::move(on_response))
            {
                parser_.eager(true);
                parser_.body_limit(kMaxResponseBody);
                if (request_.method == "HEAD")
                {
                    parser_.skip(true);
                }
            }

            void start()
            {
                auto self = shared_from_this();
                resolver_.async_resolve(url_.host, std::to_string(url_.port),
                                        [this, self](const std::error_code &ec,
                                                     const asio::ip::tcp::resolver::results_type &results)
                                        {
                                            if (ec)
                                            {
                                                finish(ec);
                                                return;
                                            }
                                            connect(results);
                                        });
            }

        private:
            void connect(const asio::ip::tcp::resolver::results_type &results)
            {
                auto self = shared_from_this();
                asio::async_connect(socket_, results,
                                    [this, self](const std::error_code &ec, const asio::ip::tcp::endpoint &)
                                    {
                                        if (ec)
                                        {
                                            finish(ec);
                                            return;
                                        }
                                        write_head();
                                    });
            }

            void write_head()
            {
                try
                {
                    head_ = serialize_head(url_, request_);
                }
                catch (const std::exception &)
                {
                    finish(std::make_error_code(std::errc::invalid_argument));
                    return;
                }

                auto self = shared_from_this();
                asio::async_write(socket_, asio::buffer(head_),
                                  [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                                  {
                                      if (ec)
                                      {
                                          finish(ec);
                                          return;
                                      }
                                      write_body();
                                  });
            }

            void write_body()
            {
                if (body_offset_ >= request_.body.size())
                {
                    read_response();
                    return;
                }
                const auto length = std::min(kWriteSegment, request_.body.size() - body_offset_);
                auto self = shared_from_this();
                asio::async_write(socket_, asio::buffer(request_.body.data() + body_offset_, length),
                                  [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                  {
                                      if (ec)
                                      {
                                          finish(ec);
                                          return;
                                      }
                                      body_offset_ += bytes_transferred;
                                      if (on_progress_)
                                      {
                                          on_progress_(body_offset_, request_.body.size());
                                      }
                                      write_body();
                                  });
            }

            void read_response()
            {
                auto self = shared_from_this();
                socket_.async_read_some(asio::buffer(read_buffer_),
                                        [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                        {
                                            pending_.append(read_buffer_.data(), bytes_transferred);
                                            if (!feed_parser())
                                            {
                                                finish(protocol_error());
                                                return;
                                            }
                                            if (parser_.is_done())
                                            {
                                                complete();
                                                return;
                                            }
                                            if (ec == asio::error::eof)
                                            {
                                                on_eof();
                                                return;
                                            }
                                            if (ec)
                                            {
                                                finish(ec);
                                                return;
                                            }
                                            read_response();
                                        });
            }

            // Hands buffered bytes to the parser; whatever it cannot consume yet stays in pending_.
            bool feed_parser()
            {
                while (!pending_.empty() && !parser_.is_done())
                {
                    boost::beast::error_code ec;
                    const auto used = parser_.put(boost::asio::buffer(pending_.data(), pending_.size()), ec);
                    pending_.erase(0, used);
                    if (ec == http::error::need_more)
                    {
                        return true;
                    }
                    if (ec)
                    {
                        return false;
                    }
                    if (used == 0)
                    {
                        return true;
                    }
                }
                return true;
            }

            void on_eof()
            {
                if (!parser_.got_some())
                {
                    finish(asio::error::eof);
                    return;
                }
                // Bodies delimited by connection close end here; anything else is truncated.
                boost::beast::error_code ec;
                parser_.put_eof(ec);
                if (ec || !parser_.is_done())
                {
                    finish(protocol_error());
                    return;
                }
                complete();
            }

            void complete()
            {
                auto message = parser_.release();
                response_.status = message.result_int();
                for (const auto &field : message)
                {
                    response_.headers[lowercase(to_std(field.name_string()))] = to_std(field.value());
                }
                response_.body = std::move(message.body());
                finish({});
            }

            void finish(const std::error_code &ec)
            {
                if (!on_response_)
                {
                    return;
                }
                std::error_code ignored;
                socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
                socket_.close(ignored);
                auto handler = std::move(on_response_);
                on_response_ = nullptr;
                handler(ec, ec ? HttpResponse{} : std::move(response_));
            }

            asio::ip::tcp::resolver resolver_;
            asio::ip::tcp::socket socket_;
            Url url_;
            HttpRequest request_;
            ProgressHandler on_progress_;
            ResponseHandler on_response_;
            std::string head_;
            std::size_t body_offset_{0};
            std::array<char, kReadSegment> read_buffer_{};
            std::string pending_;
            http::response_parser<http::string_body> parser_;
            HttpResponse response_;
        };

    } // namespace

    std::optional<std::string> HttpResponse::header(std::string_view name) const
    {
        if (auto it = headers.find(lowercase(std::string(name))); it != headers.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    AsioHttpTransport::AsioHttpTransport(asio::io_context &io_context)
        : io_context_(io_context) {}

    void AsioHttpTransport::async_send(HttpRequest request, ProgressHandler on_progress, ResponseHandler on_response)
    {
        auto url = parse_url(request.url);
        if (!url)
        {
            asio::post(io_context_, [handler = std::move(on_response)]()
                       { handler(std::make_error_code(std::errc::invalid_argument), HttpResponse{}); });
            return;
        }
        auto exchange = std::make_shared<HttpExchange>(io_context_, std::move(*url), std::move(request),
                                                       std::move(on_progress), std::move(on_response));
        exchange->start();
    }

} // namespace formupload::client
