#include "http_exchange.hpp"
#include "connection_bridge.hpp"

#include <boost/asio/connect.hpp>

namespace bridge
{
    HttpExchange::HttpExchange(boost::asio::io_context &ioc, std::string host)
        : socket_(ioc), host_(std::move(host))
    {
        parser_.body_limit(MAX_RESPONSE_BODY);
    }

    void HttpExchange::run(const tcp::resolver::results_type &endpoints,
                           const std::string &target,
                           const std::string &body,
                           Handler handler)
    {
        handler_ = std::move(handler);

        req_ = http::request<http::string_body>{http::verb::post, target, 11};
        req_.set(http::field::host, host_);
        req_.set(http::field::user_agent, CLIENT_AGENT);
        req_.set(http::field::content_type, "application/json");
        req_.keep_alive(false);
        req_.body() = body;
        req_.prepare_payload();

        auto self = shared_from_this();
        boost::asio::async_connect(socket_, endpoints,
                                   [self](beast::error_code ec, const tcp::endpoint &)
                                   {
                                       if (ec)
                                           return self->finish(ec);
                                       self->doWrite();
                                   });
    }

    void HttpExchange::cancel()
    {
        beast::error_code ec;
        socket_.close(ec);
    }

    void HttpExchange::doWrite()
    {
        auto self = shared_from_this();
        http::async_write(socket_, req_,
                          [self](beast::error_code ec, std::size_t)
                          {
                              if (ec)
                                  return self->finish(ec);
                              self->doRead();
                          });
    }

    void HttpExchange::doRead()
    {
        auto self = shared_from_this();
        http::async_read(socket_, buffer_, parser_,
                         [self](beast::error_code ec, std::size_t)
                         {
                             self->finish(ec);
                         });
    }

    void HttpExchange::finish(beast::error_code ec)
    {
        if (done_)
            return;
        done_ = true;

        beast::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);

        Handler handler = std::move(handler_);
        handler_ = nullptr;
        if (!handler)
            return;
        if (ec)
            handler(ec, http::response<http::string_body>{});
        else
            handler(ec, parser_.release());
    }

    json decodeResponse(beast::error_code ec, const http::response<http::string_body> &res)
    {
        if (ec == boost::asio::error::operation_aborted)
        {
            throw ConnectionClosedError("Request aborted before a reply arrived");
        }
        if (ec)
        {
            throw BridgeError("Transport error: " + ec.message());
        }

        json body = json::parse(res.body(), nullptr, false);
        int status = static_cast<int>(res.result_int());
        if (status != 200)
        {
            std::string message = "HTTP " + std::to_string(status);
            if (body.is_object() && body.contains("error") && body["error"].is_string())
            {
                message = body["error"].get<std::string>();
            }
            throw RemoteError(status, message);
        }
        if (body.is_discarded())
        {
            throw RemoteError(status, "Malformed response body");
        }
        return body;
    }
}
