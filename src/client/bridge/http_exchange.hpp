#ifndef HTTP_EXCHANGE_HPP
#define HTTP_EXCHANGE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace bridge
{
    namespace beast = boost::beast;
    namespace http = beast::http;

    constexpr const char *CLIENT_AGENT = "pangea-compute-client";
    constexpr std::uint64_t MAX_RESPONSE_BODY = 256ULL * 1024 * 1024;

    /*
       One POST over a fresh TCP connection: connect, write the request,
       read the reply, close. Keeps itself alive through its pending
       handlers; cancel() closes the socket so they complete with
       operation_aborted.
    */
    class HttpExchange : public std::enable_shared_from_this<HttpExchange>
    {
    public:
        using Handler = std::function<void(beast::error_code, http::response<http::string_body>)>;

        HttpExchange(boost::asio::io_context &ioc, std::string host);

        void run(const boost::asio::ip::tcp::resolver::results_type &endpoints,
                 const std::string &target,
                 const std::string &body,
                 Handler handler);
        void cancel();

    private:
        void doWrite();
        void doRead();
        void finish(beast::error_code ec);

        boost::asio::ip::tcp::socket socket_;
        std::string host_;
        beast::flat_buffer buffer_;
        http::request<http::string_body> req_;
        http::response_parser<http::string_body> parser_;
        Handler handler_;
        bool done_ = false;
    };

    // 200 with a JSON body gives the body; anything else throws
    // RemoteError, ConnectionClosedError or BridgeError.
    json decodeResponse(beast::error_code ec, const http::response<http::string_body> &res);
}

#endif // HTTP_EXCHANGE_HPP
