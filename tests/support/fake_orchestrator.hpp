#ifndef FAKE_ORCHESTRATOR_HPP
#define FAKE_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "check.hpp"

namespace testing_support
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;
    using json = nlohmann::json;

    // Thrown by a handler to answer with a non-200 status.
    struct RemoteFailure : std::runtime_error
    {
        RemoteFailure(int status, const std::string &message)
            : std::runtime_error(message), status(status) {}
        int status;
    };

    /*
       Minimal node stand-in: serves POST /rpc/<method> on an ephemeral
       loopback port from its own io_context thread. Handlers map the
       request JSON to the reply JSON. In silent mode connections are
       accepted and read but never answered.
    */
    class FakeOrchestrator
    {
    public:
        using Handler = std::function<json(const json &)>;

        explicit FakeOrchestrator(std::uint64_t node_id = 7)
            : acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
              node_id_(node_id)
        {
            port_ = acceptor_.local_endpoint().port();
            doAccept();
            thread_ = std::thread([this]()
                                  { ioc_.run(); });
        }

        ~FakeOrchestrator()
        {
            ioc_.stop();
            if (thread_.joinable())
                thread_.join();
            std::lock_guard<std::mutex> lock(mutex_);
            parked_.clear();
        }

        FakeOrchestrator(const FakeOrchestrator &) = delete;
        FakeOrchestrator &operator=(const FakeOrchestrator &) = delete;

        unsigned short port() const { return port_; }
        std::uint64_t nodeId() const { return node_id_; }

        void on(const std::string &method, Handler handler)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers_[method] = std::move(handler);
        }

        void setSilent(bool silent) { silent_ = silent; }

        void setDelay(const std::string &method, std::chrono::milliseconds delay)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delays_[method] = delay;
        }

        std::size_t requests(const std::string &method) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = counts_.find(method);
            return it == counts_.end() ? 0 : it->second;
        }

        std::size_t totalRequests() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::size_t total = 0;
            for (const auto &entry : counts_)
                total += entry.second;
            return total;
        }

        json lastParams(const std::string &method) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = last_params_.find(method);
            return it == last_params_.end() ? json() : it->second;
        }

    private:
        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, FakeOrchestrator &owner)
                : socket_(std::move(socket)), timer_(socket_.get_executor()), owner_(owner) {}

            void start()
            {
                auto self = shared_from_this();
                http::async_read(socket_, buffer_, req_,
                                 [self](beast::error_code ec, std::size_t)
                                 {
                                     if (!ec)
                                         self->handleRequest();
                                 });
            }

        private:
            void handleRequest()
            {
                if (owner_.silent_)
                {
                    owner_.park(shared_from_this());
                    return;
                }

                std::string target(req_.target());
                std::string method = target.rfind("/rpc/", 0) == 0 ? target.substr(5) : target;

                int status = 200;
                std::chrono::milliseconds delay{0};
                json reply = owner_.dispatch(method, req_.body(), status, delay);

                res_ = http::response<http::string_body>{static_cast<http::status>(status), req_.version()};
                res_.set(http::field::server, "FakeOrchestrator");
                res_.set(http::field::content_type, "application/json");
                res_.keep_alive(false);
                res_.body() = reply.dump();
                res_.prepare_payload();

                auto self = shared_from_this();
                timer_.expires_after(delay);
                timer_.async_wait([self](const beast::error_code &)
                                  { self->write(); });
            }

            void write()
            {
                auto self = shared_from_this();
                http::async_write(socket_, res_,
                                  [self](beast::error_code, std::size_t)
                                  {
                                      beast::error_code ignored;
                                      self->socket_.shutdown(tcp::socket::shutdown_send, ignored);
                                  });
            }

            tcp::socket socket_;
            asio::steady_timer timer_;
            FakeOrchestrator &owner_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
        };

        void doAccept()
        {
            acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket)
                                   {
                if (!ec)
                    std::make_shared<Session>(std::move(socket), *this)->start();
                if (acceptor_.is_open())
                    doAccept(); });
        }

        void park(std::shared_ptr<Session> session)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            parked_.push_back(std::move(session));
        }

        json dispatch(const std::string &method, const std::string &body, int &status, std::chrono::milliseconds &delay)
        {
            Handler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++counts_[method];
                auto delay_it = delays_.find(method);
                if (delay_it != delays_.end())
                    delay = delay_it->second;
                auto it = handlers_.find(method);
                if (it != handlers_.end())
                    handler = it->second;
            }

            json params = json::parse(body, nullptr, false);
            if (params.is_discarded())
            {
                status = 400;
                return json{{"error", "request body is not JSON"}};
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_params_[method] = params;
            }

            if (!handler)
            {
                if (method == "bootstrap")
                    return json{{"service", "NodeService"}, {"nodeId", node_id_}};
                status = 404;
                return json{{"error", "unknown method " + method}};
            }

            try
            {
                return handler(params);
            }
            catch (const RemoteFailure &e)
            {
                status = e.status;
                return json{{"error", e.what()}};
            }
            catch (const std::exception &e)
            {
                status = 500;
                return json{{"error", e.what()}};
            }
        }

        asio::io_context ioc_;
        tcp::acceptor acceptor_;
        std::thread thread_;
        unsigned short port_ = 0;
        std::uint64_t node_id_;
        std::atomic<bool> silent_{false};

        mutable std::mutex mutex_;
        std::map<std::string, Handler> handlers_;
        std::map<std::string, std::chrono::milliseconds> delays_;
        std::map<std::string, std::size_t> counts_;
        std::map<std::string, json> last_params_;
        std::vector<std::shared_ptr<Session>> parked_;
    };

    // A port with nothing listening on it.
    inline unsigned short unusedPort()
    {
        asio::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        unsigned short port = acceptor.local_endpoint().port();
        acceptor.close();
        return port;
    }
}

#endif // FAKE_ORCHESTRATOR_HPP
