#include "connection_bridge.hpp"
#include "http_exchange.hpp"

#include <vector>

namespace bridge
{
    std::string stateToString(State state)
    {
        switch (state)
        {
        case State::Disconnected:
            return "disconnected";
        case State::Connecting:
            return "connecting";
        case State::Connected:
            return "connected";
        }
        return "unknown";
    }

    // ----------------------------------
    // CallHandle
    // ----------------------------------

    void CallHandle::onCancel(std::function<void()> fn)
    {
        if (cancelled_)
        {
            if (fn)
                fn();
            return;
        }
        cancel_fn_ = std::move(fn);
    }

    void CallHandle::cancel()
    {
        if (cancelled_)
            return;
        cancelled_ = true;
        std::function<void()> fn = std::move(cancel_fn_);
        cancel_fn_ = nullptr;
        if (fn)
            fn();
    }

    // ----------------------------------
    // LoopSession
    // ----------------------------------

    LoopSession::LoopSession()
        : ioc_(std::make_unique<asio::io_context>())
    {
        work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(ioc_->get_executor());
    }

    void LoopSession::beginConnect(const std::string &host, unsigned short port, ConnectHandler done)
    {
        auto op = std::make_shared<CallHandle>(0);
        connect_op_ = op;

        auto self = shared_from_this();
        auto resolver = std::make_shared<tcp::resolver>(*ioc_);
        op->onCancel([resolver]()
                     { resolver->cancel(); });

        resolver->async_resolve(
            host, std::to_string(port),
            [self, resolver, op, host, port, done](const beast::error_code &ec, tcp::resolver::results_type endpoints)
            {
                if (ec || op->cancelled())
                {
                    self->connect_op_.reset();
                    std::string reason = ec ? ec.message() : "cancelled";
                    done(std::make_exception_ptr(BridgeError("Could not resolve " + host + ": " + reason)), nullptr);
                    return;
                }

                auto exchange = std::make_shared<HttpExchange>(*self->ioc_, host);
                op->onCancel([exchange]()
                             { exchange->cancel(); });

                json hello = {{"client", CLIENT_AGENT}};
                exchange->run(endpoints, "/rpc/bootstrap", hello.dump(),
                              [self, endpoints, host, port, done](beast::error_code ec, http::response<http::string_body> res)
                              {
                                  self->connect_op_.reset();
                                  try
                                  {
                                      json reply = decodeResponse(ec, res);
                                      auto service = std::make_shared<RemoteService>();
                                      service->host = host;
                                      service->port = port;
                                      service->endpoints = endpoints;
                                      service->service = reply.value("service", std::string());
                                      service->node_id = reply.value("nodeId", std::uint64_t(0));
                                      if (service->service.empty())
                                      {
                                          throw BridgeError("Handshake reply did not name a service");
                                      }
                                      done(nullptr, service);
                                  }
                                  catch (...)
                                  {
                                      done(std::current_exception(), nullptr);
                                  }
                              });
            });
    }

    void LoopSession::track(const std::shared_ptr<CallHandle> &handle)
    {
        calls_[handle->id()] = handle;
        in_flight = calls_.size();
    }

    bool LoopSession::untrack(std::uint64_t id)
    {
        bool erased = calls_.erase(id) > 0;
        in_flight = calls_.size();
        return erased;
    }

    void LoopSession::cancelAll()
    {
        // cancel() may complete a call and untrack it, so work on a copy.
        std::vector<std::shared_ptr<CallHandle>> pending;
        pending.reserve(calls_.size());
        for (auto &entry : calls_)
            pending.push_back(entry.second);
        for (auto &handle : pending)
            handle->cancel();

        if (connect_op_)
            connect_op_->cancel();
    }

    void LoopSession::startHeartbeat(std::chrono::milliseconds interval)
    {
        heartbeat_ = std::make_unique<asio::steady_timer>(*ioc_);
        armHeartbeat(interval);
    }

    void LoopSession::armHeartbeat(std::chrono::milliseconds interval)
    {
        if (!heartbeat_)
            return;
        heartbeat_->expires_after(interval);
        auto self = shared_from_this();
        heartbeat_->async_wait([self, interval](const beast::error_code &ec)
                               {
            if (ec || !self->connected.load())
                return;
            self->armHeartbeat(interval); });
    }

    void LoopSession::shutdown()
    {
        connected = false;
        cancelAll();
        if (heartbeat_)
            heartbeat_->cancel();
        work_.reset();
        // Queued behind the cancellation completions so they still run.
        auto self = shared_from_this();
        asio::post(*ioc_, [self]()
                   { self->ioc_->stop(); });
    }

    void LoopSession::releaseLoop()
    {
        if (!released_.exchange(true))
            return;

        // Handles and the timer refer to the io_context; they go first.
        // Destroying the io_context then drops every queued handler.
        calls_.clear();
        in_flight = 0;
        connect_op_.reset();
        heartbeat_.reset();
        work_.reset();
        ioc_.reset();
    }

    // ----------------------------------
    // ConnectionBridge
    // ----------------------------------

    ConnectionBridge::ConnectionBridge(BridgeOptions options)
        : options_(options)
    {
    }

    ConnectionBridge::~ConnectionBridge()
    {
        disconnect();
    }

    bool ConnectionBridge::connect(const std::string &host, unsigned short port)
    {
        if (isConnected())
        {
            if (host == host_ && port == port_)
            {
                MyLogger::debug("Already connected to " + endpointName());
                return true;
            }
            disconnect();
        }

        host_ = host;
        port_ = port;
        state_ = State::Connecting;
        MyLogger::info("Connecting to " + endpointName());

        std::shared_ptr<LoopSession> session;
        try
        {
            session = startLoop();
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Failed to start event loop: " + std::string(e.what()));
            state_ = State::Disconnected;
            return false;
        }
        if (!session)
        {
            state_ = State::Disconnected;
            return false;
        }

        auto ready = std::make_shared<std::promise<std::shared_ptr<RemoteService>>>();
        std::future<std::shared_ptr<RemoteService>> result = ready->get_future();
        std::chrono::milliseconds heartbeat = options_.heartbeat_interval;

        asio::post(session->ioc(), [session, host, port, ready, heartbeat]()
                   { session->beginConnect(host, port,
                                           [session, ready, heartbeat](std::exception_ptr error, std::shared_ptr<RemoteService> service)
                                           {
                                               if (error)
                                               {
                                                   ready->set_exception(error);
                                                   return;
                                               }
                                               session->service = service;
                                               session->connected = true;
                                               session->startHeartbeat(heartbeat);
                                               ready->set_value(service);
                                           }); });

        if (result.wait_for(options_.connect_timeout) != std::future_status::ready)
        {
            MyLogger::error("Connection to " + endpointName() + " timed out after " +
                            std::to_string(options_.connect_timeout.count()) + " ms");
            stopLoop(session);
            state_ = State::Disconnected;
            return false;
        }

        try
        {
            std::shared_ptr<RemoteService> service = result.get();
            session_ = session;
            state_ = State::Connected;
            MyLogger::info("Connected to " + service->service + " node " +
                           std::to_string(service->node_id) + " at " + endpointName());
            return true;
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Failed to connect to " + endpointName() + ": " + e.what());
            stopLoop(session);
            state_ = State::Disconnected;
            return false;
        }
    }

    void ConnectionBridge::disconnect()
    {
        std::shared_ptr<LoopSession> session = std::move(session_);
        session_.reset();
        if (!session)
        {
            state_ = State::Disconnected;
            return;
        }

        MyLogger::info("Disconnecting from " + endpointName());
        stopLoop(session);
        state_ = State::Disconnected;
    }

    bool ConnectionBridge::isConnected() const
    {
        std::shared_ptr<LoopSession> session = session_;
        return session && session->connected.load() && state_.load() == State::Connected;
    }

    json ConnectionBridge::invoke(const std::string &method, const json &params, std::chrono::milliseconds timeout)
    {
        std::string target = "/rpc/" + method;
        std::string body = params.dump();

        MyLogger::debug("Invoking " + method + " on " + endpointName());
        MyLogger::trace("Request body for " + method + ": " + body);
        return call<json>(timeout, [target, body](const RemoteService &service, asio::io_context &ioc, CallHandle &handle, Completion<json> done)
                          {
            auto exchange = std::make_shared<HttpExchange>(ioc, service.host);
            handle.onCancel([exchange]()
                            { exchange->cancel(); });
            exchange->run(service.endpoints, target, body,
                          [done](beast::error_code ec, http::response<http::string_body> res)
                          {
                              try
                              {
                                  done(nullptr, decodeResponse(ec, res));
                              }
                              catch (...)
                              {
                                  done(std::current_exception(), json());
                              }
                          }); });
    }

    std::size_t ConnectionBridge::inFlight() const
    {
        std::shared_ptr<LoopSession> session = session_;
        return session ? session->in_flight.load() : 0;
    }

    std::uint64_t ConnectionBridge::nodeId() const
    {
        std::shared_ptr<LoopSession> session = session_;
        if (!session || !session->connected.load() || !session->service)
            return 0;
        return session->service->node_id;
    }

    std::shared_ptr<LoopSession> ConnectionBridge::startLoop()
    {
        auto session = std::make_shared<LoopSession>();
        auto exited = std::make_shared<std::promise<void>>();
        loop_exited_ = exited->get_future();

        loop_thread_ = std::thread([session, exited]()
                                   {
            try
            {
                session->ioc().run();
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Event loop stopped with an error: " + std::string(e.what()));
            }
            exited->set_value();
            session->releaseLoop(); });

        asio::post(session->ioc(), [session]()
                   { session->loop_running = true; });

        auto deadline = std::chrono::steady_clock::now() + options_.loop_start_timeout;
        while (!session->loop_running.load() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (!session->loop_running.load())
        {
            MyLogger::error("Event loop did not start within " +
                            std::to_string(options_.loop_start_timeout.count()) + " ms");
            stopLoop(session);
            return nullptr;
        }
        return session;
    }

    void ConnectionBridge::stopLoop(const std::shared_ptr<LoopSession> &session)
    {
        session->connected = false;
        asio::post(session->ioc(), [session]()
                   { session->shutdown(); });

        if (loop_thread_.joinable())
        {
            if (loop_exited_.valid() &&
                loop_exited_.wait_for(options_.join_timeout) == std::future_status::ready)
            {
                loop_thread_.join();
            }
            else
            {
                MyLogger::warning("Event loop thread for " + endpointName() + " did not stop within " +
                                  std::to_string(options_.join_timeout.count()) + " ms, detaching it");
                loop_thread_.detach();
            }
        }
        session->releaseLoop();
    }

    std::string ConnectionBridge::endpointName() const
    {
        if (host_.empty())
            return "<no endpoint>";
        return host_ + ":" + std::to_string(port_);
    }
}
