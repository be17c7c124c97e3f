#ifndef CONNECTION_BRIDGE_HPP
#define CONNECTION_BRIDGE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include "../logger/Mylogger.hpp"

using json = nlohmann::json;

namespace bridge
{
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    // ----------------------------------
    // Errors raised by the bridge. The RPC layer above turns all of them
    // into sentinel values; nothing else is expected to catch them.
    // ----------------------------------

    class BridgeError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class NotConnectedError : public BridgeError
    {
    public:
        using BridgeError::BridgeError;
    };

    // Only the client stops waiting; the remote side may still finish the work.
    class CallTimeoutError : public BridgeError
    {
    public:
        using BridgeError::BridgeError;
    };

    class ConnectionClosedError : public BridgeError
    {
    public:
        using BridgeError::BridgeError;
    };

    class RemoteError : public BridgeError
    {
    public:
        RemoteError(int status, const std::string &message)
            : BridgeError(message), status_(status) {}
        int status() const { return status_; }

    private:
        int status_;
    };

    enum class State
    {
        Disconnected,
        Connecting,
        Connected
    };

    std::string stateToString(State state);

    struct BridgeOptions
    {
        std::chrono::milliseconds connect_timeout{5000};
        // Upper bound on waiting for the loop thread to report itself running.
        std::chrono::milliseconds loop_start_timeout{100};
        std::chrono::milliseconds join_timeout{2000};
        std::chrono::milliseconds heartbeat_interval{100};
    };

    // What the handshake hands back: where to send calls and who answered.
    struct RemoteService
    {
        std::string host;
        unsigned short port = 0;
        tcp::resolver::results_type endpoints;
        std::string service;
        std::uint64_t node_id = 0;
    };

    // One in-flight call. Touched on the loop thread only.
    class CallHandle
    {
    public:
        explicit CallHandle(std::uint64_t id) : id_(id) {}

        std::uint64_t id() const { return id_; }
        bool cancelled() const { return cancelled_; }

        // The operation registers how to abort its pending I/O.
        void onCancel(std::function<void()> fn);
        void cancel();

    private:
        std::uint64_t id_;
        bool cancelled_ = false;
        std::function<void()> cancel_fn_;
    };

    template <typename T>
    using Completion = std::function<void(std::exception_ptr, T)>;

    // An asynchronous operation started on the loop thread. It must call the
    // completion exactly once; extra calls are ignored.
    template <typename T>
    using AsyncCall = std::function<void(const RemoteService &, asio::io_context &, CallHandle &, Completion<T>)>;

    // Everything that belongs to one live connection. Loop handlers keep it
    // alive through shared_ptr, so a loop thread abandoned on disconnect
    // never touches a destroyed bridge.
    class LoopSession : public std::enable_shared_from_this<LoopSession>
    {
    public:
        using ConnectHandler = std::function<void(std::exception_ptr, std::shared_ptr<RemoteService>)>;

        LoopSession();

        asio::io_context &ioc() { return *ioc_; }

        // Resolve, connect and run the bootstrap handshake. Loop thread only.
        void beginConnect(const std::string &host, unsigned short port, ConnectHandler done);

        void track(const std::shared_ptr<CallHandle> &handle);
        // False when the call was already finished.
        bool untrack(std::uint64_t id);
        void cancelAll();

        void startHeartbeat(std::chrono::milliseconds interval);

        // Cancels pending work, drops the work guard and stops the loop.
        // Loop thread only.
        void shutdown();

        // Whichever of the loop thread and the stopping thread gets here
        // second destroys the io_context.
        void releaseLoop();

        std::atomic<bool> connected{false};
        std::atomic<bool> loop_running{false};
        std::atomic<std::size_t> in_flight{0};
        std::shared_ptr<RemoteService> service;

    private:
        void armHeartbeat(std::chrono::milliseconds interval);

        std::unique_ptr<asio::io_context> ioc_;
        std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
        std::unique_ptr<asio::steady_timer> heartbeat_;
        std::shared_ptr<CallHandle> connect_op_;
        std::unordered_map<std::uint64_t, std::shared_ptr<CallHandle>> calls_;
        std::atomic<bool> released_{false};
    };

    // Blocking facade over a background io_context. One live connection per
    // instance; connect/disconnect/call are meant for a single controlling
    // thread.
    class ConnectionBridge
    {
    public:
        explicit ConnectionBridge(BridgeOptions options = BridgeOptions());
        ~ConnectionBridge();

        ConnectionBridge(const ConnectionBridge &) = delete;
        ConnectionBridge &operator=(const ConnectionBridge &) = delete;

        bool connect(const std::string &host, unsigned short port);
        void disconnect();
        bool isConnected() const;
        State state() const { return state_.load(); }

        // Schedules op on the loop and waits at most timeout for it.
        // Throws NotConnectedError (loop untouched), CallTimeoutError,
        // ConnectionClosedError, or whatever op reported. T must be
        // default constructible.
        template <typename T>
        T call(std::chrono::milliseconds timeout, AsyncCall<T> op);

        // JSON request/response exchange on POST /rpc/<method>.
        json invoke(const std::string &method, const json &params, std::chrono::milliseconds timeout);

        std::size_t inFlight() const;
        std::uint64_t dispatchedCalls() const { return dispatched_.load(); }
        const std::string &host() const { return host_; }
        unsigned short port() const { return port_; }
        std::uint64_t nodeId() const;
        const BridgeOptions &options() const { return options_; }

    private:
        std::shared_ptr<LoopSession> startLoop();
        void stopLoop(const std::shared_ptr<LoopSession> &session);
        std::string endpointName() const;

        BridgeOptions options_;
        std::string host_;
        unsigned short port_ = 0;
        std::atomic<State> state_{State::Disconnected};
        std::shared_ptr<LoopSession> session_;
        std::thread loop_thread_;
        std::future<void> loop_exited_;
        std::atomic<std::uint64_t> next_call_id_{1};
        std::atomic<std::uint64_t> dispatched_{0};
    };

    template <typename T>
    T ConnectionBridge::call(std::chrono::milliseconds timeout, AsyncCall<T> op)
    {
        std::shared_ptr<LoopSession> session = session_;
        if (!session || !session->connected.load())
        {
            throw NotConnectedError("Not connected to " + endpointName());
        }

        auto promise = std::make_shared<std::promise<T>>();
        std::future<T> result = promise->get_future();
        auto handle = std::make_shared<CallHandle>(next_call_id_++);
        ++dispatched_;

        asio::post(session->ioc(), [session, handle, promise, op]()
                   {
            session->track(handle);
            Completion<T> finish = [session, handle, promise](std::exception_ptr error, T value)
            {
                if (!session->untrack(handle->id()))
                    return;
                if (error)
                    promise->set_exception(error);
                else
                    promise->set_value(std::move(value));
            };
            try
            {
                op(*session->service, session->ioc(), *handle, finish);
            }
            catch (...)
            {
                finish(std::current_exception(), T());
            } });

        if (result.wait_for(timeout) != std::future_status::ready)
        {
            MyLogger::warning("Call " + std::to_string(handle->id()) + " to " + endpointName() +
                              " timed out after " + std::to_string(timeout.count()) + " ms, cancelling");
            asio::post(session->ioc(), [handle]()
                       { handle->cancel(); });
            throw CallTimeoutError("Call timed out after " + std::to_string(timeout.count()) + " ms");
        }

        try
        {
            return result.get();
        }
        catch (const std::future_error &)
        {
            throw ConnectionClosedError("Connection to " + endpointName() + " closed before the call completed");
        }
    }
}

#endif // CONNECTION_BRIDGE_HPP
