/**
 * @file bridge_test.cpp
 * @brief Blocking connection bridge against an in-process fake node.
 */

#include "../src/client/bridge/connection_bridge.hpp"
#include "../src/client/bridge/http_exchange.hpp"
#include "support/fake_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using testing_support::FakeOrchestrator;
using testing_support::RemoteFailure;
using namespace std::chrono_literals;

static bridge::BridgeOptions fastOptions()
{
    bridge::BridgeOptions options;
    options.connect_timeout = 500ms;
    options.join_timeout = 1000ms;
    options.heartbeat_interval = 20ms;
    return options;
}

// Polls until pred holds or the wait runs out.
template <typename Pred>
static bool eventually(Pred pred, std::chrono::milliseconds wait = 1000ms)
{
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

static void test_connect_handshake_and_invoke()
{
    std::printf("  test_connect_handshake_and_invoke...\n");
    FakeOrchestrator node(42);
    node.on("echo", [](const json &params)
            { return json{{"echo", params}}; });

    bridge::ConnectionBridge link(fastOptions());
    CHECK(link.state() == bridge::State::Disconnected);
    CHECK(link.nodeId() == 0);

    CHECK(link.connect("127.0.0.1", node.port()));
    CHECK(link.isConnected());
    CHECK(link.state() == bridge::State::Connected);
    CHECK(link.nodeId() == 42);
    CHECK(link.host() == "127.0.0.1");
    CHECK(link.port() == node.port());
    CHECK(node.requests("bootstrap") == 1);
    CHECK(node.lastParams("bootstrap")["client"] == bridge::CLIENT_AGENT);

    json reply = link.invoke("echo", json{{"value", 5}}, 1000ms);
    CHECK(reply["echo"]["value"] == 5);
    CHECK(link.dispatchedCalls() == 1);
    CHECK(link.inFlight() == 0);

    // Same endpoint again is a no-op.
    CHECK(link.connect("127.0.0.1", node.port()));
    CHECK(node.requests("bootstrap") == 1);

    link.disconnect();
    CHECK(!link.isConnected());
    CHECK(link.state() == bridge::State::Disconnected);
    CHECK(link.nodeId() == 0);
    link.disconnect();
}

static void test_remote_errors_carry_status()
{
    std::printf("  test_remote_errors_carry_status...\n");
    FakeOrchestrator node;
    node.on("busy", [](const json &) -> json
            { throw RemoteFailure(503, "node is busy"); });
    node.on("broken", [](const json &) -> json
            { throw std::runtime_error("handler crashed"); });

    bridge::ConnectionBridge link(fastOptions());
    CHECK(link.connect("127.0.0.1", node.port()));

    int status = 0;
    std::string message;
    try
    {
        link.invoke("busy", json::object(), 1000ms);
    }
    catch (const bridge::RemoteError &e)
    {
        status = e.status();
        message = e.what();
    }
    CHECK(status == 503);
    CHECK(message == "node is busy");

    try
    {
        link.invoke("noSuchMethod", json::object(), 1000ms);
    }
    catch (const bridge::RemoteError &e)
    {
        status = e.status();
    }
    CHECK(status == 404);

    CHECK_THROWS(link.invoke("broken", json::object(), 1000ms), bridge::RemoteError);

    // Remote failures leave the connection usable.
    CHECK(link.isConnected());
    CHECK(link.inFlight() == 0);
}

static void test_call_timeout_keeps_connection()
{
    std::printf("  test_call_timeout_keeps_connection...\n");
    FakeOrchestrator node;
    node.on("slow", [](const json &)
            { return json{{"done", true}}; });
    node.on("fast", [](const json &)
            { return json{{"done", true}}; });
    node.setDelay("slow", 600ms);

    bridge::ConnectionBridge link(fastOptions());
    CHECK(link.connect("127.0.0.1", node.port()));

    auto started = std::chrono::steady_clock::now();
    CHECK_THROWS(link.invoke("slow", json::object(), 100ms), bridge::CallTimeoutError);
    auto waited = std::chrono::steady_clock::now() - started;
    CHECK(waited < 500ms);

    CHECK(link.isConnected());
    CHECK(link.invoke("fast", json::object(), 1000ms)["done"] == true);
    CHECK(eventually([&]()
                     { return link.inFlight() == 0; }));
}

static void test_calls_without_connection_never_dispatch()
{
    std::printf("  test_calls_without_connection_never_dispatch...\n");
    bridge::ConnectionBridge link(fastOptions());
    CHECK_THROWS(link.invoke("getAllNodes", json::object(), 100ms), bridge::NotConnectedError);
    CHECK_THROWS(link.invoke("getAllNodes", json::object(), 100ms), bridge::NotConnectedError);
    CHECK(link.dispatchedCalls() == 0);
    CHECK(link.inFlight() == 0);

    // Also after a disconnect.
    FakeOrchestrator node;
    CHECK(link.connect("127.0.0.1", node.port()));
    link.disconnect();
    CHECK_THROWS(link.invoke("getAllNodes", json::object(), 100ms), bridge::NotConnectedError);
    CHECK(link.dispatchedCalls() == 0);
    CHECK(node.totalRequests() == 1);
}

static void test_unreachable_endpoint()
{
    std::printf("  test_unreachable_endpoint...\n");
    bridge::ConnectionBridge link(fastOptions());
    CHECK(!link.connect("127.0.0.1", testing_support::unusedPort()));
    CHECK(!link.isConnected());
    CHECK(link.state() == bridge::State::Disconnected);
}

static void test_silent_node_times_out_then_reconnect()
{
    std::printf("  test_silent_node_times_out_then_reconnect...\n");
    FakeOrchestrator silent;
    silent.setSilent(true);
    FakeOrchestrator live(9);

    bridge::ConnectionBridge link(fastOptions());
    auto started = std::chrono::steady_clock::now();
    CHECK(!link.connect("127.0.0.1", silent.port()));
    auto waited = std::chrono::steady_clock::now() - started;
    CHECK(waited >= 500ms);
    CHECK(waited < 500ms + 1500ms);
    CHECK(link.state() == bridge::State::Disconnected);

    CHECK(link.connect("127.0.0.1", live.port()));
    CHECK(link.nodeId() == 9);

    // Switching endpoints drops the old connection first.
    FakeOrchestrator other(11);
    CHECK(link.connect("127.0.0.1", other.port()));
    CHECK(link.nodeId() == 11);
    CHECK(link.port() == other.port());
}

static void test_custom_async_calls()
{
    std::printf("  test_custom_async_calls...\n");
    FakeOrchestrator node;
    bridge::ConnectionBridge link(fastOptions());
    CHECK(link.connect("127.0.0.1", node.port()));

    // Completes from a timer on the loop; the second completion is ignored.
    bridge::AsyncCall<int> delayed = [](const bridge::RemoteService &service, bridge::asio::io_context &ioc,
                                        bridge::CallHandle &, bridge::Completion<int> done)
    {
        auto timer = std::make_shared<bridge::asio::steady_timer>(ioc, 10ms);
        int node_id = static_cast<int>(service.node_id);
        timer->async_wait([timer, done, node_id](const boost::system::error_code &)
                          {
            done(nullptr, node_id);
            done(nullptr, -1); });
    };
    CHECK(link.call<int>(1000ms, delayed) == 7);

    bridge::AsyncCall<int> throwing = [](const bridge::RemoteService &, bridge::asio::io_context &,
                                         bridge::CallHandle &, bridge::Completion<int>)
    {
        throw std::domain_error("refused before any I/O");
    };
    CHECK_THROWS(link.call<int>(1000ms, throwing), std::domain_error);

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    bridge::AsyncCall<int> stuck = [cancelled](const bridge::RemoteService &, bridge::asio::io_context &,
                                               bridge::CallHandle &handle, bridge::Completion<int>)
    {
        handle.onCancel([cancelled]()
                        { *cancelled = true; });
    };
    CHECK_THROWS(link.call<int>(50ms, stuck), bridge::CallTimeoutError);
    CHECK(eventually([&]()
                     { return cancelled->load(); }));

    CHECK(link.dispatchedCalls() == 3);
    link.disconnect();
    CHECK(link.inFlight() == 0);
}

static void test_state_names()
{
    std::printf("  test_state_names...\n");
    CHECK(bridge::stateToString(bridge::State::Disconnected) == "disconnected");
    CHECK(bridge::stateToString(bridge::State::Connecting) == "connecting");
    CHECK(bridge::stateToString(bridge::State::Connected) == "connected");
}

int main()
{
    std::printf("bridge_test\n");

    test_connect_handshake_and_invoke();
    test_remote_errors_carry_status();
    test_call_timeout_keeps_connection();
    test_calls_without_connection_never_dispatch();
    test_unreachable_endpoint();
    test_silent_node_times_out_then_reconnect();
    test_custom_async_calls();
    test_state_names();

    std::printf("OK: all bridge tests passed\n");
    return 0;
}
