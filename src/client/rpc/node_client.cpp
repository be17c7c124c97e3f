#include "node_client.hpp"
#include "../hash/hashing.hpp"
#include "../logger/Mylogger.hpp"

namespace rpc
{
    namespace
    {
        // Runs fn; any exception is logged and replaced by sentinel.
        template <typename R, typename Fn>
        R guarded(const std::string &what, R sentinel, Fn &&fn)
        {
            try
            {
                return fn();
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Error " + what + ": " + e.what());
                return sentinel;
            }
        }

        std::string errorMessage(const json &reply)
        {
            std::string message = reply.value("errorMsg", std::string());
            return message.empty() ? "request rejected by node" : message;
        }
    }

    bridge::BridgeOptions bridgeOptionsFromConfig(const ConfigReader::ClientConfig &config)
    {
        bridge::BridgeOptions options;
        options.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
        options.join_timeout = std::chrono::milliseconds(config.join_timeout_ms);
        options.heartbeat_interval = std::chrono::milliseconds(config.heartbeat_ms);
        return options;
    }

    NodeClient::NodeClient(ConfigReader::ClientConfig config)
        : config_(std::move(config)), bridge_(bridgeOptionsFromConfig(config_))
    {
    }

    bool NodeClient::connect()
    {
        return bridge_.connect(config_.host, config_.port);
    }

    bool NodeClient::connect(const std::string &host, unsigned short port)
    {
        return bridge_.connect(host, port);
    }

    void NodeClient::disconnect()
    {
        bridge_.disconnect();
    }

    bool NodeClient::isConnected() const
    {
        return bridge_.isConnected();
    }

    std::chrono::milliseconds NodeClient::queryTimeout() const
    {
        return std::chrono::milliseconds(config_.timeouts.query_ms);
    }

    std::chrono::milliseconds NodeClient::controlTimeout() const
    {
        return std::chrono::milliseconds(config_.timeouts.control_ms);
    }

    std::chrono::milliseconds NodeClient::bulkTimeout() const
    {
        return std::chrono::milliseconds(config_.timeouts.bulk_ms);
    }

    bool NodeClient::invokeForSuccess(const std::string &what, const std::string &method, const json &params, std::chrono::milliseconds timeout)
    {
        return guarded(what, false, [&]() -> bool
                       {
            json reply = bridge_.invoke(method, params, timeout);
            bool success = reply.value("success", false);
            if (!success)
                MyLogger::warning("Node rejected " + method + ": " + errorMessage(reply));
            return success; });
    }

    std::pair<bool, std::string> NodeClient::invokeForStatus(const std::string &what, const std::string &method, const json &params, std::chrono::milliseconds timeout)
    {
        try
        {
            json reply = bridge_.invoke(method, params, timeout);
            if (!reply.value("success", false))
            {
                std::string message = errorMessage(reply);
                MyLogger::warning("Node rejected " + method + ": " + message);
                return {false, message};
            }
            return {true, ""};
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Error " + what + ": " + e.what());
            return {false, e.what()};
        }
    }

    // ----------------------------------
    // Nodes and peers
    // ----------------------------------

    std::vector<NodeInfo> NodeClient::get_all_nodes()
    {
        return guarded("getting all nodes", std::vector<NodeInfo>(), [&]() -> std::vector<NodeInfo>
                       {
            json reply = bridge_.invoke("getAllNodes", json::object(), queryTimeout());
            return reply.at("nodes").get<std::vector<NodeInfo>>(); });
    }

    std::optional<NodeInfo> NodeClient::get_node(std::uint32_t node_id)
    {
        return guarded("getting node " + std::to_string(node_id), std::optional<NodeInfo>(), [&]() -> std::optional<NodeInfo>
                       {
            json reply = bridge_.invoke("getNode", {{"nodeId", node_id}}, queryTimeout());
            if (!reply.contains("node") || reply["node"].is_null())
                return std::nullopt;
            return reply["node"].get<NodeInfo>(); });
    }

    bool NodeClient::update_threat_score(std::uint32_t node_id, float threat_score)
    {
        return invokeForSuccess("updating threat score for node " + std::to_string(node_id),
                                "updateNode", {{"nodeId", node_id}, {"threatScore", threat_score}}, queryTimeout());
    }

    bool NodeClient::update_latency(std::uint32_t node_id, float latency_ms)
    {
        return invokeForSuccess("updating latency for node " + std::to_string(node_id),
                                "updateLatency", {{"nodeId", node_id}, {"latencyMs", latency_ms}}, queryTimeout());
    }

    std::optional<ConnectionQuality> NodeClient::get_connection_quality(std::uint32_t peer_id)
    {
        return guarded("getting connection quality for peer " + std::to_string(peer_id), std::optional<ConnectionQuality>(),
                       [&]() -> std::optional<ConnectionQuality>
                       {
                           json reply = bridge_.invoke("getConnectionQuality", {{"peerId", peer_id}}, queryTimeout());
                           return reply.at("quality").get<ConnectionQuality>();
                       });
    }

    std::pair<bool, std::optional<ConnectionQuality>> NodeClient::connect_to_peer(std::uint32_t peer_id, const std::string &host, std::uint16_t port)
    {
        using Reply = std::pair<bool, std::optional<ConnectionQuality>>;
        std::string what = "connecting to peer " + std::to_string(peer_id) + " at " + host + ":" + std::to_string(port);
        return guarded(what, Reply(false, std::nullopt), [&]() -> Reply
                       {
            json reply = bridge_.invoke("connectToPeer", {{"peerId", peer_id}, {"host", host}, {"port", port}}, controlTimeout());
            if (!reply.value("success", false))
            {
                MyLogger::warning("Node refused connection to peer " + std::to_string(peer_id) + ": " + errorMessage(reply));
                return Reply(false, std::nullopt);
            }
            std::optional<ConnectionQuality> quality;
            if (reply.contains("quality") && reply["quality"].is_object())
                quality = reply["quality"].get<ConnectionQuality>();
            return Reply(true, quality); });
    }

    bool NodeClient::disconnect_peer(std::uint32_t peer_id)
    {
        return invokeForSuccess("disconnecting peer " + std::to_string(peer_id),
                                "disconnectPeer", {{"peerId", peer_id}}, controlTimeout());
    }

    std::vector<std::uint32_t> NodeClient::get_connected_peers()
    {
        return guarded("getting connected peers", std::vector<std::uint32_t>(), [&]() -> std::vector<std::uint32_t>
                       {
            json reply = bridge_.invoke("getConnectedPeers", json::object(), queryTimeout());
            return reply.at("peers").get<std::vector<std::uint32_t>>(); });
    }

    bool NodeClient::send_message(std::uint32_t peer_id, const std::string &data)
    {
        return invokeForSuccess("sending message to peer " + std::to_string(peer_id),
                                "sendMessage", {{"toPeerId", peer_id}, {"data", hashing::base64Encode(data)}}, bulkTimeout());
    }

    std::optional<NetworkMetrics> NodeClient::get_network_metrics()
    {
        return guarded("getting network metrics", std::optional<NetworkMetrics>(), [&]() -> std::optional<NetworkMetrics>
                       {
            json reply = bridge_.invoke("getNetworkMetrics", json::object(), queryTimeout());
            return reply.at("metrics").get<NetworkMetrics>(); });
    }

    // ----------------------------------
    // Streaming
    // ----------------------------------

    std::pair<bool, std::string> NodeClient::start_streaming(const StreamConfig &config)
    {
        return invokeForStatus("starting streaming on port " + std::to_string(config.port),
                               "startStreaming", {{"config", config}}, controlTimeout());
    }

    bool NodeClient::stop_streaming()
    {
        return invokeForSuccess("stopping streaming", "stopStreaming", json::object(), controlTimeout());
    }

    bool NodeClient::send_video_frame(const VideoFrame &frame)
    {
        return invokeForSuccess("sending video frame " + std::to_string(frame.frame_id),
                                "sendVideoFrame", {{"frame", frame}}, bulkTimeout());
    }

    bool NodeClient::send_audio_chunk(const AudioChunk &chunk)
    {
        return invokeForSuccess("sending audio chunk", "sendAudioChunk", {{"chunk", chunk}}, bulkTimeout());
    }

    bool NodeClient::send_chat_message(const std::string &peer_addr, const std::string &message)
    {
        json params = {{"message", {{"peerAddr", peer_addr}, {"message", message}}}};
        return invokeForSuccess("sending chat message to " + peer_addr, "sendChatMessage", params, controlTimeout());
    }

    std::pair<bool, std::string> NodeClient::connect_stream_peer(const std::string &host, std::uint16_t port)
    {
        using Reply = std::pair<bool, std::string>;
        std::string what = "connecting stream peer " + host + ":" + std::to_string(port);
        return guarded(what, Reply(false, ""), [&]() -> Reply
                       {
            json reply = bridge_.invoke("connectStreamPeer", {{"host", host}, {"port", port}}, controlTimeout());
            if (!reply.value("success", false))
                return Reply(false, "");
            return Reply(true, reply.value("peerAddr", std::string())); });
    }

    std::optional<StreamStats> NodeClient::get_stream_stats()
    {
        return guarded("getting stream stats", std::optional<StreamStats>(), [&]() -> std::optional<StreamStats>
                       {
            json reply = bridge_.invoke("getStreamStats", json::object(), queryTimeout());
            return reply.at("stats").get<StreamStats>(); });
    }

    // ----------------------------------
    // Compute jobs
    // ----------------------------------

    std::pair<bool, std::string> NodeClient::submit_compute_job(const job::JobManifest &manifest)
    {
        using Reply = std::pair<bool, std::string>;
        try
        {
            json reply = bridge_.invoke("submitComputeJob", {{"manifest", manifest.toJson()}}, controlTimeout());
            if (!reply.value("success", false))
            {
                std::string message = errorMessage(reply);
                MyLogger::warning("Node rejected job " + manifest.job_id + ": " + message);
                return Reply(false, message);
            }
            // A missing, null or empty jobId means the node kept ours.
            std::string job_id = manifest.job_id;
            if (reply.contains("jobId") && reply["jobId"].is_string() && !reply["jobId"].get<std::string>().empty())
                job_id = reply["jobId"].get<std::string>();
            return Reply(true, job_id);
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Error submitting job " + manifest.job_id + ": " + e.what());
            return Reply(false, e.what());
        }
    }

    std::optional<JobStatus> NodeClient::get_compute_job_status(const std::string &job_id)
    {
        return guarded("getting status of job " + job_id, std::optional<JobStatus>(), [&]() -> std::optional<JobStatus>
                       {
            json reply = bridge_.invoke("getComputeJobStatus", {{"jobId", job_id}}, queryTimeout());
            if (!reply.contains("status") || !reply["status"].is_object())
                return std::nullopt;
            return reply["status"].get<JobStatus>(); });
    }

    ResultReply NodeClient::get_compute_job_result(const std::string &job_id, std::uint32_t timeout_ms)
    {
        std::chrono::milliseconds wait(static_cast<std::int64_t>(timeout_ms) + config_.timeouts.result_margin_ms);
        try
        {
            json reply = bridge_.invoke("getComputeJobResult", {{"jobId", job_id}, {"timeoutMs", timeout_ms}}, wait);
            if (!reply.value("success", false))
            {
                return ResultReply(std::nullopt, errorMessage(reply), "");
            }
            std::string data = hashing::base64Decode(reply.value("result", std::string()));
            return ResultReply(std::move(data), "", reply.value("workerNode", std::string()));
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Error getting result of job " + job_id + ": " + e.what());
            return ResultReply(std::nullopt, e.what(), "");
        }
    }

    bool NodeClient::cancel_compute_job(const std::string &job_id)
    {
        return invokeForSuccess("cancelling job " + job_id, "cancelComputeJob", {{"jobId", job_id}}, controlTimeout());
    }

    std::optional<ComputeCapacity> NodeClient::get_compute_capacity()
    {
        return guarded("getting compute capacity", std::optional<ComputeCapacity>(), [&]() -> std::optional<ComputeCapacity>
                       {
            json reply = bridge_.invoke("getComputeCapacity", json::object(), queryTimeout());
            return reply.at("capacity").get<ComputeCapacity>(); });
    }

    // ----------------------------------
    // Ephemeral chat
    // ----------------------------------

    std::optional<ChatSession> NodeClient::start_chat_session(const std::string &peer_addr)
    {
        return guarded("starting chat session with " + peer_addr, std::optional<ChatSession>(), [&]() -> std::optional<ChatSession>
                       {
            json reply = bridge_.invoke("startChatSession", {{"peerAddr", peer_addr}}, controlTimeout());
            if (!reply.value("success", false))
            {
                MyLogger::warning("Node refused chat session with " + peer_addr + ": " + errorMessage(reply));
                return std::nullopt;
            }
            return reply.at("session").get<ChatSession>(); });
    }

    bool NodeClient::send_ephemeral_message(const std::string &peer_addr, const std::string &message)
    {
        json params = {{"message", {{"toPeer", peer_addr}, {"message", message}}}};
        return invokeForSuccess("sending ephemeral message to " + peer_addr, "sendEphemeralMessage", params, controlTimeout());
    }

    std::vector<ChatMessage> NodeClient::receive_chat_messages(const std::string &peer_addr)
    {
        return guarded("receiving chat messages from " + peer_addr, std::vector<ChatMessage>(), [&]() -> std::vector<ChatMessage>
                       {
            json reply = bridge_.invoke("receiveChatMessages", {{"peerAddr", peer_addr}}, queryTimeout());
            return reply.at("messages").get<std::vector<ChatMessage>>(); });
    }

    bool NodeClient::close_chat_session(const std::string &session_id)
    {
        return invokeForSuccess("closing chat session " + session_id, "closeChatSession", {{"sessionId", session_id}}, controlTimeout());
    }

    // ----------------------------------
    // Security
    // ----------------------------------

    std::pair<bool, std::string> NodeClient::set_proxy_config(const ProxyConfig &config)
    {
        return invokeForStatus("setting proxy config", "setProxyConfig", {{"config", config}}, controlTimeout());
    }

    std::optional<ProxyConfig> NodeClient::get_proxy_config()
    {
        return guarded("getting proxy config", std::optional<ProxyConfig>(), [&]() -> std::optional<ProxyConfig>
                       {
            json reply = bridge_.invoke("getProxyConfig", json::object(), queryTimeout());
            return reply.at("config").get<ProxyConfig>(); });
    }

    // ----------------------------------
    // Distributed training
    // ----------------------------------

    std::pair<bool, std::string> NodeClient::start_ml_training(const TrainingTask &task)
    {
        return invokeForStatus("starting training task " + task.task_id, "startMLTraining", {{"task", task}}, controlTimeout());
    }

    std::optional<TrainingStatus> NodeClient::get_ml_training_status(const std::string &task_id)
    {
        return guarded("getting training status of " + task_id, std::optional<TrainingStatus>(), [&]() -> std::optional<TrainingStatus>
                       {
            json reply = bridge_.invoke("getMLTrainingStatus", {{"taskId", task_id}}, queryTimeout());
            return reply.at("status").get<TrainingStatus>(); });
    }

    bool NodeClient::stop_ml_training(const std::string &task_id)
    {
        return invokeForSuccess("stopping training task " + task_id, "stopMLTraining", {{"taskId", task_id}}, controlTimeout());
    }

    bool NodeClient::submit_gradient(const GradientUpdate &update)
    {
        return invokeForSuccess("submitting gradient from " + update.worker_id, "submitGradient", {{"update", update}}, bulkTimeout());
    }

    std::optional<ModelUpdate> NodeClient::get_model_update(std::uint32_t model_version)
    {
        return guarded("getting model update " + std::to_string(model_version), std::optional<ModelUpdate>(), [&]() -> std::optional<ModelUpdate>
                       {
            json reply = bridge_.invoke("getModelUpdate", {{"modelVersion", model_version}}, bulkTimeout());
            if (!reply.value("success", false))
            {
                MyLogger::warning("Node has no model update " + std::to_string(model_version) + ": " + errorMessage(reply));
                return std::nullopt;
            }
            return reply.at("update").get<ModelUpdate>(); });
    }
}
