#ifndef NODE_CLIENT_HPP
#define NODE_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "records.hpp"
#include "../bridge/connection_bridge.hpp"
#include "../job/job.hpp"
#include "../load_config/load_config.hpp"

namespace rpc
{
    // (result bytes, error message, worker node)
    using ResultReply = std::tuple<std::optional<std::string>, std::string, std::string>;

    /*
       Typed wrappers over the node's RPC surface. No wrapper throws: any
       transport, remote or decoding failure is logged and turned into the
       call's sentinel (false, nullopt, an empty collection, or a
       (false, message) pair).
    */
    class NodeClient
    {
    public:
        explicit NodeClient(ConfigReader::ClientConfig config = ConfigReader::ClientConfig());

        NodeClient(const NodeClient &) = delete;
        NodeClient &operator=(const NodeClient &) = delete;

        // Connects to the configured host and port.
        bool connect();
        bool connect(const std::string &host, unsigned short port);
        void disconnect();
        bool isConnected() const;

        bridge::ConnectionBridge &connection() { return bridge_; }
        const ConfigReader::ClientConfig &config() const { return config_; }

        // Nodes and peers
        std::vector<NodeInfo> get_all_nodes();
        std::optional<NodeInfo> get_node(std::uint32_t node_id);
        bool update_threat_score(std::uint32_t node_id, float threat_score);
        bool update_latency(std::uint32_t node_id, float latency_ms);
        std::optional<ConnectionQuality> get_connection_quality(std::uint32_t peer_id);
        std::pair<bool, std::optional<ConnectionQuality>> connect_to_peer(std::uint32_t peer_id, const std::string &host, std::uint16_t port);
        bool disconnect_peer(std::uint32_t peer_id);
        std::vector<std::uint32_t> get_connected_peers();
        bool send_message(std::uint32_t peer_id, const std::string &data);
        std::optional<NetworkMetrics> get_network_metrics();

        // Streaming
        std::pair<bool, std::string> start_streaming(const StreamConfig &config);
        bool stop_streaming();
        bool send_video_frame(const VideoFrame &frame);
        bool send_audio_chunk(const AudioChunk &chunk);
        bool send_chat_message(const std::string &peer_addr, const std::string &message);
        // Returns the peer address the node registered.
        std::pair<bool, std::string> connect_stream_peer(const std::string &host, std::uint16_t port);
        std::optional<StreamStats> get_stream_stats();

        // Compute jobs
        // (true, job id) or (false, error).
        std::pair<bool, std::string> submit_compute_job(const job::JobManifest &manifest);
        std::optional<JobStatus> get_compute_job_status(const std::string &job_id);
        // Waits up to timeout_ms on the node, plus the configured margin locally.
        ResultReply get_compute_job_result(const std::string &job_id, std::uint32_t timeout_ms);
        bool cancel_compute_job(const std::string &job_id);
        std::optional<ComputeCapacity> get_compute_capacity();

        // Ephemeral chat
        std::optional<ChatSession> start_chat_session(const std::string &peer_addr);
        bool send_ephemeral_message(const std::string &peer_addr, const std::string &message);
        std::vector<ChatMessage> receive_chat_messages(const std::string &peer_addr);
        bool close_chat_session(const std::string &session_id);

        // Security
        std::pair<bool, std::string> set_proxy_config(const ProxyConfig &config);
        std::optional<ProxyConfig> get_proxy_config();

        // Distributed training
        std::pair<bool, std::string> start_ml_training(const TrainingTask &task);
        std::optional<TrainingStatus> get_ml_training_status(const std::string &task_id);
        bool stop_ml_training(const std::string &task_id);
        bool submit_gradient(const GradientUpdate &update);
        std::optional<ModelUpdate> get_model_update(std::uint32_t model_version);

    private:
        std::chrono::milliseconds queryTimeout() const;
        std::chrono::milliseconds controlTimeout() const;
        std::chrono::milliseconds bulkTimeout() const;

        // Invokes method and reads the "success" flag of the reply.
        bool invokeForSuccess(const std::string &what, const std::string &method, const json &params, std::chrono::milliseconds timeout);
        // Like invokeForSuccess, but keeps the error message on failure.
        std::pair<bool, std::string> invokeForStatus(const std::string &what, const std::string &method, const json &params, std::chrono::milliseconds timeout);

        ConfigReader::ClientConfig config_;
        bridge::ConnectionBridge bridge_;
    };

    bridge::BridgeOptions bridgeOptionsFromConfig(const ConfigReader::ClientConfig &config);

} // namespace rpc

#endif // NODE_CLIENT_HPP
