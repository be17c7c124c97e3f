#ifndef RECORDS_HPP
#define RECORDS_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../job/job.hpp"

using json = nlohmann::json;

namespace rpc
{
    // Plain records handed out by NodeClient. Byte fields hold raw bytes;
    // they travel as base64 on the wire.

    // ----------------------------------
    // Nodes and peers
    // ----------------------------------

    struct NodeInfo
    {
        std::uint32_t id = 0;
        std::uint32_t status = 0;
        float latency_ms = 0.0f;
        float threat_score = 0.0f;
    };

    struct ConnectionQuality
    {
        float latency_ms = 0.0f;
        float jitter_ms = 0.0f;
        float packet_loss = 0.0f;
    };

    struct NetworkMetrics
    {
        std::uint32_t peer_count = 0;
        float avg_rtt_ms = 0.0f;
        float packet_loss = 0.0f;
    };

    // ----------------------------------
    // Streaming
    // ----------------------------------

    enum class StreamType : std::uint8_t
    {
        Video = 0,
        Audio = 1,
        Chat = 2
    };

    struct StreamConfig
    {
        std::uint16_t port = 0;
        std::string peer_host;
        std::uint16_t peer_port = 0;
        StreamType stream_type = StreamType::Video;
    };

    struct VideoFrame
    {
        std::uint32_t frame_id = 0;
        std::string data;
        std::string peer_addr;
    };

    struct AudioChunk
    {
        std::string data;
        std::string peer_addr;
        std::uint64_t timestamp = 0;
    };

    struct StreamStats
    {
        std::uint64_t frames_sent = 0;
        std::uint64_t frames_received = 0;
        std::uint64_t bytes_sent = 0;
        std::uint64_t bytes_received = 0;
        float avg_latency_ms = 0.0f;
    };

    // ----------------------------------
    // Compute
    // ----------------------------------

    struct JobStatus
    {
        std::string job_id;
        job::TaskStatus status = job::TaskStatus::PENDING;
        float progress = 0.0f;
        std::uint32_t completed_chunks = 0;
        std::uint32_t total_chunks = 0;
        std::uint32_t estimated_time_remaining = 0;
        std::string error_msg;
    };

    struct ComputeCapacity
    {
        std::uint32_t cpu_cores = 0;
        std::uint64_t ram_mb = 0;
        float current_load = 0.0f;
        std::uint64_t disk_mb = 0;
        std::uint32_t bandwidth_mbps = 0;
    };

    // ----------------------------------
    // Chat and security
    // ----------------------------------

    struct ChatSession
    {
        std::string session_id;
        std::string peer_addr;
        std::int64_t established = 0;
    };

    struct ChatMessage
    {
        std::string from_peer;
        std::string to_peer;
        std::string message;
        std::int64_t timestamp = 0;
        std::string message_id;
        std::string encryption_type;
        std::string signature;
    };

    struct ProxyConfig
    {
        bool enabled = false;
        std::string proxy_type = "socks5";
        std::string proxy_host;
        std::uint16_t proxy_port = 0;
        std::string username;
        std::string password;
    };

    // ----------------------------------
    // Distributed training
    // ----------------------------------

    struct TrainingTask
    {
        std::string task_id;
        std::string dataset_id;
        std::string model_architecture;
        std::string aggregator_node;
        std::vector<std::string> worker_nodes;
        std::map<std::string, std::string> hyperparameters;
        std::uint32_t epochs = 1;
    };

    struct TrainingStatus
    {
        std::string task_id;
        std::uint32_t current_epoch = 0;
        std::uint32_t total_epochs = 0;
        std::uint32_t active_workers = 0;
        std::uint32_t completed_workers = 0;
        float current_loss = 0.0f;
        float current_accuracy = 0.0f;
        std::uint32_t estimated_time_remaining = 0;
    };

    struct GradientUpdate
    {
        std::string task_id;
        std::string worker_id;
        std::uint32_t epoch = 0;
        std::string gradients;
        float loss = 0.0f;
        float accuracy = 0.0f;
    };

    struct ModelUpdate
    {
        std::uint32_t model_version = 0;
        std::string parameters;
        std::string aggregation_method;
        std::uint32_t num_workers = 0;
        float global_loss = 0.0f;
        float global_accuracy = 0.0f;
    };

    // JSON mapping, found by nlohmann through ADL. from_json throws
    // json::exception on missing or mistyped fields.
    void to_json(json &j, const NodeInfo &v);
    void from_json(const json &j, NodeInfo &v);
    void to_json(json &j, const ConnectionQuality &v);
    void from_json(const json &j, ConnectionQuality &v);
    void to_json(json &j, const NetworkMetrics &v);
    void from_json(const json &j, NetworkMetrics &v);
    void to_json(json &j, const StreamConfig &v);
    void from_json(const json &j, StreamConfig &v);
    void to_json(json &j, const VideoFrame &v);
    void from_json(const json &j, VideoFrame &v);
    void to_json(json &j, const AudioChunk &v);
    void from_json(const json &j, AudioChunk &v);
    void to_json(json &j, const StreamStats &v);
    void from_json(const json &j, StreamStats &v);
    void to_json(json &j, const JobStatus &v);
    void from_json(const json &j, JobStatus &v);
    void to_json(json &j, const ComputeCapacity &v);
    void from_json(const json &j, ComputeCapacity &v);
    void to_json(json &j, const ChatSession &v);
    void from_json(const json &j, ChatSession &v);
    void to_json(json &j, const ChatMessage &v);
    void from_json(const json &j, ChatMessage &v);
    void to_json(json &j, const ProxyConfig &v);
    void from_json(const json &j, ProxyConfig &v);
    void to_json(json &j, const TrainingTask &v);
    void from_json(const json &j, TrainingTask &v);
    void to_json(json &j, const TrainingStatus &v);
    void from_json(const json &j, TrainingStatus &v);
    void to_json(json &j, const GradientUpdate &v);
    void from_json(const json &j, GradientUpdate &v);
    void to_json(json &j, const ModelUpdate &v);
    void from_json(const json &j, ModelUpdate &v);

} // namespace rpc

#endif // RECORDS_HPP
