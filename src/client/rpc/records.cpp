#include "records.hpp"
#include "../hash/hashing.hpp"

namespace rpc
{
    void to_json(json &j, const NodeInfo &v)
    {
        j = json{{"id", v.id}, {"status", v.status}, {"latencyMs", v.latency_ms}, {"threatScore", v.threat_score}};
    }

    void from_json(const json &j, NodeInfo &v)
    {
        j.at("id").get_to(v.id);
        j.at("status").get_to(v.status);
        j.at("latencyMs").get_to(v.latency_ms);
        j.at("threatScore").get_to(v.threat_score);
    }

    void to_json(json &j, const ConnectionQuality &v)
    {
        j = json{{"latencyMs", v.latency_ms}, {"jitterMs", v.jitter_ms}, {"packetLoss", v.packet_loss}};
    }

    void from_json(const json &j, ConnectionQuality &v)
    {
        j.at("latencyMs").get_to(v.latency_ms);
        j.at("jitterMs").get_to(v.jitter_ms);
        j.at("packetLoss").get_to(v.packet_loss);
    }

    void to_json(json &j, const NetworkMetrics &v)
    {
        j = json{{"peerCount", v.peer_count}, {"avgRttMs", v.avg_rtt_ms}, {"packetLoss", v.packet_loss}};
    }

    void from_json(const json &j, NetworkMetrics &v)
    {
        j.at("peerCount").get_to(v.peer_count);
        j.at("avgRttMs").get_to(v.avg_rtt_ms);
        j.at("packetLoss").get_to(v.packet_loss);
    }

    void to_json(json &j, const StreamConfig &v)
    {
        j = json{{"port", v.port},
                 {"peerHost", v.peer_host},
                 {"peerPort", v.peer_port},
                 {"streamType", static_cast<int>(v.stream_type)}};
    }

    void from_json(const json &j, StreamConfig &v)
    {
        j.at("port").get_to(v.port);
        j.at("peerHost").get_to(v.peer_host);
        j.at("peerPort").get_to(v.peer_port);
        v.stream_type = static_cast<StreamType>(j.at("streamType").get<int>());
    }

    void to_json(json &j, const VideoFrame &v)
    {
        j = json{{"frameId", v.frame_id}, {"data", hashing::base64Encode(v.data)}, {"peerAddr", v.peer_addr}};
    }

    void from_json(const json &j, VideoFrame &v)
    {
        j.at("frameId").get_to(v.frame_id);
        v.data = hashing::base64Decode(j.at("data").get<std::string>());
        v.peer_addr = j.value("peerAddr", std::string());
    }

    void to_json(json &j, const AudioChunk &v)
    {
        j = json{{"data", hashing::base64Encode(v.data)}, {"peerAddr", v.peer_addr}, {"timestamp", v.timestamp}};
    }

    void from_json(const json &j, AudioChunk &v)
    {
        v.data = hashing::base64Decode(j.at("data").get<std::string>());
        v.peer_addr = j.value("peerAddr", std::string());
        v.timestamp = j.value("timestamp", std::uint64_t(0));
    }

    void to_json(json &j, const StreamStats &v)
    {
        j = json{{"framesSent", v.frames_sent},
                 {"framesReceived", v.frames_received},
                 {"bytesSent", v.bytes_sent},
                 {"bytesReceived", v.bytes_received},
                 {"avgLatencyMs", v.avg_latency_ms}};
    }

    void from_json(const json &j, StreamStats &v)
    {
        j.at("framesSent").get_to(v.frames_sent);
        j.at("framesReceived").get_to(v.frames_received);
        j.at("bytesSent").get_to(v.bytes_sent);
        j.at("bytesReceived").get_to(v.bytes_received);
        j.at("avgLatencyMs").get_to(v.avg_latency_ms);
    }

    void to_json(json &j, const JobStatus &v)
    {
        j = json{{"jobId", v.job_id},
                 {"status", job::statusToString(v.status)},
                 {"progress", v.progress},
                 {"completedChunks", v.completed_chunks},
                 {"totalChunks", v.total_chunks},
                 {"estimatedTimeRemaining", v.estimated_time_remaining},
                 {"errorMsg", v.error_msg}};
    }

    void from_json(const json &j, JobStatus &v)
    {
        j.at("jobId").get_to(v.job_id);
        v.status = job::statusFromString(j.at("status").get<std::string>());
        v.progress = j.value("progress", 0.0f);
        v.completed_chunks = j.value("completedChunks", std::uint32_t(0));
        v.total_chunks = j.value("totalChunks", std::uint32_t(0));
        v.estimated_time_remaining = j.value("estimatedTimeRemaining", std::uint32_t(0));
        v.error_msg = j.value("errorMsg", std::string());
    }

    void to_json(json &j, const ComputeCapacity &v)
    {
        j = json{{"cpuCores", v.cpu_cores},
                 {"ramMb", v.ram_mb},
                 {"currentLoad", v.current_load},
                 {"diskMb", v.disk_mb},
                 {"bandwidthMbps", v.bandwidth_mbps}};
    }

    void from_json(const json &j, ComputeCapacity &v)
    {
        j.at("cpuCores").get_to(v.cpu_cores);
        j.at("ramMb").get_to(v.ram_mb);
        j.at("currentLoad").get_to(v.current_load);
        v.disk_mb = j.value("diskMb", std::uint64_t(0));
        v.bandwidth_mbps = j.value("bandwidthMbps", std::uint32_t(0));
    }

    void to_json(json &j, const ChatSession &v)
    {
        j = json{{"sessionId", v.session_id}, {"peerAddr", v.peer_addr}, {"established", v.established}};
    }

    void from_json(const json &j, ChatSession &v)
    {
        j.at("sessionId").get_to(v.session_id);
        j.at("peerAddr").get_to(v.peer_addr);
        v.established = j.value("established", std::int64_t(0));
    }

    void to_json(json &j, const ChatMessage &v)
    {
        j = json{{"fromPeer", v.from_peer},
                 {"toPeer", v.to_peer},
                 {"message", v.message},
                 {"timestamp", v.timestamp},
                 {"messageId", v.message_id},
                 {"encryptionType", v.encryption_type},
                 {"signature", hashing::base64Encode(v.signature)}};
    }

    void from_json(const json &j, ChatMessage &v)
    {
        j.at("fromPeer").get_to(v.from_peer);
        j.at("toPeer").get_to(v.to_peer);
        j.at("message").get_to(v.message);
        v.timestamp = j.value("timestamp", std::int64_t(0));
        v.message_id = j.value("messageId", std::string());
        v.encryption_type = j.value("encryptionType", std::string());
        v.signature = hashing::base64Decode(j.value("signature", std::string()));
    }

    void to_json(json &j, const ProxyConfig &v)
    {
        j = json{{"enabled", v.enabled},
                 {"proxyType", v.proxy_type},
                 {"proxyHost", v.proxy_host},
                 {"proxyPort", v.proxy_port},
                 {"username", v.username},
                 {"password", v.password}};
    }

    void from_json(const json &j, ProxyConfig &v)
    {
        j.at("enabled").get_to(v.enabled);
        j.at("proxyType").get_to(v.proxy_type);
        j.at("proxyHost").get_to(v.proxy_host);
        j.at("proxyPort").get_to(v.proxy_port);
        v.username = j.value("username", std::string());
        v.password = j.value("password", std::string());
    }

    void to_json(json &j, const TrainingTask &v)
    {
        j = json{{"taskId", v.task_id},
                 {"datasetId", v.dataset_id},
                 {"modelArchitecture", v.model_architecture},
                 {"aggregatorNode", v.aggregator_node},
                 {"workerNodes", v.worker_nodes},
                 {"hyperparameters", v.hyperparameters},
                 {"epochs", v.epochs}};
    }

    void from_json(const json &j, TrainingTask &v)
    {
        j.at("taskId").get_to(v.task_id);
        j.at("datasetId").get_to(v.dataset_id);
        j.at("modelArchitecture").get_to(v.model_architecture);
        v.aggregator_node = j.value("aggregatorNode", std::string());
        v.worker_nodes = j.value("workerNodes", std::vector<std::string>());
        v.hyperparameters = j.value("hyperparameters", std::map<std::string, std::string>());
        v.epochs = j.value("epochs", std::uint32_t(1));
    }

    void to_json(json &j, const TrainingStatus &v)
    {
        j = json{{"taskId", v.task_id},
                 {"currentEpoch", v.current_epoch},
                 {"totalEpochs", v.total_epochs},
                 {"activeWorkers", v.active_workers},
                 {"completedWorkers", v.completed_workers},
                 {"currentLoss", v.current_loss},
                 {"currentAccuracy", v.current_accuracy},
                 {"estimatedTimeRemaining", v.estimated_time_remaining}};
    }

    void from_json(const json &j, TrainingStatus &v)
    {
        j.at("taskId").get_to(v.task_id);
        j.at("currentEpoch").get_to(v.current_epoch);
        j.at("totalEpochs").get_to(v.total_epochs);
        v.active_workers = j.value("activeWorkers", std::uint32_t(0));
        v.completed_workers = j.value("completedWorkers", std::uint32_t(0));
        v.current_loss = j.value("currentLoss", 0.0f);
        v.current_accuracy = j.value("currentAccuracy", 0.0f);
        v.estimated_time_remaining = j.value("estimatedTimeRemaining", std::uint32_t(0));
    }

    void to_json(json &j, const GradientUpdate &v)
    {
        j = json{{"taskId", v.task_id},
                 {"workerId", v.worker_id},
                 {"epoch", v.epoch},
                 {"gradients", hashing::base64Encode(v.gradients)},
                 {"loss", v.loss},
                 {"accuracy", v.accuracy}};
    }

    void from_json(const json &j, GradientUpdate &v)
    {
        j.at("taskId").get_to(v.task_id);
        j.at("workerId").get_to(v.worker_id);
        j.at("epoch").get_to(v.epoch);
        v.gradients = hashing::base64Decode(j.at("gradients").get<std::string>());
        v.loss = j.value("loss", 0.0f);
        v.accuracy = j.value("accuracy", 0.0f);
    }

    void to_json(json &j, const ModelUpdate &v)
    {
        j = json{{"modelVersion", v.model_version},
                 {"parameters", hashing::base64Encode(v.parameters)},
                 {"aggregationMethod", v.aggregation_method},
                 {"numWorkers", v.num_workers},
                 {"globalLoss", v.global_loss},
                 {"globalAccuracy", v.global_accuracy}};
    }

    void from_json(const json &j, ModelUpdate &v)
    {
        j.at("modelVersion").get_to(v.model_version);
        v.parameters = hashing::base64Decode(j.at("parameters").get<std::string>());
        v.aggregation_method = j.value("aggregationMethod", std::string());
        v.num_workers = j.value("numWorkers", std::uint32_t(0));
        v.global_loss = j.value("globalLoss", 0.0f);
        v.global_accuracy = j.value("globalAccuracy", 0.0f);
    }
}
