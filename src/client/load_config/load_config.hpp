#ifndef LOAD_CONFIG_HPP
#define LOAD_CONFIG_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "../logger/Mylogger.hpp"

using json = nlohmann::json;

namespace ConfigReader
{
    json load(const std::string &filepath);
    bool save(const std::string &filepath, const json &j);
    int get_config_value(const std::string &key, const json &j);
    std::string get_config_string(const std::string &key, const json &j);
    unsigned short get_config_short(const std::string &key, const json &j);

    // Per latency class RPC timeouts, in milliseconds.
    struct RpcTimeouts
    {
        int query_ms = 800;
        int control_ms = 5000;
        int bulk_ms = 30000;
        int result_margin_ms = 2000;
    };

    struct ChunkDefaults
    {
        std::size_t chunk_size = 65536;
        std::size_t min_chunk_size = 65536;
        std::size_t max_chunk_size = 1048576;
    };

    // Everything the client reads from config/client_config.json.
    // Missing keys keep the defaults below.
    struct ClientConfig
    {
        std::string host = "localhost";
        unsigned short port = 8080;
        std::string log_level = "info";
        std::string log_file;
        int connect_timeout_ms = 5000;
        int join_timeout_ms = 2000;
        int heartbeat_ms = 100;
        RpcTimeouts timeouts;
        ChunkDefaults chunk;

        static ClientConfig fromJson(const json &j);
        json toJson() const;
    };

    ClientConfig load_client_config(const std::string &filepath);
};

#endif // LOAD_CONFIG_HPP
