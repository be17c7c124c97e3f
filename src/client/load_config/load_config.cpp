#include "load_config.hpp"
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            MyLogger::debug("Loaded JSON: " + j.dump(4));
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
        }
        return json::object();
    }

    bool save(const std::string &filepath, const json &j)
    {
        std::ofstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file for writing: " + filepath);
            throw std::runtime_error("Could not open config file for writing: " + filepath);
        }

        config_file << j.dump(4);
        if (!config_file)
        {
            MyLogger::error("Error writing JSON to file " + filepath);
            return false;
        }
        MyLogger::info("Configuration file saved successfully: " + filepath);
        return true;
    }

    int get_config_value(const std::string &key, const json &j)
    {
        try
        {
            if (!j.contains(key))
            {
                MyLogger::error("Key not found in JSON: " + key);
                return 0;
            }
            if (!j[key].is_number_integer())
            {
                MyLogger::error("Key is not an integer: " + key);
                return 0;
            }
            return j[key].get<int>();
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Error retrieving int value for key '" + key + "': " + e.what());
            return 0;
        }
    }

    std::string get_config_string(const std::string &key, const json &j)
    {
        try
        {
            if (!j.contains(key))
            {
                MyLogger::error("Key not found in JSON: " + key);
                return "";
            }
            if (!j[key].is_string())
            {
                MyLogger::error("Key is not a string: " + key);
                return "";
            }
            return j[key].get<std::string>();
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Error retrieving string value for key '" + key + "': " + e.what());
            return "";
        }
    }

    unsigned short get_config_short(const std::string &key, const json &j)
    {
        try
        {
            if (!j.contains(key))
            {
                MyLogger::error("Key not found in JSON: " + key);
                return 0;
            }
            if (!j[key].is_number_integer() || j[key].get<long long>() < 0)
            {
                MyLogger::error("Key is not an unsigned integer: " + key);
                return 0;
            }
            auto val = j[key].get<unsigned long long>();
            if (val > std::numeric_limits<unsigned short>::max())
            {
                MyLogger::error("Value for key '" + key + "' exceeds unsigned short limit");
                return 0;
            }
            return static_cast<unsigned short>(val);
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Error retrieving unsigned short value for key '" + key + "': " + e.what());
            return 0;
        }
    }

    namespace
    {
        // Only overwrite the default when the key is present, so a partial
        // config file does not zero out everything else.
        void readInt(const json &j, const std::string &key, int &out)
        {
            if (j.contains(key))
                out = get_config_value(key, j);
        }

        void readSize(const json &j, const std::string &key, std::size_t &out)
        {
            if (j.contains(key))
                out = static_cast<std::size_t>(get_config_value(key, j));
        }
    }

    ClientConfig ClientConfig::fromJson(const json &j)
    {
        ClientConfig config;
        if (!j.is_object())
        {
            MyLogger::warning("Client configuration is not a JSON object, using defaults");
            return config;
        }

        if (j.contains("host"))
            config.host = get_config_string("host", j);
        if (j.contains("port"))
            config.port = get_config_short("port", j);
        if (j.contains("log_level"))
            config.log_level = get_config_string("log_level", j);
        if (j.contains("log_file"))
            config.log_file = get_config_string("log_file", j);
        readInt(j, "connect_timeout_ms", config.connect_timeout_ms);
        readInt(j, "join_timeout_ms", config.join_timeout_ms);
        readInt(j, "heartbeat_ms", config.heartbeat_ms);

        if (j.contains("timeouts") && j["timeouts"].is_object())
        {
            const auto &t = j["timeouts"];
            readInt(t, "query_ms", config.timeouts.query_ms);
            readInt(t, "control_ms", config.timeouts.control_ms);
            readInt(t, "bulk_ms", config.timeouts.bulk_ms);
            readInt(t, "result_margin_ms", config.timeouts.result_margin_ms);
        }

        if (j.contains("chunk") && j["chunk"].is_object())
        {
            const auto &c = j["chunk"];
            readSize(c, "chunk_size", config.chunk.chunk_size);
            readSize(c, "min_chunk_size", config.chunk.min_chunk_size);
            readSize(c, "max_chunk_size", config.chunk.max_chunk_size);
        }

        if (config.host.empty() || config.port == 0)
        {
            throw std::invalid_argument("Client configuration needs a non-empty host and a non-zero port");
        }
        return config;
    }

    json ClientConfig::toJson() const
    {
        return json{
            {"host", host},
            {"port", port},
            {"log_level", log_level},
            {"log_file", log_file},
            {"connect_timeout_ms", connect_timeout_ms},
            {"join_timeout_ms", join_timeout_ms},
            {"heartbeat_ms", heartbeat_ms},
            {"timeouts", {{"query_ms", timeouts.query_ms}, {"control_ms", timeouts.control_ms}, {"bulk_ms", timeouts.bulk_ms}, {"result_margin_ms", timeouts.result_margin_ms}}},
            {"chunk", {{"chunk_size", chunk.chunk_size}, {"min_chunk_size", chunk.min_chunk_size}, {"max_chunk_size", chunk.max_chunk_size}}}};
    }

    ClientConfig load_client_config(const std::string &filepath)
    {
        return ClientConfig::fromJson(load(filepath));
    }
}
