/**
 * @file config_test.cpp
 * @brief Client configuration loading and the hashing helpers it sits beside.
 */

#include "../src/client/hash/hashing.hpp"
#include "../src/client/load_config/load_config.hpp"
#include "support/check.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path tempFile(const std::string &name)
{
    return fs::temp_directory_path() / (name + "_" + std::to_string(::getpid()) + ".json");
}

static void test_defaults_from_empty_object()
{
    std::printf("  test_defaults_from_empty_object...\n");
    ConfigReader::ClientConfig config = ConfigReader::ClientConfig::fromJson(json::object());
    CHECK(config.host == "localhost");
    CHECK(config.port == 8080);
    CHECK(config.log_level == "info");
    CHECK(config.log_file.empty());
    CHECK(config.connect_timeout_ms == 5000);
    CHECK(config.timeouts.query_ms == 800);
    CHECK(config.timeouts.control_ms == 5000);
    CHECK(config.timeouts.bulk_ms == 30000);
    CHECK(config.timeouts.result_margin_ms == 2000);
    CHECK(config.chunk.chunk_size == 65536);
    CHECK(config.chunk.max_chunk_size == 1048576);

    // Anything that is not an object falls back to the defaults.
    ConfigReader::ClientConfig from_array = ConfigReader::ClientConfig::fromJson(json::array());
    CHECK(from_array.port == 8080);
}

static void test_partial_overrides()
{
    std::printf("  test_partial_overrides...\n");
    json j = {
        {"host", "10.0.0.5"},
        {"port", 9100},
        {"timeouts", {{"query_ms", 50}}},
        {"chunk", {{"chunk_size", 4096}}}};
    ConfigReader::ClientConfig config = ConfigReader::ClientConfig::fromJson(j);
    CHECK(config.host == "10.0.0.5");
    CHECK(config.port == 9100);
    CHECK(config.timeouts.query_ms == 50);
    CHECK(config.timeouts.control_ms == 5000);
    CHECK(config.chunk.chunk_size == 4096);
    CHECK(config.chunk.min_chunk_size == 65536);
}

static void test_invalid_endpoint_rejected()
{
    std::printf("  test_invalid_endpoint_rejected...\n");
    CHECK_THROWS(ConfigReader::ClientConfig::fromJson(json{{"host", ""}}), std::invalid_argument);
    CHECK_THROWS(ConfigReader::ClientConfig::fromJson(json{{"port", 70000}}), std::invalid_argument);
    CHECK_THROWS(ConfigReader::ClientConfig::fromJson(json{{"port", "http"}}), std::invalid_argument);
}

static void test_save_and_load()
{
    std::printf("  test_save_and_load...\n");
    ConfigReader::ClientConfig config;
    config.host = "orchestrator.local";
    config.port = 7001;
    config.log_level = "debug";
    config.timeouts.bulk_ms = 12345;
    config.chunk.max_chunk_size = 2048;

    fs::path path = tempFile("client_config_test");
    CHECK(ConfigReader::save(path.string(), config.toJson()));

    ConfigReader::ClientConfig loaded = ConfigReader::load_client_config(path.string());
    CHECK(loaded.host == "orchestrator.local");
    CHECK(loaded.port == 7001);
    CHECK(loaded.log_level == "debug");
    CHECK(loaded.timeouts.bulk_ms == 12345);
    CHECK(loaded.chunk.max_chunk_size == 2048);
    CHECK(loaded.toJson() == config.toJson());

    json raw = ConfigReader::load(path.string());
    CHECK(ConfigReader::get_config_string("host", raw) == "orchestrator.local");
    CHECK(ConfigReader::get_config_short("port", raw) == 7001);
    CHECK(ConfigReader::get_config_value("missing", raw) == 0);
    CHECK(ConfigReader::get_config_string("port", raw).empty());
    fs::remove(path);
}

static void test_load_failures()
{
    std::printf("  test_load_failures...\n");
    fs::path missing = tempFile("client_config_missing");
    fs::remove(missing);
    CHECK_THROWS(ConfigReader::load(missing.string()), std::runtime_error);

    // A file that does not parse reads as an empty object.
    fs::path broken = tempFile("client_config_broken");
    {
        std::ofstream out(broken);
        out << "{ \"host\": ";
    }
    CHECK(ConfigReader::load(broken.string()) == json::object());
    CHECK(ConfigReader::load_client_config(broken.string()).host == "localhost");
    fs::remove(broken);
}

static void test_sha256_vectors()
{
    std::printf("  test_sha256_vectors...\n");
    CHECK(hashing::sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(hashing::sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    hashing::Sha256 pieces;
    pieces.update("a");
    pieces.update(std::string("bc"));
    CHECK(pieces.hexDigest() == hashing::sha256Hex("abc"));
    CHECK_THROWS(pieces.update("more"), std::logic_error);
}

static void test_base64_vectors()
{
    std::printf("  test_base64_vectors...\n");
    CHECK(hashing::base64Encode("").empty());
    CHECK(hashing::base64Encode("f") == "Zg==");
    CHECK(hashing::base64Encode("fo") == "Zm8=");
    CHECK(hashing::base64Encode("foo") == "Zm9v");
    CHECK(hashing::base64Encode("foobar") == "Zm9vYmFy");

    CHECK(hashing::base64Decode("").empty());
    CHECK(hashing::base64Decode("Zg==") == "f");
    CHECK(hashing::base64Decode("Zm8=") == "fo");
    CHECK(hashing::base64Decode("Zm9vYmFy") == "foobar");

    const std::string binary("\0\xff\x10\n", 4);
    CHECK(hashing::base64Decode(hashing::base64Encode(binary)) == binary);

    CHECK_THROWS(hashing::base64Decode("abc"), std::invalid_argument);
    CHECK_THROWS(hashing::base64Decode("@@@@"), std::invalid_argument);
}

int main()
{
    std::printf("config_test\n");

    test_defaults_from_empty_object();
    test_partial_overrides();
    test_invalid_endpoint_rejected();
    test_save_and_load();
    test_load_failures();
    test_sha256_vectors();
    test_base64_vectors();

    std::printf("OK: all config tests passed\n");
    return 0;
}
