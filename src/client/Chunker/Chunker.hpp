// File: Chunker.hpp
#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace chunker
{
    constexpr std::size_t DEFAULT_CHUNK_SIZE = 65536;
    constexpr std::size_t DEFAULT_MIN_CHUNK_SIZE = 1024;
    constexpr std::size_t DEFAULT_MAX_CHUNK_SIZE = 1048576;
    // How much of the payload the adaptive strategy inspects.
    constexpr std::size_t ADAPTIVE_SCAN_SIZE = 1024;

    enum class ChunkStrategy
    {
        FixedSize,
        LineBased,
        RecordBased,
        Adaptive
    };

    // Wire names: "fixed_size", "line_based", "record_based", "adaptive".
    std::string strategyToString(ChunkStrategy strategy);
    // Throws std::invalid_argument for an unknown name.
    ChunkStrategy strategyFromString(const std::string &name);

    struct ChunkInfo
    {
        std::size_t index;
        std::size_t offset;
        std::size_t size;
        std::string hash;
    };

    // Deterministic, reversible splitting: for every strategy
    // merge(split(data)) == data.
    class Chunker
    {
    public:
        explicit Chunker(std::size_t chunk_size = DEFAULT_CHUNK_SIZE,
                         std::size_t min_chunk_size = DEFAULT_MIN_CHUNK_SIZE,
                         std::size_t max_chunk_size = DEFAULT_MAX_CHUNK_SIZE,
                         ChunkStrategy strategy = ChunkStrategy::FixedSize,
                         std::string record_delimiter = "\n\n");

        std::vector<std::string> split(const std::string &data) const;
        std::vector<std::string> split(const std::string &data, ChunkStrategy strategy) const;
        std::vector<std::pair<std::string, ChunkInfo>> splitWithInfo(const std::string &data) const;

        std::vector<std::string> splitFixedSize(const std::string &data) const;
        std::vector<std::string> splitLineBased(const std::string &data) const;
        std::vector<std::string> splitRecordBased(const std::string &data) const;
        std::vector<std::string> splitRecordBased(const std::string &data, const std::string &delimiter) const;
        std::vector<std::string> splitAdaptive(const std::string &data) const;

        static std::string merge(const std::vector<std::string> &chunks);

        static std::string hashChunk(const std::string &chunk);
        static std::string hashData(const std::string &data);
        // Merges, hashes and compares. A mismatch is reported, never thrown.
        static bool verifyIntegrity(const std::vector<std::string> &chunks, const std::string &expected_hash);

        std::size_t estimateChunks(std::size_t data_size) const;
        std::size_t optimizeChunkSize(std::size_t data_size, std::size_t target_chunks = 8) const;

        std::size_t chunkSize() const { return chunk_size_; }
        std::size_t minChunkSize() const { return min_chunk_size_; }
        std::size_t maxChunkSize() const { return max_chunk_size_; }
        ChunkStrategy strategy() const { return strategy_; }

    private:
        std::vector<std::string> accumulate(const std::string &data, const std::string &delimiter) const;

        std::size_t chunk_size_;
        std::size_t min_chunk_size_;
        std::size_t max_chunk_size_;
        ChunkStrategy strategy_;
        std::string record_delimiter_;
    };

    // Base64 wrappers used when chunks travel inside JSON.
    std::string encodeForTransmission(const std::string &data);
    std::string decodeFromTransmission(const std::string &encoded);
}
