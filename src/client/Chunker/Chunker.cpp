// File: Chunker.cpp
#include "Chunker.hpp"
#include "../hash/hashing.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <stdexcept>

namespace chunker
{
    std::string strategyToString(ChunkStrategy strategy)
    {
        switch (strategy)
        {
        case ChunkStrategy::FixedSize:
            return "fixed_size";
        case ChunkStrategy::LineBased:
            return "line_based";
        case ChunkStrategy::RecordBased:
            return "record_based";
        case ChunkStrategy::Adaptive:
            return "adaptive";
        }
        return "fixed_size";
    }

    ChunkStrategy strategyFromString(const std::string &name)
    {
        if (name == "fixed_size")
            return ChunkStrategy::FixedSize;
        if (name == "line_based")
            return ChunkStrategy::LineBased;
        if (name == "record_based")
            return ChunkStrategy::RecordBased;
        if (name == "adaptive")
            return ChunkStrategy::Adaptive;
        throw std::invalid_argument("Unknown split strategy: " + name);
    }

    Chunker::Chunker(std::size_t chunk_size, std::size_t min_chunk_size, std::size_t max_chunk_size,
                     ChunkStrategy strategy, std::string record_delimiter)
        : chunk_size_(chunk_size),
          min_chunk_size_(min_chunk_size),
          max_chunk_size_(max_chunk_size),
          strategy_(strategy),
          record_delimiter_(std::move(record_delimiter))
    {
        if (chunk_size_ == 0)
        {
            throw std::invalid_argument("Chunk size must be greater than zero");
        }
        if (min_chunk_size_ > max_chunk_size_)
        {
            throw std::invalid_argument("Minimum chunk size exceeds maximum chunk size");
        }
        if (record_delimiter_.empty())
        {
            throw std::invalid_argument("Record delimiter must not be empty");
        }
    }

    std::vector<std::string> Chunker::split(const std::string &data) const
    {
        return split(data, strategy_);
    }

    std::vector<std::string> Chunker::split(const std::string &data, ChunkStrategy strategy) const
    {
        switch (strategy)
        {
        case ChunkStrategy::FixedSize:
            return splitFixedSize(data);
        case ChunkStrategy::LineBased:
            return splitLineBased(data);
        case ChunkStrategy::RecordBased:
            return splitRecordBased(data);
        case ChunkStrategy::Adaptive:
            return splitAdaptive(data);
        }
        return splitFixedSize(data);
    }

    std::vector<std::pair<std::string, ChunkInfo>> Chunker::splitWithInfo(const std::string &data) const
    {
        std::vector<std::pair<std::string, ChunkInfo>> result;
        std::size_t offset = 0;
        std::size_t index = 0;
        for (auto &chunk : split(data))
        {
            ChunkInfo info{index++, offset, chunk.size(), hashChunk(chunk)};
            offset += chunk.size();
            result.emplace_back(std::move(chunk), std::move(info));
        }
        return result;
    }

    std::vector<std::string> Chunker::splitFixedSize(const std::string &data) const
    {
        std::vector<std::string> chunks;
        chunks.reserve(estimateChunks(data.size()));
        for (std::size_t offset = 0; offset < data.size(); offset += chunk_size_)
        {
            chunks.push_back(data.substr(offset, chunk_size_));
        }
        return chunks;
    }

    std::vector<std::string> Chunker::splitLineBased(const std::string &data) const
    {
        return accumulate(data, "\n");
    }

    std::vector<std::string> Chunker::splitRecordBased(const std::string &data) const
    {
        return accumulate(data, record_delimiter_);
    }

    std::vector<std::string> Chunker::splitRecordBased(const std::string &data, const std::string &delimiter) const
    {
        if (delimiter.empty())
        {
            throw std::invalid_argument("Record delimiter must not be empty");
        }
        return accumulate(data, delimiter);
    }

    std::vector<std::string> Chunker::splitAdaptive(const std::string &data) const
    {
        // Text with a newline early on is treated as line oriented, anything
        // else as opaque binary.
        const std::size_t scan = std::min(data.size(), ADAPTIVE_SCAN_SIZE);
        if (data.find('\n', 0) < scan)
        {
            MyLogger::debug("Adaptive split: newline found in scan window, using line-based chunks");
            return splitLineBased(data);
        }
        MyLogger::debug("Adaptive split: no newline in scan window, using fixed-size chunks");
        return splitFixedSize(data);
    }

    // Units are delimiter-terminated pieces (the delimiter stays with the unit,
    // the last unit may lack it). Units are packed into a chunk until the next
    // one would overflow chunk_size_; a single oversized unit forms its own chunk.
    std::vector<std::string> Chunker::accumulate(const std::string &data, const std::string &delimiter) const
    {
        std::vector<std::string> chunks;
        std::string current;
        std::size_t pos = 0;
        while (pos < data.size())
        {
            std::size_t found = data.find(delimiter, pos);
            std::size_t end = (found == std::string::npos) ? data.size() : found + delimiter.size();
            std::size_t unit_size = end - pos;

            if (!current.empty() && current.size() + unit_size > chunk_size_)
            {
                chunks.push_back(std::move(current));
                current.clear();
            }
            current.append(data, pos, unit_size);
            pos = end;
        }
        if (!current.empty())
        {
            chunks.push_back(std::move(current));
        }
        return chunks;
    }

    std::string Chunker::merge(const std::vector<std::string> &chunks)
    {
        std::size_t total = 0;
        for (const auto &chunk : chunks)
            total += chunk.size();

        std::string merged;
        merged.reserve(total);
        for (const auto &chunk : chunks)
            merged += chunk;
        return merged;
    }

    std::string Chunker::hashChunk(const std::string &chunk)
    {
        return hashing::sha256Hex(chunk);
    }

    std::string Chunker::hashData(const std::string &data)
    {
        return hashing::sha256Hex(data);
    }

    bool Chunker::verifyIntegrity(const std::vector<std::string> &chunks, const std::string &expected_hash)
    {
        const std::string actual = hashData(merge(chunks));
        if (actual != expected_hash)
        {
            MyLogger::warning("Chunk integrity check failed: expected " + expected_hash + ", got " + actual);
            return false;
        }
        return true;
    }

    std::size_t Chunker::estimateChunks(std::size_t data_size) const
    {
        return std::max<std::size_t>(1, (data_size + chunk_size_ - 1) / chunk_size_);
    }

    std::size_t Chunker::optimizeChunkSize(std::size_t data_size, std::size_t target_chunks) const
    {
        if (target_chunks == 0)
        {
            throw std::invalid_argument("Target chunk count must be greater than zero");
        }
        std::size_t optimal = data_size / target_chunks;
        return std::max(min_chunk_size_, std::min(optimal, max_chunk_size_));
    }

    std::string encodeForTransmission(const std::string &data)
    {
        return hashing::base64Encode(data);
    }

    std::string decodeFromTransmission(const std::string &encoded)
    {
        return hashing::base64Decode(encoded);
    }
}
