// main.cpp
#include "Chunker/Chunker.hpp"
#include "compute/compute_client.hpp"
#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace
{
    const char *SAMPLE_INPUT =
        "the quick brown fox\n"
        "jumps over the lazy dog\n"
        "and the dog sleeps\n";

    std::string readFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open input file: " + path);
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    // Counts whitespace separated words in one chunk.
    std::string countWords(const std::string &chunk)
    {
        std::istringstream in(chunk);
        std::string word;
        std::uint64_t count = 0;
        while (in >> word)
            ++count;
        return std::to_string(count);
    }

    std::string sumCounts(const std::vector<std::string> &counts)
    {
        std::uint64_t total = 0;
        for (const auto &count : counts)
            total += std::stoull(count);
        return std::to_string(total);
    }
}

int main(int argc, char *argv[])
{
    try
    {
        const std::string config_path = (argc > 1) ? argv[1] : "config/client_config.json";
        const std::string input_path = (argc > 2) ? argv[2] : "";

        ConfigReader::ClientConfig config = ConfigReader::load_client_config(config_path);
        MyLogger::init(config.log_level, config.log_file);

        std::string input = input_path.empty() ? std::string(SAMPLE_INPUT) : readFile(input_path);

        // Line based split keeps words intact across chunks.
        chunker::Chunker lines(config.chunk.chunk_size, 1, config.chunk.max_chunk_size, chunker::ChunkStrategy::LineBased);
        job::JobDefinition word_count = job::JobBuilder("word-count")
                                            .withSplit([lines](const std::string &data)
                                                       { return lines.split(data); })
                                            .withExecute(countWords)
                                            .withMerge(sumCounts)
                                            .withMetadata("source", input_path.empty() ? "sample" : input_path)
                                            .build();

        std::cout << "\n=== Compute Client ===\n";
        std::cout << "Orchestrator: " << config.host << ":" << config.port << "\n";
        std::cout << "Input: " << input.size() << " bytes\n\n";

        compute::ComputeClient client(config);
        if (!client.connect())
        {
            MyLogger::warning("Orchestrator unreachable, the job will run on this host");
        }

        std::string job_id = client.submit(word_count, input);
        compute::JobResult result = client.get_result(job_id, std::chrono::seconds(60));
        rpc::JobStatus status = client.get_status(job_id);

        std::cout << "Job:    " << job_id << " (" << job::statusToString(status.status) << ")\n";
        std::cout << "Words:  " << result.data << "\n";
        std::cout << "Worker: " << result.worker << "\n";

        client.cleanup_job(job_id);
        client.disconnect();
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n!!! Critical Error: " << e.what() << " !!!\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
