#include "job.hpp"
#include "../hash/hashing.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <stdexcept>

namespace job
{
    std::string statusToString(TaskStatus status)
    {
        switch (status)
        {
        case TaskStatus::PENDING:
            return "pending";
        case TaskStatus::ASSIGNED:
            return "assigned";
        case TaskStatus::COMPUTING:
            return "computing";
        case TaskStatus::VERIFYING:
            return "verifying";
        case TaskStatus::COMPLETED:
            return "completed";
        case TaskStatus::FAILED:
            return "failed";
        case TaskStatus::TIMEOUT:
            return "timeout";
        case TaskStatus::CANCELLED:
            return "cancelled";
        }
        return "failed";
    }

    TaskStatus statusFromString(const std::string &name)
    {
        if (name == "pending")
            return TaskStatus::PENDING;
        if (name == "assigned")
            return TaskStatus::ASSIGNED;
        if (name == "computing")
            return TaskStatus::COMPUTING;
        if (name == "verifying")
            return TaskStatus::VERIFYING;
        if (name == "completed")
            return TaskStatus::COMPLETED;
        if (name == "timeout")
            return TaskStatus::TIMEOUT;
        if (name == "cancelled")
            return TaskStatus::CANCELLED;
        return TaskStatus::FAILED;
    }

    bool isTerminal(TaskStatus status)
    {
        return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED ||
               status == TaskStatus::TIMEOUT || status == TaskStatus::CANCELLED;
    }

    std::vector<std::string> defaultSplit(const std::string &data, std::size_t chunk_size)
    {
        chunker::Chunker fixed(chunk_size, 1, std::max<std::size_t>(chunk_size, 1));
        return fixed.splitFixedSize(data);
    }

    std::string defaultExecute(const std::string &chunk)
    {
        return chunk;
    }

    std::string defaultMerge(const std::vector<std::string> &results)
    {
        return chunker::Chunker::merge(results);
    }

    std::string makeJobId(const std::string &name, const std::string &input)
    {
        hashing::Sha256 digest;
        digest.update(name);
        digest.update(input.data(), std::min(input.size(), JOB_ID_PREFIX_BYTES));
        return "job-" + digest.hexDigest().substr(0, 16);
    }

    // ---------------------------
    // JobManifest
    // ---------------------------

    json JobManifest::toJson() const
    {
        return json{
            {"jobId", job_id},
            {"wasmModule", hashing::base64Encode(module)},
            {"inputData", hashing::base64Encode(input_data)},
            {"splitStrategy", split_strategy},
            {"minChunkSize", min_chunk_size},
            {"maxChunkSize", max_chunk_size},
            {"verificationMode", verification_mode},
            {"timeoutSecs", timeout_secs},
            {"retryCount", retry_count},
            {"priority", priority},
            {"redundancy", redundancy},
            {"metadata", metadata}};
    }

    JobManifest JobManifest::fromJson(const json &j)
    {
        static const char *required[] = {"jobId", "splitStrategy", "minChunkSize", "maxChunkSize",
                                         "verificationMode", "timeoutSecs", "retryCount", "priority",
                                         "redundancy"};
        for (const char *key : required)
        {
            if (!j.contains(key))
            {
                throw std::invalid_argument(std::string("Manifest is missing field: ") + key);
            }
        }

        JobManifest manifest;
        try
        {
            manifest.job_id = j.at("jobId").get<std::string>();
            manifest.module = hashing::base64Decode(j.value("wasmModule", std::string()));
            manifest.input_data = hashing::base64Decode(j.value("inputData", std::string()));
            manifest.split_strategy = j.at("splitStrategy").get<std::string>();
            manifest.min_chunk_size = j.at("minChunkSize").get<std::uint64_t>();
            manifest.max_chunk_size = j.at("maxChunkSize").get<std::uint64_t>();
            manifest.verification_mode = j.at("verificationMode").get<std::string>();
            manifest.timeout_secs = j.at("timeoutSecs").get<std::uint32_t>();
            manifest.retry_count = j.at("retryCount").get<std::uint32_t>();
            manifest.priority = j.at("priority").get<std::uint32_t>();
            manifest.redundancy = j.at("redundancy").get<std::uint32_t>();
            if (j.contains("metadata") && j["metadata"].is_object())
                manifest.metadata = j["metadata"];
        }
        catch (const json::exception &e)
        {
            throw std::invalid_argument(std::string("Malformed manifest: ") + e.what());
        }
        return manifest;
    }

    // ---------------------------
    // JobDefinition
    // ---------------------------

    JobDefinition::JobDefinition(std::string name) : name_(std::move(name))
    {
        if (name_.empty())
        {
            throw std::invalid_argument("Job name must not be empty");
        }
    }

    void JobDefinition::requireMutable(const char *what) const
    {
        if (validated_)
        {
            throw std::logic_error("Job " + name_ + " is already validated, cannot set " + what);
        }
    }

    void JobDefinition::setSplit(SplitFn fn)
    {
        requireMutable("split");
        split_fn_ = std::move(fn);
    }

    void JobDefinition::setExecute(ExecuteFn fn)
    {
        requireMutable("execute");
        execute_fn_ = std::move(fn);
    }

    void JobDefinition::setMerge(MergeFn fn)
    {
        requireMutable("merge");
        merge_fn_ = std::move(fn);
    }

    void JobDefinition::addMetadata(const std::string &key, const json &value)
    {
        requireMutable("metadata");
        metadata_[key] = value;
    }

    bool JobDefinition::validate()
    {
        if (validated_)
            return true;

        if (!split_fn_)
        {
            MyLogger::warning("Job " + name_ + " missing split function, using default");
            split_fn_ = [](const std::string &data)
            { return defaultSplit(data); };
        }
        if (!execute_fn_)
        {
            MyLogger::warning("Job " + name_ + " missing execute function, using identity");
            execute_fn_ = defaultExecute;
        }
        if (!merge_fn_)
        {
            MyLogger::warning("Job " + name_ + " missing merge function, using default");
            merge_fn_ = defaultMerge;
        }
        validated_ = true;
        return true;
    }

    std::vector<std::string> JobDefinition::split(const std::string &data) const
    {
        if (split_fn_)
            return split_fn_(data);
        return defaultSplit(data);
    }

    std::string JobDefinition::execute(const std::string &chunk) const
    {
        if (execute_fn_)
            return execute_fn_(chunk);
        return defaultExecute(chunk);
    }

    std::string JobDefinition::merge(const std::vector<std::string> &results) const
    {
        if (merge_fn_)
            return merge_fn_(results);
        return defaultMerge(results);
    }

    std::string JobDefinition::run(const std::string &input) const
    {
        std::vector<std::string> chunks = split(input);
        std::vector<std::string> results;
        results.reserve(chunks.size());
        for (const auto &chunk : chunks)
        {
            results.push_back(execute(chunk));
        }
        return merge(results);
    }

    JobManifest JobDefinition::toManifest(const std::string &input, const ManifestOptions &options) const
    {
        if (options.min_chunk_size > options.max_chunk_size)
        {
            throw std::invalid_argument("minChunkSize exceeds maxChunkSize");
        }
        // Rejects unknown strategy names before anything goes on the wire.
        chunker::strategyFromString(options.split_strategy);

        JobManifest manifest;
        manifest.job_id = makeJobId(name_, input);
        manifest.module = NATIVE_JOB_MARKER;
        manifest.input_data = input;
        manifest.split_strategy = options.split_strategy;
        manifest.min_chunk_size = options.min_chunk_size;
        manifest.max_chunk_size = options.max_chunk_size;
        manifest.verification_mode = options.verification_mode;
        manifest.timeout_secs = options.timeout_secs;
        manifest.retry_count = options.retry_count;
        manifest.priority = options.priority;
        manifest.redundancy = options.redundancy;
        manifest.metadata = metadata_;
        return manifest;
    }

    // ---------------------------
    // JobBuilder
    // ---------------------------

    JobBuilder::JobBuilder(std::string name) : definition_(std::move(name)) {}

    JobBuilder &JobBuilder::withSplit(SplitFn fn)
    {
        definition_.setSplit(std::move(fn));
        return *this;
    }

    JobBuilder &JobBuilder::withExecute(ExecuteFn fn)
    {
        definition_.setExecute(std::move(fn));
        return *this;
    }

    JobBuilder &JobBuilder::withMerge(MergeFn fn)
    {
        definition_.setMerge(std::move(fn));
        return *this;
    }

    JobBuilder &JobBuilder::withMetadata(const std::string &key, const json &value)
    {
        definition_.addMetadata(key, value);
        return *this;
    }

    JobDefinition JobBuilder::build()
    {
        definition_.validate();
        return definition_;
    }

    JobDefinition createMapReduceJob(const std::string &name, ExecuteFn mapper, MergeFn reducer, std::size_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be greater than zero");
        }
        return JobBuilder(name)
            .withSplit([chunk_size](const std::string &data)
                       { return defaultSplit(data, chunk_size); })
            .withExecute(std::move(mapper))
            .withMerge(std::move(reducer))
            .build();
    }

    JobDefinition createParallelProcessJob(const std::string &name, ExecuteFn processor, std::size_t chunk_size)
    {
        return createMapReduceJob(name, std::move(processor), defaultMerge, chunk_size);
    }
}
