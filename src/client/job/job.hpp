#ifndef JOB_HPP
#define JOB_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../Chunker/Chunker.hpp"

using json = nlohmann::json;

namespace job
{
    using SplitFn = std::function<std::vector<std::string>(const std::string &)>;
    using ExecuteFn = std::function<std::string(const std::string &)>;
    using MergeFn = std::function<std::string(const std::vector<std::string> &)>;

    // Shared by the remote and local execution paths. Numeric values are the
    // orchestrator's; string forms are the lower-case names.
    enum class TaskStatus : std::uint8_t
    {
        PENDING = 0,
        ASSIGNED = 1,
        COMPUTING = 2,
        VERIFYING = 3,
        COMPLETED = 4,
        FAILED = 5,
        TIMEOUT = 6,
        CANCELLED = 7
    };

    std::string statusToString(TaskStatus status);
    // Unknown names map to FAILED, which is what the orchestrator reports
    // when it cannot describe a job.
    TaskStatus statusFromString(const std::string &name);
    bool isTerminal(TaskStatus status);

    // Marker sent in place of a compiled module; tells the orchestrator to
    // use its built-in split/execute/merge.
    constexpr const char *NATIVE_JOB_MARKER = "PANGEA_NATIVE_JOB_V1";
    // Bytes of input that take part in the job id.
    constexpr std::size_t JOB_ID_PREFIX_BYTES = 1024;

    std::vector<std::string> defaultSplit(const std::string &data, std::size_t chunk_size = chunker::DEFAULT_CHUNK_SIZE);
    std::string defaultExecute(const std::string &chunk);
    std::string defaultMerge(const std::vector<std::string> &results);

    // "job-" + first 16 hex chars of SHA-256(name || input[0:1024]).
    // Identical (name, prefix) pairs collide on purpose so resubmission is idempotent.
    std::string makeJobId(const std::string &name, const std::string &input);

    struct ManifestOptions
    {
        std::string split_strategy = "fixed_size";
        std::uint64_t min_chunk_size = 65536;
        std::uint64_t max_chunk_size = 1048576;
        std::string verification_mode = "hash";
        std::uint32_t timeout_secs = 300;
        std::uint32_t retry_count = 3;
        std::uint32_t priority = 5;
        std::uint32_t redundancy = 1;
    };

    struct JobManifest
    {
        std::string job_id;
        std::string module;
        std::string input_data;
        std::string split_strategy;
        std::uint64_t min_chunk_size = 0;
        std::uint64_t max_chunk_size = 0;
        std::string verification_mode;
        std::uint32_t timeout_secs = 0;
        std::uint32_t retry_count = 0;
        std::uint32_t priority = 0;
        std::uint32_t redundancy = 0;
        json metadata = json::object();

        // Binary fields are base64 encoded.
        json toJson() const;
        // Throws std::invalid_argument when a required field is missing.
        static JobManifest fromJson(const json &j);
    };

    class JobDefinition
    {
    public:
        explicit JobDefinition(std::string name);

        const std::string &name() const { return name_; }
        const json &metadata() const { return metadata_; }
        bool isValidated() const { return validated_; }

        // Setters are only legal before validate().
        void setSplit(SplitFn fn);
        void setExecute(ExecuteFn fn);
        void setMerge(MergeFn fn);
        void addMetadata(const std::string &key, const json &value);

        // Fills missing functions with the defaults; idempotent.
        bool validate();

        std::vector<std::string> split(const std::string &data) const;
        std::string execute(const std::string &chunk) const;
        std::string merge(const std::vector<std::string> &results) const;

        // split -> execute each chunk in order -> merge, on the calling thread.
        std::string run(const std::string &input) const;

        JobManifest toManifest(const std::string &input, const ManifestOptions &options = ManifestOptions()) const;

    private:
        void requireMutable(const char *what) const;

        std::string name_;
        SplitFn split_fn_;
        ExecuteFn execute_fn_;
        MergeFn merge_fn_;
        json metadata_ = json::object();
        bool validated_ = false;
    };

    class JobBuilder
    {
    public:
        explicit JobBuilder(std::string name);

        JobBuilder &withSplit(SplitFn fn);
        JobBuilder &withExecute(ExecuteFn fn);
        JobBuilder &withMerge(MergeFn fn);
        JobBuilder &withMetadata(const std::string &key, const json &value);

        JobDefinition build();

    private:
        JobDefinition definition_;
    };

    // Fixed-size split, mapper per chunk, reducer over the mapped chunks.
    JobDefinition createMapReduceJob(const std::string &name, ExecuteFn mapper, MergeFn reducer,
                                     std::size_t chunk_size = chunker::DEFAULT_CHUNK_SIZE);
    // Same as above with concatenation as the reducer.
    JobDefinition createParallelProcessJob(const std::string &name, ExecuteFn processor,
                                           std::size_t chunk_size = chunker::DEFAULT_CHUNK_SIZE);
}

#endif // JOB_HPP
