#ifndef COMPUTE_CLIENT_HPP
#define COMPUTE_CLIENT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "../job/job.hpp"
#include "../load_config/load_config.hpp"
#include "../rpc/node_client.hpp"
#include "../rpc/records.hpp"

namespace compute
{
    class UnknownJobError : public std::out_of_range
    {
    public:
        using std::out_of_range::out_of_range;
    };

    class JobTimeoutError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Carries the message stored on the failed, cancelled or timed out job.
    class JobFailedError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Worker label reported for jobs executed in-process.
    constexpr const char *LOCAL_WORKER = "local";
    constexpr std::chrono::milliseconds RESULT_POLL_INTERVAL{100};
    constexpr std::chrono::seconds DEFAULT_RESULT_TIMEOUT{300};

    struct JobResult
    {
        std::string data;
        std::string worker;
    };

    // Client-side bookkeeping for one submitted job.
    struct JobRecord
    {
        job::JobManifest manifest;
        std::string input;
        std::shared_ptr<const job::JobDefinition> definition;
        job::TaskStatus status = job::TaskStatus::PENDING;
        std::chrono::steady_clock::time_point started;
        std::string result;
        std::string error;
        std::string worker;
        bool remote = false;
        // Set once the local fallback checked that the split is lossless.
        std::optional<bool> integrity_ok;
    };

    /*
       Submits jobs to the node and tracks them locally. When the node
       cannot take a job it is run in-process instead, synchronously, and
       reported with the "local" worker label.

       Not thread safe: one controlling thread per client.
    */
    class ComputeClient
    {
    public:
        explicit ComputeClient(const ConfigReader::ClientConfig &config = ConfigReader::ClientConfig());
        explicit ComputeClient(std::shared_ptr<rpc::NodeClient> node);

        bool connect();
        void disconnect();
        bool isConnected() const;

        // The job id is computed before anything goes on the wire. Without
        // options the manifest takes defaultOptions().
        std::string submit(const job::JobDefinition &definition, const std::string &input);
        std::string submit(const job::JobDefinition &definition,
                           const std::string &input,
                           const job::ManifestOptions &options);

        // Throws UnknownJobError when neither the node nor this client knows the job.
        rpc::JobStatus get_status(const std::string &job_id);

        // Throws UnknownJobError, JobTimeoutError or JobFailedError.
        JobResult get_result(const std::string &job_id,
                             std::chrono::milliseconds timeout = DEFAULT_RESULT_TIMEOUT);

        // False only for an unknown job. A running local execution is not
        // interrupted; the record is marked cancelled once it returns.
        bool cancel(const std::string &job_id);

        // The node's capacity, or an estimate of this host's.
        rpc::ComputeCapacity get_capacity();

        std::vector<std::string> list_jobs() const;
        bool cleanup_job(const std::string &job_id);

        const job::ManifestOptions &defaultOptions() const { return default_options_; }
        void setDefaultOptions(const job::ManifestOptions &options) { default_options_ = options; }

        const JobRecord &record(const std::string &job_id) const;
        rpc::NodeClient &node() { return *node_; }

    private:
        void runLocally(JobRecord &record);
        // Moves a record that outlived its manifest timeout to TIMEOUT.
        void expireIfOverdue(JobRecord &record);
        JobRecord &findRecord(const std::string &job_id);

        std::shared_ptr<rpc::NodeClient> node_;
        job::ManifestOptions default_options_;
        std::unordered_map<std::string, JobRecord> jobs_;
    };

    rpc::ComputeCapacity localCapacity();

    // Manifest options with the chunk bounds taken from the client config.
    job::ManifestOptions manifestDefaults(const ConfigReader::ClientConfig &config);

    // Connect, submit, wait for the result, always disconnect. Throws
    // bridge::NotConnectedError when the node is unreachable.
    JobResult submit_job(const job::JobDefinition &definition,
                         const std::string &input,
                         const ConfigReader::ClientConfig &config = ConfigReader::ClientConfig(),
                         std::chrono::milliseconds timeout = DEFAULT_RESULT_TIMEOUT);
    JobResult submit_job(const job::JobDefinition &definition,
                         const std::string &input,
                         const ConfigReader::ClientConfig &config,
                         std::chrono::milliseconds timeout,
                         const job::ManifestOptions &options);

} // namespace compute

#endif // COMPUTE_CLIENT_HPP
