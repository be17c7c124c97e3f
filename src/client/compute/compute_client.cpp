#include "compute_client.hpp"
#include "../Chunker/Chunker.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace compute
{
    job::ManifestOptions manifestDefaults(const ConfigReader::ClientConfig &config)
    {
        job::ManifestOptions options;
        options.min_chunk_size = config.chunk.min_chunk_size;
        options.max_chunk_size = config.chunk.max_chunk_size;
        return options;
    }

    ComputeClient::ComputeClient(const ConfigReader::ClientConfig &config)
        : node_(std::make_shared<rpc::NodeClient>(config)),
          default_options_(manifestDefaults(config))
    {
    }

    ComputeClient::ComputeClient(std::shared_ptr<rpc::NodeClient> node)
        : node_(std::move(node))
    {
        if (!node_)
        {
            throw std::invalid_argument("ComputeClient needs a node client");
        }
    }

    bool ComputeClient::connect()
    {
        return node_->connect();
    }

    void ComputeClient::disconnect()
    {
        node_->disconnect();
    }

    bool ComputeClient::isConnected() const
    {
        return node_->isConnected();
    }

    std::string ComputeClient::submit(const job::JobDefinition &definition, const std::string &input)
    {
        return submit(definition, input, default_options_);
    }

    std::string ComputeClient::submit(const job::JobDefinition &definition,
                                      const std::string &input,
                                      const job::ManifestOptions &options)
    {
        auto validated = std::make_shared<job::JobDefinition>(definition);
        validated->validate();

        JobRecord record;
        record.manifest = validated->toManifest(input, options);
        record.input = input;
        record.definition = validated;
        record.status = job::TaskStatus::PENDING;
        record.started = std::chrono::steady_clock::now();

        const std::string job_id = record.manifest.job_id;
        if (jobs_.count(job_id))
        {
            MyLogger::debug("Resubmitting job " + job_id + ", replacing its previous record");
        }
        MyLogger::info("Submitting job " + job_id + " (" + validated->name() + ", " +
                       std::to_string(input.size()) + " bytes)");

        JobRecord &stored = jobs_[job_id] = std::move(record);

        auto submitted = node_->submit_compute_job(stored.manifest);
        if (submitted.first)
        {
            if (submitted.second != job_id)
            {
                MyLogger::warning("Node acknowledged job " + job_id + " as " + submitted.second);
            }
            stored.remote = true;
            stored.status = job::TaskStatus::ASSIGNED;
            MyLogger::info("Job " + job_id + " assigned by the node");
            return job_id;
        }

        MyLogger::warning("Remote submission of job " + job_id + " failed (" + submitted.second +
                          "), falling back to local execution");
        runLocally(stored);
        return job_id;
    }

    void ComputeClient::runLocally(JobRecord &record)
    {
        const std::string &job_id = record.manifest.job_id;
        record.status = job::TaskStatus::COMPUTING;
        record.worker = LOCAL_WORKER;

        try
        {
            std::vector<std::string> chunks = record.definition->split(record.input);
            MyLogger::debug("Job " + job_id + " split into " + std::to_string(chunks.size()) + " chunks");

            std::vector<std::string> results;
            results.reserve(chunks.size());
            for (const auto &chunk : chunks)
            {
                results.push_back(record.definition->execute(chunk));
            }
            std::string merged = record.definition->merge(results);

            if (record.manifest.verification_mode == "hash")
            {
                record.status = job::TaskStatus::VERIFYING;
                record.integrity_ok = chunker::Chunker::verifyIntegrity(chunks, chunker::Chunker::hashData(record.input));
                if (!*record.integrity_ok)
                {
                    MyLogger::warning("Job " + job_id + ": chunks do not reassemble into the input");
                }
            }

            record.result = std::move(merged);
            record.status = job::TaskStatus::COMPLETED;
            MyLogger::info("Job " + job_id + " completed locally (" + std::to_string(record.result.size()) + " bytes)");
        }
        catch (const std::exception &e)
        {
            record.status = job::TaskStatus::FAILED;
            record.error = e.what();
            MyLogger::error("Job " + job_id + " failed locally: " + record.error);
        }
    }

    void ComputeClient::expireIfOverdue(JobRecord &record)
    {
        if (job::isTerminal(record.status) || record.manifest.timeout_secs == 0)
            return;
        auto elapsed = std::chrono::steady_clock::now() - record.started;
        if (elapsed > std::chrono::seconds(record.manifest.timeout_secs))
        {
            record.status = job::TaskStatus::TIMEOUT;
            record.error = "Job exceeded its timeout of " + std::to_string(record.manifest.timeout_secs) + " s";
            MyLogger::warning("Job " + record.manifest.job_id + ": " + record.error);
        }
    }

    JobRecord &ComputeClient::findRecord(const std::string &job_id)
    {
        auto it = jobs_.find(job_id);
        if (it == jobs_.end())
        {
            throw UnknownJobError("Unknown job " + job_id);
        }
        return it->second;
    }

    const JobRecord &ComputeClient::record(const std::string &job_id) const
    {
        auto it = jobs_.find(job_id);
        if (it == jobs_.end())
        {
            throw UnknownJobError("Unknown job " + job_id);
        }
        return it->second;
    }

    namespace
    {
        // FAILED, TIMEOUT and CANCELLED records never change again, whatever
        // the node reports afterwards.
        bool endedWithoutResult(const JobRecord &record)
        {
            return record.status == job::TaskStatus::FAILED || record.status == job::TaskStatus::TIMEOUT ||
                   record.status == job::TaskStatus::CANCELLED;
        }
    }

    rpc::JobStatus ComputeClient::get_status(const std::string &job_id)
    {
        auto it = jobs_.find(job_id);
        bool known_locally = it != jobs_.end();
        if (known_locally)
            expireIfOverdue(it->second);

        // Jobs that ran in-process are unknown to the node, and settled
        // records are answered from the record.
        bool settled = known_locally && (endedWithoutResult(it->second) || !it->second.worker.empty());
        if (!settled && (!known_locally || it->second.remote))
        {
            std::optional<rpc::JobStatus> remote = node_->get_compute_job_status(job_id);
            if (remote)
            {
                if (known_locally)
                {
                    it->second.status = remote->status;
                    if (!remote->error_msg.empty())
                        it->second.error = remote->error_msg;
                }
                return *remote;
            }
        }

        if (!known_locally)
        {
            throw UnknownJobError("Unknown job " + job_id);
        }

        JobRecord &record = it->second;

        bool completed = record.status == job::TaskStatus::COMPLETED;
        rpc::JobStatus status;
        status.job_id = job_id;
        status.status = record.status;
        status.progress = completed ? 1.0f : 0.5f;
        status.completed_chunks = completed ? 1 : 0;
        status.total_chunks = 1;
        status.estimated_time_remaining = completed ? 0 : 10;
        status.error_msg = record.error;
        return status;
    }

    JobResult ComputeClient::get_result(const std::string &job_id, std::chrono::milliseconds timeout)
    {
        JobRecord &record = findRecord(job_id);
        auto deadline = std::chrono::steady_clock::now() + timeout;

        // worker stays empty until the node handed over a result.
        bool fetched = !record.worker.empty();
        expireIfOverdue(record);
        if (record.remote && !fetched && !endedWithoutResult(record))
        {
            auto timeout_ms = static_cast<std::uint32_t>(std::max<std::int64_t>(timeout.count(), 0));
            rpc::ResultReply reply = node_->get_compute_job_result(job_id, timeout_ms);
            const std::optional<std::string> &data = std::get<0>(reply);
            if (data)
            {
                record.result = *data;
                const std::string &worker = std::get<2>(reply);
                record.worker = worker.empty() ? "remote" : worker;
                record.status = job::TaskStatus::COMPLETED;
                return JobResult{record.result, record.worker};
            }
            MyLogger::warning("Could not fetch result of job " + job_id + " from the node (" +
                              std::get<1>(reply) + "), polling local record");
        }

        while (true)
        {
            expireIfOverdue(record);
            switch (record.status)
            {
            case job::TaskStatus::COMPLETED:
                if (!record.worker.empty())
                    return JobResult{record.result, record.worker};
                break;
            case job::TaskStatus::FAILED:
            case job::TaskStatus::CANCELLED:
            case job::TaskStatus::TIMEOUT:
                throw JobFailedError(record.error.empty()
                                         ? "Job " + job_id + " ended as " + job::statusToString(record.status)
                                         : record.error);
            default:
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                throw JobTimeoutError("Job " + job_id + " did not finish within " +
                                      std::to_string(timeout.count()) + " ms");
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(RESULT_POLL_INTERVAL, remaining));
        }
    }

    bool ComputeClient::cancel(const std::string &job_id)
    {
        auto it = jobs_.find(job_id);
        if (it == jobs_.end())
        {
            MyLogger::warning("Cannot cancel unknown job " + job_id);
            return false;
        }
        JobRecord &record = it->second;

        if (record.remote && node_->cancel_compute_job(job_id))
        {
            MyLogger::info("Job " + job_id + " cancelled on the node");
        }
        else
        {
            MyLogger::info("Job " + job_id + " cancelled locally");
        }
        record.status = job::TaskStatus::CANCELLED;
        record.error = "Job " + job_id + " was cancelled";
        return true;
    }

    rpc::ComputeCapacity ComputeClient::get_capacity()
    {
        std::optional<rpc::ComputeCapacity> remote = node_->get_compute_capacity();
        if (remote)
            return *remote;
        MyLogger::debug("Node capacity unavailable, reporting this host's");
        return localCapacity();
    }

    std::vector<std::string> ComputeClient::list_jobs() const
    {
        std::vector<std::string> ids;
        ids.reserve(jobs_.size());
        for (const auto &entry : jobs_)
            ids.push_back(entry.first);
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    bool ComputeClient::cleanup_job(const std::string &job_id)
    {
        if (jobs_.erase(job_id) == 0)
            return false;
        MyLogger::debug("Cleaned up job " + job_id);
        return true;
    }

    rpc::ComputeCapacity localCapacity()
    {
        rpc::ComputeCapacity capacity;
        capacity.cpu_cores = std::max(1u, std::thread::hardware_concurrency());

        long pages = sysconf(_SC_PHYS_PAGES);
        long page_size = sysconf(_SC_PAGE_SIZE);
        if (pages > 0 && page_size > 0)
        {
            capacity.ram_mb = static_cast<std::uint64_t>(pages) * static_cast<std::uint64_t>(page_size) / (1024 * 1024);
        }

        std::error_code ec;
        std::filesystem::space_info space = std::filesystem::space(std::filesystem::current_path(ec), ec);
        if (!ec)
        {
            capacity.disk_mb = space.available / (1024 * 1024);
        }

        double load[1];
        if (getloadavg(load, 1) == 1)
        {
            capacity.current_load = static_cast<float>(load[0] / capacity.cpu_cores);
        }
        return capacity;
    }

    JobResult submit_job(const job::JobDefinition &definition,
                         const std::string &input,
                         const ConfigReader::ClientConfig &config,
                         std::chrono::milliseconds timeout)
    {
        return submit_job(definition, input, config, timeout, manifestDefaults(config));
    }

    JobResult submit_job(const job::JobDefinition &definition,
                         const std::string &input,
                         const ConfigReader::ClientConfig &config,
                         std::chrono::milliseconds timeout,
                         const job::ManifestOptions &options)
    {
        ComputeClient client(config);
        if (!client.connect())
        {
            throw bridge::NotConnectedError("Unable to connect to compute service at " + config.host + ":" +
                                            std::to_string(config.port));
        }

        try
        {
            std::string job_id = client.submit(definition, input, options);
            JobResult result = client.get_result(job_id, timeout);
            client.disconnect();
            return result;
        }
        catch (...)
        {
            client.disconnect();
            throw;
        }
    }
}
