#pragma once

#include <optional>
#include <string>
#include "../model/Job.hpp"

namespace BulkBridge
{

    class CancellationToken;

    // =========================================================================
    // JobClient — the warehouse's asynchronous job service
    // =========================================================================
    //
    // submit_*  : start a job under the given id. Ids are unique per project;
    //             submitting an id twice is an error (WarehouseError).
    // poll_job  : block until the job is DONE. Transient failures are retried
    //             up to max_retries times; nullopt when the job cannot be found.
    //             Throws JobCancelledError when `cancel` fires while waiting.
    // get_job   : single lookup, no waiting; nullopt when the job is gone.
    // dry_run   : validates a query and reports its estimated statistics
    //             without running it.
    // =========================================================================
    class JobClient
    {
    public:
        virtual ~JobClient() = default;

        virtual void submit_load(const JobReference &ref, const LoadJobConfig &config) = 0;
        virtual void submit_copy(const JobReference &ref, const CopyJobConfig &config) = 0;
        virtual void submit_extract(const JobReference &ref, const ExtractJobConfig &config) = 0;
        virtual void submit_query(const JobReference &ref, const QueryJobConfig &config) = 0;

        [[nodiscard]]
        virtual std::optional<Job> poll_job(const JobReference &ref,
                                            int max_retries,
                                            const CancellationToken *cancel) = 0;

        [[nodiscard]]
        virtual std::optional<Job> get_job(const JobReference &ref) = 0;

        [[nodiscard]]
        virtual JobStatistics dry_run_query(const std::string &project_id,
                                            const QueryJobConfig &config) = 0;
    };

} // namespace BulkBridge
