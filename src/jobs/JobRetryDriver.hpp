#pragma once

#include <climits>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../model/Job.hpp"
#include "../services/JobClient.hpp"
#include "CancellationToken.hpp"

namespace BulkBridge
{

    struct JobRetryPolicy
    {
        int max_retry_jobs = 3;            // distinct job ids tried before giving up
        int poll_max_retries = INT_MAX;    // transient poll failures tolerated per attempt
    };

    // One submitted attempt. Never mutated after it is appended to JobRun.
    struct JobAttempt
    {
        JobReference reference;
        JobStatus status = JobStatus::Unknown;
        std::optional<Job> job;
    };

    struct JobRun
    {
        Job job;                          // the attempt that SUCCEEDED
        std::vector<JobAttempt> attempts; // every attempt in submission order
    };

    // =========================================================================
    // JobRetryDriver — submit / poll / classify / retry
    // =========================================================================
    //
    //   for i in [0, max_retry_jobs):
    //       ref = {project, "<prefix>-<i>"}
    //       submit(ref); job = poll(ref)
    //       SUCCEEDED -> on_success(job); return
    //       FAILED    -> remember job; next i
    //       UNKNOWN   -> JobStatusUnknownError (no retry)
    //   JobFailedError with the last failed job
    //
    // A FAILED job is never resubmitted under its old id.
    // =========================================================================
    class JobRetryDriver
    {
    public:
        using SubmitFn = std::function<void(const JobReference &)>;
        using SuccessFn = std::function<void(const Job &)>;

        JobRetryDriver(JobClient &jobs,
                       std::string project_id,
                       JobRetryPolicy policy = {},
                       const CancellationToken *cancel = nullptr);

        /**
         * @brief Runs one logical job to a SUCCEEDED attempt.
         * @param kind       "load", "copy", "extract", "query" (used in messages)
         * @param id_prefix  attempt ids are "<id_prefix>-<i>"
         * @param submit     starts the job under the given reference
         * @param on_success post-commit action, run once on the succeeded job
         */
        JobRun run_job(std::string_view kind,
                       const std::string &id_prefix,
                       const SubmitFn &submit,
                       const SuccessFn &on_success = {}) const;

        const JobRetryPolicy &policy() const { return policy_; }

    private:
        JobClient &jobs_;
        std::string project_id_;
        JobRetryPolicy policy_;
        const CancellationToken *cancel_;
    };

    // "null" for a missing job, otherwise Job::to_pretty_string()
    std::string job_to_pretty_string(const std::optional<Job> &job);

} // namespace BulkBridge
