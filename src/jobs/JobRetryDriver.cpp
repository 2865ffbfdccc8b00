#include "JobRetryDriver.hpp"
#include <iostream>
#include "../common/Errors.hpp"

namespace BulkBridge
{

    std::string job_to_pretty_string(const std::optional<Job> &job)
    {
        return job ? job->to_pretty_string() : std::string("null");
    }

    JobRetryDriver::JobRetryDriver(JobClient &jobs,
                                   std::string project_id,
                                   JobRetryPolicy policy,
                                   const CancellationToken *cancel)
        : jobs_(jobs), project_id_(std::move(project_id)), policy_(policy), cancel_(cancel)
    {
    }

    JobRun JobRetryDriver::run_job(std::string_view kind,
                                   const std::string &id_prefix,
                                   const SubmitFn &submit,
                                   const SuccessFn &on_success) const
    {
        std::vector<JobAttempt> attempts;
        std::optional<Job> last_failed;

        for (int i = 0; i < policy_.max_retry_jobs; ++i)
        {
            const JobReference ref{project_id_, id_prefix + "-" + std::to_string(i)};

            std::cout << "[JOB] Starting " << kind << " job " << ref.job_id << "\n";
            submit(ref);

            std::optional<Job> job;
            try
            {
                job = jobs_.poll_job(ref, policy_.poll_max_retries, cancel_);
            }
            catch (const JobCancelledError &e)
            {
                std::cerr << "[JOB ERROR] Polling " << kind << " job " << ref.job_id
                          << " interrupted: " << e.what() << "\n";
                throw;
            }

            const JobStatus status = parse_status(job);
            attempts.push_back({ref, status, job});

            switch (status)
            {
            case JobStatus::Succeeded:
                std::cout << "[JOB] " << kind << " job " << ref.job_id << " succeeded"
                          << " (attempt " << (i + 1) << "/" << policy_.max_retry_jobs << ")\n";
                if (on_success)
                    on_success(*job);
                return JobRun{*job, std::move(attempts)};

            case JobStatus::Unknown:
                throw JobStatusUnknownError(
                    "UNKNOWN status of " + std::string(kind) + " job [" + ref.job_id + "]: " +
                    job_to_pretty_string(job) + ".");

            case JobStatus::Failed:
                std::cerr << "[JOB ERROR] " << kind << " job " << ref.job_id << " failed: "
                          << (job->error_result ? job->error_result->message : std::string("see errors"))
                          << "\n";
                last_failed = std::move(job);
                continue;
            }
        }

        const std::string last = job_to_pretty_string(last_failed);
        throw JobFailedError(
            "Failed to create " + std::string(kind) + " job with id prefix " + id_prefix +
                ", reached max retries: " + std::to_string(policy_.max_retry_jobs) +
                ", last failed " + std::string(kind) + " job: " + last + ".",
            last);
    }

} // namespace BulkBridge
