#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace BulkBridge
{

    // =========================================================================
    // PipelineOptions — process-wide settings read from the environment
    // =========================================================================
    //
    //   BULKBRIDGE_PROJECT          executing project, default for unqualified tables
    //   BULKBRIDGE_TEMP_LOCATION    staging root (local path or URI)
    //   BULKBRIDGE_JOB_NAME         pipeline name, embedded in every job id
    //   BULKBRIDGE_PG_CONN          libpq connection string of the warehouse
    //   BULKBRIDGE_NUM_WORKERS      worker threads per parallel stage
    //   BULKBRIDGE_POLL_INTERVAL_MS job poll interval
    //
    // A malformed numeric value is a ConfigurationError.
    // =========================================================================
    struct PipelineOptions
    {
        std::string project = "bulkbridge-local";
        std::string temp_location;
        std::string job_name = "bulkbridge";
        std::string pg_connection = "postgresql://localhost:5432/bulkbridge";
        size_t num_workers = 4;
        std::chrono::milliseconds poll_interval{200};

        [[nodiscard]]
        static PipelineOptions from_env();
    };

    /**
     * @brief Per-transform identifiers, fixed when the transform is built.
     *   step_uuid    : random, names the staging / extract directory
     *   job_uuid     : "<step_uuid>_<job name without '-'>"
     *   job_id_token : "bulkbridge_job_<job_uuid>", prefix of every job id
     */
    struct RunIdentity
    {
        std::string step_uuid;
        std::string job_uuid;
        std::string job_id_token;
    };

    [[nodiscard]]
    RunIdentity make_run_identity(const std::string &job_name);

} // namespace BulkBridge
