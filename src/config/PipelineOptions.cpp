#include "PipelineOptions.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <string_view>

#include "../common/Errors.hpp"
#include "../util/RandomToken.hpp"

namespace BulkBridge
{

    namespace
    {
        std::string env_string(const char *name, const std::string &defv)
        {
            const char *val = std::getenv(name);
            if (!val || !*val)
                return defv;
            return val;
        }

        size_t env_size(const char *name, size_t defv)
        {
            const char *val = std::getenv(name);
            if (!val || !*val)
                return defv;

            std::string_view text(val);
            size_t parsed = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (ec != std::errc() || ptr != text.data() + text.size())
                throw ConfigurationError(std::string(name) + " must be a non-negative integer, got '" + val + "'");
            return parsed == 0 ? defv : parsed;
        }
    } // namespace

    PipelineOptions PipelineOptions::from_env()
    {
        PipelineOptions o;
        o.project = env_string("BULKBRIDGE_PROJECT", o.project);
        o.temp_location = env_string("BULKBRIDGE_TEMP_LOCATION", o.temp_location);
        o.job_name = env_string("BULKBRIDGE_JOB_NAME", o.job_name);
        o.pg_connection = env_string("BULKBRIDGE_PG_CONN", o.pg_connection);
        o.num_workers = env_size("BULKBRIDGE_NUM_WORKERS", o.num_workers);
        o.poll_interval = std::chrono::milliseconds(
            env_size("BULKBRIDGE_POLL_INTERVAL_MS", static_cast<size_t>(o.poll_interval.count())));
        return o;
    }

    RunIdentity make_run_identity(const std::string &job_name)
    {
        std::string name = job_name;
        name.erase(std::remove(name.begin(), name.end(), '-'), name.end());

        RunIdentity id;
        id.step_uuid = random_token();
        id.job_uuid = id.step_uuid + "_" + name;
        id.job_id_token = "bulkbridge_job_" + id.job_uuid;
        return id;
    }

} // namespace BulkBridge
