#include "ReadConfig.hpp"

#include "../common/Errors.hpp"
#include "../config/PipelineOptions.hpp"
#include "../load/WriteConfig.hpp"
#include "../services/JobClient.hpp"
#include "../services/TableClient.hpp"

namespace BulkBridge
{

    void validate_read_config(const ReadConfig &config, const PipelineOptions &options)
    {
        if (config.table && config.query)
            throw ConfigurationError("Invalid read: table reference and query may not both be set");

        if (!config.table && !config.query)
            throw ConfigurationError("Invalid read: one of table reference and query must be set");

        if (config.table)
        {
            if (config.flatten_results)
            {
                throw ConfigurationError(
                    "Invalid read: Specifies a table with a result flattening preference, which only applies to queries");
            }
            if (config.use_legacy_sql)
            {
                throw ConfigurationError(
                    "Invalid read: Specifies a table with a SQL dialect preference, which only applies to queries");
            }
        }
        else if (config.query->empty())
        {
            throw ConfigurationError("Invalid read: query is empty");
        }

        if (options.temp_location.empty())
            throw ConfigurationError("Reads need a temp location to store extracted files.");
    }

    void validate_read_source(const ReadConfig &config,
                              JobClient &jobs,
                              TableClient &tables,
                              const PipelineOptions &options)
    {
        if (!config.validate)
            return;

        if (config.table)
        {
            const TableReference table = config.table->with_default_project(options.project);
            verify_dataset_presence(tables, table);
            verify_table_presence(tables, table);
            return;
        }

        QueryJobConfig dry;
        dry.query = *config.query;
        dry.flatten_results = config.effective_flatten_results();
        dry.use_legacy_sql = config.effective_use_legacy_sql();
        try
        {
            (void)jobs.dry_run_query(options.project, dry);
        }
        catch (const std::exception &e)
        {
            throw ConfigurationError(
                "Validation of query \"" + *config.query + "\" failed. If the query depends on an earlier"
                " stage of the pipeline, this validation can be disabled by setting validate = false. Cause: " +
                e.what());
        }
    }

} // namespace BulkBridge
