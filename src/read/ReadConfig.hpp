#pragma once

#include <optional>
#include <string>
#include "../model/TableReference.hpp"

namespace BulkBridge
{

    class JobClient;
    class TableClient;
    struct PipelineOptions;

    // Exactly one of `table` / `query`. The dialect and flattening flags only
    // apply to queries; unset they default to legacy SQL with flattening.
    struct ReadConfig
    {
        std::optional<TableReference> table;
        std::optional<std::string> query;
        std::optional<bool> flatten_results;
        std::optional<bool> use_legacy_sql;
        bool validate = true;

        bool effective_flatten_results() const { return flatten_results.value_or(true); }
        bool effective_use_legacy_sql() const { return use_legacy_sql.value_or(true); }
    };

    // Static checks; ConfigurationError
    void validate_read_config(const ReadConfig &config, const PipelineOptions &options);

    // Remote checks, skipped when config.validate is false:
    //   table -> dataset and table exist (ValidationError)
    //   query -> dry run succeeds (ConfigurationError naming the query)
    void validate_read_source(const ReadConfig &config,
                              JobClient &jobs,
                              TableClient &tables,
                              const PipelineOptions &options);

} // namespace BulkBridge
