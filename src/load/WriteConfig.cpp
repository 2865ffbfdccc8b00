#include "WriteConfig.hpp"

#include "../common/Errors.hpp"
#include "../config/PipelineOptions.hpp"
#include "../services/TableClient.hpp"

namespace BulkBridge
{

    namespace
    {
        std::string resource_not_found(const std::string &resource, const TableReference &table)
        {
            return "Warehouse " + resource + " not found for table \"" + to_table_spec(table) +
                   "\". Please create the " + resource + " before pipeline execution. If the " +
                   resource + " is created by an earlier stage of the pipeline, this validation" +
                   " can be disabled by setting validate = false.";
        }

        std::string unable_to_confirm(const std::string &resource, const TableReference &table)
        {
            return "Unable to confirm warehouse " + resource + " presence for table \"" +
                   to_table_spec(table) + "\". If the " + resource +
                   " is created by an earlier stage of the pipeline, this validation" +
                   " can be disabled by setting validate = false.";
        }
    } // namespace

    TableFunction table_spec_function(std::function<std::string(const BoundedWindow &)> spec_fn)
    {
        return [spec_fn = std::move(spec_fn)](const BoundedWindow &window)
        {
            return parse_table_spec(spec_fn(window));
        };
    }

    void validate_write_config(const WriteConfig &config)
    {
        if (!config.table && !config.table_function)
            throw ConfigurationError("must set the destination table of a write");

        if (config.table && config.table_function)
            throw ConfigurationError("Cannot set both a table reference and a table function for a write");

        if (config.create_disposition == CreateDisposition::CreateIfNeeded && !config.schema)
            throw ConfigurationError("CreateDisposition is CREATE_IF_NEEDED, however no schema was provided.");

        if (config.schema)
        {
            auto result = RowValidator::validate_schema(*config.schema);
            if (!result.valid)
                throw ConfigurationError("Invalid schema: " + result.reason);
        }
    }

    void validate_bulk_load_config(const WriteConfig &config, const PipelineOptions &options)
    {
        validate_write_config(config);

        if (!config.table)
            throw ConfigurationError("Bulk loads need a static destination table; use streaming inserts with a table function");

        if (options.temp_location.empty())
            throw ConfigurationError("Bulk loads need a temp location to store staged files.");
    }

    void validate_streaming_config(const WriteConfig &config)
    {
        validate_write_config(config);

        if (config.table_function && config.create_disposition == CreateDisposition::CreateNever)
            throw ConfigurationError("CreateDisposition.CREATE_NEVER is not supported when using a table function.");

        if (!config.schema && config.create_disposition != CreateDisposition::CreateNever)
            throw ConfigurationError("CreateDisposition.CREATE_NEVER must be used if no schema is provided.");

        if (config.write_disposition == WriteDisposition::WriteTruncate)
            throw ConfigurationError("WriteDisposition.WRITE_TRUNCATE is not supported for streaming inserts.");
    }

    void verify_dataset_presence(TableClient &tables, const TableReference &table)
    {
        std::optional<Dataset> dataset;
        try
        {
            dataset = tables.get_dataset(table.project_id, table.dataset_id);
        }
        catch (const WarehouseError &e)
        {
            throw ValidationError(unable_to_confirm("dataset", table) + " Cause: " + e.what());
        }
        if (!dataset)
            throw ValidationError(resource_not_found("dataset", table));
    }

    void verify_table_presence(TableClient &tables, const TableReference &table)
    {
        std::optional<Table> found;
        try
        {
            found = tables.get_table(table);
        }
        catch (const WarehouseError &e)
        {
            throw ValidationError(unable_to_confirm("table", table) + " Cause: " + e.what());
        }
        if (!found)
            throw ValidationError(resource_not_found("table", table));
    }

    void validate_destination(TableClient &tables, const WriteConfig &config, const TableReference &destination)
    {
        if (!config.validate)
            return;

        verify_dataset_presence(tables, destination);

        if (config.create_disposition == CreateDisposition::CreateNever)
            verify_table_presence(tables, destination);

        if (config.write_disposition == WriteDisposition::WriteEmpty)
        {
            try
            {
                if (tables.get_table(destination) && !tables.is_table_empty(destination))
                    throw ValidationError("Warehouse table is not empty: " + to_table_spec(destination) + ".");
            }
            catch (const WarehouseError &e)
            {
                throw ValidationError("unable to confirm warehouse table emptiness for table " +
                                      to_table_spec(destination) + ": " + e.what());
            }
        }
    }

} // namespace BulkBridge
