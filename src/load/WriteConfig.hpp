#pragma once

#include <functional>
#include <optional>
#include <string>
#include "../model/BoundedWindow.hpp"
#include "../model/Dispositions.hpp"
#include "../model/TableReference.hpp"
#include "../model/TableSchema.hpp"
#include "../validator/RowValidator.hpp"

namespace BulkBridge
{

    class TableClient;
    struct PipelineOptions;

    // Destination of a row, chosen per window
    using TableFunction = std::function<TableReference(const BoundedWindow &)>;

    // Adapts a function producing "[project:]dataset.table" strings
    [[nodiscard]]
    TableFunction table_spec_function(std::function<std::string(const BoundedWindow &)> spec_fn);

    // =========================================================================
    // WriteConfig — everything a write (bulk load or streaming) is told
    // =========================================================================
    // Exactly one of `table` / `table_function` is set. Bulk loads need the
    // static `table`; a table function always means streaming inserts.
    // =========================================================================
    struct WriteConfig
    {
        std::optional<TableReference> table;
        TableFunction table_function;

        std::optional<TableSchema> schema;
        CreateDisposition create_disposition = CreateDisposition::CreateIfNeeded;
        WriteDisposition write_disposition = WriteDisposition::WriteEmpty;
        std::optional<std::string> table_description;

        bool validate = true; // remote presence / emptiness checks before writing
        InvalidRowPolicy invalid_rows = InvalidRowPolicy::Reject;
    };

    // -------------------------------------------------------------------------
    // Static checks (ConfigurationError). No remote calls.
    // -------------------------------------------------------------------------

    // Destination set exactly once; CREATE_IF_NEEDED has a schema
    void validate_write_config(const WriteConfig &config);

    // validate_write_config + static table + temp location
    void validate_bulk_load_config(const WriteConfig &config, const PipelineOptions &options);

    // validate_write_config + the dispositions streaming inserts support
    void validate_streaming_config(const WriteConfig &config);

    // -------------------------------------------------------------------------
    // Remote checks (ValidationError). Skipped when config.validate is false.
    // -------------------------------------------------------------------------
    //   dataset must exist
    //   CREATE_NEVER  -> table must exist
    //   WRITE_EMPTY   -> table must be missing or empty
    void validate_destination(TableClient &tables, const WriteConfig &config, const TableReference &destination);

    // Presence checks shared with the read path
    void verify_dataset_presence(TableClient &tables, const TableReference &table);
    void verify_table_presence(TableClient &tables, const TableReference &table);

} // namespace BulkBridge
