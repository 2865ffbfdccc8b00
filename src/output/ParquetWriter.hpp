#pragma once

// ============================================================================
// ParquetWriter — TableRows -> Arrow columnar table -> Parquet file
// ============================================================================
//
// Snapshot files produced by extract jobs are Parquet. Column types follow
// the table schema:
//
//   STRING    -> utf8
//   INTEGER   -> int64
//   FLOAT     -> float64
//   BOOLEAN   -> boolean
//   TIMESTAMP -> timestamp[us, tz=UTC]
//
// REQUIRED columns are written as non-nullable Arrow fields. The table
// schema's column order is the file's column order.
// ============================================================================

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../model/TableRow.hpp"
#include "../model/TableSchema.hpp"

namespace arrow
{
    class Schema;
    class Table;
}

namespace BulkBridge
{

    class StagingFileSystem;

    class ParquetWriter
    {
    public:
        static constexpr int64_t DEFAULT_ROW_GROUP_LENGTH = 64 * 1024;

        [[nodiscard]]
        static std::shared_ptr<arrow::Schema> to_arrow_schema(const TableSchema &schema);

        // Throws ValidationError when a value does not fit its column type
        [[nodiscard]]
        static std::shared_ptr<arrow::Table> to_arrow_table(const std::vector<TableRow> &rows,
                                                            const TableSchema &schema);

        /**
         * @brief Writes rows as one Parquet file (Snappy compressed).
         * @param row_group_length rows per row group; readers split on row groups
         * @return bytes written
         */
        static int64_t write(const std::vector<TableRow> &rows,
                             const TableSchema &schema,
                             const StagingFileSystem &fs,
                             const std::string &location,
                             int64_t row_group_length = DEFAULT_ROW_GROUP_LENGTH);
    };

} // namespace BulkBridge
