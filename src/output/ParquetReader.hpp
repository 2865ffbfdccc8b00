#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../model/TableRow.hpp"
#include "../model/TableSchema.hpp"

namespace arrow
{
    class Table;
    namespace io
    {
        class RandomAccessFile;
    }
}

namespace parquet
{
    namespace arrow
    {
        class FileReader;
    }
}

namespace BulkBridge
{

    class StagingFileSystem;

    /**
     * @brief Row-group granular reader for one Parquet snapshot file.
     * Rows are converted to TableRows with the table schema (the schema
     * fetched from the warehouse, not the file's embedded one); a column the
     * schema names but the file lacks is a ValidationError.
     */
    class ParquetReader
    {
    public:
        ParquetReader(const StagingFileSystem &fs, const std::string &location);
        ~ParquetReader();

        ParquetReader(const ParquetReader &) = delete;
        ParquetReader &operator=(const ParquetReader &) = delete;

        int num_row_groups() const;
        int64_t num_rows() const;
        int64_t row_group_num_rows(int index) const;

        // Uncompressed size of a row group as recorded in the file footer
        int64_t row_group_byte_size(int index) const;

        [[nodiscard]]
        std::vector<TableRow> read_row_group(int index, const TableSchema &schema);

        void close();

        [[nodiscard]]
        static std::vector<TableRow> to_rows(const arrow::Table &table, const TableSchema &schema);

    private:
        std::string location_;
        std::shared_ptr<arrow::io::RandomAccessFile> input_;
        std::unique_ptr<parquet::arrow::FileReader> reader_;
    };

} // namespace BulkBridge
