#pragma once

#include <string>
#include "../model/TableSchema.hpp"
#include "RowSource.hpp"

namespace BulkBridge
{

    class StagingFileSystem;

    /**
     * @brief Rows of one Parquet snapshot file, or of the row-group range
     * [first_row_group, end_row_group) of it. Rows are typed with `schema`.
     * end_row_group < 0 means "to the last row group".
     */
    class ParquetFileSource : public RowSource
    {
    public:
        ParquetFileSource(const StagingFileSystem &fs,
                          std::string location,
                          TableSchema schema,
                          int first_row_group = 0,
                          int end_row_group = -1);

        int64_t estimated_size_bytes() override;

        // Groups consecutive row groups until each bundle reaches the desired size
        std::vector<std::unique_ptr<RowSource>> split(int64_t desired_bundle_size_bytes) override;

        std::unique_ptr<RowReader> create_reader() override;

        const std::string &location() const { return location_; }
        int first_row_group() const { return first_row_group_; }
        int end_row_group() const { return end_row_group_; }

    private:
        const StagingFileSystem &fs_;
        std::string location_;
        TableSchema schema_;
        int first_row_group_;
        int end_row_group_;
    };

} // namespace BulkBridge
