#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../model/Dispositions.hpp"
#include "../model/TableSchema.hpp"
#include "StreamingTypes.hpp"

namespace BulkBridge
{

    class TableClient;

    // =========================================================================
    // StreamingInsertWriter — per-batch buffering and insertAll calls
    // =========================================================================
    //
    //   start_batch()       clears the buffers
    //   process(group)      buffers records under their table spec
    //   finish_batch()      for each table: ensure it exists, one insert_all
    //
    // The byte counter is shared by every writer of a StreamingWriter and
    // only ever grows.
    // =========================================================================
    class StreamingInsertWriter
    {
    public:
        StreamingInsertWriter(TableClient &tables,
                              std::optional<TableSchema> schema,
                              CreateDisposition create_disposition,
                              std::optional<std::string> table_description,
                              std::atomic<int64_t> &inserted_bytes);

        void start_batch();
        void process(const std::string &table_spec, const std::vector<RowDedupRecord> &records);

        // Returns rows sent in this batch
        size_t finish_batch();

        size_t buffered_rows() const;

    private:
        TableClient &tables_;
        std::optional<TableSchema> schema_;
        CreateDisposition create_disposition_;
        std::optional<std::string> table_description_;
        std::atomic<int64_t> &inserted_bytes_;

        std::map<std::string, std::vector<RowDedupRecord>> buffers_;
    };

} // namespace BulkBridge
