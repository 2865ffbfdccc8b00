#include "StreamingInsertWriter.hpp"

#include <iostream>
#include "../services/TableClient.hpp"
#include "CreatedTableCache.hpp"

namespace BulkBridge
{

    StreamingInsertWriter::StreamingInsertWriter(TableClient &tables,
                                                 std::optional<TableSchema> schema,
                                                 CreateDisposition create_disposition,
                                                 std::optional<std::string> table_description,
                                                 std::atomic<int64_t> &inserted_bytes)
        : tables_(tables),
          schema_(std::move(schema)),
          create_disposition_(create_disposition),
          table_description_(std::move(table_description)),
          inserted_bytes_(inserted_bytes)
    {
    }

    void StreamingInsertWriter::start_batch()
    {
        buffers_.clear();
    }

    void StreamingInsertWriter::process(const std::string &table_spec, const std::vector<RowDedupRecord> &records)
    {
        auto &buffer = buffers_[table_spec];
        buffer.insert(buffer.end(), records.begin(), records.end());
    }

    size_t StreamingInsertWriter::finish_batch()
    {
        size_t sent = 0;
        for (auto &[spec, records] : buffers_)
        {
            if (records.empty())
                continue;

            const TableReference table = parse_table_spec(spec);
            CreatedTableCache::instance().ensure_table(tables_, table, schema_, table_description_, create_disposition_);

            std::vector<TableRow> rows;
            std::vector<std::string> ids;
            rows.reserve(records.size());
            ids.reserve(records.size());
            for (auto &record : records)
            {
                rows.push_back(std::move(record.row));
                ids.push_back(std::move(record.unique_id));
            }

            try
            {
                const int64_t bytes = tables_.insert_all(table, rows, ids);
                inserted_bytes_.fetch_add(bytes, std::memory_order_relaxed);
                sent += rows.size();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[STREAMING ERROR] insert_all into " << spec << " failed: " << e.what() << "\n";
                throw;
            }
        }
        buffers_.clear();
        return sent;
    }

    size_t StreamingInsertWriter::buffered_rows() const
    {
        size_t n = 0;
        for (const auto &[spec, records] : buffers_)
            n += records.size();
        return n;
    }

} // namespace BulkBridge
