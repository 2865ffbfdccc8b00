#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <string>
#include <variant>
#include <vector>
#include "benchmark/Benchmarker.hpp"
#include "config/PipelineOptions.hpp"
#include "database/PostgresWarehouse.hpp"
#include "load/BulkLoadWriter.hpp"
#include "read/SnapshotReader.hpp"
#include "storage/StagingFileSystem.hpp"
#include "streaming/StreamingWriter.hpp"
#include "tools/DataGenerator.hpp"

// Usage: bulkbridge [num_rows]
//
// Loads synthetic trades into PostgreSQL, reads them back as a table snapshot
// and as a query result, then streams two bundles of rows.
// Settings come from the BULKBRIDGE_* environment variables.
int main(int argc, char **argv)
{
    std::ios_base::sync_with_stdio(false);

    std::cout << "===================================================\n";
    std::cout << "   BulkBridge | Warehouse Bulk Transfer\n";
    std::cout << "===================================================\n\n";

    try
    {
        const size_t num_rows = argc > 1 ? std::stoul(argv[1]) : 100'000;

        BulkBridge::PipelineOptions options = BulkBridge::PipelineOptions::from_env();
        if (options.temp_location.empty())
            options.temp_location = (std::filesystem::temp_directory_path() / "bulkbridge").string();

        BulkBridge::StagingFileSystem fs;
        BulkBridge::PostgresWarehouse warehouse(options.pg_connection, fs, options.poll_interval);
        warehouse.init_catalog();

        const std::string dataset = "bulkbridge_demo";
        if (!warehouse.get_dataset(options.project, dataset))
            warehouse.create_dataset(options.project, dataset, "local", "BulkBridge demo tables");

        const auto schema = BulkBridge::DataGenerator::trade_schema();
        const auto rows = BulkBridge::DataGenerator::generate(num_rows);

        // ── STAGE 1: BULK LOAD ────────────────────────────────────────────
        std::cout << "\n[STAGE 1] BULK LOAD\n";
        BulkBridge::WriteConfig write;
        write.table = BulkBridge::TableReference{options.project, dataset, "trades"};
        write.schema = schema;
        write.write_disposition = BulkBridge::WriteDisposition::WriteTruncate;
        write.table_description = "Synthetic trades loaded by BulkBridge";

        // Two files per partition so the demo exercises the temp-table commit
        BulkBridge::PartitionPolicy partitions;
        partitions.max_num_files = 2;

        BulkBridge::BulkLoadWriter writer(warehouse, warehouse, fs, options, write, partitions);
        auto load = writer.write(rows);
        std::cout << "[SUCCESS] Loaded " << load.rows_written << " rows through "
                  << load.partition_count << " partition(s).\n";
        BulkBridge::print_benchmark_report("Bulk load", load.timings);

        // ── STAGE 2: TABLE SNAPSHOT ───────────────────────────────────────
        std::cout << "[STAGE 2] TABLE SNAPSHOT\n";
        BulkBridge::ReadConfig table_read;
        table_read.table = write.table;

        std::atomic<size_t> pro_trades{0};
        BulkBridge::SnapshotReader table_reader(warehouse, warehouse, fs, options, table_read);
        auto read = table_reader.read_all([&](const BulkBridge::TableRow &row)
                                          {
            if (auto *pro = std::get_if<bool>(&row.get("is_pro")); pro && *pro)
                ++pro_trades; });
        std::cout << "[SUCCESS] Read " << read.rows_read << " rows from " << read.files
                  << " file(s); institutional trades: " << pro_trades.load() << "\n";
        BulkBridge::print_benchmark_report("Table snapshot", read.timings);

        // ── STAGE 3: QUERY SNAPSHOT ───────────────────────────────────────
        std::cout << "[STAGE 3] QUERY SNAPSHOT\n";
        BulkBridge::ReadConfig query_read;
        query_read.query = "SELECT symbol, count(*) AS trades, avg(price) AS avg_price FROM [" +
                           options.project + ":" + dataset + ".trades] GROUP BY symbol";

        BulkBridge::SnapshotReader query_reader(warehouse, warehouse, fs, options, query_read);
        for (const auto &row : query_reader.read_rows())
            std::cout << "  " << BulkBridge::to_debug_string(row) << "\n";
        std::cout << "\n";

        // ── STAGE 4: STREAMING INSERTS ────────────────────────────────────
        std::cout << "[STAGE 4] STREAMING INSERTS\n";
        BulkBridge::WriteConfig stream;
        stream.table = BulkBridge::TableReference{options.project, dataset, "trades_stream"};
        stream.schema = schema;
        stream.write_disposition = BulkBridge::WriteDisposition::WriteAppend;

        std::vector<BulkBridge::WindowedRow> bundle;
        for (size_t i = 0; i < std::min<size_t>(rows.size(), 1000); ++i)
            bundle.push_back({rows[i]});

        BulkBridge::StreamingWriter streamer(warehouse, options, stream);
        auto first = streamer.write_batch("demo-bundle-0", bundle);
        // Same rows under a new bundle id: new ids, so they are inserted again.
        // Replaying a bundle id that failed is what reuses ids.
        auto second = streamer.write_batch("demo-bundle-1", bundle);
        std::cout << "[SUCCESS] Streamed " << first.rows_inserted + second.rows_inserted << " rows, "
                  << streamer.inserted_bytes() << " bytes.\n";
        BulkBridge::print_benchmark_report("Streaming", first.timings);

        std::cout << "[SUCCESS] BulkBridge demo finished.\n";
        std::cout << "===================================================\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "[CRITICAL ERROR] Pipeline crashed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
