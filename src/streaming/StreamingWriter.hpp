#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "../benchmark/Benchmarker.hpp"
#include "../config/PipelineOptions.hpp"
#include "../load/WriteConfig.hpp"
#include "CheckpointBarrier.hpp"
#include "RowTagger.hpp"

namespace BulkBridge
{

    class TableClient;

    // A row and the window it was produced in
    struct WindowedRow
    {
        TableRow row;
        BoundedWindow window = BoundedWindow::global_window();
    };

    struct StreamingResult
    {
        size_t rows_received = 0;
        size_t rows_inserted = 0; // sent to insert_all; the warehouse may still drop duplicates
        size_t groups = 0;        // distinct (table, shard) keys
        bool replayed = false;    // ids came from an earlier attempt of the bundle
        std::vector<BenchmarkResult> timings;
    };

    // =========================================================================
    // StreamingWriter — streaming inserts with id-keyed dedup
    // =========================================================================
    //
    //   VALIDATE    rows against the schema (when one is configured)
    //   TAG         unique id, shard, destination per row
    //   CHECKPOINT  first tagged version of the bundle is recorded; a replay
    //               of the bundle id reuses it, so retries carry the same ids
    //   INSERT      groups by ShardedKey spread over worker threads, each
    //               worker issuing one insert_all per table
    //
    // A bundle stays checkpointed after it fails and after it completes, so a
    // retry or a redelivery resends the same ids and the warehouse drops the
    // rows it already has.
    // =========================================================================
    class StreamingWriter
    {
    public:
        StreamingWriter(TableClient &tables,
                        PipelineOptions options,
                        WriteConfig config,
                        ShardingPolicy sharding = {});

        StreamingResult write_batch(const std::string &bundle_id, const std::vector<WindowedRow> &rows);

        int64_t inserted_bytes() const { return inserted_bytes_.load(); }
        size_t pending_bundles() const { return barrier_.pending(); }

    private:
        std::vector<TaggedRow> tag(const std::vector<WindowedRow> &rows);

        TableClient &tables_;
        PipelineOptions options_;
        WriteConfig config_;

        std::mutex tagger_mutex_;
        RowTagger tagger_;
        CheckpointBarrier barrier_;
        std::atomic<int64_t> inserted_bytes_{0};
    };

} // namespace BulkBridge
