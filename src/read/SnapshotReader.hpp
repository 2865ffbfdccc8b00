#pragma once

#include <functional>
#include <memory>
#include <vector>
#include "../benchmark/Benchmarker.hpp"
#include "../config/PipelineOptions.hpp"
#include "ReadConfig.hpp"
#include "SnapshotExtractSource.hpp"

namespace BulkBridge
{

    struct ReadResult
    {
        size_t rows_read = 0;
        size_t files = 0;
        size_t bundles = 0;
        size_t files_removed = 0;
        std::vector<BenchmarkResult> timings;
    };

    // =========================================================================
    // SnapshotReader — reads a table or query result in parallel
    // =========================================================================
    //
    //   source.split()          -> one sub-source per extracted file
    //   file.split(bundle)      -> row-group bundles
    //   N workers read bundles  -> consumer(row)
    //   all workers done        -> extract files deleted
    //
    // The consumer is called concurrently from worker threads. If any bundle
    // fails, the error is rethrown after every worker finished and the
    // extract files are left in place.
    // =========================================================================
    class SnapshotReader
    {
    public:
        using RowConsumer = std::function<void(const TableRow &)>;

        static constexpr int64_t DEFAULT_BUNDLE_SIZE_BYTES = 64LL << 20;

        // Throws ConfigurationError / ValidationError before any job is started
        SnapshotReader(JobClient &jobs,
                       TableClient &tables,
                       const StagingFileSystem &fs,
                       PipelineOptions options,
                       ReadConfig config,
                       const CancellationToken *cancel = nullptr);

        ReadResult read_all(const RowConsumer &consumer,
                            int64_t desired_bundle_size_bytes = DEFAULT_BUNDLE_SIZE_BYTES);

        // read_all() collecting into a vector (order unspecified)
        [[nodiscard]]
        std::vector<TableRow> read_rows(int64_t desired_bundle_size_bytes = DEFAULT_BUNDLE_SIZE_BYTES);

        SnapshotExtractSource &source() { return *source_; }
        const RunIdentity &identity() const { return identity_; }

    private:
        PipelineOptions options_;
        RunIdentity identity_;
        std::unique_ptr<SnapshotExtractSource> source_;
    };

} // namespace BulkBridge
