#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>
#include "../benchmark/Benchmarker.hpp"
#include "../config/PipelineOptions.hpp"
#include "../jobs/JobRetryDriver.hpp"
#include "../partition/Partitioner.hpp"
#include "../services/JobClient.hpp"
#include "../services/TableClient.hpp"
#include "../staging/StagingWriter.hpp"
#include "WriteConfig.hpp"

namespace BulkBridge
{

    class StagingFileSystem;
    class ThreadPool;

    struct BulkLoadResult
    {
        TableReference destination;
        size_t rows_written = 0;
        std::vector<StagedFile> staged_files;
        size_t partition_count = 0;
        std::vector<TableReference> temp_tables; // empty for a direct write
        std::vector<JobRun> load_runs;           // ordered by partition id
        std::optional<JobRun> copy_run;          // set for a staged write
        std::vector<BenchmarkResult> timings;
    };

    // =========================================================================
    // BulkLoadWriter — partitioned load jobs with one atomic commit
    // =========================================================================
    //
    //   STAGE      rows -> N staged CSV files (one per worker shard)
    //   PARTITION  files -> WritePlan (DirectWrite | StagedWrite)
    //   LOAD       DirectWrite : one load job into the destination
    //              StagedWrite : one load job per partition into temp table
    //                            "<token>_<NNNNN>" (WRITE_EMPTY, CREATE_IF_NEEDED)
    //   COMMIT     StagedWrite : one copy job temp tables -> destination,
    //                            started only after every load succeeded
    //   CLEANUP    staged files after each load job; temp tables after commit
    //
    // The destination is modified by exactly one successful job: the direct
    // load or the commit copy. If any partition fails, the destination is
    // untouched and the temp tables are left for inspection.
    // =========================================================================
    class BulkLoadWriter
    {
    public:
        static constexpr const char *WRITE_TEMP_DIR = "BulkBridgeWriteTemp";

        /**
         * @brief Throws ConfigurationError immediately for an unusable config.
         */
        BulkLoadWriter(JobClient &jobs,
                       TableClient &tables,
                       const StagingFileSystem &fs,
                       PipelineOptions options,
                       WriteConfig config,
                       PartitionPolicy partition_policy = {},
                       JobRetryPolicy retry_policy = {},
                       const CancellationToken *cancel = nullptr);

        BulkLoadResult write(const std::vector<TableRow> &rows);

        const RunIdentity &identity() const { return identity_; }
        const TableReference &destination() const { return destination_; }

        // "<temp_location>/BulkBridgeWriteTemp/<step_uuid>"
        const std::string &temp_file_prefix() const { return temp_file_prefix_; }

    private:
        TableSchema resolve_schema();

        std::vector<StagedFile> stage(std::span<const TableRow> rows, const TableSchema &schema, ThreadPool &pool);
        StagedFile stage_shard(std::span<const TableRow> shard, const TableSchema &schema) const;

        JobRun load_partition(const Partition &partition,
                              const TableReference &target,
                              const std::optional<TableSchema> &schema,
                              WriteDisposition write_disposition,
                              CreateDisposition create_disposition,
                              bool patch_description) const;

        JobRun commit(const std::vector<TableReference> &temp_tables) const;

        void remove_temp_tables(const std::vector<TableReference> &temp_tables) const;

        std::string partition_job_prefix(int64_t partition_id) const;

        JobClient &jobs_;
        TableClient &tables_;
        const StagingFileSystem &fs_;
        PipelineOptions options_;
        WriteConfig config_;
        Partitioner partitioner_;
        JobRetryPolicy retry_policy_;
        const CancellationToken *cancel_;

        RunIdentity identity_;
        TableReference destination_;
        std::string temp_file_prefix_;
    };

} // namespace BulkBridge
