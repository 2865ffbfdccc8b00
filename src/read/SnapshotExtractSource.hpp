#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../jobs/JobRetryDriver.hpp"
#include "../model/Job.hpp"
#include "../model/TableSchema.hpp"
#include "../services/JobClient.hpp"
#include "../services/TableClient.hpp"
#include "RowSource.hpp"

namespace BulkBridge
{

    class StagingFileSystem;

    // Shared by every snapshot source and by the post-read cleanup
    struct SnapshotContext
    {
        JobClient &jobs;
        TableClient &tables;
        const StagingFileSystem &fs;
        std::string executing_project;
        std::string job_id_token; // "bulkbridge_job_<job_uuid>"
        std::string extract_dir;  // "<temp_location>/<step_uuid>"
        const CancellationToken *cancel = nullptr;
    };

    // "<token>-extract"; the single attempt runs as "<token>-extract-0"
    [[nodiscard]]
    std::string extract_job_prefix(const std::string &job_id_token);

    [[nodiscard]]
    JobReference extract_job_reference(const SnapshotContext &ctx);

    // "<dir>/*.parquet"
    [[nodiscard]]
    std::string extract_destination_uri(const std::string &extract_dir);

    /**
     * @brief "<dir>/000000000000.parquet", ... one per file the extract job wrote.
     * The job must report exactly one destination URI file count.
     */
    [[nodiscard]]
    std::vector<std::string> extract_file_paths(const std::string &extract_dir, const Job &extract_job);

    // =========================================================================
    // SnapshotExtractSource — a table snapshot exported to Parquet files
    // =========================================================================
    //
    //   split():  table_to_extract()        (query: runs the query first)
    //             extract job -> <dir>/*.parquet
    //             schema of the extracted table
    //             cleanup_temp_resources()  (query: temp table + dataset)
    //             one ParquetFileSource per extracted file
    //
    // The extract runs once per source; later split() calls reuse its files.
    // The extracted files are NOT deleted here; the reader that consumes the
    // sub-sources deletes them through delete_extracted_files() once every
    // one of them has been fully read. After that the source is spent and
    // split() throws StagingError.
    // =========================================================================
    class SnapshotExtractSource : public RowSource
    {
    public:
        static constexpr JobRetryPolicy EXTRACT_RETRY_POLICY{1, INT_MAX};

        explicit SnapshotExtractSource(SnapshotContext ctx);

        std::vector<std::unique_ptr<RowSource>> split(int64_t desired_bundle_size_bytes) override;

        // Reads every file in order on the calling thread; files are deleted on close()
        std::unique_ptr<RowReader> create_reader() override;

        // Files produced by the extract, empty before the first split()
        std::vector<std::string> extracted_files() const;

        // cleanup_snapshot_files() for this source; marks it spent
        size_t delete_extracted_files();

        const SnapshotContext &context() const { return ctx_; }

    protected:
        virtual TableReference table_to_extract() = 0;
        virtual void cleanup_temp_resources() = 0;

        SnapshotContext ctx_;

    private:
        std::vector<std::string> run_extract(const TableReference &table);

        struct Extract
        {
            std::vector<std::string> files;
            TableSchema schema;
        };

        mutable std::mutex extract_mutex_;
        std::optional<Extract> extract_;
        bool files_deleted_ = false;
    };

    class TableSnapshotSource : public SnapshotExtractSource
    {
    public:
        TableSnapshotSource(SnapshotContext ctx, TableReference table);

        // Table numBytes, fetched once
        int64_t estimated_size_bytes() override;

        const TableReference &table() const { return table_; }

    protected:
        TableReference table_to_extract() override { return table_; }
        void cleanup_temp_resources() override {}

    private:
        TableReference table_;
        std::mutex size_mutex_;
        std::optional<int64_t> size_bytes_;
    };

    class QuerySnapshotSource : public SnapshotExtractSource
    {
    public:
        /**
         * @param temp_table "<project>:temp_dataset_<job_uuid>.temp_table_<job_uuid>"
         */
        QuerySnapshotSource(SnapshotContext ctx,
                            std::string query,
                            bool flatten_results,
                            bool use_legacy_sql,
                            TableReference temp_table);

        // Dry-run totalBytesProcessed, fetched once
        int64_t estimated_size_bytes() override;

        const TableReference &temp_table() const { return temp_table_; }

    protected:
        TableReference table_to_extract() override;
        void cleanup_temp_resources() override;

    private:
        QueryJobConfig basic_query_config() const;
        JobStatistics dry_run_if_needed();

        std::string query_;
        bool flatten_results_;
        bool use_legacy_sql_;
        TableReference temp_table_;

        std::mutex dry_run_mutex_;
        std::optional<JobStatistics> dry_run_stats_;
    };

    // "temp_dataset_<job_uuid>" / "temp_table_<job_uuid>" in the executing project
    [[nodiscard]]
    TableReference query_temp_table(const std::string &executing_project, const std::string &job_uuid);

    /**
     * @brief Deletes the extract files of a finished read.
     * Uses the extract job's file count when the job record still exists,
     * otherwise deletes whatever matches "<dir>/*". Failures are logged only.
     * @return number of files removed
     */
    size_t cleanup_snapshot_files(const SnapshotContext &ctx);

} // namespace BulkBridge
