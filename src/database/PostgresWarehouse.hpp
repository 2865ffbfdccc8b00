#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <pqxx/pqxx>
#include "../services/JobClient.hpp"
#include "../services/TableClient.hpp"

namespace BulkBridge
{

    class StagingFileSystem;

    // =========================================================================
    // PostgresWarehouse — JobClient + TableClient on one PostgreSQL database
    // =========================================================================
    //
    //   dataset  -> PostgreSQL schema
    //   table    -> table in that schema
    //   project  -> metadata only (bulkbridge_meta.datasets / .jobs)
    //
    //   load     COPY FROM STDIN of every staged CSV file, one transaction
    //   copy     INSERT ... SELECT from each source, one transaction
    //   query    CREATE TABLE ... AS (or INSERT ... SELECT into an existing table)
    //   extract  cursor over the table, one Parquet file per page
    //   dry run  EXPLAIN (VERBOSE, FORMAT JSON)
    //
    // Jobs run to completion inside submit_*(); the outcome is recorded in
    // bulkbridge_meta.jobs and read back by poll_job() / get_job(). A job body
    // that throws becomes a DONE job with an error result.
    //
    // Like the loaders before it, every method opens its own connection, so
    // one instance can be shared by all worker threads.
    // =========================================================================
    class PostgresWarehouse : public JobClient, public TableClient
    {
    public:
        static constexpr const char *CATALOG_SCHEMA = "bulkbridge_meta";
        static constexpr int64_t DEFAULT_ROWS_PER_EXTRACT_FILE = 250'000;

        PostgresWarehouse(std::string connection_string,
                          const StagingFileSystem &fs,
                          std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200),
                          int64_t rows_per_extract_file = DEFAULT_ROWS_PER_EXTRACT_FILE);

        // Creates the catalog schema and its tables if missing. Idempotent.
        void init_catalog();

        // ── JobClient ────────────────────────────────────────────────────
        void submit_load(const JobReference &ref, const LoadJobConfig &config) override;
        void submit_copy(const JobReference &ref, const CopyJobConfig &config) override;
        void submit_extract(const JobReference &ref, const ExtractJobConfig &config) override;
        void submit_query(const JobReference &ref, const QueryJobConfig &config) override;

        std::optional<Job> poll_job(const JobReference &ref, int max_retries, const CancellationToken *cancel) override;
        std::optional<Job> get_job(const JobReference &ref) override;
        JobStatistics dry_run_query(const std::string &project_id, const QueryJobConfig &config) override;

        // ── TableClient ──────────────────────────────────────────────────
        std::optional<Table> get_table(const TableReference &ref) override;
        void create_table(const Table &table) override;
        void delete_table(const TableReference &ref) override;

        std::optional<Dataset> get_dataset(const std::string &project_id, const std::string &dataset_id) override;
        void create_dataset(const std::string &project_id,
                            const std::string &dataset_id,
                            const std::string &location,
                            const std::string &description) override;
        void delete_dataset(const std::string &project_id, const std::string &dataset_id) override;

        bool is_table_empty(const TableReference &ref) override;
        int64_t insert_all(const TableReference &ref,
                           const std::vector<TableRow> &rows,
                           const std::vector<std::string> &unique_ids) override;
        void patch_table_description(const TableReference &ref, const std::string &description) override;

        // Rewrites [project:dataset.table] (legacy) or `project.dataset.table`
        // (standard) references into quoted PostgreSQL identifiers
        [[nodiscard]]
        static std::string rewrite_table_references(std::string_view query, bool use_legacy_sql);

    private:
        template <typename Body>
        void run_job(const JobReference &ref, JobType type, Body &&body);

        JobStatistics execute_load(const LoadJobConfig &config);
        JobStatistics execute_copy(const CopyJobConfig &config);
        JobStatistics execute_query(const std::string &project_id, const QueryJobConfig &config);
        JobStatistics execute_extract(const ExtractJobConfig &config);

        JobStatistics explain(pqxx::work &W, const std::string &project_id, const std::string &sql) const;

        // Applies both dispositions to `table` and returns the schema to write with
        TableSchema prepare_destination(pqxx::work &W,
                                        const TableReference &table,
                                        const std::optional<TableSchema> &schema,
                                        WriteDisposition write_disposition,
                                        CreateDisposition create_disposition) const;

        void copy_rows(pqxx::work &W,
                       const TableReference &table,
                       const TableSchema &schema,
                       const std::vector<TableRow> &rows) const;

        std::string conn_str_;
        const StagingFileSystem &fs_;
        std::chrono::milliseconds poll_interval_;
        int64_t rows_per_extract_file_;
    };

} // namespace BulkBridge
