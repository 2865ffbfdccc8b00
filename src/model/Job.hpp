#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "TableReference.hpp"
#include "TableSchema.hpp"
#include "Dispositions.hpp"

namespace BulkBridge
{

    // =========================================================================
    // JobReference — immutable identity of ONE job attempt
    // =========================================================================
    // A retried job gets a new JobReference ("<prefix>-0", "<prefix>-1", ...).
    // The job service treats job ids as unique; an id is never submitted twice.
    // =========================================================================
    struct JobReference
    {
        std::string project_id;
        std::string job_id;

        bool operator==(const JobReference &) const = default;
    };

    // Classification of a terminal job record
    enum class JobStatus : uint8_t
    {
        Succeeded,
        Failed,  // retryable with a fresh job id
        Unknown  // record missing / unclassifiable; never retried
    };

    enum class JobType : uint8_t
    {
        Load,
        Copy,
        Extract,
        Query
    };

    struct JobError
    {
        std::string reason;
        std::string message;

        bool operator==(const JobError &) const = default;
    };

    struct JobStatistics
    {
        int64_t total_bytes_processed = 0;
        int64_t output_rows = 0;

        // Extract jobs: one entry per destination URI, the number of files written
        std::vector<int64_t> destination_uri_file_counts;

        // Query jobs (and dry runs): tables the query reads
        std::vector<TableReference> referenced_tables;
    };

    struct Job
    {
        JobReference reference;
        JobType type = JobType::Load;
        std::string state = "DONE"; // PENDING | RUNNING | DONE
        std::optional<JobError> error_result;
        std::vector<JobError> errors;
        JobStatistics statistics;

        // Multi-line diagnostic body used in every fatal job error
        [[nodiscard]]
        std::string to_pretty_string() const;
    };

    // SUCCEEDED unless the job carries an error result or a non-empty error list.
    // A missing job (nullopt) is UNKNOWN.
    [[nodiscard]]
    JobStatus parse_status(const std::optional<Job> &job);

    std::string_view to_string(JobStatus status);
    std::string_view to_string(JobType type);

    // ─────────────────────────────────────────────────────────────────────────
    // Job configurations
    // ─────────────────────────────────────────────────────────────────────────

    struct LoadJobConfig
    {
        TableReference destination;
        std::optional<TableSchema> schema; // required when the table has to be created
        std::vector<std::string> source_uris;
        WriteDisposition write_disposition = WriteDisposition::WriteEmpty;
        CreateDisposition create_disposition = CreateDisposition::CreateIfNeeded;
        std::string source_format = "CSV";
    };

    struct CopyJobConfig
    {
        std::vector<TableReference> sources;
        TableReference destination;
        WriteDisposition write_disposition = WriteDisposition::WriteEmpty;
        CreateDisposition create_disposition = CreateDisposition::CreateIfNeeded;
    };

    struct ExtractJobConfig
    {
        TableReference source;
        std::vector<std::string> destination_uris; // wildcard URIs, e.g. "<dir>/*.parquet"
        std::string destination_format = "PARQUET";
    };

    enum class QueryPriority : uint8_t
    {
        Interactive,
        Batch
    };

    struct QueryJobConfig
    {
        std::string query;
        bool use_legacy_sql = true;
        bool flatten_results = true;
        bool allow_large_results = false;
        QueryPriority priority = QueryPriority::Interactive;
        std::optional<TableReference> destination;
        WriteDisposition write_disposition = WriteDisposition::WriteEmpty;
        CreateDisposition create_disposition = CreateDisposition::CreateIfNeeded;
    };

} // namespace BulkBridge
