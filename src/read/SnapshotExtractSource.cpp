#include "SnapshotExtractSource.hpp"

#include <cstdio>
#include <iostream>
#include <stdexcept>

#include "../common/Errors.hpp"
#include "../storage/StagingFileSystem.hpp"
#include "ParquetFileSource.hpp"

namespace BulkBridge
{

    std::string extract_job_prefix(const std::string &job_id_token)
    {
        return job_id_token + "-extract";
    }

    JobReference extract_job_reference(const SnapshotContext &ctx)
    {
        return JobReference{ctx.executing_project, extract_job_prefix(ctx.job_id_token) + "-0"};
    }

    std::string extract_destination_uri(const std::string &extract_dir)
    {
        return StagingFileSystem::join(extract_dir, "*.parquet");
    }

    std::vector<std::string> extract_file_paths(const std::string &extract_dir, const Job &extract_job)
    {
        const auto &counts = extract_job.statistics.destination_uri_file_counts;
        if (counts.size() != 1)
        {
            throw WarehouseError(counts.empty()
                                     ? "No destination uri file count received."
                                     : "More than one destination uri file count received. First two are " +
                                           std::to_string(counts[0]) + ", " + std::to_string(counts[1]));
        }

        std::vector<std::string> paths;
        paths.reserve(static_cast<size_t>(counts.front()));
        for (int64_t i = 0; i < counts.front(); ++i)
        {
            char name[32];
            std::snprintf(name, sizeof(name), "%012lld.parquet", static_cast<long long>(i));
            paths.push_back(StagingFileSystem::join(extract_dir, name));
        }
        return paths;
    }

    TableReference query_temp_table(const std::string &executing_project, const std::string &job_uuid)
    {
        return TableReference{executing_project, "temp_dataset_" + job_uuid, "temp_table_" + job_uuid};
    }

    // =========================================================================
    // SnapshotExtractSource
    // =========================================================================

    namespace
    {
        // Whole-snapshot reader: splits on start(), reads the files one after
        // another, deletes them on close()
        class SequentialSnapshotReader : public RowReader
        {
        public:
            explicit SequentialSnapshotReader(SnapshotExtractSource &source) : source_(source) {}

            bool start() override
            {
                sources_ = source_.split(INT64_MAX);
                index_ = 0;
                return open_next();
            }

            bool advance() override
            {
                if (!current_)
                    return false;
                if (current_->advance())
                    return true;
                current_->close();
                current_.reset();
                ++done_;
                return open_next();
            }

            const TableRow &current() const override
            {
                if (!current_)
                    throw std::out_of_range("[READ] No current row");
                return current_->current();
            }

            double fraction_consumed() const override
            {
                if (sources_.empty())
                    return started_ ? 1.0 : 0.0;
                double inner = current_ ? current_->fraction_consumed() : 0.0;
                return (static_cast<double>(done_) + inner) / static_cast<double>(sources_.size());
            }

            void close() override
            {
                if (current_)
                    current_->close();
                current_.reset();
                if (started_)
                    source_.delete_extracted_files();
                started_ = false;
            }

        private:
            bool open_next()
            {
                started_ = true;
                while (index_ < sources_.size())
                {
                    current_ = sources_[index_++]->create_reader();
                    if (current_->start())
                        return true;
                    current_->close();
                    current_.reset();
                    ++done_;
                }
                return false;
            }

            SnapshotExtractSource &source_;
            std::vector<std::unique_ptr<RowSource>> sources_;
            std::unique_ptr<RowReader> current_;
            size_t index_ = 0;
            size_t done_ = 0;
            bool started_ = false;
        };
    } // namespace

    SnapshotExtractSource::SnapshotExtractSource(SnapshotContext ctx)
        : ctx_(std::move(ctx))
    {
    }

    std::vector<std::string> SnapshotExtractSource::run_extract(const TableReference &table)
    {
        ExtractJobConfig extract;
        extract.source = table;
        extract.destination_uris = {extract_destination_uri(ctx_.extract_dir)};
        extract.destination_format = "PARQUET";

        JobRetryDriver driver(ctx_.jobs, ctx_.executing_project, EXTRACT_RETRY_POLICY, ctx_.cancel);
        JobRun run = driver.run_job("extract", extract_job_prefix(ctx_.job_id_token),
                                    [&](const JobReference &ref)
                                    { ctx_.jobs.submit_extract(ref, extract); });

        auto files = extract_file_paths(ctx_.extract_dir, run.job);
        std::cout << "[EXTRACT] " << to_table_spec(table) << " -> " << files.size()
                  << " files in " << ctx_.extract_dir << "\n";
        return files;
    }

    std::vector<std::unique_ptr<RowSource>> SnapshotExtractSource::split(int64_t desired_bundle_size_bytes)
    {
        (void)desired_bundle_size_bytes; // one sub-source per file; files split further themselves

        std::lock_guard<std::mutex> lock(extract_mutex_);
        if (files_deleted_)
        {
            throw StagingError("[EXTRACT] Snapshot files in " + ctx_.extract_dir +
                               " were already read and deleted");
        }

        if (!extract_)
        {
            const TableReference table = table_to_extract();
            auto files = run_extract(table);

            // Schema must be read before the temp table of a query disappears
            auto metadata = ctx_.tables.get_table(table);
            if (!metadata)
                throw WarehouseError("Extracted table " + to_table_spec(table) + " no longer exists", true);

            cleanup_temp_resources();
            extract_ = Extract{std::move(files), metadata->schema};
        }
        else
        {
            std::cout << "[EXTRACT] Reusing " << extract_->files.size() << " files in " << ctx_.extract_dir << "\n";
        }

        std::vector<std::unique_ptr<RowSource>> sources;
        sources.reserve(extract_->files.size());
        for (const auto &file : extract_->files)
            sources.push_back(std::make_unique<ParquetFileSource>(ctx_.fs, file, extract_->schema));
        return sources;
    }

    std::unique_ptr<RowReader> SnapshotExtractSource::create_reader()
    {
        return std::make_unique<SequentialSnapshotReader>(*this);
    }

    std::vector<std::string> SnapshotExtractSource::extracted_files() const
    {
        std::lock_guard<std::mutex> lock(extract_mutex_);
        return extract_ ? extract_->files : std::vector<std::string>{};
    }

    size_t SnapshotExtractSource::delete_extracted_files()
    {
        std::lock_guard<std::mutex> lock(extract_mutex_);
        files_deleted_ = true;
        return cleanup_snapshot_files(ctx_);
    }

    // =========================================================================
    // TableSnapshotSource
    // =========================================================================

    TableSnapshotSource::TableSnapshotSource(SnapshotContext ctx, TableReference table)
        : SnapshotExtractSource(std::move(ctx)), table_(std::move(table))
    {
    }

    int64_t TableSnapshotSource::estimated_size_bytes()
    {
        std::lock_guard<std::mutex> lock(size_mutex_);
        if (!size_bytes_)
        {
            auto table = ctx_.tables.get_table(table_);
            if (!table)
                throw WarehouseError("Table " + to_table_spec(table_) + " not found", true);
            size_bytes_ = table->num_bytes;
        }
        return *size_bytes_;
    }

    // =========================================================================
    // QuerySnapshotSource
    // =========================================================================
    //   1. dry run (cached) -> first referenced table -> its location
    //   2. temp dataset in that location
    //   3. query job "<token>-query" into the temp table
    // =========================================================================

    QuerySnapshotSource::QuerySnapshotSource(SnapshotContext ctx,
                                             std::string query,
                                             bool flatten_results,
                                             bool use_legacy_sql,
                                             TableReference temp_table)
        : SnapshotExtractSource(std::move(ctx)),
          query_(std::move(query)),
          flatten_results_(flatten_results),
          use_legacy_sql_(use_legacy_sql),
          temp_table_(std::move(temp_table))
    {
    }

    QueryJobConfig QuerySnapshotSource::basic_query_config() const
    {
        QueryJobConfig config;
        config.query = query_;
        config.flatten_results = flatten_results_;
        config.use_legacy_sql = use_legacy_sql_;
        return config;
    }

    JobStatistics QuerySnapshotSource::dry_run_if_needed()
    {
        std::lock_guard<std::mutex> lock(dry_run_mutex_);
        if (!dry_run_stats_)
            dry_run_stats_ = ctx_.jobs.dry_run_query(ctx_.executing_project, basic_query_config());
        return *dry_run_stats_;
    }

    int64_t QuerySnapshotSource::estimated_size_bytes()
    {
        return dry_run_if_needed().total_bytes_processed;
    }

    TableReference QuerySnapshotSource::table_to_extract()
    {
        std::string location;
        const auto stats = dry_run_if_needed();
        if (!stats.referenced_tables.empty())
        {
            if (auto table = ctx_.tables.get_table(stats.referenced_tables.front()))
                location = table->location;
        }

        ctx_.tables.create_dataset(temp_table_.project_id,
                                   temp_table_.dataset_id,
                                   location,
                                   "Dataset for query job temporary table");

        QueryJobConfig config = basic_query_config();
        config.allow_large_results = true;
        config.create_disposition = CreateDisposition::CreateIfNeeded;
        config.write_disposition = WriteDisposition::WriteEmpty;
        config.priority = QueryPriority::Batch;
        config.destination = temp_table_;

        JobRetryDriver driver(ctx_.jobs, ctx_.executing_project, EXTRACT_RETRY_POLICY, ctx_.cancel);
        driver.run_job("query", ctx_.job_id_token + "-query",
                       [&](const JobReference &ref)
                       { ctx_.jobs.submit_query(ref, config); });

        return temp_table_;
    }

    void QuerySnapshotSource::cleanup_temp_resources()
    {
        try
        {
            ctx_.tables.delete_table(temp_table_);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[CLEANUP WARN] Failed to delete query temp table " << to_table_spec(temp_table_)
                      << ": " << e.what() << "\n";
        }
        try
        {
            ctx_.tables.delete_dataset(temp_table_.project_id, temp_table_.dataset_id);
            std::cout << "[CLEANUP] Deleted query temp dataset " << temp_table_.dataset_id << "\n";
        }
        catch (const std::exception &e)
        {
            std::cerr << "[CLEANUP WARN] Failed to delete query temp dataset " << temp_table_.dataset_id
                      << ": " << e.what() << "\n";
        }
    }

    // =========================================================================
    // cleanup_snapshot_files
    // =========================================================================
    size_t cleanup_snapshot_files(const SnapshotContext &ctx)
    {
        std::vector<std::string> files;
        try
        {
            auto job = ctx.jobs.get_job(extract_job_reference(ctx));
            if (job)
                files = extract_file_paths(ctx.extract_dir, *job);
            else
                files = ctx.fs.match(StagingFileSystem::join(ctx.extract_dir, "*"));
        }
        catch (const std::exception &e)
        {
            std::cerr << "[CLEANUP WARN] Cannot list extract files in " << ctx.extract_dir << ": " << e.what() << "\n";
            return 0;
        }

        const size_t removed = ctx.fs.remove_quietly(files);
        std::cout << "[CLEANUP] Removed " << removed << " extract files from " << ctx.extract_dir << "\n";
        return removed;
    }

} // namespace BulkBridge
