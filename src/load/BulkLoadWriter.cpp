#include "BulkLoadWriter.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <future>
#include <iostream>

#include "../common/Errors.hpp"
#include "../storage/StagingFileSystem.hpp"
#include "../threading/ThreadPool.hpp"
#include "../util/RandomToken.hpp"

namespace BulkBridge
{

    BulkLoadWriter::BulkLoadWriter(JobClient &jobs,
                                   TableClient &tables,
                                   const StagingFileSystem &fs,
                                   PipelineOptions options,
                                   WriteConfig config,
                                   PartitionPolicy partition_policy,
                                   JobRetryPolicy retry_policy,
                                   const CancellationToken *cancel)
        : jobs_(jobs),
          tables_(tables),
          fs_(fs),
          options_(std::move(options)),
          config_(std::move(config)),
          partitioner_(partition_policy),
          retry_policy_(retry_policy),
          cancel_(cancel)
    {
        validate_bulk_load_config(config_, options_);

        identity_ = make_run_identity(options_.job_name);
        destination_ = config_.table->with_default_project(options_.project);
        temp_file_prefix_ = StagingFileSystem::join(
            StagingFileSystem::join(options_.temp_location, WRITE_TEMP_DIR), identity_.step_uuid);
    }

    std::string BulkLoadWriter::partition_job_prefix(int64_t partition_id) const
    {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "_%05lld", static_cast<long long>(partition_id));
        return identity_.job_id_token + suffix;
    }

    TableSchema BulkLoadWriter::resolve_schema()
    {
        if (config_.schema)
            return *config_.schema;

        // CREATE_NEVER without a schema: encode in the existing table's column order
        auto table = tables_.get_table(destination_);
        if (!table)
        {
            throw ValidationError("Destination table " + to_table_spec(destination_) +
                                  " does not exist and no schema was provided");
        }
        return table->schema;
    }

    // =========================================================================
    // STAGE
    // =========================================================================
    // Rows are split into one contiguous shard per worker (std::span, no
    // copies). Each shard becomes exactly one staged file. If any shard fails,
    // the files of the shards that succeeded are removed before rethrowing.
    // =========================================================================
    std::vector<StagedFile> BulkLoadWriter::stage(std::span<const TableRow> rows,
                                                  const TableSchema &schema,
                                                  ThreadPool &pool)
    {
        if (rows.empty())
            return {};

        const size_t num_shards = std::min(pool.thread_count(), rows.size());
        const size_t shard_size = rows.size() / num_shards;
        const size_t remainder = rows.size() % num_shards;

        std::vector<std::future<StagedFile>> futures;
        futures.reserve(num_shards);

        size_t offset = 0;
        for (size_t i = 0; i < num_shards; ++i)
        {
            const size_t this_shard = shard_size + (i < remainder ? 1 : 0);
            auto shard = rows.subspan(offset, this_shard);
            offset += this_shard;

            futures.push_back(pool.submit([this, shard, &schema]()
                                          { return stage_shard(shard, schema); }));
        }

        std::vector<StagedFile> files;
        std::exception_ptr first_error;
        for (auto &f : futures)
        {
            try
            {
                files.push_back(f.get());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[STAGING ERROR] Shard failed: " << e.what() << "\n";
                if (!first_error)
                    first_error = std::current_exception();
            }
        }

        if (first_error)
        {
            std::vector<std::string> paths;
            for (const auto &file : files)
                paths.push_back(file.path);
            fs_.remove_quietly(paths);
            std::rethrow_exception(first_error);
        }

        std::cout << "[STAGING] " << rows.size() << " rows staged into " << files.size()
                  << " files under " << temp_file_prefix_ << "\n";
        return files;
    }

    StagedFile BulkLoadWriter::stage_shard(std::span<const TableRow> shard, const TableSchema &schema) const
    {
        StagingWriter writer(fs_, temp_file_prefix_, schema);
        writer.open(random_token());
        try
        {
            for (const auto &row : shard)
                writer.write(row);
            return writer.close();
        }
        catch (const std::exception &)
        {
            // The writer already closed the stream; the partial file is ours to remove
            fs_.remove_quietly({writer.path()});
            throw;
        }
    }

    // =========================================================================
    // LOAD
    // =========================================================================
    JobRun BulkLoadWriter::load_partition(const Partition &partition,
                                          const TableReference &target,
                                          const std::optional<TableSchema> &schema,
                                          WriteDisposition write_disposition,
                                          CreateDisposition create_disposition,
                                          bool patch_description) const
    {
        LoadJobConfig load;
        load.destination = target;
        load.schema = schema;
        load.source_uris = partition.files;
        load.write_disposition = write_disposition;
        load.create_disposition = create_disposition;

        std::cout << "[LOAD] Partition " << partition.id << ": " << partition.files.size() << " files, "
                  << partition.byte_count << " bytes -> " << to_table_spec(target) << "\n";

        JobRetryDriver driver(jobs_, target.project_id, retry_policy_, cancel_);
        try
        {
            JobRun run = driver.run_job(
                "load",
                partition_job_prefix(partition.id),
                [&](const JobReference &ref)
                { jobs_.submit_load(ref, load); },
                [&](const Job &)
                {
                    if (patch_description && config_.table_description)
                        tables_.patch_table_description(target, *config_.table_description);
                });
            fs_.remove_quietly(partition.files);
            return run;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[LOAD ERROR] Partition " << partition.id << " failed: " << e.what() << "\n";
            fs_.remove_quietly(partition.files);
            throw;
        }
    }

    // =========================================================================
    // COMMIT
    // =========================================================================
    JobRun BulkLoadWriter::commit(const std::vector<TableReference> &temp_tables) const
    {
        CopyJobConfig copy;
        copy.sources = temp_tables;
        copy.destination = destination_;
        copy.write_disposition = config_.write_disposition;
        copy.create_disposition = config_.create_disposition;

        std::cout << "[COMMIT] Copying " << temp_tables.size() << " temp tables into "
                  << to_table_spec(destination_) << "\n";

        JobRetryDriver driver(jobs_, destination_.project_id, retry_policy_, cancel_);
        return driver.run_job(
            "copy",
            identity_.job_id_token,
            [&](const JobReference &ref)
            { jobs_.submit_copy(ref, copy); },
            [&](const Job &)
            {
                if (config_.table_description)
                    tables_.patch_table_description(destination_, *config_.table_description);
            });
    }

    void BulkLoadWriter::remove_temp_tables(const std::vector<TableReference> &temp_tables) const
    {
        for (const auto &table : temp_tables)
        {
            try
            {
                tables_.delete_table(table);
                std::cout << "[CLEANUP] Deleted temp table " << to_table_spec(table) << "\n";
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CLEANUP WARN] Failed to delete temp table " << to_table_spec(table)
                          << ": " << e.what() << "\n";
            }
        }
    }

    // =========================================================================
    // write() — the whole protocol
    // =========================================================================
    BulkLoadResult BulkLoadWriter::write(const std::vector<TableRow> &rows)
    {
        BulkLoadResult result;
        result.destination = destination_;
        auto &timings = result.timings;

        validate_destination(tables_, config_, destination_);
        const TableSchema schema = resolve_schema();

        std::vector<TableRow> valid_rows = RowValidator::validate_batch(rows, schema, config_.invalid_rows);
        result.rows_written = valid_rows.size();

        ThreadPool pool(options_.num_workers);

        {
            Benchmarker bench("Stage", valid_rows.size(), timings);
            result.staged_files = stage(valid_rows, schema, pool);
        }

        WritePlan plan;
        {
            Benchmarker bench("Partition", result.staged_files.size(), timings);
            plan = partitioner_.plan(result.staged_files, [this, &schema]()
                                     { return stage_shard({}, schema); });
        }

        if (const auto *direct = std::get_if<DirectWrite>(&plan))
        {
            result.partition_count = 1;
            {
                Benchmarker bench("Load", direct->partition.files.size(), timings);
                result.load_runs.push_back(load_partition(direct->partition,
                                                          destination_,
                                                          config_.schema,
                                                          config_.write_disposition,
                                                          config_.create_disposition,
                                                          /*patch_description=*/true));
            }
            std::cout << "[LOAD] Direct write to " << to_table_spec(destination_) << " complete\n";
            return result;
        }

        const auto &partitions = std::get<StagedWrite>(plan).partitions;
        result.partition_count = partitions.size();

        for (const auto &p : partitions)
        {
            result.temp_tables.push_back(
                TableReference{destination_.project_id, destination_.dataset_id, partition_job_prefix(p.id)});
        }

        {
            Benchmarker bench("Load", partitions.size(), timings);
            std::vector<std::future<JobRun>> futures;
            futures.reserve(partitions.size());
            for (size_t i = 0; i < partitions.size(); ++i)
            {
                futures.push_back(pool.submit([this, &partitions, &result, &schema, i]()
                                              { return load_partition(partitions[i],
                                                                      result.temp_tables[i],
                                                                      schema,
                                                                      WriteDisposition::WriteEmpty,
                                                                      CreateDisposition::CreateIfNeeded,
                                                                      /*patch_description=*/false); }));
            }
            // Every load has finished (or failed) before anything is committed
            result.load_runs = join_all(futures);
        }

        {
            Benchmarker bench("Commit", result.temp_tables.size(), timings);
            result.copy_run = commit(result.temp_tables);
        }

        {
            Benchmarker bench("Cleanup", result.temp_tables.size(), timings);
            remove_temp_tables(result.temp_tables);
        }

        std::cout << "[COMMIT] Staged write to " << to_table_spec(destination_) << " committed ("
                  << partitions.size() << " partitions)\n";
        return result;
    }

} // namespace BulkBridge
