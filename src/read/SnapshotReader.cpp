#include "SnapshotReader.hpp"

#include <atomic>
#include <future>
#include <iostream>
#include <mutex>

#include "../storage/StagingFileSystem.hpp"
#include "../threading/ThreadPool.hpp"

namespace BulkBridge
{

    SnapshotReader::SnapshotReader(JobClient &jobs,
                                   TableClient &tables,
                                   const StagingFileSystem &fs,
                                   PipelineOptions options,
                                   ReadConfig config,
                                   const CancellationToken *cancel)
        : options_(std::move(options))
    {
        validate_read_config(config, options_);
        validate_read_source(config, jobs, tables, options_);

        identity_ = make_run_identity(options_.job_name);

        SnapshotContext ctx{jobs,
                            tables,
                            fs,
                            options_.project,
                            identity_.job_id_token,
                            StagingFileSystem::join(options_.temp_location, identity_.step_uuid),
                            cancel};

        if (config.query)
        {
            source_ = std::make_unique<QuerySnapshotSource>(ctx,
                                                            *config.query,
                                                            config.effective_flatten_results(),
                                                            config.effective_use_legacy_sql(),
                                                            query_temp_table(options_.project, identity_.job_uuid));
        }
        else
        {
            source_ = std::make_unique<TableSnapshotSource>(ctx, config.table->with_default_project(options_.project));
        }
    }

    ReadResult SnapshotReader::read_all(const RowConsumer &consumer, int64_t desired_bundle_size_bytes)
    {
        ReadResult result;
        auto &timings = result.timings;

        std::vector<std::unique_ptr<RowSource>> bundles;
        {
            Benchmarker bench("Extract", 0, timings);
            auto files = source_->split(desired_bundle_size_bytes);
            result.files = files.size();
            for (auto &file : files)
            {
                for (auto &bundle : file->split(desired_bundle_size_bytes))
                    bundles.push_back(std::move(bundle));
            }
            result.bundles = bundles.size();
            bench.set_item_count(result.files);
        }

        std::cout << "[READ] " << result.files << " files, " << result.bundles << " bundles, "
                  << options_.num_workers << " workers\n";

        std::atomic<size_t> rows_read{0};
        {
            Benchmarker bench("Read", 0, timings);
            ThreadPool pool(options_.num_workers);

            std::vector<std::future<void>> futures;
            futures.reserve(bundles.size());
            for (auto &bundle : bundles)
            {
                RowSource *source = bundle.get();
                futures.push_back(pool.submit([source, &consumer, &rows_read]()
                                              {
                    auto reader = source->create_reader();
                    try
                    {
                        for (bool more = reader->start(); more; more = reader->advance())
                        {
                            consumer(reader->current());
                            rows_read.fetch_add(1, std::memory_order_relaxed);
                        }
                    }
                    catch (const std::exception &e)
                    {
                        std::cerr << "[READ ERROR] Bundle failed: " << e.what() << "\n";
                        reader->close();
                        throw;
                    }
                    reader->close(); }));
            }

            // All readers finish before the files may go away
            join_all(futures);
            bench.set_item_count(rows_read.load());
        }
        result.rows_read = rows_read.load();

        {
            Benchmarker bench("Cleanup", result.files, timings);
            result.files_removed = source_->delete_extracted_files();
        }

        std::cout << "[READ] Read " << result.rows_read << " rows\n";
        return result;
    }

    std::vector<TableRow> SnapshotReader::read_rows(int64_t desired_bundle_size_bytes)
    {
        std::mutex mutex;
        std::vector<TableRow> rows;
        read_all([&](const TableRow &row)
                 {
                     std::lock_guard<std::mutex> lock(mutex);
                     rows.push_back(row); },
                 desired_bundle_size_bytes);
        return rows;
    }

} // namespace BulkBridge
