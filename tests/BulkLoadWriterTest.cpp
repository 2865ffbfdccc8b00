#include <gtest/gtest.h>

#include <cstdio>

#include <arrow/io/interfaces.h>

#include "../src/common/Errors.hpp"
#include "../src/load/BulkLoadWriter.hpp"
#include "../src/storage/StagingFileSystem.hpp"
#include "FakeWarehouse.hpp"
#include "TestSupport.hpp"

using namespace BulkBridge;

namespace
{
    // Real files whose writes all fail: the file exists but never gets data
    class BrokenWriteStream : public arrow::io::OutputStream
    {
    public:
        explicit BrokenWriteStream(std::shared_ptr<arrow::io::OutputStream> inner) : inner_(std::move(inner)) {}

        arrow::Status Write(const void *, int64_t) override { return arrow::Status::IOError("device unplugged"); }
        arrow::Status Close() override { return inner_->Close(); }
        arrow::Status Abort() override { return inner_->Abort(); }
        arrow::Result<int64_t> Tell() const override { return inner_->Tell(); }
        bool closed() const override { return inner_->closed(); }

    private:
        std::shared_ptr<arrow::io::OutputStream> inner_;
    };

    class BrokenWriteFileSystem : public StagingFileSystem
    {
    public:
        std::shared_ptr<arrow::io::OutputStream> create(const std::string &location) const override
        {
            return std::make_shared<BrokenWriteStream>(StagingFileSystem::create(location));
        }
    };
}

class BulkLoadWriterTest : public ::testing::Test
{
protected:
    BulkLoadWriterTest() : warehouse(fs), options(test_options(dir.str()))
    {
        warehouse.add_dataset("test-project", "sales");
        config.table = TableReference{"", "sales", "orders"};
        config.schema = order_schema();
    }

    // Four rows per worker shard; four shards with the default options
    static constexpr size_t NUM_ROWS = 16;

    const TableReference destination{"test-project", "sales", "orders"};

    TempDir dir;
    StagingFileSystem fs;
    FakeWarehouse warehouse;
    PipelineOptions options;
    WriteConfig config;
};

TEST_F(BulkLoadWriterTest, SinglePartitionLoadsStraightIntoTheDestination)
{
    config.write_disposition = WriteDisposition::WriteAppend;
    config.table_description = "Orders of the day";
    const auto rows = order_rows(NUM_ROWS);

    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    auto result = writer.write(rows);

    EXPECT_EQ(result.destination, destination);
    EXPECT_EQ(result.rows_written, NUM_ROWS);
    EXPECT_EQ(result.partition_count, 1u);
    EXPECT_TRUE(result.temp_tables.empty());
    EXPECT_FALSE(result.copy_run.has_value());

    auto loads = warehouse.load_configs();
    ASSERT_EQ(loads.size(), 1u);
    EXPECT_EQ(loads[0].destination, destination);
    EXPECT_EQ(loads[0].write_disposition, WriteDisposition::WriteAppend);
    EXPECT_EQ(loads[0].create_disposition, CreateDisposition::CreateIfNeeded);
    EXPECT_EQ(loads[0].source_uris.size(), result.staged_files.size());
    EXPECT_TRUE(warehouse.copy_configs().empty());

    auto jobs = warehouse.submitted_jobs();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].job_id, writer.identity().job_id_token + "_00001-0");
    EXPECT_EQ(jobs[0].project_id, "test-project");

    EXPECT_EQ(sorted(warehouse.rows(destination)), sorted(rows));
    EXPECT_EQ(warehouse.description(destination), "Orders of the day");

    // Staged files are gone once the load succeeded
    EXPECT_EQ(dir.file_count(), 0u);
}

TEST_F(BulkLoadWriterTest, StagedFilesLiveUnderTheStepDirectory)
{
    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    auto result = writer.write(order_rows(NUM_ROWS));

    EXPECT_EQ(writer.temp_file_prefix(),
              StagingFileSystem::join(StagingFileSystem::join(dir.str(), "BulkBridgeWriteTemp"),
                                      writer.identity().step_uuid));
    ASSERT_EQ(result.staged_files.size(), options.num_workers);
    int64_t total = 0;
    for (const auto &file : result.staged_files)
    {
        EXPECT_EQ(file.path.rfind(writer.temp_file_prefix(), 0), 0u) << file.path;
        total += file.byte_count;
    }
    EXPECT_GT(total, 0);
}

TEST_F(BulkLoadWriterTest, SeveralPartitionsCommitThroughOneCopy)
{
    config.table_description = "Committed in one copy";
    const auto rows = order_rows(NUM_ROWS);

    BulkLoadWriter writer(warehouse, warehouse, fs, options, config, PartitionPolicy{1, 1LL << 40});
    auto result = writer.write(rows);

    const std::string token = writer.identity().job_id_token;
    ASSERT_EQ(result.partition_count, 4u);
    ASSERT_EQ(result.temp_tables.size(), 4u);
    for (size_t i = 0; i < result.temp_tables.size(); ++i)
    {
        char suffix[8];
        std::snprintf(suffix, sizeof(suffix), "_%05zu", i + 1);
        EXPECT_EQ(result.temp_tables[i], (TableReference{"test-project", "sales", token + suffix}));
    }

    // Every partition load goes to its own temp table with fixed dispositions
    auto loads = warehouse.load_configs();
    ASSERT_EQ(loads.size(), 4u);
    for (const auto &load : loads)
    {
        EXPECT_NE(load.destination, destination);
        EXPECT_EQ(load.write_disposition, WriteDisposition::WriteEmpty);
        EXPECT_EQ(load.create_disposition, CreateDisposition::CreateIfNeeded);
        EXPECT_EQ(load.source_uris.size(), 1u);
    }

    auto copies = warehouse.copy_configs();
    ASSERT_EQ(copies.size(), 1u);
    EXPECT_EQ(copies[0].sources, result.temp_tables);
    EXPECT_EQ(copies[0].destination, destination);
    EXPECT_EQ(copies[0].write_disposition, config.write_disposition);
    ASSERT_TRUE(result.copy_run.has_value());
    EXPECT_EQ(result.copy_run->job.reference.job_id, token + "-0");

    EXPECT_EQ(sorted(warehouse.rows(destination)), sorted(rows));
    EXPECT_EQ(warehouse.description(destination), "Committed in one copy");

    for (const auto &temp : result.temp_tables)
        EXPECT_FALSE(warehouse.has_table(temp)) << to_table_spec(temp);
    EXPECT_EQ(warehouse.deleted_tables().size(), 4u);
    EXPECT_EQ(dir.file_count(), 0u);
}

TEST_F(BulkLoadWriterTest, FailedPartitionLeavesTheDestinationUntouched)
{
    BulkLoadWriter writer(warehouse, warehouse, fs, options, config, PartitionPolicy{1, 1LL << 40});
    const std::string prefix = writer.identity().job_id_token + "_00002";
    for (int i = 0; i < 3; ++i)
        warehouse.fail_job(prefix + "-" + std::to_string(i));

    try
    {
        (void)writer.write(order_rows(NUM_ROWS));
        FAIL() << "expected JobFailedError";
    }
    catch (const JobFailedError &e)
    {
        EXPECT_NE(std::string(e.what()).find(prefix), std::string::npos);
    }

    EXPECT_TRUE(warehouse.copy_configs().empty());
    EXPECT_FALSE(warehouse.has_table(destination));

    // The partitions that did load keep their temp tables for inspection
    const std::string token = writer.identity().job_id_token;
    EXPECT_TRUE(warehouse.has_table(TableReference{"test-project", "sales", token + "_00001"}));
    EXPECT_FALSE(warehouse.has_table(TableReference{"test-project", "sales", token + "_00002"}));
    EXPECT_TRUE(warehouse.deleted_tables().empty());

    // Staged files are removed whether their load succeeded or not
    EXPECT_EQ(dir.file_count(), 0u);
}

TEST_F(BulkLoadWriterTest, RetriedPartitionStillCommits)
{
    BulkLoadWriter writer(warehouse, warehouse, fs, options, config, PartitionPolicy{1, 1LL << 40});
    warehouse.fail_job(writer.identity().job_id_token + "_00003-0");

    auto result = writer.write(order_rows(NUM_ROWS));

    ASSERT_EQ(result.load_runs.size(), 4u);
    EXPECT_EQ(result.load_runs[2].attempts.size(), 2u);
    EXPECT_EQ(result.load_runs[2].job.reference.job_id, writer.identity().job_id_token + "_00003-1");
    EXPECT_EQ(warehouse.rows(destination).size(), NUM_ROWS);
}

TEST_F(BulkLoadWriterTest, RetriedDirectLoadWritesTheRowsOnce)
{
    const auto rows = order_rows(NUM_ROWS);
    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    const std::string prefix = writer.identity().job_id_token + "_00001";
    warehouse.fail_job(prefix + "-0");

    auto result = writer.write(rows);

    EXPECT_EQ(result.partition_count, 1u);
    EXPECT_FALSE(result.copy_run.has_value());
    ASSERT_EQ(result.load_runs.size(), 1u);
    ASSERT_EQ(result.load_runs[0].attempts.size(), 2u);
    EXPECT_EQ(result.load_runs[0].attempts[0].reference.job_id, prefix + "-0");
    EXPECT_EQ(result.load_runs[0].attempts[0].status, JobStatus::Failed);
    EXPECT_EQ(result.load_runs[0].job.reference.job_id, prefix + "-1");

    auto jobs = warehouse.submitted_jobs();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[1].job_id, prefix + "-1");
    EXPECT_EQ(sorted(warehouse.rows(destination)), sorted(rows));
    EXPECT_EQ(dir.file_count(), 0u);
}

TEST_F(BulkLoadWriterTest, LargeLoadWithDefaultsCreatesTheTable)
{
    constexpr size_t LARGE = 25'000;
    const auto rows = order_rows(LARGE);
    ASSERT_FALSE(warehouse.has_table(destination));

    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    auto result = writer.write(rows);

    EXPECT_EQ(result.rows_written, LARGE);
    EXPECT_EQ(result.partition_count, 1u);

    auto loads = warehouse.load_configs();
    ASSERT_EQ(loads.size(), 1u);
    EXPECT_EQ(loads[0].write_disposition, WriteDisposition::WriteEmpty);
    EXPECT_EQ(loads[0].create_disposition, CreateDisposition::CreateIfNeeded);

    ASSERT_TRUE(warehouse.has_table(destination));
    EXPECT_EQ(warehouse.rows(destination).size(), LARGE);
    auto table = warehouse.get_table(destination);
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->schema.column_names(), order_schema().column_names());
}

TEST_F(BulkLoadWriterTest, FailedStagingLeavesNoPartialFiles)
{
    BrokenWriteFileSystem broken;
    BulkLoadWriter writer(warehouse, warehouse, broken, options, config);

    try
    {
        (void)writer.write(order_rows(NUM_ROWS));
        FAIL() << "write() should have thrown";
    }
    catch (const StagingError &e)
    {
        EXPECT_NE(std::string(e.what()).find("device unplugged"), std::string::npos) << e.what();
    }

    EXPECT_TRUE(warehouse.submitted_jobs().empty());
    EXPECT_FALSE(warehouse.has_table(destination));
    EXPECT_EQ(dir.file_count(), 0u);
}

TEST_F(BulkLoadWriterTest, EmptyInputStillCreatesTheTable)
{
    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    auto result = writer.write({});

    EXPECT_EQ(result.rows_written, 0u);
    EXPECT_TRUE(result.staged_files.empty());
    EXPECT_EQ(result.partition_count, 1u);

    // One synthesized empty file is loaded
    auto loads = warehouse.load_configs();
    ASSERT_EQ(loads.size(), 1u);
    ASSERT_EQ(loads[0].source_uris.size(), 1u);
    EXPECT_EQ(dir.file_count(), 0u);

    EXPECT_TRUE(warehouse.has_table(destination));
    EXPECT_TRUE(warehouse.rows(destination).empty());
}

TEST_F(BulkLoadWriterTest, WriteEmptyRefusesANonEmptyDestination)
{
    warehouse.add_table(destination, order_schema(), order_rows(1));

    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    try
    {
        (void)writer.write(order_rows(NUM_ROWS));
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError &e)
    {
        EXPECT_EQ(std::string(e.what()), "Warehouse table is not empty: test-project:sales.orders.");
    }
    EXPECT_TRUE(warehouse.submitted_jobs().empty());
    EXPECT_EQ(warehouse.rows(destination).size(), 1u);
}

TEST_F(BulkLoadWriterTest, WriteTruncateReplacesExistingRows)
{
    warehouse.add_table(destination, order_schema(), order_rows(3));
    config.write_disposition = WriteDisposition::WriteTruncate;

    const auto rows = order_rows(NUM_ROWS);
    BulkLoadWriter writer(warehouse, warehouse, fs, options, config, PartitionPolicy{1, 1LL << 40});
    (void)writer.write(rows);

    EXPECT_EQ(sorted(warehouse.rows(destination)), sorted(rows));
}

TEST_F(BulkLoadWriterTest, MissingDatasetFailsValidation)
{
    config.table = TableReference{"", "no_such_dataset", "orders"};
    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    EXPECT_THROW((void)writer.write(order_rows(2)), ValidationError);
    EXPECT_TRUE(warehouse.submitted_jobs().empty());
}

TEST_F(BulkLoadWriterTest, CreateNeverWithoutSchemaUsesTheExistingTable)
{
    warehouse.add_table(destination, order_schema(), order_rows(2));
    config.schema.reset();
    config.create_disposition = CreateDisposition::CreateNever;
    config.write_disposition = WriteDisposition::WriteAppend;

    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    (void)writer.write(order_rows(NUM_ROWS));

    EXPECT_EQ(warehouse.rows(destination).size(), NUM_ROWS + 2);
}

TEST_F(BulkLoadWriterTest, InvalidRowsAreRejectedOrDropped)
{
    auto rows = order_rows(4);
    rows.push_back(TableRow{{"customer", std::string("no id")}});

    {
        BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
        EXPECT_THROW((void)writer.write(rows), ValidationError);
        EXPECT_TRUE(warehouse.submitted_jobs().empty());
    }

    config.invalid_rows = InvalidRowPolicy::Drop;
    BulkLoadWriter writer(warehouse, warehouse, fs, options, config);
    auto result = writer.write(rows);
    EXPECT_EQ(result.rows_written, 4u);
    EXPECT_EQ(warehouse.rows(destination).size(), 4u);
}

TEST_F(BulkLoadWriterTest, UnusableConfigurationsFailAtConstruction)
{
    {
        WriteConfig no_table = config;
        no_table.table.reset();
        EXPECT_THROW((void)BulkLoadWriter(warehouse, warehouse, fs, options, no_table), ConfigurationError);
    }
    {
        WriteConfig dynamic = config;
        dynamic.table.reset();
        dynamic.table_function = [](const BoundedWindow &)
        { return TableReference{"", "sales", "by_window"}; };
        EXPECT_THROW((void)BulkLoadWriter(warehouse, warehouse, fs, options, dynamic), ConfigurationError);
    }
    {
        WriteConfig no_schema = config;
        no_schema.schema.reset();
        try
        {
            BulkLoadWriter writer(warehouse, warehouse, fs, options, no_schema);
            FAIL() << "expected ConfigurationError";
        }
        catch (const ConfigurationError &e)
        {
            EXPECT_EQ(std::string(e.what()), "CreateDisposition is CREATE_IF_NEEDED, however no schema was provided.");
        }
    }
    {
        PipelineOptions no_temp = options;
        no_temp.temp_location.clear();
        EXPECT_THROW((void)BulkLoadWriter(warehouse, warehouse, fs, no_temp, config), ConfigurationError);
    }
    {
        WriteConfig bad_schema = config;
        bad_schema.schema->fields.push_back({"order_id", FieldType::String});
        EXPECT_THROW((void)BulkLoadWriter(warehouse, warehouse, fs, options, bad_schema), ConfigurationError);
    }
}
