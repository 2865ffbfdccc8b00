#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>

#include "../src/common/Errors.hpp"
#include "../src/database/PostgresWarehouse.hpp"
#include "../src/load/BulkLoadWriter.hpp"
#include "../src/read/SnapshotReader.hpp"
#include "../src/storage/StagingFileSystem.hpp"
#include "TestSupport.hpp"

using namespace BulkBridge;

// ----------------------------------------------------------------------------
// Table reference rewriting (no database needed)
// ----------------------------------------------------------------------------

TEST(PostgresSqlTest, RewritesLegacyReferences)
{
    EXPECT_EQ(PostgresWarehouse::rewrite_table_references(
                  "SELECT count(*) FROM [my-proj:sales.orders] o JOIN [sales.items] i ON o.id = i.order_id", true),
              "SELECT count(*) FROM \"sales\".\"orders\" o JOIN \"sales\".\"items\" i ON o.id = i.order_id");
}

TEST(PostgresSqlTest, RewritesStandardReferences)
{
    EXPECT_EQ(PostgresWarehouse::rewrite_table_references("SELECT * FROM `my-proj.sales.orders`", false),
              "SELECT * FROM \"sales\".\"orders\"");
    EXPECT_EQ(PostgresWarehouse::rewrite_table_references("SELECT * FROM `sales.orders`", false),
              "SELECT * FROM \"sales\".\"orders\"");
}

TEST(PostgresSqlTest, LeavesOtherTextAlone)
{
    const std::string plain = "SELECT 1 AS one, '[not.a.table' AS s";
    EXPECT_EQ(PostgresWarehouse::rewrite_table_references(plain, true), plain);
    EXPECT_EQ(PostgresWarehouse::rewrite_table_references("SELECT * FROM sales.orders", false),
              "SELECT * FROM sales.orders");
}

// ----------------------------------------------------------------------------
// Against a live database: set BULKBRIDGE_TEST_PG_CONN to run
// ----------------------------------------------------------------------------

class PostgresWarehouseTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const char *conn = std::getenv("BULKBRIDGE_TEST_PG_CONN");
        if (!conn || !*conn)
            GTEST_SKIP() << "BULKBRIDGE_TEST_PG_CONN not set";

        warehouse = std::make_unique<PostgresWarehouse>(conn, fs, std::chrono::milliseconds(10), 4);
        warehouse->init_catalog();

        dataset = "bb_test_" + random_token().substr(0, 12);
        warehouse->create_dataset(options.project, dataset, "local", "unit test dataset");
        orders = TableReference{options.project, dataset, "orders"};
    }

    void TearDown() override
    {
        if (warehouse && warehouse->get_dataset(options.project, dataset))
            warehouse->delete_dataset(options.project, dataset);
    }

    TempDir dir;
    StagingFileSystem fs;
    PipelineOptions options = test_options(dir.str());
    std::unique_ptr<PostgresWarehouse> warehouse;
    std::string dataset;
    TableReference orders;
};

TEST_F(PostgresWarehouseTest, TableMetadataRoundTrip)
{
    Table table;
    table.reference = orders;
    table.schema = order_schema();
    table.description = "orders under test";
    warehouse->create_table(table);

    auto found = warehouse->get_table(orders);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->schema.column_names(), order_schema().column_names());
    EXPECT_EQ(found->schema.fields[0].mode, FieldMode::Required);
    EXPECT_EQ(found->schema.fields[4].type, FieldType::Timestamp);
    EXPECT_EQ(found->description, "orders under test");
    EXPECT_EQ(found->location, "local");
    EXPECT_TRUE(warehouse->is_table_empty(orders));

    warehouse->patch_table_description(orders, "patched");
    EXPECT_EQ(warehouse->get_table(orders)->description, "patched");

    warehouse->delete_table(orders);
    EXPECT_FALSE(warehouse->get_table(orders).has_value());
    EXPECT_FALSE(warehouse->get_table(TableReference{options.project, "no_such_dataset_xyz", "t"}).has_value());
}

TEST_F(PostgresWarehouseTest, LoadThenReadBackAsTableAndQuery)
{
    WriteConfig write;
    write.table = orders;
    write.schema = order_schema();

    BulkLoadWriter writer(*warehouse, *warehouse, fs, options, write, PartitionPolicy{2, 1LL << 40});
    auto loaded = writer.write(order_rows(30));
    EXPECT_EQ(loaded.partition_count, 2u);
    EXPECT_EQ(warehouse->get_table(orders)->num_rows, 30);

    ReadConfig table_read;
    table_read.table = orders;
    SnapshotReader table_reader(*warehouse, *warehouse, fs, options, table_read);
    std::atomic<int64_t> id_sum{0};
    auto read = table_reader.read_all([&](const TableRow &row)
                                      { id_sum += std::get<int64_t>(row.get("order_id")); });
    EXPECT_EQ(read.rows_read, 30u);
    EXPECT_EQ(read.files, 8u); // four rows per extracted file
    EXPECT_EQ(id_sum.load(), 435);

    ReadConfig query_read;
    query_read.query = "SELECT count(*) AS n FROM [" + to_table_spec(orders) + "] WHERE priority";
    SnapshotReader query_reader(*warehouse, *warehouse, fs, options, query_read);
    auto rows = query_reader.read_rows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(rows[0].get("n")), 15);

    EXPECT_EQ(dir.file_count(), 0u);
}

TEST_F(PostgresWarehouseTest, InsertAllDropsRepeatedIds)
{
    Table table;
    table.reference = orders;
    table.schema = order_schema();
    warehouse->create_table(table);

    const auto rows = order_rows(3);
    const std::vector<std::string> ids{"s0", "s1", "s2"};
    EXPECT_GT(warehouse->insert_all(orders, rows, ids), 0);
    (void)warehouse->insert_all(orders, rows, ids);

    EXPECT_EQ(warehouse->get_table(orders)->num_rows, 3);
}

TEST_F(PostgresWarehouseTest, JobIdsAreUnique)
{
    Table table;
    table.reference = orders;
    table.schema = order_schema();
    warehouse->create_table(table);

    const JobReference ref{options.project, "bb_test_copy_" + dataset + "-0"};
    CopyJobConfig copy;
    copy.sources = {orders};
    copy.destination = TableReference{options.project, dataset, "orders_copy"};
    warehouse->submit_copy(ref, copy);

    auto job = warehouse->poll_job(ref, 3, nullptr);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(parse_status(job), JobStatus::Succeeded);
    EXPECT_EQ(job->type, JobType::Copy);

    EXPECT_THROW(warehouse->submit_copy(ref, copy), WarehouseError);
    EXPECT_FALSE(warehouse->get_job(JobReference{options.project, "never-submitted-" + dataset}).has_value());
}

TEST_F(PostgresWarehouseTest, FailingJobIsRecordedAsFailed)
{
    const JobReference ref{options.project, "bb_test_load_" + dataset + "-0"};
    LoadJobConfig load;
    load.destination = TableReference{options.project, dataset, "never_created"};
    load.create_disposition = CreateDisposition::CreateNever;
    warehouse->submit_load(ref, load);

    auto job = warehouse->poll_job(ref, 3, nullptr);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(parse_status(job), JobStatus::Failed);
    ASSERT_TRUE(job->error_result.has_value());
    EXPECT_EQ(job->error_result->reason, "notFound");
}

TEST_F(PostgresWarehouseTest, DryRunReportsInvalidQueries)
{
    QueryJobConfig bad;
    bad.query = "SELECT no_such_column FROM [" + to_table_spec(orders) + "]";
    EXPECT_THROW((void)warehouse->dry_run_query(options.project, bad), WarehouseError);
}
