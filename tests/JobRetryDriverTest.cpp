#include <gtest/gtest.h>

#include "../src/common/Errors.hpp"
#include "../src/jobs/JobRetryDriver.hpp"
#include "../src/storage/StagingFileSystem.hpp"
#include "FakeWarehouse.hpp"
#include "TestSupport.hpp"

using namespace BulkBridge;

class JobRetryDriverTest : public ::testing::Test
{
protected:
    JobRetryDriverTest() : warehouse(fs)
    {
        warehouse.add_table(TableReference{"proj-a", "ds", "src"}, order_schema(), order_rows(3));
    }

    // A copy job that always succeeds unless scripted to fail
    JobRetryDriver::SubmitFn copy_submitter(const std::string &table_id)
    {
        return [this, table_id](const JobReference &ref)
        {
            CopyJobConfig copy;
            copy.sources = {TableReference{"proj-a", "ds", "src"}};
            copy.destination = TableReference{"proj-a", "ds", table_id};
            copy.write_disposition = WriteDisposition::WriteAppend;
            warehouse.submit_copy(ref, copy);
        };
    }

    StagingFileSystem fs;
    FakeWarehouse warehouse;
};

TEST_F(JobRetryDriverTest, FirstAttemptSucceeds)
{
    JobRetryDriver driver(warehouse, "proj-a");
    int successes = 0;
    auto run = driver.run_job("copy", "prefix", copy_submitter("dst"), [&](const Job &)
                              { ++successes; });

    EXPECT_EQ(successes, 1);
    ASSERT_EQ(run.attempts.size(), 1u);
    EXPECT_EQ(run.attempts[0].reference.job_id, "prefix-0");
    EXPECT_EQ(run.attempts[0].status, JobStatus::Succeeded);
    EXPECT_EQ(run.job.reference.job_id, "prefix-0");
}

TEST_F(JobRetryDriverTest, FailedAttemptIsRetriedUnderAFreshId)
{
    warehouse.fail_job("prefix-0");

    JobRetryDriver driver(warehouse, "proj-a");
    int successes = 0;
    auto run = driver.run_job("copy", "prefix", copy_submitter("dst"), [&](const Job &job)
                              {
        ++successes;
        EXPECT_EQ(job.reference.job_id, "prefix-1"); });

    EXPECT_EQ(successes, 1);
    ASSERT_EQ(run.attempts.size(), 2u);
    EXPECT_EQ(run.attempts[0].reference.job_id, "prefix-0");
    EXPECT_EQ(run.attempts[0].status, JobStatus::Failed);
    EXPECT_EQ(run.attempts[1].reference.job_id, "prefix-1");
    EXPECT_EQ(run.attempts[1].status, JobStatus::Succeeded);
    EXPECT_EQ(warehouse.rows(TableReference{"proj-a", "ds", "dst"}).size(), 3u);
}

TEST_F(JobRetryDriverTest, GivesUpAfterMaxRetries)
{
    for (int i = 0; i < 3; ++i)
        warehouse.fail_job("prefix-" + std::to_string(i), "rateLimitExceeded");

    JobRetryDriver driver(warehouse, "proj-a");
    bool succeeded = false;
    try
    {
        (void)driver.run_job("copy", "prefix", copy_submitter("dst"), [&](const Job &)
                             { succeeded = true; });
        FAIL() << "expected JobFailedError";
    }
    catch (const JobFailedError &e)
    {
        const std::string message = e.what();
        EXPECT_NE(message.find("reached max retries: 3"), std::string::npos);
        EXPECT_NE(message.find("prefix"), std::string::npos);
        EXPECT_NE(e.last_job().find("prefix-2"), std::string::npos);
        EXPECT_NE(e.last_job().find("rateLimitExceeded"), std::string::npos);
    }

    EXPECT_FALSE(succeeded);
    EXPECT_EQ(warehouse.submitted_jobs().size(), 3u);
    EXPECT_FALSE(warehouse.has_table(TableReference{"proj-a", "ds", "dst"}));
}

TEST_F(JobRetryDriverTest, SingleAttemptPolicyDoesNotRetry)
{
    warehouse.fail_job("prefix-0");

    JobRetryDriver driver(warehouse, "proj-a", JobRetryPolicy{1, 5});
    EXPECT_THROW((void)driver.run_job("copy", "prefix", copy_submitter("dst")), JobFailedError);
    EXPECT_EQ(warehouse.submitted_jobs().size(), 1u);
}

TEST_F(JobRetryDriverTest, UnknownStatusIsNeverRetried)
{
    warehouse.lose_job("prefix-0");

    JobRetryDriver driver(warehouse, "proj-a");
    try
    {
        (void)driver.run_job("copy", "prefix", copy_submitter("dst"));
        FAIL() << "expected JobStatusUnknownError";
    }
    catch (const JobStatusUnknownError &e)
    {
        EXPECT_NE(std::string(e.what()).find("UNKNOWN status of copy job [prefix-0]"), std::string::npos);
    }
    EXPECT_EQ(warehouse.submitted_jobs().size(), 1u);
}

TEST_F(JobRetryDriverTest, SubmissionErrorPropagates)
{
    JobRetryDriver driver(warehouse, "proj-a");
    auto submit = copy_submitter("dst");
    (void)driver.run_job("copy", "dup", submit);

    // Same prefix again: "dup-0" already exists in the job service
    EXPECT_THROW((void)driver.run_job("copy", "dup", submit), WarehouseError);
}

TEST(JobStatusTest, ParseStatus)
{
    EXPECT_EQ(parse_status(std::nullopt), JobStatus::Unknown);

    Job ok;
    EXPECT_EQ(parse_status(ok), JobStatus::Succeeded);

    Job with_error_result;
    with_error_result.error_result = JobError{"backendError", "boom"};
    EXPECT_EQ(parse_status(with_error_result), JobStatus::Failed);

    Job with_errors;
    with_errors.errors.push_back(JobError{"invalid", "bad row"});
    EXPECT_EQ(parse_status(with_errors), JobStatus::Failed);
}
