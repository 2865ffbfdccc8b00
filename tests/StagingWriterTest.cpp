#include <gtest/gtest.h>

#include <arrow/io/interfaces.h>

#include "../src/common/ArrowStatus.hpp"
#include "../src/common/Errors.hpp"
#include "../src/staging/StagingWriter.hpp"
#include "../src/storage/StagingFileSystem.hpp"
#include "TestSupport.hpp"

using namespace BulkBridge;

namespace
{
    // Accepts nothing: every Write fails with the given message
    class FailingStream : public arrow::io::OutputStream
    {
    public:
        explicit FailingStream(std::string message) : message_(std::move(message)) {}

        arrow::Status Write(const void *, int64_t) override { return arrow::Status::IOError(message_); }
        arrow::Status Close() override
        {
            closed_ = true;
            ++close_calls;
            return arrow::Status::OK();
        }
        arrow::Result<int64_t> Tell() const override { return 0; }
        bool closed() const override { return closed_; }

        int close_calls = 0;

    private:
        std::string message_;
        bool closed_ = false;
    };

    class FailingFileSystem : public StagingFileSystem
    {
    public:
        std::shared_ptr<arrow::io::OutputStream> create(const std::string &) const override
        {
            last_stream = std::make_shared<FailingStream>("disk quota exceeded");
            return last_stream;
        }

        mutable std::shared_ptr<FailingStream> last_stream;
    };
}

class StagingWriterTest : public ::testing::Test
{
protected:
    TempDir dir;
    StagingFileSystem fs;
};

TEST_F(StagingWriterTest, ByteCountIsExactlyWhatWasWritten)
{
    const auto schema = order_schema();
    const auto rows = order_rows(25);
    RowCsvCodec codec(schema);

    std::string expected;
    for (const auto &row : rows)
        codec.encode_to(row, expected);

    StagingWriter writer(fs, dir.str(), schema);
    writer.open("shard-0");
    for (const auto &row : rows)
        writer.write(row);
    StagedFile file = writer.close();

    EXPECT_EQ(file.path, StagingFileSystem::join(dir.str(), "shard-0"));
    EXPECT_EQ(file.byte_count, static_cast<int64_t>(expected.size()));
    EXPECT_EQ(fs.size(file.path), file.byte_count);
    EXPECT_EQ(fs.read_all(file.path), expected);
    EXPECT_FALSE(writer.is_open());
}

TEST_F(StagingWriterTest, ClosingWithoutRowsLeavesAnEmptyFile)
{
    StagingWriter writer(fs, dir.str(), order_schema());
    writer.open("empty");
    StagedFile file = writer.close();

    EXPECT_EQ(file.byte_count, 0);
    EXPECT_TRUE(fs.exists(file.path));
    EXPECT_EQ(fs.size(file.path), 0);
}

TEST_F(StagingWriterTest, CreatesMissingParentDirectories)
{
    StagingWriter writer(fs, StagingFileSystem::join(dir.str(), "a/b/c"), order_schema());
    writer.open("f");
    writer.write(order_rows(1).front());
    StagedFile file = writer.close();
    EXPECT_TRUE(fs.exists(file.path));
}

TEST_F(StagingWriterTest, MisuseThrows)
{
    StagingWriter writer(fs, dir.str(), order_schema());
    EXPECT_THROW(writer.write(TableRow{}), StagingError);
    EXPECT_THROW((void)writer.close(), StagingError);

    writer.open("x");
    EXPECT_THROW(writer.open("y"), StagingError);
    (void)writer.close();
}

TEST_F(StagingWriterTest, FailedWriteClosesTheStreamAndRethrows)
{
    FailingFileSystem failing;
    StagingWriter writer(failing, dir.str(), order_schema());
    writer.open("doomed");
    ASSERT_TRUE(writer.is_open());

    // Large enough to force a flush on the first write
    TableRow row = order_rows(1).front();
    row.set("customer", std::string(StagingWriter::FLUSH_THRESHOLD, 'x'));

    try
    {
        writer.write(row);
        FAIL() << "write() should have thrown";
    }
    catch (const StagingError &e)
    {
        EXPECT_NE(std::string(e.what()).find("IOError: disk quota exceeded"), std::string::npos) << e.what();
    }

    EXPECT_FALSE(writer.is_open());
    ASSERT_NE(failing.last_stream, nullptr);
    EXPECT_TRUE(failing.last_stream->closed());
    EXPECT_EQ(failing.last_stream->close_calls, 1);
    EXPECT_THROW(writer.write(row), StagingError);
}

TEST_F(StagingWriterTest, WritersCanBeReopenedForANewFile)
{
    StagingWriter writer(fs, dir.str(), order_schema());
    writer.open("first");
    writer.write(order_rows(3)[1]);
    auto first = writer.close();

    writer.open("second");
    auto second = writer.close();

    EXPECT_GT(first.byte_count, 0);
    EXPECT_EQ(second.byte_count, 0);
    EXPECT_NE(first.path, second.path);
}

// ----------------------------------------------------------------------------

TEST(StagingFileSystemTest, JoinDoesNotDoubleSeparators)
{
    EXPECT_EQ(StagingFileSystem::join("/tmp/base/", "/file"), "/tmp/base/file");
    EXPECT_EQ(StagingFileSystem::join("/tmp/base", "file"), "/tmp/base/file");
    EXPECT_EQ(StagingFileSystem::join("s3://bucket", "x/y"), "s3://bucket/x/y");
}

TEST(StagingFileSystemTest, WildcardMatch)
{
    EXPECT_TRUE(wildcard_match("*.parquet", "000000000000.parquet"));
    EXPECT_TRUE(wildcard_match("*", ""));
    EXPECT_TRUE(wildcard_match("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(wildcard_match("*.parquet", "file.csv"));
    EXPECT_FALSE(wildcard_match("abc", "abcd"));
}

TEST(StagingFileSystemTest, MatchListsSortedFilesAndToleratesMissingDirectory)
{
    TempDir dir;
    StagingFileSystem fs;

    for (const char *name : {"b.parquet", "a.parquet", "notes.txt"})
        BULKBRIDGE_THROW_IF_NOT_OK(fs.create(StagingFileSystem::join(dir.str(), name))->Close());

    auto matched = fs.match(StagingFileSystem::join(dir.str(), "*.parquet"));
    ASSERT_EQ(matched.size(), 2u);
    EXPECT_EQ(matched[0], StagingFileSystem::join(dir.str(), "a.parquet"));
    EXPECT_EQ(matched[1], StagingFileSystem::join(dir.str(), "b.parquet"));

    EXPECT_TRUE(fs.match(StagingFileSystem::join(dir.str(), "missing/*")).empty());
}

TEST(StagingFileSystemTest, RemoveQuietlyCountsOnlyRemovedFiles)
{
    TempDir dir;
    StagingFileSystem fs;
    const auto present = StagingFileSystem::join(dir.str(), "present");
    BULKBRIDGE_THROW_IF_NOT_OK(fs.create(present)->Close());

    EXPECT_EQ(fs.remove_quietly({present, StagingFileSystem::join(dir.str(), "absent")}), 1u);
    EXPECT_FALSE(fs.exists(present));
    EXPECT_FALSE(fs.remove(present));
}
