#include <gtest/gtest.h>

#include <map>
#include <random>

#include "../src/common/Errors.hpp"
#include "../src/partition/Partitioner.hpp"

using namespace BulkBridge;

namespace
{
    std::vector<StagedFile> files_of_sizes(const std::vector<int64_t> &sizes)
    {
        std::vector<StagedFile> files;
        for (size_t i = 0; i < sizes.size(); ++i)
            files.push_back(StagedFile{"f" + std::to_string(i), sizes[i]});
        return files;
    }
}

TEST(PartitionerTest, FileCountLimitClosesPartitions)
{
    Partitioner partitioner(PartitionPolicy{2, 1'000});
    auto partitions = partitioner.partition(files_of_sizes({1, 1, 1, 1, 1}));

    ASSERT_EQ(partitions.size(), 3u);
    EXPECT_EQ(partitions[0].files, (std::vector<std::string>{"f0", "f1"}));
    EXPECT_EQ(partitions[1].files, (std::vector<std::string>{"f2", "f3"}));
    EXPECT_EQ(partitions[2].files, (std::vector<std::string>{"f4"}));
}

TEST(PartitionerTest, ByteLimitClosesPartitions)
{
    Partitioner partitioner(PartitionPolicy{100, 10});
    auto partitions = partitioner.partition(files_of_sizes({4, 4, 4, 10, 1}));

    ASSERT_EQ(partitions.size(), 4u);
    EXPECT_EQ(partitions[0].byte_count, 8);
    EXPECT_EQ(partitions[1].byte_count, 4);
    EXPECT_EQ(partitions[2].files, (std::vector<std::string>{"f3"}));
    EXPECT_EQ(partitions[3].files, (std::vector<std::string>{"f4"}));
}

TEST(PartitionerTest, OversizedFileGetsItsOwnPartition)
{
    Partitioner partitioner(PartitionPolicy{100, 10});
    auto partitions = partitioner.partition(files_of_sizes({3, 50, 3}));

    ASSERT_EQ(partitions.size(), 3u);
    EXPECT_EQ(partitions[1].files, (std::vector<std::string>{"f1"}));
    EXPECT_EQ(partitions[1].byte_count, 50);
}

TEST(PartitionerTest, RandomInputsAreCoveredExactlyOnceWithinLimits)
{
    std::mt19937 rng(20240301);
    for (int round = 0; round < 200; ++round)
    {
        const size_t max_files = std::uniform_int_distribution<size_t>(1, 8)(rng);
        const int64_t max_bytes = std::uniform_int_distribution<int64_t>(1, 100)(rng);
        const size_t count = std::uniform_int_distribution<size_t>(0, 60)(rng);

        // Mostly small files, now and then one past the byte limit
        std::vector<int64_t> sizes;
        for (size_t i = 0; i < count; ++i)
        {
            const bool oversized = std::uniform_int_distribution<int>(0, 9)(rng) == 0;
            sizes.push_back(oversized ? max_bytes + std::uniform_int_distribution<int64_t>(1, 50)(rng)
                                      : std::uniform_int_distribution<int64_t>(0, max_bytes)(rng));
        }
        const auto files = files_of_sizes(sizes);

        auto partitions = Partitioner(PartitionPolicy{max_files, max_bytes}).partition(files);

        std::map<std::string, int> seen;
        std::vector<std::string> in_order;
        for (size_t p = 0; p < partitions.size(); ++p)
        {
            const auto &partition = partitions[p];
            SCOPED_TRACE("round " + std::to_string(round) + ", partition " + std::to_string(p));
            EXPECT_EQ(partition.id, static_cast<int64_t>(p + 1));
            EXPECT_FALSE(partition.files.empty());
            EXPECT_LE(partition.files.size(), max_files);
            if (partition.files.size() > 1)
                EXPECT_LE(partition.byte_count, max_bytes);

            for (const auto &name : partition.files)
            {
                ++seen[name];
                in_order.push_back(name);
            }
        }

        ASSERT_EQ(in_order.size(), files.size()) << "round " << round;
        for (size_t i = 0; i < files.size(); ++i)
        {
            EXPECT_EQ(in_order[i], files[i].path);
            EXPECT_EQ(seen[files[i].path], 1);
        }
    }
}

TEST(PartitionerTest, IdsAreOneBasedAndDense)
{
    Partitioner partitioner(PartitionPolicy{1, 1'000});
    auto partitions = partitioner.partition(files_of_sizes({1, 2, 3, 4}));

    ASSERT_EQ(partitions.size(), 4u);
    for (size_t i = 0; i < partitions.size(); ++i)
        EXPECT_EQ(partitions[i].id, static_cast<int64_t>(i + 1));
}

TEST(PartitionerTest, PartitioningIsDeterministic)
{
    Partitioner partitioner(PartitionPolicy{3, 20});
    const auto files = files_of_sizes({5, 9, 2, 7, 7, 1, 15, 3});
    EXPECT_EQ(partitioner.partition(files), partitioner.partition(files));
}

TEST(PartitionerTest, SinglePartitionIsADirectWrite)
{
    Partitioner partitioner;
    auto plan = partitioner.plan(files_of_sizes({10, 20, 30}), nullptr);

    ASSERT_TRUE(std::holds_alternative<DirectWrite>(plan));
    const auto &direct = std::get<DirectWrite>(plan);
    EXPECT_EQ(direct.partition.id, 1);
    EXPECT_EQ(direct.partition.files.size(), 3u);
    EXPECT_EQ(direct.partition.byte_count, 60);
}

TEST(PartitionerTest, SeveralPartitionsAreAStagedWrite)
{
    Partitioner partitioner(PartitionPolicy{1, 1'000});
    auto plan = partitioner.plan(files_of_sizes({1, 1}), nullptr);

    ASSERT_TRUE(std::holds_alternative<StagedWrite>(plan));
    EXPECT_EQ(std::get<StagedWrite>(plan).partitions.size(), 2u);
}

TEST(PartitionerTest, NoFilesSynthesizesOneEmptyFile)
{
    Partitioner partitioner;
    int calls = 0;
    auto plan = partitioner.plan({}, [&]()
                                 {
        ++calls;
        return StagedFile{"empty-file", 0}; });

    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(std::holds_alternative<DirectWrite>(plan));
    EXPECT_EQ(std::get<DirectWrite>(plan).partition.files, (std::vector<std::string>{"empty-file"}));
}

TEST(PartitionerTest, NoFilesAndNoFactoryThrows)
{
    Partitioner partitioner;
    EXPECT_THROW((void)partitioner.plan({}, nullptr), StagingError);
}
