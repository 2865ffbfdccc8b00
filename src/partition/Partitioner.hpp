#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>
#include "../staging/StagingWriter.hpp"

namespace BulkBridge
{

    // Limits of one load job
    struct PartitionPolicy
    {
        size_t max_num_files = 10'000;
        int64_t max_size_bytes = 11LL * (1LL << 40); // 11 TiB
    };

    // Files loaded by one load job. Ids are 1-based and dense.
    struct Partition
    {
        int64_t id = 0;
        std::vector<std::string> files;
        int64_t byte_count = 0;

        bool operator==(const Partition &) const = default;
    };

    // Everything fits one load job: load straight into the destination
    struct DirectWrite
    {
        Partition partition;
    };

    // Load each partition into its own temp table, then copy them all at once
    struct StagedWrite
    {
        std::vector<Partition> partitions;
    };

    using WritePlan = std::variant<DirectWrite, StagedWrite>;

    // =========================================================================
    // Partitioner — deterministic greedy bin packing in input order
    // =========================================================================
    // A partition is closed only when it is non-empty and the next file would
    // push it past max_num_files or max_size_bytes. A file larger than
    // max_size_bytes therefore ends up alone in its partition.
    // =========================================================================
    class Partitioner
    {
    public:
        using EmptyFileFactory = std::function<StagedFile()>;

        explicit Partitioner(PartitionPolicy policy = {}) : policy_(policy) {}

        [[nodiscard]]
        std::vector<Partition> partition(const std::vector<StagedFile> &files) const;

        /**
         * @brief Partitions and classifies the result.
         * With no files at all, `make_empty` is asked for one empty staged file
         * so that the load still runs and the destination is still created.
         */
        [[nodiscard]]
        WritePlan plan(std::vector<StagedFile> files, const EmptyFileFactory &make_empty) const;

        const PartitionPolicy &policy() const { return policy_; }

    private:
        PartitionPolicy policy_;
    };

} // namespace BulkBridge
