#include "Partitioner.hpp"
#include <iostream>
#include "../common/Errors.hpp"

namespace BulkBridge
{

    std::vector<Partition> Partitioner::partition(const std::vector<StagedFile> &files) const
    {
        std::vector<Partition> partitions;
        Partition current;
        current.id = 1;

        for (const auto &file : files)
        {
            const bool too_many = current.files.size() + 1 > policy_.max_num_files;
            const bool too_big = current.byte_count + file.byte_count > policy_.max_size_bytes;

            if (!current.files.empty() && (too_many || too_big))
            {
                const int64_t next_id = current.id + 1;
                partitions.push_back(std::move(current));
                current = Partition{};
                current.id = next_id;
            }

            current.files.push_back(file.path);
            current.byte_count += file.byte_count;
        }

        if (!current.files.empty())
            partitions.push_back(std::move(current));

        return partitions;
    }

    WritePlan Partitioner::plan(std::vector<StagedFile> files, const EmptyFileFactory &make_empty) const
    {
        if (files.empty())
        {
            if (!make_empty)
                throw StagingError("[PARTITION ERROR] No staged files and no way to create an empty one");
            files.push_back(make_empty());
            std::cout << "[PARTITION] No rows staged; synthesized empty file " << files.front().path << "\n";
        }

        auto partitions = partition(files);

        std::cout << "[PARTITION] " << files.size() << " files -> " << partitions.size()
                  << (partitions.size() == 1 ? " partition (direct write)\n" : " partitions (staged write)\n");

        if (partitions.size() == 1)
            return DirectWrite{std::move(partitions.front())};
        return StagedWrite{std::move(partitions)};
    }

} // namespace BulkBridge
