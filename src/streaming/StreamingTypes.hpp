#pragma once

#include <compare>
#include <string>
#include "../model/TableRow.hpp"

namespace BulkBridge
{

    // Destination table spec plus a random shard, so one hot table still
    // spreads over several insert workers
    struct ShardedKey
    {
        std::string key; // canonical table spec
        int shard = 0;   // [0, num_shards)

        auto operator<=>(const ShardedKey &) const = default;
    };

    // A row with the id the warehouse deduplicates on
    struct RowDedupRecord
    {
        TableRow row;
        std::string unique_id; // <session token><sequence number>

        bool operator==(const RowDedupRecord &) const = default;
    };

    struct TaggedRow
    {
        ShardedKey key;
        RowDedupRecord record;
    };

} // namespace BulkBridge
