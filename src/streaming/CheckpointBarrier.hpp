#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "StreamingTypes.hpp"

namespace BulkBridge
{

    // =========================================================================
    // CheckpointBarrier — makes tagged rows durable before they are inserted
    // =========================================================================
    //
    // Tagging draws random ids. If a batch were retried after a failure and
    // re-tagged, the retry would carry new ids and the warehouse could not
    // deduplicate it. The barrier records the first tagged version of each
    // bundle; a replay of the same bundle gets the recorded rows back, ids
    // included.
    //
    // Delivery is at-least-once, so a bundle can also come back after it was
    // inserted. Completed bundles stay recorded until `retained_bundles`
    // newer ones have completed.
    //
    // group() is the shuffle half: rows grouped by ShardedKey.
    // =========================================================================
    class CheckpointBarrier
    {
    public:
        static constexpr size_t DEFAULT_RETAINED_BUNDLES = 1024;

        explicit CheckpointBarrier(size_t retained_bundles = DEFAULT_RETAINED_BUNDLES);

        // First commit of a bundle id wins; later commits return the recorded rows
        std::vector<TaggedRow> commit(const std::string &bundle_id, std::vector<TaggedRow> rows);

        bool contains(const std::string &bundle_id) const;
        size_t size() const;    // recorded bundles, pending or completed
        size_t pending() const; // recorded bundles not yet inserted

        // Marks a bundle as fully inserted; evicts the oldest completed
        // bundles beyond the retention limit
        void complete(const std::string &bundle_id);

        [[nodiscard]]
        static std::map<ShardedKey, std::vector<RowDedupRecord>> group(const std::vector<TaggedRow> &rows);

    private:
        struct Entry
        {
            std::vector<TaggedRow> rows;
            bool completed = false;
        };

        mutable std::mutex mutex_;
        size_t retained_bundles_;
        std::map<std::string, Entry> committed_;
        std::deque<std::string> completed_order_;
    };

} // namespace BulkBridge
