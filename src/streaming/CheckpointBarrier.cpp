#include "CheckpointBarrier.hpp"
#include <iostream>

namespace BulkBridge
{

    CheckpointBarrier::CheckpointBarrier(size_t retained_bundles)
        : retained_bundles_(retained_bundles)
    {
    }

    std::vector<TaggedRow> CheckpointBarrier::commit(const std::string &bundle_id, std::vector<TaggedRow> rows)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = committed_.try_emplace(bundle_id, Entry{std::move(rows), false});
        if (!inserted)
        {
            std::cout << "[STREAMING] Bundle " << bundle_id << " replayed"
                      << (it->second.completed ? " after completion" : "") << "; reusing "
                      << it->second.rows.size() << " checkpointed rows\n";
        }
        return it->second.rows;
    }

    bool CheckpointBarrier::contains(const std::string &bundle_id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return committed_.count(bundle_id) != 0;
    }

    size_t CheckpointBarrier::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return committed_.size();
    }

    size_t CheckpointBarrier::pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return committed_.size() - completed_order_.size();
    }

    void CheckpointBarrier::complete(const std::string &bundle_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = committed_.find(bundle_id);
        if (it == committed_.end() || it->second.completed)
            return;

        it->second.completed = true;
        completed_order_.push_back(bundle_id);

        while (completed_order_.size() > retained_bundles_)
        {
            committed_.erase(completed_order_.front());
            completed_order_.pop_front();
        }
    }

    std::map<ShardedKey, std::vector<RowDedupRecord>> CheckpointBarrier::group(const std::vector<TaggedRow> &rows)
    {
        std::map<ShardedKey, std::vector<RowDedupRecord>> groups;
        for (const auto &row : rows)
            groups[row.key].push_back(row.record);
        return groups;
    }

} // namespace BulkBridge
