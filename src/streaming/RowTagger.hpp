#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include "../load/WriteConfig.hpp"
#include "StreamingTypes.hpp"

namespace BulkBridge
{

    struct ShardingPolicy
    {
        int num_shards = 50;
    };

    /**
     * @brief Assigns each row its unique id, shard and destination.
     *
     * start_batch() draws a fresh session token and restarts the sequence, so
     * ids are unique across batches and workers without coordination. Ids are
     * only stable once the tagged rows went through the CheckpointBarrier.
     * One tagger per worker thread.
     */
    class RowTagger
    {
    public:
        RowTagger(std::optional<TableReference> table,
                  TableFunction table_function,
                  std::string default_project,
                  ShardingPolicy policy = {});

        void start_batch();

        [[nodiscard]]
        TaggedRow tag(TableRow row, const BoundedWindow &window);

        // Destination of a window, project filled with the default one
        [[nodiscard]]
        TableReference table_for_window(const BoundedWindow &window) const;

        const std::string &session_token() const { return session_token_; }

    private:
        std::optional<TableReference> table_;
        TableFunction table_function_;
        std::string default_project_;
        ShardingPolicy policy_;

        std::mt19937 rng_;
        std::string session_token_;
        uint64_t sequence_ = 0;
    };

} // namespace BulkBridge
