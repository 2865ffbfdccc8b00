#include "RowTagger.hpp"

#include "../common/Errors.hpp"
#include "../util/RandomToken.hpp"

namespace BulkBridge
{

    RowTagger::RowTagger(std::optional<TableReference> table,
                         TableFunction table_function,
                         std::string default_project,
                         ShardingPolicy policy)
        : table_(std::move(table)),
          table_function_(std::move(table_function)),
          default_project_(std::move(default_project)),
          policy_(policy),
          rng_(std::random_device{}())
    {
        if (!table_ && !table_function_)
            throw ConfigurationError("RowTagger needs a table or a table function");
        if (policy_.num_shards < 1)
            throw ConfigurationError("num_shards must be at least 1");
        start_batch();
    }

    void RowTagger::start_batch()
    {
        session_token_ = random_token();
        sequence_ = 0;
    }

    TableReference RowTagger::table_for_window(const BoundedWindow &window) const
    {
        TableReference ref = table_ ? *table_ : table_function_(window);
        return ref.with_default_project(default_project_);
    }

    TaggedRow RowTagger::tag(TableRow row, const BoundedWindow &window)
    {
        std::uniform_int_distribution<int> shard(0, policy_.num_shards - 1);

        TaggedRow tagged;
        tagged.key = ShardedKey{to_table_spec(table_for_window(window)), shard(rng_)};
        tagged.record = RowDedupRecord{std::move(row), session_token_ + std::to_string(sequence_++)};
        return tagged;
    }

} // namespace BulkBridge
