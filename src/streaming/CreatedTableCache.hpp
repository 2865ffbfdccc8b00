#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "../model/Dispositions.hpp"
#include "../model/TableReference.hpp"
#include "../model/TableSchema.hpp"

namespace BulkBridge
{

    class TableClient;

    /**
     * @brief Process-wide set of table specs known to exist.
     *
     * ensure_table() is check-then-act: a short locked lookup skips tables
     * already seen; otherwise, under the lock, the cache is re-checked and the
     * table looked up remotely and created if missing. CREATE_NEVER skips all
     * of it. Tests call clear() between cases.
     */
    class CreatedTableCache
    {
    public:
        static CreatedTableCache &instance();

        void ensure_table(TableClient &tables,
                          const TableReference &table,
                          const std::optional<TableSchema> &schema,
                          const std::optional<std::string> &description,
                          CreateDisposition create_disposition);

        bool contains(const std::string &table_spec) const;
        size_t size() const;
        void clear();

        CreatedTableCache(const CreatedTableCache &) = delete;
        CreatedTableCache &operator=(const CreatedTableCache &) = delete;

    private:
        CreatedTableCache() = default;

        mutable std::mutex mutex_;
        std::set<std::string> created_;
    };

} // namespace BulkBridge
