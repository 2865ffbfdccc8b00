#include "CreatedTableCache.hpp"

#include <iostream>
#include "../common/Errors.hpp"
#include "../services/TableClient.hpp"

namespace BulkBridge
{

    CreatedTableCache &CreatedTableCache::instance()
    {
        static CreatedTableCache cache;
        return cache;
    }

    void CreatedTableCache::ensure_table(TableClient &tables,
                                         const TableReference &table,
                                         const std::optional<TableSchema> &schema,
                                         const std::optional<std::string> &description,
                                         CreateDisposition create_disposition)
    {
        if (create_disposition == CreateDisposition::CreateNever)
            return;

        const std::string spec = to_table_spec(table);
        if (contains(spec))
            return;

        // Remote calls stay under the lock so concurrent workers create a table once
        std::lock_guard<std::mutex> lock(mutex_);
        if (created_.count(spec))
            return;

        if (!tables.get_table(table))
        {
            if (!schema)
                throw ConfigurationError("Table " + spec + " does not exist and no schema was given to create it");

            Table created;
            created.reference = table;
            created.schema = *schema;
            created.description = description.value_or("");
            tables.create_table(created);
            std::cout << "[STREAMING] Created table " << spec << "\n";
        }
        created_.insert(spec);
    }

    bool CreatedTableCache::contains(const std::string &table_spec) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_.count(table_spec) != 0;
    }

    size_t CreatedTableCache::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_.size();
    }

    void CreatedTableCache::clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        created_.clear();
    }

} // namespace BulkBridge
