#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include "../model/Table.hpp"
#include "../model/TableRow.hpp"

namespace BulkBridge
{

    // =========================================================================
    // TableClient — synchronous table/dataset metadata and streaming inserts
    // =========================================================================
    // Lookups return nullopt for a missing resource. Deletes of a missing
    // resource throw WarehouseError with not_found() == true.
    // =========================================================================
    class TableClient
    {
    public:
        virtual ~TableClient() = default;

        [[nodiscard]]
        virtual std::optional<Table> get_table(const TableReference &ref) = 0;

        // Creates the table; a table that already exists is left unchanged.
        virtual void create_table(const Table &table) = 0;

        virtual void delete_table(const TableReference &ref) = 0;

        [[nodiscard]]
        virtual std::optional<Dataset> get_dataset(const std::string &project_id,
                                                   const std::string &dataset_id) = 0;

        virtual void create_dataset(const std::string &project_id,
                                    const std::string &dataset_id,
                                    const std::string &location,
                                    const std::string &description) = 0;

        virtual void delete_dataset(const std::string &project_id,
                                    const std::string &dataset_id) = 0;

        [[nodiscard]]
        virtual bool is_table_empty(const TableReference &ref) = 0;

        /**
         * @brief Streams rows into an existing table.
         * unique_ids[i] identifies rows[i]; a row whose id was already
         * accepted for this table is dropped (best-effort dedup).
         * @return bytes of row payload sent
         */
        virtual int64_t insert_all(const TableReference &ref,
                                   const std::vector<TableRow> &rows,
                                   const std::vector<std::string> &unique_ids) = 0;

        virtual void patch_table_description(const TableReference &ref,
                                             const std::string &description) = 0;
    };

} // namespace BulkBridge
