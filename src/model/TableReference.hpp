#pragma once

#include <string>
#include <string_view>
#include <compare>

namespace BulkBridge
{

    /**
     * @brief Identifies one warehouse table.
     * An empty project_id means "not specified"; callers fill it with the
     * pipeline's default project before talking to the warehouse.
     */
    struct TableReference
    {
        std::string project_id;
        std::string dataset_id;
        std::string table_id;

        bool has_project() const { return !project_id.empty(); }

        // Copy of this reference with the project filled in if it was unset
        [[nodiscard]]
        TableReference with_default_project(const std::string &project) const;

        auto operator<=>(const TableReference &) const = default;
    };

    // Parses "[project_id:]dataset_id.table_id".
    // Throws ConfigurationError when the text does not match the grammar.
    [[nodiscard]]
    TableReference parse_table_spec(std::string_view table_spec);

    // Canonical form: "project:dataset.table", or "dataset.table" without project.
    [[nodiscard]]
    std::string to_table_spec(const TableReference &ref);

    // Grammar check without throwing
    [[nodiscard]]
    bool is_valid_table_spec(std::string_view table_spec);

} // namespace BulkBridge
