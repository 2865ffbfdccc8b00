#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

namespace BulkBridge
{

    enum class FieldType : uint8_t
    {
        String,
        Integer,   // 64-bit signed
        Float,     // IEEE double
        Boolean,
        Timestamp  // microseconds since the Unix epoch, UTC
    };

    enum class FieldMode : uint8_t
    {
        Nullable,
        Required
    };

    struct TableFieldSchema
    {
        std::string name;
        FieldType type = FieldType::String;
        FieldMode mode = FieldMode::Nullable;
        std::string description;

        bool operator==(const TableFieldSchema &) const = default;
    };

    /**
     * @brief Ordered column list of a table.
     * Column order is significant: staged files are encoded in this order.
     */
    struct TableSchema
    {
        std::vector<TableFieldSchema> fields;

        bool empty() const { return fields.empty(); }

        // Index of the column, or nullopt when the schema has no such column
        [[nodiscard]]
        std::optional<size_t> index_of(std::string_view name) const;

        [[nodiscard]]
        std::vector<std::string> column_names() const;

        bool operator==(const TableSchema &) const = default;
    };

    [[nodiscard]]
    std::string_view to_string(FieldType type);

    [[nodiscard]]
    std::string_view to_string(FieldMode mode);

    // "STRING", "INTEGER", "INT64", "FLOAT", "FLOAT64", "BOOLEAN", "BOOL", "TIMESTAMP"
    [[nodiscard]]
    std::optional<FieldType> parse_field_type(std::string_view name);

} // namespace BulkBridge
