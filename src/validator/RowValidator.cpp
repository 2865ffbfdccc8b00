#include "RowValidator.hpp"

#include <iostream>
#include <set>

#include "../common/Errors.hpp"

namespace BulkBridge
{

    namespace
    {
        bool type_matches(const FieldValue &value, FieldType type)
        {
            switch (type)
            {
            case FieldType::String:
                return std::holds_alternative<std::string>(value);
            case FieldType::Integer:
                return std::holds_alternative<int64_t>(value);
            case FieldType::Float:
                return std::holds_alternative<double>(value) || std::holds_alternative<int64_t>(value);
            case FieldType::Boolean:
                return std::holds_alternative<bool>(value);
            case FieldType::Timestamp:
                return std::holds_alternative<Timestamp>(value);
            }
            return false;
        }
    } // namespace

    ValidationResult RowValidator::validate_schema(const TableSchema &schema)
    {
        if (schema.empty())
            return ValidationResult::fail("Schema has no columns");

        std::set<std::string> seen;
        for (const auto &field : schema.fields)
        {
            if (!is_valid_column_name(field.name))
                return ValidationResult::fail("Invalid column name: '" + field.name + "'");
            if (!seen.insert(field.name).second)
                return ValidationResult::fail("Duplicate column name: '" + field.name + "'");
        }
        return ValidationResult::ok();
    }

    ValidationResult RowValidator::validate(const TableRow &row, const TableSchema &schema)
    {
        for (const auto &[name, value] : row)
        {
            if (!schema.index_of(name))
                return ValidationResult::fail("Unknown column: '" + name + "'");
        }

        for (const auto &field : schema.fields)
        {
            const FieldValue &value = row.get(field.name);
            if (is_null(value))
            {
                if (field.mode == FieldMode::Required)
                    return ValidationResult::fail("NULL in REQUIRED column '" + field.name + "'");
                continue;
            }
            if (!type_matches(value, field.type))
            {
                return ValidationResult::fail("Column '" + field.name + "' expects " +
                                              std::string(to_string(field.type)));
            }
        }
        return ValidationResult::ok();
    }

    std::vector<TableRow> RowValidator::validate_batch(const std::vector<TableRow> &rows,
                                                       const TableSchema &schema,
                                                       InvalidRowPolicy policy)
    {
        std::vector<TableRow> valid_rows;
        valid_rows.reserve(rows.size());
        size_t rejected = 0;

        for (const auto &row : rows)
        {
            auto result = validate(row, schema);
            if (result.valid)
            {
                valid_rows.push_back(row);
                continue;
            }

            if (policy == InvalidRowPolicy::Reject)
                throw ValidationError("Invalid row " + to_debug_string(row) + ": " + result.reason);

            ++rejected;
            std::cerr << "[VALIDATOR] REJECTED " << to_debug_string(row) << " | Reason: " << result.reason << "\n";
        }

        if (rejected > 0)
        {
            std::cout << "[VALIDATOR] Batch complete: " << valid_rows.size() << " valid, "
                      << rejected << " rejected.\n";
        }
        return valid_rows;
    }

} // namespace BulkBridge
