#pragma once

#include <ctre.hpp>
#include <string>
#include <string_view>
#include <vector>
#include "../model/TableRow.hpp"
#include "../model/TableSchema.hpp"

namespace BulkBridge
{

    struct ValidationResult
    {
        bool valid;
        std::string reason; // empty when valid

        static ValidationResult ok() { return {true, ""}; }
        static ValidationResult fail(std::string reason) { return {false, std::move(reason)}; }
    };

    // What a write does with rows that fail validation
    enum class InvalidRowPolicy : uint8_t
    {
        Reject, // the whole write fails with ValidationError
        Drop    // logged to stderr and skipped
    };

    // =========================================================================
    // RowValidator — schema checks before a row is staged or inserted
    // =========================================================================
    // Rejects:
    //   - columns the schema does not declare
    //   - NULL (or absent) values in REQUIRED columns
    //   - values whose type does not match the column (INTEGER widens to FLOAT)
    // =========================================================================
    class RowValidator
    {
    public:
        // Warehouse column names: letter or underscore, then letters, digits, underscores
        [[nodiscard]]
        static bool is_valid_column_name(std::string_view name)
        {
            return static_cast<bool>(ctre::match<"[A-Za-z_][A-Za-z0-9_]{0,127}">(name));
        }

        // Column names well-formed and unique
        [[nodiscard]]
        static ValidationResult validate_schema(const TableSchema &schema);

        [[nodiscard]]
        static ValidationResult validate(const TableRow &row, const TableSchema &schema);

        /**
         * @brief Applies `policy` to a batch.
         * Reject: throws ValidationError at the first invalid row.
         * Drop  : returns only the valid rows; rejects are logged.
         */
        [[nodiscard]]
        static std::vector<TableRow> validate_batch(const std::vector<TableRow> &rows,
                                                    const TableSchema &schema,
                                                    InvalidRowPolicy policy);
    };

} // namespace BulkBridge
