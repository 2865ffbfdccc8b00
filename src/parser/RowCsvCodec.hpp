#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../model/TableRow.hpp"
#include "../model/TableSchema.hpp"

namespace BulkBridge
{

    // One CSV field before typing. nullopt is NULL (an empty, unquoted field).
    using RawField = std::optional<std::string>;
    using RawRecord = std::vector<RawField>;

    /**
     * @brief Newline-delimited CSV encoding of TableRows, columns in schema order.
     *
     * Encoding rules (what the warehouse loader expects, RFC 4180 quoting):
     *   NULL      -> empty, unquoted
     *   STRING    -> always double-quoted, '"' doubled ("" is the empty string)
     *   INTEGER   -> decimal
     *   FLOAT     -> shortest round-trip decimal, NaN / Infinity / -Infinity
     *   BOOLEAN   -> true / false
     *   TIMESTAMP -> "YYYY-MM-DD HH:MM:SS.ffffff+00"
     * Columns absent from the row are NULL; columns absent from the schema are dropped.
     */
    class RowCsvCodec
    {
    public:
        explicit RowCsvCodec(TableSchema schema);

        // One record including the trailing '\n'
        [[nodiscard]]
        std::string encode(const TableRow &row) const;

        // Appends one record to `out`; returns the number of bytes appended
        size_t encode_to(const TableRow &row, std::string &out) const;

        /**
         * @brief Splits CSV text into records. Quoted fields may contain
         * separators and newlines. "\r\n" line endings are accepted.
         * Throws ValidationError on an unterminated quote.
         */
        [[nodiscard]]
        static std::vector<RawRecord> split_records(std::string_view content);

        // Types one record against the schema. NULL fields are left unset.
        [[nodiscard]]
        TableRow to_row(const RawRecord &record) const;

        [[nodiscard]]
        std::vector<TableRow> decode(std::string_view content) const;

        const TableSchema &schema() const { return schema_; }

    private:
        TableSchema schema_;
    };

    // Text form of one non-null value as the codec writes it, unquoted
    [[nodiscard]]
    std::string format_value(const FieldValue &value);

    // Inverse of format_value for a column type; nullopt when `text` does not parse
    [[nodiscard]]
    std::optional<FieldValue> parse_value(std::string_view text, FieldType type);

} // namespace BulkBridge
