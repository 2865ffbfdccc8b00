#pragma once

#include <map>
#include <string>
#include <variant>
#include <cstdint>
#include <compare>
#include <optional>
#include <string_view>

namespace BulkBridge
{

    // Microseconds since 1970-01-01T00:00:00Z
    struct Timestamp
    {
        int64_t micros = 0;

        auto operator<=>(const Timestamp &) const = default;
    };

    // One cell. std::monostate is SQL NULL.
    using FieldValue = std::variant<std::monostate, bool, int64_t, double, std::string, Timestamp>;

    inline bool is_null(const FieldValue &v) { return std::holds_alternative<std::monostate>(v); }

    /**
     * @brief One record flowing through the pipeline: column name -> value.
     * A column that is absent from the map reads as NULL.
     */
    class TableRow
    {
    public:
        using Fields = std::map<std::string, FieldValue>;

        TableRow() = default;
        TableRow(std::initializer_list<Fields::value_type> init) : fields_(init) {}

        TableRow &set(const std::string &column, FieldValue value)
        {
            fields_[column] = std::move(value);
            return *this;
        }

        // NULL when the column is absent
        const FieldValue &get(const std::string &column) const
        {
            static const FieldValue null_value{};
            auto it = fields_.find(column);
            return it == fields_.end() ? null_value : it->second;
        }

        bool contains(const std::string &column) const { return fields_.count(column) != 0; }
        size_t size() const { return fields_.size(); }
        bool empty() const { return fields_.empty(); }

        const Fields &fields() const { return fields_; }
        Fields::const_iterator begin() const { return fields_.begin(); }
        Fields::const_iterator end() const { return fields_.end(); }

        bool operator==(const TableRow &) const = default;
        bool operator<(const TableRow &other) const { return fields_ < other.fields_; }

    private:
        Fields fields_;
    };

    // "2024-03-01 09:15:00.250000+00" (microsecond precision, always UTC)
    [[nodiscard]]
    std::string format_timestamp(Timestamp ts);

    // Accepts "YYYY-MM-DD[ T]HH:MM:SS[.ffffff][Z|+00|+00:00]"; nullopt if malformed
    [[nodiscard]]
    std::optional<Timestamp> parse_timestamp(std::string_view text);

    // {"a": 1, "b": "x"} style rendering for logs and test failure messages
    std::string to_debug_string(const TableRow &row);

} // namespace BulkBridge
