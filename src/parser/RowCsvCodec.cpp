#include "RowCsvCodec.hpp"
#include <charconv> // from_chars / to_chars: locale-free number conversion
#include <cmath>
#include <type_traits>
#include "../common/Errors.hpp"

namespace BulkBridge
{

    namespace
    {
        void append_quoted(std::string &out, std::string_view s)
        {
            out.push_back('"');
            for (char c : s)
            {
                if (c == '"')
                    out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
        }

        std::string format_double(double v)
        {
            if (std::isnan(v))
                return "NaN";
            if (std::isinf(v))
                return v > 0 ? "Infinity" : "-Infinity";

            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
            return std::string(buf, ptr);
        }

        template <typename T>
        std::optional<T> parse_number(std::string_view text)
        {
            T value{};
            auto first = text.data();
            auto last = first + text.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc() || ptr != last)
                return std::nullopt;
            return value;
        }
    } // namespace

    std::string format_value(const FieldValue &value)
    {
        return std::visit(
            [](const auto &v) -> std::string
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                    return {};
                else if constexpr (std::is_same_v<T, bool>)
                    return v ? "true" : "false";
                else if constexpr (std::is_same_v<T, int64_t>)
                    return std::to_string(v);
                else if constexpr (std::is_same_v<T, double>)
                    return format_double(v);
                else if constexpr (std::is_same_v<T, std::string>)
                    return v;
                else
                    return format_timestamp(v);
            },
            value);
    }

    std::optional<FieldValue> parse_value(std::string_view text, FieldType type)
    {
        switch (type)
        {
        case FieldType::String:
            return FieldValue{std::string(text)};

        case FieldType::Integer:
            if (auto v = parse_number<int64_t>(text))
                return FieldValue{*v};
            return std::nullopt;

        case FieldType::Float:
            if (text == "NaN")
                return FieldValue{std::nan("")};
            if (text == "Infinity")
                return FieldValue{HUGE_VAL};
            if (text == "-Infinity")
                return FieldValue{-HUGE_VAL};
            if (auto v = parse_number<double>(text))
                return FieldValue{*v};
            return std::nullopt;

        case FieldType::Boolean:
            if (text == "true" || text == "t" || text == "1")
                return FieldValue{true};
            if (text == "false" || text == "f" || text == "0")
                return FieldValue{false};
            return std::nullopt;

        case FieldType::Timestamp:
            if (auto ts = parse_timestamp(text))
                return FieldValue{*ts};
            return std::nullopt;
        }
        return std::nullopt;
    }

    RowCsvCodec::RowCsvCodec(TableSchema schema)
        : schema_(std::move(schema))
    {
    }

    size_t RowCsvCodec::encode_to(const TableRow &row, std::string &out) const
    {
        const size_t before = out.size();
        bool first = true;
        for (const auto &field : schema_.fields)
        {
            if (!first)
                out.push_back(',');
            first = false;

            const FieldValue &value = row.get(field.name);
            if (is_null(value))
                continue;

            if (const auto *s = std::get_if<std::string>(&value))
                append_quoted(out, *s);
            else
                out += format_value(value);
        }
        out.push_back('\n');
        return out.size() - before;
    }

    std::string RowCsvCodec::encode(const TableRow &row) const
    {
        std::string line;
        encode_to(row, line);
        return line;
    }

    // -------------------------------------------------------------------------
    // split_records — single pass state machine over the whole buffer
    // -------------------------------------------------------------------------
    // A field that was quoted is never NULL, even when empty. An empty line is
    // a record of one NULL field.
    std::vector<RawRecord> RowCsvCodec::split_records(std::string_view content)
    {
        std::vector<RawRecord> records;
        RawRecord current;
        std::string field;
        bool quoted = false;   // field started with '"'
        bool in_quotes = false;
        size_t i = 0;

        auto end_field = [&]()
        {
            if (quoted || !field.empty())
                current.emplace_back(std::move(field));
            else
                current.emplace_back(std::nullopt);
            field.clear();
            quoted = false;
        };

        auto end_record = [&]()
        {
            end_field();
            records.push_back(std::move(current));
            current.clear();
        };

        while (i < content.size())
        {
            const char c = content[i];
            if (in_quotes)
            {
                if (c == '"')
                {
                    if (i + 1 < content.size() && content[i + 1] == '"')
                    {
                        field.push_back('"');
                        ++i;
                    }
                    else
                    {
                        in_quotes = false;
                    }
                }
                else
                {
                    field.push_back(c);
                }
            }
            else if (c == '"')
            {
                in_quotes = true;
                quoted = true;
            }
            else if (c == ',')
            {
                end_field();
            }
            else if (c == '\n')
            {
                end_record();
            }
            else if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n')
            {
                // swallowed; '\n' ends the record
            }
            else
            {
                field.push_back(c);
            }
            ++i;
        }

        if (in_quotes)
            throw ValidationError("[CSV] Unterminated quoted field at end of input");

        if (quoted || !field.empty() || !current.empty())
            end_record();

        return records;
    }

    TableRow RowCsvCodec::to_row(const RawRecord &record) const
    {
        if (record.size() != schema_.fields.size())
        {
            throw ValidationError("[CSV] Expected " + std::to_string(schema_.fields.size()) +
                                  " fields, got " + std::to_string(record.size()));
        }

        TableRow row;
        for (size_t i = 0; i < record.size(); ++i)
        {
            if (!record[i])
                continue;

            const auto &column = schema_.fields[i];
            auto value = parse_value(*record[i], column.type);
            if (!value)
            {
                throw ValidationError("[CSV] Column '" + column.name + "': cannot parse '" +
                                      *record[i] + "' as " + std::string(to_string(column.type)));
            }
            row.set(column.name, std::move(*value));
        }
        return row;
    }

    std::vector<TableRow> RowCsvCodec::decode(std::string_view content) const
    {
        std::vector<TableRow> rows;
        for (const auto &record : split_records(content))
            rows.push_back(to_row(record));
        return rows;
    }

} // namespace BulkBridge
