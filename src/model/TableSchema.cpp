#include "TableSchema.hpp"

namespace BulkBridge
{

    std::optional<size_t> TableSchema::index_of(std::string_view name) const
    {
        for (size_t i = 0; i < fields.size(); ++i)
        {
            if (fields[i].name == name)
                return i;
        }
        return std::nullopt;
    }

    std::vector<std::string> TableSchema::column_names() const
    {
        std::vector<std::string> names;
        names.reserve(fields.size());
        for (const auto &f : fields)
            names.push_back(f.name);
        return names;
    }

    std::string_view to_string(FieldType type)
    {
        switch (type)
        {
        case FieldType::String:
            return "STRING";
        case FieldType::Integer:
            return "INTEGER";
        case FieldType::Float:
            return "FLOAT";
        case FieldType::Boolean:
            return "BOOLEAN";
        case FieldType::Timestamp:
            return "TIMESTAMP";
        }
        return "STRING";
    }

    std::string_view to_string(FieldMode mode)
    {
        return mode == FieldMode::Required ? "REQUIRED" : "NULLABLE";
    }

    std::optional<FieldType> parse_field_type(std::string_view name)
    {
        if (name == "STRING")
            return FieldType::String;
        if (name == "INTEGER" || name == "INT64")
            return FieldType::Integer;
        if (name == "FLOAT" || name == "FLOAT64")
            return FieldType::Float;
        if (name == "BOOLEAN" || name == "BOOL")
            return FieldType::Boolean;
        if (name == "TIMESTAMP")
            return FieldType::Timestamp;
        return std::nullopt;
    }

} // namespace BulkBridge
