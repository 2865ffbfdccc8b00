#pragma once

#include <string_view>
#include <optional>
#include <cstdint>

namespace BulkBridge
{

    // Whether a missing destination table may be created
    enum class CreateDisposition : uint8_t
    {
        CreateNever,
        CreateIfNeeded
    };

    // What happens to rows already in the destination
    enum class WriteDisposition : uint8_t
    {
        WriteTruncate, // replace existing rows
        WriteAppend,   // keep existing rows
        WriteEmpty     // fail unless the destination is empty
    };

    inline std::string_view to_string(CreateDisposition d)
    {
        return d == CreateDisposition::CreateNever ? "CREATE_NEVER" : "CREATE_IF_NEEDED";
    }

    inline std::string_view to_string(WriteDisposition d)
    {
        switch (d)
        {
        case WriteDisposition::WriteTruncate:
            return "WRITE_TRUNCATE";
        case WriteDisposition::WriteAppend:
            return "WRITE_APPEND";
        case WriteDisposition::WriteEmpty:
            return "WRITE_EMPTY";
        }
        return "WRITE_EMPTY";
    }

    inline std::optional<CreateDisposition> parse_create_disposition(std::string_view s)
    {
        if (s == "CREATE_NEVER")
            return CreateDisposition::CreateNever;
        if (s == "CREATE_IF_NEEDED")
            return CreateDisposition::CreateIfNeeded;
        return std::nullopt;
    }

    inline std::optional<WriteDisposition> parse_write_disposition(std::string_view s)
    {
        if (s == "WRITE_TRUNCATE")
            return WriteDisposition::WriteTruncate;
        if (s == "WRITE_APPEND")
            return WriteDisposition::WriteAppend;
        if (s == "WRITE_EMPTY")
            return WriteDisposition::WriteEmpty;
        return std::nullopt;
    }

} // namespace BulkBridge
