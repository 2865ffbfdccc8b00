#pragma once

#include <string>
#include "TableRow.hpp"

namespace BulkBridge
{

    /**
     * @brief Event-time window a streamed row belongs to, [start, end).
     * The global window spans all time; it is the window of rows from
     * un-windowed input.
     */
    struct BoundedWindow
    {
        Timestamp start;
        Timestamp end;
        bool global = false;

        static BoundedWindow global_window() { return BoundedWindow{{INT64_MIN}, {INT64_MAX}, true}; }

        bool operator==(const BoundedWindow &) const = default;
    };

    // "[2024-03-01 00:00:00.000000+00, 2024-03-02 00:00:00.000000+00)" or "GlobalWindow"
    inline std::string to_string(const BoundedWindow &w)
    {
        if (w.global)
            return "GlobalWindow";
        return "[" + format_timestamp(w.start) + ", " + format_timestamp(w.end) + ")";
    }

} // namespace BulkBridge
