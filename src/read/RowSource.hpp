#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include "../model/TableRow.hpp"

namespace BulkBridge
{

    /**
     * @brief Pull-style cursor over a RowSource.
     *
     *   if (reader->start())
     *       do { use(reader->current()); } while (reader->advance());
     *   reader->close();
     */
    class RowReader
    {
    public:
        virtual ~RowReader() = default;

        // Positions on the first row; false when the source is empty
        virtual bool start() = 0;

        // Moves to the next row; false at the end
        virtual bool advance() = 0;

        // Throws std::out_of_range when not positioned on a row
        virtual const TableRow &current() const = 0;

        // Share of the source's rows already returned, in [0, 1]
        virtual double fraction_consumed() const = 0;

        virtual void close() = 0;
    };

    // =========================================================================
    // RowSource — a bounded, splittable set of rows
    // =========================================================================
    // split() returns independent sub-sources that together yield exactly the
    // rows of this source; each can be read on its own thread.
    // =========================================================================
    class RowSource
    {
    public:
        virtual ~RowSource() = default;

        virtual int64_t estimated_size_bytes() = 0;

        virtual std::vector<std::unique_ptr<RowSource>> split(int64_t desired_bundle_size_bytes) = 0;

        virtual std::unique_ptr<RowReader> create_reader() = 0;
    };

} // namespace BulkBridge
