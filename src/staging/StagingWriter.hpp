#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "../model/TableRow.hpp"
#include "../model/TableSchema.hpp"
#include "../parser/RowCsvCodec.hpp"

namespace arrow
{
    namespace io
    {
        class OutputStream;
    }
}

namespace BulkBridge
{

    class StagingFileSystem;

    // A closed staged file. byte_count is exactly the number of bytes written.
    struct StagedFile
    {
        std::string path;
        int64_t byte_count = 0;

        bool operator==(const StagedFile &) const = default;
    };

    // =========================================================================
    // StagingWriter — one worker's staged file
    // =========================================================================
    //
    //   open("a1b2")        -> creates <prefix>/a1b2
    //   write(row) x N      -> one CSV record per row
    //   close()             -> StagedFile{<prefix>/a1b2, bytes}
    //
    // If a write fails the stream is closed first and the original error is
    // rethrown; a failure while closing is logged, never thrown over it.
    // =========================================================================
    class StagingWriter
    {
    public:
        static constexpr size_t FLUSH_THRESHOLD = 1 << 20;

        StagingWriter(const StagingFileSystem &fs, std::string prefix, TableSchema schema);
        ~StagingWriter();

        StagingWriter(const StagingWriter &) = delete;
        StagingWriter &operator=(const StagingWriter &) = delete;

        void open(const std::string &id);
        void write(const TableRow &row);
        StagedFile close();

        bool is_open() const { return stream_ != nullptr; }
        int64_t byte_count() const { return byte_count_; }
        const std::string &path() const { return path_; }

    private:
        void flush();
        void abort_quietly() noexcept;

        const StagingFileSystem &fs_;
        std::string prefix_;
        RowCsvCodec codec_;

        std::shared_ptr<arrow::io::OutputStream> stream_;
        std::string path_;
        std::string buffer_;
        int64_t byte_count_ = 0;
    };

} // namespace BulkBridge
