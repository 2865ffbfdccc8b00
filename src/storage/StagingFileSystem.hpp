#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <cstdint>

namespace arrow
{
    namespace fs
    {
        class FileSystem;
    }
    namespace io
    {
        class OutputStream;
        class RandomAccessFile;
    }
}

namespace BulkBridge
{

    // =========================================================================
    // StagingFileSystem — intermediate file store for staged and extracted data
    // =========================================================================
    //
    // Locations are local paths ("/tmp/x", "relative/x"), file:// URIs or any
    // object-store URI Arrow's filesystem registry understands (s3://, gs://).
    // Every operation takes a full location; the matching Arrow filesystem is
    // resolved per call.
    //
    // Failures throw StagingError, except in remove_quietly(), which logs.
    // =========================================================================
    class StagingFileSystem
    {
    public:
        virtual ~StagingFileSystem() = default;

        // "<base>/<name>" without doubling the separator
        [[nodiscard]]
        static std::string join(std::string_view base, std::string_view name);

        // Opens a new file for writing, creating parent directories.
        [[nodiscard]]
        virtual std::shared_ptr<arrow::io::OutputStream> create(const std::string &location) const;

        [[nodiscard]]
        std::shared_ptr<arrow::io::RandomAccessFile> open(const std::string &location) const;

        // Whole file contents
        [[nodiscard]]
        std::string read_all(const std::string &location) const;

        [[nodiscard]]
        bool exists(const std::string &location) const;

        [[nodiscard]]
        int64_t size(const std::string &location) const;

        /**
         * @brief Lists files matching a pattern whose last component may contain '*'.
         * "<dir>/*.parquet" -> every .parquet file directly inside <dir>, sorted.
         * A missing directory matches nothing.
         */
        [[nodiscard]]
        std::vector<std::string> match(const std::string &pattern) const;

        // Returns false when the file did not exist.
        bool remove(const std::string &location) const;

        // Best-effort delete: failures are logged with [CLEANUP WARN] and dropped.
        // Returns the number of files actually removed.
        size_t remove_quietly(const std::vector<std::string> &locations) const;

    private:
        // Filesystem + filesystem-internal path for a location
        std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>
        resolve(const std::string &location) const;
    };

    // '*' matches any run of characters (including none); everything else is literal.
    [[nodiscard]]
    bool wildcard_match(std::string_view pattern, std::string_view name);

} // namespace BulkBridge
