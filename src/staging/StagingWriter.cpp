#include "StagingWriter.hpp"

#include <iostream>

#include <arrow/io/interfaces.h>

#include "../common/ArrowStatus.hpp"
#include "../storage/StagingFileSystem.hpp"

namespace BulkBridge
{

    StagingWriter::StagingWriter(const StagingFileSystem &fs, std::string prefix, TableSchema schema)
        : fs_(fs), prefix_(std::move(prefix)), codec_(std::move(schema))
    {
    }

    StagingWriter::~StagingWriter()
    {
        if (is_open())
        {
            std::cerr << "[STAGING ERROR] Writer for " << path_ << " destroyed while open\n";
            abort_quietly();
        }
    }

    void StagingWriter::open(const std::string &id)
    {
        if (is_open())
            throw StagingError("[STAGING ERROR] open() called twice; " + path_ + " is still open");

        path_ = StagingFileSystem::join(prefix_, id);
        buffer_.clear();
        byte_count_ = 0;
        stream_ = fs_.create(path_);
    }

    void StagingWriter::write(const TableRow &row)
    {
        if (!is_open())
            throw StagingError("[STAGING ERROR] write() on a closed writer");

        try
        {
            byte_count_ += static_cast<int64_t>(codec_.encode_to(row, buffer_));
            if (buffer_.size() >= FLUSH_THRESHOLD)
                flush();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[STAGING ERROR] Write to " << path_ << " failed: " << e.what() << "\n";
            abort_quietly();
            throw;
        }
    }

    StagedFile StagingWriter::close()
    {
        if (!is_open())
            throw StagingError("[STAGING ERROR] close() on a writer that is not open");

        try
        {
            flush();
            BULKBRIDGE_THROW_IF_NOT_OK(stream_->Close());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[STAGING ERROR] Close of " << path_ << " failed: " << e.what() << "\n";
            abort_quietly();
            throw;
        }
        stream_.reset();

        std::cout << "[STAGING] Closed " << path_ << " (" << byte_count_ << " bytes)\n";
        return StagedFile{path_, byte_count_};
    }

    void StagingWriter::flush()
    {
        if (buffer_.empty())
            return;
        BULKBRIDGE_THROW_IF_NOT_OK(stream_->Write(buffer_.data(), static_cast<int64_t>(buffer_.size())));
        buffer_.clear();
    }

    void StagingWriter::abort_quietly() noexcept
    {
        if (!stream_)
            return;
        auto status = stream_->Abort();
        if (!status.ok())
            std::cerr << "[STAGING ERROR] Abort of " << path_ << " failed: " << status.ToString() << "\n";
        stream_.reset();
        buffer_.clear();
    }

} // namespace BulkBridge
