#include "ParquetFileSource.hpp"

#include <stdexcept>

#include "../output/ParquetReader.hpp"
#include "../storage/StagingFileSystem.hpp"

namespace BulkBridge
{

    namespace
    {
        class ParquetRowReader : public RowReader
        {
        public:
            ParquetRowReader(const StagingFileSystem &fs, std::string location, TableSchema schema,
                             int first_group, int end_group)
                : fs_(fs), location_(std::move(location)), schema_(std::move(schema)),
                  next_group_(first_group), end_group_(end_group)
            {
            }

            bool start() override
            {
                reader_ = std::make_unique<ParquetReader>(fs_, location_);
                if (end_group_ < 0 || end_group_ > reader_->num_row_groups())
                    end_group_ = reader_->num_row_groups();

                for (int g = next_group_; g < end_group_; ++g)
                    total_rows_ += reader_->row_group_num_rows(g);

                return load_next_nonempty_group();
            }

            bool advance() override
            {
                if (!reader_)
                    throw std::logic_error("[READ] advance() before start()");
                ++position_;
                if (position_ < buffer_.size())
                {
                    ++rows_returned_;
                    return true;
                }
                return load_next_nonempty_group();
            }

            const TableRow &current() const override
            {
                if (position_ >= buffer_.size())
                    throw std::out_of_range("[READ] No current row in " + location_);
                return buffer_[position_];
            }

            double fraction_consumed() const override
            {
                if (total_rows_ == 0)
                    return reader_ ? 1.0 : 0.0;
                return static_cast<double>(rows_returned_) / static_cast<double>(total_rows_);
            }

            void close() override
            {
                if (reader_)
                    reader_->close();
                buffer_.clear();
                position_ = 0;
            }

        private:
            bool load_next_nonempty_group()
            {
                while (next_group_ < end_group_)
                {
                    buffer_ = reader_->read_row_group(next_group_++, schema_);
                    position_ = 0;
                    if (!buffer_.empty())
                    {
                        ++rows_returned_;
                        return true;
                    }
                }
                buffer_.clear();
                position_ = 0;
                return false;
            }

            const StagingFileSystem &fs_;
            std::string location_;
            TableSchema schema_;
            int next_group_;
            int end_group_;

            std::unique_ptr<ParquetReader> reader_;
            std::vector<TableRow> buffer_;
            size_t position_ = 0;
            int64_t total_rows_ = 0;
            int64_t rows_returned_ = 0;
        };
    } // namespace

    ParquetFileSource::ParquetFileSource(const StagingFileSystem &fs,
                                         std::string location,
                                         TableSchema schema,
                                         int first_row_group,
                                         int end_row_group)
        : fs_(fs),
          location_(std::move(location)),
          schema_(std::move(schema)),
          first_row_group_(first_row_group),
          end_row_group_(end_row_group)
    {
    }

    int64_t ParquetFileSource::estimated_size_bytes()
    {
        if (first_row_group_ == 0 && end_row_group_ < 0)
            return fs_.size(location_);

        ParquetReader reader(fs_, location_);
        const int end = end_row_group_ < 0 ? reader.num_row_groups() : end_row_group_;
        int64_t bytes = 0;
        for (int g = first_row_group_; g < end; ++g)
            bytes += reader.row_group_byte_size(g);
        return bytes;
    }

    std::vector<std::unique_ptr<RowSource>> ParquetFileSource::split(int64_t desired_bundle_size_bytes)
    {
        ParquetReader reader(fs_, location_);
        const int end = end_row_group_ < 0 ? reader.num_row_groups() : end_row_group_;

        std::vector<std::unique_ptr<RowSource>> bundles;
        int bundle_start = first_row_group_;
        int64_t bundle_bytes = 0;

        for (int g = first_row_group_; g < end; ++g)
        {
            bundle_bytes += reader.row_group_byte_size(g);
            if (bundle_bytes >= desired_bundle_size_bytes)
            {
                bundles.push_back(std::make_unique<ParquetFileSource>(fs_, location_, schema_, bundle_start, g + 1));
                bundle_start = g + 1;
                bundle_bytes = 0;
            }
        }
        if (bundle_start < end || bundles.empty())
            bundles.push_back(std::make_unique<ParquetFileSource>(fs_, location_, schema_, bundle_start, end));

        return bundles;
    }

    std::unique_ptr<RowReader> ParquetFileSource::create_reader()
    {
        return std::make_unique<ParquetRowReader>(fs_, location_, schema_, first_row_group_, end_row_group_);
    }

} // namespace BulkBridge
