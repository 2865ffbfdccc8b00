#include "ParquetReader.hpp"

#include <iostream>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>

#include "../common/ArrowStatus.hpp"
#include "../storage/StagingFileSystem.hpp"

namespace BulkBridge
{

    namespace
    {
        int64_t to_micros(int64_t value, arrow::TimeUnit::type unit)
        {
            switch (unit)
            {
            case arrow::TimeUnit::SECOND:
                return value * 1'000'000;
            case arrow::TimeUnit::MILLI:
                return value * 1'000;
            case arrow::TimeUnit::MICRO:
                return value;
            case arrow::TimeUnit::NANO:
                return value / 1'000;
            }
            return value;
        }

        [[noreturn]] void unexpected_type(const TableFieldSchema &field, const arrow::DataType &type)
        {
            throw ValidationError("[PARQUET ERROR] Column '" + field.name + "' declared " +
                                  std::string(to_string(field.type)) + " but file stores " +
                                  type.ToString());
        }

        // Writes one chunk of one column into rows[offset, offset + chunk.length())
        void convert_chunk(const arrow::Array &chunk, const TableFieldSchema &field,
                           std::vector<TableRow> &rows, size_t offset)
        {
            const int64_t n = chunk.length();
            const auto type_id = chunk.type_id();

            for (int64_t i = 0; i < n; ++i)
            {
                if (chunk.IsNull(i))
                    continue;

                TableRow &row = rows[offset + static_cast<size_t>(i)];
                switch (field.type)
                {
                case FieldType::String:
                    if (type_id == arrow::Type::STRING)
                        row.set(field.name, static_cast<const arrow::StringArray &>(chunk).GetString(i));
                    else if (type_id == arrow::Type::LARGE_STRING)
                        row.set(field.name, static_cast<const arrow::LargeStringArray &>(chunk).GetString(i));
                    else
                        unexpected_type(field, *chunk.type());
                    break;

                case FieldType::Integer:
                    if (type_id == arrow::Type::INT64)
                        row.set(field.name, static_cast<const arrow::Int64Array &>(chunk).Value(i));
                    else if (type_id == arrow::Type::INT32)
                        row.set(field.name, static_cast<int64_t>(static_cast<const arrow::Int32Array &>(chunk).Value(i)));
                    else
                        unexpected_type(field, *chunk.type());
                    break;

                case FieldType::Float:
                    if (type_id == arrow::Type::DOUBLE)
                        row.set(field.name, static_cast<const arrow::DoubleArray &>(chunk).Value(i));
                    else if (type_id == arrow::Type::FLOAT)
                        row.set(field.name, static_cast<double>(static_cast<const arrow::FloatArray &>(chunk).Value(i)));
                    else
                        unexpected_type(field, *chunk.type());
                    break;

                case FieldType::Boolean:
                    if (type_id != arrow::Type::BOOL)
                        unexpected_type(field, *chunk.type());
                    row.set(field.name, static_cast<const arrow::BooleanArray &>(chunk).Value(i));
                    break;

                case FieldType::Timestamp:
                {
                    if (type_id != arrow::Type::TIMESTAMP)
                        unexpected_type(field, *chunk.type());
                    const auto &ts_type = static_cast<const arrow::TimestampType &>(*chunk.type());
                    const int64_t raw = static_cast<const arrow::TimestampArray &>(chunk).Value(i);
                    row.set(field.name, Timestamp{to_micros(raw, ts_type.unit())});
                    break;
                }
                }
            }
        }
    } // namespace

    ParquetReader::ParquetReader(const StagingFileSystem &fs, const std::string &location)
        : location_(location), input_(fs.open(location))
    {
        parquet::arrow::FileReaderBuilder builder;
        BULKBRIDGE_THROW_IF_NOT_OK(builder.Open(input_));
        BULKBRIDGE_THROW_IF_NOT_OK(builder.memory_pool(arrow::default_memory_pool())->Build(&reader_));
    }

    ParquetReader::~ParquetReader()
    {
        try
        {
            close();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[PARQUET ERROR] Closing " << location_ << ": " << e.what() << "\n";
        }
    }

    int ParquetReader::num_row_groups() const
    {
        return reader_->num_row_groups();
    }

    int64_t ParquetReader::num_rows() const
    {
        return reader_->parquet_reader()->metadata()->num_rows();
    }

    int64_t ParquetReader::row_group_num_rows(int index) const
    {
        return reader_->parquet_reader()->metadata()->RowGroup(index)->num_rows();
    }

    int64_t ParquetReader::row_group_byte_size(int index) const
    {
        return reader_->parquet_reader()->metadata()->RowGroup(index)->total_byte_size();
    }

    std::vector<TableRow> ParquetReader::read_row_group(int index, const TableSchema &schema)
    {
        std::shared_ptr<arrow::Table> table;
        BULKBRIDGE_THROW_IF_NOT_OK(reader_->ReadRowGroup(index, &table));
        return to_rows(*table, schema);
    }

    void ParquetReader::close()
    {
        if (input_ && !input_->closed())
            BULKBRIDGE_THROW_IF_NOT_OK(input_->Close());
    }

    std::vector<TableRow> ParquetReader::to_rows(const arrow::Table &table, const TableSchema &schema)
    {
        std::vector<TableRow> rows(static_cast<size_t>(table.num_rows()));

        for (const auto &field : schema.fields)
        {
            auto column = table.GetColumnByName(field.name);
            if (!column)
                throw ValidationError("[PARQUET ERROR] Column '" + field.name + "' missing from file");

            size_t offset = 0;
            for (const auto &chunk : column->chunks())
            {
                convert_chunk(*chunk, field, rows, offset);
                offset += static_cast<size_t>(chunk->length());
            }
        }
        return rows;
    }

} // namespace BulkBridge
