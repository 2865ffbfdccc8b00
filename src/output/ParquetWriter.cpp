#include "ParquetWriter.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include "../common/ArrowStatus.hpp"
#include "../storage/StagingFileSystem.hpp"

namespace BulkBridge
{

    namespace
    {
        std::shared_ptr<arrow::DataType> arrow_type(FieldType type)
        {
            switch (type)
            {
            case FieldType::String:
                return arrow::utf8();
            case FieldType::Integer:
                return arrow::int64();
            case FieldType::Float:
                return arrow::float64();
            case FieldType::Boolean:
                return arrow::boolean();
            case FieldType::Timestamp:
                return arrow::timestamp(arrow::TimeUnit::MICRO, "UTC");
            }
            return arrow::utf8();
        }

        [[noreturn]] void type_mismatch(const TableFieldSchema &field, const FieldValue &value)
        {
            throw ValidationError("[PARQUET ERROR] Column '" + field.name + "' expects " +
                                  std::string(to_string(field.type)) + ", got variant index " +
                                  std::to_string(value.index()));
        }

        // Appends one column. `extract` returns nullptr when the value has the wrong type.
        template <typename Builder, typename Extract>
        std::shared_ptr<arrow::Array> build_column(Builder &builder,
                                                   const std::vector<TableRow> &rows,
                                                   const TableFieldSchema &field,
                                                   Extract extract)
        {
            BULKBRIDGE_THROW_IF_NOT_OK(builder.Reserve(static_cast<int64_t>(rows.size())));
            for (const auto &row : rows)
            {
                const FieldValue &value = row.get(field.name);
                if (is_null(value))
                {
                    if (field.mode == FieldMode::Required)
                        throw ValidationError("[PARQUET ERROR] NULL in REQUIRED column '" + field.name + "'");
                    BULKBRIDGE_THROW_IF_NOT_OK(builder.AppendNull());
                    continue;
                }
                auto v = extract(value);
                if (!v)
                    type_mismatch(field, value);
                BULKBRIDGE_THROW_IF_NOT_OK(builder.Append(*v));
            }
            std::shared_ptr<arrow::Array> array;
            BULKBRIDGE_THROW_IF_NOT_OK(builder.Finish(&array));
            return array;
        }
    } // namespace

    std::shared_ptr<arrow::Schema> ParquetWriter::to_arrow_schema(const TableSchema &schema)
    {
        arrow::FieldVector fields;
        fields.reserve(schema.fields.size());
        for (const auto &f : schema.fields)
            fields.push_back(arrow::field(f.name, arrow_type(f.type), f.mode == FieldMode::Nullable));
        return arrow::schema(fields);
    }

    std::shared_ptr<arrow::Table> ParquetWriter::to_arrow_table(const std::vector<TableRow> &rows,
                                                                const TableSchema &schema)
    {
        auto *pool = arrow::default_memory_pool();
        arrow::ArrayVector columns;
        columns.reserve(schema.fields.size());

        for (const auto &field : schema.fields)
        {
            switch (field.type)
            {
            case FieldType::String:
            {
                arrow::StringBuilder b(pool);
                columns.push_back(build_column(b, rows, field, [](const FieldValue &v)
                                               { return std::get_if<std::string>(&v); }));
                break;
            }
            case FieldType::Integer:
            {
                arrow::Int64Builder b(pool);
                columns.push_back(build_column(b, rows, field, [](const FieldValue &v)
                                               { return std::get_if<int64_t>(&v); }));
                break;
            }
            case FieldType::Float:
            {
                // INTEGER values widen into FLOAT columns
                arrow::DoubleBuilder b(pool);
                columns.push_back(build_column(b, rows, field, [](const FieldValue &v) -> std::optional<double>
                                               {
                                                   if (auto d = std::get_if<double>(&v))
                                                       return *d;
                                                   if (auto i = std::get_if<int64_t>(&v))
                                                       return static_cast<double>(*i);
                                                   return std::nullopt; }));
                break;
            }
            case FieldType::Boolean:
            {
                arrow::BooleanBuilder b(pool);
                columns.push_back(build_column(b, rows, field, [](const FieldValue &v)
                                               { return std::get_if<bool>(&v); }));
                break;
            }
            case FieldType::Timestamp:
            {
                arrow::TimestampBuilder b(arrow_type(FieldType::Timestamp), pool);
                columns.push_back(build_column(b, rows, field, [](const FieldValue &v) -> std::optional<int64_t>
                                               {
                                                   if (auto ts = std::get_if<Timestamp>(&v))
                                                       return ts->micros;
                                                   return std::nullopt; }));
                break;
            }
            }
        }

        return arrow::Table::Make(to_arrow_schema(schema), columns, static_cast<int64_t>(rows.size()));
    }

    int64_t ParquetWriter::write(const std::vector<TableRow> &rows,
                                 const TableSchema &schema,
                                 const StagingFileSystem &fs,
                                 const std::string &location,
                                 int64_t row_group_length)
    {
        auto t0 = std::chrono::high_resolution_clock::now();

        auto table = to_arrow_table(rows, schema);
        auto outfile = fs.create(location);

        auto writer_props = parquet::WriterProperties::Builder()
                                .compression(arrow::Compression::SNAPPY)
                                ->build();

        // Embeds the Arrow schema so the timestamp time zone survives the round trip
        auto arrow_props = parquet::ArrowWriterProperties::Builder()
                               .store_schema()
                               ->build();

        BULKBRIDGE_THROW_IF_NOT_OK(parquet::arrow::WriteTable(
            *table,
            arrow::default_memory_pool(),
            outfile,
            std::max<int64_t>(1, row_group_length),
            writer_props,
            arrow_props));

        BULKBRIDGE_ASSIGN_OR_THROW(int64_t bytes, outfile->Tell());
        BULKBRIDGE_THROW_IF_NOT_OK(outfile->Close());

        auto t1 = std::chrono::high_resolution_clock::now();
        std::cout << "[PARQUET] Wrote " << rows.size() << " rows (" << bytes << " bytes) to "
                  << location << " in "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count() << "ms\n";
        return bytes;
    }

} // namespace BulkBridge
