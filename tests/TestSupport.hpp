#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include "../src/config/PipelineOptions.hpp"
#include "../src/model/TableRow.hpp"
#include "../src/model/TableSchema.hpp"
#include "../src/util/RandomToken.hpp"

namespace BulkBridge
{

    // Fresh directory under the system temp dir, removed with everything in it
    class TempDir
    {
    public:
        TempDir()
            : path_(std::filesystem::temp_directory_path() / ("bulkbridge_test_" + random_token()))
        {
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        std::string str() const { return path_.string(); }
        const std::filesystem::path &path() const { return path_; }

        // Regular files below the directory, recursively
        size_t file_count() const
        {
            size_t n = 0;
            for (const auto &entry : std::filesystem::recursive_directory_iterator(path_))
                n += entry.is_regular_file() ? 1 : 0;
            return n;
        }

    private:
        std::filesystem::path path_;
    };

    inline TableSchema order_schema()
    {
        TableSchema schema;
        schema.fields = {
            {"order_id", FieldType::Integer, FieldMode::Required, ""},
            {"customer", FieldType::String, FieldMode::Nullable, ""},
            {"amount", FieldType::Float, FieldMode::Nullable, ""},
            {"priority", FieldType::Boolean, FieldMode::Nullable, ""},
            {"placed_at", FieldType::Timestamp, FieldMode::Nullable, ""}};
        return schema;
    }

    // Every fifth row has a NULL customer, every seventh a NULL amount
    inline std::vector<TableRow> order_rows(size_t n)
    {
        std::vector<TableRow> rows;
        rows.reserve(n);
        for (size_t i = 0; i < n; ++i)
        {
            TableRow row;
            row.set("order_id", static_cast<int64_t>(i));
            if (i % 5 != 0)
                row.set("customer", "customer, \"" + std::to_string(i) + "\"");
            if (i % 7 != 0)
                row.set("amount", static_cast<double>(i) * 1.25);
            row.set("priority", i % 2 == 0);
            row.set("placed_at", Timestamp{1'700'000'000'000'000LL + static_cast<int64_t>(i) * 1'000});
            rows.push_back(std::move(row));
        }
        return rows;
    }

    inline std::vector<TableRow> sorted(std::vector<TableRow> rows)
    {
        std::sort(rows.begin(), rows.end());
        return rows;
    }

    inline PipelineOptions test_options(const std::string &temp_location, size_t num_workers = 4)
    {
        PipelineOptions options;
        options.project = "test-project";
        options.temp_location = temp_location;
        options.job_name = "unit-test";
        options.num_workers = num_workers;
        return options;
    }

} // namespace BulkBridge
