#pragma once

// ============================================================================
// DataGenerator — synthetic trade rows for the demo driver and benchmarks
// ============================================================================
//
// Prices follow a per-symbol random walk, timestamps advance by a random gap
// of 5-50 µs, and some symbols are drawn more often than others. The same
// seed always yields the same rows.
// ============================================================================

#include <chrono>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include "../model/TableRow.hpp"
#include "../model/TableSchema.hpp"

namespace BulkBridge
{

    class DataGenerator
    {
    public:
        // trade_id REQUIRED INTEGER, symbol, price, volume, is_pro, traded_at
        static TableSchema trade_schema()
        {
            TableSchema schema;
            schema.fields = {
                {"trade_id", FieldType::Integer, FieldMode::Required, "exchange trade id"},
                {"symbol", FieldType::String, FieldMode::Required, ""},
                {"price", FieldType::Float, FieldMode::Nullable, ""},
                {"volume", FieldType::Integer, FieldMode::Nullable, ""},
                {"is_pro", FieldType::Boolean, FieldMode::Nullable, "institutional order"},
                {"traded_at", FieldType::Timestamp, FieldMode::Nullable, ""}};
            return schema;
        }

        static std::vector<TableRow> generate(size_t num_rows = 100'000, uint64_t seed = 42)
        {
            std::cout << "[GENERATOR] Generating " << num_rows << " synthetic trade rows...\n";
            auto gen_start = std::chrono::steady_clock::now();

            std::mt19937_64 rng(seed);

            // RELIANCE and TCS three times as often as the rest
            const std::vector<std::string> symbols = {
                "RELIANCE", "RELIANCE", "RELIANCE",
                "TCS", "TCS", "TCS",
                "INFY", "INFY",
                "HDFC", "HDFC",
                "WIPRO",
                "ICICIBANK",
                "SBIN"};
            std::uniform_int_distribution<size_t> symbol_dist(0, symbols.size() - 1);
            std::normal_distribution<double> price_change_dist(0.0, 0.5);
            std::uniform_int_distribution<int64_t> volume_dist(10, 5000);
            std::uniform_int_distribution<int> pro_dist(0, 4);
            std::uniform_int_distribution<int64_t> gap_dist(5, 50); // µs

            std::unordered_map<std::string, double> prices = {
                {"RELIANCE", 2456.75},
                {"TCS", 3567.50},
                {"INFY", 1423.25},
                {"HDFC", 1678.90},
                {"WIPRO", 432.60},
                {"ICICIBANK", 987.45},
                {"SBIN", 601.75}};

            // 2023-10-25 03:45:00 UTC (09:15 IST market open)
            int64_t micros = 1698205500000000LL;

            std::vector<TableRow> rows;
            rows.reserve(num_rows);
            for (size_t i = 0; i < num_rows; ++i)
            {
                const std::string &symbol = symbols[symbol_dist(rng)];

                double &price = prices[symbol];
                price += price_change_dist(rng);
                if (price < 50.0)
                    price = 50.0;

                micros += gap_dist(rng);

                TableRow row;
                row.set("trade_id", static_cast<int64_t>(1'000'000 + i))
                    .set("symbol", symbol)
                    .set("price", price)
                    .set("volume", volume_dist(rng))
                    .set("is_pro", pro_dist(rng) == 0)
                    .set("traded_at", Timestamp{micros});
                rows.push_back(std::move(row));
            }

            auto gen_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - gen_start)
                              .count();
            std::cout << "[GENERATOR] Done: " << rows.size() << " rows in " << gen_ms << "ms\n";
            return rows;
        }
    };

} // namespace BulkBridge
