#pragma once

// ============================================================================
// Benchmarker — RAII stage timer
// ============================================================================
//
//   std::vector<BenchmarkResult> timings;
//   {
//       Benchmarker b("Stage", rows.size(), timings);
//       stage_rows();
//   }   // <- duration recorded here, even if stage_rows() throws
//
// The results vector is owned by the orchestrating thread; do not share
// one vector between concurrently running Benchmarkers.
// ============================================================================

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace BulkBridge
{

    struct BenchmarkResult
    {
        std::string label;
        long long duration_ns;
        size_t item_count; // rows (or files) handled by the stage

        double duration_ms() const
        {
            return static_cast<double>(duration_ns) / 1'000'000.0;
        }

        double items_per_second() const
        {
            if (duration_ns == 0)
                return 0.0;
            return static_cast<double>(item_count) * 1'000'000'000.0 / static_cast<double>(duration_ns);
        }
    };

    class Benchmarker
    {
    public:
        using Clock = std::chrono::steady_clock;

        Benchmarker(std::string label, size_t item_count, std::vector<BenchmarkResult> &results)
            : label_(std::move(label)), item_count_(item_count), results_(results), start_(Clock::now())
        {
        }

        ~Benchmarker()
        {
            auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_).count();
            results_.push_back({label_, ns, item_count_});
        }

        // The item count is often only known once the stage is done
        void set_item_count(size_t n) { item_count_ = n; }

        Benchmarker(const Benchmarker &) = delete;
        Benchmarker &operator=(const Benchmarker &) = delete;

    private:
        std::string label_;
        size_t item_count_;
        std::vector<BenchmarkResult> &results_;
        Clock::time_point start_;
    };

    inline void print_benchmark_report(const std::string &title, const std::vector<BenchmarkResult> &results)
    {
        std::cout << "\n";
        std::cout << "╔══════════════════════════════════════════════════════╗\n";
        std::cout << "║ " << std::left << std::setw(52) << title << " ║\n";
        std::cout << "╠══════════════════╦══════════════╦════════╦═══════════╣\n";
        std::cout << "║ Stage            ║ Duration(ms) ║ Items  ║ items/sec ║\n";
        std::cout << "╠══════════════════╬══════════════╬════════╬═══════════╣\n";

        long long total_ns = 0;
        for (const auto &r : results)
        {
            total_ns += r.duration_ns;
            std::cout << "║ " << std::left << std::setw(16) << r.label
                      << " ║ " << std::right << std::fixed << std::setprecision(3) << std::setw(12) << r.duration_ms()
                      << " ║ " << std::setw(6) << r.item_count
                      << " ║ " << std::setprecision(0) << std::setw(9) << r.items_per_second()
                      << " ║\n";
        }

        std::cout << "╠══════════════════╬══════════════╬════════╬═══════════╣\n";
        std::cout << "║ " << std::left << std::setw(16) << "TOTAL"
                  << " ║ " << std::right << std::fixed << std::setprecision(3) << std::setw(12)
                  << static_cast<double>(total_ns) / 1'000'000.0
                  << " ║        ║           ║\n";
        std::cout << "╚══════════════════╩══════════════╩════════╩═══════════╝\n\n";
    }

} // namespace BulkBridge
