#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace pesadb::executor {

struct ExecutorTelemetrySnapshot final {
    struct OperatorLatencySnapshot final {
        std::uint64_t invocations = 0U;
        std::uint64_t total_duration_ns = 0U;
        std::uint64_t last_duration_ns = 0U;
    };

    std::uint64_t seq_scan_rows_read = 0U;
    std::uint64_t index_lookups = 0U;
    std::uint64_t index_rows_returned = 0U;
    std::uint64_t filter_rows_evaluated = 0U;
    std::uint64_t filter_rows_passed = 0U;
    std::uint64_t projection_rows_emitted = 0U;
    std::uint64_t nested_loop_rows_compared = 0U;
    std::uint64_t nested_loop_rows_matched = 0U;
    std::uint64_t aggregation_input_rows = 0U;
    std::uint64_t aggregation_groups_emitted = 0U;
    std::uint64_t sort_rows = 0U;
    std::uint64_t insert_rows_attempted = 0U;
    std::uint64_t insert_rows_succeeded = 0U;
    std::uint64_t update_rows_attempted = 0U;
    std::uint64_t update_rows_succeeded = 0U;
    std::uint64_t delete_rows_attempted = 0U;
    std::uint64_t delete_rows_succeeded = 0U;
    std::uint64_t flushes_succeeded = 0U;
    std::uint64_t flushes_failed = 0U;

    OperatorLatencySnapshot seq_scan_latency{};
    OperatorLatencySnapshot index_lookup_latency{};
    OperatorLatencySnapshot filter_latency{};
    OperatorLatencySnapshot nested_loop_latency{};
    OperatorLatencySnapshot aggregation_latency{};
    OperatorLatencySnapshot sort_latency{};
    OperatorLatencySnapshot projection_latency{};
    OperatorLatencySnapshot insert_latency{};
    OperatorLatencySnapshot update_latency{};
    OperatorLatencySnapshot delete_latency{};
    OperatorLatencySnapshot flush_latency{};
};

class ExecutorTelemetry final {
public:
    enum class Operator {
        SeqScan = 0,
        IndexLookup,
        Filter,
        NestedLoopJoin,
        Aggregation,
        Sort,
        Projection,
        Insert,
        Update,
        Delete,
        Flush,
        Count
    };

    class LatencyScope final {
    public:
        LatencyScope(ExecutorTelemetry* telemetry, Operator op) noexcept;
        ~LatencyScope();

        LatencyScope(const LatencyScope&) = delete;
        LatencyScope& operator=(const LatencyScope&) = delete;

    private:
        ExecutorTelemetry* telemetry_ = nullptr;
        Operator operator_ = Operator::SeqScan;
        std::chrono::steady_clock::time_point start_{};
    };

    void record_seq_scan_row() noexcept;
    void record_index_lookup(std::size_t rows_returned) noexcept;
    void record_filter_row(bool passed) noexcept;
    void record_projection_row() noexcept;
    void record_nested_loop_compare(bool matched) noexcept;
    void record_aggregation_input_row() noexcept;
    void record_aggregation_group_emitted() noexcept;
    void record_sort(std::size_t rows) noexcept;
    void record_insert_attempt() noexcept;
    void record_insert_success() noexcept;
    void record_update_attempt(std::size_t rows) noexcept;
    void record_update_success(std::size_t rows) noexcept;
    void record_delete_attempt(std::size_t rows) noexcept;
    void record_delete_success(std::size_t rows) noexcept;
    void record_flush(bool succeeded) noexcept;

    void record_latency(Operator op, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] ExecutorTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    struct OperatorLatencyCounters final {
        std::atomic<std::uint64_t> invocations{0U};
        std::atomic<std::uint64_t> total_duration_ns{0U};
        std::atomic<std::uint64_t> last_duration_ns{0U};
    };

    std::atomic<std::uint64_t> seq_scan_rows_read_{0U};
    std::atomic<std::uint64_t> index_lookups_{0U};
    std::atomic<std::uint64_t> index_rows_returned_{0U};
    std::atomic<std::uint64_t> filter_rows_evaluated_{0U};
    std::atomic<std::uint64_t> filter_rows_passed_{0U};
    std::atomic<std::uint64_t> projection_rows_emitted_{0U};
    std::atomic<std::uint64_t> nested_loop_rows_compared_{0U};
    std::atomic<std::uint64_t> nested_loop_rows_matched_{0U};
    std::atomic<std::uint64_t> aggregation_input_rows_{0U};
    std::atomic<std::uint64_t> aggregation_groups_emitted_{0U};
    std::atomic<std::uint64_t> sort_rows_{0U};
    std::atomic<std::uint64_t> insert_rows_attempted_{0U};
    std::atomic<std::uint64_t> insert_rows_succeeded_{0U};
    std::atomic<std::uint64_t> update_rows_attempted_{0U};
    std::atomic<std::uint64_t> update_rows_succeeded_{0U};
    std::atomic<std::uint64_t> delete_rows_attempted_{0U};
    std::atomic<std::uint64_t> delete_rows_succeeded_{0U};
    std::atomic<std::uint64_t> flushes_succeeded_{0U};
    std::atomic<std::uint64_t> flushes_failed_{0U};

    std::array<OperatorLatencyCounters, static_cast<std::size_t>(Operator::Count)> latencies_{};
};

}  // namespace pesadb::executor
