#include "pesadb/executor/executor_telemetry.hpp"

#include <initializer_list>

namespace pesadb::executor {

ExecutorTelemetry::LatencyScope::LatencyScope(ExecutorTelemetry* telemetry, Operator op) noexcept
    : telemetry_{telemetry}
    , operator_{op}
{
    if (telemetry_ != nullptr) {
        start_ = std::chrono::steady_clock::now();
    }
}

ExecutorTelemetry::LatencyScope::~LatencyScope()
{
    if (telemetry_ == nullptr) {
        return;
    }
    const auto end = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
    const auto duration_ns = elapsed.count() > 0 ? static_cast<std::uint64_t>(elapsed.count()) : 0ULL;
    telemetry_->record_latency(operator_, duration_ns);
}

void ExecutorTelemetry::record_seq_scan_row() noexcept
{
    seq_scan_rows_read_.fetch_add(1U, std::memory_order_relaxed);
}

void ExecutorTelemetry::record_index_lookup(std::size_t rows_returned) noexcept
{
    index_lookups_.fetch_add(1U, std::memory_order_relaxed);
    index_rows_returned_.fetch_add(static_cast<std::uint64_t>(rows_returned), std::memory_order_relaxed);
}

void ExecutorTelemetry::record_filter_row(bool passed) noexcept
{
    filter_rows_evaluated_.fetch_add(1U, std::memory_order_relaxed);
    if (passed) {
        filter_rows_passed_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void ExecutorTelemetry::record_projection_row() noexcept
{
    projection_rows_emitted_.fetch_add(1U, std::memory_order_relaxed);
}

void ExecutorTelemetry::record_nested_loop_compare(bool matched) noexcept
{
    nested_loop_rows_compared_.fetch_add(1U, std::memory_order_relaxed);
    if (matched) {
        nested_loop_rows_matched_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void ExecutorTelemetry::record_aggregation_input_row() noexcept
{
    aggregation_input_rows_.fetch_add(1U, std::memory_order_relaxed);
}

void ExecutorTelemetry::record_aggregation_group_emitted() noexcept
{
    aggregation_groups_emitted_.fetch_add(1U, std::memory_order_relaxed);
}

void ExecutorTelemetry::record_sort(std::size_t rows) noexcept
{
    sort_rows_.fetch_add(static_cast<std::uint64_t>(rows), std::memory_order_relaxed);
}

void ExecutorTelemetry::record_insert_attempt() noexcept
{
    insert_rows_attempted_.fetch_add(1U, std::memory_order_relaxed);
}

void ExecutorTelemetry::record_insert_success() noexcept
{
    insert_rows_succeeded_.fetch_add(1U, std::memory_order_relaxed);
}

void ExecutorTelemetry::record_update_attempt(std::size_t rows) noexcept
{
    update_rows_attempted_.fetch_add(static_cast<std::uint64_t>(rows), std::memory_order_relaxed);
}

void ExecutorTelemetry::record_update_success(std::size_t rows) noexcept
{
    update_rows_succeeded_.fetch_add(static_cast<std::uint64_t>(rows), std::memory_order_relaxed);
}

void ExecutorTelemetry::record_delete_attempt(std::size_t rows) noexcept
{
    delete_rows_attempted_.fetch_add(static_cast<std::uint64_t>(rows), std::memory_order_relaxed);
}

void ExecutorTelemetry::record_delete_success(std::size_t rows) noexcept
{
    delete_rows_succeeded_.fetch_add(static_cast<std::uint64_t>(rows), std::memory_order_relaxed);
}

void ExecutorTelemetry::record_flush(bool succeeded) noexcept
{
    if (succeeded) {
        flushes_succeeded_.fetch_add(1U, std::memory_order_relaxed);
    } else {
        flushes_failed_.fetch_add(1U, std::memory_order_relaxed);
    }
}

void ExecutorTelemetry::record_latency(Operator op, std::uint64_t duration_ns) noexcept
{
    const auto index = static_cast<std::size_t>(op);
    if (index >= latencies_.size()) {
        return;
    }
    auto& counters = latencies_[index];
    counters.invocations.fetch_add(1U, std::memory_order_relaxed);
    counters.total_duration_ns.fetch_add(duration_ns, std::memory_order_relaxed);
    counters.last_duration_ns.store(duration_ns, std::memory_order_relaxed);
}

ExecutorTelemetrySnapshot ExecutorTelemetry::snapshot() const noexcept
{
    ExecutorTelemetrySnapshot snapshot{};
    snapshot.seq_scan_rows_read = seq_scan_rows_read_.load(std::memory_order_relaxed);
    snapshot.index_lookups = index_lookups_.load(std::memory_order_relaxed);
    snapshot.index_rows_returned = index_rows_returned_.load(std::memory_order_relaxed);
    snapshot.filter_rows_evaluated = filter_rows_evaluated_.load(std::memory_order_relaxed);
    snapshot.filter_rows_passed = filter_rows_passed_.load(std::memory_order_relaxed);
    snapshot.projection_rows_emitted = projection_rows_emitted_.load(std::memory_order_relaxed);
    snapshot.nested_loop_rows_compared = nested_loop_rows_compared_.load(std::memory_order_relaxed);
    snapshot.nested_loop_rows_matched = nested_loop_rows_matched_.load(std::memory_order_relaxed);
    snapshot.aggregation_input_rows = aggregation_input_rows_.load(std::memory_order_relaxed);
    snapshot.aggregation_groups_emitted = aggregation_groups_emitted_.load(std::memory_order_relaxed);
    snapshot.sort_rows = sort_rows_.load(std::memory_order_relaxed);
    snapshot.insert_rows_attempted = insert_rows_attempted_.load(std::memory_order_relaxed);
    snapshot.insert_rows_succeeded = insert_rows_succeeded_.load(std::memory_order_relaxed);
    snapshot.update_rows_attempted = update_rows_attempted_.load(std::memory_order_relaxed);
    snapshot.update_rows_succeeded = update_rows_succeeded_.load(std::memory_order_relaxed);
    snapshot.delete_rows_attempted = delete_rows_attempted_.load(std::memory_order_relaxed);
    snapshot.delete_rows_succeeded = delete_rows_succeeded_.load(std::memory_order_relaxed);
    snapshot.flushes_succeeded = flushes_succeeded_.load(std::memory_order_relaxed);
    snapshot.flushes_failed = flushes_failed_.load(std::memory_order_relaxed);

    const auto make_latency_snapshot = [&](Operator operator_kind) {
        ExecutorTelemetrySnapshot::OperatorLatencySnapshot latency{};
        const auto index = static_cast<std::size_t>(operator_kind);
        if (index < latencies_.size()) {
            const auto& counters = latencies_[index];
            latency.invocations = counters.invocations.load(std::memory_order_relaxed);
            latency.total_duration_ns = counters.total_duration_ns.load(std::memory_order_relaxed);
            latency.last_duration_ns = counters.last_duration_ns.load(std::memory_order_relaxed);
        }
        return latency;
    };

    snapshot.seq_scan_latency = make_latency_snapshot(Operator::SeqScan);
    snapshot.index_lookup_latency = make_latency_snapshot(Operator::IndexLookup);
    snapshot.filter_latency = make_latency_snapshot(Operator::Filter);
    snapshot.nested_loop_latency = make_latency_snapshot(Operator::NestedLoopJoin);
    snapshot.aggregation_latency = make_latency_snapshot(Operator::Aggregation);
    snapshot.sort_latency = make_latency_snapshot(Operator::Sort);
    snapshot.projection_latency = make_latency_snapshot(Operator::Projection);
    snapshot.insert_latency = make_latency_snapshot(Operator::Insert);
    snapshot.update_latency = make_latency_snapshot(Operator::Update);
    snapshot.delete_latency = make_latency_snapshot(Operator::Delete);
    snapshot.flush_latency = make_latency_snapshot(Operator::Flush);

    return snapshot;
}

void ExecutorTelemetry::reset() noexcept
{
    for (auto* counter : {&seq_scan_rows_read_,
                          &index_lookups_,
                          &index_rows_returned_,
                          &filter_rows_evaluated_,
                          &filter_rows_passed_,
                          &projection_rows_emitted_,
                          &nested_loop_rows_compared_,
                          &nested_loop_rows_matched_,
                          &aggregation_input_rows_,
                          &aggregation_groups_emitted_,
                          &sort_rows_,
                          &insert_rows_attempted_,
                          &insert_rows_succeeded_,
                          &update_rows_attempted_,
                          &update_rows_succeeded_,
                          &delete_rows_attempted_,
                          &delete_rows_succeeded_,
                          &flushes_succeeded_,
                          &flushes_failed_}) {
        counter->store(0U, std::memory_order_relaxed);
    }

    for (auto& latency : latencies_) {
        latency.invocations.store(0U, std::memory_order_relaxed);
        latency.total_duration_ns.store(0U, std::memory_order_relaxed);
        latency.last_duration_ns.store(0U, std::memory_order_relaxed);
    }
}

}  // namespace pesadb::executor
