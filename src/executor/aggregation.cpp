#include "pesadb/executor/aggregation.hpp"

#include "pesadb/common/sql_errors.hpp"

#include <limits>
#include <utility>

namespace pesadb::executor {

using parser::AggregateFunction;
using storage::ColumnType;
using storage::Value;

AggregationEngine::AggregationEngine(Config config)
    : config_{std::move(config)}
{
    for (const auto& definition : config_.aggregates) {
        const bool summing = definition.function == AggregateFunction::Sum || definition.function == AggregateFunction::Avg;
        if (!summing || !definition.column_ordinal) {
            continue;
        }
        if (definition.column_type == ColumnType::String || definition.column_type == ColumnType::Bool) {
            throw SqlError{SqlErrc::TypeMismatch,
                           std::string{parser::aggregate_function_name(definition.function)} +
                               " requires a numeric column but " + definition.name + " is " +
                               std::string{storage::column_type_name(definition.column_type)}};
        }
    }

    if (config_.group_columns.empty()) {
        GroupEntry entry{};
        entry.accumulators.resize(config_.aggregates.size());
        groups_.push_back(std::move(entry));
    }
}

AggregationEngine::GroupEntry& AggregationEngine::group_for(const storage::Row& row)
{
    if (config_.group_columns.empty()) {
        return groups_.front();
    }

    storage::Row keys;
    keys.reserve(config_.group_columns.size());
    for (const auto ordinal : config_.group_columns) {
        keys.push_back(row.at(ordinal));
    }

    const auto it = group_index_.find(keys);
    if (it != group_index_.end()) {
        return groups_[it->second];
    }

    group_index_.emplace(keys, groups_.size());
    GroupEntry entry{};
    entry.keys = std::move(keys);
    entry.accumulators.resize(config_.aggregates.size());
    groups_.push_back(std::move(entry));
    return groups_.back();
}

void AggregationEngine::consume(const storage::Row& row)
{
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_aggregation_input_row();
    }

    auto& group = group_for(row);
    ++group.row_count;
    for (std::size_t index = 0U; index < config_.aggregates.size(); ++index) {
        accumulate(config_.aggregates[index], group.accumulators[index], row);
    }
}

void AggregationEngine::accumulate(const AggregateDefinition& definition, Accumulator& accumulator, const storage::Row& row)
{
    if (!definition.column_ordinal) {
        ++accumulator.count;
        return;
    }

    const auto& value = row.at(*definition.column_ordinal);
    if (storage::is_null(value)) {
        return;
    }
    ++accumulator.count;

    switch (definition.function) {
    case AggregateFunction::Count:
        break;
    case AggregateFunction::Sum:
    case AggregateFunction::Avg:
        if (const auto* integer = std::get_if<std::int64_t>(&value)) {
            const auto current = accumulator.integer_sum;
            const bool overflow = (*integer > 0 && current > std::numeric_limits<std::int64_t>::max() - *integer) ||
                                  (*integer < 0 && current < std::numeric_limits<std::int64_t>::min() - *integer);
            if (overflow && definition.function == AggregateFunction::Sum) {
                throw SqlError{SqlErrc::ExecutionFailed, definition.name + " overflows a 64-bit integer"};
            }
            if (!overflow) {
                accumulator.integer_sum += *integer;
            }
        }
        accumulator.real_sum += storage::numeric_value(value);
        break;
    case AggregateFunction::Min:
        if (storage::is_null(accumulator.extreme) || storage::compare_values(value, accumulator.extreme) < 0) {
            accumulator.extreme = value;
        }
        break;
    case AggregateFunction::Max:
        if (storage::is_null(accumulator.extreme) || storage::compare_values(value, accumulator.extreme) > 0) {
            accumulator.extreme = value;
        }
        break;
    }
}

Value AggregationEngine::project(const AggregateDefinition& definition, const Accumulator& accumulator) const
{
    switch (definition.function) {
    case AggregateFunction::Count:
        return Value{static_cast<std::int64_t>(accumulator.count)};
    case AggregateFunction::Sum:
        if (accumulator.count == 0U) {
            return Value{};
        }
        if (definition.column_type == ColumnType::Int) {
            return Value{accumulator.integer_sum};
        }
        return Value{accumulator.real_sum};
    case AggregateFunction::Avg:
        if (accumulator.count == 0U) {
            return Value{};
        }
        return Value{accumulator.real_sum / static_cast<double>(accumulator.count)};
    case AggregateFunction::Min:
    case AggregateFunction::Max:
    default:
        return accumulator.extreme;
    }
}

std::vector<AggregateGroup> AggregationEngine::finish()
{
    std::vector<AggregateGroup> result;
    result.reserve(groups_.size());
    for (auto& entry : groups_) {
        AggregateGroup group{};
        group.keys = std::move(entry.keys);
        group.row_count = entry.row_count;
        group.results.reserve(config_.aggregates.size());
        for (std::size_t index = 0U; index < config_.aggregates.size(); ++index) {
            group.results.push_back(project(config_.aggregates[index], entry.accumulators[index]));
        }
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_aggregation_group_emitted();
        }
        result.push_back(std::move(group));
    }

    groups_.clear();
    group_index_.clear();
    return result;
}

}  // namespace pesadb::executor
