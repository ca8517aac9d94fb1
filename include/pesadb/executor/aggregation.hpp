#pragma once

#include "pesadb/executor/executor_telemetry.hpp"
#include "pesadb/parser/ast.hpp"
#include "pesadb/storage/row.hpp"
#include "pesadb/storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pesadb::executor {

struct AggregateDefinition final {
    parser::AggregateFunction function = parser::AggregateFunction::Count;
    // Empty for COUNT(*).
    std::optional<std::size_t> column_ordinal{};
    storage::ColumnType column_type = storage::ColumnType::Int;
    // Canonical text, e.g. SUM(age).
    std::string name{};
};

struct AggregateGroup final {
    storage::Row keys{};
    std::vector<storage::Value> results{};
    std::size_t row_count = 0U;
};

// Hash aggregation over table rows. Groups are emitted in order of first occurrence; without
// group columns exactly one group is emitted even for empty input.
class AggregationEngine final {
public:
    struct Config final {
        std::vector<std::size_t> group_columns{};
        std::vector<AggregateDefinition> aggregates{};
        ExecutorTelemetry* telemetry = nullptr;
    };

    // Throws SqlError(TypeMismatch) for SUM/AVG over STRING or BOOL columns.
    explicit AggregationEngine(Config config);

    void consume(const storage::Row& row);
    [[nodiscard]] std::vector<AggregateGroup> finish();

private:
    struct Accumulator final {
        std::uint64_t count = 0U;
        std::int64_t integer_sum = 0;
        double real_sum = 0.0;
        storage::Value extreme{};
    };

    struct GroupEntry final {
        storage::Row keys{};
        std::vector<Accumulator> accumulators{};
        std::size_t row_count = 0U;
    };

    void accumulate(const AggregateDefinition& definition, Accumulator& accumulator, const storage::Row& row);
    [[nodiscard]] storage::Value project(const AggregateDefinition& definition, const Accumulator& accumulator) const;
    GroupEntry& group_for(const storage::Row& row);

    Config config_{};
    std::vector<GroupEntry> groups_{};
    std::unordered_map<storage::Row, std::size_t, storage::RowHash> group_index_{};
};

}  // namespace pesadb::executor
