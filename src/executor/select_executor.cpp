#include "pesadb/executor/select_executor.hpp"

#include "pesadb/common/sql_errors.hpp"
#include "pesadb/executor/aggregation.hpp"
#include "pesadb/executor/expression_evaluator.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

namespace pesadb::executor {

namespace {

using parser::AggregateExpression;
using parser::ColumnExpression;
using parser::ColumnReference;
using parser::Expression;
using storage::Row;
using storage::Value;

struct SourceRow final {
    const Row* left = nullptr;
    const Row* right = nullptr;
};

struct BoundColumn final {
    bool right = false;
    std::size_t ordinal = 0U;
};

// Resolves references against FROM and, for joins, the joined table. Unqualified names prefer
// the FROM table.
class SourceBinding final {
public:
    SourceBinding(const storage::Table& left, const storage::Table* right) noexcept
        : left_{left}
        , right_{right}
    {}

    [[nodiscard]] BoundColumn bind(const ColumnReference& reference) const
    {
        if (reference.table) {
            if (*reference.table == left_.name()) {
                if (const auto ordinal = left_.column_index(reference.column)) {
                    return BoundColumn{false, *ordinal};
                }
                missing(reference);
            }
            if (right_ != nullptr && *reference.table == right_->name()) {
                if (const auto ordinal = right_->column_index(reference.column)) {
                    return BoundColumn{true, *ordinal};
                }
                missing(reference);
            }
            throw SqlError{SqlErrc::ColumnNotFound,
                           "Unknown table '" + *reference.table + "' in column reference '" +
                               parser::format_column_reference(reference) + "'",
                           reference.position};
        }

        if (const auto ordinal = left_.column_index(reference.column)) {
            return BoundColumn{false, *ordinal};
        }
        if (right_ != nullptr) {
            if (const auto ordinal = right_->column_index(reference.column)) {
                return BoundColumn{true, *ordinal};
            }
        }
        missing(reference);
    }

    [[nodiscard]] const storage::ColumnDefinition& definition(const BoundColumn& column) const
    {
        const auto& table = column.right ? *right_ : left_;
        return table.columns()[column.ordinal];
    }

    [[nodiscard]] static const Value& fetch(const BoundColumn& column, const SourceRow& row)
    {
        return column.right ? (*row.right)[column.ordinal] : (*row.left)[column.ordinal];
    }

    [[nodiscard]] const storage::Table& left() const noexcept { return left_; }
    [[nodiscard]] const storage::Table* right() const noexcept { return right_; }

private:
    [[noreturn]] void missing(const ColumnReference& reference) const
    {
        std::string tables = "'" + left_.name() + "'";
        if (right_ != nullptr) {
            tables += " or '" + right_->name() + "'";
        }
        throw SqlError{SqlErrc::ColumnNotFound,
                       "Column '" + parser::format_column_reference(reference) + "' does not exist in table " + tables,
                       reference.position};
    }

    const storage::Table& left_;
    const storage::Table* right_;
};

class SourceRowResolver final : public ValueResolver {
public:
    SourceRowResolver(const SourceBinding& binding, const SourceRow& row) noexcept
        : binding_{binding}
        , row_{row}
    {}

    [[nodiscard]] Value resolve_column(const ColumnReference& reference) const override
    {
        return SourceBinding::fetch(binding_.bind(reference), row_);
    }

private:
    const SourceBinding& binding_;
    const SourceRow& row_;
};

template <typename OnColumn, typename OnAggregate>
void walk(const Expression& expression, const OnColumn& on_column, const OnAggregate& on_aggregate)
{
    const auto child = [&](const parser::ExpressionPtr& node) {
        if (node) {
            walk(*node, on_column, on_aggregate);
        }
    };

    std::visit(parser::Overloaded{[&](const parser::LiteralExpression&) {},
                                  [&](const ColumnExpression& node) { on_column(node.reference); },
                                  [&](const AggregateExpression& node) { on_aggregate(node, expression.position); },
                                  [&](const parser::ComparisonExpression& node) {
                                      child(node.left);
                                      child(node.right);
                                  },
                                  [&](const parser::AndExpression& node) {
                                      child(node.left);
                                      child(node.right);
                                  },
                                  [&](const parser::OrExpression& node) {
                                      child(node.left);
                                      child(node.right);
                                  },
                                  [&](const parser::NotExpression& node) { child(node.operand); },
                                  [&](const parser::IsNullExpression& node) { child(node.operand); },
                                  [&](const parser::BetweenExpression& node) {
                                      child(node.operand);
                                      child(node.low);
                                      child(node.high);
                                  },
                                  [&](const parser::InListExpression& node) { child(node.operand); },
                                  [&](const parser::LikeExpression& node) {
                                      child(node.operand);
                                      child(node.pattern);
                                  }},
               expression.node);
}

// Binds every column reference up front so missing columns fail even on empty tables.
void check_row_expression(const Expression& expression, const SourceBinding& binding, const char* clause)
{
    walk(
        expression,
        [&](const ColumnReference& reference) { static_cast<void>(binding.bind(reference)); },
        [&](const AggregateExpression& aggregate, std::size_t position) {
            throw SqlError{SqlErrc::AmbiguousAggregation,
                           "Aggregate " + parser::format_aggregate(aggregate) + " is not allowed in " + clause, position};
        });
}

struct IndexProbe final {
    const storage::HashIndex* index = nullptr;
    Value key{};
};

[[nodiscard]] std::optional<IndexProbe> index_probe(const storage::Table& table, const Expression& where)
{
    const auto* comparison = std::get_if<parser::ComparisonExpression>(&where.node);
    if (comparison == nullptr || comparison->op != parser::ComparisonOperator::Equal) {
        return std::nullopt;
    }

    const auto* column = std::get_if<ColumnExpression>(&comparison->left->node);
    const auto* literal = std::get_if<parser::LiteralExpression>(&comparison->right->node);
    if (column == nullptr || literal == nullptr) {
        column = std::get_if<ColumnExpression>(&comparison->right->node);
        literal = std::get_if<parser::LiteralExpression>(&comparison->left->node);
    }
    if (column == nullptr || literal == nullptr) {
        return std::nullopt;
    }

    const auto& reference = column->reference;
    if (reference.table && *reference.table != table.name()) {
        return std::nullopt;
    }
    const auto ordinal = table.column_index(reference.column);
    if (!ordinal) {
        return std::nullopt;
    }
    const auto* index = table.index_for(*ordinal);
    if (index == nullptr) {
        return std::nullopt;
    }

    // NULL = x is never True; an empty key set yields no rows.
    if (storage::is_null(literal->value)) {
        return IndexProbe{index, Value{}};
    }
    auto key = storage::coerce_to_column(literal->value, table.columns()[*ordinal].type);
    if (!key) {
        return std::nullopt;
    }
    return IndexProbe{index, std::move(*key)};
}

struct OutputRecord final {
    Row values{};
    std::vector<Value> sort_keys{};
};

[[nodiscard]] std::optional<std::size_t> find_output(const std::vector<std::string>& columns, const std::string& name)
{
    const auto it = std::find(columns.begin(), columns.end(), name);
    if (it == columns.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(columns.begin(), it));
}

[[nodiscard]] std::string output_name(const parser::SelectItem& item)
{
    if (item.alias) {
        return *item.alias;
    }
    if (const auto* column = std::get_if<ColumnExpression>(&item.expression->node)) {
        return parser::format_column_reference(column->reference);
    }
    return parser::format_aggregate(std::get<AggregateExpression>(item.expression->node));
}

void sort_records(std::vector<OutputRecord>& records, const parser::SelectCommand& select, ExecutorTelemetry* telemetry)
{
    if (select.order_by.empty()) {
        return;
    }

    ExecutorTelemetry::LatencyScope latency{telemetry, ExecutorTelemetry::Operator::Sort};
    std::stable_sort(records.begin(), records.end(), [&](const OutputRecord& lhs, const OutputRecord& rhs) {
        for (std::size_t index = 0U; index < select.order_by.size(); ++index) {
            const auto& left = lhs.sort_keys[index];
            const auto& right = rhs.sort_keys[index];
            const bool left_null = storage::is_null(left);
            const bool right_null = storage::is_null(right);
            if (left_null || right_null) {
                if (left_null == right_null) {
                    continue;
                }
                return right_null;
            }

            auto order = storage::compare_values(left, right);
            if (select.order_by[index].direction == parser::SortDirection::Descending) {
                order = -order;
            }
            if (order != 0) {
                return order < 0;
            }
        }
        return false;
    });

    if (telemetry != nullptr) {
        telemetry->record_sort(records.size());
    }
}

[[nodiscard]] QueryResult finalize(std::vector<std::string> columns,
                                   std::vector<OutputRecord> records,
                                   const parser::SelectCommand& select,
                                   ExecutorTelemetry* telemetry)
{
    if (select.distinct) {
        std::unordered_set<Row, storage::RowHash> seen;
        std::vector<OutputRecord> unique;
        unique.reserve(records.size());
        for (auto& record : records) {
            if (seen.insert(record.values).second) {
                unique.push_back(std::move(record));
            }
        }
        records = std::move(unique);
    }

    sort_records(records, select, telemetry);

    QueryResult result{};
    result.columns = std::move(columns);
    const auto offset = std::min<std::uint64_t>(select.offset.value_or(0U), records.size());
    auto end = static_cast<std::uint64_t>(records.size());
    if (select.limit) {
        end = std::min<std::uint64_t>(end, offset + *select.limit);
    }

    result.rows.reserve(static_cast<std::size_t>(end - offset));
    for (auto index = offset; index < end; ++index) {
        result.rows.push_back(std::move(records[static_cast<std::size_t>(index)].values));
        if (telemetry != nullptr) {
            telemetry->record_projection_row();
        }
    }
    return result;
}

[[nodiscard]] std::vector<SourceRow> collect_source_rows(const parser::SelectCommand& select,
                                                         const SourceBinding& binding,
                                                         ExecutorTelemetry* telemetry)
{
    std::vector<SourceRow> rows;
    const auto& left = binding.left();

    if (binding.right() == nullptr) {
        const auto ids = select_matching_rows(left, select.where.get(), telemetry);
        rows.reserve(ids.size());
        for (const auto row_id : ids) {
            rows.push_back(SourceRow{left.find_row(row_id), nullptr});
        }
        return rows;
    }

    const auto& right = *binding.right();
    const auto& condition = *select.join->condition;
    {
        ExecutorTelemetry::LatencyScope latency{telemetry, ExecutorTelemetry::Operator::NestedLoopJoin};
        for (const auto& [left_id, left_row] : left.rows()) {
            for (const auto& [right_id, right_row] : right.rows()) {
                const SourceRow candidate{&left_row, &right_row};
                const SourceRowResolver resolver{binding, candidate};
                const bool matched = evaluate_predicate(condition, resolver) == Logic::True;
                if (telemetry != nullptr) {
                    telemetry->record_nested_loop_compare(matched);
                }
                if (matched) {
                    rows.push_back(candidate);
                }
            }
        }
    }

    if (!select.where) {
        return rows;
    }

    ExecutorTelemetry::LatencyScope latency{telemetry, ExecutorTelemetry::Operator::Filter};
    std::vector<SourceRow> filtered;
    filtered.reserve(rows.size());
    for (const auto& row : rows) {
        const SourceRowResolver resolver{binding, row};
        const bool passed = evaluate_predicate(*select.where, resolver) == Logic::True;
        if (telemetry != nullptr) {
            telemetry->record_filter_row(passed);
        }
        if (passed) {
            filtered.push_back(row);
        }
    }
    return filtered;
}

[[nodiscard]] QueryResult execute_plain_select(const parser::SelectCommand& select,
                                               const SourceBinding& binding,
                                               ExecutorTelemetry* telemetry)
{
    const auto& left = binding.left();
    const auto* right = binding.right();

    std::vector<std::string> columns;
    std::vector<BoundColumn> projection;
    if (select.select_all) {
        for (std::size_t ordinal = 0U; ordinal < left.column_count(); ++ordinal) {
            const auto& name = left.columns()[ordinal].name;
            columns.push_back(right != nullptr ? left.name() + "." + name : name);
            projection.push_back(BoundColumn{false, ordinal});
        }
        if (right != nullptr) {
            for (std::size_t ordinal = 0U; ordinal < right->column_count(); ++ordinal) {
                columns.push_back(right->name() + "." + right->columns()[ordinal].name);
                projection.push_back(BoundColumn{true, ordinal});
            }
        }
    } else {
        for (const auto& item : select.items) {
            const auto& column = std::get<ColumnExpression>(item.expression->node);
            projection.push_back(binding.bind(column.reference));
            columns.push_back(output_name(item));
        }
    }

    struct SortSource final {
        std::optional<std::size_t> output{};
        BoundColumn source{};
    };
    std::vector<SortSource> sort_sources;
    for (const auto& item : select.order_by) {
        const auto& column = std::get<ColumnExpression>(item.expression->node);
        SortSource sort_source{};
        sort_source.output = find_output(columns, parser::format_column_reference(column.reference));
        if (!sort_source.output) {
            sort_source.source = binding.bind(column.reference);
        }
        sort_sources.push_back(sort_source);
    }

    const auto source_rows = collect_source_rows(select, binding, telemetry);

    ExecutorTelemetry::LatencyScope latency{telemetry, ExecutorTelemetry::Operator::Projection};
    std::vector<OutputRecord> records;
    records.reserve(source_rows.size());
    for (const auto& source_row : source_rows) {
        OutputRecord record{};
        record.values.reserve(projection.size());
        for (const auto& column : projection) {
            record.values.push_back(SourceBinding::fetch(column, source_row));
        }
        for (const auto& sort_source : sort_sources) {
            record.sort_keys.push_back(sort_source.output ? record.values[*sort_source.output]
                                                          : SourceBinding::fetch(sort_source.source, source_row));
        }
        records.push_back(std::move(record));
    }

    return finalize(std::move(columns), std::move(records), select, telemetry);
}

// Registers each distinct aggregate once; the same function over the same column shares a slot.
class AggregateSlots final {
public:
    explicit AggregateSlots(const SourceBinding& binding) noexcept
        : binding_{binding}
    {}

    std::size_t slot_for(const AggregateExpression& aggregate)
    {
        AggregateDefinition definition{};
        definition.function = aggregate.function;
        definition.name = parser::format_aggregate(aggregate);
        if (aggregate.argument) {
            const auto column = binding_.bind(*aggregate.argument);
            definition.column_ordinal = column.ordinal;
            definition.column_type = binding_.definition(column).type;
        }

        for (std::size_t slot = 0U; slot < definitions_.size(); ++slot) {
            const auto& existing = definitions_[slot];
            if (existing.function == definition.function && existing.column_ordinal == definition.column_ordinal) {
                return slot;
            }
        }
        definitions_.push_back(std::move(definition));
        return definitions_.size() - 1U;
    }

    [[nodiscard]] const std::vector<AggregateDefinition>& definitions() const noexcept { return definitions_; }

private:
    const SourceBinding& binding_;
    std::vector<AggregateDefinition> definitions_{};
};

class GroupResolver final : public ValueResolver {
public:
    GroupResolver(const SourceBinding& binding,
                  const std::vector<std::size_t>& group_columns,
                  AggregateSlots& slots,
                  const AggregateGroup& group) noexcept
        : binding_{binding}
        , group_columns_{group_columns}
        , slots_{slots}
        , group_{group}
    {}

    [[nodiscard]] Value resolve_column(const ColumnReference& reference) const override
    {
        const auto column = binding_.bind(reference);
        for (std::size_t index = 0U; index < group_columns_.size(); ++index) {
            if (group_columns_[index] == column.ordinal) {
                return group_.keys[index];
            }
        }
        throw SqlError{SqlErrc::AmbiguousAggregation,
                       "Column '" + parser::format_column_reference(reference) +
                           "' must appear in GROUP BY or be used inside an aggregate",
                       reference.position};
    }

    [[nodiscard]] Value resolve_aggregate(const AggregateExpression& aggregate) const override
    {
        return group_.results.at(slots_.slot_for(aggregate));
    }

private:
    const SourceBinding& binding_;
    const std::vector<std::size_t>& group_columns_;
    AggregateSlots& slots_;
    const AggregateGroup& group_;
};

[[nodiscard]] std::optional<std::size_t> group_position(const std::vector<std::size_t>& group_columns,
                                                        std::size_t ordinal) noexcept
{
    for (std::size_t index = 0U; index < group_columns.size(); ++index) {
        if (group_columns[index] == ordinal) {
            return index;
        }
    }
    return std::nullopt;
}

[[noreturn]] void not_grouped(const ColumnReference& reference)
{
    throw SqlError{SqlErrc::AmbiguousAggregation,
                   "Column '" + parser::format_column_reference(reference) +
                       "' must appear in GROUP BY or be used inside an aggregate",
                   reference.position};
}

[[nodiscard]] QueryResult execute_grouped_select(const parser::SelectCommand& select,
                                                 const SourceBinding& binding,
                                                 ExecutorTelemetry* telemetry)
{
    if (select.select_all) {
        throw SqlError{SqlErrc::AmbiguousAggregation, "SELECT * cannot be combined with aggregates or GROUP BY"};
    }

    std::vector<std::size_t> group_columns;
    for (const auto& reference : select.group_by) {
        group_columns.push_back(binding.bind(reference).ordinal);
    }

    AggregateSlots slots{binding};

    // Output item i is either a group key position or an aggregate slot.
    struct ItemSource final {
        std::optional<std::size_t> key{};
        std::optional<std::size_t> slot{};
    };
    std::vector<std::string> columns;
    std::vector<ItemSource> items;
    for (const auto& item : select.items) {
        ItemSource source{};
        if (const auto* column = std::get_if<ColumnExpression>(&item.expression->node)) {
            source.key = group_position(group_columns, binding.bind(column->reference).ordinal);
            if (!source.key) {
                not_grouped(column->reference);
            }
        } else {
            source.slot = slots.slot_for(std::get<AggregateExpression>(item.expression->node));
        }
        columns.push_back(output_name(item));
        items.push_back(source);
    }

    if (select.having) {
        walk(
            *select.having,
            [&](const ColumnReference& reference) {
                if (!group_position(group_columns, binding.bind(reference).ordinal)) {
                    not_grouped(reference);
                }
            },
            [&](const AggregateExpression& aggregate, std::size_t) { static_cast<void>(slots.slot_for(aggregate)); });
    }

    struct SortSource final {
        std::optional<std::size_t> output{};
        std::optional<std::size_t> key{};
        std::optional<std::size_t> slot{};
    };
    std::vector<SortSource> sort_sources;
    for (const auto& item : select.order_by) {
        SortSource source{};
        if (const auto* column = std::get_if<ColumnExpression>(&item.expression->node)) {
            source.output = find_output(columns, parser::format_column_reference(column->reference));
            if (!source.output) {
                source.key = group_position(group_columns, binding.bind(column->reference).ordinal);
                if (!source.key) {
                    not_grouped(column->reference);
                }
            }
        } else {
            const auto& aggregate = std::get<AggregateExpression>(item.expression->node);
            source.output = find_output(columns, parser::format_aggregate(aggregate));
            if (!source.output) {
                source.slot = slots.slot_for(aggregate);
            }
        }
        sort_sources.push_back(source);
    }

    const auto source_rows = collect_source_rows(select, binding, telemetry);

    std::vector<AggregateGroup> groups;
    {
        ExecutorTelemetry::LatencyScope latency{telemetry, ExecutorTelemetry::Operator::Aggregation};
        AggregationEngine engine{AggregationEngine::Config{group_columns, slots.definitions(), telemetry}};
        for (const auto& source_row : source_rows) {
            engine.consume(*source_row.left);
        }
        groups = engine.finish();
    }

    std::vector<OutputRecord> records;
    records.reserve(groups.size());
    for (const auto& group : groups) {
        if (select.having) {
            const GroupResolver resolver{binding, group_columns, slots, group};
            const bool passed = evaluate_predicate(*select.having, resolver) == Logic::True;
            if (telemetry != nullptr) {
                telemetry->record_filter_row(passed);
            }
            if (!passed) {
                continue;
            }
        }

        OutputRecord record{};
        for (const auto& item : items) {
            record.values.push_back(item.key ? group.keys[*item.key] : group.results[*item.slot]);
        }
        for (const auto& source : sort_sources) {
            if (source.output) {
                record.sort_keys.push_back(record.values[*source.output]);
            } else if (source.key) {
                record.sort_keys.push_back(group.keys[*source.key]);
            } else {
                record.sort_keys.push_back(group.results[*source.slot]);
            }
        }
        records.push_back(std::move(record));
    }

    return finalize(std::move(columns), std::move(records), select, telemetry);
}

[[nodiscard]] bool is_aggregated(const parser::SelectCommand& select)
{
    if (!select.group_by.empty() || select.having) {
        return true;
    }
    const auto has_aggregate = [](const parser::ExpressionPtr& expression) {
        return std::holds_alternative<AggregateExpression>(expression->node);
    };
    return std::any_of(select.items.begin(), select.items.end(),
                       [&](const parser::SelectItem& item) { return has_aggregate(item.expression); }) ||
           std::any_of(select.order_by.begin(), select.order_by.end(),
                       [&](const parser::OrderByItem& item) { return has_aggregate(item.expression); });
}

}  // namespace

std::vector<storage::RowId> select_matching_rows(const storage::Table& table,
                                                 const parser::Expression* where,
                                                 ExecutorTelemetry* telemetry)
{
    const SourceBinding binding{table, nullptr};
    if (where != nullptr) {
        check_row_expression(*where, binding, "WHERE");

        if (const auto probe = index_probe(table, *where)) {
            ExecutorTelemetry::LatencyScope latency{telemetry, ExecutorTelemetry::Operator::IndexLookup};
            std::vector<storage::RowId> ids;
            if (!storage::is_null(probe->key)) {
                const auto matches = probe->index->lookup(probe->key);
                ids.assign(matches.begin(), matches.end());
                std::sort(ids.begin(), ids.end());
            }
            if (telemetry != nullptr) {
                telemetry->record_index_lookup(ids.size());
            }
            return ids;
        }
    }

    std::vector<storage::RowId> ids;
    ExecutorTelemetry::LatencyScope latency{telemetry, ExecutorTelemetry::Operator::SeqScan};
    for (const auto& [row_id, row] : table.rows()) {
        if (telemetry != nullptr) {
            telemetry->record_seq_scan_row();
        }
        if (where == nullptr) {
            ids.push_back(row_id);
            continue;
        }

        const SourceRow source{&row, nullptr};
        const SourceRowResolver resolver{binding, source};
        const bool passed = evaluate_predicate(*where, resolver) == Logic::True;
        if (telemetry != nullptr) {
            telemetry->record_filter_row(passed);
        }
        if (passed) {
            ids.push_back(row_id);
        }
    }
    return ids;
}

QueryResult execute_select(const parser::SelectCommand& select,
                           const storage::Database& database,
                           ExecutorTelemetry* telemetry)
{
    const auto& left = database.table(select.from);
    const storage::Table* right = select.join ? &database.table(select.join->table) : nullptr;
    // Without table aliases both sides of a self-join would bind to the same columns.
    if (right == &left) {
        throw SqlError{SqlErrc::UnsupportedFeature,
                       "Joining table '" + left.name() + "' with itself requires aliases, which are not supported",
                       select.join->position};
    }
    const SourceBinding binding{left, right};

    if (select.join) {
        check_row_expression(*select.join->condition, binding, "JOIN ... ON");
    }
    if (select.where) {
        check_row_expression(*select.where, binding, "WHERE");
    }

    if (is_aggregated(select)) {
        if (select.join) {
            throw SqlError{SqlErrc::UnsupportedFeature, "Aggregates, GROUP BY and HAVING cannot be combined with JOIN"};
        }
        return execute_grouped_select(select, binding, telemetry);
    }

    return execute_plain_select(select, binding, telemetry);
}

}  // namespace pesadb::executor
