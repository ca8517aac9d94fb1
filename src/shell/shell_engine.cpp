#include "pesadb/shell/shell_engine.hpp"

#include "pesadb/common/sql_errors.hpp"
#include "pesadb/parser/ast.hpp"
#include "pesadb/storage/value.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

using pesadb::executor::MutationResult;
using pesadb::executor::QueryResult;
using pesadb::executor::SchemaDescriptor;
using pesadb::executor::StatementResult;

namespace pesadb::shell {

namespace {

struct RenderedStatement final {
    std::string summary{};
    std::vector<std::string> lines{};
};

[[nodiscard]] std::string plural(std::size_t count, std::string_view noun, std::string_view suffix = "s")
{
    std::string text = std::to_string(count);
    text.push_back(' ');
    text.append(noun);
    if (count != 1U) {
        text.append(suffix);
    }
    return text;
}

[[nodiscard]] std::string describe_constraints(const storage::ColumnDefinition& column)
{
    std::string text;
    auto append = [&](const std::string& part) {
        if (!text.empty()) {
            text.push_back(' ');
        }
        text.append(part);
    };

    if (column.primary_key) {
        append("PRIMARY KEY");
    }
    if (column.unique) {
        append("UNIQUE");
    }
    if (column.references) {
        append("REFERENCES " + column.references->table + "(" + column.references->column + ")");
    }
    return text.empty() ? std::string{"-"} : text;
}

[[nodiscard]] RenderedStatement render_query(const QueryResult& result)
{
    std::vector<std::vector<std::string>> rows;
    rows.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        std::vector<std::string> fields;
        fields.reserve(row.size());
        for (const auto& value : row) {
            fields.push_back(storage::format_value(value));
        }
        rows.push_back(std::move(fields));
    }

    RenderedStatement rendered{};
    rendered.summary = plural(result.rows.size(), "row") + " returned";
    rendered.lines = format_table(result.columns, rows);
    return rendered;
}

[[nodiscard]] RenderedStatement render_schema(const SchemaDescriptor& descriptor)
{
    RenderedStatement rendered{};
    std::vector<std::vector<std::string>> rows;

    switch (descriptor.kind) {
    case SchemaDescriptor::Kind::Databases:
        for (const auto& name : descriptor.names) {
            rows.push_back({name});
        }
        rendered.summary = "Listed " + plural(rows.size(), "database");
        rendered.lines = format_table({"database"}, rows);
        break;
    case SchemaDescriptor::Kind::Tables:
        for (const auto& name : descriptor.names) {
            rows.push_back({name});
        }
        rendered.summary = "Listed " + plural(rows.size(), "table") + " in '" + descriptor.subject + "'";
        rendered.lines = format_table({"table"}, rows);
        break;
    case SchemaDescriptor::Kind::Columns:
    default:
        for (const auto& column : descriptor.columns) {
            rows.push_back({column.name, std::string{storage::column_type_name(column.type)}, describe_constraints(column)});
        }
        rendered.summary = "Table '" + descriptor.subject + "' has " + plural(rows.size(), "column");
        rendered.lines = format_table({"column", "type", "constraints"}, rows);
        break;
    }
    return rendered;
}

[[nodiscard]] RenderedStatement render_statement(const StatementResult& result)
{
    if (!result.success()) {
        RenderedStatement rendered{};
        rendered.summary = std::string{sql_error_kind(result.error)} + ": " + result.message;
        return rendered;
    }

    return std::visit(parser::Overloaded{
                          [](const std::monostate&) { return RenderedStatement{"OK", {}}; },
                          [](const QueryResult& query) { return render_query(query); },
                          [](const MutationResult& mutation) { return RenderedStatement{mutation.message, {}}; },
                          [](const SchemaDescriptor& descriptor) { return render_schema(descriptor); }},
                      result.payload);
}

[[nodiscard]] std::vector<std::string> remediation_hints(const std::error_code& error)
{
    if (error == SqlErrc::NoDatabaseSelected) {
        return {"Run USE <database>; or start the shell with --database."};
    }
    if (error == SqlErrc::SyntaxError) {
        return {"Check the statement near the reported position."};
    }
    if (error == SqlErrc::PersistenceFailed) {
        return {"Check that the data directory is writable."};
    }
    return {};
}

[[nodiscard]] ShellDiagnostic make_diagnostic(const StatementResult& result)
{
    ShellDiagnostic diagnostic{};
    diagnostic.kind = sql_error_kind(result.error);
    diagnostic.message = result.message;
    diagnostic.statement = result.statement;
    diagnostic.position = result.position;
    diagnostic.remediation_hints = remediation_hints(result.error);
    return diagnostic;
}

[[nodiscard]] std::string category_of(const std::vector<StatementResult>& results)
{
    std::optional<parser::CommandCategory> category;
    for (const auto& result : results) {
        if (!result.category) {
            continue;
        }
        if (category && *category != *result.category) {
            return "script";
        }
        category = result.category;
    }
    return category ? parser::command_category_name(*category) : "sql";
}

[[nodiscard]] std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.emplace_back(text.substr(begin, index - begin));
    }
    return tokens;
}

}  // namespace

std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                      const std::vector<std::vector<std::string>>& rows)
{
    const std::size_t column_count = headers.size();
    std::vector<std::size_t> widths(column_count, 0U);
    for (std::size_t i = 0U; i < column_count; ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < column_count && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto make_line = [&](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0U; i < column_count; ++i) {
            if (i > 0U) {
                line.append(" | ");
            }
            const std::string field = (i < fields.size()) ? fields[i] : std::string{};
            line.append(field);
            if (field.size() < widths[i] && i + 1U < column_count) {
                line.append(widths[i] - field.size(), ' ');
            }
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 3U);
    lines.push_back(make_line(headers));

    std::string separator;
    for (std::size_t i = 0U; i < column_count; ++i) {
        if (i > 0U) {
            separator.append("-+-");
        }
        separator.append(widths[i], '-');
    }
    lines.push_back(std::move(separator));

    if (rows.empty()) {
        lines.push_back("(no rows)");
        return lines;
    }

    for (const auto& row : rows) {
        lines.push_back(make_line(row));
    }
    return lines;
}

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
{
    if (config_.catalog == nullptr) {
        throw std::invalid_argument{"ShellEngine requires a catalog"};
    }

    telemetry_ = config_.executor_config.telemetry;
    if (telemetry_ == nullptr) {
        owned_telemetry_ = std::make_unique<executor::ExecutorTelemetry>();
        telemetry_ = owned_telemetry_.get();
    }

    auto executor_config = config_.executor_config;
    executor_config.telemetry = telemetry_;
    executor_ = std::make_unique<executor::Executor>(*config_.catalog, executor_config);
}

CommandMetrics ShellEngine::execute_sql(const std::string& sql)
{
    const auto trimmed = trim(sql);

    CommandMetrics metrics{};
    switch (classify(trimmed)) {
    case CommandKind::Empty:
        metrics.success = true;
        metrics.summary = "Empty command.";
        return metrics;
    case CommandKind::Meta:
        metrics = execute_meta(trimmed);
        break;
    case CommandKind::Sql:
    default:
        metrics = execute_statements(trimmed);
        break;
    }

    if (config_.command_logger) {
        config_.command_logger(metrics);
    }
    return metrics;
}

std::string ShellEngine::trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }

    return std::string{text.substr(start, end - start)};
}

ShellEngine::CommandKind ShellEngine::classify(std::string_view text)
{
    if (text.empty()) {
        return CommandKind::Empty;
    }
    if (text.front() == '\\') {
        return CommandKind::Meta;
    }
    // A script of bare semicolons is as empty as no input.
    if (std::all_of(text.begin(), text.end(), [](char ch) {
            return ch == ';' || std::isspace(static_cast<unsigned char>(ch)) != 0;
        })) {
        return CommandKind::Empty;
    }
    return CommandKind::Sql;
}

CommandMetrics ShellEngine::execute_statements(const std::string& sql)
{
    CommandMetrics metrics{};
    metrics.command_text = sql;
    metrics.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();
    const auto rows_before = rows_touched();

    const auto results = executor_->execute_script(session_, sql);

    metrics.command_category = category_of(results);
    metrics.statements_executed = results.size();
    metrics.success = std::all_of(results.begin(), results.end(), [](const StatementResult& result) {
        return result.success();
    });

    if (results.size() == 1U) {
        auto rendered = render_statement(results.front());
        metrics.summary = std::move(rendered.summary);
        metrics.detail_lines = std::move(rendered.lines);
    } else {
        const auto successes = static_cast<std::size_t>(std::count_if(
            results.begin(), results.end(), [](const StatementResult& result) { return result.success(); }));
        std::ostringstream summary;
        summary << "Executed " << plural(results.size(), "statement") << " (" << successes << " succeeded)";
        metrics.summary = summary.str();

        for (const auto& result : results) {
            auto rendered = render_statement(result);
            metrics.detail_lines.push_back(std::move(rendered.summary));
            for (auto& line : rendered.lines) {
                metrics.detail_lines.push_back("  " + line);
            }
        }
    }

    for (const auto& result : results) {
        if (!result.success()) {
            metrics.diagnostics.push_back(make_diagnostic(result));
        }
    }

    finish(metrics, start, rows_before);
    return metrics;
}

CommandMetrics ShellEngine::execute_meta(const std::string& command)
{
    CommandMetrics metrics{};
    metrics.command_text = command;
    metrics.command_category = "meta";
    metrics.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();
    const auto rows_before = rows_touched();

    const auto tokens = split_tokens(command);
    std::optional<parser::Command> translated;
    if (tokens.front() == "\\l" && tokens.size() == 1U) {
        translated = parser::ShowDatabasesCommand{};
    } else if (tokens.front() == "\\dt" && tokens.size() == 1U) {
        translated = parser::ShowTablesCommand{};
    } else if (tokens.front() == "\\d" && tokens.size() == 2U) {
        translated = parser::DescribeTableCommand{tokens[1]};
    }

    if (!translated) {
        metrics.success = false;
        metrics.summary = "Unsupported meta command.";
        ShellDiagnostic diagnostic{};
        diagnostic.kind = "ShellError";
        diagnostic.statement = command;
        diagnostic.message = "Shell command is not recognised.";
        diagnostic.remediation_hints = {"Use \\help to list supported commands."};
        metrics.diagnostics.push_back(std::move(diagnostic));
        finish(metrics, start, rows_before);
        return metrics;
    }

    auto result = executor_->execute_command(session_, *translated);
    result.statement = command;
    metrics.statements_executed = 1U;
    metrics.success = result.success();
    auto rendered = render_statement(result);
    metrics.summary = std::move(rendered.summary);
    metrics.detail_lines = std::move(rendered.lines);
    if (!result.success()) {
        metrics.diagnostics.push_back(make_diagnostic(result));
    }

    finish(metrics, start, rows_before);
    return metrics;
}

void ShellEngine::finish(CommandMetrics& metrics,
                         std::chrono::steady_clock::time_point start,
                         std::uint64_t rows_before)
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
    metrics.finished_at = std::chrono::system_clock::now();
    metrics.rows_touched = rows_touched() - rows_before;
    metrics.correlation_id = "cmd-" + std::to_string(correlation_counter_.fetch_add(1U, std::memory_order_relaxed));
}

std::uint64_t ShellEngine::rows_touched() const noexcept
{
    const auto snapshot = telemetry_->snapshot();
    return snapshot.projection_rows_emitted + snapshot.insert_rows_succeeded + snapshot.update_rows_succeeded +
           snapshot.delete_rows_succeeded;
}

}  // namespace pesadb::shell
