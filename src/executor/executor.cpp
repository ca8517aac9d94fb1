#include "pesadb/executor/executor.hpp"

#include "pesadb/common/sql_errors.hpp"
#include "pesadb/executor/select_executor.hpp"
#include "pesadb/parser/parser.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <unordered_set>
#include <utility>

namespace pesadb::executor {

namespace {

[[nodiscard]] std::string quote_name(std::string_view text)
{
    return "'" + std::string{text} + "'";
}

[[nodiscard]] std::string rows_phrase(std::size_t count)
{
    return std::to_string(count) + (count == 1U ? " row" : " rows");
}

[[nodiscard]] std::string trimmed(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1U)};
}

void record_error(StatementResult& result, const SqlError& error)
{
    result.error = error.code();
    result.message = error.detail();
    result.position = error.position();
}

[[nodiscard]] StatementResult failed_parse(std::string_view statement, const SqlError& error)
{
    StatementResult result{};
    result.statement = trimmed(statement);
    record_error(result, error);
    return result;
}

}  // namespace

Executor::Executor(storage::Catalog& catalog)
    : Executor{catalog, Config{}}
{}

Executor::Executor(storage::Catalog& catalog, Config config)
    : catalog_{catalog}
    , config_{config}
{}

StatementResult Executor::execute(Session& session, std::string_view sql)
{
    try {
        parser::Parser parser{sql};
        auto statement = parser.next();
        if (!statement) {
            throw SqlError{SqlErrc::SyntaxError, "Expected a statement but found end of input", sql.size()};
        }
        if (!parser.at_end()) {
            throw SqlError{SqlErrc::SyntaxError,
                           "Expected a single statement; found more input at position " +
                               std::to_string(parser.position()),
                           parser.position()};
        }

        auto result = execute_command(session, statement->command);
        result.statement = std::move(statement->text);
        return result;
    } catch (const SqlError& error) {
        return failed_parse(sql, error);
    }
}

std::vector<StatementResult> Executor::execute_script(Session& session, std::string_view sql)
{
    std::vector<StatementResult> results;

    std::optional<parser::Parser> parser;
    try {
        parser.emplace(sql);
    } catch (const SqlError& error) {
        results.push_back(failed_parse(sql, error));
        return results;
    }

    for (;;) {
        std::optional<parser::ParsedStatement> statement;
        const auto start = parser->position();
        try {
            statement = parser->next();
        } catch (const SqlError& error) {
            results.push_back(failed_parse(sql.substr(std::min(start, sql.size())), error));
            return results;
        }
        if (!statement) {
            return results;
        }

        auto result = execute_command(session, statement->command);
        result.statement = std::move(statement->text);
        const bool success = result.success();
        results.push_back(std::move(result));
        if (!success) {
            return results;
        }
    }
}

StatementResult Executor::execute_command(Session& session, const parser::Command& command)
{
    StatementResult result{};
    result.category = parser::command_category(command);

    const auto started = std::chrono::steady_clock::now();
    try {
        result.payload = dispatch(session, command);
    } catch (const SqlError& error) {
        record_error(result, error);
    } catch (const std::exception& error) {
        result.error = make_error_code(SqlErrc::ExecutionFailed);
        result.message = error.what();
    }
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started);
    return result;
}

StatementPayload Executor::dispatch(Session& session, const parser::Command& command)
{
    return std::visit(
        parser::Overloaded{
            [&](const parser::CreateDatabaseCommand& node) -> StatementPayload { return create_database(node); },
            [&](const parser::DropDatabaseCommand& node) -> StatementPayload { return drop_database(session, node); },
            [&](const parser::UseDatabaseCommand& node) -> StatementPayload { return use_database(session, node); },
            [&](const parser::CreateTableCommand& node) -> StatementPayload { return create_table(session, node); },
            [&](const parser::DropTableCommand& node) -> StatementPayload { return drop_table(session, node); },
            [&](const parser::ShowDatabasesCommand&) -> StatementPayload { return show_databases(); },
            [&](const parser::ShowTablesCommand&) -> StatementPayload { return show_tables(session); },
            [&](const parser::DescribeTableCommand& node) -> StatementPayload { return describe_table(session, node); },
            [&](const parser::InsertCommand& node) -> StatementPayload { return insert(session, node); },
            [&](const parser::UpdateCommand& node) -> StatementPayload { return update(session, node); },
            [&](const parser::DeleteCommand& node) -> StatementPayload { return erase(session, node); },
            [&](const parser::SelectCommand& node) -> StatementPayload { return select(session, node); }},
        command);
}

storage::Database& Executor::current_database(const Session& session)
{
    if (!session.current_database) {
        throw SqlError{SqlErrc::NoDatabaseSelected, "No database selected; run USE <database> first"};
    }
    return catalog_.database(*session.current_database);
}

void Executor::flush(const std::string& database_name)
{
    if (!config_.auto_flush || !catalog_.persistent()) {
        return;
    }

    std::error_code ec;
    {
        ExecutorTelemetry::LatencyScope latency{config_.telemetry, ExecutorTelemetry::Operator::Flush};
        ec = catalog_.flush(database_name);
    }
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_flush(!ec);
    }
    if (ec) {
        throw SqlError{SqlErrc::PersistenceFailed,
                       "Change applied in memory but saving database " + quote_name(database_name) +
                           " failed: " + ec.message()};
    }
}

MutationResult Executor::create_database(const parser::CreateDatabaseCommand& command)
{
    catalog_.create_database(command.name);
    flush(command.name);
    return MutationResult{0U, "Database " + quote_name(command.name) + " created"};
}

MutationResult Executor::drop_database(Session& session, const parser::DropDatabaseCommand& command)
{
    catalog_.drop_database(command.name);
    if (session.current_database == command.name) {
        session.current_database.reset();
    }
    return MutationResult{0U, "Database " + quote_name(command.name) + " dropped"};
}

MutationResult Executor::use_database(Session& session, const parser::UseDatabaseCommand& command)
{
    static_cast<void>(catalog_.database(command.name));
    session.current_database = command.name;
    return MutationResult{0U, "Using database " + quote_name(command.name)};
}

MutationResult Executor::create_table(const Session& session, const parser::CreateTableCommand& command)
{
    auto& database = current_database(session);
    database.create_table(command.name, command.columns);
    flush(database.name());
    return MutationResult{0U, "Table " + quote_name(command.name) + " created"};
}

MutationResult Executor::drop_table(const Session& session, const parser::DropTableCommand& command)
{
    auto& database = current_database(session);
    database.drop_table(command.name);
    flush(database.name());
    return MutationResult{0U, "Table " + quote_name(command.name) + " dropped"};
}

SchemaDescriptor Executor::show_databases() const
{
    SchemaDescriptor descriptor{};
    descriptor.kind = SchemaDescriptor::Kind::Databases;
    descriptor.names = catalog_.database_names();
    return descriptor;
}

SchemaDescriptor Executor::show_tables(const Session& session)
{
    const auto& database = current_database(session);
    SchemaDescriptor descriptor{};
    descriptor.kind = SchemaDescriptor::Kind::Tables;
    descriptor.subject = database.name();
    descriptor.names = database.table_names();
    return descriptor;
}

SchemaDescriptor Executor::describe_table(const Session& session, const parser::DescribeTableCommand& command)
{
    const auto& table = current_database(session).table(command.name);
    SchemaDescriptor descriptor{};
    descriptor.kind = SchemaDescriptor::Kind::Columns;
    descriptor.subject = table.name();
    descriptor.columns = table.columns();
    for (const auto& column : table.columns()) {
        descriptor.names.push_back(column.name);
    }
    return descriptor;
}

MutationResult Executor::insert(const Session& session, const parser::InsertCommand& command)
{
    auto& database = current_database(session);
    auto& table = database.table(command.table);

    storage::Row row;
    if (command.columns.empty()) {
        row = command.values;
    } else {
        if (command.columns.size() != command.values.size()) {
            throw SqlError{SqlErrc::TypeMismatch,
                           "INSERT lists " + std::to_string(command.columns.size()) + " columns but " +
                               std::to_string(command.values.size()) + " values"};
        }
        row.assign(table.column_count(), storage::Value{});
        std::unordered_set<std::size_t> assigned;
        for (std::size_t index = 0U; index < command.columns.size(); ++index) {
            const auto ordinal = table.column_index(command.columns[index]);
            if (!ordinal) {
                throw SqlError{SqlErrc::ColumnNotFound,
                               "Column " + quote_name(command.columns[index]) + " does not exist in table " +
                                   quote_name(table.name())};
            }
            if (!assigned.insert(*ordinal).second) {
                throw SqlError{SqlErrc::SyntaxError, "Column " + quote_name(command.columns[index]) + " is listed twice"};
            }
            row[*ordinal] = command.values[index];
        }
    }

    {
        ExecutorTelemetry::LatencyScope latency{config_.telemetry, ExecutorTelemetry::Operator::Insert};
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_insert_attempt();
        }
        table.insert(std::move(row));
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_insert_success();
        }
    }

    flush(database.name());
    return MutationResult{1U, "1 row inserted into " + quote_name(table.name())};
}

MutationResult Executor::update(const Session& session, const parser::UpdateCommand& command)
{
    auto& database = current_database(session);
    auto& table = database.table(command.table);

    std::vector<std::pair<std::size_t, const storage::Value*>> assignments;
    std::unordered_set<std::size_t> assigned;
    for (const auto& assignment : command.assignments) {
        const auto ordinal = table.column_index(assignment.column);
        if (!ordinal) {
            throw SqlError{SqlErrc::ColumnNotFound,
                           "Column " + quote_name(assignment.column) + " does not exist in table " + quote_name(table.name()),
                           assignment.position};
        }
        if (!assigned.insert(*ordinal).second) {
            throw SqlError{SqlErrc::SyntaxError,
                           "Column " + quote_name(assignment.column) + " is assigned twice",
                           assignment.position};
        }
        assignments.emplace_back(*ordinal, &assignment.value);
    }

    const auto row_ids = select_matching_rows(table, command.where.get(), config_.telemetry);

    std::vector<storage::RowUpdate> updates;
    updates.reserve(row_ids.size());
    for (const auto row_id : row_ids) {
        storage::RowUpdate update{};
        update.row_id = row_id;
        update.values = *table.find_row(row_id);
        for (const auto& [ordinal, value] : assignments) {
            update.values[ordinal] = *value;
        }
        updates.push_back(std::move(update));
    }

    {
        ExecutorTelemetry::LatencyScope latency{config_.telemetry, ExecutorTelemetry::Operator::Update};
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_update_attempt(updates.size());
        }
        database.update_rows(table, std::move(updates));
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_update_success(row_ids.size());
        }
    }

    flush(database.name());
    return MutationResult{row_ids.size(), rows_phrase(row_ids.size()) + " updated in " + quote_name(table.name())};
}

MutationResult Executor::erase(const Session& session, const parser::DeleteCommand& command)
{
    auto& database = current_database(session);
    auto& table = database.table(command.table);

    const auto row_ids = select_matching_rows(table, command.where.get(), config_.telemetry);

    std::size_t erased = 0U;
    {
        ExecutorTelemetry::LatencyScope latency{config_.telemetry, ExecutorTelemetry::Operator::Delete};
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_delete_attempt(row_ids.size());
        }
        erased = database.delete_rows(table, row_ids);
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_delete_success(erased);
        }
    }

    flush(database.name());
    return MutationResult{erased, rows_phrase(erased) + " deleted from " + quote_name(table.name())};
}

QueryResult Executor::select(const Session& session, const parser::SelectCommand& command)
{
    return execute_select(command, current_database(session), config_.telemetry);
}

}  // namespace pesadb::executor
