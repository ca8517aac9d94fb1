#pragma once

#include "pesadb/executor/execution_result.hpp"
#include "pesadb/executor/executor_telemetry.hpp"
#include "pesadb/parser/ast.hpp"
#include "pesadb/storage/catalog.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pesadb::executor {

// Runs commands against a catalog. Every error is converted into the returned StatementResult;
// nothing escapes execute()/execute_script().
class Executor final {
public:
    struct Config final {
        // Flush the owning database after every successful mutating command.
        bool auto_flush = true;
        ExecutorTelemetry* telemetry = nullptr;
    };

    explicit Executor(storage::Catalog& catalog);
    Executor(storage::Catalog& catalog, Config config);

    // Exactly one statement; trailing tokens after it are a syntax error.
    [[nodiscard]] StatementResult execute(Session& session, std::string_view sql);
    // Stops after the first failing statement, which is the last element.
    [[nodiscard]] std::vector<StatementResult> execute_script(Session& session, std::string_view sql);
    [[nodiscard]] StatementResult execute_command(Session& session, const parser::Command& command);

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] storage::Catalog& catalog() noexcept { return catalog_; }

private:
    [[nodiscard]] StatementPayload dispatch(Session& session, const parser::Command& command);

    [[nodiscard]] MutationResult create_database(const parser::CreateDatabaseCommand& command);
    [[nodiscard]] MutationResult drop_database(Session& session, const parser::DropDatabaseCommand& command);
    [[nodiscard]] MutationResult use_database(Session& session, const parser::UseDatabaseCommand& command);
    [[nodiscard]] MutationResult create_table(const Session& session, const parser::CreateTableCommand& command);
    [[nodiscard]] MutationResult drop_table(const Session& session, const parser::DropTableCommand& command);
    [[nodiscard]] SchemaDescriptor show_databases() const;
    [[nodiscard]] SchemaDescriptor show_tables(const Session& session);
    [[nodiscard]] SchemaDescriptor describe_table(const Session& session, const parser::DescribeTableCommand& command);
    [[nodiscard]] MutationResult insert(const Session& session, const parser::InsertCommand& command);
    [[nodiscard]] MutationResult update(const Session& session, const parser::UpdateCommand& command);
    [[nodiscard]] MutationResult erase(const Session& session, const parser::DeleteCommand& command);
    [[nodiscard]] QueryResult select(const Session& session, const parser::SelectCommand& command);

    [[nodiscard]] storage::Database& current_database(const Session& session);
    void flush(const std::string& database_name);

    storage::Catalog& catalog_;
    Config config_{};
};

}  // namespace pesadb::executor
