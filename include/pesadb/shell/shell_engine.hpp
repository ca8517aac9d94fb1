#pragma once

#include "pesadb/executor/execution_result.hpp"
#include "pesadb/executor/executor.hpp"
#include "pesadb/executor/executor_telemetry.hpp"
#include "pesadb/storage/catalog.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pesadb::shell {

struct ShellDiagnostic final {
    // SqlErrc kind name ("SyntaxError"), or "ShellError" for meta commands.
    std::string kind{};
    std::string message{};
    std::string statement{};
    std::optional<std::size_t> position{};
    std::vector<std::string> remediation_hints{};
};

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    std::uint64_t statements_executed = 0U;
    std::vector<ShellDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

// Renders headers and rows as an aligned text table; empty row sets render "(no rows)".
[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows);

class ShellEngine final {
public:
    struct Config final {
        storage::Catalog* catalog = nullptr;
        executor::Executor::Config executor_config{};
        std::function<void(const CommandMetrics&)> command_logger{};
    };

    // Throws std::invalid_argument without a catalog.
    explicit ShellEngine(Config config);

    // SQL scripts run statement by statement and stop at the first failure. Backslash meta
    // commands: \l, \dt and \d <table>.
    CommandMetrics execute_sql(const std::string& sql);

    [[nodiscard]] const executor::Session& session() const noexcept { return session_; }
    [[nodiscard]] const executor::ExecutorTelemetry& telemetry() const noexcept { return *telemetry_; }

private:
    enum class CommandKind : std::uint8_t {
        Empty = 0,
        Sql,
        Meta
    };

    static std::string trim(std::string_view text);
    static CommandKind classify(std::string_view text);

    CommandMetrics execute_statements(const std::string& sql);
    CommandMetrics execute_meta(const std::string& command);
    void finish(CommandMetrics& metrics,
                std::chrono::steady_clock::time_point start,
                std::uint64_t rows_before);
    [[nodiscard]] std::uint64_t rows_touched() const noexcept;

    Config config_;
    std::unique_ptr<executor::ExecutorTelemetry> owned_telemetry_{};
    executor::ExecutorTelemetry* telemetry_ = nullptr;
    std::unique_ptr<executor::Executor> executor_{};
    executor::Session session_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace pesadb::shell
