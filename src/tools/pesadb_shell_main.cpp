#include "pesadb/common/sql_errors.hpp"
#include "pesadb/parser/tokenizer.hpp"
#include "pesadb/shell/shell_engine.hpp"
#include "pesadb/storage/catalog.hpp"
#include "pesadb/tools/shell_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

std::string trim(std::string_view text)
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

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".pesadb_shell_history";
    return path;
}

void render_result(const pesadb::shell::CommandMetrics& metrics)
{
    const auto status = metrics.success ? "OK" : "ERROR";
    std::cout << status << ": " << metrics.summary;
    if (!metrics.correlation_id.empty()) {
        std::cout << " [" << metrics.correlation_id << ']';
    }
    std::cout << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]";
    if (metrics.rows_touched != 0U) {
        std::cout << " rows=" << metrics.rows_touched;
    }
    std::cout << '\n';

    for (const auto& line : metrics.detail_lines) {
        std::cout << "    " << line << '\n';
    }

    for (const auto& diagnostic : metrics.diagnostics) {
        std::cout << "  - " << diagnostic.kind << ": " << diagnostic.message;
        if (!diagnostic.statement.empty()) {
            std::cout << " (statement: " << diagnostic.statement << ')';
        }
        std::cout << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cout << "      hint: " << hint << '\n';
        }
    }
}

enum class BufferState {
    Blank,
    Incomplete,
    Complete
};

// A buffer is complete once its last token is ';'. Input the tokenizer rejects is submitted when
// it ends with ';' so the engine can report the error.
BufferState classify_buffer(std::string_view text)
{
    try {
        const auto tokens = pesadb::parser::tokenize(text);
        if (tokens.size() == 1U) {
            return BufferState::Blank;
        }
        return tokens[tokens.size() - 2U].kind == pesadb::parser::TokenKind::Semicolon ? BufferState::Complete
                                                                                         : BufferState::Incomplete;
    } catch (const pesadb::SqlError&) {
        const auto trimmed = trim(text);
        return !trimmed.empty() && trimmed.back() == ';' ? BufferState::Complete : BufferState::Incomplete;
    }
}

// Reads a whole script; the engine splits it into statements and stops at the first failure.
std::optional<std::string> read_script(const std::string& path)
{
    if (path == "-") {
        return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
    }

    std::ifstream stream{path};
    if (!stream.is_open()) {
        return std::nullopt;
    }
    std::string text{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad()) {
        return std::nullopt;
    }
    return text;
}

void print_help()
{
    std::cout << "Commands:\n";
    std::cout << "  SQL statements must end with ';'\n";
    std::cout << "  \\l           List databases\n";
    std::cout << "  \\dt          List tables in the current database\n";
    std::cout << "  \\d <table>   Describe a table\n";
    std::cout << "  @<path>      Run a script file\n";
    std::cout << "  \\help        Show this message\n";
    std::cout << "  \\quit        Exit the shell\n";
}

int run_repl(bool quiet, pesadb::shell::ShellEngine& engine)
{
    replxx::Replxx repl;

    const auto history = history_path();
    if (!history.empty()) {
        static_cast<void>(repl.history_load(history.string()));
    }

    if (!quiet) {
        std::cout << "pesadb shell: enter SQL statements terminated with ';' or type \\help.\n";
    }

    std::string buffer;
    while (true) {
        const char* line = repl.input(buffer.empty() ? "pesadb> " : "...> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto trimmed = trim(line);
        if (buffer.empty() && trimmed.rfind('\\', 0U) == 0U) {
            if (trimmed == "\\q" || trimmed == "\\quit") {
                break;
            }
            if (trimmed == "\\help" || trimmed == "\\?") {
                print_help();
                continue;
            }
            repl.history_add(trimmed);
            render_result(engine.execute_sql(trimmed));
            continue;
        }

        if (buffer.empty() && trimmed.rfind('@', 0U) == 0U) {
            const auto script_path = trim(std::string_view{trimmed}.substr(1U));
            if (script_path.empty()) {
                std::cerr << "error: script path is required after '@'" << '\n';
                continue;
            }

            const auto script = read_script(script_path);
            if (!script) {
                std::cerr << "error: failed to read script file '" << script_path << "'" << '\n';
                continue;
            }
            render_result(engine.execute_sql(*script));
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');

        const auto state = classify_buffer(buffer);
        if (state == BufferState::Blank) {
            buffer.clear();
            continue;
        }
        if (state == BufferState::Incomplete) {
            continue;
        }

        const auto statement = trim(buffer);
        buffer.clear();
        repl.history_add(statement);
        render_result(engine.execute_sql(statement));
        if (!history.empty()) {
            static_cast<void>(repl.history_save(history.string()));
        }
    }

    return 0;
}

int run_batch(const std::vector<std::string>& inputs, pesadb::shell::ShellEngine& engine)
{
    for (const auto& input : inputs) {
        const auto result = engine.execute_sql(input);
        render_result(result);
        if (!result.success) {
            return 1;
        }
    }
    return 0;
}

// Creates the database when it does not exist yet, then selects it.
bool select_startup_database(pesadb::shell::ShellEngine& engine,
                             const pesadb::storage::Catalog& catalog,
                             const std::string& name,
                             bool quiet)
{
    if (catalog.find_database(name) == nullptr) {
        const auto created = engine.execute_sql("CREATE DATABASE " + name + ";");
        if (!quiet || !created.success) {
            render_result(created);
        }
        if (!created.success) {
            return false;
        }
    }

    const auto selected = engine.execute_sql("USE " + name + ";");
    if (!quiet || !selected.success) {
        render_result(selected);
    }
    return selected.success;
}

int run_shell(int argc, char** argv)
{
    CLI::App app{"Interactive SQL shell for the pesadb engine."};

    bool quiet = false;
    bool no_auto_flush = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> script_files;
    std::string log_json_path;
    std::string data_directory;
    std::string database_name;

    app.add_flag("-q,--quiet", quiet, "Suppress the startup banner and startup command output");
    app.add_option("-c,--command", execute_commands, "Execute the provided SQL command and exit")
        ->type_name("SQL")
        ->expected(1);
    app.add_option("-f,--file", script_files, "Execute SQL commands from the specified script file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("--log-json", log_json_path, "Write structured command logs as JSON Lines (use '-' for stdout)")
        ->type_name("PATH");
    app.add_option("--data-dir", data_directory, "Directory holding one document per database; in-memory when omitted")
        ->type_name("PATH");
    app.add_option("--database", database_name, "Database to create if missing and select at startup")
        ->type_name("NAME");
    app.add_flag("--no-auto-flush", no_auto_flush, "Keep changes in memory instead of saving after every mutation");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    pesadb::storage::Catalog::Config catalog_config{};
    if (!data_directory.empty()) {
        catalog_config.data_directory = std::filesystem::path{data_directory};
    }

    pesadb::storage::Catalog catalog{catalog_config};
    if (const auto ec = catalog.open(); ec) {
        std::cerr << "error: failed to open data directory '" << data_directory << "': " << ec.message() << '\n';
        return 1;
    }
    for (const auto& warning : catalog.load_warnings()) {
        std::cerr << "warning: " << warning << '\n';
    }
    std::cerr << "[debug] catalog opened databases=" << catalog.database_names().size()
              << " persistent=" << (catalog.persistent() ? "yes" : "no") << '\n';

    pesadb::shell::ShellEngine::Config config{};
    config.catalog = &catalog;
    config.executor_config.auto_flush = !no_auto_flush;

    std::unique_ptr<std::ofstream> log_file;
    if (!log_json_path.empty()) {
        std::ostream* log_stream = &std::cout;
        if (log_json_path != "-") {
            log_file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!log_file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                return 1;
            }
            log_stream = log_file.get();
        }

        config.command_logger = [log_stream](const pesadb::shell::CommandMetrics& metrics) {
            (*log_stream) << pesadb::tools::format_shell_command_log_json(metrics) << '\n';
            log_stream->flush();
        };
    }

    std::vector<std::string> inputs;
    for (const auto& script_path : script_files) {
        auto script = read_script(script_path);
        if (!script) {
            std::cerr << "error: failed to read script file '" << script_path << "'" << '\n';
            return 1;
        }
        inputs.push_back(std::move(*script));
    }
    inputs.insert(inputs.end(), execute_commands.begin(), execute_commands.end());

    pesadb::shell::ShellEngine engine{config};

    if (!database_name.empty() && !select_startup_database(engine, catalog, database_name, quiet)) {
        return 1;
    }

    if (!inputs.empty()) {
        return run_batch(inputs, engine);
    }
    return run_repl(quiet, engine);
}

}  // namespace

int main(int argc, char** argv)
{
    const auto code = run_shell(argc, argv);
    std::cerr << "[debug] pesadb_shell exiting with code=" << code << '\n';
    return code;
}
