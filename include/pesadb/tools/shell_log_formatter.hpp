#pragma once

#include "pesadb/shell/shell_engine.hpp"

#include <chrono>
#include <string>

namespace pesadb::tools {

// One JSON object per command, without a trailing newline.
[[nodiscard]] std::string format_shell_command_log_json(const pesadb::shell::CommandMetrics& metrics);

// ISO-8601 UTC with microseconds; empty for a default-constructed time point.
[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp);

}  // namespace pesadb::tools
