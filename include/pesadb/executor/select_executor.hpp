#pragma once

#include "pesadb/executor/execution_result.hpp"
#include "pesadb/executor/executor_telemetry.hpp"
#include "pesadb/parser/ast.hpp"
#include "pesadb/storage/database.hpp"
#include "pesadb/storage/table.hpp"

#include <vector>

namespace pesadb::executor {

// Rows of `table` matching `where` (all rows when null), in row order. A `column = literal`
// equality on an indexed column is answered from the hash index.
[[nodiscard]] std::vector<storage::RowId> select_matching_rows(const storage::Table& table,
                                                               const parser::Expression* where,
                                                               ExecutorTelemetry* telemetry);

// Source rows, WHERE, grouping, HAVING, projection, DISTINCT, ORDER BY, OFFSET and LIMIT.
[[nodiscard]] QueryResult execute_select(const parser::SelectCommand& select,
                                         const storage::Database& database,
                                         ExecutorTelemetry* telemetry);

}  // namespace pesadb::executor
