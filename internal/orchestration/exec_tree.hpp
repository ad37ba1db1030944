#pragma once

#include <string>
#include <vector>

#include "internal/db/model/exec_record.hpp"
#include "internal/db/model/log_record.hpp"

namespace ure::orchestration {

/*
  In-memory views over the exec and log arenas.

  Rows address their parent by id; trees are rebuilt by indexing children
  by parent id. Siblings are ordered by sibling_order. A row whose parent is
  not in the input becomes a root.
*/

struct ExecNode {
  db::model::ExecRecord record;
  std::vector<ExecNode> children;
};

struct LogNode {
  db::model::LogRecord record;
  std::vector<LogNode> children;
};

std::vector<ExecNode> BuildExecTree(const std::vector<db::model::ExecRecord>& execs);

std::vector<LogNode> BuildLogTree(const std::vector<db::model::LogRecord>& logs);

// First non-zero status in the subtree, depth first; 0 when all succeeded.
int AggregateStatus(const ExecNode& node);

// Depth-first replay, one line per entry, two spaces of indent per level:
//   [category] content
std::vector<std::string> ReplayLog(const std::vector<db::model::LogRecord>& logs);

// Markdown bullet list of the exec tree with status and code.
std::string RenderExecTreeMarkdown(const std::vector<ExecNode>& roots);

} // namespace ure::orchestration
