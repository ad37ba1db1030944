#include "internal/orchestration/exec_tree.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using ure::db::model::ExecRecord;
using ure::db::model::LogRecord;

ExecRecord Exec(const std::string& id, const std::optional<std::string>& parent, int64_t order, int status = 0) {
  ExecRecord record;
  record.orchestration_session_exec_id = id;
  record.session_id                    = "S1";
  record.parent_exec_id                = parent;
  record.exec_nature                   = "step";
  record.exec_code                     = id;
  record.sibling_order                 = order;
  record.exec_status                   = status;
  return record;
}

LogRecord Log(const std::string& id, const std::optional<std::string>& parent, int64_t order,
              const std::optional<std::string>& category, const std::string& content) {
  LogRecord record;
  record.orchestration_session_log_id = id;
  record.session_id                   = "S1";
  record.parent_log_id                = parent;
  record.sibling_order                = order;
  record.category                     = category;
  record.content                      = content;
  return record;
}

void TestExecTreeOrdersSiblingsBySiblingOrder() {
  // Arena rows arrive in arbitrary order.
  const std::vector<ExecRecord> rows{Exec("c2", std::string("root"), 1), Exec("root", std::nullopt, 0),
                                     Exec("c1", std::string("root"), 0), Exec("g1", std::string("c2"), 0),
                                     Exec("root2", std::nullopt, 1)};

  const auto forest = ure::orchestration::BuildExecTree(rows);
  assert(forest.size() == 2);
  assert(forest[0].record.orchestration_session_exec_id == "root");
  assert(forest[1].record.orchestration_session_exec_id == "root2");
  assert(forest[0].children.size() == 2);
  assert(forest[0].children[0].record.orchestration_session_exec_id == "c1");
  assert(forest[0].children[1].record.orchestration_session_exec_id == "c2");
  assert(forest[0].children[1].children[0].record.orchestration_session_exec_id == "g1");
}

void TestOrphansBecomeRoots() {
  const std::vector<ExecRecord> rows{Exec("lonely", std::string("missing-parent"), 0)};
  const auto                    forest = ure::orchestration::BuildExecTree(rows);
  assert(forest.size() == 1);
  assert(forest[0].children.empty());
}

void TestAggregateStatusFindsFirstFailureDepthFirst() {
  const std::vector<ExecRecord> ok{Exec("root", std::nullopt, 0), Exec("a", std::string("root"), 0)};
  assert(ure::orchestration::AggregateStatus(ure::orchestration::BuildExecTree(ok)[0]) == 0);

  const std::vector<ExecRecord> failed{Exec("root", std::nullopt, 0), Exec("a", std::string("root"), 0),
                                       Exec("a1", std::string("a"), 0, 7), Exec("b", std::string("root"), 1, 3)};
  assert(ure::orchestration::AggregateStatus(ure::orchestration::BuildExecTree(failed)[0]) == 7);
}

void TestLogReplayIsIndentedAndOrdered() {
  const std::vector<LogRecord> logs{
      Log("l3", std::string("l1"), 1, std::string("unit"), "b.md ADMITTED"),
      Log("l1", std::nullopt, 0, std::string("container"), "fs:/docs"),
      Log("l2", std::string("l1"), 0, std::string("unit"), "a.md ADMITTED"),
      Log("l4", std::nullopt, 1, std::nullopt, "done"),
  };

  const auto lines = ure::orchestration::ReplayLog(logs);
  const std::vector<std::string> expected{"[container] fs:/docs", "  [unit] a.md ADMITTED", "  [unit] b.md ADMITTED",
                                          "[log] done"};
  assert(lines == expected);
}

void TestMarkdownRendering() {
  auto failing            = Exec("child", std::string("root"), 0, 2);
  failing.exec_error_text = "boom";
  const std::vector<ExecRecord> rows{Exec("root", std::nullopt, 0), failing};

  const auto markdown = ure::orchestration::RenderExecTreeMarkdown(ure::orchestration::BuildExecTree(rows));
  assert(markdown == "- `step` root (status 0)\n  - `step` child (status 2): boom\n");
}

} // namespace

int main() {
  TestExecTreeOrdersSiblingsBySiblingOrder();
  TestOrphansBecomeRoots();
  TestAggregateStatusFindsFirstFailureDepthFirst();
  TestLogReplayIsIndentedAndOrdered();
  TestMarkdownRendering();

  std::cout << "ure_unit_exec_tree: pass\n";
  return 0;
}
