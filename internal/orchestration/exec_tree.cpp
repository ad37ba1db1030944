#include "exec_tree.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <sstream>
#include <unordered_set>

namespace ure::orchestration {

namespace {

template <typename Node, typename Record, typename ParentOf, typename IdOf>
std::vector<Node> BuildForest(const std::vector<Record>& rows, ParentOf parent_of, IdOf id_of) {
  std::unordered_set<std::string>                   ids;
  std::map<std::string, std::vector<const Record*>> children;
  std::vector<const Record*>                        roots;

  for (const auto& row : rows) ids.insert(id_of(row));
  for (const auto& row : rows) {
    const auto& parent = parent_of(row);
    if (parent && ids.count(*parent)) {
      children[*parent].push_back(&row);
    } else {
      roots.push_back(&row);
    }
  }

  auto by_order = [](const Record* a, const Record* b) { return a->sibling_order < b->sibling_order; };

  std::function<Node(const Record*)> build = [&](const Record* row) {
    Node node{*row, {}};
    auto it = children.find(id_of(*row));
    if (it != children.end()) {
      auto kids = it->second;
      std::stable_sort(kids.begin(), kids.end(), by_order);
      for (const auto* kid : kids) node.children.push_back(build(kid));
    }
    return node;
  };

  std::stable_sort(roots.begin(), roots.end(), by_order);
  std::vector<Node> out;
  for (const auto* root : roots) out.push_back(build(root));
  return out;
}

void Replay(const LogNode& node, int depth, std::vector<std::string>& out) {
  std::string line(static_cast<std::size_t>(depth) * 2, ' ');
  line += "[" + node.record.category.value_or("log") + "] " + node.record.content;
  out.push_back(std::move(line));
  for (const auto& child : node.children) Replay(child, depth + 1, out);
}

void Render(const ExecNode& node, int depth, std::ostringstream& out) {
  out << std::string(static_cast<std::size_t>(depth) * 2, ' ') << "- `" << node.record.exec_nature << "` "
      << node.record.exec_code << " (status " << node.record.exec_status << ")";
  if (node.record.exec_error_text) out << ": " << *node.record.exec_error_text;
  out << "\n";
  for (const auto& child : node.children) Render(child, depth + 1, out);
}

} // namespace

std::vector<ExecNode> BuildExecTree(const std::vector<db::model::ExecRecord>& execs) {
  return BuildForest<ExecNode>(
      execs, [](const db::model::ExecRecord& r) -> const std::optional<std::string>& { return r.parent_exec_id; },
      [](const db::model::ExecRecord& r) -> const std::string& { return r.orchestration_session_exec_id; });
}

std::vector<LogNode> BuildLogTree(const std::vector<db::model::LogRecord>& logs) {
  return BuildForest<LogNode>(
      logs, [](const db::model::LogRecord& r) -> const std::optional<std::string>& { return r.parent_log_id; },
      [](const db::model::LogRecord& r) -> const std::string& { return r.orchestration_session_log_id; });
}

int AggregateStatus(const ExecNode& node) {
  if (node.record.exec_status != 0) return node.record.exec_status;
  for (const auto& child : node.children) {
    if (int status = AggregateStatus(child); status != 0) return status;
  }
  return 0;
}

std::vector<std::string> ReplayLog(const std::vector<db::model::LogRecord>& logs) {
  std::vector<std::string> out;
  for (const auto& root : BuildLogTree(logs)) Replay(root, 0, out);
  return out;
}

std::string RenderExecTreeMarkdown(const std::vector<ExecNode>& roots) {
  std::ostringstream out;
  for (const auto& root : roots) Render(root, 0, out);
  return out.str();
}

} // namespace ure::orchestration
