#include "internal/ingest/path_rules.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using ure::ingest::MatchRule;
using ure::ingest::PathRuleSet;
using ure::ingest::RewriteRule;

MatchRule Rule(const std::string& regex, const std::string& nature, int64_t priority) {
  MatchRule rule;
  rule.regex    = regex;
  rule.nature   = nature;
  rule.priority = priority;
  return rule;
}

void TestLowerPriorityWins() {
  PathRuleSet rules("docs");
  // Declared out of order on purpose.
  rules.AddMatchRule(Rule("\\.txt$", "priority-two", 2));
  rules.AddMatchRule(Rule("^/a/", "priority-one", 1));

  const auto result = rules.Evaluate("/a/b.txt");
  assert(result.matched);
  assert(!result.by_default);
  assert(result.priority == 1);
  assert(result.nature == std::string("priority-one"));
  assert(result.rule == "^/a/");
}

void TestDeclarationOrderBreaksTies() {
  PathRuleSet rules("docs");
  rules.AddMatchRule(Rule("b", "first", 5));
  rules.AddMatchRule(Rule("txt", "second", 5));
  assert(rules.Evaluate("/a/b.txt").nature == std::string("first"));
}

void TestRuleGlobsNarrowTheRegex() {
  PathRuleSet rules("docs", true);
  auto        markdown = Rule("\\.md$", "md", 1);
  markdown.exclude_globs.push_back("**/drafts/*");
  rules.AddMatchRule(markdown);

  assert(rules.Evaluate("/notes/published/a.md").matched);
  assert(!rules.Evaluate("/notes/drafts/b.md").matched);
}

void TestStrictAndLenientDefaults() {
  PathRuleSet empty("docs", true);
  const auto  anything = empty.Evaluate("/whatever.bin");
  assert(anything.matched && anything.by_default);

  PathRuleSet strict("docs", true);
  strict.AddMatchRule(Rule("\\.md$", "md", 1));
  const auto rejected = strict.Evaluate("/image.png");
  assert(!rejected.matched);
  assert(rejected.by_default);

  PathRuleSet lenient("docs", false);
  lenient.AddMatchRule(Rule("\\.md$", "md", 1));
  const auto fallback = lenient.Evaluate("/image.png");
  assert(fallback.matched);
  assert(fallback.by_default);
  assert(!fallback.nature.has_value());
}

void TestCaseInsensitiveFlag() {
  PathRuleSet rules("docs", true);
  auto        text = Rule("\\.txt$", "text", 1);
  text.flags       = "i";
  rules.AddMatchRule(text);
  assert(rules.Evaluate("/README.TXT").matched);

  PathRuleSet sensitive("docs", true);
  sensitive.AddMatchRule(Rule("\\.txt$", "text", 1));
  assert(!sensitive.Evaluate("/README.TXT").matched);
}

void TestRewriteAppliesFirstRuleOnce() {
  PathRuleSet rules("docs");
  rules.AddRewriteRule(RewriteRule{"^/srv/", "/mnt/", 2, std::nullopt});
  rules.AddRewriteRule(RewriteRule{"^/srv/docs/", "docs://", 1, std::nullopt});

  assert(rules.Rewrite("/srv/docs/a.md") == "docs://a.md");
  assert(rules.Rewrite("/srv/other/a.md") == "/mnt/other/a.md");
  assert(rules.Rewrite("/home/a.md") == "/home/a.md");
  assert(rules.Evaluate("/srv/docs/a.md").canonical_uri == "docs://a.md");

  PathRuleSet once("docs");
  once.AddRewriteRule(RewriteRule{"a", "b", 0, std::nullopt});
  assert(once.Rewrite("/aaa") == "/baa");
}

void TestInvalidRegexIsAValidationError() {
  PathRuleSet rules("docs");
  bool        threw = false;
  try {
    rules.AddMatchRule(Rule("([unclosed", "bad", 1));
  } catch (const ure::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(rules.MatchRuleCount() == 0);
}

void TestGlobs() {
  assert(ure::ingest::GlobMatches("**/*.md", "a/b/c.md"));
  assert(ure::ingest::GlobMatches("**/*.md", "top.md"));
  assert(!ure::ingest::GlobMatches("*.md", "notes.txt"));

  assert(ure::ingest::PassesGlobs({}, {}, "anything"));
  assert(!ure::ingest::PassesGlobs({"*.md"}, {}, "a.txt"));
  assert(!ure::ingest::PassesGlobs({"*.md"}, {"secret*"}, "secret.md"));
}

void TestRulesPersistPerNamespace() {
  auto repository = std::make_shared<ure::db::memory::MemoryRepository>();

  PathRuleSet rules("docs", true);
  rules.AddMatchRule(Rule("\\.txt$", "text", 2));
  rules.AddMatchRule(Rule("\\.md$", "md", 1));
  rules.AddRewriteRule(RewriteRule{"^/srv/", "/mnt/", 0, std::string("relocate")});
  rules.Persist(*repository, "path-rules-test");
  // Persisting again only refreshes the same rows.
  rules.Persist(*repository, "path-rules-test");

  auto loaded = PathRuleSet::Load(*repository, "docs", true);
  assert(loaded.MatchRuleCount() == 2);
  assert(loaded.Evaluate("/srv/a.md").nature == std::string("md"));
  assert(loaded.Evaluate("/srv/a.md").canonical_uri == "/mnt/a.md");
  assert(!loaded.Evaluate("/srv/a.png").matched);

  assert(PathRuleSet::Load(*repository, "other", false).MatchRuleCount() == 0);
}

} // namespace

int main() {
  TestLowerPriorityWins();
  TestDeclarationOrderBreaksTies();
  TestRuleGlobsNarrowTheRegex();
  TestStrictAndLenientDefaults();
  TestCaseInsensitiveFlag();
  TestRewriteAppliesFirstRuleOnce();
  TestInvalidRegexIsAValidationError();
  TestGlobs();
  TestRulesPersistPerNamespace();

  std::cout << "ure_unit_path_rules: pass\n";
  return 0;
}
