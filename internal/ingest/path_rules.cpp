#include "path_rules.hpp"

#include <fnmatch.h>

#include <algorithm>

#include "internal/core/db_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ure::ingest {

bool GlobMatches(const std::string& pattern, const std::string& path) {
  if (::fnmatch(pattern.c_str(), path.c_str(), 0) == 0) {
    return true;
  }
  if (pattern.rfind("**/", 0) == 0) {
    return ::fnmatch(pattern.c_str() + 3, path.c_str(), 0) == 0;
  }
  return false;
}

bool AnyGlobMatches(const std::vector<std::string>& patterns, const std::string& path) {
  return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& p) { return GlobMatches(p, path); });
}

bool PassesGlobs(const std::vector<std::string>& include, const std::vector<std::string>& exclude, const std::string& path) {
  if (!include.empty() && !AnyGlobMatches(include, path)) {
    return false;
  }
  return !AnyGlobMatches(exclude, path);
}

PathRuleSet::PathRuleSet(std::string namespace_name, bool strict) : namespace_(std::move(namespace_name)), strict_(strict) {
}

std::regex PathRuleSet::Compile(const std::string& pattern, bool icase) {
  auto flags = std::regex::ECMAScript;
  if (icase) {
    flags |= std::regex::icase;
  }
  try {
    return std::regex(pattern, flags);
  } catch (const std::regex_error& e) {
    throw util::ValidationError("invalid path rule regex '" + pattern + "': " + e.what());
  }
}

void PathRuleSet::AddMatchRule(const MatchRule& rule) {
  CompiledMatch compiled{rule, Compile(rule.regex, rule.flags.find('i') != std::string::npos), match_rules_.size()};

  // Keep evaluation order: priority ascending, then declaration.
  auto pos = std::upper_bound(match_rules_.begin(), match_rules_.end(), compiled,
                              [](const CompiledMatch& a, const CompiledMatch& b) { return a.rule.priority < b.rule.priority; });
  match_rules_.insert(pos, std::move(compiled));
}

void PathRuleSet::AddRewriteRule(const RewriteRule& rule) {
  CompiledRewrite compiled{rule, Compile(rule.regex, false), rewrite_rules_.size()};

  auto pos = std::upper_bound(rewrite_rules_.begin(), rewrite_rules_.end(), compiled,
                              [](const CompiledRewrite& a, const CompiledRewrite& b) { return a.rule.priority < b.rule.priority; });
  rewrite_rules_.insert(pos, std::move(compiled));
}

MatchResult PathRuleSet::Evaluate(const std::string& path) const {
  MatchResult result;
  result.canonical_uri = Rewrite(path);

  for (const auto& compiled : match_rules_) {
    if (!std::regex_search(path, compiled.re)) {
      continue;
    }
    if (!PassesGlobs(compiled.rule.include_globs, compiled.rule.exclude_globs, path)) {
      continue;
    }
    result.matched  = true;
    result.nature   = compiled.rule.nature;
    result.priority = compiled.rule.priority;
    result.rule     = compiled.rule.regex;
    return result;
  }

  result.by_default = true;
  result.matched    = match_rules_.empty() || !strict_;
  return result;
}

std::string PathRuleSet::Rewrite(const std::string& path) const {
  for (const auto& compiled : rewrite_rules_) {
    if (std::regex_search(path, compiled.re)) {
      return std::regex_replace(path, compiled.re, compiled.rule.replace, std::regex_constants::format_first_only);
    }
  }
  return path;
}

void PathRuleSet::Persist(db::Repository& repository, const std::string& created_by) const {
  const auto now = util::NowMs();

  // Declaration order survives as insertion order.
  std::vector<const CompiledMatch*> matches;
  for (const auto& m : match_rules_) matches.push_back(&m);
  std::sort(matches.begin(), matches.end(), [](const auto* a, const auto* b) { return a->declared < b->declared; });

  std::vector<const CompiledRewrite*> rewrites;
  for (const auto& r : rewrite_rules_) rewrites.push_back(&r);
  std::sort(rewrites.begin(), rewrites.end(), [](const auto* a, const auto* b) { return a->declared < b->declared; });

  auto tx = repository.Begin();
  for (const auto* m : matches) {
    db::model::PathMatchRuleRecord record;
    record.rule_id                    = util::NewId();
    record.namespace_name             = namespace_;
    record.regex                      = m->rule.regex;
    record.flags                      = m->rule.flags;
    record.nature                     = m->rule.nature;
    record.priority                   = m->rule.priority;
    record.description                = m->rule.description;
    record.include_glob_patterns      = m->rule.include_globs;
    record.exclude_glob_patterns      = m->rule.exclude_globs;
    record.housekeeping.created_at_ms = now;
    record.housekeeping.created_by    = created_by;
    core::ThrowIfDbError(repository.UpsertPathMatchRule(*tx, record), "persist match rule " + m->rule.regex);
  }
  for (const auto* r : rewrites) {
    db::model::PathRewriteRuleRecord record;
    record.rule_id                    = util::NewId();
    record.namespace_name             = namespace_;
    record.regex                      = r->rule.regex;
    record.replace                    = r->rule.replace;
    record.priority                   = r->rule.priority;
    record.description                = r->rule.description;
    record.housekeeping.created_at_ms = now;
    record.housekeeping.created_by    = created_by;
    core::ThrowIfDbError(repository.UpsertPathRewriteRule(*tx, record), "persist rewrite rule " + r->rule.regex);
  }
  tx->Commit();
}

PathRuleSet PathRuleSet::Load(db::Repository& repository, const std::string& namespace_name, bool strict) {
  auto tx       = repository.Begin();
  auto matches  = repository.ListPathMatchRules(*tx, namespace_name);
  auto rewrites = repository.ListPathRewriteRules(*tx, namespace_name);
  tx->Commit();

  PathRuleSet rules(namespace_name, strict);
  for (const auto& m : matches) {
    rules.AddMatchRule(MatchRule{m.regex, m.flags, m.nature, m.priority, m.description, m.include_glob_patterns,
                                 m.exclude_glob_patterns});
  }
  for (const auto& r : rewrites) {
    rules.AddRewriteRule(RewriteRule{r.regex, r.replace, r.priority, r.description});
  }
  return rules;
}

} // namespace ure::ingest
