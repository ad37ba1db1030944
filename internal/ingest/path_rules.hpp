#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ure::ingest {

struct MatchRule {
  std::string                regex;
  // "i" makes the regex case-insensitive; other letters are accepted and ignored.
  std::string                flags;
  std::optional<std::string> nature;
  int64_t                    priority = 0;
  std::optional<std::string> description;
  std::vector<std::string>   include_globs;
  std::vector<std::string>   exclude_globs;
};

struct RewriteRule {
  std::string                regex;
  std::string                replace;
  int64_t                    priority = 0;
  std::optional<std::string> description;
};

struct MatchResult {
  bool                       matched = false;
  // True when no explicit rule decided the outcome.
  bool                       by_default = false;
  std::optional<std::string> nature;
  int64_t                    priority = 0;
  // Regex of the deciding rule; empty for the default.
  std::string                rule;
  // Path after rewrite rules; the candidate's canonical uri.
  std::string                canonical_uri;
};

// fnmatch over the whole path. A leading "**/" also matches at the root.
bool GlobMatches(const std::string& pattern, const std::string& path);

bool AnyGlobMatches(const std::vector<std::string>& patterns, const std::string& path);

// Empty include list admits everything; any exclude match rejects.
bool PassesGlobs(const std::vector<std::string>& include, const std::vector<std::string>& exclude, const std::string& path);

/*
  Ordered match / rewrite rules of one namespace.

  Match rules are tried by ascending priority, ties broken by declaration
  order; the first rule whose regex is found in the path and whose globs
  admit it decides. A namespace without match rules matches everything.
  When rules exist and none matches, a strict namespace reports
  matched == false; a lenient one matches by default.

  Rewrite rules follow the same order; the first whose regex is found
  replaces its first occurrence and stops.
*/
class PathRuleSet {
 public:
  explicit PathRuleSet(std::string namespace_name, bool strict = false);

  // Throws ValidationError for an invalid regex.
  void AddMatchRule(const MatchRule& rule);
  void AddRewriteRule(const RewriteRule& rule);

  MatchResult Evaluate(const std::string& path) const;

  std::string Rewrite(const std::string& path) const;

  const std::string& Namespace() const {
    return namespace_;
  }
  bool Strict() const {
    return strict_;
  }
  std::size_t MatchRuleCount() const {
    return match_rules_.size();
  }

  // Upserts every rule under this namespace.
  void Persist(db::Repository& repository, const std::string& created_by) const;

  // Builds a rule set from the persisted rules of `namespace_name`.
  static PathRuleSet Load(db::Repository& repository, const std::string& namespace_name, bool strict);

 private:
  struct CompiledMatch {
    MatchRule   rule;
    std::regex  re;
    std::size_t declared = 0;
  };

  struct CompiledRewrite {
    RewriteRule rule;
    std::regex  re;
    std::size_t declared = 0;
  };

  static std::regex Compile(const std::string& pattern, bool icase);

  std::string                  namespace_;
  bool                         strict_;
  std::vector<CompiledMatch>   match_rules_;
  std::vector<CompiledRewrite> rewrite_rules_;
};

} // namespace ure::ingest
