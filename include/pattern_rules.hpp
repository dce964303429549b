#pragma once

#include "corruption_types.hpp"
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace logguard {

enum class RuleCategory {
  SQL_INJECTION,
  XSS,
  COMMAND_INJECTION,
  PATH_TRAVERSAL,
  LDAP_INJECTION,
  PERCENT_ENCODING,
  BASE64_RUN,
  HEX_ESCAPE,
  UNICODE_ESCAPE
};

std::string toString(RuleCategory category);

enum class MatcherKind {
  REGEX,
  // Linear scan for long runs of one character class; avoids regex
  // backtracking on unbounded repetitions
  CHARACTER_RUN
};

struct PatternRule {
  std::string id;
  RuleCategory category;
  Severity severity;
  MatcherKind kind;
  std::string expression; // ECMAScript, case-insensitive; unused for runs
  size_t minRunLength = 0;
};

struct RuleMatch {
  const PatternRule *rule = nullptr;
  size_t position = 0;
  size_t length = 0;
};

/**
 * Versioned, immutable rule table. Compiled once per process and shared
 * without locking. Injection rules lead to quarantine, suspicious rules
 * only contribute to a score.
 *
 * Every regex uses bounded repetition so matching cost stays linear in the
 * line length times a constant.
 */
class PatternRuleSet {
public:
  static constexpr const char *kVersion = "1.3.0";

  static const PatternRuleSet &instance();

  const std::vector<PatternRule> &injectionRules() const {
    return injectionRules_;
  }
  const std::vector<PatternRule> &suspiciousRules() const {
    return suspiciousRules_;
  }

  // First match of every injection rule that fires, in table order
  std::vector<RuleMatch> matchInjection(std::string_view line) const;

  // All non-overlapping matches of all suspicious rules
  std::vector<RuleMatch> findSuspicious(std::string_view line) const;

  // Neutralises markup and SQL keyword sequences without deleting them
  static std::string escapeSuspicious(const std::string &line);

private:
  PatternRuleSet();

  std::vector<PatternRule> injectionRules_;
  std::vector<PatternRule> suspiciousRules_;
  std::vector<std::optional<std::regex>> injectionRegex_;
  std::vector<std::optional<std::regex>> suspiciousRegex_;

  static std::vector<std::optional<std::regex>>
  compile(const std::vector<PatternRule> &rules);
  static std::optional<RuleMatch> firstMatch(const PatternRule &rule,
                                             const std::optional<std::regex> &re,
                                             std::string_view line);
  static void collectRuns(const PatternRule &rule, std::string_view line,
                          std::vector<RuleMatch> &out);
};

} // namespace logguard
