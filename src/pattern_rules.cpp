#include "pattern_rules.hpp"
#include "component_logger.hpp"
#include <algorithm>

namespace logguard {

namespace {

using svmatch = std::match_results<std::string_view::const_iterator>;

std::vector<PatternRule> buildInjectionRules() {
  const auto rx = MatcherKind::REGEX;
  const auto critical = Severity::CRITICAL;
  return {
      // SQL keyword sequences
      {"sql_union_select", RuleCategory::SQL_INJECTION, critical, rx,
       R"(\bunion\s{1,16}(all\s{1,16})?select\b)"},
      {"sql_drop", RuleCategory::SQL_INJECTION, critical, rx,
       R"(\bdrop\s{1,16}(table|database)\b)"},
      {"sql_delete_from", RuleCategory::SQL_INJECTION, critical, rx,
       R"(\bdelete\s{1,16}from\b)"},
      {"sql_insert_into", RuleCategory::SQL_INJECTION, critical, rx,
       R"(\binsert\s{1,16}into\b)"},
      {"sql_tautology", RuleCategory::SQL_INJECTION, critical, rx,
       R"('\s{0,4}or\s{1,4}'?\w{1,8}'?\s{0,4}=\s{0,4}'?\w{1,8})"},

      // Markup and script
      {"xss_script_tag", RuleCategory::XSS, critical, rx, R"(<\s{0,4}script\b)"},
      {"xss_javascript_uri", RuleCategory::XSS, critical, rx,
       R"(javascript\s{0,4}:)"},
      {"xss_event_handler", RuleCategory::XSS, critical, rx,
       R"(<[a-z][^>]{0,128}\son[a-z]{3,24}\s{0,4}=)"},
      {"xss_embedded_object", RuleCategory::XSS, critical, rx,
       R"(<\s{0,4}(iframe|object|embed|svg)\b)"},

      // Shell metacharacter sequences
      {"cmd_substitution", RuleCategory::COMMAND_INJECTION, critical, rx,
       R"(\$\([^)]{1,256}\))"},
      {"cmd_backtick", RuleCategory::COMMAND_INJECTION, critical, rx,
       R"(`\s{0,4}(rm|curl|wget|nc|bash|sh|chmod|chown|cat|python|perl|id|whoami|uname)\b[^`]{0,256}`)"},
      {"cmd_chain", RuleCategory::COMMAND_INJECTION, critical, rx,
       R"((;|&&|\|\|?)\s{0,8}(rm|curl|wget|nc|bash|sh|chmod|chown|cat|python|perl|powershell)\b)"},

      // Path traversal
      {"path_traversal", RuleCategory::PATH_TRAVERSAL, critical, rx,
       R"(\.\.[\\/])"},
      {"path_traversal_encoded", RuleCategory::PATH_TRAVERSAL, critical, rx,
       R"(%2e%2e(%2f|%5c|/))"},
      {"path_sensitive_file", RuleCategory::PATH_TRAVERSAL, critical, rx,
       R"(/etc/(passwd|shadow)\b)"},

      // LDAP filter metacharacters
      {"ldap_filter_break", RuleCategory::LDAP_INJECTION, critical, rx,
       R"(\*\)\s{0,4}\()"},
      {"ldap_filter_operator", RuleCategory::LDAP_INJECTION, critical, rx,
       R"(\(\s{0,4}[|&!]\s{0,4}\()"},
  };
}

std::vector<PatternRule> buildSuspiciousRules() {
  const auto rx = MatcherKind::REGEX;
  const auto medium = Severity::MEDIUM;
  return {
      {"percent_encoding", RuleCategory::PERCENT_ENCODING, medium, rx,
       R"(%[0-9a-f]{2})"},
      {"base64_run", RuleCategory::BASE64_RUN, medium,
       MatcherKind::CHARACTER_RUN, "", 50},
      {"hex_escape", RuleCategory::HEX_ESCAPE, medium, rx,
       R"(\\x[0-9a-f]{2})"},
      {"unicode_escape", RuleCategory::UNICODE_ESCAPE, medium, rx,
       R"(\\u[0-9a-f]{4})"},
  };
}

bool isBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string toString(RuleCategory category) {
  switch (category) {
  case RuleCategory::SQL_INJECTION:
    return "sql_injection";
  case RuleCategory::XSS:
    return "xss";
  case RuleCategory::COMMAND_INJECTION:
    return "command_injection";
  case RuleCategory::PATH_TRAVERSAL:
    return "path_traversal";
  case RuleCategory::LDAP_INJECTION:
    return "ldap_injection";
  case RuleCategory::PERCENT_ENCODING:
    return "percent_encoding";
  case RuleCategory::BASE64_RUN:
    return "base64_run";
  case RuleCategory::HEX_ESCAPE:
    return "hex_escape";
  case RuleCategory::UNICODE_ESCAPE:
    return "unicode_escape";
  }
  return "unknown";
}

const PatternRuleSet &PatternRuleSet::instance() {
  static const PatternRuleSet rules;
  return rules;
}

PatternRuleSet::PatternRuleSet()
    : injectionRules_(buildInjectionRules()),
      suspiciousRules_(buildSuspiciousRules()),
      injectionRegex_(compile(injectionRules_)),
      suspiciousRegex_(compile(suspiciousRules_)) {
  PatternLogger::debug("Compiled rule set {} ({} injection, {} suspicious)",
                       kVersion, injectionRules_.size(),
                       suspiciousRules_.size());
}

std::vector<std::optional<std::regex>>
PatternRuleSet::compile(const std::vector<PatternRule> &rules) {
  std::vector<std::optional<std::regex>> compiled;
  compiled.reserve(rules.size());
  for (const auto &rule : rules) {
    if (rule.kind == MatcherKind::REGEX) {
      compiled.emplace_back(std::regex(rule.expression,
                                       std::regex_constants::ECMAScript |
                                           std::regex_constants::icase |
                                           std::regex_constants::optimize));
    } else {
      compiled.emplace_back(std::nullopt);
    }
  }
  return compiled;
}

std::optional<RuleMatch>
PatternRuleSet::firstMatch(const PatternRule &rule,
                           const std::optional<std::regex> &re,
                           std::string_view line) {
  if (rule.kind == MatcherKind::CHARACTER_RUN) {
    std::vector<RuleMatch> runs;
    collectRuns(rule, line, runs);
    if (runs.empty()) {
      return std::nullopt;
    }
    return runs.front();
  }

  svmatch match;
  if (!std::regex_search(line.begin(), line.end(), match, *re)) {
    return std::nullopt;
  }
  return RuleMatch{&rule, static_cast<size_t>(match.position(0)),
                   static_cast<size_t>(match.length(0))};
}

void PatternRuleSet::collectRuns(const PatternRule &rule,
                                 std::string_view line,
                                 std::vector<RuleMatch> &out) {
  size_t i = 0;
  while (i < line.size()) {
    if (!isBase64Char(line[i])) {
      ++i;
      continue;
    }
    size_t start = i;
    while (i < line.size() && isBase64Char(line[i])) {
      ++i;
    }
    size_t runLength = i - start;
    size_t padding = 0;
    while (padding < 2 && i < line.size() && line[i] == '=') {
      ++padding;
      ++i;
    }
    if (runLength >= rule.minRunLength) {
      out.push_back(RuleMatch{&rule, start, runLength + padding});
    }
  }
}

std::vector<RuleMatch>
PatternRuleSet::matchInjection(std::string_view line) const {
  std::vector<RuleMatch> matches;
  for (size_t i = 0; i < injectionRules_.size(); ++i) {
    if (auto match = firstMatch(injectionRules_[i], injectionRegex_[i], line)) {
      matches.push_back(*match);
    }
  }
  return matches;
}

std::vector<RuleMatch>
PatternRuleSet::findSuspicious(std::string_view line) const {
  std::vector<RuleMatch> matches;
  for (size_t i = 0; i < suspiciousRules_.size(); ++i) {
    const auto &rule = suspiciousRules_[i];
    if (rule.kind == MatcherKind::CHARACTER_RUN) {
      collectRuns(rule, line, matches);
      continue;
    }
    const auto &re = *suspiciousRegex_[i];
    for (std::regex_iterator<std::string_view::const_iterator> it(
             line.begin(), line.end(), re),
         end;
         it != end; ++it) {
      matches.push_back(RuleMatch{&rule, static_cast<size_t>(it->position(0)),
                                  static_cast<size_t>(it->length(0))});
    }
  }
  return matches;
}

std::string PatternRuleSet::escapeSuspicious(const std::string &line) {
  static const std::regex javascriptUri(R"((javascript)(\s{0,4}):)",
                                        std::regex_constants::icase);
  static const std::regex sqlSequence(
      R"(\b(union\s{1,16}select|drop\s{1,16}table)\b)",
      std::regex_constants::icase);

  std::string escaped;
  escaped.reserve(line.size() + 16);
  for (char c : line) {
    if (c == '<') {
      escaped += "&lt;";
    } else if (c == '>') {
      escaped += "&gt;";
    } else {
      escaped += c;
    }
  }

  escaped = std::regex_replace(escaped, javascriptUri, "$1_ESCAPED$2:");
  escaped = std::regex_replace(escaped, sqlSequence, "$1_ESCAPED");
  return escaped;
}

} // namespace logguard
