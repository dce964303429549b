#include "json_repair.hpp"
#include "component_logger.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace logguard {

namespace {

using json = nlohmann::json;

// Validation-only SAX consumer: tracks nesting, keeps no values
class DepthTrackingSax : public nlohmann::json_sax<json> {
public:
  size_t maxDepth = 0;
  size_t errorPosition = 0;
  std::string errorMessage;

  bool null() override { return true; }
  bool boolean(bool) override { return true; }
  bool number_integer(number_integer_t) override { return true; }
  bool number_unsigned(number_unsigned_t) override { return true; }
  bool number_float(number_float_t, const string_t &) override { return true; }
  bool string(string_t &) override { return true; }
  bool binary(binary_t &) override { return true; }
  bool key(string_t &) override { return true; }

  bool start_object(std::size_t) override { return enter(); }
  bool end_object() override { return leave(); }
  bool start_array(std::size_t) override { return enter(); }
  bool end_array() override { return leave(); }

  bool parse_error(std::size_t position, const std::string &,
                   const json::exception &ex) override {
    errorPosition = position;
    errorMessage = ex.what();
    return false;
  }

private:
  size_t depth_ = 0;

  bool enter() {
    ++depth_;
    maxDepth = std::max(maxDepth, depth_);
    return true;
  }
  bool leave() {
    --depth_;
    return true;
  }
};

std::string_view trimView(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;
  return text.substr(begin, end - begin);
}

// Index one past the closing quote of the string starting at `open`, or
// text.size() with *closed left false when the string never ends
size_t skipString(std::string_view text, size_t open, bool *closed = nullptr) {
  const char quote = text[open];
  size_t i = open + 1;
  while (i < text.size()) {
    if (text[i] == '\\') {
      i += 2;
      continue;
    }
    if (text[i] == quote) {
      if (closed != nullptr) {
        *closed = true;
      }
      return i + 1;
    }
    ++i;
  }
  return text.size();
}

// Index one past the bracket closing the container opened at `open`
size_t skipContainer(std::string_view text, size_t open) {
  int depth = 0;
  size_t i = open;
  while (i < text.size()) {
    char c = text[i];
    if (c == '"') {
      i = skipString(text, i);
      continue;
    }
    if (c == '{' || c == '[') {
      ++depth;
    } else if (c == '}' || c == ']') {
      if (--depth == 0) {
        return i + 1;
      }
    }
    ++i;
  }
  return text.size();
}

bool isIdentifierStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool isIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
         c == '$' || c == '-';
}

std::string dumpString(std::string_view raw) {
  return json(std::string(raw))
      .dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

JsonRepair::JsonRepair(const SanitizerConfig &config) : config_(config) {}

bool JsonRepair::looksLikeJson(std::string_view line) {
  auto trimmed = trimView(line);
  return !trimmed.empty() && (trimmed.front() == '{' || trimmed.front() == '[');
}

JsonParseResult JsonRepair::validate(std::string_view text) {
  DepthTrackingSax sax;
  JsonParseResult result;
  result.success =
      json::sax_parse(text.data(), text.data() + text.size(), &sax);
  result.maxDepth = sax.maxDepth;
  result.errorPosition = sax.errorPosition;
  result.errorMessage = std::move(sax.errorMessage);
  return result;
}

JsonBalance JsonRepair::scanBalance(std::string_view text) {
  JsonBalance balance;
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '"') {
      bool closed = false;
      i = skipString(text, i, &closed);
      if (!closed) {
        balance.unterminatedString = true;
      }
      continue;
    }
    if (c == '{' || c == '[') {
      ++balance.openContainers;
    } else if (c == '}' || c == ']') {
      --balance.openContainers;
    }
    ++i;
  }
  return balance;
}

std::string JsonRepair::flattenBeyondDepth(std::string_view text,
                                           int maxDepth) {
  std::string out;
  out.reserve(text.size() + 16);
  int depth = 0;
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '"') {
      size_t end = skipString(text, i);
      out.append(text.substr(i, end - i));
      i = end;
      continue;
    }
    if (c == '{' || c == '[') {
      if (depth >= maxDepth) {
        size_t end = skipContainer(text, i);
        out += dumpString(text.substr(i, end - i));
        i = end;
        continue;
      }
      ++depth;
    } else if (c == '}' || c == ']') {
      --depth;
    }
    out += c;
    ++i;
  }
  return out;
}

std::string JsonRepair::normalizeQuotes(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '"') {
      size_t end = skipString(text, i);
      out.append(text.substr(i, end - i));
      i = end;
      continue;
    }
    if (c != '\'') {
      out += c;
      ++i;
      continue;
    }

    // Re-emit a single-quoted string with double quotes
    out += '"';
    ++i;
    while (i < text.size() && text[i] != '\'') {
      if (text[i] == '\\' && i + 1 < text.size()) {
        if (text[i + 1] == '\'') {
          out += '\'';
        } else {
          out += text[i];
          out += text[i + 1];
        }
        i += 2;
        continue;
      }
      if (text[i] == '"') {
        out += "\\\"";
      } else {
        out += text[i];
      }
      ++i;
    }
    out += '"';
    if (i < text.size()) {
      ++i; // closing quote
    }
  }
  return out;
}

std::string JsonRepair::quoteBareKeys(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  bool expectKey = false;
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '"') {
      size_t end = skipString(text, i);
      out.append(text.substr(i, end - i));
      i = end;
      expectKey = false;
      continue;
    }
    if (c == '{' || c == ',') {
      expectKey = true;
      out += c;
      ++i;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      out += c;
      ++i;
      continue;
    }
    if (expectKey && isIdentifierStart(c)) {
      size_t end = i;
      while (end < text.size() && isIdentifierChar(text[end])) {
        ++end;
      }
      size_t next = end;
      while (next < text.size() &&
             std::isspace(static_cast<unsigned char>(text[next]))) {
        ++next;
      }
      if (next < text.size() && text[next] == ':') {
        out += '"';
        out.append(text.substr(i, end - i));
        out += '"';
      } else {
        out.append(text.substr(i, end - i));
      }
      i = end;
      expectKey = false;
      continue;
    }
    expectKey = false;
    out += c;
    ++i;
  }
  return out;
}

std::string JsonRepair::stripTrailingCommas(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == '"') {
      size_t end = skipString(text, i);
      out.append(text.substr(i, end - i));
      i = end;
      continue;
    }
    if (c == ',') {
      size_t next = i + 1;
      while (next < text.size() &&
             std::isspace(static_cast<unsigned char>(text[next]))) {
        ++next;
      }
      if (next < text.size() && (text[next] == '}' || text[next] == ']')) {
        ++i; // drop the dangling comma
        continue;
      }
    }
    out += c;
    ++i;
  }
  return out;
}

std::optional<std::string> JsonRepair::attemptRepair(std::string_view text) {
  std::string repaired =
      stripTrailingCommas(quoteBareKeys(normalizeQuotes(text)));
  if (validate(repaired).success) {
    return repaired;
  }
  return std::nullopt;
}

std::string JsonRepair::escapeAsString(std::string_view line,
                                       size_t maxLength) {
  // One input byte expands to at most six output bytes (\u00XX)
  constexpr size_t kMaxEscapeExpansion = 6;

  std::string encoded = dumpString(line);
  size_t budget = line.size();
  while (encoded.size() > maxLength && budget > 0) {
    size_t excess = encoded.size() - maxLength;
    size_t step = std::max<size_t>(1, excess / kMaxEscapeExpansion);
    budget = budget > step ? budget - step : 0;
    std::string cut = truncateUtf8(line, budget);
    budget = cut.size();
    encoded = dumpString(cut);
  }
  return encoded;
}

bool JsonRepair::looksTruncated(std::string_view text,
                                const JsonParseResult &parse) const {
  auto trimmed = trimView(text);
  if (trimmed.size() >= 3 && trimmed.substr(trimmed.size() - 3) == "...") {
    return true;
  }
  if (parse.errorMessage.find("unexpected end of input") != std::string::npos) {
    return true;
  }
  JsonBalance balance = scanBalance(trimmed);
  return balance.unterminatedString || balance.openContainers > 0;
}

std::string JsonRepair::canonicalFlatten(std::string_view text) const {
  std::string flattened = flattenBeyondDepth(text, config_.maxJsonDepth);
  json document = json::parse(flattened, nullptr, false);
  const auto maxLength = static_cast<size_t>(config_.maxLineLength);
  if (document.is_discarded()) {
    return escapeAsString(text, maxLength);
  }
  std::string canonical =
      document.dump(-1, ' ', false, json::error_handler_t::replace);
  if (canonical.size() > maxLength) {
    return escapeAsString(text, maxLength);
  }
  return canonical;
}

void JsonRepair::process(std::string &line, size_t lineNumber,
                         SanitizationResult &result) const {
  const std::string lineLabel = "line_" + std::to_string(lineNumber);
  const auto depthLimit = static_cast<size_t>(config_.maxJsonDepth);

  JsonParseResult parse = validate(line);
  if (parse.success) {
    if (parse.maxDepth <= depthLimit) {
      return;
    }

    result.corruptionsDetected.push_back(makeDetection(
        CorruptionType::MALFORMED_JSON, Severity::MEDIUM, lineLabel,
        "JSON nesting depth " + std::to_string(parse.maxDepth) +
            " exceeds limit of " + std::to_string(depthLimit),
        line, 0.8));
    line = canonicalFlatten(line);
    result.actionsTaken.emplace_back(
        SanitizationAction::SANITIZED,
        "Flattened JSON nested beyond depth " + std::to_string(depthLimit) +
            " on line " + std::to_string(lineNumber));
    return;
  }

  result.corruptionsDetected.push_back(makeDetection(
      CorruptionType::MALFORMED_JSON, Severity::HIGH,
      lineLabel + ":pos_" + std::to_string(parse.errorPosition),
      "Invalid JSON: " + parse.errorMessage, line, 0.9));

  if (looksTruncated(line, parse)) {
    result.corruptionsDetected.push_back(makeDetection(
        CorruptionType::TRUNCATED_LOG, Severity::MEDIUM, lineLabel,
        "JSON entry appears to be cut off", line, 0.7));
  }

  if (auto repaired = attemptRepair(line)) {
    if (validate(*repaired).maxDepth > depthLimit) {
      *repaired = canonicalFlatten(*repaired);
    }
    JsonRepairLogger::debug("Repaired malformed JSON on line {}", lineNumber);
    line = std::move(*repaired);
    result.actionsTaken.emplace_back(SanitizationAction::SANITIZED,
                                     "Repaired malformed JSON on line " +
                                         std::to_string(lineNumber));
    return;
  }

  line = escapeAsString(line, static_cast<size_t>(config_.maxLineLength));
  result.actionsTaken.emplace_back(
      SanitizationAction::ESCAPED,
      "Encoded malformed JSON on line " + std::to_string(lineNumber) +
          " as a string literal");
}

} // namespace logguard
