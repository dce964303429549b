#pragma once

#include "config_manager.hpp"
#include "corruption_types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace logguard {

// Tagged outcome of a non-throwing validation pass
struct JsonParseResult {
  bool success = false;
  size_t maxDepth = 0;
  size_t errorPosition = 0;
  std::string errorMessage;
};

// Bracket/quote bookkeeping from a string-aware scan
struct JsonBalance {
  int openContainers = 0; // > 0 means unclosed, < 0 means stray closers
  bool unterminatedString = false;

  bool balanced() const { return openContainers == 0 && !unterminatedString; }
};

/**
 * JSON-aware line sanitizer. Valid lines within the depth limit pass
 * through byte for byte; deeper documents are flattened; malformed ones go
 * through a fixed sequence of textual repairs and, failing those, are
 * re-encoded as a single JSON string literal.
 *
 * Nothing here recurses on input nesting: validation is a SAX pass and
 * flattening is a linear scan, so a 10,000-deep payload costs the same
 * stack as a flat one.
 */
class JsonRepair {
public:
  explicit JsonRepair(const SanitizerConfig &config);

  static bool looksLikeJson(std::string_view line);

  static JsonParseResult validate(std::string_view text);

  // Sanitises one line in place, recording detections and actions
  void process(std::string &line, size_t lineNumber,
               SanitizationResult &result) const;

  // Containers nested deeper than maxDepth become string literals of their
  // raw text. Expects syntactically valid input.
  static std::string flattenBeyondDepth(std::string_view text, int maxDepth);

  static std::string normalizeQuotes(std::string_view text);
  static std::string quoteBareKeys(std::string_view text);
  static std::string stripTrailingCommas(std::string_view text);
  static std::optional<std::string> attemptRepair(std::string_view text);

  static JsonBalance scanBalance(std::string_view text);

  // Encodes the line as one JSON string no longer than maxLength bytes
  static std::string escapeAsString(std::string_view line, size_t maxLength);

private:
  SanitizerConfig config_;

  bool looksTruncated(std::string_view text,
                      const JsonParseResult &parse) const;
  std::string canonicalFlatten(std::string_view text) const;
};

} // namespace logguard
