#pragma once

#include "corruption_types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logguard {

struct EncodingGuess {
  std::string encoding; // iconv name, e.g. "UTF-16LE", "WINDOWS-1252"
  double confidence = 0.0;
  size_t bomLength = 0;
};

struct NormalizedText {
  std::string text; // always valid UTF-8
  std::string encoding;
  bool wasUtf8 = true;
  std::vector<CorruptionDetection> detections;
  std::vector<ActionRecord> actions;
};

/**
 * Turns raw bytes into UTF-8 text. Strictly valid UTF-8 passes through
 * untouched; anything else is guessed, converted with iconv and reported as
 * an encoding_error. Never throws on hostile input.
 */
class EncodingNormalizer {
public:
  NormalizedText normalize(std::string_view bytes) const;

  // Rejects overlongs, surrogates and code points above U+10FFFF
  static bool isValidUtf8(std::string_view bytes) noexcept;

  // nullopt when the bytes look binary rather than text
  static std::optional<EncodingGuess> guessEncoding(std::string_view bytes);

  // Invalid or truncated input sequences become U+FFFD. nullopt only when
  // iconv has no converter for the encoding.
  static std::optional<std::string> convertToUtf8(std::string_view bytes,
                                                  const std::string &encoding);

  static std::string decodeLatin1(std::string_view bytes);

  // Replaces every invalid sequence with U+FFFD
  static std::string repairUtf8(std::string_view bytes);
};

} // namespace logguard
