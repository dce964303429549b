#pragma once

#include "config_manager.hpp"
#include "corruption_types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace logguard {

enum class CompressionCodec { GZIP, ZLIB, RAW_DEFLATE, ZIP };

std::string toString(CompressionCodec codec);

// Tagged outcome of one decompression attempt chain
struct DecompressionResult {
  bool success = false;
  CompressionCodec codec = CompressionCodec::GZIP;
  std::string data;
  bool truncated = false; // output hit the size cap before end of stream
  std::string error;
};

struct CompressionSignal {
  std::string decoded; // raw bytes behind the base64 text
  std::string reason;  // "gzip signature", "entropy 7.91", ...
  double entropy = 0.0;
};

/**
 * Recognises base64-wrapped compressed payloads on a single line and
 * replaces them with their decompressed text. Base64 goes through OpenSSL,
 * inflation through zlib.
 */
class CompressionDetector {
public:
  explicit CompressionDetector(const SanitizerConfig &config);

  std::optional<CompressionSignal> detect(std::string_view line) const;

  // Returns true when the line was replaced by decompressed text, which the
  // caller is expected to screen again. Newlines in the payload are kept, so
  // the replacement may hold several records.
  bool process(std::string &line, size_t lineNumber,
               SanitizationResult &result) const;

  // Strict decoding: base64 alphabet only, length a multiple of four,
  // at most two trailing '=' characters
  static std::optional<std::string> decodeBase64(std::string_view text);
  static std::string encodeBase64(std::string_view bytes);

  // Bits per byte, 0..8
  static double shannonEntropy(std::string_view bytes);

  // "gzip", "zip" or "zlib" for a recognised leading signature
  static std::optional<std::string> signatureOf(std::string_view bytes);

  // Tries gzip, zlib and raw deflate in that order (zip archives inflate
  // their first entry). Output is capped at maxOutput bytes.
  static DecompressionResult decompress(std::string_view data,
                                        size_t maxOutput);

private:
  SanitizerConfig config_;
};

} // namespace logguard
