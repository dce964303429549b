#pragma once

#include "config_manager.hpp"
#include "corruption_types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace logguard {

struct FileSignature {
  std::string_view magic;
  std::string_view mimeType;
};

/**
 * Whole-content passes run before line splitting: size ceiling, binary
 * ratio with file-type sniffing, null bytes and control characters. Each
 * pass appends its detections and actions to the result it is given.
 */
class ContentFilters {
public:
  explicit ContentFilters(const SanitizerConfig &config);

  // rawHeader is the undecoded start of the payload used for sniffing
  std::string apply(std::string content, std::string_view rawHeader,
                    SanitizationResult &result) const;

  std::string enforceSizeLimit(std::string content,
                               SanitizationResult &result) const;
  std::string removeNullBytes(std::string content,
                              SanitizationResult &result) const;
  std::string stripControlCharacters(std::string content,
                                     SanitizationResult &result) const;

  // Share of code points below 0x20 other than tab, newline and CR
  static double binaryRatio(std::string_view content);

  static std::optional<FileSignature> sniffFileType(std::string_view header);

  static bool isControlByte(unsigned char c) noexcept;

private:
  SanitizerConfig config_;

  bool detectBinary(std::string_view content, std::string_view rawHeader,
                    SanitizationResult &result) const;
  std::string stripBinary(std::string content,
                          SanitizationResult &result) const;
};

} // namespace logguard
