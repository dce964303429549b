#include "content_filters.hpp"
#include "component_logger.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <sstream>

namespace logguard {

namespace {

using namespace std::string_view_literals;

// Leading bytes of formats that never belong in a text log
constexpr std::array<FileSignature, 10> kFileSignatures = {{
    {"\x89PNG\r\n\x1a\n"sv, "image/png"},
    {"\xFF\xD8\xFF"sv, "image/jpeg"},
    {"GIF87a"sv, "image/gif"},
    {"GIF89a"sv, "image/gif"},
    {"%PDF-"sv, "application/pdf"},
    {"PK\x03\x04"sv, "application/zip"},
    {"\x1f\x8b\x08"sv, "application/gzip"},
    {"\x7f" "ELF"sv, "application/x-executable"},
    {"MZ\x90\x00"sv, "application/x-dosexec"},
    {"7z\xBC\xAF\x27\x1C"sv, "application/x-7z-compressed"},
}};

constexpr size_t kMaxReportedPositions = 5;
constexpr size_t kMaxReportedNullPositions = 10;

std::string formatPositions(const std::vector<size_t> &positions,
                            size_t limit) {
  std::ostringstream oss;
  oss << "positions: [";
  for (size_t i = 0; i < positions.size() && i < limit; ++i) {
    if (i > 0)
      oss << ", ";
    oss << positions[i];
  }
  oss << "]";
  return oss.str();
}

} // namespace

ContentFilters::ContentFilters(const SanitizerConfig &config)
    : config_(config) {}

bool ContentFilters::isControlByte(unsigned char c) noexcept {
  return c < 0x20 && c != '\t' && c != '\n' && c != '\r';
}

double ContentFilters::binaryRatio(std::string_view content) {
  size_t codePoints = 0;
  size_t binary = 0;
  for (unsigned char c : content) {
    if ((c & 0xC0) == 0x80) {
      continue; // continuation byte
    }
    ++codePoints;
    if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
      ++binary;
    }
  }
  return codePoints == 0
             ? 0.0
             : static_cast<double>(binary) / static_cast<double>(codePoints);
}

std::optional<FileSignature>
ContentFilters::sniffFileType(std::string_view header) {
  for (const auto &signature : kFileSignatures) {
    if (header.substr(0, signature.magic.size()) == signature.magic) {
      return signature;
    }
  }
  return std::nullopt;
}

std::string ContentFilters::apply(std::string content,
                                  std::string_view rawHeader,
                                  SanitizationResult &result) const {
  content = enforceSizeLimit(std::move(content), result);

  // Ratio is taken before any stripping so NULs count towards it
  bool binary = detectBinary(content, rawHeader, result);

  content = removeNullBytes(std::move(content), result);
  if (binary) {
    content = stripBinary(std::move(content), result);
  }
  return stripControlCharacters(std::move(content), result);
}

std::string ContentFilters::enforceSizeLimit(std::string content,
                                             SanitizationResult &result) const {
  const auto limit = static_cast<size_t>(config_.maxLogSize);
  if (content.size() <= limit) {
    return content;
  }

  const size_t originalSize = content.size();
  FilterLogger::warn("Content size {} exceeds limit {}, truncating",
                     originalSize, limit);

  result.corruptionsDetected.push_back(makeDetection(
      CorruptionType::OVERSIZED_ENTRY, Severity::MEDIUM, "entire_content",
      "Content size " + std::to_string(originalSize) +
          " bytes exceeds maximum of " + std::to_string(limit),
      content, 1.0));

  content = truncateUtf8(content, limit);
  result.actionsTaken.emplace_back(
      SanitizationAction::TRUNCATED,
      "Truncated content from " + std::to_string(originalSize) + " to " +
          std::to_string(content.size()) + " bytes");
  return content;
}

bool ContentFilters::detectBinary(std::string_view content,
                                  std::string_view rawHeader,
                                  SanitizationResult &result) const {
  const double ratio = binaryRatio(content);
  std::optional<FileSignature> signature;
  if (config_.enableFileTypeSniffing) {
    signature = sniffFileType(rawHeader);
  }

  if (ratio <= config_.binaryRatioThreshold && !signature) {
    return false;
  }

  std::ostringstream description;
  description.precision(3);
  description << "Binary content detected (control ratio " << ratio << ")";

  Severity severity = Severity::HIGH;
  double confidence = std::min(1.0, ratio * 2.0);
  std::string location = "entire_content";

  if (signature) {
    severity = Severity::CRITICAL;
    confidence = std::max(confidence, 0.9);
    location = "file_header";
    description << ", file signature matches " << signature->mimeType;
  }

  // Printable rendering of the leading bytes
  std::string sample;
  for (unsigned char c : content.substr(0, 32)) {
    if (c < 0x20 || c == 0x7F) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\x%02x", c);
      sample += buf;
    } else {
      sample += static_cast<char>(c);
    }
  }

  result.corruptionsDetected.push_back(
      makeDetection(CorruptionType::BINARY_DATA, severity, location,
                    description.str(), sample, confidence));
  return true;
}

std::string ContentFilters::removeNullBytes(std::string content,
                                            SanitizationResult &result) const {
  std::vector<size_t> positions;
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\0') {
      positions.push_back(i);
    }
  }
  if (positions.empty()) {
    return content;
  }

  std::ostringstream sample;
  sample << "Null bytes at "
         << formatPositions(positions, kMaxReportedPositions);

  result.corruptionsDetected.push_back(makeDetection(
      CorruptionType::NULL_BYTES, Severity::HIGH,
      formatPositions(positions, kMaxReportedNullPositions),
      "Found " + std::to_string(positions.size()) + " null bytes",
      sample.str(), 1.0));

  content.erase(std::remove(content.begin(), content.end(), '\0'),
                content.end());
  result.actionsTaken.emplace_back(SanitizationAction::REMOVED,
                                   "Removed " +
                                       std::to_string(positions.size()) +
                                       " null bytes");
  return content;
}

std::string ContentFilters::stripBinary(std::string content,
                                        SanitizationResult &result) const {
  const size_t before = content.size();
  content.erase(std::remove_if(content.begin(), content.end(),
                               [](char c) {
                                 auto u = static_cast<unsigned char>(c);
                                 return u < 0x20 && u != '\t' && u != '\n' &&
                                        u != '\r';
                               }),
                content.end());

  const size_t removed = before - content.size();
  if (removed > 0) {
    result.actionsTaken.emplace_back(SanitizationAction::SANITIZED,
                                     "Removed " + std::to_string(removed) +
                                         " non-printable characters");
  }
  return content;
}

std::string
ContentFilters::stripControlCharacters(std::string content,
                                       SanitizationResult &result) const {
  std::vector<size_t> positions;
  std::string sample;
  for (size_t i = 0; i < content.size(); ++i) {
    auto c = static_cast<unsigned char>(content[i]);
    if (!isControlByte(c)) {
      continue;
    }
    if (positions.size() < kMaxReportedPositions) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%s\\x%02x@%zu",
                    sample.empty() ? "" : " ", c, i);
      sample += buf;
    }
    positions.push_back(i);
  }
  if (positions.empty()) {
    return content;
  }

  result.corruptionsDetected.push_back(makeDetection(
      CorruptionType::CONTROL_CHARACTERS, Severity::MEDIUM,
      formatPositions(positions, kMaxReportedPositions),
      "Found " + std::to_string(positions.size()) + " control characters",
      sample, 0.8));

  content.erase(std::remove_if(content.begin(), content.end(),
                               [](char c) {
                                 return isControlByte(
                                     static_cast<unsigned char>(c));
                               }),
                content.end());
  result.actionsTaken.emplace_back(SanitizationAction::SANITIZED,
                                   "Removed " +
                                       std::to_string(positions.size()) +
                                       " control characters");
  return content;
}

} // namespace logguard
