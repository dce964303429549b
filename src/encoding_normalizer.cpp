#include "encoding_normalizer.hpp"
#include "component_logger.hpp"
#include <algorithm>
#include <cerrno>
#include <iconv.h>
#include <iomanip>
#include <sstream>

namespace logguard {

namespace {

constexpr const char *kReplacementChar = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at p, 0 if malformed
size_t sequenceLength(const unsigned char *p, const unsigned char *end) {
  const unsigned char c = p[0];
  if (c < 0x80) {
    return 1;
  }

  size_t need = 0;
  if (c >= 0xC2 && c <= 0xDF) {
    need = 1;
  } else if (c >= 0xE0 && c <= 0xEF) {
    need = 2;
  } else if (c >= 0xF0 && c <= 0xF4) {
    need = 3;
  } else {
    return 0;
  }

  if (static_cast<size_t>(end - p) < need + 1) {
    return 0;
  }
  for (size_t i = 1; i <= need; ++i) {
    if ((p[i] & 0xC0) != 0x80) {
      return 0;
    }
  }

  const unsigned char c1 = p[1];
  if (c == 0xE0 && c1 < 0xA0)
    return 0; // overlong
  if (c == 0xED && c1 >= 0xA0)
    return 0; // surrogate half
  if (c == 0xF0 && c1 < 0x90)
    return 0; // overlong
  if (c == 0xF4 && c1 > 0x8F)
    return 0; // beyond U+10FFFF

  return need + 1;
}

std::optional<EncodingGuess> probeBom(std::string_view bytes) {
  const size_t n = bytes.size();
  const auto *d = reinterpret_cast<const unsigned char *>(bytes.data());

  if (n >= 3 && d[0] == 0xEF && d[1] == 0xBB && d[2] == 0xBF)
    return EncodingGuess{"UTF-8", 1.0, 3};
  if (n >= 4 && d[0] == 0x00 && d[1] == 0x00 && d[2] == 0xFE && d[3] == 0xFF)
    return EncodingGuess{"UTF-32BE", 1.0, 4};
  if (n >= 4 && d[0] == 0xFF && d[1] == 0xFE && d[2] == 0x00 && d[3] == 0x00)
    return EncodingGuess{"UTF-32LE", 1.0, 4};
  if (n >= 2 && d[0] == 0xFE && d[1] == 0xFF)
    return EncodingGuess{"UTF-16BE", 1.0, 2};
  if (n >= 2 && d[0] == 0xFF && d[1] == 0xFE)
    return EncodingGuess{"UTF-16LE", 1.0, 2};
  return std::nullopt;
}

// Mostly-ASCII text in UTF-16/32 leaves NULs at fixed positions
std::optional<EncodingGuess> guessWide(std::string_view bytes) {
  const size_t n = bytes.size();
  if (n < 4) {
    return std::nullopt;
  }
  const auto *d = reinterpret_cast<const unsigned char *>(bytes.data());

  size_t zeroByMod4[4] = {0, 0, 0, 0};
  for (size_t i = 0; i < n; ++i) {
    if (d[i] == 0) {
      ++zeroByMod4[i & 3];
    }
  }

  const double quarter = static_cast<double>(n) / 4.0;
  const double half = static_cast<double>(n) / 2.0;

  if (n % 4 == 0) {
    double le = (zeroByMod4[1] + zeroByMod4[2] + zeroByMod4[3]) / (3 * quarter);
    double be = (zeroByMod4[0] + zeroByMod4[1] + zeroByMod4[2]) / (3 * quarter);
    if (le > 0.9 && zeroByMod4[0] / quarter < 0.1)
      return EncodingGuess{"UTF-32LE", 0.85, 0};
    if (be > 0.9 && zeroByMod4[3] / quarter < 0.1)
      return EncodingGuess{"UTF-32BE", 0.85, 0};
  }

  if (n % 2 == 0) {
    double evenRatio = (zeroByMod4[0] + zeroByMod4[2]) / half;
    double oddRatio = (zeroByMod4[1] + zeroByMod4[3]) / half;
    if (oddRatio > 0.4 && evenRatio < 0.1)
      return EncodingGuess{"UTF-16LE", std::min(0.95, 0.5 + oddRatio / 2), 0};
    if (evenRatio > 0.4 && oddRatio < 0.1)
      return EncodingGuess{"UTF-16BE", std::min(0.95, 0.5 + evenRatio / 2), 0};
  }

  return std::nullopt;
}

size_t codeUnitWidth(const std::string &encoding) {
  if (encoding.rfind("UTF-32", 0) == 0)
    return 4;
  if (encoding.rfind("UTF-16", 0) == 0)
    return 2;
  return 1;
}

class IconvHandle {
public:
  IconvHandle(const char *to, const char *from) : cd_(iconv_open(to, from)) {}
  ~IconvHandle() {
    if (valid()) {
      iconv_close(cd_);
    }
  }
  IconvHandle(const IconvHandle &) = delete;
  IconvHandle &operator=(const IconvHandle &) = delete;

  bool valid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
  iconv_t get() const { return cd_; }

private:
  iconv_t cd_;
};

} // namespace

bool EncodingNormalizer::isValidUtf8(std::string_view bytes) noexcept {
  const auto *p = reinterpret_cast<const unsigned char *>(bytes.data());
  const auto *end = p + bytes.size();
  while (p < end) {
    size_t len = sequenceLength(p, end);
    if (len == 0) {
      return false;
    }
    p += len;
  }
  return true;
}

std::string EncodingNormalizer::repairUtf8(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  const auto *begin = reinterpret_cast<const unsigned char *>(bytes.data());
  const auto *p = begin;
  const auto *end = p + bytes.size();
  while (p < end) {
    size_t len = sequenceLength(p, end);
    if (len == 0) {
      out += kReplacementChar;
      ++p;
    } else {
      out.append(bytes.substr(static_cast<size_t>(p - begin), len));
      p += len;
    }
  }
  return out;
}

std::optional<EncodingGuess>
EncodingNormalizer::guessEncoding(std::string_view bytes) {
  if (auto bom = probeBom(bytes)) {
    return bom;
  }
  if (auto wide = guessWide(bytes)) {
    return wide;
  }

  size_t controls = 0;
  size_t high = 0;
  size_t c1 = 0;
  size_t letters = 0;
  for (unsigned char b : bytes) {
    if (b < 0x20 && b != '\t' && b != '\n' && b != '\r') {
      ++controls;
    } else if (b >= 0x80) {
      ++high;
      if (b <= 0x9F) {
        ++c1;
      } else if (b >= 0xC0 && b != 0xD7 && b != 0xF7) {
        ++letters;
      }
    }
  }

  if (bytes.empty() ||
      static_cast<double>(controls) / static_cast<double>(bytes.size()) > 0.3) {
    return std::nullopt;
  }

  if (c1 > 0) {
    return EncodingGuess{"WINDOWS-1252", 0.7, 0};
  }
  double letterShare =
      high == 0 ? 0.0 : static_cast<double>(letters) / static_cast<double>(high);
  return EncodingGuess{"ISO-8859-1", letterShare >= 0.5 ? 0.9 : 0.6, 0};
}

std::optional<std::string>
EncodingNormalizer::convertToUtf8(std::string_view bytes,
                                  const std::string &encoding) {
  IconvHandle cd("UTF-8", encoding.c_str());
  if (!cd.valid()) {
    EncodingLogger::warn("No converter available for encoding {}", encoding);
    return std::nullopt;
  }

  const size_t unit = codeUnitWidth(encoding);
  std::string out;
  out.reserve(bytes.size() * 2);

  // iconv takes a non-const input pointer but never writes through it
  char *in = const_cast<char *>(bytes.data());
  size_t inLeft = bytes.size();
  char buffer[4096];

  while (inLeft > 0) {
    char *outPtr = buffer;
    size_t outLeft = sizeof(buffer);
    size_t rc = iconv(cd.get(), &in, &inLeft, &outPtr, &outLeft);
    out.append(buffer, static_cast<size_t>(outPtr - buffer));

    if (rc != static_cast<size_t>(-1)) {
      continue;
    }
    if (errno == E2BIG) {
      continue;
    }
    if (errno == EILSEQ || errno == EINVAL) {
      out += kReplacementChar;
      size_t skip = std::min(unit, inLeft);
      in += skip;
      inLeft -= skip;
      iconv(cd.get(), nullptr, nullptr, nullptr, nullptr);
      continue;
    }
    EncodingLogger::warn("iconv failed for encoding {} (errno {})", encoding,
                         errno);
    return std::nullopt;
  }

  char *outPtr = buffer;
  size_t outLeft = sizeof(buffer);
  iconv(cd.get(), nullptr, nullptr, &outPtr, &outLeft);
  out.append(buffer, static_cast<size_t>(outPtr - buffer));

  // Converters may pass through sequences they consider valid but we don't
  return isValidUtf8(out) ? out : repairUtf8(out);
}

std::string EncodingNormalizer::decodeLatin1(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char b : bytes) {
    if (b < 0x80) {
      out += static_cast<char>(b);
    } else {
      out += static_cast<char>(0xC0 | (b >> 6));
      out += static_cast<char>(0x80 | (b & 0x3F));
    }
  }
  return out;
}

NormalizedText EncodingNormalizer::normalize(std::string_view bytes) const {
  NormalizedText result;

  if (isValidUtf8(bytes)) {
    result.text = std::string(bytes);
    result.encoding = "UTF-8";
    return result;
  }

  result.wasUtf8 = false;

  if (auto guess = guessEncoding(bytes)) {
    if (auto converted =
            convertToUtf8(bytes.substr(guess->bomLength), guess->encoding)) {
      std::ostringstream description;
      description << "Content is not valid UTF-8, decoded as "
                  << guess->encoding << " (confidence " << std::fixed
                  << std::setprecision(2) << guess->confidence << ")";

      result.text = std::move(*converted);
      result.encoding = guess->encoding;
      result.detections.push_back(makeDetection(
          CorruptionType::ENCODING_ERROR,
          guess->confidence >= 0.8 ? Severity::LOW : Severity::MEDIUM,
          "entire_content", description.str(), result.text,
          guess->confidence));
      result.actions.emplace_back(SanitizationAction::DECODED,
                                  "Decoded content from " + guess->encoding +
                                      " to UTF-8");
      return result;
    }
  }

  EncodingLogger::warn(
      "Encoding detection failed for {} bytes, falling back to ISO-8859-1",
      bytes.size());

  result.text = decodeLatin1(bytes);
  result.encoding = "ISO-8859-1";
  result.detections.push_back(makeDetection(
      CorruptionType::ENCODING_ERROR, Severity::HIGH, "entire_content",
      "Encoding could not be determined, decoded as ISO-8859-1", result.text,
      0.5));
  result.actions.emplace_back(SanitizationAction::DECODED,
                              "Decoded content from ISO-8859-1 fallback");
  return result;
}

} // namespace logguard
