#include "compression_detector.hpp"
#include "component_logger.hpp"
#include "content_filters.hpp"
#include "encoding_normalizer.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <openssl/evp.h>
#include <sstream>
#include <zlib.h>

namespace logguard {

namespace {

constexpr size_t kMinSignaturePayload = 18; // smallest possible gzip member
constexpr size_t kMinEntropyPayload = 100;
constexpr size_t kInflateChunk = 16 * 1024;

constexpr int kGzipWindowBits = 16 + MAX_WBITS;
constexpr int kZlibWindowBits = MAX_WBITS;
constexpr int kRawWindowBits = -MAX_WBITS;

bool isBase64Alphabet(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string_view trimView(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t' ||
                           text.front() == '\r')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' ||
                           text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return text;
}

// RAII wrapper so every exit path calls inflateEnd
class InflateStream {
public:
  explicit InflateStream(int windowBits) {
    stream_.zalloc = Z_NULL;
    stream_.zfree = Z_NULL;
    stream_.opaque = Z_NULL;
    stream_.next_in = Z_NULL;
    stream_.avail_in = 0;
    initialized_ = inflateInit2(&stream_, windowBits) == Z_OK;
  }
  ~InflateStream() {
    if (initialized_) {
      inflateEnd(&stream_);
    }
  }
  InflateStream(const InflateStream &) = delete;
  InflateStream &operator=(const InflateStream &) = delete;

  bool ok() const { return initialized_; }
  z_stream &get() { return stream_; }

private:
  z_stream stream_{};
  bool initialized_ = false;
};

DecompressionResult inflateWith(std::string_view data, int windowBits,
                                CompressionCodec codec, size_t maxOutput) {
  DecompressionResult result;
  result.codec = codec;

  InflateStream inflater(windowBits);
  if (!inflater.ok()) {
    result.error = "inflateInit2 failed";
    return result;
  }

  z_stream &zs = inflater.get();
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::array<char, kInflateChunk> buffer;
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = reinterpret_cast<Bytef *>(buffer.data());
    zs.avail_out = static_cast<uInt>(buffer.size());

    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      result.error = zs.msg != nullptr ? zs.msg : "inflate error " +
                                                      std::to_string(rc);
      return result;
    }

    size_t produced = buffer.size() - zs.avail_out;
    size_t room = maxOutput - result.data.size();
    if (produced > room) {
      result.data.append(buffer.data(), room);
      result.truncated = true;
      break;
    }
    result.data.append(buffer.data(), produced);

    // Input exhausted without end of stream
    if (rc == Z_OK && zs.avail_in == 0 && produced == 0) {
      result.error = "unexpected end of compressed stream";
      return result;
    }
  }

  result.success = true;
  return result;
}

// Offset of the first entry's data in a zip local file header
std::optional<size_t> zipEntryOffset(std::string_view data) {
  constexpr size_t kLocalHeaderSize = 30;
  if (data.size() < kLocalHeaderSize || data.substr(0, 4) != "PK\x03\x04") {
    return std::nullopt;
  }
  auto u16 = [&](size_t at) {
    return static_cast<size_t>(static_cast<unsigned char>(data[at])) |
           (static_cast<size_t>(static_cast<unsigned char>(data[at + 1])) << 8);
  };
  const size_t method = u16(8);
  if (method != 8) { // deflate only
    return std::nullopt;
  }
  size_t offset = kLocalHeaderSize + u16(26) + u16(28);
  if (offset >= data.size()) {
    return std::nullopt;
  }
  return offset;
}

} // namespace

std::string toString(CompressionCodec codec) {
  switch (codec) {
  case CompressionCodec::GZIP:
    return "gzip";
  case CompressionCodec::ZLIB:
    return "zlib";
  case CompressionCodec::RAW_DEFLATE:
    return "deflate";
  case CompressionCodec::ZIP:
    return "zip";
  }
  return "unknown";
}

CompressionDetector::CompressionDetector(const SanitizerConfig &config)
    : config_(config) {}

std::optional<std::string>
CompressionDetector::decodeBase64(std::string_view text) {
  if (text.empty() || text.size() % 4 != 0) {
    return std::nullopt;
  }

  size_t padding = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '=') {
      // Padding may only close the final quantum
      if (i < text.size() - 2) {
        return std::nullopt;
      }
      ++padding;
      continue;
    }
    if (padding > 0 || !isBase64Alphabet(c)) {
      return std::nullopt;
    }
  }

  std::string decoded(text.size() / 4 * 3, '\0');
  int written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char *>(decoded.data()),
      reinterpret_cast<const unsigned char *>(text.data()),
      static_cast<int>(text.size()));
  if (written < 0 || static_cast<size_t>(written) < padding) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts the zero bytes produced by padding
  decoded.resize(static_cast<size_t>(written) - padding);
  return decoded;
}

std::string CompressionDetector::encodeBase64(std::string_view bytes) {
  std::string encoded((bytes.size() + 2) / 3 * 4 + 1, '\0');
  int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char *>(encoded.data()),
      reinterpret_cast<const unsigned char *>(bytes.data()),
      static_cast<int>(bytes.size()));
  encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return encoded;
}

double CompressionDetector::shannonEntropy(std::string_view bytes) {
  if (bytes.empty()) {
    return 0.0;
  }
  std::array<size_t, 256> frequencies{};
  for (unsigned char c : bytes) {
    ++frequencies[c];
  }
  const auto length = static_cast<double>(bytes.size());
  double entropy = 0.0;
  for (size_t count : frequencies) {
    if (count == 0) {
      continue;
    }
    double p = static_cast<double>(count) / length;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

std::optional<std::string>
CompressionDetector::signatureOf(std::string_view bytes) {
  if (bytes.size() < 2) {
    return std::nullopt;
  }
  auto b0 = static_cast<unsigned char>(bytes[0]);
  auto b1 = static_cast<unsigned char>(bytes[1]);
  if (b0 == 0x1f && b1 == 0x8b) {
    return "gzip";
  }
  if (b0 == 'P' && b1 == 'K') {
    return "zip";
  }
  if (b0 == 0x78 && (b1 == 0x01 || b1 == 0x5e || b1 == 0x9c || b1 == 0xda)) {
    return "zlib";
  }
  return std::nullopt;
}

DecompressionResult CompressionDetector::decompress(std::string_view data,
                                                    size_t maxOutput) {
  if (auto offset = zipEntryOffset(data)) {
    auto zip = inflateWith(data.substr(*offset), kRawWindowBits,
                           CompressionCodec::ZIP, maxOutput);
    if (zip.success) {
      return zip;
    }
  }

  DecompressionResult last;
  for (auto [bits, codec] :
       {std::pair{kGzipWindowBits, CompressionCodec::GZIP},
        std::pair{kZlibWindowBits, CompressionCodec::ZLIB},
        std::pair{kRawWindowBits, CompressionCodec::RAW_DEFLATE}}) {
    last = inflateWith(data, bits, codec, maxOutput);
    if (last.success) {
      return last;
    }
  }
  return last;
}

std::optional<CompressionSignal>
CompressionDetector::detect(std::string_view line) const {
  auto text = trimView(line);
  auto decoded = decodeBase64(text);
  if (!decoded) {
    return std::nullopt;
  }

  CompressionSignal signal;
  if (decoded->size() >= kMinSignaturePayload) {
    if (auto signature = signatureOf(*decoded)) {
      signal.reason = *signature + " signature";
      signal.decoded = std::move(*decoded);
      return signal;
    }
  }

  if (text.size() > static_cast<size_t>(config_.minCompressedLineLength) &&
      decoded->size() > kMinEntropyPayload) {
    double entropy = shannonEntropy(*decoded);
    if (entropy > config_.entropyThreshold) {
      std::ostringstream reason;
      reason.precision(3);
      reason << "entropy " << entropy << " bits/byte";
      signal.reason = reason.str();
      signal.entropy = entropy;
      signal.decoded = std::move(*decoded);
      return signal;
    }
  }
  return std::nullopt;
}

bool CompressionDetector::process(std::string &line, size_t lineNumber,
                                  SanitizationResult &result) const {
  auto signal = detect(line);
  if (!signal) {
    return false;
  }

  const std::string location = "line_" + std::to_string(lineNumber);
  result.corruptionsDetected.push_back(
      makeDetection(CorruptionType::COMPRESSED_DATA, Severity::MEDIUM,
                    location,
                    "Base64 encoded compressed data detected (" +
                        signal->reason + ")",
                    line, 0.8));

  const auto maxLength = static_cast<size_t>(config_.maxLineLength);
  DecompressionResult inflated = decompress(signal->decoded, maxLength);
  if (!inflated.success) {
    CompressionLogger::debug("Line {} not decompressible: {}", lineNumber,
                             inflated.error);
    return false;
  }

  std::string text = EncodingNormalizer::repairUtf8(inflated.data);
  text.erase(std::remove_if(text.begin(), text.end(),
                            [](char c) {
                              auto u = static_cast<unsigned char>(c);
                              return ContentFilters::isControlByte(u) ||
                                     u == '\r';
                            }),
             text.end());

  if (inflated.truncated || text.size() > maxLength) {
    text = truncateUtf8(text, maxLength);
    result.corruptionsDetected.push_back(makeDetection(
        CorruptionType::OVERSIZED_ENTRY, Severity::MEDIUM, location,
        "Decompressed payload exceeds maximum line length of " +
            std::to_string(maxLength),
        text, 1.0));
    result.actionsTaken.emplace_back(
        SanitizationAction::TRUNCATED,
        "Truncated decompressed line " + std::to_string(lineNumber) + " to " +
            std::to_string(text.size()) + " bytes");
  }

  result.actionsTaken.emplace_back(
      SanitizationAction::DECOMPRESSED,
      "Decompressed line " + std::to_string(lineNumber) + " using " +
          toString(inflated.codec));
  line = std::move(text);
  return true;
}

} // namespace logguard
