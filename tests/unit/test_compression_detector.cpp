#include "compression_detector.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <zlib.h>

using namespace logguard;

namespace {

std::string deflateWith(const std::string &data, int windowBits) {
  z_stream zs{};
  if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, windowBits, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  std::string out(deflateBound(&zs, static_cast<uLong>(data.size())) + 32,
                  '\0');
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  zs.next_out = reinterpret_cast<Bytef *>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  int rc = deflate(&zs, Z_FINISH);
  out.resize(zs.total_out);
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) {
    throw std::runtime_error("deflate did not finish");
  }
  return out;
}

std::string gzipCompress(const std::string &data) {
  return deflateWith(data, 16 + MAX_WBITS);
}

std::string zlibCompress(const std::string &data) {
  return deflateWith(data, MAX_WBITS);
}

std::string rawDeflate(const std::string &data) {
  return deflateWith(data, -MAX_WBITS);
}

std::string varietyText(size_t entries) {
  std::string text;
  for (size_t i = 0; i < entries; ++i) {
    text += "entry " + std::to_string(i * 7919 % 1000) + " status=" +
            std::to_string(i % 13) + "; ";
  }
  return text;
}

} // namespace

class CompressionDetectorTest : public ::testing::Test {
protected:
  SanitizerConfig config;

  void SetUp() override {
    LogConfig quiet;
    quiet.consoleOutput = false;
    quiet.level = LogLevel::FATAL;
    Logger::getInstance().configure(quiet);
  }
};

TEST_F(CompressionDetectorTest, Base64RoundTripThroughOpenSsl) {
  EXPECT_EQ(CompressionDetector::encodeBase64("abc"), "YWJj");
  EXPECT_EQ(CompressionDetector::encodeBase64("ab"), "YWI=");
  EXPECT_EQ(CompressionDetector::encodeBase64(""), "");

  EXPECT_EQ(CompressionDetector::decodeBase64("YWJj"), "abc");
  EXPECT_EQ(CompressionDetector::decodeBase64("YWI="), "ab");
  EXPECT_EQ(CompressionDetector::decodeBase64("YQ=="), "a");
}

TEST_F(CompressionDetectorTest, DecodingIsStrict) {
  EXPECT_FALSE(CompressionDetector::decodeBase64(""));
  EXPECT_FALSE(CompressionDetector::decodeBase64("YWJ"));      // length
  EXPECT_FALSE(CompressionDetector::decodeBase64("YW=j"));     // inner pad
  EXPECT_FALSE(CompressionDetector::decodeBase64("Y==="));     // 3 pads
  EXPECT_FALSE(CompressionDetector::decodeBase64("YW J"));     // space
  EXPECT_FALSE(CompressionDetector::decodeBase64("YWJj-_ab")); // url-safe
}

TEST_F(CompressionDetectorTest, ShannonEntropyBounds) {
  EXPECT_DOUBLE_EQ(CompressionDetector::shannonEntropy(""), 0.0);
  EXPECT_DOUBLE_EQ(CompressionDetector::shannonEntropy("aaaa"), 0.0);
  EXPECT_DOUBLE_EQ(CompressionDetector::shannonEntropy("abab"), 1.0);

  std::string everyByte;
  for (int i = 0; i < 256; ++i) {
    everyByte += static_cast<char>(i);
  }
  EXPECT_NEAR(CompressionDetector::shannonEntropy(everyByte), 8.0, 1e-9);
}

TEST_F(CompressionDetectorTest, SignaturesAreRecognised) {
  EXPECT_EQ(CompressionDetector::signatureOf("\x1f\x8b\x08"), "gzip");
  EXPECT_EQ(CompressionDetector::signatureOf("PK\x03\x04"), "zip");
  EXPECT_EQ(CompressionDetector::signatureOf("\x78\x9c"), "zlib");
  EXPECT_EQ(CompressionDetector::signatureOf("\x78\xda"), "zlib");
  EXPECT_FALSE(CompressionDetector::signatureOf("\x78\x00"));
  EXPECT_FALSE(CompressionDetector::signatureOf("{}"));
  EXPECT_FALSE(CompressionDetector::signatureOf("x"));
}

TEST_F(CompressionDetectorTest, DecompressPicksTheRightCodec) {
  const std::string text = R"({"message":"hello"})";

  auto gzip = CompressionDetector::decompress(gzipCompress(text), 1024);
  ASSERT_TRUE(gzip.success) << gzip.error;
  EXPECT_EQ(gzip.codec, CompressionCodec::GZIP);
  EXPECT_EQ(gzip.data, text);

  auto zlib = CompressionDetector::decompress(zlibCompress(text), 1024);
  ASSERT_TRUE(zlib.success) << zlib.error;
  EXPECT_EQ(zlib.codec, CompressionCodec::ZLIB);
  EXPECT_EQ(zlib.data, text);

  auto raw = CompressionDetector::decompress(rawDeflate(text), 1024);
  ASSERT_TRUE(raw.success) << raw.error;
  EXPECT_EQ(raw.codec, CompressionCodec::RAW_DEFLATE);
  EXPECT_EQ(raw.data, text);
  EXPECT_FALSE(raw.truncated);
}

TEST_F(CompressionDetectorTest, DecompressStopsAtTheCap) {
  auto result = CompressionDetector::decompress(
      zlibCompress(std::string(10000, 'x')), 100);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.truncated);
  EXPECT_EQ(result.data.size(), 100u);
}

TEST_F(CompressionDetectorTest, TruncatedStreamIsAnError) {
  std::string compressed = gzipCompress(varietyText(50));
  auto result = CompressionDetector::decompress(
      compressed.substr(0, compressed.size() / 2), 1 << 20);
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error.empty());
}

TEST_F(CompressionDetectorTest, GzipLineIsReplacedByItsText) {
  CompressionDetector detector(config);
  std::string line =
      CompressionDetector::encodeBase64(gzipCompress(R"({"message":"hello"})"));

  SanitizationResult result;
  EXPECT_TRUE(detector.process(line, 3, result));
  EXPECT_EQ(line, R"({"message":"hello"})");

  ASSERT_EQ(result.corruptionsDetected.size(), 1u);
  const auto &detection = result.corruptionsDetected[0];
  EXPECT_EQ(detection.type, CorruptionType::COMPRESSED_DATA);
  EXPECT_EQ(detection.severity, Severity::MEDIUM);
  EXPECT_EQ(detection.location, "line_3");
  EXPECT_DOUBLE_EQ(detection.confidence, 0.8);
  EXPECT_NE(detection.description.find("gzip signature"), std::string::npos);

  ASSERT_EQ(result.actionsTaken.size(), 1u);
  EXPECT_EQ(result.actionsTaken[0].first, SanitizationAction::DECOMPRESSED);
  EXPECT_NE(result.actionsTaken[0].second.find("gzip"), std::string::npos);
}

TEST_F(CompressionDetectorTest, SurroundingWhitespaceIsIgnored) {
  CompressionDetector detector(config);
  std::string line = "  " +
                     CompressionDetector::encodeBase64(
                         zlibCompress(R"({"message":"indented"})")) +
                     "\t";
  SanitizationResult result;
  EXPECT_TRUE(detector.process(line, 1, result));
  EXPECT_EQ(line, R"({"message":"indented"})");
}

TEST_F(CompressionDetectorTest, DecompressedTextKeepsRecordBoundaries) {
  CompressionDetector detector(config);
  std::string line = CompressionDetector::encodeBase64(zlibCompress(
      "{\"msg\":\"first\x01 part\x07 and the rest\"}\r\n{\"msg\":\"next\"}"));

  SanitizationResult result;
  ASSERT_TRUE(detector.process(line, 1, result));
  EXPECT_EQ(line, "{\"msg\":\"first part and the rest\"}\n{\"msg\":\"next\"}");
  EXPECT_EQ(line.find('\r'), std::string::npos);
}

TEST_F(CompressionDetectorTest, OversizedPayloadIsCapped) {
  config.maxLineLength = 50;
  CompressionDetector detector(config);
  std::string line =
      CompressionDetector::encodeBase64(gzipCompress(varietyText(200)));

  SanitizationResult result;
  ASSERT_TRUE(detector.process(line, 2, result));
  EXPECT_EQ(line.size(), 50u);
  EXPECT_TRUE(result.hasCorruption(CorruptionType::COMPRESSED_DATA));
  EXPECT_TRUE(result.hasCorruption(CorruptionType::OVERSIZED_ENTRY));
  EXPECT_TRUE(result.hasAction(SanitizationAction::TRUNCATED));
  EXPECT_TRUE(result.hasAction(SanitizationAction::DECOMPRESSED));
}

TEST_F(CompressionDetectorTest, OrdinaryLinesAreNotCandidates) {
  CompressionDetector detector(config);
  for (std::string line : {std::string("hello world"),
                           std::string(R"({"message":"hello"})"),
                           std::string("abcd"), std::string("")}) {
    SanitizationResult result;
    EXPECT_FALSE(detector.process(line, 1, result)) << line;
    EXPECT_TRUE(result.corruptionsDetected.empty()) << line;
  }
}

TEST_F(CompressionDetectorTest, ShortSignaturePayloadIsIgnored) {
  CompressionDetector detector(config);
  std::string line =
      CompressionDetector::encodeBase64(std::string("\x1f\x8b\x08\x00\x00", 5));
  EXPECT_FALSE(detector.detect(line));
}

TEST_F(CompressionDetectorTest, HighEntropyBlobIsFlagged) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> byte(0, 255);
  std::string noise(4096, '\0');
  for (auto &c : noise) {
    c = static_cast<char>(byte(rng));
  }
  noise[0] = '\0'; // no signature match

  CompressionDetector detector(config);
  auto signal = detector.detect(CompressionDetector::encodeBase64(noise));
  ASSERT_TRUE(signal);
  EXPECT_GT(signal->entropy, config.entropyThreshold);
  EXPECT_EQ(signal->reason.rfind("entropy", 0), 0u);
  EXPECT_EQ(signal->decoded, noise);
}

TEST_F(CompressionDetectorTest, LowEntropyBase64IsIgnored) {
  CompressionDetector detector(config);
  auto line = CompressionDetector::encodeBase64(std::string(600, 'a'));
  EXPECT_FALSE(detector.detect(line));
}

TEST_F(CompressionDetectorTest, UndecodablePayloadIsReportedButKept) {
  CompressionDetector detector(config);
  std::string bogus = "\x1f\x8b" + std::string(40, '\x55');
  std::string line = CompressionDetector::encodeBase64(bogus);
  const std::string original = line;

  SanitizationResult result;
  EXPECT_FALSE(detector.process(line, 1, result));
  EXPECT_EQ(line, original);
  EXPECT_TRUE(result.hasCorruption(CorruptionType::COMPRESSED_DATA));
  EXPECT_FALSE(result.hasAction(SanitizationAction::DECOMPRESSED));
}
