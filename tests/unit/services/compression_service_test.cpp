#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "sift_core/services/compression_service.hpp"

namespace sift_core {

class CompressionServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rng_.seed(42);
  }

  // Printable ASCII noise
  std::string generate_random_data(size_t size) {
    std::string data(size, '\0');
    std::uniform_int_distribution<int> dist(32, 126);
    std::generate(data.begin(), data.end(), [this, &dist]() { return static_cast<char>(dist(rng_)); });
    return data;
  }

  // Source-like text that repeats, as chunk text usually does
  static std::string generate_code_data(size_t size) {
    std::string pattern = "    public void Handle(Request request) {\n        logger.Info(request.Id);\n    }\n";
    std::string data;
    while (data.size() < size) {
      data += pattern;
    }
    return data.substr(0, size);
  }

  std::mt19937 rng_;
};

TEST_F(CompressionServiceTest, EmptyInputGivesEmptyBlob) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_TRUE(CompressionService::decompress({}).empty());
}

TEST_F(CompressionServiceTest, RoundTripsChunkText) {
  for (const std::string &data : {std::string("x"), generate_random_data(10000), generate_code_data(50000)}) {
    EXPECT_EQ(CompressionService::decompress(CompressionService::compress(data)), data);
  }
}

TEST_F(CompressionServiceTest, RoundTripsBinaryAndUtf8) {
  std::string data = "caf\xC3\xA9 \xF0\x9F\x8C\x8D";
  data += std::string(1000, '\0');
  data += std::string(1000, '\xff');
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(data)), data);
}

TEST_F(CompressionServiceTest, RepetitiveTextCompressesWell) {
  std::string data = generate_code_data(50000);
  std::vector<char> compressed = CompressionService::compress(data);

  double compression_ratio = static_cast<double>(compressed.size()) / data.size();
  EXPECT_LT(compression_ratio, 0.3) << "Repetitive source should compress well";
}

TEST_F(CompressionServiceTest, DefaultLevelIsThree) {
  std::string data = generate_code_data(3000);
  EXPECT_EQ(CompressionService::compress(data), CompressionService::compress(data, 3));
}

TEST_F(CompressionServiceTest, CompressionLevelsAllDecode) {
  std::string data = generate_code_data(20000);
  for (int level : {1, 3, 9, 19}) {
    EXPECT_EQ(CompressionService::decompress(CompressionService::compress(data, level)), data) << "level " << level;
  }
}

TEST_F(CompressionServiceTest, RejectsNonZstdData) {
  std::vector<char> invalid_data = {'H', 'e', 'l', 'l', 'o'};
  EXPECT_THROW((void)CompressionService::decompress(invalid_data), CompressionError);
}

TEST_F(CompressionServiceTest, RejectsCorruptedHeader) {
  std::vector<char> compressed = CompressionService::compress("Test data for corruption test");
  ASSERT_GT(compressed.size(), 4u);
  std::fill(compressed.begin(), compressed.begin() + 4, static_cast<char>(0xFF));

  EXPECT_THROW((void)CompressionService::decompress(compressed), CompressionError);
}

TEST_F(CompressionServiceTest, RejectsTruncatedFrame) {
  std::vector<char> compressed = CompressionService::compress(generate_random_data(5000));
  compressed.resize(compressed.size() / 2);

  EXPECT_THROW((void)CompressionService::decompress(compressed), CompressionError);
}

TEST_F(CompressionServiceTest, RefusesFramesAboveOutputLimit) {
  std::vector<char> compressed = CompressionService::compress(std::string(100000, 'a'));

  EXPECT_THROW((void)CompressionService::decompress(compressed, 1000), CompressionError);
  EXPECT_EQ(CompressionService::decompress(compressed, 100000).size(), 100000u);
}

}  // namespace sift_core
