#include "corvid/chunked-decoder.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>

using namespace corvid;
using http::ChunkedDecoder;

TEST(ChunkedDecoder, DecodesAndReportsConsumedBytes) {
  ChunkedDecoder decoder;
  std::string out;
  std::size_t consumed = 0;
  const std::string_view in = "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\nNEXT";
  EXPECT_EQ(decoder.decode(in, out, consumed), ChunkedDecoder::Status::Done);
  EXPECT_EQ(out, "Wikipedia");
  EXPECT_EQ(in.substr(consumed), "NEXT");
}

TEST(ChunkedDecoder, PartialInputIsPresentedAgain) {
  ChunkedDecoder decoder;
  std::string out;
  std::string pending;
  std::size_t consumed = 0;
  ChunkedDecoder::Status status = ChunkedDecoder::Status::NeedMoreData;
  for (char ch : std::string_view("A\r\n0123456789\r\n0\r\nTrailer: x\r\n\r\n")) {
    pending.push_back(ch);
    status = decoder.decode(pending, out, consumed);
    pending.erase(0, consumed);
    if (status != ChunkedDecoder::Status::NeedMoreData) {
      break;
    }
  }
  EXPECT_EQ(status, ChunkedDecoder::Status::Done);
  EXPECT_EQ(out, "0123456789");
  EXPECT_TRUE(pending.empty());
}

TEST(ChunkedDecoder, Errors) {
  std::string out;
  std::size_t consumed = 0;
  {
    ChunkedDecoder decoder;
    EXPECT_EQ(decoder.decode("xyz\r\n", out, consumed), ChunkedDecoder::Status::Error);
  }
  {
    ChunkedDecoder decoder;
    EXPECT_EQ(decoder.decode("2\r\nabX", out, consumed), ChunkedDecoder::Status::Error);
  }
  {
    ChunkedDecoder decoder;
    EXPECT_EQ(decoder.decode(std::string(2048, '1'), out, consumed), ChunkedDecoder::Status::Error);
  }
}
