#include <string>

#include <gtest/gtest.h>

#include "icc/errors.hpp"
#include "icc/resp.hpp"

TEST(RespCodecTest, EncodesCommandAsBulkArray) {
  auto encoded = icc::EncodeCommand({"XADD", "icc", "*", "content", "hi"});
  EXPECT_EQ(encoded, "*5\r\n$4\r\nXADD\r\n$3\r\nicc\r\n$1\r\n*\r\n$7\r\ncontent\r\n$2\r\nhi\r\n");
}

TEST(RespCodecTest, ParsesScalarReplies) {
  std::size_t consumed = 0;
  auto ok = icc::RespParser::Parse("+PONG\r\n", consumed);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->type, icc::RespReply::Type::kSimpleString);
  EXPECT_EQ(ok->str, "PONG");
  EXPECT_EQ(consumed, 7u);

  auto number = icc::RespParser::Parse(":42\r\n", consumed);
  ASSERT_TRUE(number.has_value());
  EXPECT_EQ(number->type, icc::RespReply::Type::kInteger);
  EXPECT_EQ(number->integer, 42);

  auto error = icc::RespParser::Parse("-ERR wrong type\r\n", consumed);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->type, icc::RespReply::Type::kError);
  EXPECT_EQ(error->str, "ERR wrong type");
}

TEST(RespCodecTest, ParsesBulkAndNil) {
  std::size_t consumed = 0;
  auto bulk = icc::RespParser::Parse("$5\r\na\r\nbc\r\n", consumed);
  ASSERT_TRUE(bulk.has_value());
  EXPECT_EQ(bulk->type, icc::RespReply::Type::kBulkString);
  EXPECT_EQ(bulk->str, "a\r\nbc");
  EXPECT_EQ(consumed, 11u);

  auto nil = icc::RespParser::Parse("$-1\r\n", consumed);
  ASSERT_TRUE(nil.has_value());
  EXPECT_TRUE(nil->IsNil());

  auto nil_array = icc::RespParser::Parse("*-1\r\n", consumed);
  ASSERT_TRUE(nil_array.has_value());
  EXPECT_TRUE(nil_array->IsNil());
}

TEST(RespCodecTest, ParsesNestedStreamReply) {
  std::string data =
      "*1\r\n*2\r\n$3\r\nicc\r\n*1\r\n*2\r\n$3\r\n1-0\r\n*2\r\n$7\r\ncontent\r\n$5\r\nhello\r\n";
  std::size_t consumed = 0;
  auto reply = icc::RespParser::Parse(data, consumed);
  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ(consumed, data.size());
  ASSERT_EQ(reply->elements.size(), 1u);
  const auto& stream = reply->elements[0];
  EXPECT_EQ(stream.elements[0].str, "icc");
  const auto& entry = stream.elements[1].elements[0];
  EXPECT_EQ(entry.elements[0].str, "1-0");
  EXPECT_EQ(entry.elements[1].elements[1].str, "hello");
}

TEST(RespCodecTest, IncompleteInputWaitsForMoreBytes) {
  std::size_t consumed = 0;
  EXPECT_FALSE(icc::RespParser::Parse("", consumed).has_value());
  EXPECT_FALSE(icc::RespParser::Parse("+PON", consumed).has_value());
  EXPECT_FALSE(icc::RespParser::Parse("$5\r\nhel", consumed).has_value());
  EXPECT_FALSE(icc::RespParser::Parse("*2\r\n:1\r\n", consumed).has_value());
}

TEST(RespCodecTest, LeavesTrailingBytesUnconsumed) {
  std::size_t consumed = 0;
  auto reply = icc::RespParser::Parse(":1\r\n:2\r\n", consumed);
  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ(reply->integer, 1);
  EXPECT_EQ(consumed, 4u);
}

TEST(RespCodecTest, MalformedInputThrows) {
  std::size_t consumed = 0;
  EXPECT_THROW(icc::RespParser::Parse("?what\r\n", consumed), icc::StoreError);
  EXPECT_THROW(icc::RespParser::Parse(":abc\r\n", consumed), icc::StoreError);
  EXPECT_THROW(icc::RespParser::Parse("$2\r\nabcd\r\n", consumed), icc::StoreError);
}
