#include <gtest/gtest.h>
#include "redis/resp_codec.hpp"
#include "test_utils.hpp"

using namespace cfgdb::redis;

class RespCodecTest : public ::testing::Test {
protected:
  RespParser parser;

  void SetUp() override {
    init_logging();
  }

  Reply parse_one(const std::string& wire) {
    parser.feed(wire);
    Reply reply;
    EXPECT_TRUE(parser.next(reply)) << "Incomplete reply for: " << wire;
    return reply;
  }
};

TEST_F(RespCodecTest, EncodesCommandAsBulkArray) {
  EXPECT_EQ(RespCodec::encode(Command{"HGET", "PORT|Ethernet0", "mtu"}),
            "*3\r\n$4\r\nHGET\r\n$14\r\nPORT|Ethernet0\r\n$3\r\nmtu\r\n");
}

TEST_F(RespCodecTest, EncodesEmptyArgument) {
  EXPECT_EQ(RespCodec::encode(Command{"SET", "k", ""}), "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$0\r\n\r\n");
}

TEST_F(RespCodecTest, EncodesPipelineBackToBack) {
  std::vector<Command> commands{{"PING"}, {"GET", "a"}};
  EXPECT_EQ(RespCodec::encode(commands), RespCodec::encode(commands[0]) + RespCodec::encode(commands[1]));
}

TEST_F(RespCodecTest, ParsesScalarReplies) {
  EXPECT_EQ(parse_one("+OK\r\n"), Reply::status("OK"));
  EXPECT_EQ(parse_one("-ERR wrong\r\n"), Reply::error("ERR wrong"));
  EXPECT_EQ(parse_one(":42\r\n"), Reply::number(42));
  EXPECT_EQ(parse_one(":-7\r\n"), Reply::number(-7));
  EXPECT_EQ(parse_one("$5\r\nhello\r\n"), Reply::bulk("hello"));
  EXPECT_EQ(parse_one("$0\r\n\r\n"), Reply::bulk(""));
}

TEST_F(RespCodecTest, ParsesNullBulkAndNullArray) {
  EXPECT_TRUE(parse_one("$-1\r\n").is_nil());
  EXPECT_TRUE(parse_one("*-1\r\n").is_nil());
}

TEST_F(RespCodecTest, ParsesNestedArray) {
  Reply reply = parse_one("*2\r\n$1\r\n0\r\n*2\r\n$6\r\nPORT|1\r\n$6\r\nPORT|2\r\n");
  ASSERT_TRUE(reply.is_array());
  ASSERT_EQ(reply.elements.size(), 2u);
  EXPECT_EQ(reply.elements[0], Reply::bulk("0"));
  EXPECT_EQ(reply.elements[1], Reply::array({Reply::bulk("PORT|1"), Reply::bulk("PORT|2")}));
}

TEST_F(RespCodecTest, BulkMayContainCrlf) {
  EXPECT_EQ(parse_one("$4\r\na\r\nb\r\n"), Reply::bulk("a\r\nb"));
}

TEST_F(RespCodecTest, WaitsForMoreBytes) {
  Reply reply;
  parser.feed("$5\r\nhel");
  EXPECT_FALSE(parser.next(reply));
  parser.feed("lo\r");
  EXPECT_FALSE(parser.next(reply));
  parser.feed("\n");
  ASSERT_TRUE(parser.next(reply));
  EXPECT_EQ(reply, Reply::bulk("hello"));
  EXPECT_EQ(parser.buffered(), 0u);
}

TEST_F(RespCodecTest, IncompleteArrayIsNotConsumed) {
  Reply reply;
  parser.feed("*2\r\n:1\r\n");
  EXPECT_FALSE(parser.next(reply));
  EXPECT_EQ(parser.buffered(), 8u);
  parser.feed(":2\r\n");
  ASSERT_TRUE(parser.next(reply));
  EXPECT_EQ(reply, Reply::array({Reply::number(1), Reply::number(2)}));
}

TEST_F(RespCodecTest, ExtractsSeveralRepliesInOrder) {
  parser.feed("+OK\r\n:1\r\n$-1\r\n");
  Reply first, second, third, fourth;
  ASSERT_TRUE(parser.next(first));
  ASSERT_TRUE(parser.next(second));
  ASSERT_TRUE(parser.next(third));
  EXPECT_FALSE(parser.next(fourth));
  EXPECT_EQ(first, Reply::status("OK"));
  EXPECT_EQ(second, Reply::number(1));
  EXPECT_TRUE(third.is_nil());
}

TEST_F(RespCodecTest, RejectsUnknownTypeByte) {
  Reply reply;
  parser.feed("?what\r\n");
  EXPECT_THROW(parser.next(reply), ProtocolError);
}

TEST_F(RespCodecTest, RejectsBadLengths) {
  Reply reply;
  parser.feed("$-5\r\n");
  EXPECT_THROW(parser.next(reply), ProtocolError);

  parser.reset();
  parser.feed("*abc\r\n");
  EXPECT_THROW(parser.next(reply), ProtocolError);

  parser.reset();
  parser.feed("$3\r\nabcXY");
  EXPECT_THROW(parser.next(reply), ProtocolError);
}

TEST_F(RespCodecTest, ProtocolErrorIsConnectionError) {
  Reply reply;
  parser.feed("!\r\n");
  EXPECT_THROW(parser.next(reply), cfgdb::db::ConnectionError);
}

TEST_F(RespCodecTest, EncodedReplyParsesBack) {
  Reply original = Reply::array({
    Reply::status("OK"), Reply::error("ERR x"), Reply::number(3),
    Reply::bulk("v"), Reply::nil(), Reply::array({})
  });
  EXPECT_EQ(parse_one(RespCodec::encode_reply(original)), original);
}
