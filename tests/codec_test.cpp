#include "codec.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace lanchat;

TEST(Codec,EncodeDecodeKeepsFields) {
	std::string wire;
	ASSERT_EQ(encodeMessage("alice","hello there",wire),CodecError::None);
	ChatMessage msg;
	ASSERT_EQ(decodeMessage(wire,msg),CodecError::None);
	EXPECT_EQ(msg.nickname,"alice");
	EXPECT_EQ(msg.text,"hello there");
}

TEST(Codec,WireFormatIsJsonObject) {
	std::string wire;
	ASSERT_EQ(encodeMessage("a","hi",wire),CodecError::None);
	EXPECT_EQ(wire,R"({"msg":"hi","nick":"a"})");
}

TEST(Codec,EncodeTrimsFields) {
	std::string wire;
	ASSERT_EQ(encodeMessage("  bob\t","  spaced out \n",wire),CodecError::None);
	ChatMessage msg;
	ASSERT_EQ(decodeMessage(wire,msg),CodecError::None);
	EXPECT_EQ(msg.nickname,"bob");
	EXPECT_EQ(msg.text,"spaced out");
}

TEST(Codec,EncodeKeepsUnicode) {
	std::string wire;
	ASSERT_EQ(encodeMessage("z\xC3\xBC","\xE4\xBD\xA0\xE5\xA5\xBD \xF0\x9F\x91\x8B",wire),CodecError::None);
	ChatMessage msg;
	ASSERT_EQ(decodeMessage(wire,msg),CodecError::None);
	EXPECT_EQ(msg.nickname,"z\xC3\xBC");
	EXPECT_EQ(msg.text,"\xE4\xBD\xA0\xE5\xA5\xBD \xF0\x9F\x91\x8B");
}

TEST(Codec,PayloadLimitIsInclusive) {
	// {"msg":"<text>","nick":"a"} carries 21 bytes of framing
	std::string wire;
	ASSERT_EQ(encodeMessage("a",std::string(979,'x'),wire),CodecError::None);
	EXPECT_EQ(wire.size(),kMaxPayloadBytes);

	std::string untouched="previous";
	EXPECT_EQ(encodeMessage("a",std::string(980,'x'),untouched),CodecError::TooLarge);
	EXPECT_EQ(untouched,"previous");
}

TEST(Codec,EncodeRejectsEmptyFields) {
	std::string wire;
	EXPECT_EQ(encodeMessage("","hi",wire),CodecError::Malformed);
	EXPECT_EQ(encodeMessage("a","   ",wire),CodecError::Malformed);
	EXPECT_TRUE(wire.empty());
}

TEST(Codec,EncodeRejectsInvalidUtf8) {
	std::string wire;
	EXPECT_EQ(encodeMessage("a","bad \xC3",wire),CodecError::Malformed);
	EXPECT_EQ(encodeMessage("\xFF","ok",wire),CodecError::Malformed);
}

TEST(Codec,DecodeRejectsGarbage) {
	ChatMessage msg;
	EXPECT_EQ(decodeMessage(std::string(),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string("not json"),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string("{\"msg\":\"hi\""),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string("[1,2,3]"),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string("\"just a string\""),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string("{\"msg\":\"\xC3\x28\",\"nick\":\"a\"}"),msg),CodecError::Malformed);
}

TEST(Codec,DecodeRejectsMissingOrWrongFields) {
	ChatMessage msg;
	EXPECT_EQ(decodeMessage(std::string(R"({"msg":"hi"})"),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string(R"({"nick":"a"})"),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string(R"({"msg":5,"nick":"a"})"),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string(R"({"msg":"hi","nick":null})"),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string(R"({"msg":"  ","nick":"a"})"),msg),CodecError::Malformed);
	EXPECT_EQ(decodeMessage(std::string(R"({"msg":"hi","nick":""})"),msg),CodecError::Malformed);
}

TEST(Codec,DecodeLeavesOutputOnFailure) {
	ChatMessage msg{"keep","me"};
	EXPECT_EQ(decodeMessage(std::string("{}"),msg),CodecError::Malformed);
	EXPECT_EQ(msg.nickname,"keep");
	EXPECT_EQ(msg.text,"me");
}

TEST(Codec,DecodeRejectsOversizedPayload) {
	nlohmann::json obj={{"nick","a"},{"msg",std::string(990,'x')}};
	std::string wire=obj.dump();
	ASSERT_GT(wire.size(),kMaxPayloadBytes);
	ChatMessage msg;
	EXPECT_EQ(decodeMessage(wire,msg),CodecError::Malformed);
}

TEST(Codec,DecodeIgnoresExtraKeysAndTrims) {
	ChatMessage msg;
	ASSERT_EQ(decodeMessage(std::string(R"({"nick":" a ","msg":" hi ","extra":1})"),msg),CodecError::None);
	EXPECT_EQ(msg,(ChatMessage{"a","hi"}));
}
