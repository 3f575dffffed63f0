#include <gtest/gtest.h>
#include "input_validator.hpp"
#include <vector>
#include <string>

using namespace erebus;

TEST(InputValidatorTest, KeySegment) {
    EXPECT_TRUE(InputValidator::is_valid_key_segment("room-1"));
    EXPECT_TRUE(InputValidator::is_valid_key_segment("user.42_x"));
    EXPECT_FALSE(InputValidator::is_valid_key_segment(""));
    EXPECT_FALSE(InputValidator::is_valid_key_segment("a:b"));
    EXPECT_FALSE(InputValidator::is_valid_key_segment("line\nbreak"));
    EXPECT_TRUE(InputValidator::is_valid_key_segment("abcd", 4));
    EXPECT_FALSE(InputValidator::is_valid_key_segment("abcde", 4));
}

TEST(InputValidatorTest, KeySegmentAcceptsUtf8) {
    EXPECT_TRUE(InputValidator::is_valid_key_segment("caf\xc3\xa9"));
    EXPECT_TRUE(InputValidator::is_valid_key_segment("\xe8\x81\x8a\xe5\xa4\xa9"));
    EXPECT_TRUE(InputValidator::is_valid_key_segment("with space"));
    EXPECT_FALSE(InputValidator::is_valid_key_segment("caf\xc3\xa9:x"));
    EXPECT_FALSE(InputValidator::is_valid_key_segment(std::string("nul\0byte", 8)));
    EXPECT_FALSE(InputValidator::is_valid_key_segment("tab\there"));
    EXPECT_FALSE(InputValidator::is_valid_key_segment("del\x7f"));
}

TEST(InputValidatorTest, WithinSizeLimit) {
    EXPECT_TRUE(InputValidator::is_within_size_limit(100, 200));
    EXPECT_TRUE(InputValidator::is_within_size_limit(200, 200));
    EXPECT_FALSE(InputValidator::is_within_size_limit(201, 200));
}

TEST(InputValidatorTest, Base64Url) {
    EXPECT_EQ(InputValidator::base64url_encode("hello"), "aGVsbG8");
    EXPECT_EQ(InputValidator::base64url_encode(std::string("\xfb\xff", 2)), "-_8");

    auto decoded = InputValidator::base64url_decode("aGVsbG8");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "hello");

    auto binary = InputValidator::base64url_decode("-_8");
    ASSERT_TRUE(binary.has_value());
    ASSERT_EQ(binary->size(), 2u);
    EXPECT_EQ((*binary)[0], 0xfb);

    EXPECT_FALSE(InputValidator::base64url_decode("aGVs+G8").has_value());
    EXPECT_FALSE(InputValidator::base64url_decode("aGVsbG8=").has_value());
    EXPECT_FALSE(InputValidator::base64url_decode("a").has_value());
}

TEST(InputValidatorTest, Ed25519RejectsWrongSizes) {
    std::vector<unsigned char> key(31, 0), msg{'m'}, sig(64, 0);
    EXPECT_FALSE(InputValidator::verify_ed25519(key, msg, sig));
    key.resize(32);
    sig.resize(63);
    EXPECT_FALSE(InputValidator::verify_ed25519(key, msg, sig));
}

TEST(InputValidatorTest, SafeParseJson) {
    auto val = InputValidator::safe_parse_json(R"({"packetType":"ping","n":123})");
    ASSERT_TRUE(val.is_object());
    EXPECT_EQ(val.as_object()["packetType"].as_string(), "ping");
    EXPECT_EQ(val.as_object()["n"].as_int64(), 123);
}

TEST(InputValidatorTest, SafeParseJsonDepthLimit) {
    std::string nested = "[[[[1]]]]";
    EXPECT_NO_THROW(InputValidator::safe_parse_json(nested, 4));
    EXPECT_THROW(InputValidator::safe_parse_json(nested, 3), boost::system::system_error);
}

TEST(InputValidatorTest, SafeParseJsonInvalid) {
    EXPECT_THROW(InputValidator::safe_parse_json("{invalid}"), boost::system::system_error);
}
