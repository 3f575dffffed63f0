#include <gtest/gtest.h>
#include "security_logger.hpp"
#include <sstream>

using namespace erebus;

namespace {

// Captures std::cout for the lifetime of the object.
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::stringstream buffer_;
    std::streambuf* old_;
};

}

TEST(SecurityLoggerTest, SanitizeStripsControlCharacters) {
    EXPECT_EQ(SecurityLogger::sanitize_log_message("plain text"), "plain text");
    EXPECT_EQ(SecurityLogger::sanitize_log_message("quote\" and \\ slash"), "quote  and   slash");
    EXPECT_EQ(SecurityLogger::sanitize_log_message("line\ninjected\r"), "line injected ");
    EXPECT_EQ(SecurityLogger::sanitize_log_message(std::string("nul\0byte", 8)), "nulbyte");
}

TEST(SecurityLoggerTest, BlindsRemoteAddress) {
    CoutCapture capture;
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::AUTH_SUCCESS, "203.0.113.7",
                        "grant accepted");
    auto out = capture.str();
    EXPECT_EQ(out.find("203.0.113.7"), std::string::npos);
    EXPECT_NE(out.find("ip=anon_"), std::string::npos);
    EXPECT_NE(out.find("[AUTH_SUCCESS]"), std::string::npos);
    EXPECT_NE(out.find("msg=\"grant accepted\""), std::string::npos);
}

TEST(SecurityLoggerTest, DebugOnlyWhenVerbose) {
    SecurityLogger::set_verbose(false);
    {
        CoutCapture capture;
        SecurityLogger::debug(SecurityLogger::EventType::SHARD_FAILURE, "hidden");
        EXPECT_TRUE(capture.str().empty());
    }

    SecurityLogger::set_verbose(true);
    {
        CoutCapture capture;
        SecurityLogger::debug(SecurityLogger::EventType::SHARD_FAILURE, "shown");
        auto out = capture.str();
        EXPECT_NE(out.find("[SHARD]"), std::string::npos);
        EXPECT_NE(out.find("ip=internal"), std::string::npos);
    }
    SecurityLogger::set_verbose(false);
}

TEST(SecurityLoggerTest, BlindingIsStableWithinRotation) {
    auto a = SecurityLogger::blind_address("198.51.100.1");
    EXPECT_EQ(a, SecurityLogger::blind_address("198.51.100.1"));
    EXPECT_NE(a, SecurityLogger::blind_address("198.51.100.2"));
    EXPECT_EQ(a.size(), std::string("anon_").size() + 12);
    EXPECT_EQ(SecurityLogger::blind_address("internal"), "internal");
    EXPECT_EQ(SecurityLogger::blind_address("unknown"), "unknown");
}
