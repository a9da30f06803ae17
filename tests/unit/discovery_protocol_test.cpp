/**
 * @file discovery_protocol_test.cpp
 * @brief Unit tests for the PORT:<n> discovery line parser
 */

#include "sidecar/discovery_protocol.hpp"

#include <gtest/gtest.h>

using namespace tether::sidecar;

TEST(DiscoveryProtocolTest, ParsesValidAnnouncement) {
    auto port = parse_discovery_line("PORT:54321");
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 54321);
}

TEST(DiscoveryProtocolTest, AcceptsPortBounds) {
    EXPECT_EQ(parse_discovery_line("PORT:0"), std::optional<uint16_t>(0));
    EXPECT_EQ(parse_discovery_line("PORT:65535"), std::optional<uint16_t>(65535));
}

TEST(DiscoveryProtocolTest, AcceptsLeadingZeros) { EXPECT_EQ(parse_discovery_line("PORT:08080"), std::optional<uint16_t>(8080)); }

TEST(DiscoveryProtocolTest, StripsTrailingCarriageReturn) {
    EXPECT_EQ(parse_discovery_line("PORT:8000\r"), std::optional<uint16_t>(8000));
}

TEST(DiscoveryProtocolTest, RejectsOutOfRange) {
    EXPECT_FALSE(parse_discovery_line("PORT:65536").has_value());
    EXPECT_FALSE(parse_discovery_line("PORT:99999999999999999999").has_value());
}

TEST(DiscoveryProtocolTest, RejectsEmptyValue) {
    EXPECT_FALSE(parse_discovery_line("PORT:").has_value());
    EXPECT_FALSE(parse_discovery_line("PORT:\r").has_value());
}

TEST(DiscoveryProtocolTest, RejectsNonDigits) {
    EXPECT_FALSE(parse_discovery_line("PORT:abc").has_value());
    EXPECT_FALSE(parse_discovery_line("PORT:-1").has_value());
    EXPECT_FALSE(parse_discovery_line("PORT:+80").has_value());
    EXPECT_FALSE(parse_discovery_line("PORT:80 ").has_value());
    EXPECT_FALSE(parse_discovery_line("PORT: 80").has_value());
    EXPECT_FALSE(parse_discovery_line("PORT:80x").has_value());
}

TEST(DiscoveryProtocolTest, PrefixIsExactAndCaseSensitive) {
    EXPECT_FALSE(parse_discovery_line("port:8000").has_value());
    EXPECT_FALSE(parse_discovery_line(" PORT:8000").has_value());
    EXPECT_FALSE(parse_discovery_line("Listening on PORT:8000").has_value());
    EXPECT_FALSE(parse_discovery_line("PORT=8000").has_value());
}

TEST(DiscoveryProtocolTest, IgnoresOrdinaryOutput) {
    EXPECT_FALSE(parse_discovery_line("").has_value());
    EXPECT_FALSE(parse_discovery_line("INFO: Uvicorn running on http://127.0.0.1:8000").has_value());
}
