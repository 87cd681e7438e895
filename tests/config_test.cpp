// SPDX-License-Identifier: MIT

// tests/config_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "src/config.hpp"

namespace page_stream {
namespace {

class StreamConfigTest : public ::testing::Test {
protected:
    std::expected<StreamConfig, Error> Load() {
        return StreamConfig::FromEnv([this](const char* name) -> const char* {
            auto it = env_.find(name);
            return it == env_.end() ? nullptr : it->second.c_str();
        });
    }

    std::map<std::string, std::string> env_;
};

TEST_F(StreamConfigTest, DefaultsWhenUnset) {
    auto config = Load();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->fetcher.host, "api.punkapi.com");
    EXPECT_EQ(config->fetcher.port, 443);
    EXPECT_TRUE(config->fetcher.use_tls);
    EXPECT_EQ(config->fetcher.path, "/v2/beers");
    EXPECT_EQ(config->fetcher.page_param, "page");
    EXPECT_FALSE(config->fetcher.per_page.has_value());
    EXPECT_EQ(config->fetcher.timeout, std::chrono::milliseconds(10000));
    EXPECT_DOUBLE_EQ(config->min_abv, 15.0);
    EXPECT_EQ(config->sequencer.first_page, 1u);
    EXPECT_EQ(config->sequencer.max_pages, 0u);
}

TEST_F(StreamConfigTest, Overrides) {
    env_ = {
        {"PAGE_STREAM_HOST", "localhost"},
        {"PAGE_STREAM_PORT", "8080"},
        {"PAGE_STREAM_TLS", "0"},
        {"PAGE_STREAM_PATH", "/beers"},
        {"PAGE_STREAM_PAGE_PARAM", "p"},
        {"PAGE_STREAM_PER_PAGE", "80"},
        {"PAGE_STREAM_TIMEOUT_MS", "250"},
        {"PAGE_STREAM_MIN_ABV", "12.5"},
        {"PAGE_STREAM_MAX_PAGES", "40"},
    };
    auto config = Load();
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->fetcher.host, "localhost");
    EXPECT_EQ(config->fetcher.port, 8080);
    EXPECT_FALSE(config->fetcher.use_tls);
    EXPECT_EQ(config->fetcher.path, "/beers");
    EXPECT_EQ(config->fetcher.page_param, "p");
    EXPECT_EQ(config->fetcher.per_page.value_or(0), 80u);
    EXPECT_EQ(config->fetcher.timeout, std::chrono::milliseconds(250));
    EXPECT_DOUBLE_EQ(config->min_abv, 12.5);
    EXPECT_EQ(config->sequencer.max_pages, 40u);
}

TEST_F(StreamConfigTest, PlainHttpDefaultsToPort80) {
    env_ = {{"PAGE_STREAM_TLS", "false"}};
    auto config = Load();
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->fetcher.use_tls);
    EXPECT_EQ(config->fetcher.port, 80);
}

TEST_F(StreamConfigTest, EmptyValueKeepsDefault) {
    env_ = {{"PAGE_STREAM_HOST", ""}, {"PAGE_STREAM_PORT", ""}};
    auto config = Load();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->fetcher.host, "api.punkapi.com");
    EXPECT_EQ(config->fetcher.port, 443);
}

TEST_F(StreamConfigTest, PathMayCarryQuery) {
    env_ = {{"PAGE_STREAM_PATH", "/v2/beers?brewed_after=01-2010"}};
    auto config = Load();
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->fetcher.path, "/v2/beers?brewed_after=01-2010");
}

TEST_F(StreamConfigTest, RejectsMalformedPath) {
    for (const char* path : {"v2/beers", "/v2/beers#top", "/v2/my beers"}) {
        env_ = {{"PAGE_STREAM_PATH", path}};
        auto config = Load();
        ASSERT_FALSE(config.has_value()) << path;
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
        EXPECT_NE(config.error().message.find("PAGE_STREAM_PATH"), std::string::npos);
    }
}

TEST_F(StreamConfigTest, RejectsBadPort) {
    for (const char* port : {"0", "65536", "80x", "-1", "http"}) {
        env_ = {{"PAGE_STREAM_PORT", port}};
        auto config = Load();
        ASSERT_FALSE(config.has_value()) << port;
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
        EXPECT_NE(config.error().message.find("PAGE_STREAM_PORT"), std::string::npos);
    }
}

TEST_F(StreamConfigTest, RejectsBadBool) {
    env_ = {{"PAGE_STREAM_TLS", "maybe"}};
    auto config = Load();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(config.error().message, "PAGE_STREAM_TLS='maybe': expected a boolean");
}

TEST_F(StreamConfigTest, RejectsOutOfRangeNumbers) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"PAGE_STREAM_PER_PAGE", "0"},
        {"PAGE_STREAM_TIMEOUT_MS", "0"},
        {"PAGE_STREAM_MIN_ABV", "101"},
        {"PAGE_STREAM_MIN_ABV", "strong"},
        {"PAGE_STREAM_MAX_PAGES", "-3"},
    };
    for (const auto& [name, value] : cases) {
        env_ = {{name, value}};
        auto config = Load();
        ASSERT_FALSE(config.has_value()) << name << "=" << value;
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    }
}

}  // namespace
}  // namespace page_stream
