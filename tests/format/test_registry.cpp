#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "conform/error/exception.hpp"
#include "conform/format/registry.hpp"

namespace {

using conform::format::FormatRegistry;
using ::testing::ElementsAre;

class FormatRegistryTest : public ::testing::Test {
protected:
    const FormatRegistry& registry = FormatRegistry::instance();
};

TEST_F(FormatRegistryTest, KnownNames) {
    EXPECT_THAT(registry.names(),
                ElementsAre("date", "date-time", "email", "hostname", "ipv4",
                            "ipv6", "time", "uri", "uuid"));
    EXPECT_TRUE(registry.contains("email"));
    EXPECT_FALSE(registry.contains("credit-card"));
    EXPECT_EQ(registry.find("credit-card"), nullptr);
    EXPECT_NE(registry.find("uri"), nullptr);
}

TEST_F(FormatRegistryTest, SingleSharedInstance) {
    std::vector<const FormatRegistry*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back(
            [&seen, i] { seen[i] = &FormatRegistry::instance(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto* instance : seen) {
        EXPECT_EQ(instance, &registry);
    }
}

TEST_F(FormatRegistryTest, DateTime) {
    EXPECT_TRUE(registry.matches("date-time", "2024-01-15T10:30:00Z"));
    EXPECT_TRUE(registry.matches("date-time", "2024-01-15T10:30:00.250+02:00"));
    EXPECT_FALSE(registry.matches("date-time", "2024-01-15"));
    EXPECT_TRUE(registry.matches("date", "2024-01-15"));
    EXPECT_FALSE(registry.matches("date", "15/01/2024"));
    EXPECT_TRUE(registry.matches("time", "23:59:59"));
    EXPECT_FALSE(registry.matches("time", "noon"));
}

TEST_F(FormatRegistryTest, Email) {
    EXPECT_TRUE(registry.matches("email", "a@b.co"));
    EXPECT_TRUE(registry.matches("email", "first.last+tag@example.org"));
    EXPECT_FALSE(registry.matches("email", "not-an-email"));
    EXPECT_FALSE(registry.matches("email", "prefix a@b.co"));
}

TEST_F(FormatRegistryTest, Hostname) {
    EXPECT_TRUE(registry.matches("hostname", "example.com"));
    EXPECT_TRUE(registry.matches("hostname", "localhost"));
    EXPECT_FALSE(registry.matches("hostname", "-bad.com"));
    EXPECT_FALSE(registry.matches("hostname", "under_score.com"));
}

TEST_F(FormatRegistryTest, IpAddresses) {
    EXPECT_TRUE(registry.matches("ipv4", "192.168.0.1"));
    EXPECT_FALSE(registry.matches("ipv4", "256.1.1.1"));
    EXPECT_FALSE(registry.matches("ipv4", "1.2.3"));

    EXPECT_TRUE(registry.matches("ipv6", "::1"));
    EXPECT_TRUE(registry.matches("ipv6", "2001:db8::8a2e:370:7334"));
    EXPECT_TRUE(
        registry.matches("ipv6", "2001:0db8:0000:0000:0000:ff00:0042:8329"));
    EXPECT_FALSE(registry.matches("ipv6", "12345::"));
    EXPECT_FALSE(registry.matches("ipv6", "192.168.0.1"));
}

TEST_F(FormatRegistryTest, UriAndUuid) {
    EXPECT_TRUE(registry.matches("uri", "https://example.com/path?q=1"));
    EXPECT_TRUE(registry.matches("uri", "urn:isbn:0451450523"));
    EXPECT_FALSE(registry.matches("uri", "not a uri"));

    EXPECT_TRUE(
        registry.matches("uuid", "123e4567-e89b-12d3-a456-426614174000"));
    EXPECT_FALSE(registry.matches("uuid", "123e4567e89b12d3a456426614174000"));
}

TEST_F(FormatRegistryTest, LengthCapsBoundEveryFormat) {
    const std::string huge(100000, '1');
    for (const auto& name : registry.names()) {
        const auto* format = registry.find(name);
        ASSERT_NE(format, nullptr);
        EXPECT_LT(format->max_length, huge.size()) << name;
        EXPECT_FALSE(registry.matches(name, huge)) << name;
    }
    EXPECT_EQ(registry.find("email")->max_length, 254u);
    EXPECT_EQ(registry.find("ipv6")->max_length, 45u);
    EXPECT_EQ(registry.find("uuid")->max_length, 36u);
}

TEST_F(FormatRegistryTest, TextAtTheCapStillMatches) {
    const std::string label(63, 'a');
    const std::string host = label + "." + label + "." + label + "." +
                             std::string(61, 'b');
    ASSERT_EQ(host.size(), 253u);
    EXPECT_TRUE(registry.matches("hostname", host));
    EXPECT_FALSE(registry.matches("hostname", host + "b"));
    EXPECT_TRUE(registry.matches(
        "ipv6", "ffff:ffff:ffff:ffff:ffff:ffff:255.255.255.255"));
}

TEST_F(FormatRegistryTest, UnknownFormatThrows) {
    EXPECT_THROW(static_cast<void>(registry.matches("credit-card", "4111")),
                 conform::error::InvalidArgument);
}

}  // namespace
