#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../src/version_resolver.hpp"

TEST(VersionResolverTest, ExplicitVersionIsTrimmedWithoutRequest) {
    FakeHttpClient client;
    EXPECT_EQ(resolve_version(std::string("  1.9.0 \n"), client, "https://example.test/cli"), "1.9.0");
    EXPECT_TRUE(client.requests.empty());
}

TEST(VersionResolverTest, LatestVersionIsFetchedAndTrimmed) {
    FakeHttpClient client;
    client.latest_body = "2.1.0\n";
    EXPECT_EQ(resolve_version(std::nullopt, client, "https://example.test/cli"), "2.1.0");
    ASSERT_EQ(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0], "GET https://example.test/cli/LATEST_VERSION");
}

TEST(VersionResolverTest, LatestUrlJoinsWithSingleSlash) {
    EXPECT_EQ(latest_version_url("https://example.test/cli/"), "https://example.test/cli/LATEST_VERSION");
    EXPECT_EQ(latest_version_url("https://example.test/cli"), "https://example.test/cli/LATEST_VERSION");
}

TEST(VersionResolverTest, EmptyLatestBodyFails) {
    FakeHttpClient client;
    client.latest_body = " \r\n";
    try {
        resolve_version(std::nullopt, client, "https://example.test/cli");
        FAIL() << "empty version accepted";
    } catch (const VciException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Transport);
    }
}

TEST(VersionResolverTest, TransportFailurePropagates) {
    FakeHttpClient client;
    client.fail_get = true;
    EXPECT_THROW(resolve_version(std::nullopt, client, "https://example.test/cli"), VciException);
}

TEST(VersionResolverTest, RejectsVersionsThatWouldEscapeThePath) {
    FakeHttpClient client;
    try {
        resolve_version(std::string("../1.0"), client, "https://example.test/cli");
        FAIL() << "path-like version accepted";
    } catch (const VciException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Configuration);
    }

    client.latest_body = "<html>not found</html>";
    EXPECT_THROW(resolve_version(std::nullopt, client, "https://example.test/cli"), VciException);
}

TEST(VersionResolverTest, VersionSyntax) {
    EXPECT_TRUE(is_valid_version("2.0.0"));
    EXPECT_TRUE(is_valid_version("2.0.0-rc.1+build5"));
    EXPECT_FALSE(is_valid_version(""));
    EXPECT_FALSE(is_valid_version(".2"));
    EXPECT_FALSE(is_valid_version("2.0 beta"));
    EXPECT_FALSE(is_valid_version("2/0"));
}
