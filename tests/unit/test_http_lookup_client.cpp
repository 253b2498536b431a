/**
 * @file test_http_lookup_client.cpp
 * @brief Unit tests for HttpLookupClient endpoint parsing and request targets
 */

#include <gtest/gtest.h>
#include <nsqsub/lookup/http_lookup_client.hpp>

using namespace nsqsub::lookup;

// =============================================================================
// Endpoint parsing
// =============================================================================

TEST(HttpLookupEndpointTest, SchemeHostAndPort) {
    auto endpoint = HttpLookupClient::parseEndpoint("http://10.0.0.2:4161");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "10.0.0.2");
    EXPECT_EQ(endpoint->port, "4161");
    EXPECT_EQ(endpoint->basePath, "");
}

TEST(HttpLookupEndpointTest, BareHostPort) {
    auto endpoint = HttpLookupClient::parseEndpoint("lookupd:4161");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "lookupd");
    EXPECT_EQ(endpoint->port, "4161");
}

TEST(HttpLookupEndpointTest, DefaultPortAndBasePath) {
    auto endpoint = HttpLookupClient::parseEndpoint("http://lookupd/nsq/");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "lookupd");
    EXPECT_EQ(endpoint->port, "80");
    EXPECT_EQ(endpoint->basePath, "/nsq");
}

TEST(HttpLookupEndpointTest, BracketedIpv6) {
    auto endpoint = HttpLookupClient::parseEndpoint("http://[::1]:4161");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "::1");
    EXPECT_EQ(endpoint->port, "4161");
}

TEST(HttpLookupEndpointTest, RejectsUnusableEndpoints) {
    EXPECT_FALSE(HttpLookupClient::parseEndpoint("").has_value());
    EXPECT_FALSE(HttpLookupClient::parseEndpoint("http://").has_value());
    EXPECT_FALSE(HttpLookupClient::parseEndpoint("https://lookupd:4161").has_value());
    EXPECT_FALSE(HttpLookupClient::parseEndpoint("lookupd:").has_value());
    EXPECT_FALSE(HttpLookupClient::parseEndpoint("lookupd:41x1").has_value());
    EXPECT_FALSE(HttpLookupClient::parseEndpoint("http://[::1:4161").has_value());
}

// =============================================================================
// Request target
// =============================================================================

TEST(HttpLookupTargetTest, AppendsLookupPath) {
    HttpEndpoint endpoint;
    endpoint.host = "lookupd";
    EXPECT_EQ(HttpLookupClient::lookupTarget(endpoint, "orders"), "/lookup?topic=orders");

    endpoint.basePath = "/nsq";
    EXPECT_EQ(HttpLookupClient::lookupTarget(endpoint, "orders"), "/nsq/lookup?topic=orders");
}

TEST(HttpLookupTargetTest, EscapesTopic) {
    HttpEndpoint endpoint;
    endpoint.host = "lookupd";
    EXPECT_EQ(HttpLookupClient::lookupTarget(endpoint, "orders#ephemeral"),
              "/lookup?topic=orders%23ephemeral");
    EXPECT_EQ(HttpLookupClient::lookupTarget(endpoint, "a b&c"),
              "/lookup?topic=a%20b%26c");
}
