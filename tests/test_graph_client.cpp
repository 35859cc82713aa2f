/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/graph_client.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace devcat;
using devcat::test::FakeTransport;
using devcat::test::reply;
using devcat::test::transportError;

namespace {

const std::string kBase = "https://graph.example.test/beta";

struct GraphHarness {
    FakeTransport http;
    Session session{std::string("tok-123")};
    GraphClient client{http, session, kBase + "/"};
};

}

TEST(GraphClientTest, OdataLiteralDoublesQuotes) {
    EXPECT_EQ(GraphClient::odataLiteral("Finance"), "'Finance'");
    EXPECT_EQ(GraphClient::odataLiteral("O'Brien's"), "'O''Brien''s'");
}

TEST(GraphClientTest, FindCategoriesBuildsFilteredQuery) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) {
        return reply(200, R"({"value":[{"id":"c1","displayName":"Finance"},{"id":"c9","displayName":"Finance"}]})");
    });

    auto result = h.client.findCategories("Finance");

    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].id, "c1");
    EXPECT_EQ(result.matches[1].id, "c9");

    ASSERT_EQ(h.http.requests.size(), 1u);
    const auto& request = h.http.requests[0];
    EXPECT_EQ(request.method, HttpMethod::Get);
    EXPECT_EQ(request.url, kBase + "/deviceManagement/deviceCategories?$filter=displayName%20eq%20%27Finance%27");
    EXPECT_EQ(FakeTransport::header(request, "Authorization"), "Bearer tok-123");
}

TEST(GraphClientTest, FindCategoriesEscapesQuotesInName) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) { return reply(200, R"({"value":[]})"); });

    auto result = h.client.findCategories("O'Brien");

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_NE(h.http.requests[0].url.find("%27O%27%27Brien%27"), std::string::npos);
}

TEST(GraphClientTest, FindCategoriesReportsHttpErrors) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) {
        return reply(401, R"({"error":{"code":"InvalidAuthenticationToken","message":"Access token has expired."}})");
    });

    auto result = h.client.findCategories("Finance");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "HTTP 401: InvalidAuthenticationToken: Access token has expired.");
}

TEST(GraphClientTest, FindCategoriesRejectsMalformedBody) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) { return reply(200, "<html>oops</html>"); });

    auto result = h.client.findCategories("Finance");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("Malformed"), std::string::npos);
}

TEST(GraphClientTest, FindCategoriesReportsTransportErrors) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) { return transportError("Could not resolve host"); });

    auto result = h.client.findCategories("Finance");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "Could not resolve host");
}

TEST(GraphClientTest, AssignCategoryPutsReference) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) { return reply(204, ""); });

    auto result = h.client.assignCategory("d1", "c1");

    ASSERT_TRUE(result) << result.error;
    EXPECT_TRUE(result.body.empty());

    const auto& request = h.http.requests[0];
    EXPECT_EQ(request.method, HttpMethod::Put);
    EXPECT_EQ(request.url, kBase + "/deviceManagement/managedDevices/d1/deviceCategory/$ref");
    EXPECT_EQ(FakeTransport::header(request, "Content-Type"), "application/json");

    auto body = nlohmann::json::parse(request.body);
    EXPECT_EQ(body.at("@odata.id").get<std::string>(), kBase + "/deviceManagement/deviceCategories/c1");
}

TEST(GraphClientTest, AssignCategoryPassesNonEmptyBodyThrough) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) { return reply(200, "  {\"ok\":true}\n"); });

    auto result = h.client.assignCategory("d1", "c1");

    ASSERT_TRUE(result);
    EXPECT_EQ(result.body, "{\"ok\":true}");
}

TEST(GraphClientTest, AssignCategoryFailsOnNon2xx) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) { return reply(404, "not here"); });

    auto result = h.client.assignCategory("d1", "c1");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, "HTTP 404: not here");
}

TEST(GraphClientTest, GetDeviceReadsCategoryName) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) {
        return reply(200, R"({"id":"d1","deviceCategoryDisplayName":"Finance"})");
    });

    auto result = h.client.getDevice("d1");

    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.id, "d1");
    EXPECT_EQ(result.categoryName, "Finance");
    EXPECT_EQ(h.http.requests[0].url,
              kBase + "/deviceManagement/managedDevices/d1?$select=id,deviceCategoryDisplayName");
}

TEST(GraphClientTest, GetDeviceTreatsNullCategoryAsEmpty) {
    GraphHarness h;
    h.http.setHandler([](const HttpRequest&) {
        return reply(200, R"({"id":"d1","deviceCategoryDisplayName":null})");
    });

    auto result = h.client.getDevice("d1");

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.categoryName.empty());
}

TEST(GraphClientTest, MissingTokenFailsBeforeSending) {
    FakeTransport http;
    Session session{std::string()};
    GraphClient client(http, session, kBase);

    auto result = client.getDevice("d1");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("Authentication failed"), std::string::npos);
    EXPECT_TRUE(http.requests.empty());
}
