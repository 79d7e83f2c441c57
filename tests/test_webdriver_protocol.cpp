#include <gtest/gtest.h>

#include "collector/webdriver_client.hpp"

using namespace webdriver;
using json = nlohmann::json;

namespace {

ErrorKind kindOf(long status, const std::string& body)
{
    try {
        parseResponse(status, body, "test");
    } catch (const CollectError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected CollectError for " << body;
    return ErrorKind::ConfigurationError;
}

} // namespace

TEST(WebDriverProtocol, ClassifyError)
{
    EXPECT_EQ(classifyError("timeout", ""), ErrorKind::ConnectivityTimeout);
    EXPECT_EQ(classifyError("script timeout", ""), ErrorKind::ConnectivityTimeout);
    EXPECT_EQ(classifyError("no such element", ""), ErrorKind::StructureError);
    EXPECT_EQ(classifyError("unknown error", "net::ERR_CONNECTION_REFUSED"), ErrorKind::ConnectivityTimeout);
    EXPECT_EQ(classifyError("unknown error", "net::ERR_ADDRESS_UNREACHABLE"), ErrorKind::ConnectivityTimeout);
    EXPECT_EQ(classifyError("session not created", "Chrome failed to start"), ErrorKind::ProtocolError);
}

TEST(WebDriverProtocol, ParseResponseAcceptsValue)
{
    auto j = parseResponse(200, R"({"value": null})", "test");
    EXPECT_TRUE(j["value"].is_null());
}

TEST(WebDriverProtocol, ParseResponseErrors)
{
    EXPECT_EQ(kindOf(200, "<html>"), ErrorKind::ProtocolError);
    EXPECT_EQ(kindOf(200, R"({"status": 0})"), ErrorKind::ProtocolError);
    EXPECT_EQ(kindOf(500, R"({"value": {}})"), ErrorKind::ProtocolError);
    EXPECT_EQ(kindOf(500, R"({"value": {"error": "timeout", "message": "Timed out receiving message"}})"),
              ErrorKind::ConnectivityTimeout);
    EXPECT_EQ(kindOf(500, R"json({"value": {"error": "unknown error",
                                        "message": "unknown error: net::ERR_CONNECTION_TIMED_OUT\n  (Session info: chrome=120)"}})json"),
              ErrorKind::ConnectivityTimeout);
}

TEST(WebDriverProtocol, ErrorMessageKeepsFirstLineOnly)
{
    try {
        parseResponse(500, R"({"value": {"error": "unknown error", "message": "first line\nstack trace"}})", "navigate");
        FAIL() << "expected CollectError";
    } catch (const CollectError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("first line"), std::string::npos);
        EXPECT_EQ(what.find("stack trace"), std::string::npos);
    }
}

TEST(WebDriverProtocol, SessionIdFromW3cAndLegacyShapes)
{
    EXPECT_EQ(sessionIdFrom(json::parse(R"({"value": {"sessionId": "abc", "capabilities": {}}})")), "abc");
    EXPECT_EQ(sessionIdFrom(json::parse(R"({"sessionId": "old", "status": 0, "value": {}})")), "old");
    EXPECT_THROW(sessionIdFrom(json::parse(R"({"value": {}})")), CollectError);
}

TEST(WebDriverProtocol, ProbeFrom)
{
    auto probe = probeFrom(json::parse(
        R"({"value": {"ready": "complete", "blocks": ["Array Current\n84 V", "Battery\n12.1 V"]}})"));
    EXPECT_TRUE(probe.loaded);
    ASSERT_EQ(probe.blocks.size(), 2u);
    EXPECT_EQ(probe.blocks[1], "Battery\n12.1 V");

    auto loading = probeFrom(json::parse(R"({"value": {"ready": "interactive", "blocks": []}})"));
    EXPECT_FALSE(loading.loaded);
    EXPECT_TRUE(loading.blocks.empty());

    EXPECT_THROW(probeFrom(json::parse(R"({"value": "oops"})")), CollectError);
}

TEST(WebDriverProtocol, Payloads)
{
    auto session = newSessionPayload({"--headless=new", "--no-sandbox"});
    const auto& caps = session["capabilities"]["alwaysMatch"];
    EXPECT_EQ(caps["browserName"], "chrome");
    ASSERT_EQ(caps["goog:chromeOptions"]["args"].size(), 2u);
    EXPECT_EQ(caps["goog:chromeOptions"]["args"][0], "--headless=new");

    auto probe = probePayload(".tile-text");
    EXPECT_TRUE(probe["script"].is_string());
    ASSERT_EQ(probe["args"].size(), 1u);
    EXPECT_EQ(probe["args"][0], ".tile-text");
}
