#include "mcp/RequestDispatcher.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace sf_boost;
using json = nlohmann::json;

class RequestDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.register_tool("text", "Returns text", {{"type", "object"}},
                               [](const json&) -> json { return "hello"; });
        registry.register_tool("structured", "Returns an object", {{"type", "object"}},
                               [](const json&) -> json { return {{"a", 1}}; });
        registry.register_tool("content", "Returns MCP content", {{"type", "object"}},
                               [](const json&) -> json {
                                   return {{"content", json::array({
                                       {{"type", "text"}, {"text", "x"}},
                                       {{"type", "text"}, {"text", "y"}}
                                   })}};
                               });
        registry.register_tool("args", "Returns its arguments", {{"type", "object"}},
                               [](const json& args) -> json { return args; });
        registry.register_tool("throws", "Throws a std::exception", {{"type", "object"}},
                               [](const json&) -> json { throw std::runtime_error("boom"); });
        registry.register_tool("throws_int", "Throws a non-standard exception",
                               {{"type", "object"}},
                               [](const json&) -> json { throw 42; });
    }

    json dispatch(const json& id, const json& method, const json& params = json::object()) {
        RequestDispatcher dispatcher(registry, ServerIdentity{"symfony-boost", "1.0.0-beta.5",
                                                              "2024-11-05"});
        return dispatcher.dispatch(Request{id, method, params});
    }

    json call(const std::string& tool, const json& arguments = json::object()) {
        return dispatch(1, "tools/call", {{"name", tool}, {"arguments", arguments}});
    }

    ToolRegistry registry;
};

TEST_F(RequestDispatcherTest, Initialize) {
    json response = dispatch(1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", "test-client"}, {"version", 3}}}
    });

    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    const json& result = response["result"];
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_EQ(result["serverInfo"]["name"], "symfony-boost");
    EXPECT_EQ(result["serverInfo"]["version"], "1.0.0-beta.5");
    EXPECT_EQ(result["capabilities"], json({{"tools", json::object()}}));
}

TEST_F(RequestDispatcherTest, InitializeIgnoresParams) {
    EXPECT_EQ(dispatch(1, "initialize")["result"],
              dispatch(2, "initialize", {{"clientInfo", "garbage"}})["result"]);
}

TEST_F(RequestDispatcherTest, ToolsListPublishesSchemas) {
    json tools = dispatch("list", "tools/list")["result"]["tools"];

    ASSERT_EQ(tools.size(), registry.size());
    EXPECT_EQ(tools[0]["name"], "text");
    EXPECT_EQ(tools[0]["description"], "Returns text");
    EXPECT_EQ(tools[0]["inputSchema"], json({{"type", "object"}}));
    EXPECT_EQ(tools[5]["name"], "throws_int");
}

TEST_F(RequestDispatcherTest, Ping) {
    json response = dispatch(9, "ping");
    EXPECT_EQ(response["id"], 9);
    EXPECT_EQ(response["result"], json::object());
}

TEST_F(RequestDispatcherTest, UnknownMethod) {
    json response = dispatch(3, "resources/list");
    EXPECT_EQ(response["id"], 3);
    EXPECT_EQ(response["error"]["code"], -32601);
    EXPECT_EQ(response["error"]["message"], "Method not found: resources/list");
    EXPECT_FALSE(response.contains("result"));
}

TEST_F(RequestDispatcherTest, MissingOrNonStringMethod) {
    EXPECT_EQ(dispatch(1, nullptr)["error"]["code"], -32601);
    EXPECT_EQ(dispatch(1, 17)["error"]["code"], -32601);
    EXPECT_EQ(dispatch(1, json::array({"ping"}))["error"]["code"], -32601);
}

TEST_F(RequestDispatcherTest, NotificationStillAnswered) {
    json response = dispatch(nullptr, "notifications/initialized");
    EXPECT_TRUE(response["id"].is_null());
    EXPECT_EQ(response["error"]["code"], -32601);
}

TEST_F(RequestDispatcherTest, StringResultBecomesTextItem) {
    json content = call("text")["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[0]["text"], "hello");
}

TEST_F(RequestDispatcherTest, StructuredResultIsPrettyPrinted) {
    json content = call("structured")["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["text"], "{\n    \"a\": 1\n}");
}

TEST_F(RequestDispatcherTest, ContentResultPassesThrough) {
    json content = call("content")["result"]["content"];
    ASSERT_EQ(content.size(), 2u);
    EXPECT_EQ(content[0]["text"], "x");
    EXPECT_EQ(content[1]["text"], "y");
}

TEST_F(RequestDispatcherTest, ArgumentsDefaultToEmptyObject) {
    json response = dispatch(1, "tools/call", {{"name", "args"}});
    EXPECT_EQ(response["result"]["content"][0]["text"], "{}");

    response = dispatch(1, "tools/call", {{"name", "args"}, {"arguments", nullptr}});
    EXPECT_EQ(response["result"]["content"][0]["text"], "{}");
}

TEST_F(RequestDispatcherTest, ToolNotFound) {
    json response = dispatch("call-7", "tools/call", {{"name", "missing"}});
    EXPECT_EQ(response["id"], "call-7");
    EXPECT_EQ(response["error"]["code"], -32602);
    EXPECT_EQ(response["error"]["message"], "Tool not found: missing");

    response = dispatch(2, "tools/call", json::object());
    EXPECT_EQ(response["error"]["code"], -32602);
    EXPECT_EQ(response["error"]["message"], "Tool not found: ");
}

TEST_F(RequestDispatcherTest, ToolExceptionBecomesInternalError) {
    json response = call("throws");
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["error"]["code"], -32603);
    EXPECT_EQ(response["error"]["message"], "boom");
}

TEST_F(RequestDispatcherTest, NonStandardExceptionIsUnknownError) {
    json response = call("throws_int");
    EXPECT_EQ(response["error"]["code"], -32603);
    EXPECT_EQ(response["error"]["message"], "Unknown error");
}

TEST(NormalizeToolResultTest, Shapes) {
    EXPECT_EQ(RequestDispatcher::normalize_tool_result("plain"),
              json::parse(R"([{"type":"text","text":"plain"}])"));
    EXPECT_EQ(RequestDispatcher::normalize_tool_result(json::array({1, 2}))[0]["text"],
              "[\n    1,\n    2\n]");
    EXPECT_EQ(RequestDispatcher::normalize_tool_result(nullptr)[0]["text"], "null");
    // "content" that is not a list is ordinary data
    EXPECT_EQ(RequestDispatcher::normalize_tool_result({{"content", "text"}})[0]["text"],
              "{\n    \"content\": \"text\"\n}");
}
