#include "mcp/ToolRegistry.hpp"
#include <gtest/gtest.h>

using namespace sf_boost;
using json = nlohmann::json;

namespace {

ToolHandler returning(const std::string& text) {
    return [text](const json&) -> json { return text; };
}

} // namespace

TEST(ToolRegistryTest, StartsEmpty) {
    ToolRegistry registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.list().empty());
    EXPECT_EQ(registry.lookup("anything"), nullptr);
}

TEST(ToolRegistryTest, ListKeepsRegistrationOrder) {
    ToolRegistry registry;
    registry.register_tool("zeta", "last letter", {{"type", "object"}}, returning("z"));
    registry.register_tool("alpha", "first letter", {{"type", "object"}}, returning("a"));
    registry.register_tool("mid", "middle", {{"type", "object"}}, returning("m"));

    auto tools = registry.list();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_EQ(tools[2].name, "mid");
    EXPECT_EQ(tools[1].description, "first letter");
}

TEST(ToolRegistryTest, LookupFindsHandler) {
    ToolRegistry registry;
    json schema = {{"type", "object"}, {"properties", {{"q", {{"type", "string"}}}}}};
    registry.register_tool(ToolInfo{"search", "Search", schema}, returning("found"));

    const ToolDescriptor* tool = registry.lookup("search");
    ASSERT_NE(tool, nullptr);
    EXPECT_EQ(tool->info.input_schema, schema);
    EXPECT_EQ(tool->invoke(json::object()), "found");

    EXPECT_EQ(registry.lookup("Search"), nullptr);
}

TEST(ToolRegistryTest, DuplicateNameReplacesInPlace) {
    ToolRegistry registry;
    registry.register_tool("first", "v1", json::object(), returning("one"));
    registry.register_tool("second", "v1", json::object(), returning("two"));
    registry.register_tool("first", "v2", json::object(), returning("uno"));

    auto tools = registry.list();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "first");
    EXPECT_EQ(tools[0].description, "v2");
    EXPECT_EQ(tools[1].name, "second");
    EXPECT_EQ(registry.lookup("first")->invoke(json::object()), "uno");
}

TEST(ToolRegistryTest, RejectsEmptyNameAndHandler) {
    ToolRegistry registry;
    EXPECT_THROW(registry.register_tool("", "no name", json::object(), returning("x")),
                 std::invalid_argument);
    EXPECT_THROW(registry.register_tool("no_handler", "desc", json::object(), ToolHandler()),
                 std::invalid_argument);
    EXPECT_TRUE(registry.empty());
}
