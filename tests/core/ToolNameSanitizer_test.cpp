#include <gtest/gtest.h>
#include "core/ToolNameSanitizer.hpp"

using namespace dify_bridge;

TEST(ToolNameSanitizerTest, ReplacesDisallowedCharacters) {
    EXPECT_EQ(ToolNameSanitizer::sanitize_name("My Tool!!", "tool_1"), "My_Tool__");
    EXPECT_EQ(ToolNameSanitizer::sanitize_name("search.v2/query", "tool_1"), "search_v2_query");
    EXPECT_EQ(ToolNameSanitizer::sanitize_name("ok-name_1", "tool_1"), "ok-name_1");
}

TEST(ToolNameSanitizerTest, TruncatesTo64Characters) {
    std::string name = ToolNameSanitizer::sanitize_name(std::string(100, 'a'), "tool_1");
    EXPECT_EQ(name, std::string(64, 'a'));
}

TEST(ToolNameSanitizerTest, EmptyNameUsesFallback) {
    EXPECT_EQ(ToolNameSanitizer::sanitize_name("", "tool_2"), "tool_2");
}

TEST(ToolNameSanitizerTest, MultibyteCharactersCountAsUtf16Units) {
    // U+00E9 (2 bytes) and U+4E2D (3 bytes) are one unit, U+1F600 (4 bytes) is two
    EXPECT_EQ(ToolNameSanitizer::sanitize_name("caf\xC3\xA9", "t"), "caf_");
    EXPECT_EQ(ToolNameSanitizer::sanitize_name("\xE4\xB8\xAD", "t"), "_");
    EXPECT_EQ(ToolNameSanitizer::sanitize_name("x\xF0\x9F\x98\x80", "t"), "x__");
}

TEST(ToolNameSanitizerTest, SanitizesToolList) {
    json result = json::parse(R"({
        "tools": [
            {"name": "My Tool!!", "description": "first", "inputSchema": {"type": "object"}},
            {"name": "", "description": "second"},
            {"description": "third"},
            "not-an-object",
            {"name": 42}
        ],
        "nextCursor": "abc"
    })");

    json sanitized = ToolNameSanitizer::sanitize_result(result);
    const json& tools = sanitized["tools"];

    ASSERT_EQ(tools.size(), 5);
    EXPECT_EQ(tools[0]["name"], "My_Tool__");
    EXPECT_EQ(tools[0]["description"], "first");
    EXPECT_EQ(tools[0]["inputSchema"], json::parse(R"({"type":"object"})"));
    EXPECT_EQ(tools[1]["name"], "tool_2");
    EXPECT_EQ(tools[2]["name"], "tool_3");
    EXPECT_EQ(tools[3], "not-an-object");
    EXPECT_EQ(tools[4]["name"], "42");
    EXPECT_EQ(sanitized["nextCursor"], "abc");
}

TEST(ToolNameSanitizerTest, PreservesFieldOrder) {
    json result = json::parse(R"({"tools":[{"description":"d","name":"a b","annotations":{}}]})");

    json sanitized = ToolNameSanitizer::sanitize_result(result);
    EXPECT_EQ(sanitized.dump(), R"({"tools":[{"description":"d","name":"a_b","annotations":{}}]})");
}

TEST(ToolNameSanitizerTest, DoesNotModifyInput) {
    json result = json::parse(R"({"tools":[{"name":"a b"}]})");
    json copy = result;

    ToolNameSanitizer::sanitize_result(result);
    EXPECT_EQ(result, copy);
}

TEST(ToolNameSanitizerTest, ResultsWithoutToolListUnchanged) {
    json no_tools = {{"content", json::array()}};
    json tools_not_array = {{"tools", "none"}};

    EXPECT_EQ(ToolNameSanitizer::sanitize_result(no_tools), no_tools);
    EXPECT_EQ(ToolNameSanitizer::sanitize_result(tools_not_array), tools_not_array);
    EXPECT_EQ(ToolNameSanitizer::sanitize_result(json(7)), json(7));
    EXPECT_EQ(ToolNameSanitizer::sanitize_result(json()), json());
}

TEST(ToolNameSanitizerTest, Idempotent) {
    json result = json::parse(R"({"tools":[
        {"name":"My Tool!!"}, {"name":""}, {"name":"über-tool"}, {"x":1}
    ]})");
    result["tools"].push_back({{"name", std::string(80, '#')}});

    json once = ToolNameSanitizer::sanitize_result(result);
    json twice = ToolNameSanitizer::sanitize_result(once);
    EXPECT_EQ(once, twice);
}
