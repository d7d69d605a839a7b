#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "tool/tool_registry.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>

using namespace toolbridge::tools;

TEST(ToolRegistry, ListsToolsInRegistrationOrder) {
    ToolRegistry registry;
    registry.add(make_test_tool("zeta", [](ToolCall&) { return ok("z"); }));
    registry.add(make_test_tool("alpha", [](ToolCall&) { return ok("a"); }));
    registry.add(make_test_tool("mid", [](ToolCall&) { return ok("m"); }));

    auto listed = registry.list();
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0]->name, "zeta");
    EXPECT_EQ(listed[1]->name, "alpha");
    EXPECT_EQ(listed[2]->name, "mid");
}

TEST(ToolRegistry, RejectsDuplicateNames) {
    ToolRegistry registry;
    registry.add(make_test_tool("same", [](ToolCall&) { return ok("first"); }));

    EXPECT_THROW(registry.add(make_test_tool("same", [](ToolCall&) { return ok("second"); })), DuplicateToolError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistry, IgnoresNullHandler) {
    ToolRegistry registry;
    registry.add(nullptr);

    EXPECT_EQ(registry.size(), 0u);
}

TEST(ToolRegistry, FindReturnsRegisteredDescriptorUnchanged) {
    ToolDescriptor registered{
        "present",
        "Looks things up",
        {required_string("path", "Where to look"), optional_bool("deep", "Recurse", true),
         optional_integer("limit", "Cap", 25), enum_param("mode", "How", {"fast", "full"}, "fast")},
        std::chrono::milliseconds(1500),
    };
    ToolRegistry registry;
    registry.add(std::make_unique<FunctionToolHandler>(registered, [](ToolCall&) { return ok("here"); }));

    const ToolHandler* found = registry.find("present");
    ASSERT_NE(found, nullptr);
    const ToolDescriptor& resolved = found->descriptor();
    EXPECT_EQ(resolved.name, registered.name);
    EXPECT_EQ(resolved.description, registered.description);
    EXPECT_EQ(resolved.timeout, registered.timeout);
    ASSERT_EQ(resolved.parameters.size(), registered.parameters.size());
    for (size_t i = 0; i < registered.parameters.size(); ++i) {
        const ParameterSpec& expected = registered.parameters[i];
        const ParameterSpec& actual = resolved.parameters[i];
        EXPECT_EQ(actual.name, expected.name);
        EXPECT_EQ(actual.kind, expected.kind) << expected.name;
        EXPECT_EQ(actual.description, expected.description) << expected.name;
        EXPECT_EQ(actual.required, expected.required) << expected.name;
        EXPECT_EQ(actual.default_value, expected.default_value) << expected.name;
        EXPECT_EQ(actual.enum_values, expected.enum_values) << expected.name;
    }
    EXPECT_EQ(describe(resolved), describe(registered));
    EXPECT_EQ(registry.find("absent"), nullptr);
}

TEST(ToolRegistry, BuiltinToolsHaveUniqueNamesAndDescriptions) {
    ToolRegistry registry;
    register_builtin_tools(registry);

    const std::set<std::string> expected = {
        "decompile_apk", "jadx_decompile", "analyze_manifest", "find_classes",
        "get-current-program", "list-project-files", "list-open-programs", "open-program", "checkin-program",
    };
    std::set<std::string> names;
    for (const auto* descriptor : registry.list()) {
        names.insert(descriptor->name);
        EXPECT_FALSE(descriptor->description.empty()) << descriptor->name;
    }
    EXPECT_EQ(names, expected);
    EXPECT_EQ(registry.size(), expected.size());
}
