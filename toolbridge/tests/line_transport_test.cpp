#include <gtest/gtest.h>

#include "line_transport.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace toolbridge;
using nlohmann::json;

namespace {

std::vector<json> parse_lines(const std::string& output) {
    std::vector<json> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

std::string run_transport(TestServer& server, const std::string& input, size_t workers = 0) {
    std::istringstream in(input);
    std::ostringstream out;
    LineTransport transport(in, out, [&server](const Request& request) { return server.dispatcher().dispatch(request); },
                            workers);
    transport.run();
    return out.str();
}

} // namespace

TEST(LineTransport, AnswersEachRequestOnItsOwnLine) {
    TestServer server;
    std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n";

    auto lines = parse_lines(run_transport(server, input));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["id"], 1);
    EXPECT_TRUE(lines[0]["result"].contains("serverInfo"));
    EXPECT_EQ(lines[1]["id"], 2);
    EXPECT_TRUE(lines[1]["result"]["tools"].is_array());
}

TEST(LineTransport, MalformedLinesAreSkipped) {
    TestServer server;
    std::string input =
        "this is not json\n"
        "\n"
        "[1,2,3]\n"
        R"({"jsonrpc":"2.0","id":5,"method":"ping"})" "\n";

    std::istringstream in(input);
    std::ostringstream out;
    LineTransport transport(in, out, [&server](const Request& request) { return server.dispatcher().dispatch(request); });
    transport.run();

    auto lines = parse_lines(out.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["id"], 5);
    EXPECT_EQ(transport.lines_dropped(), 2u);
    EXPECT_EQ(transport.responses_written(), 1u);
}

TEST(LineTransport, RequestWithoutMethodGetsInvalidRequest) {
    TestServer server;
    auto lines = parse_lines(run_transport(server, R"({"jsonrpc":"2.0","id":"x"})" "\n"));

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["id"], "x");
    EXPECT_EQ(lines[0]["error"]["code"], -32600);
}

TEST(LineTransport, ServesRemainingRequestsAfterToolFailure) {
    TestServer server;
    server.registry.add(make_test_tool("explode", [](tools::ToolCall&) -> tools::ToolOutcome {
        throw std::runtime_error("boom");
    }));
    std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"explode"}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\n";

    auto lines = parse_lines(run_transport(server, input));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["error"]["code"], -32603);
    EXPECT_EQ(lines[1]["id"], 2);
    EXPECT_TRUE(lines[1].contains("result"));
}

TEST(LineTransport, DispatchExceptionBecomesInternalError) {
    std::istringstream in(R"({"jsonrpc":"2.0","id":4,"method":"ping"})" "\n");
    std::ostringstream out;
    LineTransport transport(in, out, [](const Request&) -> std::optional<Response> {
        throw std::runtime_error("dispatcher unavailable");
    });
    transport.run();

    auto lines = parse_lines(out.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["id"], 4);
    EXPECT_EQ(lines[0]["error"]["code"], -32603);
}

TEST(LineTransport, WorkerPoolKeepsResponsesInArrivalOrder) {
    TestServer server;
    server.registry.add(make_test_tool("slow", [](tools::ToolCall&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return tools::ok("slow done");
    }));
    server.registry.add(make_test_tool("fast", [](tools::ToolCall&) { return tools::ok("fast done"); }));

    std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"slow"}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"fast"}})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"ping"})" "\n";

    auto lines = parse_lines(run_transport(server, input, 2));

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0]["id"], 1);
    EXPECT_EQ(lines[0]["result"]["content"][0]["text"], "slow done");
    EXPECT_EQ(lines[1]["id"], 2);
    EXPECT_EQ(lines[1]["result"]["content"][0]["text"], "fast done");
    EXPECT_EQ(lines[2]["id"], 3);
}

TEST(LineTransport, WorkerPoolDropsNotificationsWithoutBlocking) {
    TestServer server;
    std::string input =
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n";

    auto lines = parse_lines(run_transport(server, input, 3));

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["id"], 1);
}
