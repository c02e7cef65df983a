#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <rgmcp/server.hpp>
#include <sstream>

using namespace rgmcp;

// Drives a complete MCP session through Server with the real ripgrep.

class StdioSessionTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        dir_.write_file("src/main.rs", "fn hello_world() {}\n");
        dir_.write_file("web/app.js", "function helloWorld() {}\n");
        config_.files_root = dir_.path();
    }

    std::vector<json> run(const std::vector<json>& requests)
    {
        std::string input;
        for (const auto& request : requests)
            input += request.dump() + "\n";

        std::istringstream in(input);
        std::ostringstream out;
        Server(config_).serve(in, out);

        std::vector<json> responses;
        std::istringstream lines(out.str());
        std::string line;
        while (std::getline(lines, line))
            responses.push_back(json::parse(line));
        return responses;
    }

    static json tool_call(int id, const json& arguments)
    {
        return json{{"jsonrpc", "2.0"},
                    {"id", id},
                    {"method", "tools/call"},
                    {"params", {{"name", "search"}, {"arguments", arguments}}}};
    }

    static const json* find_id(const std::vector<json>& responses, int id)
    {
        for (const auto& response : responses)
            if (response["id"] == id)
                return &response;
        return nullptr;
    }

    test::TempDir dir_;
    ServerConfig config_;
};

TEST_F(StdioSessionTest, InitializeListAndSearch)
{
    SKIP_WITHOUT_RIPGREP();

    auto responses = run({
        json{{"jsonrpc", "2.0"},
             {"id", 1},
             {"method", "initialize"},
             {"params",
              {{"protocolVersion", "2024-11-05"},
               {"capabilities", json::object()},
               {"clientInfo", {{"name", "it"}, {"version", "1"}}}}}},
        json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
        json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}},
        tool_call(3, {{"pattern", "hello"}, {"fixed_strings", true}}),
        tool_call(4, {{"pattern", "hello"}, {"file_types", json::array({"rust"})}}),
    });

    ASSERT_EQ(responses.size(), 4u);

    const json* init = find_id(responses, 1);
    ASSERT_NE(init, nullptr);
    EXPECT_EQ((*init)["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ((*init)["result"]["serverInfo"]["name"], "ripgrep-mcp");

    const json* list = find_id(responses, 2);
    ASSERT_NE(list, nullptr);
    EXPECT_EQ((*list)["result"]["tools"].size(), 1u);

    const json* all = find_id(responses, 3);
    ASSERT_NE(all, nullptr);
    json all_payload = json::parse((*all)["result"]["content"][0]["text"].get<std::string>());
    EXPECT_GE(all_payload["matches"].size(), 2u);

    const json* rust = find_id(responses, 4);
    ASSERT_NE(rust, nullptr);
    json rust_payload = json::parse((*rust)["result"]["content"][0]["text"].get<std::string>());
    ASSERT_EQ(rust_payload["matches"].size(), 1u);
    EXPECT_NE(rust_payload["matches"][0].get<std::string>().find("main.rs"), std::string::npos);
}

TEST_F(StdioSessionTest, FailuresSurfaceAsToolErrors)
{
    SKIP_WITHOUT_RIPGREP();

    auto responses = run({
        tool_call(1, {{"pattern", "hello"}, {"path", "../../etc"}}),
        tool_call(2, {{"pattern", "(unclosed"}}),
        tool_call(3, {{"pattern", "hello"}, {"path", "no/such/dir"}}),
    });

    ASSERT_EQ(responses.size(), 3u);
    for (int id = 1; id <= 3; ++id)
    {
        const json* response = find_id(responses, id);
        ASSERT_NE(response, nullptr) << id;
        EXPECT_EQ((*response)["result"]["isError"], true) << id;
    }

    std::string traversal =
        (*find_id(responses, 1))["result"]["content"][0]["text"].get<std::string>();
    EXPECT_NE(traversal.find("Path traversal attempt"), std::string::npos);
}
