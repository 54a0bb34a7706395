#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "McpServer.hpp"
#include "FakeDriver.hpp"
#include <csignal>
#include <sstream>

using namespace odbcmcp;
using namespace odbcmcp::fake;
using ::testing::HasSubstr;

class McpServerTest : public ::testing::Test {
protected:
    McpServerTest()
        : manager_(config_, driver_)
        , metadata_(manager_)
        , executor_(manager_)
        , tester_(manager_)
        , dispatcher_(manager_, metadata_, executor_, tester_)
        , server_(dispatcher_) {
    }

    void SetUp() override {
        config_.profiles.push_back(makeProfile("main"));
    }

    json request(const json& message) {
        auto response = server_.handleMessage(message);
        EXPECT_TRUE(response.has_value());
        return response.value_or(json());
    }

    Config config_;
    FakeDriver driver_;
    ConnectionManager manager_;
    MetadataService metadata_;
    QueryExecutor executor_;
    ConnectionTester tester_;
    ToolDispatcher dispatcher_;
    McpServer server_;
};

// Handshake
TEST_F(McpServerTest, Initialize) {
    json response = request({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                             {"params", {{"clientInfo", {{"name", "test"}}}}}});

    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(response["result"]["serverInfo"]["name"], "odbc-mcp-server");
    EXPECT_TRUE(response["result"]["capabilities"].contains("tools"));
}

TEST_F(McpServerTest, NotificationsGetNoResponse) {
    EXPECT_FALSE(server_.initialized());

    auto response = server_.handleMessage({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});

    EXPECT_FALSE(response.has_value());
    EXPECT_TRUE(server_.initialized());
    EXPECT_FALSE(server_.handleMessage({{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}}).has_value());
}

TEST_F(McpServerTest, Ping) {
    json response = request({{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "ping"}});

    EXPECT_EQ(response["id"], "abc");
    EXPECT_EQ(response["result"], json::object());
}

// Tools
TEST_F(McpServerTest, ToolsList) {
    json response = request({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});

    EXPECT_EQ(response["result"]["tools"].size(), 6u);
}

TEST_F(McpServerTest, ToolsCallSuccess) {
    json response = request({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                             {"params", {{"name", "list-connections"}, {"arguments", json::object()}}}});

    const json& result = response["result"];
    EXPECT_EQ(result["isError"], false);
    ASSERT_EQ(result["content"].size(), 1u);
    EXPECT_EQ(result["content"][0]["type"], "text");
    EXPECT_THAT(result["content"][0]["text"].get<std::string>(), HasSubstr("\"main\""));
}

TEST_F(McpServerTest, ToolFailureIsAResultNotAProtocolError) {
    driver_.failConnect = true;

    json response = request({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                             {"params", {{"name", "list-tables"}}}});

    EXPECT_FALSE(response.contains("error"));
    EXPECT_EQ(response["result"]["isError"], true);
    EXPECT_THAT(response["result"]["content"][0]["text"].get<std::string>(),
                HasSubstr("Error executing list-tables"));
}

TEST_F(McpServerTest, NonStandardToolFaultIsAResult) {
    driver_.foreignFaultStatements.insert("SELECT odd");

    json response = request({{"jsonrpc", "2.0"}, {"id", 9}, {"method", "tools/call"},
                             {"params", {{"name", "execute-query"}, {"arguments", {{"sql", "SELECT odd"}}}}}});

    EXPECT_FALSE(response.contains("error"));
    EXPECT_EQ(response["result"]["isError"], true);
    EXPECT_EQ(response["result"]["content"][0]["text"].get<std::string>(),
              "Error executing execute-query: Unknown error");
}

TEST_F(McpServerTest, ToolsCallWithoutNameIsInvalidParams) {
    json response = request({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                             {"params", json::object()}});

    EXPECT_EQ(response["error"]["code"], kInvalidParams);
}

TEST_F(McpServerTest, ToolsCallWithNonObjectArgumentsIsInvalidParams) {
    json response = request({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"},
                             {"params", {{"name", "list-tables"}, {"arguments", "oops"}}}});

    EXPECT_EQ(response["error"]["code"], kInvalidParams);
}

// Protocol errors
TEST_F(McpServerTest, UnknownMethod) {
    json response = request({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "resources/list"}});

    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["error"]["code"], kMethodNotFound);
    EXPECT_THAT(response["error"]["message"].get<std::string>(), HasSubstr("resources/list"));
}

TEST_F(McpServerTest, MissingMethodIsInvalidRequest) {
    json response = request({{"jsonrpc", "2.0"}, {"id", 8}});

    EXPECT_EQ(response["error"]["code"], kInvalidRequest);
}

TEST_F(McpServerTest, NonObjectIsInvalidRequest) {
    json response = request(json::array({1, 2}));

    EXPECT_TRUE(response["id"].is_null());
    EXPECT_EQ(response["error"]["code"], kInvalidRequest);
}

TEST_F(McpServerTest, UnparsableLineIsParseError) {
    auto line = server_.handleLine("{not json");

    ASSERT_TRUE(line.has_value());
    json response = json::parse(*line);
    EXPECT_TRUE(response["id"].is_null());
    EXPECT_EQ(response["error"]["code"], kParseError);
}

// Stream loop
TEST_F(McpServerTest, RunProcessesEachLineInOrder) {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        "garbage\n"
        R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\r\n");
    std::ostringstream out;

    server_.run(in, out);

    std::istringstream lines(out.str());
    std::vector<json> responses;
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }

    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["error"]["code"], kParseError);
    EXPECT_EQ(responses[2]["id"], 2);
    EXPECT_TRUE(server_.initialized());
}

TEST_F(McpServerTest, RunStopsWhenFlagIsRaised) {
    std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");
    std::ostringstream out;
    volatile std::sig_atomic_t stop = SIGTERM;

    server_.run(in, out, &stop);

    EXPECT_TRUE(out.str().empty());
}
