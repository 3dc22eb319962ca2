#include "gtest/gtest.h"
#include <map>
#include <sstream>
#include "service.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebox;

class ServiceTest : public ::testing::Test {
protected:
    ServiceTest() : exec(2), srv(exec, in, out, 2) {}

    executor exec;
    stringstream in, out;
    service srv;
};

TEST_F(ServiceTest, LimitsTest) {
    json response = srv.handle({{"id", 1}, {"op", "limits"}});
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["success"], true);
    EXPECT_JSON_EQ(response["data"], exec.limits());
    EXPECT_EQ(response["data"]["max_timeout_seconds"], 300);
    EXPECT_EQ(response["data"]["max_code_length"], 50000);
}

TEST_F(ServiceTest, HealthTest) {
    json response = srv.handle({{"id", "h"}, {"op", "health"}});
    EXPECT_EQ(response["id"], "h");
    EXPECT_EQ(response["success"], true);
    EXPECT_EQ(response["data"]["status"], "healthy");
    EXPECT_EQ(response["data"]["executor_available"], true);
    EXPECT_EQ(response["data"]["capacity"], 2);
}

TEST_F(ServiceTest, UnknownOpTest) {
    json response = srv.handle({{"id", 2}, {"op", "compile"}});
    EXPECT_EQ(response["success"], false);
    EXPECT_EQ(response["error"]["type"], "BadRequest");
}

TEST_F(ServiceTest, NonStringOpTest) {
    json response = srv.handle({{"id", 3}, {"op", 42}});
    EXPECT_EQ(response["success"], false);
    EXPECT_EQ(response["error"]["type"], "BadRequest");
}

TEST_F(ServiceTest, NonObjectRequestTest) {
    json response = srv.handle(json::array({1, 2}));
    EXPECT_TRUE(response["id"].is_null());
    EXPECT_EQ(response["error"]["type"], "BadRequest");
}

TEST_F(ServiceTest, ValidationErrorTest) {
    json response = srv.handle({{"id", 4}, {"code", "   "}});
    EXPECT_EQ(response["id"], 4);
    EXPECT_EQ(response["success"], false);
    EXPECT_EQ(response["error"]["type"], "ValidationError");
    EXPECT_EQ(response["error"]["constraint"], "code_empty");

    response = srv.handle({{"id", 5}, {"code", "pass"}, {"timeout", 0}});
    EXPECT_EQ(response["error"]["constraint"], "timeout_out_of_range");
    EXPECT_EQ(exec.gate().in_use(), 0u);
}

TEST_F(ServiceTest, ExecuteTest) {
    json response = srv.handle({{"id", 6}, {"code", "print(6 * 7)"}});
    EXPECT_EQ(response["success"], true);
    EXPECT_EQ(response["data"]["success"], true);
    EXPECT_EQ(response["data"]["stdout"], "42\n");
    EXPECT_TRUE(response["data"]["error_type"].is_null());
}

TEST_F(ServiceTest, ExecuteFailureIsSuccessfulResponseTest) {
    // 用户代码的错误属于执行结果，不是协议错误
    json response = srv.handle({{"id", 7}, {"op", "execute"}, {"code", "1/0"}});
    EXPECT_EQ(response["success"], true);
    EXPECT_EQ(response["data"]["success"], false);
    EXPECT_EQ(response["data"]["error_type"], "SnippetRuntimeError");
    EXPECT_EQ(response["data"]["exception_type"], "ZeroDivisionError");
}

TEST_F(ServiceTest, ServeTest) {
    in << R"({"id": 1, "op": "limits"})" << "\n"
       << "\n"
       << "{not json" << "\n"
       << R"json({"id": 2, "code": "print('a')"})json" << "\n"
       << R"({"id": 3, "code": "x = 1", "capture_locals": true})" << "\n"
       << R"({"id": 4, "code": ""})" << "\n"
       << R"({"id": 5, "op": ["limits"]})" << "\n";
    srv.serve();

    map<string, json> responses;
    int anonymous = 0;
    string line;
    while (getline(out, line)) {
        json response = json::parse(line);
        if (response["id"].is_null())
            ++anonymous;
        else
            responses[response["id"].dump()] = response;
    }

    EXPECT_EQ(anonymous, 1);
    ASSERT_EQ(responses.size(), 5u);
    EXPECT_EQ(responses["1"]["success"], true);
    EXPECT_EQ(responses["2"]["data"]["stdout"], "a\n");
    EXPECT_JSON_EQ(responses["3"]["data"]["locals_dict"], (json{{"x", 1}}));
    EXPECT_EQ(responses["4"]["error"]["constraint"], "code_empty");
    EXPECT_EQ(responses["5"]["error"]["type"], "BadRequest");
}
