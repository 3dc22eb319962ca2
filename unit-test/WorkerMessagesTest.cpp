#include "gtest/gtest.h"
#include "common/messages.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebox;
using namespace codebox::message;

TEST(WorkerMessagesTest, RequestTest) {
    worker_request request;
    request.code = "print(x)";
    request.bindings = {{"x", 1}};
    request.capture = true;

    json j = request;
    EXPECT_JSON_EQ(j, (json{{"code", "print(x)"}, {"bindings", {{"x", 1}}}, {"capture", true}}));

    worker_request parsed = j.get<worker_request>();
    EXPECT_EQ(parsed.code, "print(x)");
    EXPECT_JSON_EQ(parsed.bindings, (json{{"x", 1}}));
    EXPECT_TRUE(parsed.capture);
}

TEST(WorkerMessagesTest, RequestDefaultsTest) {
    worker_request parsed = json{{"code", "pass"}}.get<worker_request>();
    EXPECT_TRUE(parsed.bindings.is_object());
    EXPECT_TRUE(parsed.bindings.empty());
    EXPECT_FALSE(parsed.capture);
}

TEST(WorkerMessagesTest, RequestRejectsNonObjectBindingsTest) {
    json j = {{"code", "pass"}, {"bindings", {1, 2, 3}}};
    EXPECT_THROW(j.get<worker_request>(), invalid_argument);
}

TEST(WorkerMessagesTest, ReportToJsonTest) {
    worker_report report;
    report.ok = true;
    json j = report;
    EXPECT_JSON_EQ(j, (json{
                          {"status", "ok"},
                          {"kind", nullptr},
                          {"exception_type", nullptr},
                          {"message", nullptr},
                          {"traceback", nullptr},
                          {"bindings", nullptr}}));
}

TEST(WorkerMessagesTest, ParseReportTest) {
    auto report = parse_worker_report(R"({"status":"error","kind":"runtime","exception_type":"ZeroDivisionError","message":"division by zero","traceback":"Traceback ...","bindings":{"a":1}})");
    ASSERT_TRUE(report);
    EXPECT_FALSE(report->ok);
    EXPECT_EQ(report->kind, "runtime");
    EXPECT_EQ(report->exception_type, "ZeroDivisionError");
    EXPECT_EQ(report->message, "division by zero");
    EXPECT_EQ(report->traceback, "Traceback ...");
    ASSERT_TRUE(report->bindings);
    EXPECT_JSON_EQ(*report->bindings, (json{{"a", 1}}));
}

TEST(WorkerMessagesTest, ParseReportWithNullsTest) {
    auto report = parse_worker_report(R"({"status":"ok","kind":null,"bindings":null})");
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->ok);
    EXPECT_EQ(report->kind, "");
    EXPECT_FALSE(report->bindings);
}

TEST(WorkerMessagesTest, MalformedReportTest) {
    EXPECT_FALSE(parse_worker_report(""));
    EXPECT_FALSE(parse_worker_report("garbage"));
    EXPECT_FALSE(parse_worker_report(R"({"status":"ok","bindi)"));
    EXPECT_FALSE(parse_worker_report(R"({"status":"maybe"})"));
    EXPECT_FALSE(parse_worker_report(R"({"kind":"runtime"})"));
    EXPECT_FALSE(parse_worker_report(R"({"status":"ok","bindings":[1]})"));
    EXPECT_FALSE(parse_worker_report(R"({"status":"error","message":42})"));
}
