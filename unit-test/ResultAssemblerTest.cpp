#include "gtest/gtest.h"
#include "result.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebox;

class ResultAssemblerTest : public ::testing::Test {
protected:
    static execution_request make_execution_request(bool capture) {
        raw_request raw;
        raw.code = "result = 2.0";
        raw.timeout = 5;
        raw.max_memory_mb = 128;
        raw.capture_locals = capture;
        return validate_request(raw);
    }

    static message::worker_report ok_report(json bindings = json::object()) {
        message::worker_report report;
        report.ok = true;
        report.bindings = bindings;
        return report;
    }

    static message::worker_report error_report(const string &kind, const string &type, const string &message) {
        message::worker_report report;
        report.ok = false;
        report.kind = kind;
        report.exception_type = type;
        report.message = message;
        report.traceback = "Traceback (most recent call last):\n  File \"<snippet>\", line 1, in <module>\n" + type + ": " + message + "\n";
        report.bindings = json{{"partial", 1}};
        return report;
    }

    static run_record completed(optional<message::worker_report> report) {
        run_record record;
        record.outcome = run_state::COMPLETED;
        record.stdout_text = "2\n";
        record.report = move(report);
        record.exit_description = "exited with code 0";
        record.elapsed_seconds = 0.125;
        record.peak_memory_bytes = 12 * 1024 * 1024;
        return record;
    }
};

TEST_F(ResultAssemblerTest, SuccessTest) {
    execution_result result = assemble_result(make_execution_request(false), completed(ok_report()));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_data, "2\n");
    EXPECT_EQ(result.stderr_data, "");
    EXPECT_FALSE(result.error);
    EXPECT_FALSE(result.error_message);
    EXPECT_FALSE(result.exception_type);
    EXPECT_DOUBLE_EQ(result.execution_time, 0.125);
    EXPECT_DOUBLE_EQ(result.memory_used_mb, 12.0);
    EXPECT_FALSE(result.captured_bindings);
}

TEST_F(ResultAssemblerTest, CapturesBindingsOnlyWhenRequestedTest) {
    json snapshot = {{"result", 2.0}, {"__doc__", nullptr}};
    execution_result captured = assemble_result(make_execution_request(true), completed(ok_report(snapshot)));
    ASSERT_TRUE(captured.captured_bindings);
    EXPECT_JSON_EQ(*captured.captured_bindings, (json{{"result", 2.0}}));

    execution_result ignored = assemble_result(make_execution_request(false), completed(ok_report(snapshot)));
    EXPECT_FALSE(ignored.captured_bindings);
}

TEST_F(ResultAssemblerTest, RuntimeErrorTest) {
    execution_result result = assemble_result(make_execution_request(true),
                                              completed(error_report("runtime", "ValueError", "boom")));
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(*result.error, error_kind::SNIPPET_RUNTIME_ERROR);
    ASSERT_TRUE(result.error_message);
    EXPECT_NE(result.error_message->find("Traceback"), string::npos);
    EXPECT_NE(result.error_message->find("ValueError: boom"), string::npos);
    EXPECT_EQ(result.exception_type, "ValueError");
    // 用户代码抛出异常时 worker 仍然正常结束，变量快照可信
    ASSERT_TRUE(result.captured_bindings);
    EXPECT_JSON_EQ(*result.captured_bindings, (json{{"partial", 1}}));
}

TEST_F(ResultAssemblerTest, RuntimeErrorWithoutTracebackTest) {
    message::worker_report report = error_report("runtime", "KeyError", "'missing'");
    report.traceback.clear();
    execution_result result = assemble_result(make_execution_request(false), completed(report));
    EXPECT_EQ(result.error_message, "KeyError: 'missing'");
}

TEST_F(ResultAssemblerTest, SyntaxErrorTest) {
    execution_result result = assemble_result(make_execution_request(false),
                                              completed(error_report("syntax", "SyntaxError", "invalid syntax")));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, error_kind::SNIPPET_SYNTAX_ERROR);
    EXPECT_EQ(result.exception_type, "SyntaxError");
}

TEST_F(ResultAssemblerTest, MemoryErrorInsideSnippetTest) {
    execution_result result = assemble_result(make_execution_request(true),
                                              completed(error_report("memory", "MemoryError", "")));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, error_kind::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(result.error_message, "Code execution exceeded memory limit of 128 MB");
    EXPECT_EQ(result.exception_type, "MemoryError");
    EXPECT_FALSE(result.captured_bindings);
}

TEST_F(ResultAssemblerTest, TimeoutTest) {
    run_record record = completed(ok_report({{"result", 2.0}}));
    record.outcome = run_state::TIMED_OUT;
    record.stdout_text = "partial";
    execution_result result = assemble_result(make_execution_request(true), record);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, error_kind::TIMEOUT);
    EXPECT_EQ(result.error_message, "Code execution timeout after 5 seconds");
    EXPECT_EQ(result.stdout_data, "partial");
    EXPECT_FALSE(result.captured_bindings);
}

TEST_F(ResultAssemblerTest, MemoryExceededTest) {
    run_record record = completed(nullopt);
    record.outcome = run_state::MEMORY_EXCEEDED;
    record.exit_description = "terminated by signal 9 (Killed)";
    execution_result result = assemble_result(make_execution_request(true), record);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, error_kind::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(result.error_message, "Code execution exceeded memory limit of 128 MB");
    EXPECT_FALSE(result.captured_bindings);
}

TEST_F(ResultAssemblerTest, CrashedTest) {
    run_record record = completed(nullopt);
    record.outcome = run_state::CRASHED;
    record.exit_description = "terminated by signal 11 (Segmentation fault)";
    execution_result result = assemble_result(make_execution_request(true), record);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, error_kind::WORKER_CRASHED);
    EXPECT_EQ(result.error_message, "Worker process terminated by signal 11 (Segmentation fault) without reporting a result");
    EXPECT_FALSE(result.captured_bindings);
}

TEST_F(ResultAssemblerTest, CompletedWithoutReportIsCrashTest) {
    execution_result result = assemble_result(make_execution_request(false), completed(nullopt));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, error_kind::WORKER_CRASHED);
}

TEST_F(ResultAssemblerTest, TruncationDoesNotAffectSuccessTest) {
    run_record record = completed(ok_report());
    record.stdout_truncated = true;
    execution_result result = assemble_result(make_execution_request(false), record);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output_truncated, vector<string>{"stdout"});
}

TEST_F(ResultAssemblerTest, ToJsonTest) {
    execution_result result = assemble_result(make_execution_request(true), completed(ok_report({{"result", 2.0}})));
    json j = result;
    EXPECT_JSON_EQ(j, (json{
                          {"success", true},
                          {"stdout", "2\n"},
                          {"stderr", ""},
                          {"error_type", nullptr},
                          {"error_message", nullptr},
                          {"execution_time", 0.125},
                          {"memory_used_mb", 12.0},
                          {"locals_dict", {{"result", 2.0}}},
                          {"exception_type", nullptr},
                          {"output_truncated", json::array()}}));
}

TEST_F(ResultAssemblerTest, ToJsonErrorTest) {
    run_record record = completed(nullopt);
    record.outcome = run_state::TIMED_OUT;
    json j = assemble_result(make_execution_request(false), record);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error_type"], "Timeout");
    EXPECT_EQ(j["error_message"], "Code execution timeout after 5 seconds");
    EXPECT_TRUE(j["locals_dict"].is_null());
}
