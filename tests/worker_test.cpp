#include <gtest/gtest.h>
#include <bits/stdc++.h>
#include "src/worker/worker.h"
#include "testUtils.h"
using namespace std;

class WorkerTest : public ::testing::Test {
protected:
    TestTree tree;
    unique_ptr<Worker> worker;

    void SetUp() override {
        set_verbose(false);
        worker = make_unique<Worker>(make_test_config(tree));
    }

    json request(const json& line) {
        return json::parse(worker->handle_line(line.dump()));
    }
};

TEST_F(WorkerTest, MalformedLineGivesError) {
    json response = json::parse(worker->handle_line("{not json"));
    ASSERT_TRUE(response.contains("error"));
    EXPECT_FALSE(response.contains("result"));
}

TEST_F(WorkerTest, UnknownToolGivesError) {
    json response = request({{"tool", "objdump"}, {"arguments", {{"binary", "/bin/ls"}}}});
    ASSERT_TRUE(response.contains("error"));
    EXPECT_NE(response["error"].get<string>().find("objdump"), string::npos);
}

TEST_F(WorkerTest, CompareThroughDispatch) {
    json response = request({{"tool", "compare"}, {"arguments", {{"actual", "3 5\n"}, {"expected", "3  5"}}}});
    EXPECT_EQ(response["tool"], "compare");
    EXPECT_EQ(response["session"].get<string>().rfind("session_", 0), 0u);
    EXPECT_TRUE(response["result"]["match"].get<bool>());
}

TEST_F(WorkerTest, SessionsAreDistinct) {
    RequestContext a = worker->make_context("compile", "{}");
    RequestContext b = worker->make_context("compile", "{}");
    EXPECT_NE(a.session_id, b.session_id);
    EXPECT_EQ(a.tool, "compile");
}

TEST_F(WorkerTest, RunRefusesForeignBinary) {
    json response = request({{"tool", "run"}, {"arguments", {{"binary", "/bin/true"}}}});
    EXPECT_FALSE(response["result"]["success"].get<bool>());
    EXPECT_EQ(response["result"]["outcome"], "NotStarted");
    EXPECT_EQ(response["result"]["error_kind"], "SecurityViolation");
    EXPECT_TRUE(response["result"]["stdout"].is_null());
}

TEST_F(WorkerTest, CompileAndRunMatchesExpected) {
    if (!tool_available("g++")) GTEST_SKIP() << "g++ not available";
    json response = request({{"tool", "compile_and_run"},
                             {"arguments", {{"source", PROGRAM_SUM}, {"input", "3 5\n"}, {"expected_output", "8"}}}});
    ASSERT_TRUE(response.contains("result")) << response.dump();
    const json& result = response["result"];
    EXPECT_TRUE(result["compile"]["success"].get<bool>());
    EXPECT_EQ(result["run"]["stdout"], "8\n");
    EXPECT_EQ(result["run"]["outcome"], "Ok");
    EXPECT_TRUE(result["comparison"]["match"].get<bool>());
}

TEST_F(WorkerTest, CompileAndRunReportsMismatch) {
    if (!tool_available("g++")) GTEST_SKIP() << "g++ not available";
    json response = request({{"tool", "compile_and_run"},
                             {"arguments", {{"source", PROGRAM_SUM}, {"input", "3 5\n"}, {"expected_output", "9"}}}});
    const json& comparison = response["result"]["comparison"];
    EXPECT_FALSE(comparison["match"].get<bool>());
    ASSERT_EQ(comparison["differences"].size(), 1u);
    EXPECT_EQ(comparison["differences"][0]["actual"], "8");
    EXPECT_EQ(comparison["differences"][0]["expected"], "9");
}

TEST_F(WorkerTest, CompileFailureSkipsRun) {
    if (!tool_available("g++")) GTEST_SKIP() << "g++ not available";
    json response = request({{"tool", "compile_and_run"},
                             {"arguments", {{"source", "int main() { return }"}, {"expected_output", "1"}}}});
    const json& result = response["result"];
    EXPECT_FALSE(result["compile"]["success"].get<bool>());
    EXPECT_EQ(result["compile"]["error_kind"], "CompileFailure");
    EXPECT_TRUE(result["run"].is_null());
    EXPECT_TRUE(result["comparison"].is_null());
}

TEST_F(WorkerTest, CompileThenRunWithTimeLimit) {
    if (!tool_available("g++")) GTEST_SKIP() << "g++ not available";
    json compiled = request({{"tool", "compile"}, {"arguments", {{"source", PROGRAM_SLEEP}, {"name", "sleeper"}}}});
    ASSERT_TRUE(compiled["result"]["success"].get<bool>()) << compiled.dump();
    string artifact = compiled["result"]["artifact"].get<string>();

    json response = request({{"tool", "run"}, {"arguments", {{"binary", artifact}, {"time_limit_ms", 200}}}});
    const json& result = response["result"];
    EXPECT_EQ(result["outcome"], "Timeout");
    EXPECT_EQ(result["elapsed_ms"], 200);
    EXPECT_EQ(result["limits"]["time_limit_ms"], 200);
    EXPECT_TRUE(result["stdout"].is_null());
}

TEST_F(WorkerTest, RawBytesSerializeWithoutThrowing) {
    CompareRequest compare{"\xff\xfe", "x", false, false};
    RequestContext ctx = worker->make_context("compare", "{}");
    json result = worker->handle(Request(compare), ctx);
    EXPECT_FALSE(result["match"].get<bool>());
    EXPECT_NO_THROW(result.dump(-1, ' ', false, json::error_handler_t::replace));
}
