#include <fmt/format.h>
#include <filesystem>
#include <mutex>
#include <thread>
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/executor.hpp"
#include "test/mock_container_engine.hpp"

using namespace std;
using namespace sandbox;
using namespace sandbox::engine;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;
namespace fs = std::filesystem;

class ExecutorTest : public ::testing::Test {
protected:
    NiceMock<mock::mock_container_engine> docker;
    sandbox_config config;
    fs::path state_dir = fs::path(::testing::TempDir()) / "executor-test";
    image_provisioner images{docker, "code-sandbox-python-executor", state_dir, state_dir, chrono::seconds(60)};
    sandbox_orchestrator orchestrator{docker, images, config};
    execution_cache cache{chrono::seconds(300), 64};
    availability_gate gate{docker, chrono::seconds(1)};
    code_executor executor{gate, orchestrator, cache, config};

    void SetUp() override {
        docker.set_defaults();
    }

    execution_result execute(const execution_request &request) {
        outcome o = executor.execute(request);
        auto *result = get_if<execution_result>(&o);
        if (!result) throw internal_error("expected an execution result");
        return *result;
    }
};

TEST_F(ExecutorTest, UnreachableEngineFailsClosed) {
    EXPECT_CALL(docker, ping(_)).WillRepeatedly(Throw(engine_error("Cannot connect to the Docker daemon")));
    EXPECT_CALL(docker, run(_, _)).Times(0);
    EXPECT_CALL(docker, image_exists(_)).Times(0);

    outcome o = executor.execute(execution_request::create("print(1)"));
    auto *u = get_if<unavailable>(&o);
    ASSERT_NE(u, nullptr);
    EXPECT_EQ(u->reason, "Code execution service is unavailable: Cannot connect to the Docker daemon");
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ExecutorTest, EmptyCodeIsRejected) {
    EXPECT_CALL(docker, run(_, _)).Times(0);
    for (string code : {"", "   \n\t  "}) {
        auto result = execute(execution_request::create(code));
        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error_type, error_type::EXECUTION);
        EXPECT_EQ(result.error, "No code provided");
    }
}

TEST_F(ExecutorTest, UnsupportedLanguageIsRejected) {
    EXPECT_CALL(docker, run(_, _)).Times(0);
    auto result = execute(execution_request::create("puts 1", "ruby"));
    EXPECT_EQ(result.error_type, error_type::EXECUTION);
    EXPECT_EQ(result.error, "Unsupported language: ruby");
}

TEST_F(ExecutorTest, UnsafeCodeNeverReachesEngine) {
    EXPECT_CALL(docker, run(_, _)).Times(0);
    auto result = execute(execution_request::create("import os\nos.system('id')"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, error_type::SECURITY);
    EXPECT_EQ(result.error, "Code contains unsafe operations");
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0], "Potentially unsafe pattern detected: import os");
}

TEST_F(ExecutorTest, SuccessfulResultIsCached) {
    EXPECT_CALL(docker, run(_, _)).Times(1);

    auto first = execute(execution_request::create("x = 1\nprint(x)\n"));
    EXPECT_TRUE(first.success);
    EXPECT_FALSE(first.from_cache);

    auto second = execute(execution_request::create("x = 1\r\nprint(x)\r\n"));
    EXPECT_TRUE(second.success);
    EXPECT_TRUE(second.from_cache);
    EXPECT_EQ(second.stdout_text, first.stdout_text);
}

TEST_F(ExecutorTest, CacheCanBeBypassed) {
    EXPECT_CALL(docker, run(_, _)).Times(2);
    auto request = execution_request::create("print('ok')", "python", {}, 30, DEFAULT_MEMORY_LIMIT, false);
    EXPECT_FALSE(execute(request).from_cache);
    EXPECT_FALSE(execute(request).from_cache);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ExecutorTest, FailuresAreNotCached) {
    docker.set_defaults(R"({"success": false, "error": "NameError: name 'x' is not defined"})");
    EXPECT_CALL(docker, run(_, _)).Times(2);
    execute(execution_request::create("print(x)"));
    auto result = execute(execution_request::create("print(x)"));
    EXPECT_FALSE(result.from_cache);
    EXPECT_EQ(result.error_type, error_type::EXECUTION);
}

TEST_F(ExecutorTest, ScoreIsComputed) {
    docker.set_defaults(R"({
        "success": true,
        "test_results": [
            {"name": "a", "passed": true},
            {"name": "b", "passed": true},
            {"name": "c", "passed": true},
            {"name": "d", "passed": false}
        ]
    })");
    auto result = execute(execution_request::create("def f(): pass"));
    EXPECT_EQ(result.summary.passed_tests, 3);
    EXPECT_EQ(result.summary.total_tests, 4);
    EXPECT_EQ(result.summary.score, 75);
}

TEST_F(ExecutorTest, GradedSubmissionsBypassCache) {
    EXPECT_CALL(docker, run(_, _)).Times(2);
    auto first = executor.grade("print('ok')", {});
    auto second = executor.grade("print('ok')", {});
    ASSERT_TRUE(holds_alternative<graded_submission>(first));
    ASSERT_TRUE(holds_alternative<graded_submission>(second));
    EXPECT_FALSE(get<graded_submission>(second).result.from_cache);
    EXPECT_EQ(get<graded_submission>(first).status, attempt_status::PASSED);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ExecutorTest, GradeLeavesAttemptPendingWhenUnavailable) {
    EXPECT_CALL(docker, ping(_)).WillOnce(Throw(engine_error("daemon down")));
    submission_attempt attempt;
    auto graded = executor.grade(attempt, "print(1)", {});
    EXPECT_TRUE(holds_alternative<unavailable>(graded));
    EXPECT_EQ(attempt.status(), attempt_status::PENDING);
}

TEST_F(ExecutorTest, GradeRecordsTerminalState) {
    docker.set_defaults(R"({
        "success": true,
        "test_results": [
            {"name": "a", "passed": true},
            {"name": "b", "passed": false, "expected": "2", "actual": "3"}
        ]
    })");
    submission_attempt attempt;
    auto graded = executor.grade(attempt, "def f(): pass", {});
    ASSERT_TRUE(holds_alternative<graded_submission>(graded));
    auto &submission = get<graded_submission>(graded);
    EXPECT_EQ(submission.status, attempt_status::FAILED);
    EXPECT_EQ(attempt.status(), attempt_status::FAILED);
    EXPECT_NE(submission.feedback.find("Your solution passed 1 out of 2 test cases."), string::npos);
}

TEST_F(ExecutorTest, GradeReportsTimeout) {
    EXPECT_CALL(docker, wait(_, _)).WillOnce(Return(wait_result{true, -1}));
    submission_attempt attempt;
    auto graded = executor.grade(attempt, "while True: pass", {}, 2);
    ASSERT_TRUE(holds_alternative<graded_submission>(graded));
    EXPECT_EQ(attempt.status(), attempt_status::TIMEOUT);
}

TEST_F(ExecutorTest, GradeKeepsRequestLimits) {
    container_spec spec;
    EXPECT_CALL(docker, run(_, _)).WillOnce(SaveArg<0>(&spec));
    auto request = execution_request::create("print('ok')", "python", {}, 10, 64LL << 20, true, true);
    auto graded = executor.grade(request);
    ASSERT_TRUE(holds_alternative<graded_submission>(graded));
    EXPECT_EQ(spec.memory_limit, 64LL << 20);
    EXPECT_EQ(spec.env.at("MEMORY_LIMIT"), to_string(64LL << 20));
    EXPECT_EQ(spec.env.at("TIME_LIMIT"), "10");
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ExecutorTest, GradeRejectsUnsupportedLanguage) {
    EXPECT_CALL(docker, run(_, _)).Times(0);
    submission_attempt attempt;
    auto graded = executor.grade(attempt, execution_request::create("console.log(1)", "javascript", {}, 10, DEFAULT_MEMORY_LIMIT, false, true));
    ASSERT_TRUE(holds_alternative<graded_submission>(graded));
    auto &submission = get<graded_submission>(graded);
    EXPECT_EQ(submission.result.error_type, error_type::EXECUTION);
    EXPECT_EQ(submission.result.error, "Unsupported language: javascript");
    EXPECT_EQ(attempt.status(), attempt_status::FAILED);
}

TEST_F(ExecutorTest, ConcurrentRequestsAreIsolated) {
    mutex mut;
    map<string, string> code_by_container;
    ON_CALL(docker, run(_, _)).WillByDefault(Invoke([&](const container_spec &spec, chrono::milliseconds) {
        lock_guard<mutex> guard(mut);
        code_by_container[spec.name] = spec.env.at("CODE");
    }));
    ON_CALL(docker, logs(_, _)).WillByDefault(Invoke([&](const string &name, chrono::milliseconds) {
        lock_guard<mutex> guard(mut);
        nlohmann::json output = {{"success", true}, {"stdout", code_by_container.at(name)}};
        return output.dump();
    }));

    constexpr int N = 8;
    vector<string> outputs(N);
    vector<thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([this, i, &outputs] {
            outputs[i] = execute(execution_request::create(fmt::format("print({})", i))).stdout_text;
        });
    }
    for (auto &t : threads) t.join();

    for (int i = 0; i < N; ++i)
        EXPECT_EQ(outputs[i], fmt::format("print({})", i));
    EXPECT_EQ(code_by_container.size(), (size_t)N);
    EXPECT_EQ(executor.in_flight(), 0);
}
