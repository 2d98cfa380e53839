#include <nlohmann/json.hpp>
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/protocol.hpp"
#include "sandbox/scorer.hpp"

using namespace std;
using namespace sandbox;

/**
 * 在宿主机上直接运行容器内的 runner.py，检查它输出的文档能被 decode_result 和 score_results 正确处理
 */
class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = exec_program_capture({}, {"python3", "--version"}, chrono::seconds(10));
        if (result.exit_code != 0)
            GTEST_SKIP() << "python3 is not available";
    }

    static process_result run_runner(const string &code, const nlohmann::json &tests, int time_limit) {
        return exec_program_capture({{"CODE", code}, {"TEST_CASES", tests.dump()}, {"TIME_LIMIT", to_string(time_limit)}},
                                    {"python3", "-I", SANDBOX_RUNNER_PATH},
                                    chrono::seconds(time_limit + 10));
    }
};

TEST_F(RunnerTest, SuccessfulRunWithTests) {
    nlohmann::json tests = {{{"name", "square"}, {"test_code", "print(square(4))"}, {"expected_output", "16"}}};
    auto raw = run_runner("def square(x):\n    return x * x\nprint('defined')\n", tests, 5);
    ASSERT_EQ(raw.exit_code, 0) << raw.err;

    auto result = decode_result(raw.out);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.error_type, error_type::NONE);
    EXPECT_EQ(result.stdout_text, "defined\n");
    ASSERT_EQ(result.test_results.size(), 1u);
    EXPECT_EQ(result.test_results[0].name, "square");
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_EQ(result.test_results[0].actual, "16");

    auto summary = score_results(result);
    EXPECT_EQ(summary.passed_tests, 1);
    EXPECT_EQ(summary.total_tests, 1);
    EXPECT_EQ(summary.score, 100);
}

TEST_F(RunnerTest, FailingBareRunStillRunsTests) {
    nlohmann::json tests = {{{"test_code", "print(double(3))"}, {"expected_output", "6"}},
                            {{"test_code", "print(double(4))"}, {"expected_output", "8"}}};
    auto raw = run_runner("def double(x):\n    return x * 2\nprint(undefined_name)\n", tests, 5);
    ASSERT_EQ(raw.exit_code, 0) << raw.err;

    auto result = decode_result(raw.out);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, error_type::EXECUTION);
    EXPECT_NE(result.error.find("NameError"), string::npos) << result.error;
    ASSERT_EQ(result.test_results.size(), 2u);
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_TRUE(result.test_results[1].passed);

    auto summary = score_results(result);
    EXPECT_EQ(summary.total_tests, 2);
    EXPECT_EQ(summary.passed_tests, 2);
}

TEST_F(RunnerTest, InputOnlyTestComparesProgramOutput) {
    nlohmann::json tests = {{{"input", "3\n"}, {"expected_output", "6"}},
                            {{"input", "5\n"}, {"expected_output", "11"}}};
    auto raw = run_runner("n = int(input())\nprint(n * 2)\n", tests, 5);
    ASSERT_EQ(raw.exit_code, 0) << raw.err;

    auto result = decode_result(raw.out);
    ASSERT_EQ(result.test_results.size(), 2u);
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_EQ(result.test_results[0].actual, "6");
    EXPECT_FALSE(result.test_results[1].passed);
    EXPECT_EQ(result.test_results[1].actual, "10");

    auto summary = score_results(result);
    EXPECT_EQ(summary.passed_tests, 1);
    EXPECT_EQ(summary.total_tests, 2);
}

TEST_F(RunnerTest, TestsShareTimeLimit) {
    nlohmann::json tests = nlohmann::json::array();
    for (int i = 0; i < 3; ++i)
        tests.push_back({{"test_code", "import time\ntime.sleep(1.5)\nprint('done')"}, {"expected_output", "done"}});

    elapsed_time timer;
    auto raw = run_runner("print('ready')\n", tests, 2);
    ASSERT_EQ(raw.exit_code, 0) << raw.err;
    // 文档必须在 TIME_LIMIT 加上少量开销之内输出，不能等每个测试各自超时
    EXPECT_LT(timer.seconds(), 3.5);

    auto result = decode_result(raw.out);
    ASSERT_EQ(result.test_results.size(), 3u);
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_FALSE(result.test_results[1].passed);
    EXPECT_NE(result.test_results[1].error.find("timed out"), string::npos) << result.test_results[1].error;
    EXPECT_FALSE(result.test_results[2].passed);
    EXPECT_NE(result.test_results[2].error.find("Not run"), string::npos) << result.test_results[2].error;

    auto summary = score_results(result);
    EXPECT_EQ(summary.total_tests, 3);
    EXPECT_EQ(summary.passed_tests, 1);
}

TEST_F(RunnerTest, BareRunTimeoutSkipsTests) {
    nlohmann::json tests = {{{"test_code", "print(1)"}, {"expected_output", "1"}}};
    auto raw = run_runner("while True:\n    pass\n", tests, 1);
    ASSERT_EQ(raw.exit_code, 0) << raw.err;

    auto result = decode_result(raw.out);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, error_type::TIMEOUT);
    EXPECT_TRUE(result.test_results.empty());
}
