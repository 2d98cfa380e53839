#include "gtest/gtest.h"
#include "sandbox/protocol.hpp"

using namespace std;
using namespace sandbox;

TEST(ProtocolTest, DecodesSuccessfulDocument) {
    auto result = decode_result(R"(
        {
            "success": true,
            "stdout": "5\n",
            "stderr": "",
            "execution_time": 0.25,
            "memory_used": 1048576,
            "error_type": "none",
            "test_results": [
                {"name": "adds", "passed": true, "expected": "5", "actual": "5", "time": 0.01},
                {"name": "negative", "passed": false, "expected": "-1", "actual": "1", "time": 0.02}
            ]
        }
    )");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.error_type, error_type::NONE);
    EXPECT_EQ(result.stdout_text, "5\n");
    EXPECT_DOUBLE_EQ(result.execution_time, 0.25);
    EXPECT_EQ(result.memory_used, 1048576);
    ASSERT_EQ(result.test_results.size(), 2u);
    EXPECT_EQ(result.test_results[0].name, "adds");
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_FALSE(result.test_results[1].passed);
    EXPECT_EQ(result.test_results[1].actual, "1");
}

TEST(ProtocolTest, MissingErrorTypeIsInferred) {
    EXPECT_EQ(decode_result(R"({"success": true})").error_type, error_type::NONE);
    EXPECT_EQ(decode_result(R"({"success": false, "error": "boom"})").error_type, error_type::EXECUTION);
}

TEST(ProtocolTest, ErrorTypesAreParsed) {
    EXPECT_EQ(decode_result(R"({"success": false, "error_type": "timeout"})").error_type, error_type::TIMEOUT);
    EXPECT_EQ(decode_result(R"({"success": false, "error_type": "memory"})").error_type, error_type::MEMORY);
    EXPECT_EQ(decode_result(R"({"success": false, "error_type": "security"})").error_type, error_type::SECURITY);
}

TEST(ProtocolTest, EmptyOutputIsSystemError) {
    auto result = decode_result("");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, error_type::SYSTEM);
    EXPECT_EQ(decode_result("   \n\t").error_type, error_type::SYSTEM);
}

TEST(ProtocolTest, NonJsonIsSystemErrorWithExcerpt) {
    auto result = decode_result("Traceback (most recent call last):\n  oops");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, error_type::SYSTEM);
    EXPECT_NE(result.stderr_text.find("Traceback"), string::npos);
}

TEST(ProtocolTest, TrailingDataIsRejected) {
    EXPECT_EQ(decode_result(R"({"success": true} {"success": true})").error_type, error_type::SYSTEM);
    EXPECT_EQ(decode_result(R"({"success": true} garbage)").error_type, error_type::SYSTEM);
}

TEST(ProtocolTest, WrongTypesAreRejected) {
    EXPECT_EQ(decode_result(R"([1, 2, 3])").error_type, error_type::SYSTEM);
    EXPECT_EQ(decode_result(R"({"success": "yes"})").error_type, error_type::SYSTEM);
    EXPECT_EQ(decode_result(R"({"stdout": "hi"})").error_type, error_type::SYSTEM);
    EXPECT_EQ(decode_result(R"({"success": true, "stdout": 42})").error_type, error_type::SYSTEM);
    EXPECT_EQ(decode_result(R"({"success": true, "execution_time": "fast"})").error_type, error_type::SYSTEM);
    EXPECT_EQ(decode_result(R"({"success": true, "test_results": {}})").error_type, error_type::SYSTEM);
}

TEST(ProtocolTest, UnknownErrorTypeIsRejected) {
    auto result = decode_result(R"({"success": false, "error_type": "segfault"})");
    EXPECT_EQ(result.error_type, error_type::SYSTEM);
    EXPECT_TRUE(result.test_results.empty());
}

TEST(ProtocolTest, MalformedTestEntryFailsOnlyThatTest) {
    auto result = decode_result(R"({
        "success": true,
        "test_results": [
            {"name": "good", "passed": true},
            "not an object",
            {"name": "bad", "passed": "maybe"}
        ]
    })");
    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.test_results.size(), 3u);
    EXPECT_TRUE(result.test_results[0].passed);
    EXPECT_FALSE(result.test_results[1].passed);
    EXPECT_EQ(result.test_results[1].name, "Test 2");
    EXPECT_FALSE(result.test_results[1].error.empty());
    EXPECT_FALSE(result.test_results[2].passed);
    EXPECT_EQ(result.test_results[2].name, "bad");
    EXPECT_NE(result.test_results[2].error.find("malformed"), string::npos);
}

TEST(ProtocolTest, InvalidUtf8IsSanitizedInExcerpt) {
    string raw = "not json \xff\xfe end";
    auto result = decode_result(raw);
    EXPECT_EQ(result.error_type, error_type::SYSTEM);
    EXPECT_EQ(result.stderr_text.find('\xff'), string::npos);
}

TEST(ProtocolTest, ExcerptIsBounded) {
    string raw(RAW_OUTPUT_EXCERPT_LIMIT * 4, 'x');
    auto result = decode_result(raw);
    EXPECT_EQ(result.error_type, error_type::SYSTEM);
    EXPECT_LE(result.stderr_text.size(), RAW_OUTPUT_EXCERPT_LIMIT);
}
