#include "sandbox/grading.hpp"
#include <fmt/format.h>
#include <sstream>
#include "common/exceptions.hpp"
#include "sandbox/scorer.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

/**
 * @brief 反馈中最多列出的失败测试用例数
 */
static constexpr int MAX_FAILED_TESTS_SHOWN = 3;

attempt_status submission_attempt::status() const {
    return current;
}

void submission_attempt::start() {
    transition(attempt_status::RUNNING);
}

attempt_status submission_attempt::finish(const execution_result &result, int pass_threshold) {
    attempt_status next = classify(result, pass_threshold);
    transition(next);
    return next;
}

attempt_status submission_attempt::classify(const execution_result &result, int pass_threshold) {
    switch (result.error_type) {
        case error_type::TIMEOUT:
            return attempt_status::TIMEOUT;
        case error_type::MEMORY:
            return attempt_status::MEMORY_EXCEEDED;
        case error_type::SYSTEM:
            return attempt_status::ERROR;
        case error_type::SECURITY:
        case error_type::EXECUTION:
            return attempt_status::FAILED;
        case error_type::NONE:
            if (!result.success) return attempt_status::FAILED;
            return is_passing(result.summary, pass_threshold) ? attempt_status::PASSED : attempt_status::FAILED;
    }
    return attempt_status::ERROR;
}

void submission_attempt::transition(attempt_status next) {
    bool legal = false;
    switch (current) {
        case attempt_status::PENDING:
            legal = next == attempt_status::RUNNING;
            break;
        case attempt_status::RUNNING:
            legal = is_terminal(next);
            break;
        default:
            legal = false;
            break;
    }
    if (!legal)
        throw internal_error(fmt::format("illegal submission transition from {} to {}", get_display_message(current), get_display_message(next)));
    current = next;
}

void to_json(json &j, const graded_submission &graded) {
    j = graded.result;
    j["status"] = get_display_message(graded.status);
    j["is_correct"] = graded.status == attempt_status::PASSED;
    j["feedback"] = graded.feedback;
}

void to_json(json &j, const grading_outcome &o) {
    visit([&j](auto &&value) { to_json(j, value); }, o);
}

string render_feedback(const execution_result &result, attempt_status status) {
    const score_summary &summary = result.summary;
    if (status == attempt_status::PASSED) {
        if (summary.score == 100)
            return "Excellent work! Your solution passed all test cases.";
        return fmt::format("Good job! Your solution works for most cases ({}/{} tests passed).", summary.passed_tests, summary.total_tests);
    }

    stringstream ss;
    switch (status) {
        case attempt_status::TIMEOUT:
            ss << "Your solution took too long to run. Look for infinite loops or slow algorithms.";
            break;
        case attempt_status::MEMORY_EXCEEDED:
            ss << "Your solution used too much memory.";
            break;
        case attempt_status::ERROR:
            ss << "Your solution could not be evaluated because of a service error. Please try again later.";
            break;
        default:
            ss << "Your solution passed " << summary.passed_tests << " out of " << summary.total_tests << " test cases.";
            if (result.error_type == error_type::SECURITY)
                ss << "\nYour code uses operations that are not allowed.";
            else if (!result.error.empty())
                ss << "\nError: " << result.error;
            break;
    }

    int shown = 0;
    for (auto &test : result.test_results) {
        if (test.passed) continue;
        if (shown == MAX_FAILED_TESTS_SHOWN) break;
        if (shown++ == 0) ss << "\n\nFailed test cases:";
        if (!test.error.empty())
            ss << "\n- " << test.name << ": " << test.error;
        else
            ss << "\n- " << test.name << ": Expected '" << test.expected << "', got '" << test.actual << "'";
    }

    if (status == attempt_status::FAILED) {
        ss << "\n\nTips for improvement:"
           << "\n- Check your logic for edge cases"
           << "\n- Ensure your output format matches exactly"
           << "\n- Test your solution with the provided examples";
    }
    return ss.str();
}

}  // namespace sandbox
