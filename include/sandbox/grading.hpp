#pragma once

#include <string>
#include <variant>
#include "common/status.hpp"
#include "sandbox/result.hpp"

namespace sandbox {

/**
 * @brief 一次评分提交的状态机
 * pending -> running -> {passed, failed, error, timeout, memory_exceeded}
 * 终态不会再发生转移，非法的转移抛出 internal_error。
 */
struct submission_attempt {
    attempt_status status() const;

    /**
     * @brief 进入 running 状态
     */
    void start();

    /**
     * @brief 根据执行结果进入终态
     * @param result 沙箱执行结果，summary 已经计算
     * @param pass_threshold 视为通过的最低分数
     * @return 进入的终态
     */
    attempt_status finish(const execution_result &result, int pass_threshold);

    /**
     * @brief 执行结果对应的终态
     * timeout -> TIMEOUT, memory -> MEMORY_EXCEEDED, system -> ERROR,
     * security 和 execution -> FAILED, 成功时按得分是否达到通过线决定 PASSED 或 FAILED
     */
    static attempt_status classify(const execution_result &result, int pass_threshold);

private:
    attempt_status current = attempt_status::PENDING;

    void transition(attempt_status next);
};

/**
 * @brief 评分完成的提交
 */
struct graded_submission {
    attempt_status status = attempt_status::PENDING;

    execution_result result;

    /**
     * @brief 给学生看的反馈
     */
    std::string feedback;
};

/**
 * @brief 评分结果：沙箱不可用时返回 unavailable，提交保持 pending，调用方可以稍后重试
 */
using grading_outcome = std::variant<graded_submission, unavailable>;

void to_json(nlohmann::json &j, const graded_submission &graded);
void to_json(nlohmann::json &j, const grading_outcome &o);

/**
 * @brief 生成给学生看的反馈，最多列出前三个失败的测试用例
 */
std::string render_feedback(const execution_result &result, attempt_status status);

}  // namespace sandbox
