#pragma once

#include <atomic>
#include <string>
#include <vector>
#include "config.hpp"
#include "sandbox/availability.hpp"
#include "sandbox/cache.hpp"
#include "sandbox/grading.hpp"
#include "sandbox/orchestrator.hpp"
#include "sandbox/request.hpp"
#include "sandbox/result.hpp"

namespace sandbox {

/**
 * @brief 代码执行的入口
 * 依次经过可用性探测、缓存查找、安全预检、沙箱执行、结果解析、评分和缓存写入。
 * 不存在全局实例，由 main 构造并以引用传给调用方。
 */
struct code_executor {
    code_executor(availability_gate &gate, sandbox_orchestrator &orchestrator, execution_cache &cache, const sandbox_config &config);

    /**
     * @brief 执行一个请求
     * @return 容器引擎不可达时返回 unavailable，此时代码既没有被检查也没有被执行
     */
    outcome execute(const execution_request &request);

    /**
     * @brief 评分执行，总是绕过缓存
     * 请求的语言和内存限制照常生效，不支持的语言得到 EXECUTION 错误并判为 failed。
     * 沙箱不可用时 attempt 保持 pending 并返回 unavailable
     * @param attempt 提交的状态机，必须处于 pending 状态
     */
    grading_outcome grade(submission_attempt &attempt, const execution_request &request);

    grading_outcome grade(const execution_request &request);

    /**
     * @brief 以 python 和默认内存限制评分一段代码
     */
    grading_outcome grade(submission_attempt &attempt, const std::string &code, const std::vector<test_case_spec> &test_cases, int time_limit = GRADED_TIME_LIMIT);

    grading_outcome grade(const std::string &code, const std::vector<test_case_spec> &test_cases, int time_limit = GRADED_TIME_LIMIT);

    /**
     * @brief 正在执行的请求数
     */
    int in_flight() const;

    /**
     * @brief 支持的语言
     */
    static bool is_supported_language(const std::string &language);

private:
    availability_gate &gate;
    sandbox_orchestrator &orchestrator;
    execution_cache &cache;
    const sandbox_config &config;
    std::atomic<int> running{0};

    /**
     * @brief 在确认引擎可达之后执行请求
     */
    execution_result run_available(const execution_request &request);
};

}  // namespace sandbox
