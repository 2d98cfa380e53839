#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>
#include "common/status.hpp"

namespace sandbox {

/**
 * @brief 单个测试用例的执行结果
 */
struct test_result {
    std::string name;

    bool passed = false;

    std::string expected;

    std::string actual;

    /**
     * @brief 测试用例的运行时间（秒）
     */
    double time = 0;

    /**
     * @brief 测试用例执行出错时的错误信息
     */
    std::string error;
};

/**
 * @brief 测试用例的统计结果
 */
struct score_summary {
    int passed_tests = 0;

    int total_tests = 0;

    /**
     * @brief 百分制得分
     */
    int score = 0;
};

/**
 * @brief 一次代码执行的结果
 */
struct execution_result {
    bool success = false;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 给用户看的错误描述
     */
    std::string error;

    /**
     * @brief 运行时间（秒）
     */
    double execution_time = 0;

    /**
     * @brief 内存用量（字节）
     */
    long long memory_used = 0;

    sandbox::error_type error_type = sandbox::error_type::NONE;

    std::vector<test_result> test_results;

    score_summary summary;

    /**
     * @brief 安全预检发现的问题
     */
    std::vector<std::string> issues;

    /**
     * @brief 沙箱会话的 id，缓存命中时为原始执行的 id
     */
    std::string execution_id;

    bool from_cache = false;
};

void to_json(nlohmann::json &j, const test_result &result);
void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 表示容器引擎不可达，请求中的代码没有被执行
 * 这与执行失败不同，调用方应当提示服务不可用并允许重试
 */
struct unavailable {
    std::string reason;
};

void to_json(nlohmann::json &j, const unavailable &u);

/**
 * @brief 一次执行请求的结果：要么在沙箱中执行完成，要么沙箱不可用
 * 不存在在沙箱之外执行代码的第三种可能
 */
using outcome = std::variant<execution_result, unavailable>;

void to_json(nlohmann::json &j, const outcome &o);

/**
 * @brief 构造一个失败结果
 */
execution_result make_failure(sandbox::error_type type, const std::string &error);

}  // namespace sandbox
