#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "config.hpp"

namespace sandbox {

/**
 * @brief 一个测试用例
 * 测试用例由题目定义提供，在沙箱中于用户代码之后运行
 */
struct test_case_spec {
    /**
     * @brief 测试用例名，为空时沙箱内使用 "Test <序号>"
     */
    std::string name;

    /**
     * @brief 在用户代码之后执行的测试代码片段
     */
    std::string test_code;

    /**
     * @brief 测试代码的标准输入
     */
    std::string input;

    /**
     * @brief 期望的标准输出，比较时忽略首尾空白
     */
    std::string expected_output;

    /**
     * @brief 单个测试用例的时间限制（秒），0 表示使用整个请求的时间限制
     */
    int timeout = 0;
};

void from_json(const nlohmann::json &j, test_case_spec &test);
void to_json(nlohmann::json &j, const test_case_spec &test);

/**
 * @brief 一次代码执行请求
 * 只能通过 create 构造，构造时对时间和内存限制进行截断，构造后不可修改
 */
struct execution_request {
    /**
     * @brief 构造执行请求
     * @param code 用户提交的源代码
     * @param language 目标语言，目前只支持 python
     * @param test_cases 按顺序执行的测试用例
     * @param time_limit 时间限制（秒），会被截断到 [MIN_TIME_LIMIT, MAX_TIME_LIMIT]
     * @param memory_limit 内存限制（字节），会被截断到 [MIN_MEMORY_LIMIT, MAX_MEMORY_LIMIT]
     * @param use_cache 是否允许使用结果缓存
     * @param graded 是否是评分提交，评分提交总是绕过缓存
     */
    static execution_request create(std::string code,
                                    std::string language = "python",
                                    std::vector<test_case_spec> test_cases = {},
                                    long long time_limit = 30,
                                    long long memory_limit = DEFAULT_MEMORY_LIMIT,
                                    bool use_cache = true,
                                    bool graded = false);

    const std::string &code() const { return code_; }
    const std::string &language() const { return language_; }
    const std::vector<test_case_spec> &test_cases() const { return test_cases_; }
    int time_limit() const { return time_limit_; }
    long long memory_limit() const { return memory_limit_; }
    bool use_cache() const { return use_cache_; }
    bool graded() const { return graded_; }

private:
    execution_request() = default;

    std::string code_;
    std::string language_;
    std::vector<test_case_spec> test_cases_;
    int time_limit_ = 30;
    long long memory_limit_ = DEFAULT_MEMORY_LIMIT;
    bool use_cache_ = true;
    bool graded_ = false;
};

/**
 * @brief 从 JSON 文档构造执行请求，用于命令行的请求文件和标准输入
 * 格式：{code, language?, test_cases?, time_limit?, memory_limit? (MB), use_cache?, graded?}
 * @throw std::invalid_argument 缺少 code 或者字段类型错误
 */
execution_request parse_request(const nlohmann::json &j, bool graded);

/**
 * @brief 测试用例序列化为传给沙箱的 JSON，也作为缓存键的一部分
 */
nlohmann::json serialize_test_cases(const std::vector<test_case_spec> &test_cases);

}  // namespace sandbox
