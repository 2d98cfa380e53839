#pragma once

#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "sandbox/request.hpp"
#include "sandbox/result.hpp"

namespace sandbox {

/**
 * @brief 缓存键的前缀
 */
constexpr const char *CACHE_KEY_PREFIX = "code_execution:";

/**
 * @brief 执行结果缓存
 * 以 (代码, 测试用例) 的摘要为键缓存成功的执行结果，条目在固定的有效期后过期。
 * 条目数超过上限时淘汰最早写入的条目。
 * 并发的缓存未命中会导致重复执行，最后写入的结果生效。
 */
struct execution_cache {
    using clock_type = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @param ttl 条目的有效期
     * @param capacity 最大条目数
     * @param clock 时钟，测试中可以替换以模拟过期
     */
    execution_cache(std::chrono::seconds ttl, size_t capacity, clock_type clock = std::chrono::steady_clock::now);

    /**
     * @brief 计算缓存键
     * 代码和测试用例中的 CRLF 统一为 LF，测试用例按键排序序列化为 JSON 后计算 SHA-256
     * 时间和内存限制不参与缓存键
     */
    static std::string key(const std::string &code, const std::vector<test_case_spec> &test_cases);

    /**
     * @brief 查找未过期的缓存条目，命中时返回的结果 from_cache 为 true
     */
    std::optional<execution_result> get(const std::string &key);

    /**
     * @brief 写入缓存，失败的执行结果会被忽略
     * @return 是否写入了缓存
     */
    bool put(const std::string &key, const execution_result &result);

    /**
     * @brief 删除所有过期的条目
     * @return 删除的条目数
     */
    size_t erase_expired();

    size_t size() const;

private:
    struct entry {
        execution_result result;
        std::chrono::steady_clock::time_point expires;
        std::list<std::string>::iterator order;
    };

    std::chrono::seconds ttl;
    size_t capacity;
    clock_type clock;

    mutable std::mutex mut;
    std::unordered_map<std::string, entry> entries;

    /**
     * @brief 按写入时间排序的键，队首最早写入
     */
    std::list<std::string> insertion_order;

    void erase(std::unordered_map<std::string, entry>::iterator it);
};

}  // namespace sandbox
