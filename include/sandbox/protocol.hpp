#pragma once

#include <string>
#include "sandbox/result.hpp"

namespace sandbox {

/**
 * @brief 附加到诊断信息中的原始输出的最大字节数
 */
constexpr size_t RAW_OUTPUT_EXCERPT_LIMIT = 4096;

/**
 * @brief 解析沙箱在标准输出上输出的结果文档
 *
 * 沙箱退出时必须恰好输出一个 JSON 对象（首尾空白忽略）：
 * {success: bool, stdout?: string, stderr?: string, execution_time?: number,
 *  memory_used?: number, error_type?: string, error?: string, test_results?: array}
 *
 * 不符合协议的输出（为空、不是 JSON、有多余内容、字段类型错误、未知的 error_type）
 * 一律返回 SYSTEM 类型的失败结果，stderr 中附带原始输出的片段。
 * test_results 中单个格式错误的条目只会使该测试用例失败，不影响其他测试用例。
 *
 * 这是沙箱和编排器之间的信任边界，该函数不会抛出异常。
 */
execution_result decode_result(const std::string &raw_stdout) noexcept;

}  // namespace sandbox
