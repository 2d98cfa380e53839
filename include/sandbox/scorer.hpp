#pragma once

#include "sandbox/result.hpp"

namespace sandbox {

/**
 * @brief 统计测试用例的通过情况并计算得分
 * 有测试用例时 score = round(100 * passed / total)；
 * 没有测试用例时，执行成功得 100 分，否则 0 分。
 */
score_summary score_results(const execution_result &result);

/**
 * @brief 得分是否达到通过线
 */
bool is_passing(const score_summary &summary, int pass_threshold);

}  // namespace sandbox
