#pragma once

#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 安全预检的结果
 */
struct safety_report {
    bool safe = true;

    /**
     * @brief 检测到的危险模式，每项一条描述
     */
    std::vector<std::string> issues;

    std::vector<std::string> warnings;
};

/**
 * @brief 对源代码进行静态的黑名单扫描
 * 这只是纵深防御的一层，用于在启动容器之前拒绝明显恶意的代码，真正的隔离边界是沙箱本身。
 * 调用方不能通过任何参数跳过这个检查。
 * @param code 用户提交的源代码
 * @param language 目标语言，未知语言没有黑名单
 */
safety_report check_code_safety(const std::string &code, const std::string &language);

/**
 * @brief 获取某个语言的黑名单，未知语言返回空列表
 */
const std::vector<std::string> &unsafe_patterns(const std::string &language);

}  // namespace sandbox
