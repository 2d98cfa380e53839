#pragma once

#include <optional>
#include <string>

namespace sandbox {

/**
 * @brief 表示一次代码执行的失败类型
 * 沙箱协议中以小写字符串传输，见 to_string / parse_error_type
 */
enum class error_type {
    /**
     * @brief 执行成功，没有错误
     */
    NONE = 0,

    /**
     * @brief 用户程序运行时间超出限制，容器被强制终止
     */
    TIMEOUT = 1,

    /**
     * @brief 用户程序运行内存超限
     * 容器被 OOM killer 终止，或者以 137（SIGKILL）退出
     */
    MEMORY = 2,

    /**
     * @brief 代码被安全预检或者沙箱内的安全限制拒绝
     */
    SECURITY = 3,

    /**
     * @brief 沙箱子系统出错
     * 比如镜像构建失败、容器启动失败、结果文档不符合协议
     * 这不是用户代码的问题，应当作为服务故障展示给用户
     */
    SYSTEM = 4,

    /**
     * @brief 用户代码自身出错（抛出异常、非零退出）
     */
    EXECUTION = 5
};

/**
 * @brief 协议中使用的字符串表示
 */
const char *to_string(error_type type);

/**
 * @brief 解析协议中的 error_type 字符串，未知的字符串返回 nullopt
 */
std::optional<error_type> parse_error_type(const std::string &text);

/**
 * @brief 评分提交的状态
 * PENDING 和 RUNNING 是暂态，其余为终态，终态之间不会再发生转移
 */
enum class attempt_status {
    /**
     * @brief 提交还未开始执行
     * 沙箱不可用时提交会停留在这个状态，以便调用方稍后重试
     */
    PENDING = 0,

    /**
     * @brief 提交正在沙箱中执行
     */
    RUNNING = 1,

    /**
     * @brief 得分不低于通过线
     */
    PASSED = 2,

    /**
     * @brief 得分低于通过线，或者用户代码出错、被安全检查拒绝
     */
    FAILED = 3,

    /**
     * @brief 沙箱子系统出错，与用户代码无关
     */
    ERROR = 4,

    TIMEOUT = 5,

    MEMORY_EXCEEDED = 6
};

const char *get_display_message(attempt_status);

bool is_terminal(attempt_status);

}  // namespace sandbox
