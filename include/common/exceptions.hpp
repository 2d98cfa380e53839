#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sandbox {

/**
 * @brief 沙箱子系统所有异常的基类
 * 构造时记录调用栈，输出到流时会附带调用栈，便于定位编排过程中的错误
 */
struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    template <typename T>
    sandbox_exception operator<<(const T &t) const {
        return sandbox_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱子系统的内部错误
 * 比如状态机出现非法转移、镜像构建上下文缺失
 */
struct internal_error : public sandbox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示容器引擎的调用失败
 * 引擎客户端无法启动、返回非零退出码或者超时
 */
struct engine_error : public sandbox_exception {
    engine_error();
    explicit engine_error(const std::string &message);
};

/**
 * @brief 表示沙箱输出的结果文档不符合协议
 */
struct protocol_error : public sandbox_exception {
    protocol_error();
    explicit protocol_error(const std::string &message);
};

}  // namespace sandbox
