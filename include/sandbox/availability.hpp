#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "engine/container_engine.hpp"

namespace sandbox {

/**
 * @brief 容器引擎的可用性探测
 * 引擎不可达时执行器直接返回 unavailable，请求中的代码不会被检查或执行。
 */
struct availability_gate {
    availability_gate(engine::container_engine &backend, std::chrono::milliseconds probe_timeout);

    /**
     * @brief 探测容器引擎是否可达，没有副作用
     * @return 引擎不可达时返回原因，可达时返回 nullopt
     */
    std::optional<std::string> probe();

    /**
     * @brief 获取容器引擎的诊断信息，供运维查看
     */
    engine::engine_info status();

private:
    engine::container_engine &backend;
    std::chrono::milliseconds probe_timeout;
};

}  // namespace sandbox
