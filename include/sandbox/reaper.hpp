#pragma once

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <mutex>
#include <thread>
#include "engine/container_engine.hpp"

namespace sandbox {

/**
 * @brief 回收残留的沙箱容器
 * 正常情况下会话会删除自己的容器，回收器只处理进程崩溃等情况下遗留的容器。
 * 只会删除名字带有 CONTAINER_PREFIX 前缀且创建时间早于 max_age 的容器。
 */
struct stale_sandbox_reaper {
    using clock_type = std::function<std::time_t()>;

    stale_sandbox_reaper(engine::container_engine &backend, std::chrono::seconds max_age, clock_type clock = [] { return std::time(nullptr); });
    ~stale_sandbox_reaper();

    /**
     * @brief 执行一次回收，可以重复调用
     * @return 删除的容器数
     */
    size_t sweep();

    /**
     * @brief 启动后台线程，每隔 interval 执行一次回收
     */
    void start(std::chrono::seconds interval);

    /**
     * @brief 停止后台线程并等待其退出
     */
    void stop();

private:
    engine::container_engine &backend;
    std::chrono::seconds max_age;
    clock_type clock;

    std::thread worker;
    std::mutex mut;
    std::condition_variable cond;
    bool stopping = false;
};

}  // namespace sandbox
