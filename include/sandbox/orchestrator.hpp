#pragma once

#include <chrono>
#include <string>
#include "config.hpp"
#include "engine/container_engine.hpp"
#include "sandbox/image.hpp"
#include "sandbox/request.hpp"
#include "sandbox/result.hpp"

namespace sandbox {

/**
 * @brief 一个沙箱会话，独占一个容器
 * 会话析构或者调用 destroy() 时强制删除容器，因此容器的生命周期不会超过一次调用。
 * 会话只能移动不能复制。
 *
 * 会话的全部引擎调用共享一个时间预算：从创建会话开始的 time_limit + grace_period。
 */
struct sandbox_session {
    sandbox_session(engine::container_engine &backend, int time_limit, long long memory_limit,
                    std::chrono::milliseconds grace_period);
    sandbox_session(sandbox_session &&other) noexcept;
    sandbox_session(const sandbox_session &) = delete;
    sandbox_session &operator=(const sandbox_session &) = delete;
    sandbox_session &operator=(sandbox_session &&) = delete;
    ~sandbox_session();

    /**
     * @brief 会话的唯一 id
     */
    const std::string &id() const;

    /**
     * @brief 容器名，为 CONTAINER_PREFIX + id
     */
    const std::string &container_name() const;

    std::chrono::steady_clock::time_point start_time() const;

    /**
     * @brief 时间预算的截止时刻
     */
    std::chrono::steady_clock::time_point deadline() const;

    /**
     * @brief 剩余的时间预算，已经耗尽时为 0
     */
    std::chrono::milliseconds remaining() const;

    int time_limit() const;

    long long memory_limit() const;

    /**
     * @brief 强制删除容器，可以重复调用
     * 使用剩余的时间预算，但至少 CLEANUP_TIMEOUT。删除失败只记录日志，残留的容器由回收器处理
     */
    void destroy() noexcept;

private:
    engine::container_engine *backend;
    std::string session_id;
    std::string name;
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point deadline_;
    int time_limit_;
    long long memory_limit_;
};

/**
 * @brief 沙箱编排器
 * 为每个请求启动一个一次性的受限容器，等待其结束（有时间上限），解析输出，并保证容器被删除。
 * 多个请求可以并发调用 run，会话之间不共享可变状态。
 */
struct sandbox_orchestrator {
    sandbox_orchestrator(engine::container_engine &backend, image_provisioner &images, const sandbox_config &config);

    /**
     * @brief 在沙箱中执行请求
     * 该函数不会抛出 sandbox_exception，编排过程中的错误都转换为 SYSTEM 类型的结果
     */
    execution_result run(const execution_request &request);

    /**
     * @brief 构造会话对应的容器参数
     */
    engine::container_spec make_spec(const sandbox_session &session, const execution_request &request) const;

private:
    engine::container_engine &backend;
    image_provisioner &images;
    const sandbox_config &config;

    execution_result run_container(sandbox_session &session, const execution_request &request);
};

}  // namespace sandbox
