#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "common/utils.hpp"
#include "engine/container_engine.hpp"

namespace sandbox::engine {

/**
 * @brief 执行外部命令的抽象
 * 引擎客户端的所有调用都经过这里，测试时替换为 mock 以检查参数而不真正启动进程
 */
struct command_runner {
    virtual ~command_runner();

    /**
     * @brief 执行外部命令并等待其结束
     * @param env 额外传给子进程的环境变量
     * @param argv 命令及其参数
     * @param timeout 命令允许运行的最长时间，超时后命令会被强制终止
     */
    virtual process_result run(const std::map<std::string, std::string> &env,
                               const std::vector<std::string> &argv,
                               std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief 通过 fork/exec 真正执行外部命令
 */
struct system_command_runner : public command_runner {
    process_result run(const std::map<std::string, std::string> &env,
                       const std::vector<std::string> &argv,
                       std::chrono::milliseconds timeout) override;
};

/**
 * @brief 通过 docker 命令行客户端操作容器
 */
struct docker_engine : public container_engine {
    /**
     * @param runner 执行 docker 客户端的方式，调用方保证其生命周期长于 docker_engine
     * @param binary docker 客户端的路径
     */
    explicit docker_engine(command_runner &runner, const std::string &binary = "docker");

    void ping(std::chrono::milliseconds timeout) override;
    engine_info info(std::chrono::milliseconds timeout) override;
    bool image_exists(const std::string &image) override;
    void build_image(const std::string &image, const std::filesystem::path &context, std::chrono::milliseconds timeout) override;
    void run(const container_spec &spec, std::chrono::milliseconds timeout) override;
    wait_result wait(const std::string &name, std::chrono::milliseconds timeout) override;
    container_state inspect(const std::string &name, std::chrono::milliseconds timeout) override;
    std::string logs(const std::string &name, std::chrono::milliseconds timeout) override;
    void kill(const std::string &name, std::chrono::milliseconds timeout) override;
    void remove(const std::string &name, std::chrono::milliseconds timeout) override;
    std::vector<container_info> list(const std::string &prefix) override;

    /**
     * @brief 构造 docker run 的参数（不含 docker 本身）
     * 环境变量只以 -e NAME 的形式出现，值通过客户端进程的环境传递
     */
    static std::vector<std::string> build_run_arguments(const container_spec &spec);

private:
    command_runner &runner;
    std::string binary;

    /**
     * @brief 执行 docker 子命令，失败（无法启动、超时、非零退出）时抛出 engine_error
     */
    process_result invoke(const std::vector<std::string> &args,
                          std::chrono::milliseconds timeout,
                          const std::map<std::string, std::string> &env = {});

    process_result invoke_unchecked(const std::vector<std::string> &args,
                                    std::chrono::milliseconds timeout,
                                    const std::map<std::string, std::string> &env = {});
};

}  // namespace sandbox::engine
