#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sandbox::engine {

/**
 * @brief tmpfs 挂载点
 */
struct tmpfs_mount {
    std::string path;

    /**
     * @brief 挂载大小，比如 100m
     */
    std::string size;

    /**
     * @brief 挂载选项，比如 noexec,nosuid
     */
    std::string options = "noexec,nosuid";
};

/**
 * @brief 启动一个沙箱容器所需的全部参数
 */
struct container_spec {
    /**
     * @brief 容器名，由调用方保证唯一
     */
    std::string name;

    std::string image;

    /**
     * @brief 内存上限（字节），交换空间上限与之相同，即禁止使用 swap
     */
    long long memory_limit = 0;

    /**
     * @brief CPU 份额，可以是小数
     */
    double cpu_limit = 0.5;

    /**
     * @brief 容器内进程数上限，由 pids cgroup 按容器计数
     * 不使用 nproc ulimit，它按 uid 在整台主机上共享计数
     */
    int pids_limit = 50;

    /**
     * @brief nofile ulimit 的软硬上限
     */
    int nofile_limit = 1024;

    /**
     * @brief 容器内运行程序的用户，格式为 uid:gid
     */
    std::string user;

    bool network_disabled = true;

    bool read_only_root = true;

    std::vector<tmpfs_mount> tmpfs;

    /**
     * @brief 在丢弃全部 capability 之后重新加回的 capability
     */
    std::vector<std::string> cap_add;

    /**
     * @brief 注入容器的环境变量
     * 这些变量通过引擎客户端进程自身的环境传递，不会出现在命令行参数中
     */
    std::map<std::string, std::string> env;

    std::map<std::string, std::string> labels;
};

/**
 * @brief 等待容器结束的结果
 */
struct wait_result {
    /**
     * @brief 容器是否在等待期限内没有结束
     */
    bool timed_out = false;

    /**
     * @brief 容器主进程的退出码，超时时为 -1
     */
    int exit_code = -1;
};

/**
 * @brief 容器结束后由引擎报告的状态
 */
struct container_state {
    bool running = false;

    /**
     * @brief 容器是否被 OOM killer 终止
     */
    bool oom_killed = false;

    int exit_code = -1;
};

/**
 * @brief 容器列表中的一项
 */
struct container_info {
    std::string name;

    /**
     * @brief 创建时间标签，标签缺失或者无法解析时为空
     */
    std::optional<std::time_t> created;
};

/**
 * @brief 容器引擎的诊断信息
 */
struct engine_info {
    bool available = false;

    std::string server_version;

    int containers_running = 0;

    int images = 0;

    long long total_memory = 0;

    int cpus = 0;

    /**
     * @brief 引擎不可用时的错误信息
     */
    std::string error;
};

void to_json(nlohmann::json &j, const engine_info &info);

/**
 * @brief 表示一个容器引擎
 * 所有操作失败时抛出 engine_error。
 * 实现必须是线程安全的，多个沙箱会话会并发地调用同一个引擎。
 * 带 timeout 参数的操作超过期限时同样抛出 engine_error。
 */
struct container_engine {
    virtual ~container_engine();

    /**
     * @brief 检查引擎是否可达，不产生任何副作用
     * @param timeout 探测的最长时间
     */
    virtual void ping(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 获取引擎的诊断信息，引擎不可用时返回 available = false 而不是抛出异常
     */
    virtual engine_info info(std::chrono::milliseconds timeout) = 0;

    virtual bool image_exists(const std::string &image) = 0;

    /**
     * @brief 从构建上下文目录构建镜像
     * @param image 镜像名
     * @param context 包含 Dockerfile 的目录
     * @param timeout 构建允许的最长时间
     */
    virtual void build_image(const std::string &image, const std::filesystem::path &context, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 以后台模式启动一个容器
     */
    virtual void run(const container_spec &spec, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 阻塞等待容器结束，最多等待 timeout
     */
    virtual wait_result wait(const std::string &name, std::chrono::milliseconds timeout) = 0;

    virtual container_state inspect(const std::string &name, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 获取容器的标准输出
     */
    virtual std::string logs(const std::string &name, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 强制终止容器内的整个进程树
     */
    virtual void kill(const std::string &name, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 强制删除容器，容器不存在时不视为错误
     */
    virtual void remove(const std::string &name, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 列出名字以 prefix 开头的容器（包括已经结束的）
     * 引擎的过滤条件可能比前缀匹配更宽松，调用方需要自行检查
     */
    virtual std::vector<container_info> list(const std::string &prefix) = 0;
};

}  // namespace sandbox::engine
