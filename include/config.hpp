#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace sandbox {

/**
 * @brief 时间限制的硬上限（秒）
 * 无论调用方传入什么值，都会被截断到这个上限，不可通过配置调大
 */
constexpr int MAX_TIME_LIMIT = 60;

/**
 * @brief 时间限制的下限（秒）
 */
constexpr int MIN_TIME_LIMIT = 1;

/**
 * @brief 评分提交的默认时间限制（秒）
 */
constexpr int GRADED_TIME_LIMIT = 30;

/**
 * @brief 内存限制的硬上限（字节），512MB
 */
constexpr long long MAX_MEMORY_LIMIT = 512LL * 1024 * 1024;

/**
 * @brief 内存限制的下限（字节），16MB
 * 太小的内存限制会导致解释器自身都无法启动
 */
constexpr long long MIN_MEMORY_LIMIT = 16LL * 1024 * 1024;

constexpr long long DEFAULT_MEMORY_LIMIT = 256LL * 1024 * 1024;

/**
 * @brief 会话的时间预算耗尽后，终止和删除容器仍然可以使用的时间
 */
constexpr std::chrono::milliseconds CLEANUP_TIMEOUT = std::chrono::seconds(2);

/**
 * @brief 回收器删除单个残留容器的超时时间
 */
constexpr std::chrono::milliseconds REAP_TIMEOUT = std::chrono::seconds(10);

/**
 * @brief 沙箱容器的命名前缀
 * 回收器只会删除带有这个前缀的容器
 */
constexpr const char *CONTAINER_PREFIX = "code-sandbox-";

/**
 * @brief 容器创建时间的标签名，值为 UNIX 时间戳（秒）
 */
constexpr const char *CREATED_LABEL = "code-sandbox.created";

/**
 * @brief 沙箱子系统的运行配置
 * 加载顺序：默认值 -> JSON 配置文件 -> 环境变量 -> 命令行参数
 */
struct sandbox_config {
    /**
     * @brief 容器引擎客户端的路径，默认从 PATH 中查找 docker
     */
    std::string engine_binary = "docker";

    /**
     * @brief 执行镜像的名称
     */
    std::string image_name = "code-sandbox-python-executor";

    /**
     * @brief 构建执行镜像所需的上下文目录，包含 Dockerfile
     * 默认为项目根目录下的 exec/python-executor
     */
    std::filesystem::path image_context;

    /**
     * @brief 存放镜像构建锁文件的目录
     * 多个进程同时首次调用时，通过该目录下的文件锁保证只有一个构建
     */
    std::filesystem::path state_dir = "/tmp/code-sandbox";

    /**
     * @brief 容器可以使用的 CPU 份额
     */
    double cpu_limit = 0.5;

    int pids_limit = 50;

    int nofile_limit = 1024;

    /**
     * @brief 选手程序在容器中运行的用户
     */
    std::string run_user = "1000:1000";

    /**
     * @brief 在 time_limit 之外额外允许的编排时间
     */
    std::chrono::seconds grace_period{5};

    /**
     * @brief 可用性探测的超时时间
     */
    std::chrono::seconds probe_timeout{5};

    /**
     * @brief 镜像构建的超时时间
     */
    std::chrono::seconds build_timeout{600};

    /**
     * @brief 结果缓存的有效期
     */
    std::chrono::seconds cache_ttl{300};

    /**
     * @brief 结果缓存的最大条目数，超出后淘汰最早写入的条目
     */
    size_t cache_capacity = 1024;

    /**
     * @brief 超过该时间的沙箱容器将被回收器删除
     */
    std::chrono::seconds reap_max_age{3600};

    /**
     * @brief 评分提交视为通过所需的最低分数
     */
    int pass_threshold = 80;
};

void from_json(const nlohmann::json &j, sandbox_config &config);

/**
 * @brief 将调用方传入的时间限制截断到 [MIN_TIME_LIMIT, MAX_TIME_LIMIT]
 */
int clamp_time_limit(long long seconds);

/**
 * @brief 将调用方传入的内存限制截断到 [MIN_MEMORY_LIMIT, MAX_MEMORY_LIMIT]
 */
long long clamp_memory_limit(long long bytes);

}  // namespace sandbox
