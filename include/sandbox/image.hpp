#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include "engine/container_engine.hpp"

namespace sandbox {

/**
 * @brief 确保执行镜像存在，不存在时构建
 * 并发的首次调用在进程内通过互斥锁、在进程间通过 state_dir 下的文件锁串行化，
 * 只有一个调用者真正构建镜像，其余调用者在获得锁之后发现镜像已经存在。
 */
struct image_provisioner {
    image_provisioner(engine::container_engine &backend,
                      std::string image,
                      std::filesystem::path context,
                      std::filesystem::path state_dir,
                      std::chrono::milliseconds build_timeout);

    /**
     * @brief 确保镜像存在
     * @return 是否由本次调用构建了镜像
     * @throw engine_error 镜像构建失败
     * @throw internal_error 构建上下文不存在
     */
    bool ensure();

    const std::string &image() const;

private:
    engine::container_engine &backend;
    std::string image_name;
    std::filesystem::path context;
    std::filesystem::path state_dir;
    std::chrono::milliseconds build_timeout;

    std::mutex build_mutex;

    /**
     * @brief 镜像已确认存在，之后的调用不再询问引擎
     */
    bool ready = false;
};

}  // namespace sandbox
