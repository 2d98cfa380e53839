#pragma once

#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

namespace sandbox {

/**
 * @brief 外部命令的执行结果
 */
struct process_result {
    /**
     * @brief 外部命令的返回值，如果外部命令因为信号崩溃或者被强制终止而没有返回码，则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 导致外部命令终止的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 外部命令是否因为超时被强制终止
     */
    bool timed_out = false;

    std::string out;

    std::string err;
};

/**
 * @brief 执行外部命令并捕获其标准输出和标准错误
 * 子进程会被放入独立的进程组，超时后先 SIGTERM 再 SIGKILL 整个进程组，
 * 因此该函数的阻塞时间不会超过 timeout 太多。
 * @param env 额外的环境变量，会覆盖当前进程中的同名变量
 * @param argv 外部命令的路径 (argv[0]) 和 参数
 * @param timeout 外部命令允许运行的最长时钟时间
 * @param output_limit 每个输出流最多保留的字节数，超出部分会被读取并丢弃
 */
process_result exec_program_capture(const std::map<std::string, std::string> &env,
                                    const std::vector<std::string> &argv,
                                    std::chrono::milliseconds timeout,
                                    size_t output_limit = 16 << 20);

/**
 * @brief 调用外部程序并捕获输出
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @code{.cpp}
 *     auto result = call_process_capture({}, std::chrono::seconds(5), "docker", "version");
 * @endcode
 */
template <typename... Args>
process_result call_process_capture(const std::map<std::string, std::string> &env, std::chrono::milliseconds timeout, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list) ss << arg << ' ';
    DLOG(INFO) << ss.str();
#endif

    return exec_program_capture(env, list, timeout);
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace sandbox
