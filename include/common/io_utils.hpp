#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 截取字符串的前 limit 个字节，并保证结果仍是合法的 UTF-8
 * 用于把不可信的原始输出附加到诊断信息中
 */
std::string utf8_excerpt(const std::string &string, size_t limit);

/**
 * @brief 基于 flock 的文件锁，析构时释放
 */
struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&);
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    void release();

private:
    int fd = -1;
    bool valid = false;
    std::filesystem::path lock_file;
};

/**
 * @brief 锁文件夹
 * 通过创建文件夹，并对文件夹根目录下的 .lock 文件加锁实现
 * @param dir 要被加锁的文件夹
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @return 文件锁
 */
scoped_file_lock lock_directory(const std::filesystem::path &dir, bool shared);

}  // namespace sandbox
