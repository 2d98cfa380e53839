#pragma once

#include <string>

namespace sandbox {

/**
 * @brief 计算字符串的 SHA-256 摘要
 * @return 64 个字符的小写十六进制字符串
 */
std::string sha256_hex(const std::string &input);

}  // namespace sandbox
