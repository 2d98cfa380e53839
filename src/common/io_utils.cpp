#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    if (!fin) throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

/**
 * @brief 返回以 c 开头的 UTF-8 字符还需要多少个后续字节，非法首字节返回 -1
 */
static int utf8_trailing_bytes(unsigned char c) {
    if (c <= 0x7f) return 0;              // 0bbbbbbb
    if ((c & 0xE0) == 0xC0) return 1;     // 110bbbbb
    if ((c & 0xF0) == 0xE0) return 2;     // 1110bbbb
    if ((c & 0xF8) == 0xF0) return 3;     // 11110bbb
    return -1;
}

bool utf8_check_is_valid(const string &string) {
    size_t ix = string.length();
    for (size_t i = 0; i < ix; i++) {
        unsigned char c = (unsigned char)string[i];
        if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  // U+d800 to U+dfff
        int n = utf8_trailing_bytes(c);
        if (n < 0) return false;
        for (int j = 0; j < n; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

string utf8_excerpt(const string &str, size_t limit) {
    string result;
    size_t i = 0;
    while (i < str.length() && i < limit) {
        int n = utf8_trailing_bytes((unsigned char)str[i]);
        if (n < 0 || i + n >= str.length() || i + n >= limit) {
            result += '?';
            ++i;
            continue;
        }
        string ch = str.substr(i, n + 1);
        result += utf8_check_is_valid(ch) ? ch : "?";
        i += n + 1;
    }
    return result;
}

scoped_file_lock::scoped_file_lock() {
    valid = false;
}

scoped_file_lock::scoped_file_lock(const fs::path &path, bool shared) : lock_file(path) {
    fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open lock file " + path.string());
    if (flock(fd, shared ? LOCK_SH : LOCK_EX) != 0) {
        int saved = errno;
        close(fd);
        throw system_error(saved, system_category(), "unable to lock file " + path.string());
    }
    valid = true;
}

scoped_file_lock::scoped_file_lock(scoped_file_lock &&lock) {
    *this = move(lock);
}

scoped_file_lock::~scoped_file_lock() {
    release();
}

scoped_file_lock &scoped_file_lock::operator=(scoped_file_lock &&lock) {
    swap(fd, lock.fd);
    swap(valid, lock.valid);
    swap(lock_file, lock.lock_file);
    return *this;
}

void scoped_file_lock::release() {
    if (!valid) return;
    flock(fd, LOCK_UN);
    close(fd);
    valid = false;
}

scoped_file_lock lock_directory(const fs::path &dir, bool shared) {
    fs::create_directories(dir);
    fs::path lock_file = dir / ".lock";
    if (fs::is_directory(lock_file))
        fs::remove_all(lock_file);
    return scoped_file_lock(lock_file, shared);
}

}  // namespace sandbox
