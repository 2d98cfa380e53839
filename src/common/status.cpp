#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<attempt_status, const char *> status_string = boost::assign::map_list_of
    (attempt_status::PENDING, "Pending")
    (attempt_status::RUNNING, "Running")
    (attempt_status::PASSED, "Passed")
    (attempt_status::FAILED, "Failed")
    (attempt_status::ERROR, "Error")
    (attempt_status::TIMEOUT, "Timeout")
    (attempt_status::MEMORY_EXCEEDED, "Memory Exceeded");

static const unordered_map<string, error_type> error_type_names = boost::assign::map_list_of
    ("none", error_type::NONE)
    ("timeout", error_type::TIMEOUT)
    ("memory", error_type::MEMORY)
    ("security", error_type::SECURITY)
    ("system", error_type::SYSTEM)
    ("execution", error_type::EXECUTION);
// clang-format on

const char *to_string(error_type type) {
    switch (type) {
        case error_type::NONE: return "none";
        case error_type::TIMEOUT: return "timeout";
        case error_type::MEMORY: return "memory";
        case error_type::SECURITY: return "security";
        case error_type::SYSTEM: return "system";
        case error_type::EXECUTION: return "execution";
    }
    return "system";
}

optional<error_type> parse_error_type(const string &text) {
    auto it = error_type_names.find(text);
    if (it == error_type_names.end()) return nullopt;
    return it->second;
}

const char *get_display_message(attempt_status stat) {
    return status_string.at(stat);
}

bool is_terminal(attempt_status stat) {
    switch (stat) {
        case attempt_status::PENDING:
        case attempt_status::RUNNING:
            return false;
        case attempt_status::PASSED:
        case attempt_status::FAILED:
        case attempt_status::ERROR:
        case attempt_status::TIMEOUT:
        case attempt_status::MEMORY_EXCEEDED:
            return true;
    }
    return false;
}

}  // namespace sandbox
