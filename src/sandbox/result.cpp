#include "sandbox/result.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const test_result &result) {
    j = {{"name", result.name},
         {"passed", result.passed},
         {"expected", result.expected},
         {"actual", result.actual},
         {"time", result.time}};
    if (!result.error.empty()) j["error"] = result.error;
}

void to_json(json &j, const execution_result &result) {
    j = {{"success", result.success},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"execution_time", result.execution_time},
         {"memory_used", result.memory_used},
         {"error_type", to_string(result.error_type)},
         {"test_results", result.test_results},
         {"score", result.summary.score},
         {"passed_tests", result.summary.passed_tests},
         {"total_tests", result.summary.total_tests},
         {"from_cache", result.from_cache}};
    if (!result.error.empty()) j["error"] = result.error;
    if (!result.issues.empty()) j["issues"] = result.issues;
    if (!result.execution_id.empty()) j["execution_id"] = result.execution_id;
}

void to_json(json &j, const unavailable &u) {
    j = {{"success", false},
         {"unavailable", true},
         {"error", u.reason}};
}

void to_json(json &j, const outcome &o) {
    visit([&j](auto &&value) { to_json(j, value); }, o);
}

execution_result make_failure(sandbox::error_type type, const string &error) {
    execution_result result;
    result.success = false;
    result.error_type = type;
    result.error = error;
    return result;
}

}  // namespace sandbox
