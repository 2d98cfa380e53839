#include "sandbox/request.hpp"
#include <algorithm>
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case_spec &test) {
    test.name = get_value_def<string>(j, "", "name");
    test.test_code = get_value_def<string>(j, "", "test_code");
    test.input = get_value_def<string>(j, "", "input");
    test.expected_output = get_value_def<string>(j, "", "expected_output");
    test.timeout = get_value_def<int>(j, 0, "timeout");
}

void to_json(json &j, const test_case_spec &test) {
    j = {{"name", test.name},
         {"test_code", test.test_code},
         {"input", test.input},
         {"expected_output", test.expected_output},
         {"timeout", test.timeout}};
}

execution_request execution_request::create(string code, string language, vector<test_case_spec> test_cases, long long time_limit, long long memory_limit, bool use_cache, bool graded) {
    execution_request request;
    request.code_ = move(code);
    request.language_ = move(language);
    request.time_limit_ = clamp_time_limit(time_limit);
    request.memory_limit_ = clamp_memory_limit(memory_limit);
    request.use_cache_ = use_cache;
    request.graded_ = graded;
    for (auto &test : test_cases) {
        if (test.timeout <= 0 || test.timeout > request.time_limit_)
            test.timeout = request.time_limit_;
    }
    request.test_cases_ = move(test_cases);
    return request;
}

execution_request parse_request(const json &j, bool graded) {
    if (!j.is_object())
        throw invalid_argument("request must be a JSON object");
    graded = graded || get_value_def<bool>(j, false, "graded");

    vector<test_case_spec> test_cases;
    if (exists(j, "test_cases")) {
        const json &tests = access(j, "test_cases");
        if (!tests.is_array())
            throw build_invalid_argument(j, "test_cases");
        for (auto &test : tests)
            test_cases.push_back(test.get<test_case_spec>());
    }

    long long memory_mb = get_value_def<long long>(j, DEFAULT_MEMORY_LIMIT >> 20, "memory_limit");
    // 先截断到合理范围再换算，避免乘法溢出
    memory_mb = clamp<long long>(memory_mb, 0, MAX_MEMORY_LIMIT >> 20);

    return execution_request::create(get_value<string>(j, "code"),
                                     get_value_def<string>(j, "python", "language"),
                                     move(test_cases),
                                     get_value_def<long long>(j, graded ? GRADED_TIME_LIMIT : 30, "time_limit"),
                                     memory_mb << 20,
                                     get_value_def<bool>(j, true, "use_cache"),
                                     graded);
}

json serialize_test_cases(const vector<test_case_spec> &test_cases) {
    json j = json::array();
    for (auto &test : test_cases)
        j.push_back(test);
    return j;
}

}  // namespace sandbox
