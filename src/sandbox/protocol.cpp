#include "sandbox/protocol.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

static string optional_string(const json &doc, const char *key) {
    if (!doc.contains(key) || doc.at(key).is_null()) return "";
    const json &value = doc.at(key);
    if (!value.is_string())
        throw protocol_error(string("field ") + key + " is not a string");
    return value.get<string>();
}

static double optional_number(const json &doc, const char *key) {
    if (!doc.contains(key) || doc.at(key).is_null()) return 0;
    const json &value = doc.at(key);
    if (!value.is_number())
        throw protocol_error(string("field ") + key + " is not a number");
    return value.get<double>();
}

/**
 * @brief 解析单个测试用例的结果，格式错误时返回一个失败的测试用例
 */
static test_result decode_test_result(const json &entry, size_t index) {
    test_result test;
    test.name = "Test " + to_string(index + 1);
    if (!entry.is_object()) {
        test.error = "malformed test result";
        return test;
    }

    try {
        if (entry.contains("name") && entry.at("name").is_string())
            test.name = entry.at("name").get<string>();
        const json &passed = entry.contains("passed") ? entry.at("passed") : json();
        if (!passed.is_boolean())
            throw protocol_error("field passed is not a boolean");
        test.expected = optional_string(entry, "expected");
        test.actual = optional_string(entry, "actual");
        test.time = optional_number(entry, "time");
        test.error = optional_string(entry, "error");
        test.passed = passed.get<bool>();
    } catch (protocol_error &e) {
        test.passed = false;
        test.error = string("malformed test result: ") + e.what();
    }
    return test;
}

static execution_result decode_document(const string &text) {
    if (text.empty())
        throw protocol_error("sandbox produced no output");

    // parse 会拒绝 JSON 文档之后的多余内容
    json doc = json::parse(text);
    if (!doc.is_object())
        throw protocol_error("result document is not an object");
    if (!doc.contains("success") || !doc.at("success").is_boolean())
        throw protocol_error("field success is missing or not a boolean");

    execution_result result;
    result.success = doc.at("success").get<bool>();
    result.stdout_text = optional_string(doc, "stdout");
    result.stderr_text = optional_string(doc, "stderr");
    result.error = optional_string(doc, "error");
    result.execution_time = optional_number(doc, "execution_time");
    result.memory_used = (long long)optional_number(doc, "memory_used");

    string type = optional_string(doc, "error_type");
    if (type.empty()) {
        result.error_type = result.success ? error_type::NONE : error_type::EXECUTION;
    } else {
        auto parsed = parse_error_type(type);
        if (!parsed)
            throw protocol_error("unknown error_type " + type);
        result.error_type = *parsed;
    }

    if (doc.contains("test_results") && !doc.at("test_results").is_null()) {
        const json &tests = doc.at("test_results");
        if (!tests.is_array())
            throw protocol_error("field test_results is not an array");
        for (size_t i = 0; i < tests.size(); ++i)
            result.test_results.push_back(decode_test_result(tests[i], i));
    }
    return result;
}

execution_result decode_result(const string &raw_stdout) noexcept {
    string text = boost::algorithm::trim_copy(raw_stdout);
    string reason;
    try {
        return decode_document(text);
    } catch (protocol_error &e) {
        reason = e.what();
    } catch (json::exception &e) {
        reason = e.what();
    } catch (std::exception &e) {
        LOG(ERROR) << "Unexpected error while decoding sandbox output: " << e.what();
        reason = e.what();
    }

    execution_result result = make_failure(error_type::SYSTEM, "Invalid output from executor: " + reason);
    result.stderr_text = utf8_excerpt(raw_stdout, RAW_OUTPUT_EXCERPT_LIMIT);
    return result;
}

}  // namespace sandbox
