#include "sandbox/executor.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "sandbox/safety.hpp"
#include "sandbox/scorer.hpp"

namespace sandbox {
using namespace std;

code_executor::code_executor(availability_gate &gate, sandbox_orchestrator &orchestrator, execution_cache &cache, const sandbox_config &config)
    : gate(gate), orchestrator(orchestrator), cache(cache), config(config) {}

bool code_executor::is_supported_language(const string &language) {
    return language == "python";
}

int code_executor::in_flight() const {
    return running.load();
}

outcome code_executor::execute(const execution_request &request) {
    if (auto reason = gate.probe())
        return unavailable{"Code execution service is unavailable: " + *reason};
    return run_available(request);
}

grading_outcome code_executor::grade(submission_attempt &attempt, const execution_request &request) {
    if (auto reason = gate.probe())
        return unavailable{"Code execution service is unavailable: " + *reason};

    // 评分提交总是绕过缓存，其余字段保持调用方的值
    auto graded_request = execution_request::create(request.code(), request.language(), request.test_cases(),
                                                    request.time_limit(), request.memory_limit(), false, true);
    attempt.start();
    graded_submission graded;
    graded.result = run_available(graded_request);
    graded.status = attempt.finish(graded.result, config.pass_threshold);
    graded.feedback = render_feedback(graded.result, graded.status);
    LOG(INFO) << "Graded submission " << graded.result.execution_id << ": " << get_display_message(graded.status)
              << " (" << graded.result.summary.passed_tests << "/" << graded.result.summary.total_tests << ")";
    return graded;
}

grading_outcome code_executor::grade(const execution_request &request) {
    submission_attempt attempt;
    return grade(attempt, request);
}

grading_outcome code_executor::grade(submission_attempt &attempt, const string &code, const vector<test_case_spec> &test_cases, int time_limit) {
    return grade(attempt, execution_request::create(code, "python", test_cases, time_limit, DEFAULT_MEMORY_LIMIT, false, true));
}

grading_outcome code_executor::grade(const string &code, const vector<test_case_spec> &test_cases, int time_limit) {
    submission_attempt attempt;
    return grade(attempt, code, test_cases, time_limit);
}

execution_result code_executor::run_available(const execution_request &request) {
    ++running;
    defer { --running; };

    if (boost::algorithm::trim_copy(request.code()).empty())
        return make_failure(error_type::EXECUTION, "No code provided");
    if (!is_supported_language(request.language()))
        return make_failure(error_type::EXECUTION, "Unsupported language: " + request.language());

    try {
        // 评分提交无论 use_cache 如何都不读写缓存
        bool cacheable = request.use_cache() && !request.graded();
        string key;
        if (cacheable) {
            key = execution_cache::key(request.code(), request.test_cases());
            if (auto hit = cache.get(key)) {
                DLOG(INFO) << "Cache hit " << key;
                return *hit;
            }
        }

        safety_report safety = check_code_safety(request.code(), request.language());
        if (!safety.safe) {
            execution_result result = make_failure(error_type::SECURITY, "Code contains unsafe operations");
            result.issues = safety.issues;
            return result;
        }

        execution_result result = orchestrator.run(request);
        result.summary = score_results(result);

        if (cacheable) cache.put(key, result);
        return result;
    } catch (sandbox_exception &e) {
        LOG(ERROR) << "Execution failed: " << e;
        return make_failure(error_type::SYSTEM, string("Execution failed: ") + e.what());
    } catch (std::exception &e) {
        LOG(ERROR) << "Execution failed: " << e.what();
        return make_failure(error_type::SYSTEM, string("Execution failed: ") + e.what());
    }
}

}  // namespace sandbox
