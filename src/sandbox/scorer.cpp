#include "sandbox/scorer.hpp"
#include <cmath>

namespace sandbox {
using namespace std;

score_summary score_results(const execution_result &result) {
    score_summary summary;
    summary.total_tests = (int)result.test_results.size();
    for (auto &test : result.test_results)
        if (test.passed) ++summary.passed_tests;

    if (summary.total_tests > 0)
        summary.score = (int)lround(100.0 * summary.passed_tests / summary.total_tests);
    else
        summary.score = result.success ? 100 : 0;
    return summary;
}

bool is_passing(const score_summary &summary, int pass_threshold) {
    return summary.score >= pass_threshold;
}

}  // namespace sandbox
