#include "sandbox/safety.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<string, vector<string>> denylists = boost::assign::map_list_of
    ("python", vector<string>{
        "import os", "import sys", "import subprocess",
        "import shutil", "__import__", "eval(", "exec(",
        "open(", "file(", "input(", "raw_input(",
        "compile(", "globals()", "locals()", "vars(",
        "import socket", "import urllib", "import requests"})
    ("javascript", vector<string>{
        "require(", "import ", "fetch(", "XMLHttpRequest",
        "process.", "global.", "window.", "document.",
        "eval(", "Function(", "setTimeout", "setInterval"});
// clang-format on

const vector<string> &unsafe_patterns(const string &language) {
    static const vector<string> empty;
    auto it = denylists.find(language);
    return it == denylists.end() ? empty : it->second;
}

safety_report check_code_safety(const string &code, const string &language) {
    safety_report report;
    for (auto &pattern : unsafe_patterns(language))
        if (code.find(pattern) != string::npos)
            report.issues.push_back("Potentially unsafe pattern detected: " + pattern);
    report.safe = report.issues.empty();
    if (!report.safe)
        report.warnings.push_back("Code contains potentially unsafe operations");
    return report;
}

}  // namespace sandbox
