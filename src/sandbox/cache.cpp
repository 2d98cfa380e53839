#include "sandbox/cache.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <nlohmann/json.hpp>
#include "common/hash.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

static string normalize_newlines(const string &text) {
    return boost::algorithm::replace_all_copy(text, "\r\n", "\n");
}

execution_cache::execution_cache(chrono::seconds ttl, size_t capacity, clock_type clock)
    : ttl(ttl), capacity(max<size_t>(capacity, 1)), clock(move(clock)) {}

string execution_cache::key(const string &code, const vector<test_case_spec> &test_cases) {
    vector<test_case_spec> normalized = test_cases;
    for (auto &test : normalized) {
        test.name = normalize_newlines(test.name);
        test.test_code = normalize_newlines(test.test_code);
        test.input = normalize_newlines(test.input);
        test.expected_output = normalize_newlines(test.expected_output);
    }

    // nlohmann::json 的对象按键排序，dump 的结果是稳定的
    json payload = {{"code", normalize_newlines(code)},
                    {"test_cases", serialize_test_cases(normalized)}};
    return CACHE_KEY_PREFIX + sha256_hex(payload.dump(-1, ' ', false, json::error_handler_t::replace));
}

optional<execution_result> execution_cache::get(const string &key) {
    lock_guard<mutex> guard(mut);
    auto it = entries.find(key);
    if (it == entries.end()) return nullopt;
    if (clock() >= it->second.expires) {
        erase(it);
        return nullopt;
    }
    execution_result result = it->second.result;
    result.from_cache = true;
    return result;
}

bool execution_cache::put(const string &key, const execution_result &result) {
    if (!result.success) return false;

    lock_guard<mutex> guard(mut);
    auto it = entries.find(key);
    if (it != entries.end()) erase(it);

    while (entries.size() >= capacity)
        erase(entries.find(insertion_order.front()));

    insertion_order.push_back(key);
    entry e{result, clock() + ttl, prev(insertion_order.end())};
    e.result.from_cache = false;
    entries.emplace(key, move(e));
    return true;
}

size_t execution_cache::erase_expired() {
    lock_guard<mutex> guard(mut);
    auto now = clock();
    size_t count = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        auto next = std::next(it);
        if (now >= it->second.expires) {
            erase(it);
            ++count;
        }
        it = next;
    }
    return count;
}

size_t execution_cache::size() const {
    lock_guard<mutex> guard(mut);
    return entries.size();
}

void execution_cache::erase(unordered_map<string, entry>::iterator it) {
    insertion_order.erase(it->second.order);
    entries.erase(it);
}

}  // namespace sandbox
