#include "config.hpp"
#include <algorithm>
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, sandbox_config &config) {
    config.engine_binary = get_value_def<string>(j, config.engine_binary, "engine");
    config.image_name = get_value_def<string>(j, config.image_name, "image", "name");
    if (exists(j, "image", "context"))
        config.image_context = get_value<string>(j, "image", "context");
    if (exists(j, "stateDir"))
        config.state_dir = get_value<string>(j, "stateDir");
    config.cpu_limit = get_value_def<double>(j, config.cpu_limit, "limits", "cpu");
    config.pids_limit = get_value_def<int>(j, config.pids_limit, "limits", "pids");
    config.nofile_limit = get_value_def<int>(j, config.nofile_limit, "limits", "nofile");
    config.run_user = get_value_def<string>(j, config.run_user, "runUser");
    config.grace_period = chrono::seconds(get_value_def<int>(j, (int)config.grace_period.count(), "timeouts", "grace"));
    config.probe_timeout = chrono::seconds(get_value_def<int>(j, (int)config.probe_timeout.count(), "timeouts", "probe"));
    config.build_timeout = chrono::seconds(get_value_def<int>(j, (int)config.build_timeout.count(), "timeouts", "build"));
    config.cache_ttl = chrono::seconds(get_value_def<int>(j, (int)config.cache_ttl.count(), "cache", "ttl"));
    config.cache_capacity = get_value_def<size_t>(j, config.cache_capacity, "cache", "capacity");
    config.reap_max_age = chrono::seconds(get_value_def<int>(j, (int)config.reap_max_age.count(), "reaper", "maxAge"));
    config.pass_threshold = get_value_def<int>(j, config.pass_threshold, "passThreshold");

    if (config.cpu_limit <= 0)
        throw invalid_argument("limits.cpu must be positive");
    if (config.pass_threshold < 0 || config.pass_threshold > 100)
        throw invalid_argument("passThreshold must be within [0, 100]");
}

int clamp_time_limit(long long seconds) {
    return (int)clamp<long long>(seconds, MIN_TIME_LIMIT, MAX_TIME_LIMIT);
}

long long clamp_memory_limit(long long bytes) {
    return clamp<long long>(bytes, MIN_MEMORY_LIMIT, MAX_MEMORY_LIMIT);
}

}  // namespace sandbox
