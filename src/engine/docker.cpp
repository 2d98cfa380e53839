#include "engine/docker.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace sandbox::engine {
using namespace std;
using namespace nlohmann;

/**
 * @brief 不属于任何沙箱会话的 docker 子命令（镜像检查、列出容器）的超时时间
 */
static const chrono::milliseconds COMMAND_TIMEOUT = chrono::seconds(30);

command_runner::~command_runner() = default;

process_result system_command_runner::run(const map<string, string> &env, const vector<string> &argv, chrono::milliseconds timeout) {
#ifndef NDEBUG
    DLOG(INFO) << boost::algorithm::join(argv, " ");
#endif
    return exec_program_capture(env, argv, timeout);
}

docker_engine::docker_engine(command_runner &runner, const string &binary)
    : runner(runner), binary(binary) {}

process_result docker_engine::invoke_unchecked(const vector<string> &args, chrono::milliseconds timeout, const map<string, string> &env) {
    vector<string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary);
    argv.insert(argv.end(), args.begin(), args.end());
    try {
        return runner.run(env, argv, timeout);
    } catch (system_error &e) {
        throw engine_error(fmt::format("unable to start {}: {}", binary, e.what()));
    }
}

process_result docker_engine::invoke(const vector<string> &args, chrono::milliseconds timeout, const map<string, string> &env) {
    process_result result = invoke_unchecked(args, timeout, env);
    string command = args.empty() ? binary : binary + " " + args.front();
    if (result.timed_out)
        throw engine_error(fmt::format("{} timed out after {}ms", command, timeout.count()));
    if (result.exit_code == 127)
        throw engine_error(fmt::format("{} not found or not executable", binary));
    if (result.exit_code != 0)
        throw engine_error(fmt::format("{} exited with {}: {}", command, result.exit_code, boost::algorithm::trim_copy(result.err)));
    return result;
}

void docker_engine::ping(chrono::milliseconds timeout) {
    invoke({"version", "--format", "{{.Server.Version}}"}, timeout);
}

engine_info docker_engine::info(chrono::milliseconds timeout) {
    engine_info info;
    try {
        process_result result = invoke({"info", "--format", "{{json .}}"}, timeout);
        json j = json::parse(result.out);
        info.available = true;
        info.server_version = get_value_def<string>(j, "", "ServerVersion");
        info.containers_running = get_value_def<int>(j, 0, "ContainersRunning");
        info.images = get_value_def<int>(j, 0, "Images");
        info.total_memory = get_value_def<long long>(j, 0, "MemTotal");
        info.cpus = get_value_def<int>(j, 0, "NCPU");
    } catch (engine_error &e) {
        info.available = false;
        info.error = e.what();
    } catch (json::exception &e) {
        info.available = false;
        info.error = fmt::format("unexpected output of {} info: {}", binary, e.what());
    }
    return info;
}

bool docker_engine::image_exists(const string &image) {
    process_result result = invoke_unchecked({"image", "inspect", "--format", "{{.Id}}", image}, COMMAND_TIMEOUT);
    if (result.timed_out)
        throw engine_error(fmt::format("{} image inspect timed out", binary));
    if (result.exit_code == 0) return true;
    if (result.err.find("No such image") != string::npos) return false;
    throw engine_error(fmt::format("{} image inspect exited with {}: {}", binary, result.exit_code, boost::algorithm::trim_copy(result.err)));
}

void docker_engine::build_image(const string &image, const filesystem::path &context, chrono::milliseconds timeout) {
    invoke({"build", "-t", image, context.string()}, timeout);
}

vector<string> docker_engine::build_run_arguments(const container_spec &spec) {
    vector<string> args = {"run", "-d", "--name", spec.name};

    args.push_back(fmt::format("--memory={}", spec.memory_limit));
    args.push_back(fmt::format("--memory-swap={}", spec.memory_limit));
    args.insert(args.end(), {"--cpus", fmt::format("{}", spec.cpu_limit)});
    args.insert(args.end(), {"--pids-limit", to_string(spec.pids_limit)});
    args.insert(args.end(), {"--ulimit", fmt::format("nofile={0}:{0}", spec.nofile_limit)});

    if (spec.network_disabled)
        args.insert(args.end(), {"--network", "none"});
    if (spec.read_only_root)
        args.push_back("--read-only");
    for (auto &mount : spec.tmpfs)
        args.insert(args.end(), {"--tmpfs", fmt::format("{}:{},size={}", mount.path, mount.options, mount.size)});

    args.insert(args.end(), {"--cap-drop", "ALL"});
    for (auto &cap : spec.cap_add)
        args.insert(args.end(), {"--cap-add", cap});
    args.insert(args.end(), {"--security-opt", "no-new-privileges:true"});

    if (!spec.user.empty())
        args.insert(args.end(), {"--user", spec.user});
    for (auto &[key, value] : spec.labels)
        args.insert(args.end(), {"--label", fmt::format("{}={}", key, value)});
    for (auto &[key, value] : spec.env)
        args.insert(args.end(), {"-e", key});

    args.push_back(spec.image);
    return args;
}

void docker_engine::run(const container_spec &spec, chrono::milliseconds timeout) {
    invoke(build_run_arguments(spec), timeout, spec.env);
}

wait_result docker_engine::wait(const string &name, chrono::milliseconds timeout) {
    wait_result wr;
    process_result result = invoke_unchecked({"wait", name}, timeout);
    if (result.timed_out) {
        wr.timed_out = true;
        return wr;
    }
    if (result.exit_code != 0)
        throw engine_error(fmt::format("{} wait {} exited with {}: {}", binary, name, result.exit_code, boost::algorithm::trim_copy(result.err)));
    try {
        wr.exit_code = boost::lexical_cast<int>(boost::algorithm::trim_copy(result.out));
    } catch (boost::bad_lexical_cast &) {
        throw engine_error(fmt::format("unexpected output of {} wait: {}", binary, result.out));
    }
    return wr;
}

container_state docker_engine::inspect(const string &name, chrono::milliseconds timeout) {
    process_result result = invoke({"inspect", "--format", "{{.State.Running}} {{.State.OOMKilled}} {{.State.ExitCode}}", name}, timeout);
    container_state state;
    string running, oom_killed;
    istringstream iss(result.out);
    if (!(iss >> running >> oom_killed >> state.exit_code))
        throw engine_error(fmt::format("unexpected output of {} inspect: {}", binary, result.out));
    state.running = running == "true";
    state.oom_killed = oom_killed == "true";
    return state;
}

string docker_engine::logs(const string &name, chrono::milliseconds timeout) {
    return invoke({"logs", name}, timeout).out;
}

void docker_engine::kill(const string &name, chrono::milliseconds timeout) {
    process_result result = invoke_unchecked({"kill", name}, timeout);
    if (result.timed_out)
        throw engine_error(fmt::format("{} kill {} timed out", binary, name));
    // 容器可能恰好在超时的同时退出
    if (result.exit_code != 0 && result.err.find("is not running") == string::npos)
        throw engine_error(fmt::format("{} kill {} exited with {}: {}", binary, name, result.exit_code, boost::algorithm::trim_copy(result.err)));
}

void docker_engine::remove(const string &name, chrono::milliseconds timeout) {
    process_result result = invoke_unchecked({"rm", "-f", name}, timeout);
    if (result.timed_out)
        throw engine_error(fmt::format("{} rm {} timed out", binary, name));
    if (result.exit_code != 0 && result.err.find("No such container") == string::npos)
        throw engine_error(fmt::format("{} rm {} exited with {}: {}", binary, name, result.exit_code, boost::algorithm::trim_copy(result.err)));
}

vector<container_info> docker_engine::list(const string &prefix) {
    process_result result = invoke({"ps", "-a",
                                    "--filter", "name=" + prefix,
                                    "--format", fmt::format("{{{{.Names}}}}\t{{{{.Label \"{}\"}}}}", CREATED_LABEL)},
                                   COMMAND_TIMEOUT);
    vector<container_info> containers;
    istringstream iss(result.out);
    string line;
    while (getline(iss, line)) {
        if (line.empty()) continue;
        container_info info;
        size_t tab = line.find('\t');
        info.name = line.substr(0, tab);
        if (tab != string::npos) {
            try {
                info.created = boost::lexical_cast<time_t>(boost::algorithm::trim_copy(line.substr(tab + 1)));
            } catch (boost::bad_lexical_cast &) {
                info.created = nullopt;
            }
        }
        containers.push_back(info);
    }
    return containers;
}

}  // namespace sandbox::engine
