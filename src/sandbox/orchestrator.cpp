#include "sandbox/orchestrator.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <ctime>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/protocol.hpp"

namespace sandbox {
using namespace std;

/**
 * @brief docker 以 SIGKILL 结束容器时的退出码，内存超限时通常是这个值
 */
static constexpr int SIGKILL_EXIT_CODE = 137;

/**
 * @brief 会话内单个引擎调用的最短超时时间，避免以 0 超时启动 docker 客户端
 */
static const chrono::milliseconds MIN_STEP_TIMEOUT(100);

sandbox_session::sandbox_session(engine::container_engine &backend, int time_limit, long long memory_limit,
                                 chrono::milliseconds grace_period)
    : backend(&backend),
      session_id(boost::lexical_cast<string>(boost::uuids::random_generator()())),
      started(chrono::steady_clock::now()),
      deadline_(started + chrono::seconds(time_limit) + grace_period),
      time_limit_(time_limit),
      memory_limit_(memory_limit) {
    name = CONTAINER_PREFIX + session_id;
}

sandbox_session::sandbox_session(sandbox_session &&other) noexcept
    : backend(other.backend),
      session_id(move(other.session_id)),
      name(move(other.name)),
      started(other.started),
      deadline_(other.deadline_),
      time_limit_(other.time_limit_),
      memory_limit_(other.memory_limit_) {
    other.backend = nullptr;
}

sandbox_session::~sandbox_session() {
    destroy();
}

const string &sandbox_session::id() const {
    return session_id;
}

const string &sandbox_session::container_name() const {
    return name;
}

chrono::steady_clock::time_point sandbox_session::start_time() const {
    return started;
}

chrono::steady_clock::time_point sandbox_session::deadline() const {
    return deadline_;
}

chrono::milliseconds sandbox_session::remaining() const {
    auto left = chrono::duration_cast<chrono::milliseconds>(deadline_ - chrono::steady_clock::now());
    return max(left, chrono::milliseconds::zero());
}

int sandbox_session::time_limit() const {
    return time_limit_;
}

long long sandbox_session::memory_limit() const {
    return memory_limit_;
}

void sandbox_session::destroy() noexcept {
    if (!backend) return;
    engine::container_engine *owner = backend;
    backend = nullptr;
    try {
        owner->remove(name, max(remaining(), CLEANUP_TIMEOUT));
    } catch (sandbox_exception &e) {
        LOG(ERROR) << "Unable to remove container " << name << ", leaving it to the reaper: " << e;
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to remove container " << name << ", leaving it to the reaper: " << e.what();
    }
}

sandbox_orchestrator::sandbox_orchestrator(engine::container_engine &backend, image_provisioner &images, const sandbox_config &config)
    : backend(backend), images(images), config(config) {}

engine::container_spec sandbox_orchestrator::make_spec(const sandbox_session &session, const execution_request &request) const {
    engine::container_spec spec;
    spec.name = session.container_name();
    spec.image = images.image();
    spec.memory_limit = session.memory_limit();
    spec.cpu_limit = config.cpu_limit;
    spec.pids_limit = config.pids_limit;
    spec.nofile_limit = config.nofile_limit;
    spec.user = config.run_user;
    spec.network_disabled = true;
    spec.read_only_root = true;
    spec.tmpfs = {{"/tmp", "100m"}, {"/app/code", "50m"}, {"/app/output", "50m"}};
    spec.cap_add = {"SETUID", "SETGID"};
    spec.labels[CREATED_LABEL] = to_string(time(nullptr));
    spec.env = {{"CODE", request.code()},
                {"TEST_CASES", serialize_test_cases(request.test_cases()).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)},
                {"TIME_LIMIT", to_string(session.time_limit())},
                {"MEMORY_LIMIT", to_string(session.memory_limit())}};
    return spec;
}

execution_result sandbox_orchestrator::run(const execution_request &request) {
    try {
        images.ensure();
    } catch (sandbox_exception &e) {
        LOG(ERROR) << "Failed to prepare image " << images.image() << ": " << e;
        return make_failure(error_type::SYSTEM, "Failed to prepare execution environment");
    } catch (std::exception &e) {
        LOG(ERROR) << "Failed to prepare image " << images.image() << ": " << e.what();
        return make_failure(error_type::SYSTEM, "Failed to prepare execution environment");
    }

    sandbox_session session(backend, request.time_limit(), request.memory_limit(), config.grace_period);
    execution_result result;
    try {
        result = run_container(session, request);
    } catch (sandbox_exception &e) {
        LOG(ERROR) << "Sandbox " << session.container_name() << " failed: " << e;
        result = make_failure(error_type::SYSTEM, fmt::format("Container execution failed: {}", e.what()));
    } catch (std::exception &e) {
        LOG(ERROR) << "Sandbox " << session.container_name() << " failed: " << e.what();
        result = make_failure(error_type::SYSTEM, fmt::format("Container execution failed: {}", e.what()));
    }
    session.destroy();

    result.execution_id = session.id();
    return result;
}

execution_result sandbox_orchestrator::run_container(sandbox_session &session, const execution_request &request) {
    const string &name = session.container_name();
    elapsed_time timer;

    auto step_timeout = [&session] { return max(session.remaining(), MIN_STEP_TIMEOUT); };

    // 启动、等待、检查和读取输出都计入同一个预算，容器的启动时间也计入其中
    backend.run(make_spec(session, request), step_timeout());
    DLOG(INFO) << "Started sandbox " << name;

    engine::wait_result waited = backend.wait(name, step_timeout());
    if (waited.timed_out) {
        auto bound = chrono::duration_cast<chrono::milliseconds>(session.deadline() - session.start_time());
        LOG(WARNING) << "Sandbox " << name << " exceeded " << bound.count() << "ms, killing it";
        try {
            backend.kill(name, max(session.remaining(), CLEANUP_TIMEOUT));
        } catch (engine_error &e) {
            // 随后的 rm -f 同样会终止容器
            LOG(WARNING) << "Unable to kill container " << name << ": " << e.what();
        }
        execution_result result = make_failure(error_type::TIMEOUT, fmt::format("Code execution timed out after {} seconds", session.time_limit()));
        result.execution_time = timer.seconds();
        return result;
    }

    engine::container_state state = backend.inspect(name, step_timeout());
    if (state.oom_killed || waited.exit_code == SIGKILL_EXIT_CODE) {
        execution_result result = make_failure(error_type::MEMORY, fmt::format("Memory limit of {}MB exceeded", session.memory_limit() >> 20));
        result.execution_time = timer.seconds();
        return result;
    }

    execution_result result = decode_result(backend.logs(name, step_timeout()));
    if (result.error_type == error_type::SYSTEM)
        LOG(WARNING) << "Sandbox " << name << " exited with " << waited.exit_code << " and produced invalid output: " << result.error;
    return result;
}

}  // namespace sandbox
