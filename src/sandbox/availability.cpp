#include "sandbox/availability.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;

availability_gate::availability_gate(engine::container_engine &backend, chrono::milliseconds probe_timeout)
    : backend(backend), probe_timeout(probe_timeout) {}

optional<string> availability_gate::probe() {
    try {
        backend.ping(probe_timeout);
        return nullopt;
    } catch (engine_error &e) {
        LOG(WARNING) << "Container engine is unreachable: " << e.what();
        return string(e.what());
    }
}

engine::engine_info availability_gate::status() {
    return backend.info(probe_timeout);
}

}  // namespace sandbox
