#include "engine/container_engine.hpp"

namespace sandbox::engine {
using namespace std;

container_engine::~container_engine() = default;

void to_json(nlohmann::json &j, const engine_info &info) {
    j = {{"available", info.available},
         {"server_version", info.server_version},
         {"containers_running", info.containers_running},
         {"images", info.images},
         {"total_memory", info.total_memory},
         {"cpus", info.cpus}};
    if (!info.error.empty()) j["error"] = info.error;
}

}  // namespace sandbox::engine
