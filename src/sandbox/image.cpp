#include "sandbox/image.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

image_provisioner::image_provisioner(engine::container_engine &backend, string image, fs::path context, fs::path state_dir, chrono::milliseconds build_timeout)
    : backend(backend), image_name(move(image)), context(move(context)), state_dir(move(state_dir)), build_timeout(build_timeout) {}

const string &image_provisioner::image() const {
    return image_name;
}

bool image_provisioner::ensure() {
    lock_guard<mutex> guard(build_mutex);
    if (ready) return false;

    if (backend.image_exists(image_name)) {
        ready = true;
        return false;
    }

    // 其他进程可能正在构建同一个镜像，拿到锁之后需要再检查一次
    scoped_file_lock lock = lock_directory(state_dir, false);
    if (backend.image_exists(image_name)) {
        LOG(INFO) << "Image " << image_name << " already exists";
        ready = true;
        return false;
    }

    if (!fs::exists(context / "Dockerfile"))
        throw internal_error("image build context " + context.string() + " has no Dockerfile");

    LOG(INFO) << "Building image " << image_name << " from " << context;
    elapsed_time timer;
    backend.build_image(image_name, context, build_timeout);
    LOG(INFO) << "Built image " << image_name << " in " << timer.seconds() << "s";
    ready = true;
    return true;
}

}  // namespace sandbox
