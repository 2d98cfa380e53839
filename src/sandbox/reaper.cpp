#include "sandbox/reaper.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;

stale_sandbox_reaper::stale_sandbox_reaper(engine::container_engine &backend, chrono::seconds max_age, clock_type clock)
    : backend(backend), max_age(max_age), clock(move(clock)) {}

stale_sandbox_reaper::~stale_sandbox_reaper() {
    stop();
}

size_t stale_sandbox_reaper::sweep() {
    time_t now = clock();
    size_t removed = 0;
    for (auto &container : backend.list(CONTAINER_PREFIX)) {
        // 引擎的名字过滤是子串匹配，这里必须再检查一次前缀
        if (!boost::algorithm::starts_with(container.name, CONTAINER_PREFIX)) continue;
        if (!container.created) {
            LOG(WARNING) << "Container " << container.name << " has no creation label, skipping";
            continue;
        }
        if (now - *container.created < max_age.count()) continue;

        try {
            backend.remove(container.name, REAP_TIMEOUT);
            ++removed;
            LOG(INFO) << "Removed stale container " << container.name;
        } catch (engine_error &e) {
            LOG(WARNING) << "Unable to remove stale container " << container.name << ": " << e.what();
        }
    }
    return removed;
}

void stale_sandbox_reaper::start(chrono::seconds interval) {
    stop();
    {
        lock_guard<mutex> guard(mut);
        stopping = false;
    }
    worker = thread([this, interval] {
        unique_lock<mutex> lock(mut);
        while (!stopping) {
            lock.unlock();
            try {
                size_t removed = sweep();
                if (removed > 0) LOG(INFO) << "Reaper removed " << removed << " stale containers";
            } catch (sandbox_exception &e) {
                LOG(ERROR) << "Reaper sweep failed: " << e;
            } catch (std::exception &e) {
                LOG(ERROR) << "Reaper sweep failed: " << e.what();
            }
            lock.lock();
            cond.wait_for(lock, interval, [this] { return stopping; });
        }
    });
}

void stale_sandbox_reaper::stop() {
    {
        lock_guard<mutex> guard(mut);
        stopping = true;
    }
    cond.notify_all();
    if (worker.joinable()) worker.join();
}

}  // namespace sandbox
