#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

/**
 * @brief 测试中只输出警告以上的日志，避免沙箱生命周期日志淹没测试输出
 */
class QuietLogEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        FLAGS_logtostderr = true;
        FLAGS_minloglevel = google::GLOG_WARNING;
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    ::testing::AddGlobalTestEnvironment(new QuietLogEnvironment);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
