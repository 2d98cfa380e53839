#include "common/exceptions.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/reaper.hpp"
#include "test/mock_container_engine.hpp"

using namespace std;
using namespace sandbox;
using namespace sandbox::engine;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

static constexpr time_t NOW = 1700000000;

class ReaperTest : public ::testing::Test {
protected:
    NiceMock<mock::mock_container_engine> docker;
    stale_sandbox_reaper reaper{docker, chrono::seconds(3600), [] { return NOW; }};
};

TEST_F(ReaperTest, RemovesOnlyStaleSandboxes) {
    EXPECT_CALL(docker, list(CONTAINER_PREFIX))
        .WillOnce(Return(vector<container_info>{
            {"code-sandbox-old", NOW - 7200},
            {"code-sandbox-young", NOW - 60},
            {"code-sandbox-unlabelled", nullopt},
            {"my-code-sandbox-impostor", NOW - 7200},
            {"code-sandbox-edge", NOW - 3600}}));
    EXPECT_CALL(docker, remove("code-sandbox-old", REAP_TIMEOUT));
    EXPECT_CALL(docker, remove("code-sandbox-edge", _));
    EXPECT_CALL(docker, remove("code-sandbox-young", _)).Times(0);
    EXPECT_CALL(docker, remove("code-sandbox-unlabelled", _)).Times(0);
    EXPECT_CALL(docker, remove("my-code-sandbox-impostor", _)).Times(0);

    EXPECT_EQ(reaper.sweep(), 2u);
}

TEST_F(ReaperTest, RemoveFailureDoesNotStopSweep) {
    EXPECT_CALL(docker, list(_))
        .WillOnce(Return(vector<container_info>{
            {"code-sandbox-a", NOW - 7200},
            {"code-sandbox-b", NOW - 7200}}));
    EXPECT_CALL(docker, remove("code-sandbox-a", _)).WillOnce(Throw(engine_error("removal in progress")));
    EXPECT_CALL(docker, remove("code-sandbox-b", _));

    EXPECT_EQ(reaper.sweep(), 1u);
}

TEST_F(ReaperTest, BackgroundSweeps) {
    EXPECT_CALL(docker, list(_)).Times(AtLeast(1)).WillRepeatedly(Return(vector<container_info>{}));
    reaper.start(chrono::seconds(3600));
    this_thread::sleep_for(chrono::milliseconds(100));
    reaper.stop();
}

TEST_F(ReaperTest, BackgroundSweepSurvivesEngineFailure) {
    EXPECT_CALL(docker, list(_)).Times(AtLeast(1)).WillRepeatedly(Throw(engine_error("docker ps timed out")));
    reaper.start(chrono::seconds(3600));
    this_thread::sleep_for(chrono::milliseconds(100));
    reaper.stop();
    reaper.stop();
}
