#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/TokenSweeper.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/MockSessionRepository.hpp"
#include "mocks/MockHandoffTokenService.hpp"

#include <thread>

using namespace bridge;
using namespace bridge::tests::mocks;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Return;
using ::testing::Throw;

class TokenSweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::BridgeSettings>();
        tokenService_ = std::make_shared<::testing::NiceMock<MockHandoffTokenService>>();
        sessions_ = std::make_shared<::testing::NiceMock<MockSessionRepository>>();
        clock_ = std::make_shared<FakeClock>();
    }

    std::shared_ptr<application::TokenSweeper> makeSweeper() {
        return std::make_shared<application::TokenSweeper>(settings_, tokenService_, sessions_, clock_);
    }

    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<::testing::NiceMock<MockHandoffTokenService>> tokenService_;
    std::shared_ptr<::testing::NiceMock<MockSessionRepository>> sessions_;
    std::shared_ptr<FakeClock> clock_;
};

TEST_F(TokenSweeperTest, ManualTick_SweepsTokensAndSessions) {
    EXPECT_CALL(*tokenService_, sweep()).WillOnce(Return(2));
    EXPECT_CALL(*sessions_, deleteExpired(clock_->now())).WillOnce(Return(1));

    auto sweeper = makeSweeper();
    sweeper->manualTick();

    EXPECT_EQ(sweeper->tickCount(), 1u);
}

TEST_F(TokenSweeperTest, SessionSweepFailure_DoesNotStopTicking) {
    EXPECT_CALL(*tokenService_, sweep()).Times(2).WillRepeatedly(Return(0));
    EXPECT_CALL(*sessions_, deleteExpired(_))
        .WillOnce(Throw(ports::output::SessionPersistenceError("store down")))
        .WillOnce(Return(0));

    auto sweeper = makeSweeper();
    sweeper->manualTick();
    sweeper->manualTick();

    EXPECT_EQ(sweeper->tickCount(), 2u);
}

TEST_F(TokenSweeperTest, Background_RunsPeriodically) {
    settings_->setSweepInterval(std::chrono::milliseconds(10));
    EXPECT_CALL(*tokenService_, sweep()).Times(AtLeast(2));

    auto sweeper = makeSweeper();
    sweeper->start();
    EXPECT_TRUE(sweeper->isRunning());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    sweeper->stop();

    EXPECT_FALSE(sweeper->isRunning());
    EXPECT_GE(sweeper->tickCount(), 2u);
}

TEST_F(TokenSweeperTest, Stop_WakesSleepingThreadImmediately) {
    settings_->setSweepInterval(std::chrono::hours(1));

    auto sweeper = makeSweeper();
    sweeper->start();

    auto begin = std::chrono::steady_clock::now();
    sweeper->stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::seconds(1));
    EXPECT_EQ(sweeper->tickCount(), 0u);
}

TEST_F(TokenSweeperTest, StopWithoutStart_IsNoop) {
    auto sweeper = makeSweeper();
    sweeper->stop();
    EXPECT_FALSE(sweeper->isRunning());
}
