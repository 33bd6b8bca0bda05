#include <gtest/gtest.h>

#include "adapters/secondary/InMemoryHandoffTokenRepository.hpp"

using namespace bridge;
using namespace std::chrono;

class InMemoryHandoffTokenRepositoryTest : public ::testing::Test {
protected:
    adapters::secondary::InMemoryHandoffTokenRepository repo_;
    system_clock::time_point now_ = system_clock::time_point(hours(1000));
};

TEST_F(InMemoryHandoffTokenRepositoryTest, SaveFindDelete) {
    repo_.save(domain::HandoffToken("t1", "1", "acme", now_ + seconds(30)));

    auto found = repo_.findByToken("t1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->tenantId, "acme");

    EXPECT_TRUE(repo_.deleteByToken("t1"));
    EXPECT_FALSE(repo_.deleteByToken("t1"));
    EXPECT_FALSE(repo_.findByToken("t1").has_value());
}

TEST_F(InMemoryHandoffTokenRepositoryTest, DeleteExpired_StrictlyBeforeNow) {
    repo_.save(domain::HandoffToken("past", "1", "acme", now_ - seconds(1)));
    repo_.save(domain::HandoffToken("edge", "1", "acme", now_));
    repo_.save(domain::HandoffToken("future", "1", "acme", now_ + seconds(1)));

    EXPECT_EQ(repo_.deleteExpired(now_), 1u);
    EXPECT_EQ(repo_.size(), 2u);
    EXPECT_FALSE(repo_.findByToken("past").has_value());
}
