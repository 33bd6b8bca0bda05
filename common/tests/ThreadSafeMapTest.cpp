#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <string>

struct Expiring {
    std::string owner;
    int expiresAt;

    Expiring(const std::string& o = "", int e = 0) : owner(o), expiresAt(e) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Expiring> map;

    void fill(int count, int expiresAt) {
        for (int i = 0; i < count; ++i) {
            map.insert("k" + std::to_string(expiresAt) + "_" + std::to_string(i),
                       std::make_shared<Expiring>("user", expiresAt));
        }
    }
};

TEST_F(ThreadSafeMapTest, InsertFindOverwrite) {
    map.insert("key", std::make_shared<Expiring>("first", 1));
    map.insert("key", std::make_shared<Expiring>("second", 2));

    auto found = map.find("key");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->owner, "second");
    EXPECT_EQ(map.size(), 1u);
    EXPECT_EQ(map.find("missing"), nullptr);
}

TEST_F(ThreadSafeMapTest, Erase) {
    map.insert("key", std::make_shared<Expiring>("a", 1));

    EXPECT_TRUE(map.erase("key"));
    EXPECT_FALSE(map.erase("key"));
    EXPECT_FALSE(map.contains("key"));
}

TEST_F(ThreadSafeMapTest, EraseIf_RemovesMatchingOnly) {
    fill(3, 10);
    fill(2, 50);

    size_t removed = map.eraseIf([](const Expiring& e) { return e.expiresAt < 20; });

    EXPECT_EQ(removed, 3u);
    EXPECT_EQ(map.size(), 2u);
}

TEST_F(ThreadSafeMapTest, EraseIf_NoMatches) {
    fill(4, 100);

    EXPECT_EQ(map.eraseIf([](const Expiring&) { return false; }), 0u);
    EXPECT_EQ(map.size(), 4u);
}

TEST_F(ThreadSafeMapTest, Clear) {
    fill(5, 1);
    map.clear();
    EXPECT_EQ(map.size(), 0u);
}

// Очистка параллельно с вставкой и чтением: свежие записи не теряются
TEST_F(ThreadSafeMapTest, EraseIfConcurrentWithWriters) {
    fill(500, 1);

    std::atomic<bool> done{false};
    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([this, w]() {
            for (int i = 0; i < 200; ++i) {
                std::string key = "fresh_" + std::to_string(w) + "_" + std::to_string(i);
                map.insert(key, std::make_shared<Expiring>("user", 1000));
                EXPECT_NE(map.find(key), nullptr);
            }
        });
    }

    std::thread sweeper([this, &done]() {
        while (!done) {
            map.eraseIf([](const Expiring& e) { return e.expiresAt < 500; });
        }
    });

    for (auto& t : writers) {
        t.join();
    }
    done = true;
    sweeper.join();

    map.eraseIf([](const Expiring& e) { return e.expiresAt < 500; });
    EXPECT_EQ(map.size(), 800u);
}
