#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct GroupSlotStub {
    std::mutex mutex;
    std::string groupId;
    int updates = 0;

    explicit GroupSlotStub(const std::string& id = "") : groupId(id) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, GroupSlotStub> slots;
};

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    slots.insert("brk-1", std::make_shared<GroupSlotStub>("brk-1"));

    auto found = slots.find("brk-1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->groupId, "brk-1");
    EXPECT_EQ(slots.find("brk-2"), nullptr);
}

TEST_F(ThreadSafeMapTest, Insert_SameKey_ReplacesValue) {
    slots.insert("key", std::make_shared<GroupSlotStub>("first"));
    slots.insert("key", std::make_shared<GroupSlotStub>("second"));

    EXPECT_EQ(slots.find("key")->groupId, "second");
    EXPECT_EQ(slots.values().size(), 1u);
}

TEST_F(ThreadSafeMapTest, Erase_RemovesKey) {
    slots.insert("key", std::make_shared<GroupSlotStub>("key"));

    EXPECT_TRUE(slots.erase("key"));
    EXPECT_FALSE(slots.erase("key"));
    EXPECT_EQ(slots.find("key"), nullptr);
    EXPECT_TRUE(slots.values().empty());
}

TEST_F(ThreadSafeMapTest, Values_ReturnsSnapshot) {
    slots.insert("a", std::make_shared<GroupSlotStub>("a"));
    slots.insert("b", std::make_shared<GroupSlotStub>("b"));

    auto values = slots.values();
    slots.erase("a");
    slots.erase("b");

    ASSERT_EQ(values.size(), 2u);
    std::vector<std::string> ids;
    for (const auto& v : values) {
        ids.push_back(v->groupId);
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(slots.values().empty());
}

// Найденный объект живёт дольше записи в словаре
TEST_F(ThreadSafeMapTest, FoundValue_SurvivesErase) {
    slots.insert("key", std::make_shared<GroupSlotStub>("kept"));
    auto held = slots.find("key");

    slots.erase("key");

    ASSERT_NE(held, nullptr);
    EXPECT_EQ(held->groupId, "kept");
}

// Обновления одного слота сериализуются его собственным мьютексом
TEST_F(ThreadSafeMapTest, ConcurrentSlotUpdates_NoLostWrites) {
    slots.insert("shared", std::make_shared<GroupSlotStub>("shared"));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 250; ++i) {
                auto slot = slots.find("shared");
                std::lock_guard<std::mutex> lock(slot->mutex);
                ++slot->updates;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(slots.find("shared")->updates, 2000);
}

TEST_F(ThreadSafeMapTest, ConcurrentWriters_AllKeysVisible) {
    std::vector<std::thread> threads;
    for (int writer = 0; writer < 5; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < 100; ++i) {
                std::string key = "w" + std::to_string(writer) + "_" + std::to_string(i);
                slots.insert(key, std::make_shared<GroupSlotStub>(key));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(slots.values().size(), 500u);
    for (int writer = 0; writer < 5; ++writer) {
        for (int i = 0; i < 100; ++i) {
            std::string key = "w" + std::to_string(writer) + "_" + std::to_string(i);
            ASSERT_NE(slots.find(key), nullptr) << "Missing key: " << key;
        }
    }
}
