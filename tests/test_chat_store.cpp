#include <gtest/gtest.h>
#include "chat_store.hpp"
#include <thread>

using namespace chatrelay;

TEST(ChatKey, OrderIndependent) {
    auto ab = ChatKey::normalize("alice", "bob");
    auto ba = ChatKey::normalize("bob", "alice");
    ASSERT_TRUE(ab && ba);
    EXPECT_EQ(*ab, *ba);
    EXPECT_EQ(ab->first(), "alice");
    EXPECT_EQ(ab->second(), "bob");
}

TEST(ChatKey, HandlesAreCaseSensitive) {
    auto k1 = ChatKey::normalize("Alice", "bob");
    auto k2 = ChatKey::normalize("alice", "bob");
    ASSERT_TRUE(k1 && k2);
    EXPECT_NE(*k1, *k2);
    EXPECT_TRUE(ChatKey::normalize("Alice", "alice").has_value());
}

TEST(ChatKey, SelfPairIsInvalid) {
    EXPECT_FALSE(ChatKey::normalize("alice", "alice").has_value());
}

TEST(ChatStore, AppendKeepsOrderForBothOrderings) {
    ChatStore store;
    auto key = *ChatKey::normalize("alice", "bob");
    store.append(key, {"alice", "m1"});
    store.append(key, {"alice", "m2"});
    store.append(*ChatKey::normalize("bob", "alice"), {"bob", "m3"});

    auto log = store.get_log(*ChatKey::normalize("bob", "alice"));
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0], (Message{"alice", "m1"}));
    EXPECT_EQ(log[1], (Message{"alice", "m2"}));
    EXPECT_EQ(log[2], (Message{"bob", "m3"}));
    EXPECT_EQ(log, store.get_log(key));
    EXPECT_EQ(store.log_count(), 1u);
}

TEST(ChatStore, ReadDoesNotCreateLog) {
    ChatStore store;
    auto key = *ChatKey::normalize("carol", "dave");
    EXPECT_TRUE(store.get_log(key).empty());
    EXPECT_FALSE(store.has_log(key));
    EXPECT_EQ(store.log_count(), 0u);
}

TEST(ChatStore, PairsAreIsolated) {
    ChatStore store;
    store.append(*ChatKey::normalize("a", "b"), {"a", "to b"});
    store.append(*ChatKey::normalize("a", "c"), {"a", "to c"});
    EXPECT_EQ(store.get_log(*ChatKey::normalize("b", "a")).size(), 1u);
    EXPECT_EQ(store.get_log(*ChatKey::normalize("c", "a"))[0].content, "to c");
    EXPECT_TRUE(store.get_log(*ChatKey::normalize("b", "c")).empty());
    EXPECT_EQ(store.log_count(), 2u);
}

TEST(ChatStore, SnapshotUnaffectedByLaterAppends) {
    ChatStore store;
    auto key = *ChatKey::normalize("a", "b");
    store.append(key, {"a", "one"});
    auto snap = store.get_log(key);
    store.append(key, {"b", "two"});
    EXPECT_EQ(snap.size(), 1u);
    EXPECT_EQ(store.get_log(key).size(), 2u);
}

TEST(ChatStore, ConcurrentAppendsAllLandOncePerWriterInOrder) {
    ChatStore store;
    auto key = *ChatKey::normalize("a", "b");
    const int kPerThread = 500;
    std::thread ta([&] {
        for (int i = 0; i < kPerThread; i++)
            store.append(key, {"a", std::to_string(i)});
    });
    std::thread tb([&] {
        for (int i = 0; i < kPerThread; i++)
            store.append(key, {"b", std::to_string(i)});
    });
    ta.join();
    tb.join();

    auto log = store.get_log(key);
    ASSERT_EQ(log.size(), 2u * kPerThread);
    EXPECT_EQ(store.log_count(), 1u);
    int next_a = 0, next_b = 0;
    for (const auto& m : log) {
        int& next = m.sender == "a" ? next_a : next_b;
        EXPECT_EQ(m.content, std::to_string(next));
        next++;
    }
}
