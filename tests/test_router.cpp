#include <gtest/gtest.h>
#include "errors.hpp"
#include "logging.hpp"
#include "router.hpp"
#include "test_support.hpp"

using namespace chatrelay;
using chatrelay::testkit::FakePeer;

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().set_level(LogLevel::OFF); }

    std::shared_ptr<FakePeer> join(const std::string& handle) {
        auto p = std::make_shared<FakePeer>(handle + "-addr");
        std::string bound;
        EXPECT_FALSE(router.register_peer(Register{handle}, p, bound));
        EXPECT_EQ(bound, handle);
        return p;
    }

    template <typename T>
    static T last_as(const FakePeer& p) {
        return std::get<T>(p.last());
    }

    ConnectionRegistry registry;
    ChatStore store;
    Router router{registry, store};
};

TEST_F(RouterTest, RegisterRepliesRegistered) {
    auto alice = join("alice");
    ASSERT_EQ(alice->count(), 1u);
    EXPECT_EQ(last_as<Registered>(*alice).handle, "alice");
    EXPECT_EQ(registry.lookup("alice"), alice);
}

TEST_F(RouterTest, TakenHandleRepliesErrorAndLeavesOwner) {
    auto alice = join("alice");
    auto imposter = std::make_shared<FakePeer>();
    std::string bound;
    EXPECT_EQ(router.register_peer(Register{"alice"}, imposter, bound),
              errc::handle_taken);
    EXPECT_TRUE(bound.empty());
    EXPECT_EQ(last_as<Error>(*imposter).message, "Handle already taken");
    EXPECT_EQ(registry.lookup("alice"), alice);
}

TEST_F(RouterTest, EmptyHandleRejectedWithError) {
    auto p = std::make_shared<FakePeer>();
    std::string bound;
    EXPECT_EQ(router.register_peer(Register{""}, p, bound), errc::invalid_handle);
    EXPECT_TRUE(std::holds_alternative<Error>(p->last()));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(RouterTest, FirstRequestOtherThanRegisterIsViolation) {
    auto p = std::make_shared<FakePeer>();
    std::string bound;
    EXPECT_EQ(router.register_peer(ListUsers{}, p, bound), errc::protocol_violation);
    EXPECT_EQ(router.register_peer(SendMessage{"hi", "bob"}, p, bound),
              errc::protocol_violation);
    EXPECT_EQ(p->count(), 0u);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(RouterTest, ListUsersIncludesCaller) {
    auto alice = join("alice");
    auto bob = join("bob");
    EXPECT_FALSE(router.handle("bob", ListUsers{}, *bob));
    EXPECT_EQ(last_as<UserList>(*bob).users,
              (std::vector<std::string>{"alice", "bob"}));
}

TEST_F(RouterTest, SendMessageAppendsAndForwards) {
    auto alice = join("alice");
    auto bob = join("bob");
    EXPECT_FALSE(router.handle("alice", SendMessage{"hi", "bob"}, *alice));

    auto fwd = last_as<ChatMessage>(*bob);
    EXPECT_EQ(fwd.sender, "alice");
    EXPECT_EQ(fwd.content, "hi");
    // No acknowledgement to the sender.
    EXPECT_EQ(alice->count(), 1u);
    EXPECT_EQ(store.get_log(*ChatKey::normalize("bob", "alice")),
              (std::vector<Message>{{"alice", "hi"}}));
}

TEST_F(RouterTest, UnknownTargetIsErrorWithoutMutation) {
    auto alice = join("alice");
    EXPECT_FALSE(router.handle("alice", SendMessage{"boo", "ghost"}, *alice));
    EXPECT_EQ(last_as<Error>(*alice).message, "Target handle doesn't exist.");
    EXPECT_EQ(store.log_count(), 0u);
}

TEST_F(RouterTest, SelfChatRejected) {
    auto alice = join("alice");
    EXPECT_FALSE(router.handle("alice", SendMessage{"note", "alice"}, *alice));
    EXPECT_EQ(last_as<Error>(*alice).message, "Cannot chat with yourself.");
    EXPECT_FALSE(router.handle("alice", GetMessages{"alice"}, *alice));
    EXPECT_EQ(last_as<Error>(*alice).message, "Cannot chat with yourself.");
    EXPECT_EQ(store.log_count(), 0u);
}

TEST_F(RouterTest, GetMessagesReturnsHistoryForEitherSide) {
    auto alice = join("alice");
    auto bob = join("bob");
    ASSERT_FALSE(router.handle("alice", SendMessage{"m1", "bob"}, *alice));
    ASSERT_FALSE(router.handle("alice", SendMessage{"m2", "bob"}, *alice));
    ASSERT_FALSE(router.handle("bob", SendMessage{"m3", "alice"}, *bob));

    std::vector<Message> expect{{"alice", "m1"}, {"alice", "m2"}, {"bob", "m3"}};
    ASSERT_FALSE(router.handle("alice", GetMessages{"bob"}, *alice));
    EXPECT_EQ(last_as<ChatMessages>(*alice).partner, "bob");
    EXPECT_EQ(last_as<ChatMessages>(*alice).messages, expect);
    ASSERT_FALSE(router.handle("bob", GetMessages{"alice"}, *bob));
    EXPECT_EQ(last_as<ChatMessages>(*bob).partner, "alice");
    EXPECT_EQ(last_as<ChatMessages>(*bob).messages, expect);
}

TEST_F(RouterTest, GetMessagesOnFreshPairCreatesNothing) {
    auto alice = join("alice");
    ASSERT_FALSE(router.handle("alice", GetMessages{"nobody"}, *alice));
    EXPECT_EQ(last_as<ChatMessages>(*alice).partner, "nobody");
    EXPECT_TRUE(last_as<ChatMessages>(*alice).messages.empty());
    EXPECT_FALSE(store.has_log(*ChatKey::normalize("alice", "nobody")));
}

TEST_F(RouterTest, RegisterAfterRegistrationIsViolation) {
    auto alice = join("alice");
    EXPECT_EQ(router.handle("alice", Register{"alice2"}, *alice),
              errc::protocol_violation);
    EXPECT_FALSE(registry.contains("alice2"));
}

TEST_F(RouterTest, ReleaseFreesHandleButKeepsLogs) {
    auto alice = join("alice");
    auto bob = join("bob");
    ASSERT_FALSE(router.handle("alice", SendMessage{"hi", "bob"}, *alice));
    router.release("bob");
    EXPECT_FALSE(registry.contains("bob"));

    ASSERT_FALSE(router.handle("alice", SendMessage{"still there?", "bob"}, *alice));
    EXPECT_EQ(last_as<Error>(*alice).message, "Target handle doesn't exist.");

    auto bob2 = join("bob");
    ASSERT_FALSE(router.handle("bob", GetMessages{"alice"}, *bob2));
    EXPECT_EQ(last_as<ChatMessages>(*bob2).messages,
              (std::vector<Message>{{"alice", "hi"}}));
}
