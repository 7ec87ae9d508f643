#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace chatrelay {

// Unordered pair of two distinct handles, stored lexicographically.
class ChatKey {
public:
    // nullopt when a == b.
    static std::optional<ChatKey> normalize(const std::string& a, const std::string& b);

    const std::string& first() const { return first_; }
    const std::string& second() const { return second_; }

    bool operator==(const ChatKey& o) const { return first_ == o.first_ && second_ == o.second_; }
    bool operator!=(const ChatKey& o) const { return !(*this == o); }
    bool operator<(const ChatKey& o) const;

private:
    ChatKey(std::string first, std::string second)
        : first_(std::move(first)), second_(std::move(second)) {}
    std::string first_;
    std::string second_;
};

// Append-only chat logs, one per key, created on first append.
class ChatStore {
public:
    void append(const ChatKey& key, Message msg);
    // Copy of the log; empty and not created when absent.
    std::vector<Message> get_log(const ChatKey& key) const;
    bool has_log(const ChatKey& key) const;
    size_t log_count() const;

private:
    mutable std::mutex mtx_;
    std::map<ChatKey, std::vector<Message>> logs_;
};

} // namespace chatrelay
