#include "chat_store.hpp"

namespace chatrelay {

std::optional<ChatKey> ChatKey::normalize(const std::string &a,
                                          const std::string &b) {
  if (a == b)
    return std::nullopt;
  if (b < a)
    return ChatKey(b, a);
  return ChatKey(a, b);
}

bool ChatKey::operator<(const ChatKey &o) const {
  if (first_ != o.first_)
    return first_ < o.first_;
  return second_ < o.second_;
}

void ChatStore::append(const ChatKey &key, Message msg) {
  std::lock_guard<std::mutex> lk(mtx_);
  logs_[key].push_back(std::move(msg));
}

std::vector<Message> ChatStore::get_log(const ChatKey &key) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = logs_.find(key);
  if (it == logs_.end())
    return {};
  return it->second;
}

bool ChatStore::has_log(const ChatKey &key) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return logs_.count(key) != 0;
}

size_t ChatStore::log_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return logs_.size();
}

} // namespace chatrelay
