#include "registry.hpp"
#include "errors.hpp"
#include <algorithm>

namespace chatrelay {

std::error_code ConnectionRegistry::register_handle(const std::string &handle,
                                                    std::shared_ptr<Peer> peer) {
  if (handle.empty())
    return errc::invalid_handle;
  std::lock_guard<std::mutex> lk(mtx_);
  auto res = peers_.emplace(handle, std::move(peer));
  if (!res.second)
    return errc::handle_taken;
  return {};
}

void ConnectionRegistry::unregister(const std::string &handle) {
  std::lock_guard<std::mutex> lk(mtx_);
  peers_.erase(handle);
}

std::shared_ptr<Peer> ConnectionRegistry::lookup(const std::string &handle) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = peers_.find(handle);
  if (it == peers_.end())
    return nullptr;
  return it->second;
}

bool ConnectionRegistry::contains(const std::string &handle) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return peers_.count(handle) != 0;
}

std::vector<std::string> ConnectionRegistry::list_handles() const {
  std::vector<std::string> out;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    out.reserve(peers_.size());
    for (const auto &kv : peers_)
      out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return peers_.size();
}

} // namespace chatrelay
