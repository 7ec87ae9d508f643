#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include "peer.hpp"

namespace chatrelay {

// Handle -> live connection. At most one entry per handle.
class ConnectionRegistry {
public:
    // errc::handle_taken if the handle is live, errc::invalid_handle if empty.
    std::error_code register_handle(const std::string& handle, std::shared_ptr<Peer> peer);
    // No-op when absent.
    void unregister(const std::string& handle);
    std::shared_ptr<Peer> lookup(const std::string& handle) const;
    bool contains(const std::string& handle) const;
    // Sorted snapshot.
    std::vector<std::string> list_handles() const;
    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Peer>> peers_;
};

} // namespace chatrelay
