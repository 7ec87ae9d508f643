#pragma once
#include <asio.hpp>
#include <functional>
#include <memory>
#include <vector>
#include "chat_store.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "server_config.hpp"

namespace chatrelay {

class Session;

// Owns the shared state and accepts connections, one Session each.
class RelayServer {
public:
    using tcp = asio::ip::tcp;

    RelayServer(asio::io_context& io, const ServerConfig& cfg);

    // Throws std::system_error when the listen address cannot be bound.
    void start();
    // Stops accepting and closes every live session, dropping whatever they
    // still had queued. `done` runs on the acceptor strand once the last
    // session is gone. Thread-safe; later calls are ignored.
    void stop(std::function<void()> done = nullptr);

    // Bound port, valid after start(); resolves a configured port of 0.
    uint16_t port() const { return bound_port_; }

    ConnectionRegistry& registry() { return registry_; }
    ChatStore& store() { return store_; }

private:
    void do_accept();
    void prune_sessions();
    void wait_drained();

    asio::io_context& io_;
    ServerConfig cfg_;
    tcp::acceptor acceptor_;
    asio::steady_timer drain_timer_;
    uint16_t bound_port_{0};

    ConnectionRegistry registry_;
    ChatStore store_;
    Router router_;

    // Touched only on the acceptor's strand.
    std::vector<std::weak_ptr<Session>> sessions_;
    bool stopped_{false};
    std::function<void()> done_;
};

} // namespace chatrelay
