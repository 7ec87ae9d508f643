#pragma once
#include <asio.hpp>
#include <array>
#include <deque>
#include <memory>
#include <string>
#include "peer.hpp"
#include "router.hpp"
#include "server_config.hpp"

namespace chatrelay {

// One accepted connection. All handlers run on the socket's strand, so the
// members below are only touched from that strand.
class Session : public Peer, public std::enable_shared_from_this<Session> {
public:
    using tcp = asio::ip::tcp;

    enum class State { AwaitingRegistration, Active, Closed };

    Session(tcp::socket sock, Router& router, const ServerConfig& cfg);

    void start();
    // Thread-safe; closes the connection as if the peer had gone away.
    void stop();

    void deliver(const ServerMessage& msg) override;
    std::string remote_address() const override { return remote_; }

private:
    void read_header();
    void read_payload(uint32_t len);
    void on_frame();
    void on_read_error(const std::error_code& ec, bool frame_boundary);
    void do_write();
    // `force` drops whatever is still queued instead of draining it first.
    void close(const char* reason, bool force = false);
    void shutdown_socket();

    tcp::socket sock_;
    Router& router_;
    const ServerConfig& cfg_;
    std::string remote_;

    State state_{State::AwaitingRegistration};
    std::string handle_;
    std::array<uint8_t, kFrameHeaderSize> header_{};
    std::vector<uint8_t> payload_;
    std::deque<std::vector<uint8_t>> write_q_;
    uint64_t queued_bytes_{0};
};

} // namespace chatrelay
