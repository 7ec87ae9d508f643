#pragma once
#include <asio.hpp>
#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include "framing.hpp"
#include "protocol.hpp"

namespace chatrelay {

// Client end of a relay connection. The socket lives on a strand and is
// only touched from it; send() and close() may be called from any thread.
class ClientConnection : public std::enable_shared_from_this<ClientConnection> {
public:
    using tcp = asio::ip::tcp;
    using MessageHandler = std::function<void(const ServerMessage&)>;
    // Called once. The error code is clear when the server closed between
    // frames or close() was called.
    using CloseHandler = std::function<void(const std::error_code&)>;

    explicit ClientConnection(asio::io_context& io,
                              uint32_t max_frame_size = kClientMaxFrameSize);

    // Blocking. Throws std::system_error.
    void connect(const std::string& host, uint16_t port);
    // Handlers run on the connection's strand.
    void start(MessageHandler on_message, CloseHandler on_close);
    void send(const ClientMessage& msg);
    void close();

private:
    void read_header();
    void read_payload(uint32_t len);
    void do_write();
    void finish(const std::error_code& ec);

    tcp::socket sock_;
    uint32_t max_frame_size_;
    MessageHandler on_message_;
    CloseHandler on_close_;
    std::array<uint8_t, kFrameHeaderSize> header_{};
    std::vector<uint8_t> payload_;
    std::deque<std::vector<uint8_t>> write_q_;
    bool closed_{false};
};

} // namespace chatrelay
