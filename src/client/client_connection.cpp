#include "client_connection.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace chatrelay {

ClientConnection::ClientConnection(asio::io_context &io,
                                   uint32_t max_frame_size)
    : sock_(asio::make_strand(io)), max_frame_size_(max_frame_size) {}

void ClientConnection::connect(const std::string &host, uint16_t port) {
  tcp::resolver res(sock_.get_executor());
  asio::connect(sock_, res.resolve(host, std::to_string(port)));
}

void ClientConnection::start(MessageHandler on_message, CloseHandler on_close) {
  auto self = shared_from_this();
  asio::dispatch(sock_.get_executor(),
                 [this, self, on_message = std::move(on_message),
                  on_close = std::move(on_close)]() mutable {
                   on_message_ = std::move(on_message);
                   on_close_ = std::move(on_close);
                   read_header();
                 });
}

void ClientConnection::send(const ClientMessage &msg) {
  auto self = shared_from_this();
  std::vector<uint8_t> frame = make_frame(encode(msg));
  asio::post(sock_.get_executor(),
             [this, self, frame = std::move(frame)]() mutable {
               if (closed_)
                 return;
               write_q_.emplace_back(std::move(frame));
               if (write_q_.size() == 1)
                 do_write();
             });
}

void ClientConnection::close() {
  auto self = shared_from_this();
  asio::post(sock_.get_executor(),
             [this, self]() { finish(std::error_code()); });
}

void ClientConnection::read_header() {
  auto self = shared_from_this();
  asio::async_read(sock_, asio::buffer(header_),
                   [this, self](std::error_code ec, std::size_t n) {
                     if (ec) {
                       if (ec == asio::error::eof)
                         ec = n == 0 ? std::error_code()
                                     : make_error_code(errc::truncated_frame);
                       finish(ec);
                       return;
                     }
                     uint32_t len = get_be32(header_.data());
                     if (len > max_frame_size_) {
                       finish(errc::frame_too_large);
                       return;
                     }
                     read_payload(len);
                   });
}

void ClientConnection::read_payload(uint32_t len) {
  payload_.resize(len);
  auto self = shared_from_this();
  asio::async_read(sock_, asio::buffer(payload_),
                   [this, self](std::error_code ec, std::size_t) {
                     if (ec) {
                       if (ec == asio::error::eof)
                         ec = errc::truncated_frame;
                       finish(ec);
                       return;
                     }
                     ServerMessage msg;
                     ec = decode(payload_.data(), payload_.size(), msg);
                     if (ec)
                       Logger::instance().log(LogLevel::WARN,
                                              "dropping reply: %s (%zu bytes)",
                                              ec.message().c_str(),
                                              payload_.size());
                     else if (on_message_)
                       on_message_(msg);
                     if (!closed_)
                       read_header();
                   });
}

void ClientConnection::do_write() {
  auto self = shared_from_this();
  asio::async_write(sock_, asio::buffer(write_q_.front()),
                    [this, self](std::error_code ec, std::size_t) {
                      if (ec) {
                        write_q_.clear();
                        finish(ec);
                        return;
                      }
                      write_q_.pop_front();
                      if (!write_q_.empty() && !closed_)
                        do_write();
                    });
}

void ClientConnection::finish(const std::error_code &ec) {
  if (closed_)
    return;
  closed_ = true;
  if (ec)
    Logger::instance().log(LogLevel::WARN, "connection lost: %s",
                           ec.message().c_str());
  std::error_code sec;
  sock_.shutdown(tcp::socket::shutdown_both, sec);
  if (sec && sec != asio::error::not_connected)
    Logger::instance().log(LogLevel::DEBUG, "shutdown: %s",
                           sec.message().c_str());
  sock_.close(sec);
  if (on_close_) {
    auto cb = std::move(on_close_);
    on_close_ = nullptr;
    cb(ec);
  }
}

} // namespace chatrelay
