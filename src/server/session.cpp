#include "session.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace chatrelay {

namespace {
const char *kMalformed = "Malformed request.";

std::string endpoint_string(const asio::ip::tcp::socket &sock) {
  std::error_code ec;
  auto ep = sock.remote_endpoint(ec);
  if (ec)
    return "?";
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}
} // namespace

Session::Session(tcp::socket sock, Router &router, const ServerConfig &cfg)
    : sock_(std::move(sock)), router_(router), cfg_(cfg),
      remote_(endpoint_string(sock_)) {}

void Session::start() {
  auto self = shared_from_this();
  asio::dispatch(sock_.get_executor(), [this, self]() { read_header(); });
}

void Session::stop() {
  auto self = shared_from_this();
  asio::dispatch(sock_.get_executor(),
                 [this, self]() { close("server shutdown", true); });
}

void Session::read_header() {
  auto self = shared_from_this();
  asio::async_read(sock_, asio::buffer(header_),
                   [this, self](std::error_code ec, std::size_t n) {
                     if (ec) {
                       on_read_error(ec, n == 0);
                       return;
                     }
                     uint32_t len = get_be32(header_.data());
                     if (len > cfg_.max_frame_size) {
                       Logger::instance().log(
                           LogLevel::WARN, "%s: frame of %u bytes refused",
                           remote_.c_str(), (unsigned)len);
                       close("frame too large");
                       return;
                     }
                     if (len == 0) {
                       payload_.clear();
                       on_frame();
                       return;
                     }
                     read_payload(len);
                   });
}

void Session::read_payload(uint32_t len) {
  payload_.resize(len);
  auto self = shared_from_this();
  asio::async_read(sock_, asio::buffer(payload_),
                   [this, self](std::error_code ec, std::size_t) {
                     if (ec) {
                       on_read_error(ec, false);
                       return;
                     }
                     on_frame();
                   });
}

void Session::on_read_error(const std::error_code &ec, bool frame_boundary) {
  if (state_ == State::Closed)
    return;
  if (ec == asio::error::eof && frame_boundary) {
    close("peer closed");
    return;
  }
  std::error_code why = ec;
  if (ec == asio::error::eof)
    why = errc::truncated_frame;
  Logger::instance().log(LogLevel::WARN, "%s: read failed: %s",
                         remote_.c_str(), why.message().c_str());
  close("read error");
}

void Session::on_frame() {
  if (state_ == State::Closed)
    return;
  ClientMessage req;
  std::error_code ec = decode(payload_.data(), payload_.size(), req);

  if (state_ == State::AwaitingRegistration) {
    if (ec) {
      Logger::instance().log(LogLevel::WARN, "%s: first frame: %s",
                             remote_.c_str(), ec.message().c_str());
      close("protocol violation");
      return;
    }
    ec = router_.register_peer(req, shared_from_this(), handle_);
    if (ec) {
      close(ec.message().c_str());
      return;
    }
    state_ = State::Active;
    read_header();
    return;
  }

  if (ec) {
    Logger::instance().log(LogLevel::WARN, "'%s': %s (%zu bytes)",
                           handle_.c_str(), ec.message().c_str(),
                           payload_.size());
    if (cfg_.decode_errors == DecodeErrorPolicy::Close) {
      close("malformed frame");
      return;
    }
    deliver(Error{kMalformed});
    read_header();
    return;
  }
  ec = router_.handle(handle_, req, *this);
  if (ec) {
    close(ec.message().c_str());
    return;
  }
  read_header();
}

void Session::deliver(const ServerMessage &msg) {
  auto self = shared_from_this();
  std::vector<uint8_t> frame = make_frame(encode(msg));
  asio::dispatch(sock_.get_executor(),
                 [this, self, frame = std::move(frame)]() mutable {
                   if (state_ == State::Closed)
                     return;
                   // One frame always fits; only a backlog counts against
                   // the limit.
                   if (!write_q_.empty() &&
                       queued_bytes_ + frame.size() > cfg_.max_queue_bytes) {
                     Logger::instance().log(
                         LogLevel::WARN,
                         "%s: send queue over %llu bytes, dropping peer",
                         remote_.c_str(),
                         (unsigned long long)cfg_.max_queue_bytes);
                     close("send queue full", true);
                     return;
                   }
                   queued_bytes_ += frame.size();
                   write_q_.emplace_back(std::move(frame));
                   if (write_q_.size() == 1)
                     do_write();
                 });
}

void Session::do_write() {
  auto self = shared_from_this();
  asio::async_write(
      sock_, asio::buffer(write_q_.front()),
      [this, self](std::error_code ec, std::size_t) {
        if (ec) {
          if (ec != asio::error::operation_aborted)
            Logger::instance().log(LogLevel::WARN, "%s: write failed: %s",
                                   remote_.c_str(), ec.message().c_str());
          write_q_.clear();
          queued_bytes_ = 0;
          if (state_ != State::Closed)
            close("write error");
          else
            shutdown_socket();
          return;
        }
        queued_bytes_ -= write_q_.front().size();
        write_q_.pop_front();
        if (!write_q_.empty())
          do_write();
        else if (state_ == State::Closed)
          shutdown_socket();
      });
}

void Session::close(const char *reason, bool force) {
  if (state_ == State::Closed) {
    // Still draining; a forced close cuts the drain short.
    if (force)
      shutdown_socket();
    return;
  }
  bool was_active = state_ == State::Active;
  state_ = State::Closed;
  Logger::instance().log(LogLevel::INFO, "%s%s%s closed: %s", remote_.c_str(),
                         handle_.empty() ? "" : " ",
                         handle_.empty() ? "" : handle_.c_str(), reason);
  if (was_active)
    router_.release(handle_);
  if (force && write_q_.size() > 1) {
    // The front buffer belongs to the write in flight.
    for (auto it = write_q_.begin() + 1; it != write_q_.end(); ++it)
      queued_bytes_ -= it->size();
    write_q_.erase(write_q_.begin() + 1, write_q_.end());
  }
  if (force || write_q_.empty()) {
    shutdown_socket();
    return;
  }
  // Let queued replies drain; stop reading meanwhile.
  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_receive, ec);
  if (ec)
    Logger::instance().log(LogLevel::DEBUG, "%s: shutdown: %s",
                           remote_.c_str(), ec.message().c_str());
}

void Session::shutdown_socket() {
  if (!sock_.is_open())
    return;
  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != asio::error::not_connected)
    Logger::instance().log(LogLevel::DEBUG, "%s: shutdown: %s",
                           remote_.c_str(), ec.message().c_str());
  sock_.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::DEBUG, "%s: close: %s", remote_.c_str(),
                           ec.message().c_str());
}

} // namespace chatrelay
