#include "relay_server.hpp"
#include "logging.hpp"
#include "session.hpp"
#include <algorithm>

namespace chatrelay {

RelayServer::RelayServer(asio::io_context &io, const ServerConfig &cfg)
    : io_(io), cfg_(cfg), acceptor_(asio::make_strand(io)),
      drain_timer_(acceptor_.get_executor()), router_(registry_, store_) {}

void RelayServer::start() {
  tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  bound_port_ = acceptor_.local_endpoint().port();
  Logger::instance().log(LogLevel::INFO, "listening on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)bound_port_);
  asio::dispatch(acceptor_.get_executor(), [this]() { do_accept(); });
}

void RelayServer::stop(std::function<void()> done) {
  asio::dispatch(acceptor_.get_executor(), [this, done = std::move(done)]() {
    if (stopped_)
      return;
    stopped_ = true;
    done_ = done;
    std::error_code ec;
    acceptor_.close(ec);
    if (ec)
      Logger::instance().log(LogLevel::WARN, "acceptor close: %s",
                             ec.message().c_str());
    size_t n = 0;
    for (auto &w : sessions_) {
      if (auto s = w.lock()) {
        s->stop();
        n++;
      }
    }
    Logger::instance().log(LogLevel::INFO, "shutting down, closing %zu sessions",
                           n);
    wait_drained();
  });
}

void RelayServer::prune_sessions() {
  sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                 [](const std::weak_ptr<Session> &w) {
                                   return w.expired();
                                 }),
                  sessions_.end());
}

void RelayServer::wait_drained() {
  prune_sessions();
  if (sessions_.empty()) {
    Logger::instance().log(LogLevel::INFO, "all sessions closed");
    if (done_) {
      auto cb = std::move(done_);
      done_ = nullptr;
      cb();
    }
    return;
  }
  drain_timer_.expires_after(std::chrono::milliseconds(20));
  drain_timer_.async_wait([this](std::error_code ec) {
    if (ec)
      return;
    wait_drained();
  });
}

void RelayServer::do_accept() {
  acceptor_.async_accept(
      asio::make_strand(io_), [this](std::error_code ec, tcp::socket sock) {
        if (stopped_ || ec == asio::error::operation_aborted)
          return;
        if (ec) {
          Logger::instance().log(LogLevel::WARN, "accept failed: %s",
                                 ec.message().c_str());
          do_accept();
          return;
        }
        auto s = std::make_shared<Session>(std::move(sock), router_, cfg_);
        Logger::instance().log(LogLevel::INFO, "accepted %s",
                               s->remote_address().c_str());
        prune_sessions();
        sessions_.push_back(s);
        s->start();
        do_accept();
      });
}

} // namespace chatrelay
