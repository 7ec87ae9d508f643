#include "logging.hpp"
#include "relay_server.hpp"
#include "server_config.hpp"
#include <asio.hpp>
#include <algorithm>
#include <csignal>
#include <functional>
#include <iostream>
#include <thread>

using namespace chatrelay;

int main(int argc, char **argv) {
  ServerConfig cfg;
  std::string err;
  if (!parse_server_args(argc, argv, cfg, err)) {
    std::cerr << err << "\n" << server_usage();
    return 1;
  }
  if (cfg.help) {
    std::cout << server_usage();
    return 0;
  }
  if (cfg.threads <= 0)
    cfg.threads = (int)std::max(2u, std::thread::hardware_concurrency());
  Logger::instance().set_level(cfg.log_level);

  asio::io_context io;
  RelayServer server(io, cfg);
  try {
    server.start();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "cannot listen on %s:%u: %s",
                           cfg.listen_host.c_str(), (unsigned)cfg.listen_port,
                           e.what());
    return 1;
  }

  // First signal stops the server gracefully, a second one stops the loop.
  asio::signal_set signals(asio::make_strand(io), SIGINT, SIGTERM);
  int signal_count = 0;
  std::function<void(std::error_code, int)> on_signal =
      [&](std::error_code ec, int sig) {
        if (ec)
          return;
        if (++signal_count == 1) {
          Logger::instance().log(LogLevel::INFO,
                                 "signal %d received, shutting down", sig);
          server.stop([&]() {
            asio::post(signals.get_executor(), [&]() { signals.cancel(); });
          });
          signals.async_wait(on_signal);
        } else {
          Logger::instance().log(LogLevel::WARN,
                                 "signal %d received again, stopping now", sig);
          io.stop();
        }
      };
  signals.async_wait(on_signal);

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();
  return 0;
}
