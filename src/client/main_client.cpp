#include "client_connection.hpp"
#include "console.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <atomic>
#include <cstdlib>
#include <future>
#include <iostream>
#include <thread>

using namespace chatrelay;

int main(int argc, char **argv) {
  std::string server = "127.0.0.1:8080";
  std::string handle;
  LogLevel level = LogLevel::WARN;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--server")
      server = next(i);
    else if (a == "--handle")
      handle = next(i);
    else if (a == "--log-level") {
      std::string v = next(i);
      if (!parse_log_level(v, level)) {
        std::cerr << "bad log level: " << v << "\n";
        return 1;
      }
    } else {
      std::cerr << "usage: chatrelay_client [--server HOST:PORT] "
                   "[--handle NAME] [--log-level LEVEL]\n";
      return 1;
    }
  }
  Logger::instance().set_level(level);

  std::string host;
  uint16_t port;
  if (!parse_host_port(server, host, port)) {
    std::cerr << "bad server" << std::endl;
    return 1;
  }

  asio::io_context io;
  auto conn = std::make_shared<ClientConnection>(io);
  try {
    conn->connect(host, port);
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "connect %s failed: %s",
                           server.c_str(), e.what());
    return 1;
  }

  while (handle.empty()) {
    std::cout << "Handle: " << std::flush;
    if (!std::getline(std::cin, handle))
      return 0;
  }

  // Both handlers run on the connection's strand.
  ConsoleState state;
  std::promise<bool> registered;
  bool awaiting_reply = true;
  std::atomic<bool> closed{false};
  conn->start(
      [&](const ServerMessage &msg) {
        std::cout << state.render(msg) << std::endl;
        if (awaiting_reply) {
          awaiting_reply = false;
          registered.set_value(std::holds_alternative<Registered>(msg));
        }
      },
      [&](const std::error_code &) {
        if (awaiting_reply) {
          awaiting_reply = false;
          registered.set_value(false);
        }
        if (!closed.exchange(true))
          std::cout << "Server closed the connection." << std::endl;
      });
  conn->send(Register{handle});
  std::thread net([&]() { io.run(); });

  if (!registered.get_future().get()) {
    closed.store(true);
    conn->close();
    net.join();
    return 1;
  }
  std::cout << client_help() << std::endl;

  std::string line;
  while (!closed.load() && std::getline(std::cin, line)) {
    Input in = parse_input(line);
    switch (in.kind) {
    case Input::Kind::Users:
      conn->send(ListUsers{});
      break;
    case Input::Kind::Chat:
      state.set_partner(in.arg);
      conn->send(GetMessages{in.arg});
      break;
    case Input::Kind::Exit:
      if (state.partner().empty()) {
        closed.store(true);
        break;
      }
      state.clear_partner();
      std::cout << "Left the chat." << std::endl;
      break;
    case Input::Kind::Help:
      std::cout << client_help() << std::endl;
      break;
    case Input::Kind::Text:
      if (state.partner().empty()) {
        std::cout << "Not in a chat; use /chat <user> first." << std::endl;
        break;
      }
      conn->send(SendMessage{in.arg, state.partner()});
      break;
    case Input::Kind::Invalid:
      if (!in.arg.empty())
        std::cout << "Unknown command " << in.arg << "; try /help"
                  << std::endl;
      break;
    }
  }

  closed.store(true);
  conn->close();
  net.join();
  return 0;
}
