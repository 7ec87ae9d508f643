#include "console.hpp"
#include <sstream>

namespace chatrelay {

const char *client_help() {
  return "Commands:\n"
         "  /users        list connected users\n"
         "  /chat <user>  chat with a user and show the history\n"
         "  /exit         leave the current chat, or quit\n"
         "  /help         show this text\n"
         "Anything else is sent to the current chat partner.";
}

Input parse_input(const std::string &line) {
  Input in;
  if (line.empty() || line[0] != '/') {
    in.kind = line.empty() ? Input::Kind::Invalid : Input::Kind::Text;
    in.arg = line;
    return in;
  }
  std::istringstream ss(line);
  std::string cmd, arg, extra;
  ss >> cmd >> arg >> extra;
  if (cmd == "/users" && arg.empty()) {
    in.kind = Input::Kind::Users;
  } else if (cmd == "/chat" && !arg.empty() && extra.empty()) {
    in.kind = Input::Kind::Chat;
    in.arg = arg;
  } else if (cmd == "/exit" && arg.empty()) {
    in.kind = Input::Kind::Exit;
  } else if (cmd == "/help") {
    in.kind = Input::Kind::Help;
  } else {
    in.kind = Input::Kind::Invalid;
    in.arg = cmd;
  }
  return in;
}

std::string ConsoleState::partner() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return partner_;
}

void ConsoleState::set_partner(const std::string &p) {
  std::lock_guard<std::mutex> lk(mtx_);
  partner_ = p;
}

void ConsoleState::clear_partner() {
  std::lock_guard<std::mutex> lk(mtx_);
  partner_.clear();
}

std::string ConsoleState::render(const ServerMessage &msg) const {
  std::string partner = this->partner();
  std::ostringstream out;
  if (auto *m = std::get_if<Registered>(&msg)) {
    out << "Registered as " << m->handle;
  } else if (auto *m = std::get_if<UserList>(&msg)) {
    out << "Users:";
    for (const auto &u : m->users)
      out << "\n  " << u;
  } else if (auto *m = std::get_if<ChatMessages>(&msg)) {
    out << "-- chat with " << m->partner << " --";
    for (const auto &e : m->messages)
      out << "\n" << e.sender << ": " << e.content;
  } else if (auto *m = std::get_if<ChatMessage>(&msg)) {
    if (m->sender == partner)
      out << m->sender << ": " << m->content;
    else
      out << m->sender << " just sent you a message. Join the chat using '/chat "
          << m->sender << "'";
  } else if (auto *m = std::get_if<Error>(&msg)) {
    out << "Error: " << m->message;
  }
  return out.str();
}

} // namespace chatrelay
