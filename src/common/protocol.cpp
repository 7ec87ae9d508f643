#include "protocol.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

namespace chatrelay {

using json = nlohmann::json;

bool operator==(const Message &a, const Message &b) {
  return a.sender == b.sender && a.content == b.content;
}

bool operator!=(const Message &a, const Message &b) { return !(a == b); }

namespace {

json tagged(const char *name, json fields) {
  json j = json::object();
  j[name] = std::move(fields);
  return j;
}

std::vector<uint8_t> to_bytes(const json &j) {
  // Bytes that are not valid UTF-8 go out as U+FFFD. The parser never lets
  // them in, so only locally built strings (console input) can carry them.
  std::string s = j.dump(-1, ' ', false, json::error_handler_t::replace);
  return std::vector<uint8_t>(s.begin(), s.end());
}

struct ClientEncoder {
  json operator()(const Register &m) const {
    return tagged("Register", json{{"handle", m.handle}});
  }
  json operator()(const ListUsers &) const { return json("ListUsers"); }
  json operator()(const SendMessage &m) const {
    return tagged("SendMessage",
                  json{{"content", m.content}, {"target", m.target}});
  }
  json operator()(const GetMessages &m) const {
    return tagged("GetMessages", json{{"target", m.target}});
  }
};

struct ServerEncoder {
  json operator()(const Registered &m) const {
    return tagged("Registered", json{{"handle", m.handle}});
  }
  json operator()(const UserList &m) const {
    return tagged("UserList", json{{"users", m.users}});
  }
  json operator()(const ChatMessages &m) const {
    json msgs = json::array();
    for (const auto &e : m.messages)
      msgs.push_back(json{{"sender", e.sender}, {"content", e.content}});
    return tagged("ChatMessages",
                  json{{"partner", m.partner}, {"messages", std::move(msgs)}});
  }
  json operator()(const ChatMessage &m) const {
    return tagged("ChatMessage",
                  json{{"sender", m.sender}, {"content", m.content}});
  }
  json operator()(const Error &m) const {
    return tagged("Error", json{{"message", m.message}});
  }
};

// Unit variants arrive as a bare string, the rest as {"Tag":{...}}.
// `body` is null for the bare string form.
bool split_tag(const json &j, std::string &tag, const json *&body) {
  if (j.is_string()) {
    tag = j.get<std::string>();
    body = nullptr;
    return true;
  }
  if (j.is_object() && j.size() == 1) {
    tag = j.begin().key();
    body = &j.begin().value();
    return body->is_object();
  }
  return false;
}

std::string str_field(const json &body, const char *key) {
  return body.at(key).get<std::string>();
}

} // namespace

std::vector<uint8_t> encode(const ClientMessage &msg) {
  return to_bytes(std::visit(ClientEncoder{}, msg));
}

std::vector<uint8_t> encode(const ServerMessage &msg) {
  return to_bytes(std::visit(ServerEncoder{}, msg));
}

std::error_code decode(const uint8_t *data, size_t len, ClientMessage &out) {
  json j = json::parse(data, data + len, nullptr, false);
  if (j.is_discarded())
    return errc::decode_failed;
  std::string tag;
  const json *body = nullptr;
  if (!split_tag(j, tag, body))
    return errc::decode_failed;
  try {
    if (!body) {
      if (tag == "ListUsers") {
        out = ListUsers{};
        return {};
      }
      return errc::decode_failed;
    }
    if (tag == "Register") {
      out = Register{str_field(*body, "handle")};
    } else if (tag == "SendMessage") {
      out = SendMessage{str_field(*body, "content"),
                        str_field(*body, "target")};
    } else if (tag == "GetMessages") {
      out = GetMessages{str_field(*body, "target")};
    } else {
      return errc::decode_failed;
    }
  } catch (const json::exception &) {
    return errc::decode_failed;
  }
  return {};
}

std::error_code decode(const uint8_t *data, size_t len, ServerMessage &out) {
  json j = json::parse(data, data + len, nullptr, false);
  if (j.is_discarded())
    return errc::decode_failed;
  std::string tag;
  const json *body = nullptr;
  if (!split_tag(j, tag, body) || !body)
    return errc::decode_failed;
  try {
    if (tag == "Registered") {
      out = Registered{str_field(*body, "handle")};
    } else if (tag == "UserList") {
      const json &users = body->at("users");
      if (!users.is_array())
        return errc::decode_failed;
      UserList ul;
      for (const auto &u : users)
        ul.users.push_back(u.get<std::string>());
      out = std::move(ul);
    } else if (tag == "ChatMessages") {
      const json &msgs = body->at("messages");
      if (!msgs.is_array())
        return errc::decode_failed;
      ChatMessages cm;
      cm.partner = str_field(*body, "partner");
      for (const auto &m : msgs)
        cm.messages.push_back(
            Message{str_field(m, "sender"), str_field(m, "content")});
      out = std::move(cm);
    } else if (tag == "ChatMessage") {
      out = ChatMessage{str_field(*body, "sender"),
                        str_field(*body, "content")};
    } else if (tag == "Error") {
      out = Error{str_field(*body, "message")};
    } else {
      return errc::decode_failed;
    }
  } catch (const json::exception &) {
    return errc::decode_failed;
  }
  return {};
}

const char *message_name(const ClientMessage &msg) {
  static const char *names[] = {"Register", "ListUsers", "SendMessage",
                                "GetMessages"};
  return names[msg.index()];
}

const char *message_name(const ServerMessage &msg) {
  static const char *names[] = {"Registered", "UserList", "ChatMessages",
                                "ChatMessage", "Error"};
  return names[msg.index()];
}

} // namespace chatrelay
