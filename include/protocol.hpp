#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace chatrelay {

// One entry of a chat log.
struct Message {
    std::string sender;
    std::string content;
};

bool operator==(const Message& a, const Message& b);
bool operator!=(const Message& a, const Message& b);

// client -> server
struct Register    { std::string handle; };
struct ListUsers   {};
struct SendMessage { std::string content; std::string target; };
struct GetMessages { std::string target; };

using ClientMessage = std::variant<Register, ListUsers, SendMessage, GetMessages>;

// server -> client
struct Registered   { std::string handle; };
struct UserList     { std::vector<std::string> users; };
struct ChatMessages { std::string partner; std::vector<Message> messages; };
struct ChatMessage  { std::string sender; std::string content; };
struct Error        { std::string message; };

using ServerMessage = std::variant<Registered, UserList, ChatMessages, ChatMessage, Error>;

// Payloads are JSON, externally tagged by variant name:
//   "ListUsers"
//   {"SendMessage":{"content":"hi","target":"bob"}}
std::vector<uint8_t> encode(const ClientMessage& msg);
std::vector<uint8_t> encode(const ServerMessage& msg);

// Both return errc::decode_failed for anything that is not a message of
// the expected direction; `out` is untouched on failure.
std::error_code decode(const uint8_t* data, size_t len, ClientMessage& out);
std::error_code decode(const uint8_t* data, size_t len, ServerMessage& out);

const char* message_name(const ClientMessage& msg);
const char* message_name(const ServerMessage& msg);

} // namespace chatrelay
