#pragma once
#include <mutex>
#include <string>
#include "protocol.hpp"

namespace chatrelay {

struct Input {
    enum class Kind { Users, Chat, Exit, Help, Text, Invalid };
    Kind kind{Kind::Invalid};
    std::string arg;
};

Input parse_input(const std::string& line);

const char* client_help();

// Which partner the console is chatting with; shared by the stdin loop and
// the reader thread.
class ConsoleState {
public:
    std::string partner() const;
    void set_partner(const std::string& p);
    void clear_partner();
    // Text to print for a message from the server.
    std::string render(const ServerMessage& msg) const;

private:
    mutable std::mutex mtx_;
    std::string partner_;
};

} // namespace chatrelay
