#pragma once
#include <string>
#include "protocol.hpp"

namespace chatrelay {

// Outbound side of a live connection. deliver() only queues the message
// for the connection's own writer; it never blocks on the socket and is
// safe to call from any thread.
class Peer {
public:
    virtual ~Peer() = default;
    virtual void deliver(const ServerMessage& msg) = 0;
    virtual std::string remote_address() const = 0;
};

} // namespace chatrelay
