#pragma once
#include <memory>
#include <string>
#include <system_error>
#include "chat_store.hpp"
#include "peer.hpp"
#include "protocol.hpp"
#include "registry.hpp"

namespace chatrelay {

// Applies client requests to the shared registry and store. Holds no state
// of its own; replies go to `self`, relays to the target's Peer.
class Router {
public:
    Router(ConnectionRegistry& registry, ChatStore& store);

    // Handles the first frame of a connection. On success `handle` is set and
    // Registered has been delivered. On handle_taken / invalid_handle an Error
    // has been delivered; on protocol_violation nothing is sent. Any error
    // means the connection must be closed.
    std::error_code register_peer(const ClientMessage& first,
                                  const std::shared_ptr<Peer>& self,
                                  std::string& handle);

    // Handles one request from a registered connection. Domain errors are
    // answered with Error and return success; a returned error is fatal to
    // the connection.
    std::error_code handle(const std::string& sender, const ClientMessage& req, Peer& self);

    void release(const std::string& handle);

private:
    void list_users(Peer& self);
    void get_messages(const std::string& sender, const GetMessages& req, Peer& self);
    void send_message(const std::string& sender, const SendMessage& req, Peer& self);

    ConnectionRegistry& registry_;
    ChatStore& store_;
};

} // namespace chatrelay
