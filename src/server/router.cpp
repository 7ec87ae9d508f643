#include "router.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace chatrelay {

namespace {
const char *kHandleTaken = "Handle already taken";
const char *kHandleEmpty = "Handle must not be empty.";
const char *kTargetUnknown = "Target handle doesn't exist.";
const char *kSelfChat = "Cannot chat with yourself.";
} // namespace

Router::Router(ConnectionRegistry &registry, ChatStore &store)
    : registry_(registry), store_(store) {}

std::error_code Router::register_peer(const ClientMessage &first,
                                      const std::shared_ptr<Peer> &self,
                                      std::string &handle) {
  const Register *reg = std::get_if<Register>(&first);
  if (!reg) {
    Logger::instance().log(LogLevel::WARN,
                           "%s: expected Register, got %s",
                           self->remote_address().c_str(), message_name(first));
    return errc::protocol_violation;
  }
  std::error_code ec = registry_.register_handle(reg->handle, self);
  if (ec == errc::handle_taken) {
    Logger::instance().log(LogLevel::INFO, "%s: handle '%s' already taken",
                           self->remote_address().c_str(), reg->handle.c_str());
    self->deliver(Error{kHandleTaken});
    return ec;
  }
  if (ec == errc::invalid_handle) {
    Logger::instance().log(LogLevel::INFO, "%s: empty handle rejected",
                           self->remote_address().c_str());
    self->deliver(Error{kHandleEmpty});
    return ec;
  }
  if (ec)
    return ec;
  handle = reg->handle;
  Logger::instance().log(LogLevel::INFO, "%s registered as '%s'",
                         self->remote_address().c_str(), handle.c_str());
  self->deliver(Registered{handle});
  return {};
}

std::error_code Router::handle(const std::string &sender,
                               const ClientMessage &req, Peer &self) {
  if (std::holds_alternative<ListUsers>(req)) {
    list_users(self);
  } else if (auto *gm = std::get_if<GetMessages>(&req)) {
    get_messages(sender, *gm, self);
  } else if (auto *sm = std::get_if<SendMessage>(&req)) {
    send_message(sender, *sm, self);
  } else {
    Logger::instance().log(LogLevel::WARN, "'%s' sent %s after registering",
                           sender.c_str(), message_name(req));
    return errc::protocol_violation;
  }
  return {};
}

void Router::release(const std::string &handle) {
  registry_.unregister(handle);
  Logger::instance().log(LogLevel::INFO, "'%s' left", handle.c_str());
}

void Router::list_users(Peer &self) {
  self.deliver(UserList{registry_.list_handles()});
}

void Router::get_messages(const std::string &sender, const GetMessages &req,
                          Peer &self) {
  auto key = ChatKey::normalize(sender, req.target);
  if (!key) {
    self.deliver(Error{kSelfChat});
    return;
  }
  self.deliver(ChatMessages{req.target, store_.get_log(*key)});
}

void Router::send_message(const std::string &sender, const SendMessage &req,
                          Peer &self) {
  auto key = ChatKey::normalize(sender, req.target);
  if (!key) {
    self.deliver(Error{kSelfChat});
    return;
  }
  // The shared_ptr keeps the target alive for the relay; deliver() only
  // queues, so no lock is held across socket I/O.
  std::shared_ptr<Peer> target = registry_.lookup(req.target);
  if (!target) {
    Logger::instance().log(LogLevel::DEBUG, "'%s' -> '%s': no such handle",
                           sender.c_str(), req.target.c_str());
    self.deliver(Error{kTargetUnknown});
    return;
  }
  store_.append(*key, Message{sender, req.content});
  Logger::instance().log(LogLevel::DEBUG, "relay '%s' -> '%s' (%zu bytes)",
                         sender.c_str(), req.target.c_str(),
                         req.content.size());
  target->deliver(ChatMessage{sender, req.content});
}

} // namespace chatrelay
