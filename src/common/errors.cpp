#include "errors.hpp"

namespace chatrelay {

namespace {

class RelayCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "chatrelay"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::handle_taken:
      return "handle already taken";
    case errc::invalid_handle:
      return "invalid handle";
    case errc::invalid_pair:
      return "a handle cannot chat with itself";
    case errc::target_unknown:
      return "target handle is not registered";
    case errc::decode_failed:
      return "malformed message payload";
    case errc::frame_too_large:
      return "frame exceeds maximum size";
    case errc::truncated_frame:
      return "stream closed mid-frame";
    case errc::protocol_violation:
      return "protocol violation";
    }
    return "unknown chatrelay error";
  }
};

} // namespace

const std::error_category &relay_category() noexcept {
  static RelayCategory cat;
  return cat;
}

std::error_code make_error_code(errc e) noexcept {
  return std::error_code(static_cast<int>(e), relay_category());
}

} // namespace chatrelay
