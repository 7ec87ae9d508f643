#pragma once
#include <cstdint>
#include <string>
#include "framing.hpp"
#include "logging.hpp"

namespace chatrelay {

constexpr uint64_t kDefaultMaxQueueBytes = 16ull << 20;

// What an active connection does with a frame that does not decode.
enum class DecodeErrorPolicy { Close, Report };

struct ServerConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{8080};
    int threads{0};  // 0: hardware concurrency, at least 2
    uint32_t max_frame_size{kDefaultMaxFrameSize};
    // Outbound backlog per connection before the peer is dropped as stalled.
    uint64_t max_queue_bytes{kDefaultMaxQueueBytes};
    DecodeErrorPolicy decode_errors{DecodeErrorPolicy::Close};
    LogLevel log_level{LogLevel::INFO};
    bool help{false};
};

// Fills `cfg` from argv. On failure returns false and sets `err`.
bool parse_server_args(int argc, const char* const* argv, ServerConfig& cfg, std::string& err);

const char* server_usage();

} // namespace chatrelay
