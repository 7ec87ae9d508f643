#include "server_config.hpp"
#include "util.hpp"

namespace chatrelay {

const char *server_usage() {
  return "usage: chatrelay_server [host:port] [options]\n"
         "  --listen HOST:PORT       listen address (default 0.0.0.0:8080)\n"
         "  --threads N              io threads (default: cpu count, min 2)\n"
         "  --max-frame BYTES        largest accepted frame (default 1048576)\n"
         "  --max-queue BYTES        outbound backlog before a peer is dropped\n"
         "                           (default 16777216)\n"
         "  --decode-errors MODE     close | report (default close)\n"
         "  --log-level LEVEL        trace|debug|info|warn|error|off\n"
         "  --help                   show this text\n";
}

bool parse_server_args(int argc, const char *const *argv, ServerConfig &cfg,
                       std::string &err) {
  std::string listen;
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](std::string &out) -> bool {
      if (i + 1 < argc) {
        out = argv[++i];
        return true;
      }
      err = "missing value for " + a;
      return false;
    };
    std::string v;
    if (a == "--help" || a == "-h") {
      cfg.help = true;
      return true;
    } else if (a == "--listen") {
      if (!next(listen))
        return false;
    } else if (a == "--threads") {
      uint64_t n = 0;
      if (!next(v))
        return false;
      if (!parse_uint(v, 1024, n) || n == 0) {
        err = "bad thread count: " + v;
        return false;
      }
      cfg.threads = (int)n;
    } else if (a == "--max-frame") {
      uint64_t n = 0;
      if (!next(v))
        return false;
      if (!parse_uint(v, 0xFFFFFFFFull, n) || n == 0) {
        err = "bad frame size: " + v;
        return false;
      }
      cfg.max_frame_size = (uint32_t)n;
    } else if (a == "--max-queue") {
      uint64_t n = 0;
      if (!next(v))
        return false;
      if (!parse_uint(v, UINT64_MAX, n) || n == 0) {
        err = "bad queue size: " + v;
        return false;
      }
      cfg.max_queue_bytes = n;
    } else if (a == "--decode-errors") {
      if (!next(v))
        return false;
      if (v == "close")
        cfg.decode_errors = DecodeErrorPolicy::Close;
      else if (v == "report")
        cfg.decode_errors = DecodeErrorPolicy::Report;
      else {
        err = "bad decode error policy: " + v;
        return false;
      }
    } else if (a == "--log-level") {
      if (!next(v))
        return false;
      if (!parse_log_level(v, cfg.log_level)) {
        err = "bad log level: " + v;
        return false;
      }
    } else if (!a.empty() && a[0] != '-' && listen.empty()) {
      listen = a;
    } else {
      err = "unknown argument: " + a;
      return false;
    }
  }
  if (!listen.empty() &&
      !parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    err = "bad listen address: " + listen;
    return false;
  }
  return true;
}

} // namespace chatrelay
