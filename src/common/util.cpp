#include "util.hpp"
#include <cctype>

namespace chatrelay {

bool parse_uint(const std::string &s, uint64_t max, uint64_t &out) {
  if (s.empty() || s.size() > 20)
    return false;
  uint64_t v = 0;
  for (char ch : s) {
    if (!std::isdigit((unsigned char)ch))
      return false;
    uint64_t d = (uint64_t)(ch - '0');
    if (v > (max - d) / 10)
      return false;
    v = v * 10 + d;
  }
  out = v;
  return true;
}

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  std::string h = s.substr(0, pos);
  // [::1]:8080
  if (h.size() >= 2 && h.front() == '[' && h.back() == ']')
    h = h.substr(1, h.size() - 2);
  uint64_t p = 0;
  if (!parse_uint(s.substr(pos + 1), 65535, p))
    return false;
  host = h;
  port = (uint16_t)p;
  return true;
}

} // namespace chatrelay
