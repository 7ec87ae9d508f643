#include "framing.hpp"
#include <cstring>

namespace chatrelay {

void put_be32(uint8_t *out, uint32_t v) {
  out[0] = (uint8_t)(v >> 24);
  out[1] = (uint8_t)(v >> 16);
  out[2] = (uint8_t)(v >> 8);
  out[3] = (uint8_t)v;
}

uint32_t get_be32(const uint8_t *in) {
  return ((uint32_t)in[0] << 24) | ((uint32_t)in[1] << 16) |
         ((uint32_t)in[2] << 8) | (uint32_t)in[3];
}

std::vector<uint8_t> make_frame(const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> buf(kFrameHeaderSize + payload.size());
  put_be32(buf.data(), (uint32_t)payload.size());
  if (!payload.empty())
    std::memcpy(buf.data() + kFrameHeaderSize, payload.data(), payload.size());
  return buf;
}

} // namespace chatrelay
