#pragma once
#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <system_error>
#include <vector>
#include "errors.hpp"
#include "protocol.hpp"

namespace chatrelay {

// Frame: [u32 big-endian payload length][payload]
constexpr size_t   kFrameHeaderSize = 4;
constexpr uint32_t kDefaultMaxFrameSize = 1u << 20;
// Server replies are not bounded by the request limit (a relayed message
// grows by its sender, a history by its length), so clients take any size.
constexpr uint32_t kClientMaxFrameSize = std::numeric_limits<uint32_t>::max();

void put_be32(uint8_t* out, uint32_t v);
uint32_t get_be32(const uint8_t* in);

// Header and payload in one buffer, ready for a single write.
std::vector<uint8_t> make_frame(const std::vector<uint8_t>& payload);

template <typename SyncWriteStream>
void write_frame(SyncWriteStream& s, const std::vector<uint8_t>& payload,
                 std::error_code& ec) {
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        ec = errc::frame_too_large;
        return;
    }
    uint8_t hdr[kFrameHeaderSize];
    put_be32(hdr, (uint32_t)payload.size());
    std::array<asio::const_buffer, 2> bufs{{asio::buffer(hdr), asio::buffer(payload)}};
    asio::write(s, bufs, ec);
}

// Returns true with a complete payload. Returns false with `ec` clear when
// the peer closed before the first byte of a new frame, and false with `ec`
// set on any other failure (truncated_frame when the stream ends mid-frame).
template <typename SyncReadStream>
bool read_frame(SyncReadStream& s, std::vector<uint8_t>& payload,
                std::error_code& ec, uint32_t max_size = kDefaultMaxFrameSize) {
    ec.clear();
    uint8_t hdr[kFrameHeaderSize];
    size_t n = asio::read(s, asio::buffer(hdr), ec);
    if (ec) {
        if (ec == asio::error::eof) {
            if (n == 0)
                ec.clear();
            else
                ec = errc::truncated_frame;
        }
        return false;
    }
    uint32_t len = get_be32(hdr);
    if (len > max_size) {
        ec = errc::frame_too_large;
        return false;
    }
    payload.resize(len);
    if (len == 0)
        return true;
    asio::read(s, asio::buffer(payload), ec);
    if (ec) {
        if (ec == asio::error::eof)
            ec = errc::truncated_frame;
        return false;
    }
    return true;
}

template <typename SyncWriteStream, typename Msg>
void write_message(SyncWriteStream& s, const Msg& msg, std::error_code& ec) {
    write_frame(s, encode(msg), ec);
}

// Same contract as read_frame, plus errc::decode_failed for a bad payload.
template <typename SyncReadStream, typename Msg>
bool read_message(SyncReadStream& s, Msg& out, std::error_code& ec,
                  uint32_t max_size = kDefaultMaxFrameSize) {
    std::vector<uint8_t> payload;
    if (!read_frame(s, payload, ec, max_size))
        return false;
    ec = decode(payload.data(), payload.size(), out);
    return !ec;
}

} // namespace chatrelay
