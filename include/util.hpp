#pragma once
#include <string>
#include <cstdint>

namespace chatrelay {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
bool parse_uint(const std::string& s, uint64_t max, uint64_t& out);

} // namespace chatrelay
