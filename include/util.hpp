
#pragma once
#include <string>
#include <cstdint>
#include <vector>

namespace ferry {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
// Accepts plain byte counts and K/M/G suffixes (binary multiples).
bool parse_size(const std::string& s, uint64_t& out);
std::string bytes_to_hex(const uint8_t* data, size_t len);
std::string format_bytes(double bytes);
std::string guess_mime_type(const std::string& file_name);
// Last path component with separators and leading dots removed.
std::string sanitize_file_name(const std::string& name);

} // namespace ferry
