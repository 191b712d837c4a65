
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <unordered_map>

namespace ferry {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_size(const std::string &s, uint64_t &out) {
  if (s.empty())
    return false;
  size_t digits = 0;
  while (digits < s.size() && std::isdigit((unsigned char)s[digits]))
    digits++;
  if (digits == 0)
    return false;
  uint64_t mult = 1;
  std::string suffix = s.substr(digits);
  std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                 [](unsigned char c) { return (char)std::toupper(c); });
  if (suffix.empty() || suffix == "B")
    mult = 1;
  else if (suffix == "K" || suffix == "KB" || suffix == "KIB")
    mult = 1024;
  else if (suffix == "M" || suffix == "MB" || suffix == "MIB")
    mult = 1024 * 1024;
  else if (suffix == "G" || suffix == "GB" || suffix == "GIB")
    mult = 1024ull * 1024 * 1024;
  else
    return false;
  try {
    out = std::stoull(s.substr(0, digits)) * mult;
  } catch (const std::exception &) {
    return false;
  }
  return true;
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char *digits = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::string format_bytes(double bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  int u = 0;
  while (bytes >= 1024.0 && u < 4) {
    bytes /= 1024.0;
    u++;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.1f %s", bytes,
                units[u]);
  return buf;
}

std::string guess_mime_type(const std::string &file_name) {
  static const std::unordered_map<std::string, std::string> types = {
      {"txt", "text/plain"},         {"html", "text/html"},
      {"css", "text/css"},           {"csv", "text/csv"},
      {"json", "application/json"},  {"pdf", "application/pdf"},
      {"zip", "application/zip"},    {"gz", "application/gzip"},
      {"png", "image/png"},          {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"},        {"gif", "image/gif"},
      {"svg", "image/svg+xml"},      {"mp3", "audio/mpeg"},
      {"mp4", "video/mp4"},          {"webm", "video/webm"}};
  auto dot = file_name.rfind('.');
  if (dot != std::string::npos && dot + 1 < file_name.size()) {
    std::string ext = file_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    auto it = types.find(ext);
    if (it != types.end())
      return it->second;
  }
  return "application/octet-stream";
}

std::string sanitize_file_name(const std::string &name) {
  auto slash = name.find_last_of("/\\");
  std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
  size_t lead = 0;
  while (lead < base.size() && base[lead] == '.')
    lead++;
  base = base.substr(lead);
  if (base.empty())
    return "received.bin";
  return base;
}

} // namespace ferry
