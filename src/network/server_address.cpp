// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/server_address.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace nvr {
namespace network {

ServerAddress ServerAddress::Parse(const std::string& text) {
  ServerAddress address;
  address.text = text;

  if (text.find('/') != std::string::npos) {
    return address;
  }

  auto colon = text.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
    return address;
  }

  std::string port_str = text.substr(colon + 1);
  if (port_str.size() > 5 ||
      !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return address;
  }
  unsigned long port = std::strtoul(port_str.c_str(), nullptr, 10);
  if (port == 0 || port > 65535) {
    return address;
  }

  std::string host = text.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  } else if (host.find(':') != std::string::npos) {
    // Bare IPv6 literal without brackets is ambiguous
    return address;
  }
  if (host.empty()) {
    return address;
  }

  address.kind = Kind::TCP;
  address.host = host;
  address.port = static_cast<uint16_t>(port);
  return address;
}

std::string ResolveServerAddress(const std::optional<std::string>& servername, const char* env_value) {
  if (servername) {
    return *servername;
  }
  if (env_value != nullptr && env_value[0] != '\0') {
    return env_value;
  }
  return DEFAULT_SERVER_ADDRESS;
}

}  // namespace network
}  // namespace nvr
