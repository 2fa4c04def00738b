// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace nvr {
namespace network {

// Used when neither --servername nor NVIM_LISTEN_ADDRESS is given
inline constexpr const char* DEFAULT_SERVER_ADDRESS = "/tmp/nvimsocket";
inline constexpr const char* LISTEN_ADDRESS_ENV = "NVIM_LISTEN_ADDRESS";

// Where the editor listens: a Unix domain socket path or a TCP host:port.
struct ServerAddress {
  enum class Kind { UNIX_SOCKET, TCP };

  Kind kind = Kind::UNIX_SOCKET;
  std::string text;  // address as given by the user
  std::string host;  // TCP only, brackets stripped from IPv6 literals
  uint16_t port = 0;  // TCP only

  // "host:port" with a numeric port in 1..65535 and no '/' is TCP, anything else is a socket path.
  static ServerAddress Parse(const std::string& text);
};

// Resolution order: explicit servername, then env_value (ignored when empty), then DEFAULT_SERVER_ADDRESS.
std::string ResolveServerAddress(const std::optional<std::string>& servername, const char* env_value);

}  // namespace network
}  // namespace nvr
