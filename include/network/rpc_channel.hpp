// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 RpcChannel — abstract msgpack-RPC call surface

 Request() blocks until the matching response arrives; Notify() returns as
 soon as the message is written. Both throw RpcError on transport failure.
*/

#include "remote/value.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nvr {
namespace network {

class RpcError : public std::runtime_error {
public:
  explicit RpcError(const std::string& message) : std::runtime_error(message) {}
};

struct RpcResponse {
  // Set when the server reported an error; result is then nil.
  std::optional<remote::RemoteValue> error;
  remote::RemoteValue result;
};

class RpcChannel {
public:
  virtual ~RpcChannel() = default;

  virtual RpcResponse Request(const std::string& method, const std::vector<std::string>& params) = 0;

  virtual void Notify(const std::string& method, const std::vector<std::string>& params) = 0;
};

}  // namespace network
}  // namespace nvr
