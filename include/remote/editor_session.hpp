// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/rpc_channel.hpp"
#include "remote/value.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace nvr {
namespace remote {

// The editor answered a call with an error (e.g. "E492: Not an editor command").
class RemoteError : public std::runtime_error {
public:
  explicit RemoteError(const std::string& message) : std::runtime_error(message) {}
};

// Named editor API calls over an RPC channel.
// Blocking calls throw RemoteError when the editor reports a failure.
// Non-blocking calls never see the outcome.
class EditorSession {
public:
  explicit EditorSession(std::unique_ptr<network::RpcChannel> channel);

  // Run an Ex command line (nvim_command).
  void Command(const std::string& command_line, bool blocking);

  // Queue raw keys as if typed (nvim_input).
  void Input(const std::string& keys, bool blocking);

  // Evaluate a Vimscript expression (nvim_eval).
  RemoteValue Eval(const std::string& expression);

private:
  RemoteValue Call(const std::string& method, const std::string& argument);

  std::unique_ptr<network::RpcChannel> channel_;
};

// Human-readable message of a msgpack-RPC error object ([type, message] for Neovim).
std::string DescribeRemoteError(const RemoteValue& error);

}  // namespace remote
}  // namespace nvr
