// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "remote/editor_session.hpp"

#include "util/logging.hpp"

namespace nvr {
namespace remote {

EditorSession::EditorSession(std::unique_ptr<network::RpcChannel> channel) : channel_(std::move(channel)) {}

void EditorSession::Command(const std::string& command_line, bool blocking) {
  if (!blocking) {
    channel_->Notify("nvim_command", {command_line});
    return;
  }
  Call("nvim_command", command_line);
}

void EditorSession::Input(const std::string& keys, bool blocking) {
  if (!blocking) {
    channel_->Notify("nvim_input", {keys});
    return;
  }
  Call("nvim_input", keys);
}

RemoteValue EditorSession::Eval(const std::string& expression) {
  return Call("nvim_eval", expression);
}

RemoteValue EditorSession::Call(const std::string& method, const std::string& argument) {
  network::RpcResponse response = channel_->Request(method, {argument});
  if (response.error) {
    std::string message = DescribeRemoteError(*response.error);
    LOG_RPC_DEBUG("{} failed: {}", method, message);
    throw RemoteError(message);
  }
  return std::move(response.result);
}

std::string DescribeRemoteError(const RemoteValue& error) {
  RemoteValue decoded = DecodeByteStrings(error);
  if (const auto* items = std::get_if<RemoteArray>(&decoded.data)) {
    if (items->size() == 2 && (*items)[1].is_text()) {
      return std::get<std::string>((*items)[1].data);
    }
  }
  return FormatForDisplay(decoded);
}

}  // namespace remote
}  // namespace nvr
