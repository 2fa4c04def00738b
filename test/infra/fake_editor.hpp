// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// FakeEditor - in-memory stand-in for a running editor
//
// Records every call made through the channels it hands out and answers
// nvim_eval from a table of canned results. Unknown expressions produce the
// error object a real server would send.

#include "network/rpc_channel.hpp"
#include "remote/dispatcher.hpp"
#include "remote/value.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nvr {
namespace test {

struct RecordedCall {
  bool notification;
  std::string method;
  std::vector<std::string> params;
};

struct FakeEditorState {
  bool reachable{true};
  int connect_attempts{0};
  std::vector<RecordedCall> calls;
  std::map<std::string, remote::RemoteValue> eval_results;
  std::map<std::string, std::string> command_errors;  // command line -> error message
};

class FakeRpcChannel : public network::RpcChannel {
public:
  explicit FakeRpcChannel(std::shared_ptr<FakeEditorState> state) : state_(std::move(state)) {}

  network::RpcResponse Request(const std::string& method, const std::vector<std::string>& params) override {
    state_->calls.push_back(RecordedCall{false, method, params});

    network::RpcResponse response;
    if (method == "nvim_eval") {
      auto it = state_->eval_results.find(params.at(0));
      if (it != state_->eval_results.end()) {
        response.result = it->second;
      } else {
        response.error = ErrorObject("Vim:E15: Invalid expression: " + params.at(0));
      }
    } else if (method == "nvim_command") {
      auto it = state_->command_errors.find(params.at(0));
      if (it != state_->command_errors.end()) {
        response.error = ErrorObject(it->second);
      }
    }
    return response;
  }

  void Notify(const std::string& method, const std::vector<std::string>& params) override {
    state_->calls.push_back(RecordedCall{true, method, params});
  }

  // Neovim error objects are [type, message] with the message as raw bytes
  static remote::RemoteValue ErrorObject(const std::string& message) {
    return remote::RemoteValue::Array({remote::RemoteValue::Integer(0), remote::RemoteValue::Bytes(message)});
  }

private:
  std::shared_ptr<FakeEditorState> state_;
};

class FakeEditor {
public:
  FakeEditor() : state_(std::make_shared<FakeEditorState>()) {}

  remote::Connector connector() {
    auto state = state_;
    return [state](const std::string& address, std::string& error) -> std::unique_ptr<network::RpcChannel> {
      ++state->connect_attempts;
      if (!state->reachable) {
        error = "Cannot connect to " + address + ": No such file or directory";
        return nullptr;
      }
      return std::make_unique<FakeRpcChannel>(state);
    };
  }

  FakeEditorState& state() { return *state_; }
  const std::vector<RecordedCall>& calls() const { return state_->calls; }

private:
  std::shared_ptr<FakeEditorState> state_;
};

}  // namespace test
}  // namespace nvr
