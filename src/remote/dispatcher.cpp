// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "remote/dispatcher.hpp"

#include "network/server_address.hpp"
#include "util/logging.hpp"

#include <utility>

namespace nvr {
namespace remote {

ServerUnreachable::ServerUnreachable(const std::string& address, const std::string& reason)
    : std::runtime_error("Can't find server at " + address + " (" + reason + "). Set $" +
                         network::LISTEN_ADDRESS_ENV + " or use --servername.") {}

Dispatcher::Dispatcher(std::string address, Connector connector, std::ostream& out, std::ostream& err)
    : address_(std::move(address)), connector_(std::move(connector)), out_(out), err_(err) {}

bool Dispatcher::EnsureConnected(bool silent) {
  if (state_ == ConnectionState::UNRESOLVED) {
    LOG_CLI_DEBUG("Attaching to {}", address_);
    std::string error;
    std::unique_ptr<network::RpcChannel> channel = connector_(address_, error);
    if (channel) {
      session_ = std::make_unique<EditorSession>(std::move(channel));
      state_ = ConnectionState::CONNECTED;
    } else {
      failure_reason_ = error.empty() ? "no server listening" : error;
      state_ = ConnectionState::UNREACHABLE;
      LOG_CLI_INFO("Server {} unreachable: {}", address_, failure_reason_);
    }
  }

  if (state_ == ConnectionState::CONNECTED) {
    return true;
  }
  if (silent) {
    return false;
  }
  throw ServerUnreachable(address_, failure_reason_);
}

void Dispatcher::Run(const std::vector<cli::Action>& plan) {
  for (const auto& action : plan) {
    if (!EnsureConnected(action.silent)) {
      LOG_CLI_DEBUG("Skipping action, no server");
      continue;
    }
    Execute(action);
  }
}

void Dispatcher::Execute(const cli::Action& action) {
  if (!session_) {
    throw std::logic_error("Dispatcher::Execute called without a connection");
  }

  switch (action.type) {
  case cli::ActionType::SEND_KEYS:
    session_->Input(action.payload, action.blocking);
    break;
  case cli::ActionType::EVALUATE_EXPRESSION:
    Evaluate(action.payload);
    break;
  default: {
    std::string command_line = cli::BuildCommandLine(action);
    LOG_CLI_DEBUG("Running '{}'{}", command_line, action.blocking ? "" : " (async)");
    session_->Command(command_line, action.blocking);
    break;
  }
  }
}

void Dispatcher::Evaluate(const std::string& expression) {
  try {
    RemoteValue result = session_->Eval(expression);
    out_ << FormatForDisplay(DecodeByteStrings(result)) << "\n";
    out_.flush();
  } catch (const RemoteError& e) {
    // One bad expression must not abort the rest of the batch
    LOG_CLI_DEBUG("Evaluation of '{}' failed: {}", expression, e.what());
    err_ << "No valid expression: " << expression << std::endl;
  }
}

}  // namespace remote
}  // namespace nvr
