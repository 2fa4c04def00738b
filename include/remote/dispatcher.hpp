// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "cli/action.hpp"
#include "network/rpc_channel.hpp"
#include "remote/editor_session.hpp"

#include <functional>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace nvr {
namespace remote {

// A non-silent action found no editor at the target address.
class ServerUnreachable : public std::runtime_error {
public:
  ServerUnreachable(const std::string& address, const std::string& reason);
};

enum class ConnectionState {
  UNRESOLVED,   // no attempt yet
  CONNECTED,    // session available for the rest of the run
  UNREACHABLE,  // attempt failed; never retried
};

// Opens a channel to address. Returns nullptr and fills error when nothing answers there.
using Connector =
    std::function<std::unique_ptr<network::RpcChannel>(const std::string& address, std::string& error)>;

/**
 * Dispatcher - executes an action plan against one lazily attached editor
 *
 * The connection is attempted at most once per run, on the first action that
 * needs it. The outcome is cached: later actions either reuse the session or
 * see the cached failure.
 *
 * A failed attempt is silent for silent actions (they are skipped) and fatal
 * for the first non-silent action that observes it (ServerUnreachable).
 *
 * Evaluation results go to out; per-expression failures are reported on err.
 */
class Dispatcher {
public:
  Dispatcher(std::string address, Connector connector, std::ostream& out, std::ostream& err);

  // True once connected. On failure returns false if silent, throws ServerUnreachable otherwise.
  bool EnsureConnected(bool silent);

  // Run every action in order. Actions whose silent connection attempt failed are skipped.
  void Run(const std::vector<cli::Action>& plan);

  // Run one action. Requires CONNECTED.
  void Execute(const cli::Action& action);

  ConnectionState state() const { return state_; }
private:
  void Evaluate(const std::string& expression);

  std::string address_;
  Connector connector_;
  std::ostream& out_;
  std::ostream& err_;

  ConnectionState state_{ConnectionState::UNRESOLVED};
  std::string failure_reason_;
  std::unique_ptr<EditorSession> session_;
};

}  // namespace remote
}  // namespace nvr
