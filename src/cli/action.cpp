// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/action.hpp"

namespace nvr {
namespace cli {

namespace {

void Append(std::vector<Action>& plan, ActionType type, const std::vector<std::string>& payloads, bool blocking,
            bool silent) {
  for (const auto& payload : payloads) {
    plan.push_back(Action{type, payload, blocking, silent});
  }
}

}  // namespace

std::string EscapeFilename(const std::string& path) {
  std::string escaped;
  escaped.reserve(path.size());
  for (char c : path) {
    if (c == ' ') {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

std::string BuildCommandLine(const Action& action) {
  switch (action.type) {
  case ActionType::FOCUS_PREVIOUS_WINDOW:
    return "wincmd p";
  case ActionType::OPEN_FILE:
    return "edit " + EscapeFilename(action.payload);
  case ActionType::OPEN_IN_SPLIT:
    return "split " + EscapeFilename(action.payload);
  case ActionType::OPEN_IN_VSPLIT:
    return "vsplit " + EscapeFilename(action.payload);
  case ActionType::OPEN_IN_TAB:
    return "tabedit " + EscapeFilename(action.payload);
  case ActionType::SEND_KEYS:
  case ActionType::EVALUATE_EXPRESSION:
    break;
  }
  return {};
}

std::vector<Action> BuildActionPlan(const Options& options) {
  std::vector<Action> plan;

  if (options.focus_previous_window) {
    plan.push_back(Action{ActionType::FOCUS_PREVIOUS_WINDOW, "", true, false});
  }

  // Bare file names behave exactly like --remote-silent
  Append(plan, ActionType::OPEN_FILE, options.bare_files, false, true);
  Append(plan, ActionType::OPEN_FILE, options.remote_silent, false, true);
  Append(plan, ActionType::OPEN_FILE, options.remote_wait_silent, true, true);
  Append(plan, ActionType::OPEN_FILE, options.remote, false, false);
  Append(plan, ActionType::OPEN_FILE, options.remote_wait, true, false);
  Append(plan, ActionType::OPEN_IN_TAB, options.remote_tab, true, false);
  Append(plan, ActionType::SEND_KEYS, options.remote_send, true, false);
  Append(plan, ActionType::EVALUATE_EXPRESSION, options.remote_expr, true, false);
  Append(plan, ActionType::OPEN_IN_SPLIT, options.split, true, false);
  Append(plan, ActionType::OPEN_IN_VSPLIT, options.vsplit, true, false);

  return plan;
}

}  // namespace cli
}  // namespace nvr
