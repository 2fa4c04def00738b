// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "cli/options.hpp"

#include <string>
#include <vector>

namespace nvr {
namespace cli {

enum class ActionType {
  FOCUS_PREVIOUS_WINDOW,
  OPEN_FILE,
  OPEN_IN_SPLIT,
  OPEN_IN_VSPLIT,
  OPEN_IN_TAB,
  SEND_KEYS,
  EVALUATE_EXPRESSION,
};

// One remote call requested on the command line.
struct Action {
  ActionType type;
  std::string payload;  // file path, key sequence or expression; empty for FOCUS_PREVIOUS_WINDOW
  bool blocking;        // wait for the editor's reply
  bool silent;          // skip quietly when no server is reachable

  bool operator==(const Action&) const = default;
};

// Escape a path for use as a single Ex command argument (" " -> "\ ").
std::string EscapeFilename(const std::string& path);

// Ex command line for the window and file actions, e.g. "tabedit my\ file.txt".
// Empty for SEND_KEYS and EVALUATE_EXPRESSION, which are not Ex commands.
std::string BuildCommandLine(const Action& action);

// Flatten options into dispatch order:
// -l, bare files, --remote-silent, --remote-wait-silent, --remote, --remote-wait,
// --remote-tab, --remote-send, --remote-expr, -o, -O.
std::vector<Action> BuildActionPlan(const Options& options);

}  // namespace cli
}  // namespace nvr
