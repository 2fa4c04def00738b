// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nvr {
namespace cli {

// Malformed command line. The message is suitable for "nvr: error: <message>".
class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// Everything the command line asked for. File and expression lists keep command-line order.
struct Options {
  // Target
  std::optional<std::string> servername;  // --servername
  std::string server_address;             // resolved: --servername > $NVIM_LISTEN_ADDRESS > default
  bool serverlist{false};                 // --serverlist

  // Editor actions
  bool focus_previous_window{false};          // -l
  std::vector<std::string> bare_files;        // positional arguments
  std::vector<std::string> remote;            // --remote
  std::vector<std::string> remote_wait;       // --remote-wait
  std::vector<std::string> remote_silent;     // --remote-silent
  std::vector<std::string> remote_wait_silent;  // --remote-wait-silent
  std::vector<std::string> remote_tab;        // --remote-tab, -p
  std::vector<std::string> remote_send;       // --remote-send
  std::vector<std::string> remote_expr;       // --remote-expr
  std::vector<std::string> split;             // -o
  std::vector<std::string> vsplit;            // -O

  // Client behaviour
  std::string log_level{"off"};  // --loglevel
  bool show_help{false};         // -h, --help
  bool show_version{false};      // -v, --version
};

// Parse args (program name excluded). env_listen_address is the value of
// NVIM_LISTEN_ADDRESS or nullptr. Throws UsageError.
Options ParseArguments(const std::vector<std::string>& args, const char* env_listen_address);

std::string GetUsage(const std::string& program_name);

}  // namespace cli
}  // namespace nvr
