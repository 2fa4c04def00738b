// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "remote/dispatcher.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace nvr {
namespace cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_STATUS = 1;

// Whole client run: parse, resolve, dispatch. Returns the process exit status.
// Command output goes to out, diagnostics to err.
int RunClient(const std::vector<std::string>& args, const char* env_listen_address,
              const remote::Connector& connector, std::ostream& out, std::ostream& err);

}  // namespace cli
}  // namespace nvr
