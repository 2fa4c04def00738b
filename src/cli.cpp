// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/runner.hpp"
#include "network/rpc_client.hpp"
#include "network/server_address.hpp"
#include "util/logging.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  int status = nvr::cli::RunClient(args, std::getenv(nvr::network::LISTEN_ADDRESS_ENV), nvr::rpc::ConnectToServer,
                                   std::cout, std::cerr);
  nvr::util::LogManager::Shutdown();
  return status;
}
