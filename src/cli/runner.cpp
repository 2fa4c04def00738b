// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/runner.hpp"

#include "cli/action.hpp"
#include "cli/options.hpp"
#include "util/logging.hpp"
#include "version.hpp"

namespace nvr {
namespace cli {

int RunClient(const std::vector<std::string>& args, const char* env_listen_address,
              const remote::Connector& connector, std::ostream& out, std::ostream& err) {
  if (args.empty()) {
    err << GetUsage("nvr");
    return EXIT_FAILURE_STATUS;
  }

  try {
    Options options = ParseArguments(args, env_listen_address);

    if (options.show_help) {
      out << GetUsage("nvr");
      return EXIT_OK;
    }
    if (options.show_version) {
      out << GetFullVersionString() << "\n" << GetCopyrightString() << std::endl;
      return EXIT_OK;
    }

    util::LogManager::Initialize(options.log_level);
    util::LogManager::SetLogLevel(options.log_level);
    LOG_CLI_DEBUG("Server address: {}", options.server_address);

    if (options.serverlist) {
      out << options.server_address << std::endl;
    }

    std::vector<Action> plan = BuildActionPlan(options);
    LOG_CLI_DEBUG("{} action(s) planned", plan.size());

    remote::Dispatcher dispatcher(options.server_address, connector, out, err);
    dispatcher.Run(plan);
    out.flush();
    return EXIT_OK;

  } catch (const UsageError& e) {
    err << "nvr: error: " << e.what() << "\n"
        << "Try 'nvr --help' for more information." << std::endl;
    return EXIT_FAILURE_STATUS;
  } catch (const remote::ServerUnreachable& e) {
    err << e.what() << std::endl;
    return EXIT_FAILURE_STATUS;
  } catch (const std::exception& e) {
    // Remote errors on blocking commands and transport failures
    err << "Error: " << e.what() << std::endl;
    return EXIT_FAILURE_STATUS;
  }
}

}  // namespace cli
}  // namespace nvr
