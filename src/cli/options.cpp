// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/options.hpp"

#include "network/server_address.hpp"
#include "util/logging.hpp"

#include <sstream>

namespace nvr {
namespace cli {

namespace {

enum class Arity { NONE, ONE, ONE_OR_MORE };

enum class Flag {
  HELP,
  VERSION,
  FOCUS_PREVIOUS,
  SPLIT,
  VSPLIT,
  REMOTE,
  REMOTE_WAIT,
  REMOTE_SILENT,
  REMOTE_WAIT_SILENT,
  REMOTE_TAB,
  REMOTE_SEND,
  REMOTE_EXPR,
  SERVERNAME,
  SERVERLIST,
  LOGLEVEL,
};

struct FlagSpec {
  const char* name;
  Flag flag;
  Arity arity;
};

constexpr FlagSpec kFlags[] = {
    {"-h", Flag::HELP, Arity::NONE},
    {"--help", Flag::HELP, Arity::NONE},
    {"-v", Flag::VERSION, Arity::NONE},
    {"--version", Flag::VERSION, Arity::NONE},
    {"-l", Flag::FOCUS_PREVIOUS, Arity::NONE},
    {"-o", Flag::SPLIT, Arity::ONE_OR_MORE},
    {"-O", Flag::VSPLIT, Arity::ONE_OR_MORE},
    {"-p", Flag::REMOTE_TAB, Arity::ONE_OR_MORE},
    {"--remote", Flag::REMOTE, Arity::ONE_OR_MORE},
    {"--remote-wait", Flag::REMOTE_WAIT, Arity::ONE_OR_MORE},
    {"--remote-silent", Flag::REMOTE_SILENT, Arity::ONE_OR_MORE},
    {"--remote-wait-silent", Flag::REMOTE_WAIT_SILENT, Arity::ONE_OR_MORE},
    {"--remote-tab", Flag::REMOTE_TAB, Arity::ONE_OR_MORE},
    {"--remote-send", Flag::REMOTE_SEND, Arity::ONE_OR_MORE},
    {"--remote-expr", Flag::REMOTE_EXPR, Arity::ONE_OR_MORE},
    {"--servername", Flag::SERVERNAME, Arity::ONE},
    {"--serverlist", Flag::SERVERLIST, Arity::NONE},
    {"--loglevel", Flag::LOGLEVEL, Arity::ONE},
};

const FlagSpec* FindFlag(const std::string& name) {
  for (const auto& spec : kFlags) {
    if (name == spec.name) {
      return &spec;
    }
  }
  return nullptr;
}

// Unique long-flag prefixes select that flag. Exact names win over prefixes.
// Throws UsageError when a prefix matches more than one flag.
const FlagSpec* ResolveLongFlag(const std::string& name) {
  if (const FlagSpec* exact = FindFlag(name)) {
    return exact;
  }
  std::vector<const FlagSpec*> matches;
  for (const auto& spec : kFlags) {
    std::string candidate = spec.name;
    if (candidate.starts_with("--") && candidate.starts_with(name)) {
      matches.push_back(&spec);
    }
  }
  if (matches.size() > 1) {
    std::string names;
    for (const FlagSpec* match : matches) {
      names += names.empty() ? "" : ", ";
      names += match->name;
    }
    throw UsageError("ambiguous option: " + name + " could match " + names);
  }
  return matches.empty() ? nullptr : matches.front();
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

// "-5", "-12", "-.5", "-3.25". No flag name looks like this.
bool LooksLikeNegativeNumber(const std::string& token) {
  if (token.size() < 2 || token[0] != '-') {
    return false;
  }
  size_t i = 1;
  while (i < token.size() && IsDigit(token[i])) {
    ++i;
  }
  if (i == token.size()) {
    return true;
  }
  if (token[i] != '.' || i + 1 == token.size()) {
    return false;
  }
  for (++i; i < token.size(); ++i) {
    if (!IsDigit(token[i])) {
      return false;
    }
  }
  return true;
}

// A value is a token that cannot be read as an option: anything not starting
// with '-', a lone "-", a negative number, or a token containing a space that
// names no flag.
bool LooksLikeValue(const std::string& token) {
  if (token.empty() || token[0] != '-' || token == "-") {
    return true;
  }
  if (token == "--") {
    return false;
  }
  if (token.starts_with("--")) {
    std::string name = token.substr(0, token.find('='));
    for (const auto& spec : kFlags) {
      std::string candidate = spec.name;
      if (candidate.starts_with("--") && candidate.starts_with(name)) {
        return false;
      }
    }
  } else if (FindFlag(token.substr(0, 2)) != nullptr) {
    return false;
  }
  return LooksLikeNegativeNumber(token) || token.find(' ') != std::string::npos;
}

std::vector<std::string>* ListFor(Options& options, Flag flag) {
  switch (flag) {
  case Flag::SPLIT:
    return &options.split;
  case Flag::VSPLIT:
    return &options.vsplit;
  case Flag::REMOTE:
    return &options.remote;
  case Flag::REMOTE_WAIT:
    return &options.remote_wait;
  case Flag::REMOTE_SILENT:
    return &options.remote_silent;
  case Flag::REMOTE_WAIT_SILENT:
    return &options.remote_wait_silent;
  case Flag::REMOTE_TAB:
    return &options.remote_tab;
  case Flag::REMOTE_SEND:
    return &options.remote_send;
  case Flag::REMOTE_EXPR:
    return &options.remote_expr;
  default:
    return nullptr;
  }
}

void ApplySwitch(Options& options, Flag flag) {
  switch (flag) {
  case Flag::HELP:
    options.show_help = true;
    break;
  case Flag::VERSION:
    options.show_version = true;
    break;
  case Flag::FOCUS_PREVIOUS:
    options.focus_previous_window = true;
    break;
  case Flag::SERVERLIST:
    options.serverlist = true;
    break;
  default:
    break;
  }
}

void ApplySingle(Options& options, const FlagSpec& spec, const std::string& value) {
  if (spec.flag == Flag::SERVERNAME) {
    options.servername = value;
  } else if (spec.flag == Flag::LOGLEVEL) {
    if (!util::LogManager::IsValidLevel(value)) {
      throw UsageError(std::string("argument ") + spec.name + ": invalid level '" + value +
                       "' (choose from trace, debug, info, warn, error, critical, off)");
    }
    options.log_level = value;
  }
}

// Apply one flag. Values come from attached, or are consumed from args after index i.
void ApplyFlag(Options& options, const FlagSpec& spec, const std::optional<std::string>& attached,
               const std::vector<std::string>& args, size_t& i) {
  switch (spec.arity) {
  case Arity::NONE:
    if (attached) {
      throw UsageError(std::string("argument ") + spec.name + ": ignored explicit argument '" + *attached + "'");
    }
    ApplySwitch(options, spec.flag);
    break;

  case Arity::ONE:
    if (attached) {
      ApplySingle(options, spec, *attached);
    } else if (i + 1 < args.size() && LooksLikeValue(args[i + 1])) {
      ApplySingle(options, spec, args[++i]);
    } else {
      throw UsageError(std::string("argument ") + spec.name + ": expected one argument");
    }
    break;

  case Arity::ONE_OR_MORE: {
    std::vector<std::string>* target = ListFor(options, spec.flag);
    if (attached) {
      target->push_back(*attached);
      break;
    }
    size_t consumed = 0;
    while (i + 1 < args.size() && LooksLikeValue(args[i + 1])) {
      target->push_back(args[++i]);
      ++consumed;
    }
    if (consumed == 0) {
      throw UsageError(std::string("argument ") + spec.name + ": expected at least one argument");
    }
    break;
  }
  }
}

}  // namespace

Options ParseArguments(const std::vector<std::string>& args, const char* env_listen_address) {
  Options options;
  bool positional_only = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (positional_only || LooksLikeValue(arg)) {
      options.bare_files.push_back(arg);
      continue;
    }

    if (arg == "--") {
      positional_only = true;
      continue;
    }

    if (arg.starts_with("--")) {
      // --flag=value carries an attached value
      auto eq = arg.find('=');
      std::string name = arg.substr(0, eq);
      std::optional<std::string> attached;
      if (eq != std::string::npos) {
        attached = arg.substr(eq + 1);
      }
      const FlagSpec* spec = ResolveLongFlag(name);
      if (spec == nullptr) {
        throw UsageError("unrecognized arguments: " + arg);
      }
      ApplyFlag(options, *spec, attached, args, i);
      continue;
    }

    // Short flags: "-ovalue" attaches a value, "-lo" clusters switches
    std::string rest = arg;
    const FlagSpec* previous = nullptr;
    while (true) {
      const FlagSpec* spec = FindFlag(rest.substr(0, 2));
      if (spec == nullptr) {
        if (previous == nullptr) {
          throw UsageError("unrecognized arguments: " + arg);
        }
        throw UsageError(std::string("argument ") + previous->name + ": ignored explicit argument '" +
                         rest.substr(1) + "'");
      }
      std::optional<std::string> attached;
      if (rest.size() > 2) {
        attached = rest.substr(2);
      }
      if (spec->arity == Arity::NONE && attached) {
        ApplySwitch(options, spec->flag);
        rest = "-" + *attached;
        previous = spec;
        continue;
      }
      ApplyFlag(options, *spec, attached, args, i);
      break;
    }
  }

  options.server_address = network::ResolveServerAddress(options.servername, env_listen_address);
  return options;
}

std::string GetUsage(const std::string& program_name) {
  std::ostringstream usage;
  usage << "nvr - control a running Neovim instance\n\n"
        << "Usage: " << program_name << " [arguments] [file ...]\n\n"
        << "Files given without an option are opened as with --remote-silent.\n\n"
        << "Options:\n"
        << "  -l                              Focus the previous window\n"
        << "  -o <file> [...]                 Open files via :split\n"
        << "  -O <file> [...]                 Open files via :vsplit\n"
        << "  -p <file> [...]                 Open files via :tabedit\n"
        << "  --remote <file> [...]           Open files in new buffers [ASYNC]\n"
        << "  --remote-wait <file> [...]      As --remote [SYNC]\n"
        << "  --remote-silent <file> [...]    As --remote, no error if no server is found [ASYNC]\n"
        << "  --remote-wait-silent <file> [...]\n"
        << "                                  As --remote, no error if no server is found [SYNC]\n"
        << "  --remote-tab <file> [...]       Open files in new tabs [SYNC]\n"
        << "  --remote-send <keys> [...]      Send keys to the server [SYNC]\n"
        << "  --remote-expr <expr> [...]      Evaluate expressions and print the results [SYNC]\n"
        << "  --servername <addr>             Unix socket path or host:port (overrides $"
        << network::LISTEN_ADDRESS_ENV << ")\n"
        << "  --serverlist                    Print the server address\n"
        << "  --loglevel <level>              Diagnostics on stderr: trace, debug, info, warn,\n"
        << "                                  error, critical, off (default: off)\n"
        << "  -v, --version                   Show version information\n"
        << "  -h, --help                      Show this help message\n\n"
        << "Default server address: " << network::DEFAULT_SERVER_ADDRESS << "\n";
  return usage.str();
}

}  // namespace cli
}  // namespace nvr
