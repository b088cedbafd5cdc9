#include "cli/command.h"
#include "supervisor/supervisor_error.h"
#include <sstream>

namespace cli {

using supervisor::SupervisorError;
using supervisor::SupervisorErrorCode;

namespace {

int parsePort(const std::string &value) {
  size_t consumed = 0;
  int port = 0;
  try {
    port = std::stoi(value, &consumed);
  } catch (const std::exception &) {
    consumed = 0;
  }
  if (consumed != value.size() || port < 1 || port > 65535) {
    throw SupervisorError(SupervisorErrorCode::InvalidCommand,
                          "Invalid port: '" + value + "'");
  }
  return port;
}

// Reads --port N or --port=N at position i; advances i past the value.
bool takePort(const std::vector<std::string> &args, size_t &i,
              std::optional<int> &port) {
  const std::string &arg = args[i];
  if (arg == "--port" || arg == "-p") {
    if (i + 1 >= args.size()) {
      throw SupervisorError(SupervisorErrorCode::InvalidCommand,
                            arg + " requires a value");
    }
    port = parsePort(args[++i]);
    return true;
  }
  if (arg.rfind("--port=", 0) == 0) {
    port = parsePort(arg.substr(7));
    return true;
  }
  return false;
}

void unknownOption(const std::string &command,
                   const std::string &arg) {
  throw SupervisorError(SupervisorErrorCode::InvalidCommand,
                        "Unknown option for " + command + ": " + arg);
}

} // namespace

Command parseCommand(const std::vector<std::string> &args) {
  size_t i = 0;
  std::string name = "start";
  if (!args.empty() && args[0].rfind("-", 0) != 0) {
    name = args[0];
    i = 1;
  }

  if (name == "start") {
    StartCommand cmd;
    for (; i < args.size(); ++i) {
      if (takePort(args, i, cmd.port)) {
        continue;
      }
      if (args[i] == "--stay-alive") {
        cmd.stay_alive = true;
      } else if (args[i] == "--help" || args[i] == "-h") {
        return HelpCommand{};
      } else {
        unknownOption(name, args[i]);
      }
    }
    return cmd;
  }

  if (name == "stop") {
    if (i < args.size()) {
      unknownOption(name, args[i]);
    }
    return StopCommand{};
  }

  if (name == "status") {
    StatusCommand cmd;
    for (; i < args.size(); ++i) {
      if (args[i] == "--json") {
        cmd.json = true;
      } else {
        unknownOption(name, args[i]);
      }
    }
    return cmd;
  }

  if (name == "restart") {
    RestartCommand cmd;
    for (; i < args.size(); ++i) {
      if (!takePort(args, i, cmd.port)) {
        unknownOption(name, args[i]);
      }
    }
    return cmd;
  }

  if (name == "help") {
    return HelpCommand{};
  }

  throw SupervisorError(SupervisorErrorCode::InvalidCommand,
                        "Unknown command: " + name);
}

const char *commandName(const Command &command) {
  struct Visitor {
    const char *operator()(const StartCommand &) const { return "start"; }
    const char *operator()(const StopCommand &) const { return "stop"; }
    const char *operator()(const StatusCommand &) const { return "status"; }
    const char *operator()(const RestartCommand &) const { return "restart"; }
    const char *operator()(const HelpCommand &) const { return "help"; }
  };
  return std::visit(Visitor{}, command);
}

std::string usage(const std::string &program) {
  std::ostringstream ss;
  ss << "Usage: " << program << " <command> [options]\n"
     << "\n"
     << "Commands:\n"
     << "  start [--port N] [--stay-alive]  Start the supervisor (default)\n"
     << "  stop                             Stop the running instance\n"
     << "  status [--json]                  Show whether an instance is "
        "running\n"
     << "  restart [--port N]               Stop, then start\n"
     << "  help                             Show this help\n"
     << "\n"
     << "Options:\n"
     << "  --port N       Service port (overrides CONTINUUM_PORT and "
        "config.json)\n"
     << "  --stay-alive   Exit with 0 instead of replacing a running "
        "instance\n"
     << "\n"
     << "Environment:\n"
     << "  CONTINUUM_PORT        Service port\n"
     << "  CONTINUUM_CONFIG_DIR  Directory for config.json, lock and logs "
        "(default ./.continuum)\n"
     << "  CONTINUUM_BROWSER     Browser executable for debug sessions\n"
     << "  LOG_LEVEL             NONE|FATAL|ERROR|WARNING|INFO|DEBUG|VERBOSE\n";
  return ss.str();
}

} // namespace cli
