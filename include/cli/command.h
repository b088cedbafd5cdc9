#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cli {

/// start [--port N] [--stay-alive]
struct StartCommand {
  std::optional<int> port;
  bool stay_alive = false;
};

/// stop
struct StopCommand {};

/// status [--json]
struct StatusCommand {
  bool json = false;
};

/// restart [--port N]
struct RestartCommand {
  std::optional<int> port;
};

/// help
struct HelpCommand {};

using Command = std::variant<StartCommand, StopCommand, StatusCommand,
                             RestartCommand, HelpCommand>;

/**
 * @brief Parse command-line arguments (without argv[0])
 *
 * No arguments, or options without a subcommand, mean "start".
 *
 * @throws supervisor::SupervisorError InvalidCommand
 */
Command parseCommand(const std::vector<std::string> &args);

/**
 * @brief Name of the subcommand held by a Command
 */
const char *commandName(const Command &command);

std::string usage(const std::string &program);

} // namespace cli
