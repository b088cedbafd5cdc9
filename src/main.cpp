#include "api/client_websocket.h"
#include "api/health_handler.h"
#include "api/session_handler.h"
#include "api/supervisor_handler.h"
#include "cli/command.h"
#include "cli/command_runner.h"
#include "config/supervisor_config.h"
#include "core/bounded_retry.h"
#include "core/env_config.h"
#include "core/health_monitor.h"
#include "core/logger.h"
#include "server/connection_registry.h"
#include "server/drogon_socket_layer.h"
#include "sessions/browser_launcher.h"
#include "sessions/devtools_client.h"
#include "sessions/session_coordinator.h"
#include "supervisor/instance_claim.h"
#include "supervisor/lock_manager.h"
#include "supervisor/port_negotiator.h"
#include "supervisor/shutdown_coordinator.h"
#include "supervisor/signal_dispatcher.h"
#include "supervisor/supervisor_error.h"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <drogon/drogon.h>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "1.0.0"
#endif

/**
 * @brief Continuum Supervisor
 *
 * Keeps exactly one service instance per working directory, serves the
 * supervisor API with Drogon and hands out browser debug sessions.
 */

// Exit status chosen by the shutdown path
static std::atomic<int> g_exit_code{0};

// Used by the terminate handler; set while the server runs
static supervisor::ShutdownCoordinator *g_shutdown = nullptr;
static supervisor::LockManager *g_lock = nullptr;

/**
 * @brief Route uncaught exceptions into the shutdown path
 *
 * The lock must be released on every exit path.
 */
void terminateHandler() {
  std::string error_msg = "Unknown exception";
  try {
    auto exception_ptr = std::current_exception();
    if (exception_ptr) {
      std::rethrow_exception(exception_ptr);
    }
  } catch (const std::exception &e) {
    error_msg = e.what();
  } catch (...) {
    PLOG_ERROR << "[Shutdown] Uncaught exception of unknown type";
  }
  PLOG_FATAL << "[Shutdown] Uncaught exception: " << error_msg;

  if (g_shutdown) {
    supervisor::ShutdownEvent event;
    event.trigger = supervisor::ShutdownTrigger::UncaughtException;
    event.detail = error_msg;
    if (!g_shutdown->dispatch(event) && g_lock) {
      // Shutdown was already running on another thread
      g_lock->release();
    }
  } else if (g_lock) {
    g_lock->release();
  }
  std::_Exit(1);
}

/**
 * @brief Claim the instance, serve until shut down
 * @return Process exit status
 */
static int runServer(supervisor::LockManager &lock,
                     const cli::StartCommand &cmd) {
  auto &config = SupervisorConfig::getInstance();
  if (cmd.port) {
    config.setServerPort(*cmd.port);
  }

  auto server_config = config.getServerConfig();
  auto ports_config = config.getPortsConfig();
  auto shutdown_config = config.getShutdownConfig();
  auto health_config = config.getHealthConfig();
  auto sessions_config = config.getSessionsConfig();

  PLOG_INFO << "========================================";
  PLOG_INFO << "Continuum Supervisor " << PROJECT_VERSION;
  PLOG_INFO << "========================================";
  PLOG_INFO << "[Main] Config: " << config.getConfigPath();
  PLOG_INFO << "[Main] Lock file: " << lock.lockPath();

  // 1. Singleton lock and port
  supervisor::PortNegotiator::Options port_options;
  port_options.max_attempts = ports_config.max_attempts;
  port_options.replacement_grace =
      std::chrono::milliseconds(ports_config.replacement_grace_ms);
  supervisor::PortNegotiator ports(port_options);

  supervisor::ClaimResult claim =
      supervisor::claimInstance(lock, ports, server_config.port,
                                server_config.host, cmd.stay_alive);
  if (!claim.proceed) {
    std::cout << "An instance is already running; --stay-alive set, exiting"
              << std::endl;
    return claim.exit_code;
  }
  // Declared before everything that can throw during setup
  supervisor::ClaimGuard claim_guard(lock);
  if (claim.port != server_config.port) {
    PLOG_WARNING << "[Server] Preferred port " << server_config.port
                 << " unavailable, using port " << claim.port;
  }

  // 2. Session coordination
  sessions::ChromeBrowserLauncher::Options launcher_options;
  launcher_options.executable = sessions_config.browser_executable;
  launcher_options.app_url =
      sessions_config.app_url.empty()
          ? "http://localhost:" + std::to_string(claim.port)
          : sessions_config.app_url;
  launcher_options.headless = sessions_config.headless;
  launcher_options.user_data_root = sessions_config.user_data_root;
  sessions::ChromeBrowserLauncher launcher(launcher_options);
  sessions::DrogonDevToolsClient devtools;

  sessions::SessionCoordinator::Options session_options;
  session_options.port_range_start = sessions_config.port_range_start;
  session_options.port_range_end = sessions_config.port_range_end;
  session_options.launch_timeout =
      std::chrono::milliseconds(sessions_config.launch_timeout_ms);
  sessions::SessionCoordinator session_coordinator(launcher, devtools,
                                                   session_options);

  // 3. Socket layer and shutdown
  server::ConnectionRegistry registry;
  supervisor::ShutdownCoordinator *shutdown_ptr = nullptr;
  HealthMonitor *monitor_ptr = nullptr;
  server::DrogonSocketLayer socket_layer(
      registry, server_config.host, claim.port,
      [&registry, &session_coordinator, &lock, &shutdown_ptr, &monitor_ptr]() {
        ClientWebSocketController::setConnectionRegistry(&registry);
        SessionHandler::setSessionCoordinator(&session_coordinator);
        SupervisorHandler::setLockManager(&lock);
        SupervisorHandler::setShutdownCoordinator(shutdown_ptr);
        HealthHandler::setHealthMonitor(monitor_ptr);
      });

  supervisor::ShutdownCoordinator::Options shutdown_options;
  shutdown_options.connection_close_timeout =
      std::chrono::milliseconds(shutdown_config.connection_close_timeout_ms);
  supervisor::ShutdownCoordinator shutdown(
      socket_layer, session_coordinator, lock, shutdown_options,
      [](int code) {
        g_exit_code.store(code);
        drogon::app().quit();
      });
  shutdown_ptr = &shutdown;

  HealthMonitor::Options monitor_options;
  monitor_options.interval =
      std::chrono::milliseconds(health_config.interval_ms);
  monitor_options.auto_launch = health_config.auto_launch_browser
                                    ? BrowserAutoLaunchPolicy::WhenIdle
                                    : BrowserAutoLaunchPolicy::Disabled;
  monitor_options.prune_unreachable_sessions =
      health_config.prune_unreachable_sessions;
  HealthMonitor monitor(socket_layer, session_coordinator, monitor_options);
  monitor_ptr = &monitor;
  shutdown.setHealthMonitor(&monitor);

  supervisor::SignalDispatcher signals(shutdown);
  signals.install();
  g_shutdown = &shutdown;
  g_lock = &lock;
  struct ShutdownRegistration {
    ~ShutdownRegistration() { g_shutdown = nullptr; }
  } registration;

  // 4. Drogon
  auto &app = drogon::app();
  app.setThreadNum(server_config.thread_num > 0
                       ? static_cast<size_t>(server_config.thread_num)
                       : std::thread::hardware_concurrency())
      .setLogLevel(trantor::Logger::kWarn)
      .disableSigtermHandling();
  app.addListener(server_config.host, claim.port, false, "", "");
  socket_layer.install();

  app.registerBeginningAdvice([&signals, &monitor, &claim, &server_config]() {
    // Drogon may install its own handlers while starting
    signals.install();
    monitor.start();
    PLOG_INFO << "[Server] Listening on " << server_config.host << ":"
              << claim.port;
    std::cout << "Continuum supervisor running on port " << claim.port
              << " (PID " << getpid() << ")" << std::endl;
  });

  app.run();

  if (!shutdown.isShuttingDown()) {
    supervisor::ShutdownEvent event;
    event.trigger = supervisor::ShutdownTrigger::FatalError;
    event.detail = "event loop exited unexpectedly";
    shutdown.dispatch(event);
  }

  // dispatch() may still be finishing on the signal or request thread
  BoundedRetry retry;
  retry.timeout = shutdown_options.connection_close_timeout +
                  std::chrono::seconds(5);
  if (!retry.waitUntil([&shutdown]() {
        return shutdown.state() == supervisor::ShutdownState::Stopped;
      })) {
    PLOG_WARNING << "[Shutdown] Shutdown did not complete, releasing lock";
    lock.release();
  }

  monitor.stop();
  signals.uninstall();

  PLOG_INFO << "Server stopped.";
  return g_exit_code.load();
}

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  cli::Command command;
  try {
    command = cli::parseCommand(args);
  } catch (const supervisor::SupervisorError &e) {
    std::cerr << "Error: " << e.what() << "\n\n" << cli::usage(argv[0]);
    return supervisor::exitCodeFor(e.code());
  }

  if (std::holds_alternative<cli::HelpCommand>(command)) {
    std::cout << cli::usage(argv[0]);
    return 0;
  }

  try {
    std::string config_dir = EnvConfig::resolveConfigDir();

    auto &config = SupervisorConfig::getInstance();
    config.loadConfig(EnvConfig::resolveInConfigDir(config_dir, "config.json"));
    config.applyEnvironmentOverrides();

    bool serving = std::holds_alternative<cli::StartCommand>(command) ||
                   std::holds_alternative<cli::RestartCommand>(command);
    auto logging = config.getLoggingConfig();
    Logger::init(EnvConfig::resolveInConfigDir(config_dir, logging.log_dir),
                 Logger::parseSeverity(logging.log_level, plog::info),
                 logging.max_files, serving);

    supervisor::LockManager lock(
        EnvConfig::resolveInConfigDir(config_dir, config.getLockConfig().file),
        PROJECT_VERSION);

    std::set_terminate(terminateHandler);

    if (auto *status = std::get_if<cli::StatusCommand>(&command)) {
      return cli::runStatus(lock, *status, std::cout);
    }
    if (std::holds_alternative<cli::StopCommand>(command)) {
      return cli::runStop(lock, std::cout);
    }
    if (auto *restart = std::get_if<cli::RestartCommand>(&command)) {
      int stopped = cli::runStop(lock, std::cout);
      if (stopped != 0) {
        return stopped;
      }
      cli::StartCommand start;
      start.port = restart->port;
      return runServer(lock, start);
    }
    return runServer(lock, std::get<cli::StartCommand>(command));
  } catch (const supervisor::SupervisorError &e) {
    PLOG_FATAL << "[Main] " << supervisor::toString(e.code()) << ": "
               << e.what();
    std::cerr << "Error: " << e.what() << std::endl;
    return supervisor::exitCodeFor(e.code());
  } catch (const std::exception &e) {
    PLOG_FATAL << "Fatal error: " << e.what();
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
