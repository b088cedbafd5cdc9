#include "supervisor/signal_dispatcher.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <plog/Log.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace supervisor {

namespace {
// Written from signal context
volatile sig_atomic_t g_write_fd = -1;
} // namespace

SignalDispatcher::SignalDispatcher(ShutdownCoordinator &coordinator)
    : coordinator_(coordinator) {}

SignalDispatcher::~SignalDispatcher() { uninstall(); }

ShutdownTrigger SignalDispatcher::triggerFor(int signo) {
  switch (signo) {
  case SIGINT:
    return ShutdownTrigger::Interrupt;
  case SIGHUP:
    return ShutdownTrigger::HangUp;
  default:
    return ShutdownTrigger::Terminate;
  }
}

void SignalDispatcher::handleSignal(int signo) {
  int fd = g_write_fd;
  if (fd < 0) {
    return;
  }
  int saved_errno = errno;
  unsigned char byte = static_cast<unsigned char>(signo);
  // Nothing useful can be done about a full pipe here.
  ssize_t written = write(fd, &byte, 1);
  (void)written;
  errno = saved_errno;
}

void SignalDispatcher::install() {
  if (!running_.load()) {
    int fds[2];
    if (pipe(fds) != 0) {
      throw std::runtime_error(std::string("Cannot create signal pipe: ") +
                               strerror(errno));
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFL, O_NONBLOCK);

    read_fd_ = fds[0];
    g_write_fd = fds[1];
    running_.store(true);
    watcher_ = std::make_unique<std::thread>(&SignalDispatcher::watchLoop, this);
  }

  std::signal(SIGINT, &SignalDispatcher::handleSignal);
  std::signal(SIGTERM, &SignalDispatcher::handleSignal);
  std::signal(SIGHUP, &SignalDispatcher::handleSignal);
  PLOG_DEBUG << "[Shutdown] Signal handlers installed (SIGINT, SIGTERM, "
                "SIGHUP)";
}

void SignalDispatcher::uninstall() {
  if (!running_.exchange(false)) {
    return;
  }

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  std::signal(SIGHUP, SIG_DFL);

  int write_fd = g_write_fd;
  g_write_fd = -1;
  if (write_fd >= 0) {
    // Wakes the watcher with EOF
    close(write_fd);
  }

  if (watcher_ && watcher_->joinable()) {
    if (watcher_->get_id() == std::this_thread::get_id()) {
      watcher_->detach();
    } else {
      watcher_->join();
    }
  }
  close(read_fd_);
  read_fd_ = -1;
}

void SignalDispatcher::watchLoop() {
  while (true) {
    unsigned char byte = 0;
    ssize_t n = read(read_fd_, &byte, 1);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }

    int signo = byte;
    PLOG_INFO << "[Shutdown] Received signal " << signo << " ("
              << strsignal(signo) << ")";

    ShutdownEvent event;
    event.trigger = triggerFor(signo);
    event.detail = strsignal(signo);
    coordinator_.dispatch(event);
  }
}

} // namespace supervisor
