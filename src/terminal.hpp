#pragma once
/*
 * TerminalGuard / ShutdownWatcher
 *
 * Purpose: make fini run on every exit path once init succeeded.
 * TerminalGuard: scope guard; destructor calls fini, and a std::terminate
 * handler runs emergency_reset on the guarded surface before the process aborts.
 * ShutdownWatcher: blocks SIGINT/SIGTERM/SIGHUP/SIGQUIT and waits for them on
 * its own thread; on delivery it calls fini, then the callback.
 * Usage: construct both in main before starting other threads (signal masks
 * are inherited).
 */
#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <signal.h>
#include "iterminal.hpp"

class TerminalGuard {
public:
  explicit TerminalGuard(ITerminal& term);
  ~TerminalGuard();
  TerminalGuard(const TerminalGuard&) = delete;
  TerminalGuard& operator=(const TerminalGuard&) = delete;
private:
  ITerminal& term_;
  ITerminal* prev_guarded_;
  std::terminate_handler prev_handler_;
};

class ShutdownWatcher {
public:
  using Callback = std::function<void(int signo)>;
  ShutdownWatcher(ITerminal& term, Callback on_signal);
  ~ShutdownWatcher();
  ShutdownWatcher(const ShutdownWatcher&) = delete;
  ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

  bool start(std::string& msg);
  void stop();
  // Signal number that triggered shutdown, 0 if none.
  int received() const { return received_.load(); }

private:
  void run();

  ITerminal& term_;
  Callback on_signal_;
  sigset_t set_{};
  sigset_t old_mask_{};
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> done_{false};
  std::atomic<int> received_{0};
};
