#include "terminal.hpp"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <pthread.h>
#include <spdlog/spdlog.h>

static std::atomic<ITerminal*> g_guarded{nullptr};
static std::terminate_handler g_prev_terminate = nullptr;

// The throwing thread may still hold the surface lock (no unwinding happens
// before terminate), so only the lock-free restore is safe here.
static void finalize_on_terminate() {
  if (ITerminal* t = g_guarded.exchange(nullptr)) t->emergency_reset();
  spdlog::critical("terminate called; terminal restored");
  if (g_prev_terminate) g_prev_terminate();
  std::abort();
}

TerminalGuard::TerminalGuard(ITerminal& term)
  : term_(term), prev_guarded_(g_guarded.exchange(&term)) {
  prev_handler_ = std::set_terminate(finalize_on_terminate);
  if (prev_handler_ != finalize_on_terminate) g_prev_terminate = prev_handler_;
}

TerminalGuard::~TerminalGuard() {
  term_.fini();
  g_guarded.store(prev_guarded_);
  if (prev_handler_ != finalize_on_terminate) std::set_terminate(prev_handler_);
}

ShutdownWatcher::ShutdownWatcher(ITerminal& term, Callback on_signal)
  : term_(term), on_signal_(std::move(on_signal)) {
  sigemptyset(&set_);
  sigaddset(&set_, SIGINT);
  sigaddset(&set_, SIGTERM);
  sigaddset(&set_, SIGHUP);
  sigaddset(&set_, SIGQUIT);
}

ShutdownWatcher::~ShutdownWatcher() {
  stop();
}

bool ShutdownWatcher::start(std::string& msg) {
  if (thread_.joinable()) return true;
  int rc = ::pthread_sigmask(SIG_BLOCK, &set_, &old_mask_);
  if (rc != 0) {
    msg = std::string("pthread_sigmask failed: ") + std::strerror(rc);
    return false;
  }
  stopping_.store(false);
  done_.store(false);
  thread_ = std::thread([this]{ run(); });
  return true;
}

void ShutdownWatcher::stop() {
  if (!thread_.joinable()) return;
  stopping_.store(true);
  // Wakes sigwait; the thread sees stopping_ and leaves without finalizing.
  if (!done_.load()) ::pthread_kill(thread_.native_handle(), SIGTERM);
  thread_.join();
  int rc = ::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
  if (rc != 0) spdlog::warn("shutdown watcher: restoring signal mask failed: {}", std::strerror(rc));
}

void ShutdownWatcher::run() {
  int signo = 0;
  int rc = ::sigwait(&set_, &signo);
  if (rc != 0) {
    spdlog::error("shutdown watcher: sigwait failed: {}", std::strerror(rc));
  } else if (!stopping_.load()) {
    received_.store(signo);
    spdlog::info("shutdown watcher: received signal {}", signo);
    term_.fini();
    if (on_signal_) on_signal_(signo);
  }
  done_.store(true);
}
