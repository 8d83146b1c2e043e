/**
 * @file cancellation.cpp
 * @brief Signal handler installation
 */

#include "transync/cancellation.hpp"

#include <csignal>

namespace transync {

namespace {

/// Token targeted by the active SignalGuard
std::atomic<CancellationToken *> g_signal_token{nullptr};

extern "C" void on_interrupt(int) {
  CancellationToken *token = g_signal_token.load();
  if (token)
    token->request();
}

} // anonymous namespace

struct SignalGuard::Saved {
  struct sigaction old_int;
  struct sigaction old_term;
};

SignalGuard::SignalGuard(CancellationToken &token)
    : saved_(std::make_unique<Saved>()) {
  g_signal_token.store(&token);

  struct sigaction sa {};
  sa.sa_handler = on_interrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; //< No SA_RESTART: blocking waits return EINTR

  sigaction(SIGINT, &sa, &saved_->old_int);
  sigaction(SIGTERM, &sa, &saved_->old_term);
}

SignalGuard::~SignalGuard() {
  sigaction(SIGINT, &saved_->old_int, nullptr);
  sigaction(SIGTERM, &saved_->old_term, nullptr);
  g_signal_token.store(nullptr);
}

} // namespace transync
