#include "forge/context.h"

#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace forge {

ExecutionContext::ExecutionContext(std::string auth_token,
                                   ConfigMap config,
                                   ProgressSink sink,
                                   CancelToken cancel)
    : auth_token_(std::move(auth_token)),
      config_(std::move(config)),
      sink_(std::move(sink)),
      cancel_(std::move(cancel)) {}

std::optional<std::string> ExecutionContext::config_value(const std::string& key) const {
    auto it = config_.find(key);
    if (it == config_.end()) return std::nullopt;
    return it->second;
}

void ExecutionContext::progress(double fraction, const std::string& message) {
    if (std::isnan(fraction)) fraction = last_fraction_;
    if (fraction < 0.0) fraction = 0.0;
    if (fraction > 1.0) fraction = 1.0;
    last_fraction_ = fraction;
    if (sink_) sink_(fraction, message);
}

void console_progress(double fraction, const std::string& message) {
    char pct[16];
    std::snprintf(pct, sizeof(pct), "%3d", (int)(fraction * 100.0));
    std::cerr << "  [" << pct << "%] " << message << std::endl;
}

namespace {

std::atomic<std::atomic<bool>*> g_interrupt_flag{nullptr};
std::atomic<int> g_interrupt_count{0};

using SignalHandler = void (*)(int);
SignalHandler g_prev_int = SIG_DFL;
SignalHandler g_prev_term = SIG_DFL;

void forge_on_interrupt(int) {
    if (g_interrupt_count.fetch_add(1) > 0) {
        std::_Exit(130);
    }
    if (auto* f = g_interrupt_flag.load()) f->store(true);
}

} // namespace

InterruptGuard::InterruptGuard(const CancelToken& token) : token_(token) {
    g_interrupt_count.store(0);
    g_interrupt_flag.store(token_.raw());
    g_prev_int = std::signal(SIGINT, forge_on_interrupt);
    g_prev_term = std::signal(SIGTERM, forge_on_interrupt);
}

InterruptGuard::~InterruptGuard() {
    std::signal(SIGINT, g_prev_int == SIG_ERR ? SIG_DFL : g_prev_int);
    std::signal(SIGTERM, g_prev_term == SIG_ERR ? SIG_DFL : g_prev_term);
    g_interrupt_flag.store(nullptr);
}

} // namespace forge
