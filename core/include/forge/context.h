#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace forge {

// Shared handle onto one level-triggered cancellation flag. Copies observe
// the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

    // For signal handlers; valid while any copy of the token is alive.
    std::atomic<bool>* raw() const { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

using ProgressSink = std::function<void(double fraction, const std::string& message)>;

// Free-form configuration handed to plugins. Non-string JSON values are kept
// as their JSON text.
using ConfigMap = std::map<std::string, std::string>;

// Per-invocation bundle of auth, config, progress reporting and cancellation.
// Created by the dispatcher right before run() and discarded after it.
class ExecutionContext {
public:
    ExecutionContext(std::string auth_token,
                     ConfigMap config,
                     ProgressSink sink,
                     CancelToken cancel);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // Empty when the plugin does not require auth.
    const std::string& auth_token() const { return auth_token_; }
    const ConfigMap& config() const { return config_; }
    std::optional<std::string> config_value(const std::string& key) const;

    // Fractions outside [0,1] are clamped; going backwards is allowed.
    void progress(double fraction, const std::string& message);
    double last_fraction() const { return last_fraction_; }

    // Plugins poll this; nothing interrupts plugin code.
    bool cancelled() const { return cancel_.cancelled(); }
    const CancelToken& cancel_token() const { return cancel_; }

private:
    const std::string auth_token_;
    const ConfigMap config_;
    ProgressSink sink_;
    CancelToken cancel_;
    double last_fraction_{0.0};
};

// Console renderer: "  [ 50%] message" on stderr.
void console_progress(double fraction, const std::string& message);

// Routes SIGINT/SIGTERM into a CancelToken while alive. A second interrupt
// exits the process with status 130. Restores previous handlers on
// destruction. Only one guard may be active at a time.
class InterruptGuard {
public:
    explicit InterruptGuard(const CancelToken& token);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    CancelToken token_;
};

} // namespace forge
