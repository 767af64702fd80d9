#pragma once

#include "core/cancellation_token.hpp"
#include <atomic>
#include <csignal>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Centralized shutdown manager.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM
 * - Translates the first signal into cancellation of every watched token
 * - A second signal gets the default disposition and terminates the process
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Cancel `token` when shutdown is requested (immediately if it already was)
    void watch(std::shared_ptr<CancellationToken> token);

    // Programmatically request shutdown (safe to call from any thread, not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }
    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<CancellationToken>> tokens_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
