#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    signal(SIGINT, &ShutdownManager::handleSignal);
    signal(SIGTERM, &ShutdownManager::handleSignal);

    startWatcher();
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
    // A second signal terminates immediately
    signal(sig, SIG_DFL);
}

void ShutdownManager::watch(std::shared_ptr<CancellationToken> token)
{
    if (!token)
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!shutdown_requested_.load())
        {
            tokens_.push_back(std::move(token));
            return;
        }
    }
    token->cancel();
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("Signal received", sig);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    if (!watcher_running_.exchange(false))
    {
        return;
    }
    if (watcher_.joinable())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    std::vector<std::shared_ptr<CancellationToken>> tokens;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        last_signal_.store(signal_number);
        reason_ = reason;
        tokens.swap(tokens_);
    }

    if (signal_number != 0)
    {
        Logger::warn("ShutdownManager: received signal " + std::to_string(signal_number) +
                     ", cancelling conversions (repeat to force quit)");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }

    for (auto &token : tokens)
    {
        token->cancel();
    }
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    last_signal_.store(0);
    signal_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
    tokens_.clear();
}
