#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief Cooperative cancellation flag shared between a request and its sub-tasks.
 *
 * Cancelling a token cancels every child created from it. Sleepers blocked in
 * waitFor() wake immediately.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    static std::shared_ptr<CancellationToken> create()
    {
        return std::make_shared<CancellationToken>();
    }

    /**
     * @brief Create a token that is cancelled whenever `parent` is.
     * A null parent yields an independent token.
     */
    static std::shared_ptr<CancellationToken> childOf(const std::shared_ptr<CancellationToken> &parent)
    {
        auto child = create();
        if (!parent)
        {
            return child;
        }

        bool parent_cancelled = false;
        {
            std::lock_guard<std::mutex> lock(parent->mutex_);
            parent_cancelled = parent->cancelled_.load();
            if (!parent_cancelled)
            {
                auto &children = parent->children_;
                children.erase(std::remove_if(children.begin(), children.end(),
                                              [](const std::weak_ptr<CancellationToken> &weak_child)
                                              { return weak_child.expired(); }),
                               children.end());
                children.push_back(child);
            }
        }
        if (parent_cancelled)
        {
            child->cancel();
        }
        return child;
    }

    void cancel()
    {
        std::vector<std::weak_ptr<CancellationToken>> children;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.exchange(true))
            {
                return;
            }
            children.swap(children_);
        }
        cv_.notify_all();

        for (auto &weak_child : children)
        {
            if (auto child = weak_child.lock())
            {
                child->cancel();
            }
        }
    }

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief Number of registered children; expired entries are pruned on the next childOf()
     */
    size_t childCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return children_.size();
    }

    /**
     * @brief Sleep for `duration` unless cancelled first
     * @return true if the token was cancelled before the duration elapsed
     */
    bool waitFor(std::chrono::milliseconds duration) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this]
                            { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<std::weak_ptr<CancellationToken>> children_;
};
