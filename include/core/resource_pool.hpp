#pragma once

#include "core/format_descriptor.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <string>
#include <vector>

/**
 * @brief Admission control and bookkeeping for running conversions.
 *
 * Counters are atomics so concurrent begin/end calls from several coordinators
 * never lose updates. The task map and the active-file set are mutex guarded.
 */
class ResourcePool
{
public:
    using MemoryProvider = std::function<uint64_t()>;
    using IdleCallback = std::function<void()>;

    static constexpr uint64_t kMiB = 1024ULL * 1024ULL;
    static constexpr uint64_t kBaseRequirement = 100 * kMiB;
    static constexpr uint64_t kVideoPenalty = 500 * kMiB;
    static constexpr uint64_t kImageToVideoPenalty = 250 * kMiB;

    struct AdmissionDecision
    {
        bool admitted;
        uint64_t required_bytes;
        uint64_t available_bytes;
    };

    /**
     * @param memory_provider Source of currently available physical memory in bytes.
     *        Defaults to readAvailableMemory().
     */
    explicit ResourcePool(MemoryProvider memory_provider = nullptr);

    ResourcePool(const ResourcePool &) = delete;
    ResourcePool &operator=(const ResourcePool &) = delete;

    /**
     * @brief Register a task and bump the counters. Never blocks.
     * @return false if the id is already registered (counters unchanged)
     */
    bool beginTask(const std::string &task_id, MediaCategory category);

    /**
     * @brief Unregister a task. Unknown ids are logged and ignored.
     * Fires the idle callback when the last active task ends.
     */
    void endTask(const std::string &task_id);

    /**
     * @brief Pre-flight memory check: rejects iff required > available / 2
     */
    AdmissionDecision checkResourceAvailability(const std::string &task_id,
                                                const FormatDescriptor &from,
                                                const FormatDescriptor &to) const;

    static uint64_t estimateRequiredMemory(const FormatDescriptor &from, const FormatDescriptor &to);

    // Temporary files currently being written or read by a task
    void markFileAsActive(const std::string &path);
    void markFileAsInactive(const std::string &path);
    bool isFileActive(const std::string &path) const;
    std::vector<std::string> activeFiles() const;

    size_t activeTaskCount() const { return active_total_.load(); }
    size_t activeTaskCount(MediaCategory category) const;
    uint64_t totalTasksStarted() const { return tasks_started_.load(); }
    uint64_t totalTasksEnded() const { return tasks_ended_.load(); }

    /**
     * @brief Register a callback fired when the last active task ends
     * @return Handle for removeIdleCallback()
     */
    uint64_t addIdleCallback(IdleCallback callback);

    /**
     * @brief Unregister a callback; blocks while an idle notification is running
     */
    void removeIdleCallback(uint64_t handle);

    /**
     * @brief MemAvailable from /proc/meminfo, falling back to sysinfo(2)
     */
    static uint64_t readAvailableMemory();

private:
    struct TaskEntry
    {
        MediaCategory category;
        std::chrono::steady_clock::time_point started_at;
    };

    static size_t categoryIndex(MediaCategory category);
    static std::string normalizePath(const std::string &path);
    void notifyIdle();

    MemoryProvider memory_provider_;

    std::atomic<size_t> active_total_{0};
    std::array<std::atomic<size_t>, 4> active_by_category_{};
    std::atomic<uint64_t> tasks_started_{0};
    std::atomic<uint64_t> tasks_ended_{0};

    mutable std::mutex tasks_mutex_;
    std::map<std::string, TaskEntry> tasks_;

    mutable std::mutex files_mutex_;
    std::map<std::string, int> active_files_;

    std::mutex callback_mutex_;
    std::map<uint64_t, IdleCallback> idle_callbacks_;
    uint64_t next_callback_handle_ = 0;
};

/**
 * @brief RAII task registration: beginTask on construction, exactly one endTask
 */
class ScopedTask
{
public:
    ScopedTask(ResourcePool &pool, std::string task_id, MediaCategory category)
        : pool_(pool), task_id_(std::move(task_id)), registered_(pool_.beginTask(task_id_, category))
    {
    }

    ~ScopedTask()
    {
        release();
    }

    void release()
    {
        if (registered_)
        {
            registered_ = false;
            pool_.endTask(task_id_);
        }
    }

    bool registered() const { return registered_; }
    const std::string &taskId() const { return task_id_; }

    ScopedTask(const ScopedTask &) = delete;
    ScopedTask &operator=(const ScopedTask &) = delete;

private:
    ResourcePool &pool_;
    std::string task_id_;
    bool registered_;
};
