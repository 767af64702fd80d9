#include "core/resource_pool.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <sstream>
#include <sys/sysinfo.h>

ResourcePool::ResourcePool(MemoryProvider memory_provider)
    : memory_provider_(memory_provider ? std::move(memory_provider) : MemoryProvider(&ResourcePool::readAvailableMemory))
{
}

bool ResourcePool::beginTask(const std::string &task_id, MediaCategory category)
{
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        if (!tasks_.emplace(task_id, TaskEntry{category, std::chrono::steady_clock::now()}).second)
        {
            Logger::warn("ResourcePool: task " + task_id + " is already registered");
            return false;
        }
        active_total_.fetch_add(1);
        active_by_category_[categoryIndex(category)].fetch_add(1);
    }
    tasks_started_.fetch_add(1);

    Logger::debug("ResourcePool: began " + categoryName(category) + " task " + task_id +
                  " (active: " + std::to_string(active_total_.load()) + ")");
    return true;
}

void ResourcePool::endTask(const std::string &task_id)
{
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end())
        {
            Logger::warn("ResourcePool: endTask for unknown task " + task_id);
            return;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - it->second.started_at);
        active_by_category_[categoryIndex(it->second.category)].fetch_sub(1);
        remaining = active_total_.fetch_sub(1) - 1;
        tasks_.erase(it);

        Logger::debug("ResourcePool: ended task " + task_id + " after " + std::to_string(elapsed.count()) +
                      " ms (active: " + std::to_string(remaining) + ")");
    }
    tasks_ended_.fetch_add(1);

    if (remaining == 0)
    {
        notifyIdle();
    }
}

ResourcePool::AdmissionDecision ResourcePool::checkResourceAvailability(const std::string &task_id,
                                                                        const FormatDescriptor &from,
                                                                        const FormatDescriptor &to) const
{
    AdmissionDecision decision;
    decision.required_bytes = estimateRequiredMemory(from, to);
    decision.available_bytes = memory_provider_();
    // Half of available memory is held back for estimation error and other tasks
    decision.admitted = decision.required_bytes <= decision.available_bytes / 2;

    if (decision.admitted)
    {
        Logger::debug("ResourcePool: admitted task " + task_id + " (" +
                      FileUtils::formatBytes(decision.required_bytes) + " of " +
                      FileUtils::formatBytes(decision.available_bytes) + " available)");
    }
    else
    {
        Logger::warn("ResourcePool: rejected task " + task_id + ", requires " +
                     FileUtils::formatBytes(decision.required_bytes) + " but only " +
                     FileUtils::formatBytes(decision.available_bytes) + " available");
    }
    return decision;
}

uint64_t ResourcePool::estimateRequiredMemory(const FormatDescriptor &from, const FormatDescriptor &to)
{
    uint64_t required = kBaseRequirement;
    if (from.category() == MediaCategory::Video || to.category() == MediaCategory::Video)
    {
        required += kVideoPenalty;
    }
    if (from.category() == MediaCategory::Image && to.category() == MediaCategory::Video)
    {
        required += kImageToVideoPenalty;
    }
    return required;
}

void ResourcePool::markFileAsActive(const std::string &path)
{
    std::lock_guard<std::mutex> lock(files_mutex_);
    ++active_files_[normalizePath(path)];
}

void ResourcePool::markFileAsInactive(const std::string &path)
{
    std::lock_guard<std::mutex> lock(files_mutex_);
    auto it = active_files_.find(normalizePath(path));
    if (it == active_files_.end())
    {
        return;
    }
    if (--it->second <= 0)
    {
        active_files_.erase(it);
    }
}

bool ResourcePool::isFileActive(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(files_mutex_);
    return active_files_.count(normalizePath(path)) > 0;
}

std::vector<std::string> ResourcePool::activeFiles() const
{
    std::lock_guard<std::mutex> lock(files_mutex_);
    std::vector<std::string> files;
    files.reserve(active_files_.size());
    for (const auto &entry : active_files_)
    {
        files.push_back(entry.first);
    }
    return files;
}

size_t ResourcePool::activeTaskCount(MediaCategory category) const
{
    return active_by_category_[categoryIndex(category)].load();
}

uint64_t ResourcePool::addIdleCallback(IdleCallback callback)
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    uint64_t handle = ++next_callback_handle_;
    if (callback)
    {
        idle_callbacks_[handle] = std::move(callback);
    }
    return handle;
}

void ResourcePool::removeIdleCallback(uint64_t handle)
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    idle_callbacks_.erase(handle);
}

void ResourcePool::notifyIdle()
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    for (auto &entry : idle_callbacks_)
    {
        try
        {
            entry.second();
        }
        catch (const std::exception &e)
        {
            Logger::error("ResourcePool: idle callback failed: " + std::string(e.what()));
        }
    }
}

uint64_t ResourcePool::readAvailableMemory()
{
    std::ifstream meminfo("/proc/meminfo");
    std::string line;
    while (std::getline(meminfo, line))
    {
        if (line.rfind("MemAvailable:", 0) == 0)
        {
            std::istringstream fields(line.substr(13));
            uint64_t kilobytes = 0;
            if (fields >> kilobytes)
            {
                return kilobytes * 1024;
            }
        }
    }

    struct sysinfo info;
    if (sysinfo(&info) == 0)
    {
        return static_cast<uint64_t>(info.freeram + info.bufferram) * info.mem_unit;
    }

    Logger::warn("ResourcePool: unable to determine available memory");
    return 0;
}

size_t ResourcePool::categoryIndex(MediaCategory category)
{
    switch (category)
    {
    case MediaCategory::Image:
        return 0;
    case MediaCategory::Audio:
        return 1;
    case MediaCategory::Video:
    case MediaCategory::Audiovisual:
        return 2;
    case MediaCategory::Document:
        return 3;
    }
    return 0;
}

std::string ResourcePool::normalizePath(const std::string &path)
{
    return fs::path(path).lexically_normal().string();
}
