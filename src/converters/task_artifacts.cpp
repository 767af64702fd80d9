#include "core/converters/conversion_request.hpp"
#include "core/cache_manager.hpp"
#include "core/conversion_error.hpp"
#include "core/resource_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>

TaskArtifacts::TaskArtifacts(std::shared_ptr<CacheManager> cache, std::shared_ptr<ResourcePool> pool)
    : cache_(std::move(cache)), pool_(std::move(pool))
{
}

TaskArtifacts::~TaskArtifacts()
{
    release();
}

std::string TaskArtifacts::allocate(const std::string &extension)
{
    std::string path = cache_->createTemporaryURL(extension);
    track(path);
    return path;
}

std::string TaskArtifacts::allocateDirectory()
{
    std::string path = cache_->createTemporaryDirectory();
    track(path);
    return path;
}

void TaskArtifacts::track(const std::string &path)
{
    if (!cache_->contains(path))
    {
        throw ConversionError::sandboxViolation(path);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(paths_.begin(), paths_.end(), path) != paths_.end())
    {
        return;
    }
    paths_.push_back(path);
    released_ = false;
    if (pool_)
    {
        pool_->markFileAsActive(path);
    }
}

void TaskArtifacts::promote(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(promoted_.begin(), promoted_.end(), path) == promoted_.end())
    {
        promoted_.push_back(path);
    }
}

void TaskArtifacts::release()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_)
    {
        return;
    }
    removeLocked(true);
    released_ = true;
}

void TaskArtifacts::discardUnpromoted()
{
    std::lock_guard<std::mutex> lock(mutex_);
    removeLocked(false);
}

std::vector<std::string> TaskArtifacts::paths() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_;
}

size_t TaskArtifacts::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.size();
}

void TaskArtifacts::removeLocked(bool drop_promoted_marks)
{
    std::vector<std::string> kept;
    size_t removed = 0;
    for (const auto &path : paths_)
    {
        bool promoted = std::find(promoted_.begin(), promoted_.end(), path) != promoted_.end();
        if (!promoted)
        {
            cache_->remove(path);
            ++removed;
        }
        if (!promoted || drop_promoted_marks)
        {
            if (pool_)
            {
                pool_->markFileAsInactive(path);
            }
        }
        if (promoted && !drop_promoted_marks)
        {
            kept.push_back(path);
        }
    }
    paths_.swap(kept);
    if (removed > 0)
    {
        Logger::debug("Removed " + std::to_string(removed) + " temporary artifacts");
    }
}
