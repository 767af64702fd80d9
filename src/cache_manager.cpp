#include "core/cache_manager.hpp"
#include "core/file_utils.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/resource_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <vector>

CacheOptions CacheOptions::fromConfig(const PocoConfigAdapter &config)
{
    CacheOptions options;
    options.root = config.getCacheDirectory();
    options.retention = std::chrono::hours(std::max(1, config.getCacheRetentionHours()));
    options.sweep_on_start = config.getCacheSweepOnStart();
    return options;
}

CacheManager::CacheManager(std::shared_ptr<ResourcePool> pool, CacheOptions options, Clock clock)
    : pool_(std::move(pool)), options_(std::move(options)),
      clock_(clock ? std::move(clock) : Clock([]
                                              { return fs::file_time_type::clock::now(); })),
      root_(options_.root.empty() ? defaultCacheRoot() : options_.root),
      rng_(std::random_device{}())
{
    fs::create_directories(root_);
    Logger::info("Cache directory: " + root_ + " (retention " + std::to_string(options_.retention.count()) + "h)");

    if (pool_)
    {
        idle_handle_ = pool_->addIdleCallback([this]()
                                              { sweep(); });
    }

    if (options_.sweep_on_start)
    {
        sweep();
    }
}

CacheManager::~CacheManager()
{
    if (pool_)
    {
        pool_->removeIdleCallback(idle_handle_);
    }
}

std::string CacheManager::createTemporaryURL(const std::string &extension)
{
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.')
    {
        ext.erase(0, 1);
    }

    fs::path candidate = fs::path(root_) / (ext.empty() ? uniqueName() : uniqueName() + "." + ext);

    std::error_code ec;
    if (fs::exists(candidate, ec))
    {
        Logger::warn("Cache path collision, removing existing entry: " + candidate.string());
        fs::remove_all(candidate, ec);
        if (ec)
        {
            // Stale entry could not be removed; pick another name instead of failing
            Logger::warn("Could not remove " + candidate.string() + ": " + ec.message());
            return createTemporaryURL(extension);
        }
    }
    return candidate.string();
}

std::string CacheManager::createTemporaryDirectory()
{
    std::string path = createTemporaryURL("");
    fs::create_directories(path);
    return path;
}

size_t CacheManager::sweep()
{
    std::lock_guard<std::mutex> lock(sweep_mutex_);

    const auto now = clock_();
    size_t removed = 0;
    size_t skipped_active = 0;

    std::vector<fs::path> entries;
    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec))
    {
        entries.push_back(it->path());
    }
    if (ec)
    {
        Logger::error("Cache sweep could not enumerate " + root_ + ": " + ec.message());
        return 0;
    }

    for (const auto &entry : entries)
    {
        try
        {
            auto age = now - fs::last_write_time(entry);
            if (age <= options_.retention)
            {
                continue;
            }
            if (isEntryActive(entry))
            {
                ++skipped_active;
                continue;
            }
            fs::remove_all(entry);
            ++removed;
            Logger::debug("Swept stale cache entry: " + entry.string());
        }
        catch (const fs::filesystem_error &e)
        {
            Logger::warn("Cache sweep skipped " + entry.string() + ": " + e.what());
        }
    }

    if (removed > 0 || skipped_active > 0)
    {
        Logger::info("Cache sweep removed " + std::to_string(removed) + " entries, kept " +
                     std::to_string(skipped_active) + " active");
    }
    return removed;
}

void CacheManager::remove(const std::string &path)
{
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
    {
        Logger::warn("Failed to remove cache artifact " + path + ": " + ec.message());
    }
}

bool CacheManager::contains(const std::string &path) const
{
    return FileUtils::isWithinDirectory(path, root_);
}

std::string CacheManager::defaultCacheRoot()
{
    fs::path base;
    if (const char *xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg)
    {
        base = xdg;
    }
    else if (const char *home = std::getenv("HOME"); home && *home)
    {
        base = fs::path(home) / ".cache";
    }
    else
    {
        base = fs::temp_directory_path();
    }
    return (base / "mediaconv" / "filecache").string();
}

std::string CacheManager::uniqueName()
{
    std::lock_guard<std::mutex> lock(name_mutex_);
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << rng_() << std::setw(16) << rng_();
    return ss.str();
}

bool CacheManager::isEntryActive(const fs::path &entry) const
{
    if (!pool_)
    {
        return false;
    }
    if (pool_->isFileActive(entry.string()))
    {
        return true;
    }
    if (fs::is_directory(entry))
    {
        for (const auto &active : pool_->activeFiles())
        {
            if (FileUtils::isWithinDirectory(active, entry.string()))
            {
                return true;
            }
        }
    }
    return false;
}
