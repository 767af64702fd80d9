#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>

class PocoConfigAdapter;
class ResourcePool;

struct CacheOptions
{
    std::string root;                       // Empty selects defaultCacheRoot()
    std::chrono::hours retention{24};       // Entries older than this are swept
    bool sweep_on_start = true;

    static CacheOptions fromConfig(const PocoConfigAdapter &config);
};

/**
 * @brief Owns the temporary artifact directory.
 *
 * Hands out collision-free output locations and removes entries older than the
 * retention window that no task has marked active in the ResourcePool. Sweeps
 * run on construction and whenever the pool reports that its last task ended.
 */
class CacheManager
{
public:
    using Clock = std::function<std::filesystem::file_time_type()>;

    CacheManager(std::shared_ptr<ResourcePool> pool, CacheOptions options, Clock clock = nullptr);
    ~CacheManager();

    CacheManager(const CacheManager &) = delete;
    CacheManager &operator=(const CacheManager &) = delete;

    /**
     * @brief Fresh unique path `<root>/<hex>.<extension>`; any entry already at
     * that path is removed first. The file itself is not created.
     */
    std::string createTemporaryURL(const std::string &extension);

    /**
     * @brief Fresh empty directory under the cache root
     */
    std::string createTemporaryDirectory();

    /**
     * @brief Remove stale, inactive entries
     * @return Number of top-level entries removed
     */
    size_t sweep();

    /**
     * @brief Delete a file or directory artifact; failures are logged only
     */
    void remove(const std::string &path);

    bool contains(const std::string &path) const;
    const std::string &root() const { return root_; }
    std::chrono::hours retention() const { return options_.retention; }

    static std::string defaultCacheRoot();

private:
    std::string uniqueName();
    bool isEntryActive(const std::filesystem::path &entry) const;

    std::shared_ptr<ResourcePool> pool_;
    uint64_t idle_handle_ = 0;
    CacheOptions options_;
    Clock clock_;
    std::string root_;

    std::mutex name_mutex_;
    std::mt19937_64 rng_;

    std::mutex sweep_mutex_;
};
