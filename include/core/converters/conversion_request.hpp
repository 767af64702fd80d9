#pragma once

#include "core/backend/media_backend.hpp"
#include "core/cancellation_token.hpp"
#include "core/conversion_settings.hpp"
#include "core/format_descriptor.hpp"
#include "core/processing_result.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class CacheManager;
class ResourcePool;

/**
 * @brief Temporary files and directories owned by one conversion task.
 *
 * Every path handed out lives under the cache root and is marked active in the
 * ResourcePool until the task releases it. Destruction deletes everything that
 * was not promoted, so cleanup happens on every exit path.
 */
class TaskArtifacts
{
public:
    TaskArtifacts(std::shared_ptr<CacheManager> cache, std::shared_ptr<ResourcePool> pool);
    ~TaskArtifacts();

    TaskArtifacts(const TaskArtifacts &) = delete;
    TaskArtifacts &operator=(const TaskArtifacts &) = delete;

    /**
     * @brief New cache location `<root>/<hex>.<extension>` owned by this task
     */
    std::string allocate(const std::string &extension);

    /**
     * @brief New empty cache directory owned by this task
     */
    std::string allocateDirectory();

    /**
     * @brief Take ownership of an existing path
     * @throws ConversionError (SandboxViolation) if the path is outside the cache root
     */
    void track(const std::string &path);

    /**
     * @brief Hand `path` over to the caller: it survives release() and destruction
     */
    void promote(const std::string &path);

    /**
     * @brief Delete every unpromoted artifact and mark all of them inactive
     */
    void release();

    /**
     * @brief Delete every unpromoted artifact but keep owning the list (between attempts)
     */
    void discardUnpromoted();

    std::vector<std::string> paths() const;
    size_t size() const;

private:
    void removeLocked(bool drop_promoted_marks);

    std::shared_ptr<CacheManager> cache_;
    std::shared_ptr<ResourcePool> pool_;

    mutable std::mutex mutex_;
    std::vector<std::string> paths_;
    std::vector<std::string> promoted_;
    bool released_ = false;
};

/**
 * @brief Shared services the converters work with
 */
struct ConverterContext
{
    std::shared_ptr<MediaBackend> backend;
    std::shared_ptr<CacheManager> cache;
    std::shared_ptr<ResourcePool> pool;
    ConversionSettings settings;
};

/**
 * @brief One conversion attempt as seen by a converter
 */
struct ConversionRequest
{
    std::string input_path;
    FormatDescriptor target;
    ConversionMetadata metadata;
    ProgressCallback progress;                  // Fraction of this attempt, may be empty
    std::shared_ptr<CancellationToken> token;   // Never null
    std::shared_ptr<TaskArtifacts> artifacts;   // Never null
    bool reduced_quality = false;
};
