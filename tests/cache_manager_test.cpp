#include "test_base.hpp"
#include "core/conversion_error.hpp"
#include "core/converters/conversion_request.hpp"
#include <set>

class CacheManagerTest : public TestBase
{
protected:
    // Cache whose clock can be moved forward by the test
    std::shared_ptr<CacheManager> makeClockedCache(const std::string &name)
    {
        CacheOptions options;
        options.root = (std::filesystem::path(getTestFilesDir()).parent_path() / name).string();
        options.retention = std::chrono::hours(24);
        options.sweep_on_start = false;
        return std::make_shared<CacheManager>(pool_, options, [this]()
                                              { return fs::file_time_type::clock::now() + clock_offset_; });
    }

    void touch(const std::string &path)
    {
        std::ofstream(path) << "x";
    }

    std::chrono::hours clock_offset_{0};
};

TEST_F(CacheManagerTest, TemporaryUrlsAreUniqueAndInsideTheRoot)
{
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i)
    {
        std::string url = cache_->createTemporaryURL(".png");
        EXPECT_TRUE(cache_->contains(url)) << url;
        EXPECT_EQ(fs::path(url).extension(), ".png");
        EXPECT_TRUE(seen.insert(url).second) << "duplicate " << url;
    }
}

TEST_F(CacheManagerTest, ContainsRejectsEscapes)
{
    EXPECT_FALSE(cache_->contains("/etc/passwd"));
    EXPECT_FALSE(cache_->contains(cache_->root() + "/../outside.png"));
    EXPECT_TRUE(cache_->contains(cache_->root() + "/nested/inside.png"));
}

TEST_F(CacheManagerTest, SweepRemovesOnlyStaleInactiveEntries)
{
    auto cache = makeClockedCache("clocked_cache");
    std::string stale = cache->createTemporaryURL("mp4");
    std::string active = cache->createTemporaryURL("mp4");
    touch(stale);
    touch(active);
    pool_->markFileAsActive(active);

    EXPECT_EQ(cache->sweep(), 0u);

    clock_offset_ = std::chrono::hours(25);
    EXPECT_EQ(cache->sweep(), 1u);
    EXPECT_FALSE(fs::exists(stale));
    EXPECT_TRUE(fs::exists(active));

    pool_->markFileAsInactive(active);
    EXPECT_EQ(cache->sweep(), 1u);
    EXPECT_FALSE(fs::exists(active));
}

TEST_F(CacheManagerTest, SweepKeepsDirectoriesWithActiveContent)
{
    auto cache = makeClockedCache("clocked_dirs");
    std::string directory = cache->createTemporaryDirectory();
    std::string page = (fs::path(directory) / "page_001.png").string();
    touch(page);
    pool_->markFileAsActive(page);

    clock_offset_ = std::chrono::hours(48);
    EXPECT_EQ(cache->sweep(), 0u);
    EXPECT_TRUE(fs::exists(page));
    pool_->markFileAsInactive(page);
}

TEST_F(CacheManagerTest, CachesSharingAPoolEachSweepWhenIdle)
{
    auto first = makeClockedCache("first_cache");
    auto second = makeClockedCache("second_cache");
    std::string first_entry = first->createTemporaryURL("png");
    std::string second_entry = second->createTemporaryURL("png");
    touch(first_entry);
    touch(second_entry);
    clock_offset_ = std::chrono::hours(25);

    pool_->beginTask("idle-1", MediaCategory::Image);
    pool_->endTask("idle-1");
    EXPECT_FALSE(fs::exists(first_entry));
    EXPECT_FALSE(fs::exists(second_entry));

    // Destroying one cache leaves the other's sweep registered
    second.reset();
    std::string later_entry = first->createTemporaryURL("png");
    touch(later_entry);
    pool_->beginTask("idle-2", MediaCategory::Image);
    pool_->endTask("idle-2");
    EXPECT_FALSE(fs::exists(later_entry));
}

TEST_F(CacheManagerTest, ArtifactsAreDeletedUnlessPromoted)
{
    std::string kept;
    std::string dropped;
    {
        TaskArtifacts artifacts(cache_, pool_);
        kept = artifacts.allocate("png");
        dropped = artifacts.allocate("png");
        touch(kept);
        touch(dropped);
        EXPECT_TRUE(pool_->isFileActive(kept));

        artifacts.promote(kept);
    }

    EXPECT_TRUE(fs::exists(kept));
    EXPECT_FALSE(fs::exists(dropped));
    EXPECT_FALSE(pool_->isFileActive(kept));
    EXPECT_FALSE(pool_->isFileActive(dropped));
}

TEST_F(CacheManagerTest, DiscardUnpromotedClearsPreviousAttempt)
{
    TaskArtifacts artifacts(cache_, pool_);
    std::string first = artifacts.allocate("mp4");
    touch(first);

    artifacts.discardUnpromoted();
    EXPECT_FALSE(fs::exists(first));
    EXPECT_EQ(artifacts.size(), 0u);

    std::string second = artifacts.allocate("mp4");
    touch(second);
    EXPECT_EQ(artifacts.size(), 1u);
    artifacts.release();
    artifacts.release();
    EXPECT_FALSE(fs::exists(second));
}

TEST_F(CacheManagerTest, TrackingOutsideTheCacheIsASandboxViolation)
{
    TaskArtifacts artifacts(cache_, pool_);
    std::string outside = createDummyFile("victim.txt");

    try
    {
        artifacts.track(outside);
        FAIL() << "expected SandboxViolation";
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::SandboxViolation);
    }
    artifacts.release();
    EXPECT_TRUE(fs::exists(outside));
}
