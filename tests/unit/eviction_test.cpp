#include <gtest/gtest.h>
#include "eviction.hpp"
#include <map>
#include <set>

namespace {

// Directory listing held in memory. Files named in busy refuse removal.
class FakeCacheDirectory : public CacheDirectory {
public:
    std::map<std::string, CacheFileInfo> files;
    std::set<std::string> busy;
    std::set<std::string> broken;
    std::vector<std::string> removed;

    void addBucket(const std::string& name, int64_t data_size, int64_t metadata_size,
                   std::chrono::system_clock::time_point last_modified) {
        files[name + "_data"] = CacheFileInfo{name + "_data", data_size, last_modified};
        files[name + "_metadata"] = CacheFileInfo{name + "_metadata", metadata_size, last_modified};
    }

    void initialize() override {}

    std::vector<CacheFileInfo> listFiles() const override {
        std::vector<CacheFileInfo> result;
        for (const auto& [name, info] : files) {
            result.push_back(info);
        }
        return result;
    }

    std::unique_ptr<BucketFile> openFile(const std::string& name) override {
        throw StorageError("Not supported by the fake directory: " + name);
    }

    RemoveResult removeFile(const std::string& name) override {
        if (busy.count(name)) {
            return RemoveResult::Busy;
        }
        if (broken.count(name) || !files.count(name)) {
            return RemoveResult::Failed;
        }
        files.erase(name);
        removed.push_back(name);
        return RemoveResult::Removed;
    }

    int64_t usage() const override {
        int64_t total = 0;
        for (const auto& [name, info] : files) {
            total += info.size;
        }
        return total;
    }

    int64_t quota() const override { return 0; }
};

} // namespace

class EvictionTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::chrono::system_clock::now();
    }

    std::chrono::system_clock::time_point daysAgo(int days) const {
        return now_ - std::chrono::hours(24 * days);
    }

    FakeCacheDirectory directory_;
    std::chrono::system_clock::time_point now_;
};

TEST_F(EvictionTest, ZeroFractionRemovesOnlyExpiredBuckets) {
    directory_.addBucket("old", 100, 28, daysAgo(100));
    directory_.addBucket("recent", 100, 28, daysAgo(10));

    EvictionResult result = evictBuckets(directory_, 0.0, now_);

    EXPECT_TRUE(result.target_met);
    EXPECT_EQ(result.removed_buckets, 1);
    EXPECT_EQ(result.deleted_bytes, 128);
    EXPECT_EQ(directory_.files.count("old_data"), 0u);
    EXPECT_EQ(directory_.files.count("old_metadata"), 0u);
    EXPECT_EQ(directory_.files.count("recent_data"), 1u);
}

TEST_F(EvictionTest, RemovesOldestFirstUntilTargetMet) {
    directory_.addBucket("newest", 100, 0, daysAgo(1));
    directory_.addBucket("oldest", 100, 0, daysAgo(30));
    directory_.addBucket("middle", 100, 0, daysAgo(10));

    // 120 of 300 bytes needs two buckets
    EvictionResult result = evictBuckets(directory_, 0.4, now_);

    EXPECT_TRUE(result.target_met);
    EXPECT_EQ(result.total_bytes, 300);
    EXPECT_EQ(result.min_bytes, 120);
    EXPECT_EQ(result.removed_buckets, 2);
    EXPECT_EQ(directory_.files.count("newest_data"), 1u);
    EXPECT_EQ(directory_.files.count("oldest_data"), 0u);
    EXPECT_EQ(directory_.files.count("middle_data"), 0u);
}

TEST_F(EvictionTest, MetadataFileIsRemovedBeforeData) {
    directory_.addBucket("bucket", 10, 28, daysAgo(200));

    evictBuckets(directory_, 0.0, now_);

    ASSERT_EQ(directory_.removed.size(), 2u);
    EXPECT_EQ(directory_.removed[0], "bucket_metadata");
    EXPECT_EQ(directory_.removed[1], "bucket_data");
}

TEST_F(EvictionTest, BusyBucketsAreSkipped) {
    directory_.addBucket("open", 500, 28, daysAgo(200));
    directory_.addBucket("closed", 100, 28, daysAgo(5));
    directory_.busy.insert("open_metadata");

    EvictionResult result = evictBuckets(directory_, 1.0, now_);

    EXPECT_FALSE(result.target_met);
    EXPECT_EQ(result.busy_buckets, 1);
    EXPECT_EQ(result.removed_buckets, 1);
    EXPECT_EQ(directory_.files.count("open_data"), 1u);
    EXPECT_EQ(directory_.files.count("open_metadata"), 1u);
    EXPECT_EQ(directory_.files.count("closed_data"), 0u);
}

TEST_F(EvictionTest, FailedRemovalIsTolerated) {
    directory_.addBucket("broken", 100, 28, daysAgo(200));
    directory_.addBucket("fine", 100, 28, daysAgo(150));
    directory_.broken.insert("broken_metadata");

    EvictionResult result = evictBuckets(directory_, 0.0, now_);

    EXPECT_EQ(result.removed_buckets, 1);
    EXPECT_EQ(directory_.files.count("broken_data"), 1u);
    EXPECT_EQ(directory_.files.count("fine_data"), 0u);
}

TEST_F(EvictionTest, FullEvictionNeverIncreasesUsage) {
    directory_.addBucket("a", 10, 28, daysAgo(1));
    directory_.addBucket("b", 20, 52, daysAgo(2));
    int64_t before = directory_.usage();

    EvictionResult result = evictBuckets(directory_, 1.0, now_);

    EXPECT_TRUE(result.target_met);
    EXPECT_LE(directory_.usage(), before);
    EXPECT_EQ(directory_.usage(), 0);
}

TEST_F(EvictionTest, EmptyDirectory) {
    EvictionResult result = evictBuckets(directory_, 0.5, now_);

    EXPECT_TRUE(result.target_met);
    EXPECT_EQ(result.total_bytes, 0);
    EXPECT_EQ(result.removed_buckets, 0);
}
