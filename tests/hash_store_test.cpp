#include "test_peers.hpp"

#include <shoal/transfer_error.hpp>
#include <shoal/sha256_hasher.hpp>
#include <shoal/hash_store.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <thread>
#include <vector>

using namespace shoal;
using shoal_test::temp_dir;

namespace {

sha256_hash digest_of(const std::string& s)
{
    return create_sha256_digest(reinterpret_cast<const uint8_t*>(s.data()), s.length());
}

} // namespace

TEST(HashStoreTest, LookupOfUnknownSegmentFails)
{
    hash_store store;
    sha256_hash digest;
    EXPECT_FALSE(store.lookup(file_id("song.flac", 100), 0, 100, digest));
    EXPECT_TRUE(store.empty());
}

TEST(HashStoreTest, FirstRecordedDigestWins)
{
    hash_store store;
    const file_id file("song.flac", 2048);
    const auto first = digest_of("first attempt");
    const auto second = digest_of("second attempt");

    EXPECT_FALSE(store.record(file, 0, 1024, first));
    // the same digest again is fine
    EXPECT_FALSE(store.record(file, 0, 1024, first));
    EXPECT_EQ(store.record(file, 0, 1024, second), transfer_errc::verification_mismatch);

    sha256_hash digest;
    ASSERT_TRUE(store.lookup(file, 0, 1024, digest));
    EXPECT_EQ(digest, first);
    EXPECT_EQ(store.size(), 1);
}

TEST(HashStoreTest, KeyIncludesFileSizeOffsetAndLength)
{
    hash_store store;
    const auto d1 = digest_of("1");
    const auto d2 = digest_of("2");
    EXPECT_FALSE(store.record(file_id("a", 2048), 0, 1024, d1));
    EXPECT_FALSE(store.record(file_id("a", 4096), 0, 1024, d2));
    EXPECT_FALSE(store.record(file_id("a", 2048), 1024, 1024, d2));
    EXPECT_FALSE(store.record(file_id("a", 2048), 0, 512, d2));
    EXPECT_FALSE(store.record(file_id("b", 2048), 0, 1024, d2));
    EXPECT_EQ(store.size(), 5);

    // the full file digest is not part of the key
    sha256_hash digest;
    ASSERT_TRUE(store.lookup(file_id("a", 2048, d2), 0, 1024, digest));
    EXPECT_EQ(digest, d1);
}

TEST(HashStoreTest, SaveAndLoad)
{
    temp_dir dir("hash-store");
    const auto path = dir.path() / "digests";
    const file_id file("@@music\\Artist\\01 - Track.flac", 3 * 1024 * 1024);

    hash_store store;
    for(auto i = 0; i < 3; ++i) {
        store.record(file, i * 1024 * 1024, 1024 * 1024, digest_of(std::to_string(i)));
    }
    std::error_code error;
    store.save(path, error);
    ASSERT_FALSE(error) << error.message();

    hash_store loaded;
    // entries already in the store are kept
    loaded.record(file, 0, 1024 * 1024, digest_of("other"));
    loaded.load(path, error);
    ASSERT_FALSE(error) << error.message();
    EXPECT_EQ(loaded.size(), 3);

    sha256_hash digest;
    ASSERT_TRUE(loaded.lookup(file, 0, 1024 * 1024, digest));
    EXPECT_EQ(digest, digest_of("other"));
    ASSERT_TRUE(loaded.lookup(file, 2 * 1024 * 1024, 1024 * 1024, digest));
    EXPECT_EQ(digest, digest_of("2"));
}

TEST(HashStoreTest, LoadingMissingFileIsNotAnError)
{
    temp_dir dir("hash-store-missing");
    hash_store store;
    std::error_code error;
    store.load(dir.path() / "nothing-here", error);
    EXPECT_FALSE(error);
    EXPECT_TRUE(store.empty());
}

TEST(HashStoreTest, LoadingGarbageFails)
{
    temp_dir dir("hash-store-garbage");
    const auto path = dir.path() / "digests";
    {
        std::ofstream file(path);
        file << "this is not bencode";
    }
    hash_store store;
    std::error_code error;
    store.load(path, error);
    EXPECT_TRUE(error);
    EXPECT_TRUE(store.empty());
}

TEST(HashStoreTest, ConcurrentRecordsKeepOneDigest)
{
    hash_store store;
    const file_id file("shared.mp3", 1024);
    std::vector<std::thread> threads;
    std::atomic<int> num_mismatches{0};
    for(auto i = 0; i < 8; ++i) {
        threads.emplace_back([&store, &file, &num_mismatches, i] {
            if(store.record(file, 0, 1024, digest_of(std::to_string(i)))) {
                ++num_mismatches;
            }
        });
    }
    for(auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(store.size(), 1);
    EXPECT_EQ(num_mismatches, 7);
}
