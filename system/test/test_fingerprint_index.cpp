// ============= test/test_fingerprint_index.cpp =============
#include "database/fingerprint_index.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace autoface;

TEST(ContentFingerprintTest, KnownSha256Vectors) {
    std::string abc = "abc";
    EXPECT_EQ(content_fingerprint(reinterpret_cast<const unsigned char*>(abc.data()), abc.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    EXPECT_EQ(content_fingerprint(std::vector<unsigned char>{}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(ContentFingerprintTest, SingleByteChangesFingerprint) {
    std::vector<unsigned char> a(1024, 0x42);
    std::vector<unsigned char> b = a;
    b[512] ^= 0x01;

    EXPECT_EQ(content_fingerprint(a), content_fingerprint(a));
    EXPECT_NE(content_fingerprint(a), content_fingerprint(b));
    EXPECT_EQ(content_fingerprint(a).size(), 64u);
}

TEST(FingerprintIndexTest, LookupMissingReturnsNullopt) {
    FingerprintIndex index;
    EXPECT_FALSE(index.lookup("deadbeef").has_value());
    EXPECT_EQ(index.size(), 0u);
}

TEST(FingerprintIndexTest, FirstRecordWins) {
    FingerprintIndex index;
    EXPECT_TRUE(index.record("fp", FingerprintHit{10, 1}));
    EXPECT_FALSE(index.record("fp", FingerprintHit{20, 2}));

    auto hit = index.lookup("fp");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->event_id, 10);
    EXPECT_EQ(hit->identity_id, 1);
    EXPECT_EQ(index.size(), 1u);
}

TEST(FingerprintIndexTest, LoadReplacesContents) {
    FingerprintIndex index;
    index.record("old", FingerprintHit{1, 1});

    index.load({{"a", FingerprintHit{5, 2}}, {"b", FingerprintHit{6, 3}}});

    EXPECT_FALSE(index.lookup("old").has_value());
    ASSERT_TRUE(index.lookup("b").has_value());
    EXPECT_EQ(index.lookup("b")->identity_id, 3);
    EXPECT_EQ(index.size(), 2u);
}

TEST(FingerprintIndexTest, ConcurrentRecordsKeepOneWinner) {
    FingerprintIndex index;
    std::vector<std::thread> threads;
    std::atomic<int> winners{0};

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            if (index.record("shared", FingerprintHit{t, t})) {
                winners++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(index.size(), 1u);
}
