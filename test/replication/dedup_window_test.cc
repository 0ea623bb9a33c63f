#include <gtest/gtest.h>

#include <string>

#include "replication/dedup_window.h"

using namespace MqBridge;

TEST(DedupWindowTest, InsertReportsFirstSighting) {
    DedupWindow window(10, 2);
    EXPECT_TRUE(window.Insert("k2r:orders:0:1"));
    EXPECT_FALSE(window.Insert("k2r:orders:0:1")) << "second insert of the same id must be refused";
    EXPECT_TRUE(window.Contains("k2r:orders:0:1"));
    EXPECT_FALSE(window.Contains("k2r:orders:0:2"));
    EXPECT_EQ(window.size(), 1u);
}

TEST(DedupWindowTest, EvictsOldestBatchWhenFull) {
    DedupWindow window(5, 2);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(window.Insert("id-" + std::to_string(i)));
    }
    EXPECT_EQ(window.size(), 5u);

    // The sixth insert drops id-0 and id-1 before adding id-5.
    EXPECT_TRUE(window.Insert("id-5"));
    EXPECT_EQ(window.size(), 4u);
    EXPECT_FALSE(window.Contains("id-0"));
    EXPECT_FALSE(window.Contains("id-1"));
    for (int i = 2; i <= 5; ++i) {
        EXPECT_TRUE(window.Contains("id-" + std::to_string(i))) << "id-" << i;
    }
}

TEST(DedupWindowTest, NeverExceedsCapacity) {
    DedupWindow window(100, 10);
    for (int i = 0; i < 1000; ++i) {
        window.Insert("id-" + std::to_string(i));
        ASSERT_LE(window.size(), window.capacity());
    }
    EXPECT_TRUE(window.Contains("id-999"));
    EXPECT_FALSE(window.Contains("id-0"));
}

TEST(DedupWindowTest, EvictedIdCanBeInsertedAgain) {
    DedupWindow window(2, 1);
    window.Insert("a");
    window.Insert("b");
    window.Insert("c");  // evicts a
    EXPECT_FALSE(window.Contains("a"));
    EXPECT_TRUE(window.Insert("a"));
}

TEST(DedupWindowTest, DefaultsMatchProductionWindow) {
    DedupWindow window;
    EXPECT_EQ(window.capacity(), 10000u);
    for (int i = 0; i < 10000; ++i) {
        window.Insert("id-" + std::to_string(i));
    }
    EXPECT_EQ(window.size(), 10000u);
    window.Insert("overflow");
    EXPECT_EQ(window.size(), 9001u);
    EXPECT_FALSE(window.Contains("id-999"));
    EXPECT_TRUE(window.Contains("id-1000"));
}
