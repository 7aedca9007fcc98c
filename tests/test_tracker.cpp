// File: tests/test_tracker.cpp
// Purpose: Exercise the allocation tracker's registry and bulk release.
// Key invariants: Every allocation is registered once; releaseAll empties the
//                 registry and may be repeated.

#include <gtest/gtest.h>

#include "kapila.h"

#include <cstring>

using namespace kapila;

TEST(AllocationTrackerTest, AllocateRegistersEachBuffer) {
    AllocationTracker tracker;
    EXPECT_EQ(tracker.allocationCount(), 0u);

    auto a = tracker.allocate(16);
    auto b = tracker.allocate(32);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a, b);
    EXPECT_EQ(tracker.allocationCount(), 2u);
    EXPECT_EQ(tracker.bytesAllocated(), 48u);
}

TEST(AllocationTrackerTest, ZeroSizeAllocationIsStillABuffer) {
    AllocationTracker tracker;
    EXPECT_NE(tracker.allocate(0), nullptr);
    EXPECT_EQ(tracker.allocationCount(), 1u);
    EXPECT_EQ(tracker.bytesAllocated(), 0u);
}

TEST(AllocationTrackerTest, DuplicateTextCopiesAndTerminates) {
    AllocationTracker tracker;
    char source[] = "abc";
    auto v = tracker.duplicateText(source, 3);
    source[0] = 'x';

    ASSERT_TRUE(v.isText());
    auto& t = v.asText();
    EXPECT_TRUE(t.owned);
    EXPECT_EQ(t.length, 3u);
    EXPECT_NE(t.bytes, source);
    EXPECT_EQ(std::strcmp(t.bytes, "abc"), 0);
    EXPECT_EQ(tracker.allocationCount(), 1u);
}

TEST(AllocationTrackerTest, TypedAllocationIsValueInitialized) {
    AllocationTracker tracker;
    auto items = tracker.allocate<Value>(4);
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(items[i].isInteger());
        EXPECT_EQ(items[i].asInteger(), 0);
    }
    auto list = tracker.allocate<List>(1);
    EXPECT_EQ(list->items, nullptr);
    EXPECT_EQ(list->length, 0u);
    EXPECT_EQ(tracker.allocationCount(), 2u);
}

TEST(AllocationTrackerTest, ReleaseAllIsIdempotent) {
    AllocationTracker tracker;
    tracker.allocate(8);
    tracker.duplicateText("hello", 5);
    tracker.releaseAll();
    EXPECT_EQ(tracker.allocationCount(), 0u);
    EXPECT_EQ(tracker.bytesAllocated(), 0u);
    tracker.releaseAll();
    EXPECT_EQ(tracker.allocationCount(), 0u);
}

TEST(AllocationTrackerTest, LimitRaisesOutOfMemory) {
    AllocationTracker tracker(64);
    tracker.allocate(60);
    try {
        tracker.allocate(8);
        FAIL() << "expected RuntimeFault";
    }
    catch (const RuntimeFault& fault) {
        EXPECT_EQ(fault.kind(), FaultKind::OutOfMemory);
    }
    EXPECT_EQ(tracker.allocationCount(), 1u);
    EXPECT_EQ(tracker.bytesAllocated(), 60u);

    tracker.setLimit(0);
    EXPECT_NE(tracker.allocate(8), nullptr);
}
