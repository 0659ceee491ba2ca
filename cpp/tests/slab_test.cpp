#include <gtest/gtest.h>
#include "strata/slab.hpp"

#include <iterator>
#include <set>
#include <vector>

using namespace strata;
using namespace strata::slab;

class SlabTest : public ::testing::Test {
protected:
    static constexpr uint32_t CAPACITY = 16;

    void SetUp() override {
        region.resize(Slab::region_size(CAPACITY));
        ASSERT_EQ(Slab::init(region.data(), region.size(), CAPACITY), ErrorCode::OK);
        slab = Slab(region.data(), region.size());
    }

    std::vector<uint8_t> region;
    Slab slab;
};

TEST_F(SlabTest, FreshSlabIsEmpty) {
    EXPECT_EQ(slab.validate(), ErrorCode::OK);
    EXPECT_EQ(slab.capacity(), CAPACITY);
    EXPECT_EQ(slab.allocated(), 0u);
    EXPECT_EQ(slab.available(), CAPACITY);
    EXPECT_EQ(slab.root(), NIL_NODE);
}

TEST_F(SlabTest, InitRejectsBadCapacity) {
    EXPECT_EQ(Slab::init(region.data(), region.size(), 0), ErrorCode::INVALID_CAPACITY);
    EXPECT_EQ(Slab::init(region.data(), region.size(), CAPACITY + 1), ErrorCode::REGION_TOO_SMALL);
}

TEST_F(SlabTest, AllocatesUntilExhausted) {
    std::set<NodeHandle> handles;
    for (uint32_t i = 0; i < CAPACITY; ++i) {
        auto h = slab.allocate();
        ASSERT_TRUE(h.has_value());
        EXPECT_TRUE(handles.insert(*h).second);
    }
    EXPECT_TRUE(slab.full());
    EXPECT_FALSE(slab.allocate().has_value());
}

TEST_F(SlabTest, FreedIndexIsReusedFirst) {
    auto a = slab.allocate();
    auto b = slab.allocate();
    ASSERT_TRUE(a && b);

    EXPECT_EQ(slab.free(*a), ErrorCode::OK);
    EXPECT_EQ(slab.allocated(), 1u);

    auto c = slab.allocate();
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, *a);
    EXPECT_EQ(slab.node(*c)->tag, NodeTag::UNINITIALIZED);
}

TEST_F(SlabTest, FreeListIsLifo) {
    std::vector<NodeHandle> handles;
    for (int i = 0; i < 4; ++i) handles.push_back(*slab.allocate());

    EXPECT_EQ(slab.free(handles[1]), ErrorCode::OK);
    EXPECT_EQ(slab.free(handles[3]), ErrorCode::OK);

    EXPECT_EQ(*slab.allocate(), handles[3]);
    EXPECT_EQ(*slab.allocate(), handles[1]);
    // Free list drained: next comes from the bump index
    EXPECT_EQ(*slab.allocate(), 4u);
}

TEST_F(SlabTest, DoubleFreeIsRejected) {
    auto a = slab.allocate();
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(slab.free(*a), ErrorCode::OK);
    EXPECT_EQ(slab.free(*a), ErrorCode::CORRUPT_STATE);
    EXPECT_EQ(slab.allocated(), 0u);
}

TEST_F(SlabTest, FreeOfUnallocatedIndexIsRejected) {
    EXPECT_EQ(slab.free(0), ErrorCode::CORRUPT_STATE);
    EXPECT_EQ(slab.free(NIL_NODE), ErrorCode::CORRUPT_STATE);
    EXPECT_EQ(slab.node(3), nullptr);
}

TEST_F(SlabTest, NoIndexHandedOutTwiceWhileLive) {
    std::set<NodeHandle> live;
    uint64_t seed = 7;
    for (int step = 0; step < 500; ++step) {
        seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
        if ((seed >> 33) % 3 != 0 || live.empty()) {
            auto h = slab.allocate();
            if (!h) {
                EXPECT_EQ(live.size(), CAPACITY);
                continue;
            }
            EXPECT_TRUE(live.insert(*h).second) << "index " << *h << " handed out twice";
        } else {
            auto it = live.begin();
            std::advance(it, static_cast<long>((seed >> 40) % live.size()));
            EXPECT_EQ(slab.free(*it), ErrorCode::OK);
            live.erase(it);
        }
        EXPECT_EQ(slab.allocated(), live.size());
    }
    EXPECT_EQ(slab.validate(), ErrorCode::OK);
}

TEST_F(SlabTest, StateSurvivesRebinding) {
    auto a = slab.allocate();
    auto b = slab.allocate();
    ASSERT_TRUE(a && b);
    EXPECT_EQ(slab.free(*a), ErrorCode::OK);

    // A copy of the bytes is a complete slab: indices, not pointers
    std::vector<uint8_t> copy = region;
    Slab reloaded(copy.data(), copy.size());
    EXPECT_EQ(reloaded.validate(), ErrorCode::OK);
    EXPECT_EQ(reloaded.allocated(), 1u);
    EXPECT_EQ(*reloaded.allocate(), *a);
}
