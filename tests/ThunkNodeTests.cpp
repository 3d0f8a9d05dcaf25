#include <gtest/gtest.h>

#include <map>
#include <memory>

#include "Host/ThunkNode.hpp"

namespace {

using CAB::Host::MoveNode;
using CAB::Host::StageNode;

struct Record {
    int value{0};
};

using RecordMap = std::map<const void*, std::unique_ptr<Record>>;
using RetiredMap = std::multimap<const void*, std::unique_ptr<Record>>;

TEST(ThunkNodeTests, StagedNodeHoldsDefaultValue) {
    auto node = StageNode<RecordMap>();
    ASSERT_FALSE(node.empty());
    ASSERT_NE(node.mapped(), nullptr);
    EXPECT_EQ(node.mapped()->value, 0);
    EXPECT_EQ(node.key(), nullptr);
}

TEST(ThunkNodeTests, RekeyedNodeKeepsItsAddressWhenInserted) {
    int handle = 0;
    RecordMap live;

    auto node = StageNode<RecordMap>();
    ASSERT_FALSE(node.empty());
    Record* staged = node.mapped().get();
    staged->value = 42;
    node.key() = &handle;

    auto result = live.insert(std::move(node));
    ASSERT_TRUE(result.inserted);
    EXPECT_EQ(live.at(&handle).get(), staged);
    EXPECT_EQ(live.at(&handle)->value, 42);
}

TEST(ThunkNodeTests, RetiredEntryOutlivesRemovalFromLiveMap) {
    int handle = 0;
    RecordMap live;
    RetiredMap retired;

    auto node = StageNode<RecordMap>();
    ASSERT_FALSE(node.empty());
    Record* staged = node.mapped().get();
    node.key() = &handle;
    live.insert(std::move(node));

    MoveNode(live, live.find(&handle), retired);
    EXPECT_TRUE(live.empty());
    ASSERT_EQ(retired.count(&handle), 1u);
    EXPECT_EQ(retired.find(&handle)->second.get(), staged);
}

TEST(ThunkNodeTests, MultimapKeepsReplacedEntries) {
    int handle = 0;
    RetiredMap entries;
    for (int i = 0; i < 2; ++i) {
        auto node = StageNode<RetiredMap>();
        ASSERT_FALSE(node.empty());
        node.key() = &handle;
        node.mapped()->value = i;
        entries.insert(std::move(node));
    }
    EXPECT_EQ(entries.count(&handle), 2u);
}

} // namespace
