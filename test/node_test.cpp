#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "Errors.h"
#include "LocalCluster.h"
#include "Node.h"
#include "fakes.h"

namespace {

const ShardAddress ADDRESS{"127.0.0.1", 7000};

}  // namespace

TEST(Node, addAndRemoveCountChanges) {
    Node node(ADDRESS);

    EXPECT_EQ(node.add(bytes("k"), {bytes("a"), bytes("b"), bytes("a")}), 2u);
    EXPECT_EQ(node.add(bytes("k"), {bytes("b"), bytes("c")}), 1u);
    EXPECT_EQ(node.card(bytes("k")), 3u);
    EXPECT_TRUE(node.isMember(bytes("k"), bytes("c")));

    EXPECT_EQ(node.remove(bytes("k"), {bytes("a"), bytes("zz")}), 1u);
    EXPECT_EQ(node.members(bytes("k")), setOf({"b", "c"}));
}

TEST(Node, lastMemberRemovedDeletesKey) {
    Node node(ADDRESS);
    node.add(bytes("k"), {bytes("a")});

    node.remove(bytes("k"), {bytes("a")});
    EXPECT_FALSE(node.exists(bytes("k")));
    EXPECT_EQ(node.keyCount(), 0u);
    EXPECT_EQ(node.add(bytes("k"), {}), 0u);
    EXPECT_FALSE(node.exists(bytes("k")));
}

TEST(Node, storeReplacesDestination) {
    Node node(ADDRESS);
    node.add(bytes("a"), {bytes("1"), bytes("2")});
    node.add(bytes("b"), {bytes("2"), bytes("3")});
    node.add(bytes("d"), {bytes("old")});

    EXPECT_EQ(node.store(SetOperation::Union, bytes("d"), {bytes("a"), bytes("b")}),
              3u);
    EXPECT_EQ(node.members(bytes("d")), setOf({"1", "2", "3"}));

    node.add(bytes("c"), {bytes("9")});
    EXPECT_EQ(node.store(SetOperation::Intersect, bytes("d"),
                         {bytes("a"), bytes("c")}),
              0u);
    EXPECT_FALSE(node.exists(bytes("d")));
}

TEST(Node, moveBetweenKeys) {
    Node node(ADDRESS);
    node.add(bytes("src"), {bytes("a")});

    EXPECT_FALSE(node.move(bytes("src"), bytes("dst"), bytes("zz")));
    EXPECT_TRUE(node.move(bytes("src"), bytes("src"), bytes("a")));
    EXPECT_TRUE(node.move(bytes("src"), bytes("dst"), bytes("a")));
    EXPECT_FALSE(node.exists(bytes("src")));
    EXPECT_EQ(node.members(bytes("dst")), setOf({"a"}));
    EXPECT_FALSE(node.move(bytes("missing"), bytes("dst"), bytes("a")));
}

TEST(Node, delReportsWhetherKeyExisted) {
    Node node(ADDRESS);
    node.add(bytes("k"), {bytes("a")});

    EXPECT_TRUE(node.del(bytes("k")));
    EXPECT_FALSE(node.del(bytes("k")));
}

TEST(Node, downNodeRejectsCalls) {
    Node node(ADDRESS);
    node.add(bytes("k"), {bytes("a")});
    node.setDown(true);

    EXPECT_THROW(node.members(bytes("k")), FetchError);
    EXPECT_THROW(node.add(bytes("k"), {bytes("b")}), FetchError);

    node.setDown(false);
    EXPECT_EQ(node.card(bytes("k")), 1u);
}

TEST(Node, flushAndLoadRoundTrip) {
    auto dir = tempDir("clusterset_node_");
    auto path = dir / "node.csv";

    {
        Node node(ADDRESS, path);
        node.add(bytes("k"), {bytes("a"), bytes("with,comma")});
        node.add(ByteArray{0x00, 0xFF}, {ByteArray{0x0A}});
        ASSERT_TRUE(node.flush());
    }

    Node restored(ADDRESS, path);
    ASSERT_TRUE(restored.load());
    EXPECT_EQ(restored.members(bytes("k")), setOf({"a", "with,comma"}));
    EXPECT_EQ(restored.members(ByteArray{0x00, 0xFF}), ByteArraySet{ByteArray{0x0A}});
    EXPECT_FALSE(std::filesystem::exists(dir / "node.csv.tmp"));

    std::filesystem::remove_all(dir);
}

TEST(Node, loadSkipsMalformedLines) {
    auto dir = tempDir("clusterset_node_");
    auto path = dir / "node.csv";
    {
        std::ofstream file(path);
        file << "6B,61\n"
             << "no-comma\n"
             << "XYZ,61\n"
             << "\n"
             << "6B,62\n";
    }

    Node node(ADDRESS, path);
    ASSERT_TRUE(node.load());
    EXPECT_EQ(node.members(bytes("k")), setOf({"a", "b"}));
    EXPECT_EQ(node.keyCount(), 1u);

    std::filesystem::remove_all(dir);
}

TEST(Node, flushReportsFailedReplace) {
    auto dir = tempDir("clusterset_node_");
    auto path = dir / "node.csv";
    std::filesystem::create_directories(path / "occupied");

    Node node(ADDRESS, path);
    node.add(bytes("k"), {bytes("a")});

    bool flushed = true;
    EXPECT_NO_THROW(flushed = node.flush());
    EXPECT_FALSE(flushed);

    std::filesystem::remove_all(dir);
}

TEST(Node, loadWithoutFile) {
    Node memory_only(ADDRESS);
    EXPECT_FALSE(memory_only.load());
    EXPECT_FALSE(memory_only.flush());
}

TEST(LocalCluster, keysLandOnTheirOwningNode) {
    LocalCluster cluster(ClusterTopology::defaultLayout());

    cluster.addMembers(bytes("foo"), {bytes("x")});
    cluster.addMembers(bytes("bar"), {bytes("y")});

    EXPECT_EQ(cluster.node({"127.0.0.1", 7002})->card(bytes("foo")), 1u);
    EXPECT_EQ(cluster.node({"127.0.0.1", 7000})->card(bytes("bar")), 1u);
    EXPECT_EQ(cluster.node({"127.0.0.1", 7001})->keyCount(), 0u);
    EXPECT_EQ(cluster.node({"127.0.0.1", 9999}), nullptr);
}

TEST(LocalCluster, nativeCommandsNeedOneSlot) {
    LocalCluster cluster(ClusterTopology::defaultLayout());

    EXPECT_THROW(cluster.runSetOperation(SetOperation::Union,
                                         {bytes("foo"), bytes("bar")}),
                 ClusterError);
    EXPECT_NO_THROW(cluster.runSetOperation(SetOperation::Union,
                                            {bytes("{x}1"), bytes("{x}2")}));
}

TEST(LocalCluster, fetchFromUnknownNodeFails) {
    LocalCluster cluster(ClusterTopology::defaultLayout());
    EXPECT_THROW(cluster.fetchMembers({"10.1.1.1", 1}, bytes("k")), FetchError);
}

TEST(LocalCluster, persistsEveryNode) {
    auto dir = tempDir("clusterset_cluster_");
    {
        LocalCluster cluster(ClusterTopology::defaultLayout(), dir);
        cluster.addMembers(bytes("foo"), {bytes("1")});
        cluster.addMembers(bytes("bar"), {bytes("2")});
        ASSERT_TRUE(cluster.flush());
    }

    LocalCluster reopened(ClusterTopology::defaultLayout(), dir);
    EXPECT_EQ(reopened.load(), 3u);
    EXPECT_EQ(reopened.members(bytes("foo")), setOf({"1"}));
    EXPECT_EQ(reopened.members(bytes("bar")), setOf({"2"}));

    std::filesystem::remove_all(dir);
}
