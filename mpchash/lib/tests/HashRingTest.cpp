/* Copyright (C) 2018-present, Facebook, Inc.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 2 of the License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include <folly/container/F14Map.h>
#include <folly/hash/Hash.h>

#include "mpchash/lib/HashRing.h"
#include "mpchash/lib/MurmurPartitioner.h"

namespace mpchash {

namespace {

struct TestNode {
  uint64_t id;

  bool operator==(const TestNode& other) const {
    return id == other.id;
  }

  bool operator<(const TestNode& other) const {
    return id < other.id;
  }
};

struct TestNodeHasher {
  size_t operator()(const TestNode& node) const {
    return folly::hasher<uint64_t>()(node.id);
  }
};

using TestRing = HashRing<TestNode, TestNodeHasher>;

constexpr uint64_t kNumNodes = 10;
constexpr uint64_t kNumKeys = 10000;

/**
 * reference implementation of primary owner selection: first node clockwise
 * from each probe, the probe w/ minimal distance wins.
 */
RingPosition referenceOwner(
    const std::vector<RingPosition>& sortedPositions,
    const std::vector<RingPosition>& probes) {
  RingPosition best = 0;
  RingPosition bestDistance = 0;
  for (size_t i = 0; i < probes.size(); i++) {
    auto it = std::lower_bound(
        sortedPositions.begin(), sortedPositions.end(), probes[i]);
    auto owner = it == sortedPositions.end() ? sortedPositions.front() : *it;
    auto distance = ringDistance(probes[i], owner);
    if (i == 0 || distance < bestDistance) {
      best = owner;
      bestDistance = distance;
    }
  }
  return best;
}

} // namespace

class HashRingTestF : public ::testing::Test {
 protected:
  void SetUp() override {
    for (uint64_t i = 0; i < kNumNodes; i++) {
      nodes.push_back(TestNode{i});
      ring.add(nodes.back());
    }
  }

  TestRing ring;
  std::vector<TestNode> nodes;
};

TEST_F(HashRingTestF, testPrimaryNodeIsOnTheRing) {
  ASSERT_EQ(ring.size(), kNumNodes);
  for (uint64_t key = 0; key < kNumKeys; key++) {
    auto token = ring.primaryToken(key);
    ASSERT_TRUE(token.has_value());
    EXPECT_TRUE(
        std::find(nodes.begin(), nodes.end(), token->node()) != nodes.end());
    // token is a stored position, not a probe
    EXPECT_EQ(token->position(), ring.nodePosition(token->node()));
    EXPECT_EQ(ring.primaryNode(key)->id, token->node().id);
  }
}

TEST_F(HashRingTestF, testPrimaryMatchesReference) {
  std::vector<RingPosition> sortedPositions;
  for (auto token : ring.tokens(0, RingDirection::Clockwise)) {
    sortedPositions.push_back(token.position());
  }
  MurmurPartitioner partitioner;
  for (uint64_t key = 0; key < kNumKeys; key++) {
    auto probes = partitioner.positions(
        folly::hasher<uint64_t>()(key), kDefaultProbeCount);
    EXPECT_EQ(
        ring.primaryToken(key)->position(),
        referenceOwner(sortedPositions, probes));
  }
}

TEST_F(HashRingTestF, testLookupIsDeterministic) {
  TestRing other;
  // add in reverse order, positions do not depend on it
  for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
    other.add(*it);
  }
  for (uint64_t key = 0; key < kNumKeys; key++) {
    EXPECT_EQ(ring.primaryNode(key)->id, other.primaryNode(key)->id);
    EXPECT_EQ(ring.primaryNode(key)->id, ring.primaryNode(key)->id);
  }
  std::string key = "some key";
  EXPECT_EQ(ring.position(key), other.position(key));
  EXPECT_EQ(ring.primaryNode(key)->id, other.primaryNode(key)->id);
}

TEST_F(HashRingTestF, testLoadIsBalanced) {
  folly::F14FastMap<uint64_t, uint64_t> load;
  constexpr uint64_t kKeys = 100000;
  for (uint64_t key = 0; key < kKeys; key++) {
    load[ring.primaryNode(key)->id]++;
  }
  const double mean = static_cast<double>(kKeys) / kNumNodes;
  for (const auto& entry : load) {
    EXPECT_LT(entry.second, 1.6 * mean) << "node " << entry.first;
  }
}

TEST_F(HashRingTestF, testRemoveMovesOnlyKeysOfRemovedNode) {
  std::vector<uint64_t> before;
  for (uint64_t key = 0; key < kNumKeys; key++) {
    before.push_back(ring.primaryNode(key)->id);
  }
  auto removed = ring.remove(nodes[3]);
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->id, 3);
  EXPECT_EQ(ring.size(), kNumNodes - 1);

  for (uint64_t key = 0; key < kNumKeys; key++) {
    auto owner = ring.primaryNode(key)->id;
    EXPECT_NE(owner, 3);
    if (before[key] != 3) {
      EXPECT_EQ(owner, before[key]);
    }
  }
}

TEST_F(HashRingTestF, testAddMovesKeysOnlyToNewNode) {
  std::vector<uint64_t> before;
  for (uint64_t key = 0; key < kNumKeys; key++) {
    before.push_back(ring.primaryNode(key)->id);
  }
  ASSERT_FALSE(ring.add(TestNode{100}).has_value());

  uint64_t moved = 0;
  for (uint64_t key = 0; key < kNumKeys; key++) {
    auto owner = ring.primaryNode(key)->id;
    if (owner != before[key]) {
      EXPECT_EQ(owner, 100);
      moved++;
    }
  }
  EXPECT_GT(moved, 0);
  EXPECT_LT(moved, kNumKeys / 2);
}

TEST_F(HashRingTestF, testDuplicateAdd) {
  auto prev = ring.add(nodes[0]);
  ASSERT_TRUE(prev.has_value());
  EXPECT_EQ(prev->id, 0);
  EXPECT_EQ(ring.size(), kNumNodes);
}

TEST_F(HashRingTestF, testRemoveAbsentNode) {
  EXPECT_FALSE(ring.remove(TestNode{12345}).has_value());
  EXPECT_EQ(ring.size(), kNumNodes);
}

TEST_F(HashRingTestF, testReplicas) {
  for (uint64_t key = 0; key < 1000; key++) {
    auto replicas = ring.replicas(key, 3);
    ASSERT_EQ(replicas.size(), 3);
    EXPECT_EQ(replicas[0].id, ring.primaryNode(key)->id);
    EXPECT_NE(replicas[0].id, replicas[1].id);
    EXPECT_NE(replicas[1].id, replicas[2].id);
    EXPECT_NE(replicas[0].id, replicas[2].id);

    // replicas follow primary clockwise
    auto tokens = ring.replicaTokens(key, 3);
    auto expected = ring.tokens(tokens[0].position(), RingDirection::Clockwise)
                        .begin();
    for (const auto& token : tokens) {
      EXPECT_EQ(token.position(), (*expected++).position());
    }
  }
  // ring has fewer nodes than requested
  EXPECT_EQ(ring.replicas(uint64_t{7}, 100).size(), kNumNodes);
  EXPECT_TRUE(ring.replicas(uint64_t{7}, 0).empty());
}

TEST_F(HashRingTestF, testReplicasSkipRepeatedNode) {
  TestRing small;
  small.insert(100, TestNode{1});
  small.insert(200, TestNode{1});
  small.insert(300, TestNode{2});
  for (uint64_t key = 0; key < 100; key++) {
    auto replicas = small.replicas(key, 3);
    ASSERT_EQ(replicas.size(), 2);
    EXPECT_NE(replicas[0].id, replicas[1].id);
  }
}

TEST_F(HashRingTestF, testIntervals) {
  for (const auto& node : nodes) {
    auto ranges = ring.intervals(node);
    ASSERT_TRUE(ranges.has_value());
    ASSERT_EQ(ranges->size(), 1);
    EXPECT_EQ((*ranges)[0].end, ring.nodePosition(node));
    EXPECT_EQ((*ranges)[0], *ring.keyRange(ring.nodePosition(node)));
  }
  EXPECT_FALSE(ring.intervals(TestNode{12345}).has_value());
}

TEST_F(HashRingTestF, testOwnershipCoversTheRing) {
  auto ownership = ring.ownership();
  ASSERT_EQ(ownership.size(), kNumNodes);
  std::vector<KeyRange> ranges;
  for (const auto& entry : ownership) {
    EXPECT_EQ(entry.second.end, entry.first.position());
    ranges.push_back(entry.second);
  }
  // every range starts where the previous one ends
  for (size_t i = 1; i < ranges.size(); i++) {
    EXPECT_EQ(ranges[i].start, ranges[i - 1].end);
  }
  auto merged = KeyRange::coalesce(ranges);
  ASSERT_EQ(merged.size(), 1);
  EXPECT_TRUE(merged[0].coversWholeRing());
}

TEST_F(HashRingTestF, testContains) {
  EXPECT_TRUE(ring.contains(nodes[5]));
  EXPECT_FALSE(ring.contains(TestNode{12345}));
  ring.remove(nodes[5]);
  EXPECT_FALSE(ring.contains(nodes[5]));
}

TEST(HashRingTest, testEmptyRing) {
  TestRing ring;
  EXPECT_TRUE(ring.empty());
  EXPECT_EQ(ring.size(), 0);
  EXPECT_FALSE(ring.primaryNode(uint64_t{1}).has_value());
  EXPECT_FALSE(ring.primaryToken(std::string("key")).has_value());
  EXPECT_TRUE(ring.replicas(uint64_t{1}, 3).empty());
  EXPECT_FALSE(ring.keyRange(0).has_value());
  EXPECT_FALSE(ring.intervals(TestNode{1}).has_value());
  EXPECT_TRUE(ring.ownership().empty());
}

TEST(HashRingTest, testInsertOverwrites) {
  TestRing ring;
  EXPECT_FALSE(ring.insert(10, TestNode{1}).has_value());
  auto prev = ring.insert(10, TestNode{2});
  ASSERT_TRUE(prev.has_value());
  EXPECT_EQ(prev->id, 1);
  EXPECT_EQ(ring.size(), 1);
  EXPECT_EQ(ring.primaryNode(uint64_t{42})->id, 2);
}

TEST(HashRingTest, testRemoveUsesNaturalPosition) {
  TestRing ring;
  TestNode node{1};
  ring.insert(ring.nodePosition(node) + 1, node);
  // node is not at the position add() would use
  EXPECT_FALSE(ring.remove(node).has_value());
  EXPECT_EQ(ring.size(), 1);
  EXPECT_FALSE(ring.contains(node));
  EXPECT_FALSE(ring.intervals(node).has_value());
}

TEST(HashRingTest, testKeyRange) {
  TestRing ring;
  ring.insert(100, TestNode{1});
  ring.insert(200, TestNode{2});
  ring.insert(300, TestNode{3});

  EXPECT_EQ(*ring.keyRange(200), KeyRange(100, 200));
  EXPECT_EQ(*ring.keyRange(300), KeyRange(200, 300));
  // first node owns everything after the last one
  EXPECT_EQ(*ring.keyRange(100), KeyRange(300, 100));
  EXPECT_TRUE(ring.keyRange(100)->isWrapping());
  // not a stored position
  EXPECT_EQ(*ring.keyRange(250), KeyRange(200, 250));
  EXPECT_EQ(*ring.keyRange(50), KeyRange(300, 50));
  EXPECT_EQ(*ring.keyRange(kMaxRingPosition), KeyRange(300, kMaxRingPosition));
}

TEST(HashRingTest, testKeyRangeSingleNode) {
  TestRing ring;
  ring.insert(100, TestNode{1});
  auto range = ring.keyRange(100);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->end, 100);
  EXPECT_TRUE(range->coversWholeRing());
  EXPECT_EQ(*ring.keyRange(500), KeyRange(100, 500));
}

TEST(HashRingTest, testSingleNodeOwnsEverything) {
  TestRing ring;
  ring.add(TestNode{42});
  for (uint64_t key = 0; key < 1000; key++) {
    EXPECT_EQ(ring.primaryNode(key)->id, 42);
  }
}

TEST(HashRingTest, testNodesAtOriginAndMaximum) {
  TestRing ring;
  ring.insert(0, TestNode{1});
  ring.insert(kMaxRingPosition, TestNode{2});
  for (uint64_t key = 0; key < 1000; key++) {
    auto token = ring.primaryToken(key);
    ASSERT_TRUE(token.has_value());
    EXPECT_TRUE(
        token->position() == 0 || token->position() == kMaxRingPosition);
  }
  EXPECT_EQ(*ring.keyRange(0), KeyRange(kMaxRingPosition, 0));
  EXPECT_EQ(*ring.keyRange(kMaxRingPosition), KeyRange(0, kMaxRingPosition));
}

TEST(HashRingTest, testCustomConfig) {
  RingConfig config;
  config.probeCount = 1;
  config.hashFunction = HashFunction::Spooky;
  HashRing<std::string> ring(config);
  EXPECT_EQ(ring.getProbeCount(), 1);
  ring.add("a");
  ring.add("b");

  // w/ single probe the owner is the first node clockwise from key position
  for (uint64_t key = 0; key < 1000; key++) {
    auto pos = ring.position(key);
    auto expected = ring.tokens(pos, RingDirection::Clockwise).front();
    EXPECT_EQ(*ring.primaryNode(key), expected->node());
  }
}

TEST(HashRingTest, testCustomPartitioner) {
  HashRing<std::string> ring(std::make_unique<MurmurPartitioner>(1, 2), 5);
  EXPECT_EQ(ring.getProbeCount(), 5);
  EXPECT_EQ(ring.getPartitioner().getSeed1(), 1);
  EXPECT_EQ(
      ring.nodePosition("a"),
      MurmurPartitioner(1, 2).position(folly::hasher<std::string>()("a")));
}

TEST(HashRingTest, testInvalidConfig) {
  RingConfig config;
  config.probeCount = 0;
  EXPECT_THROW(HashRing<std::string>{config}, std::invalid_argument);
  EXPECT_THROW(
      HashRing<std::string>(std::make_unique<MurmurPartitioner>(7, 7)),
      std::invalid_argument);
  std::unique_ptr<Partitioner> none;
  EXPECT_THROW(HashRing<std::string>{std::move(none)}, std::invalid_argument);
}

TEST(HashRingTest, testPrint) {
  HashRing<std::string> ring;
  ring.insert(5, "a");
  ring.insert(1, "b");
  std::ostringstream os;
  os << ring;
  EXPECT_EQ(os.str(), "HashRing{probes: 23, tokens: [1 -> b, 5 -> a]}");
}

} // namespace mpchash
