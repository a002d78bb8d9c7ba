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

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <folly/container/F14Set.h>
#include <folly/hash/Hash.h>
#include <glog/logging.h>

#include "mpchash/lib/KeyRange.h"
#include "mpchash/lib/Partitioner.h"
#include "mpchash/lib/RingConfig.h"
#include "mpchash/lib/RingToken.h"
#include "mpchash/lib/RingTraversal.h"
#include "mpchash/lib/RingTypes.h"

namespace mpchash {

/**
 * HashRing implements multi-probe consistent hashing
 * (more info: https://arxiv.org/abs/1505.00062).
 *
 * each node gets exactly one position on the ring, computed from the node
 * itself. a node owns range of keys from the previous node (counter-
 * clockwise) up to its own position. to find key's owner we calculate
 * several probe positions for the key (double hashing), and select the
 * probe with the minimal distance to the next node on the ring. this keeps
 * load even w/o virtual nodes.
 *
 * this class is not thread safe, all access must be synchronized by the
 * owner. see SharedHashRing for the version which could be shared between
 * threads.
 */
template <typename Node, typename NodeHash = folly::hasher<Node>>
class HashRing {
  static_assert(
      IsRingNode<Node, NodeHash>::value,
      "ring node must be copyable, equality and less-than comparable "
      "and hashable with NodeHash");

 public:
  using Token = RingToken<Node>;
  using Tokens = TokenRange<Node>;

  HashRing() : HashRing(RingConfig()) {}

  /**
   * @param RingConfig& config of the ring
   * @throw std::invalid_argument if config is not valid
   */
  explicit HashRing(const RingConfig& config) : probeCount_(config.probeCount) {
    validateRingConfig(config);
    partitioner_ = PartitionerFactory::make(
        config.hashFunction, config.seed1, config.seed2);
  }

  /**
   * @param unique_ptr<Partitioner> partitioner to use for positions
   * @param size_t probeCount number of probes per key
   * @throw std::invalid_argument if partitioner is null or config derived
   * from partitioner's seeds and probe count is not valid
   */
  explicit HashRing(
      std::unique_ptr<Partitioner> partitioner,
      size_t probeCount = kDefaultProbeCount)
      : partitioner_(std::move(partitioner)), probeCount_(probeCount) {
    if (!partitioner_) {
      throw std::invalid_argument("partitioner must not be null");
    }
    RingConfig config;
    config.probeCount = probeCount_;
    config.seed1 = partitioner_->getSeed1();
    config.seed2 = partitioner_->getSeed2();
    validateRingConfig(config);
  }

  HashRing(HashRing&&) = default;
  HashRing& operator=(HashRing&&) = default;

  /**
   * @param Node& node to add
   * @return std::optional<Node> previous occupant of node's position
   *
   * node's position is computed from the node itself. adding the same node
   * twice does not change the ring.
   */
  std::optional<Node> add(const Node& node) {
    return insert(nodePosition(node), node);
  }

  /**
   * @param RingPosition pos where node should be placed
   * @param Node& node to place
   * @return std::optional<Node> previous occupant of the position
   *
   * places node at exact position, bypassing partitioner. mostly useful for
   * testing and simulation. if position is taken, it is overwritten.
   */
  std::optional<Node> insert(RingPosition pos, const Node& node) {
    auto it = positions_.find(pos);
    if (it == positions_.end()) {
      positions_.emplace(pos, node);
      VLOG(2) << "placed node at position " << pos << ", ring size "
              << positions_.size();
      return std::nullopt;
    }
    std::optional<Node> prev(std::move(it->second));
    it->second = node;
    VLOG(3) << "replaced occupant of position " << pos;
    return prev;
  }

  /**
   * @param Node& node to remove
   * @return std::optional<Node> removed entry
   *
   * removes whatever is stored at node's natural position (the one add()
   * would use). node which was placed with insert() at some other position
   * would not be found.
   */
  std::optional<Node> remove(const Node& node) {
    auto pos = nodePosition(node);
    auto it = positions_.find(pos);
    if (it == positions_.end()) {
      VLOG(3) << "nothing to remove at position " << pos;
      return std::nullopt;
    }
    std::optional<Node> removed(std::move(it->second));
    positions_.erase(it);
    VLOG(2) << "removed node from position " << pos << ", ring size "
            << positions_.size();
    return removed;
  }

  /**
   * @param K& key to look up
   * @return std::optional<Token> token of the node, which owns the key.
   * std::nullopt if the ring is empty.
   *
   * every probe is answered by the first node clockwise from it. the probe
   * with the minimal distance to its node wins, on equal distances the
   * earlier probe wins.
   */
  template <typename K, typename KeyHash = folly::hasher<K>>
  std::optional<Token> primaryToken(
      const K& key,
      const KeyHash& hasher = KeyHash()) const {
    if (positions_.empty()) {
      return std::nullopt;
    }
    std::optional<Token> minToken;
    RingPosition minDistance = kMaxRingPosition;
    for (auto probe : partitioner_->positions(hasher(key), probeCount_)) {
      auto owner = *tokens(probe, RingDirection::Clockwise).front();
      auto distance = ringDistance(probe, owner.position());
      if (!minToken || distance < minDistance) {
        minDistance = distance;
        minToken = owner;
      }
    }
    return minToken;
  }

  /**
   * @param K& key to look up
   * @return std::optional<Node> primary owner of the key
   */
  template <typename K, typename KeyHash = folly::hasher<K>>
  std::optional<Node> primaryNode(
      const K& key,
      const KeyHash& hasher = KeyHash()) const {
    auto token = primaryToken(key, hasher);
    if (!token) {
      return std::nullopt;
    }
    return token->node();
  }

  /**
   * @param K& key to look up
   * @param size_t k number of replicas
   * @return std::vector<Token> up to k tokens of distinct nodes, starting
   * from the primary and moving clockwise
   *
   * the same node could be stored on several positions (w/ insert()), such
   * positions are skipped after the first one.
   */
  template <typename K, typename KeyHash = folly::hasher<K>>
  std::vector<Token> replicaTokens(
      const K& key,
      size_t k,
      const KeyHash& hasher = KeyHash()) const {
    std::vector<Token> result;
    auto primary = primaryToken(key, hasher);
    if (!primary || k == 0) {
      return result;
    }
    folly::F14FastSet<Node, NodeHash> seen;
    for (auto token : tokens(primary->position(), RingDirection::Clockwise)) {
      if (seen.insert(token.node()).second) {
        result.push_back(token);
        if (result.size() == k) {
          break;
        }
      }
    }
    return result;
  }

  template <typename K, typename KeyHash = folly::hasher<K>>
  std::vector<Node> replicas(
      const K& key,
      size_t k,
      const KeyHash& hasher = KeyHash()) const {
    std::vector<Node> result;
    for (const auto& token : replicaTokens(key, k, hasher)) {
      result.push_back(token.node());
    }
    return result;
  }

  /**
   * @param RingPosition start of the traversal
   * @param RingDirection dir of the traversal
   * @return Tokens lazy sequence of all tokens on the ring
   *
   * see TokenRange for the order of tokens in both directions.
   */
  Tokens tokens(RingPosition start, RingDirection dir) const {
    return Tokens(positions_, start, dir);
  }

  /**
   * @param RingPosition pos of the node
   * @return std::optional<KeyRange> key range, which node at pos would own.
   * std::nullopt for empty ring.
   *
   * range always ends at pos and starts at the position of the previous
   * node (counter-clockwise). if pos is the only position on the ring, the
   * range covers the whole ring.
   */
  std::optional<KeyRange> keyRange(RingPosition pos) const {
    if (positions_.empty()) {
      return std::nullopt;
    }
    auto prev = tokens(pos, RingDirection::Clockwise).back();
    RingPosition start = prev ? prev->position() : 0;
    return KeyRange(start, pos);
  }

  /**
   * @param Node& node
   * @return std::optional<std::vector<KeyRange>> key ranges owned by the
   * node. std::nullopt if node is not on the ring.
   *
   * w/o virtual nodes there is always exactly one range per node.
   */
  std::optional<std::vector<KeyRange>> intervals(const Node& node) const {
    if (!contains(node)) {
      return std::nullopt;
    }
    return std::vector<KeyRange>{*keyRange(nodePosition(node))};
  }

  /**
   * @return vector of all tokens (in ascending position order) and key
   * ranges they own
   */
  std::vector<std::pair<Token, KeyRange>> ownership() const {
    std::vector<std::pair<Token, KeyRange>> result;
    result.reserve(positions_.size());
    for (auto token : tokens(0, RingDirection::Clockwise)) {
      result.emplace_back(token, *keyRange(token.position()));
    }
    return result;
  }

  /**
   * @param Node& node
   * @return true if node is stored at its natural position
   */
  bool contains(const Node& node) const {
    auto it = positions_.find(nodePosition(node));
    return it != positions_.end() && it->second == node;
  }

  /**
   * @param K& key
   * @return RingPosition position of the key on the ring (default seed)
   */
  template <typename K, typename KeyHash = folly::hasher<K>>
  RingPosition position(const K& key, const KeyHash& hasher = KeyHash())
      const {
    return partitioner_->position(hasher(key));
  }

  /**
   * @return RingPosition position where add() places the node
   */
  RingPosition nodePosition(const Node& node) const {
    return partitioner_->position(nodeHash_(node));
  }

  size_t size() const {
    return positions_.size();
  }

  bool empty() const {
    return positions_.empty();
  }

  size_t getProbeCount() const {
    return probeCount_;
  }

  const Partitioner& getPartitioner() const {
    return *partitioner_;
  }

 private:
  /**
   * ring positions, which are assigned to nodes (sorted in ascending order)
   */
  std::map<RingPosition, Node> positions_;

  /**
   * partitioner, which is used to compute positions of keys and nodes
   */
  std::unique_ptr<Partitioner> partitioner_;

  size_t probeCount_;

  NodeHash nodeHash_;
};

template <typename Node, typename NodeHash>
std::ostream& operator<<(
    std::ostream& os,
    const HashRing<Node, NodeHash>& ring) {
  os << "HashRing{probes: " << ring.getProbeCount() << ", tokens: [";
  bool first = true;
  for (auto token : ring.tokens(0, RingDirection::Clockwise)) {
    os << (first ? "" : ", ") << token;
    first = false;
  }
  return os << "]}";
}

} // namespace mpchash
