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
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <folly/SharedMutex.h>
#include <folly/Synchronized.h>

#include "mpchash/lib/HashRing.h"

namespace mpchash {

/**
 * SharedHashRing is a HashRing, which could be used from multiple threads
 * w/o external locking. mutations take exclusive lock, queries take shared
 * lock, so every operation observes all the mutations which were completed
 * before it has started and never a partial one.
 *
 * views (tokens and token ranges) could not outlive the lock, so queries
 * return copies. use withSnapshot() to work with views directly.
 */
template <typename Node, typename NodeHash = folly::hasher<Node>>
class SharedHashRing {
 public:
  using Ring = HashRing<Node, NodeHash>;

  SharedHashRing() : ring_(Ring()) {}

  explicit SharedHashRing(const RingConfig& config) : ring_(Ring(config)) {}

  explicit SharedHashRing(
      std::unique_ptr<Partitioner> partitioner,
      size_t probeCount = kDefaultProbeCount)
      : ring_(Ring(std::move(partitioner), probeCount)) {}

  std::optional<Node> add(const Node& node) {
    return ring_.wlock()->add(node);
  }

  std::optional<Node> insert(RingPosition pos, const Node& node) {
    return ring_.wlock()->insert(pos, node);
  }

  std::optional<Node> remove(const Node& node) {
    return ring_.wlock()->remove(node);
  }

  template <typename K, typename KeyHash = folly::hasher<K>>
  std::optional<RingEntry<Node>> primaryEntry(
      const K& key,
      const KeyHash& hasher = KeyHash()) const {
    auto ring = ring_.rlock();
    auto token = ring->primaryToken(key, hasher);
    if (!token) {
      return std::nullopt;
    }
    return RingEntry<Node>{token->position(), token->node()};
  }

  template <typename K, typename KeyHash = folly::hasher<K>>
  std::optional<Node> primaryNode(
      const K& key,
      const KeyHash& hasher = KeyHash()) const {
    return ring_.rlock()->primaryNode(key, hasher);
  }

  template <typename K, typename KeyHash = folly::hasher<K>>
  std::vector<Node>
  replicas(const K& key, size_t k, const KeyHash& hasher = KeyHash()) const {
    return ring_.rlock()->replicas(key, k, hasher);
  }

  /**
   * @return std::vector<RingEntry<Node>> copy of all ring entries, in the
   * order of traversal from start in specified direction
   */
  std::vector<RingEntry<Node>> tokens(RingPosition start, RingDirection dir)
      const {
    auto ring = ring_.rlock();
    std::vector<RingEntry<Node>> result;
    result.reserve(ring->size());
    for (auto token : ring->tokens(start, dir)) {
      result.push_back(RingEntry<Node>{token.position(), token.node()});
    }
    return result;
  }

  std::optional<KeyRange> keyRange(RingPosition pos) const {
    return ring_.rlock()->keyRange(pos);
  }

  std::optional<std::vector<KeyRange>> intervals(const Node& node) const {
    return ring_.rlock()->intervals(node);
  }

  bool contains(const Node& node) const {
    return ring_.rlock()->contains(node);
  }

  template <typename K, typename KeyHash = folly::hasher<K>>
  RingPosition position(const K& key, const KeyHash& hasher = KeyHash())
      const {
    return ring_.rlock()->position(key, hasher);
  }

  size_t size() const {
    return ring_.rlock()->size();
  }

  bool empty() const {
    return ring_.rlock()->empty();
  }

  /**
   * @param F&& func callable, which accepts const Ring&
   * @return whatever func returns
   *
   * runs func under shared lock. views obtained inside func must not escape
   * it.
   */
  template <typename F>
  auto withSnapshot(F&& func) const {
    return ring_.withRLock(std::forward<F>(func));
  }

 private:
  folly::Synchronized<Ring, folly::SharedMutex> ring_;
};

} // namespace mpchash
