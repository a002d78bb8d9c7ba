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

#include <ostream>

#include "mpchash/lib/RingTypes.h"

namespace mpchash {

/**
 * RingToken is a view of one ring entry: position on the ring and the node,
 * which owns it. token does not own the node, it is valid as long as the
 * ring is not modified.
 *
 * tokens are ordered (and compared to each other) by position only, and
 * could be compared with a node value, in which case node's equality is used.
 */
template <typename Node>
class RingToken {
 public:
  RingToken(RingPosition pos, const Node& node) : pos_(pos), node_(&node) {}

  RingPosition position() const {
    return pos_;
  }

  const Node& node() const {
    return *node_;
  }

  const Node& operator*() const {
    return *node_;
  }

  const Node* operator->() const {
    return node_;
  }

  bool operator==(const RingToken& other) const {
    return pos_ == other.pos_;
  }

  bool operator!=(const RingToken& other) const {
    return pos_ != other.pos_;
  }

  bool operator<(const RingToken& other) const {
    return pos_ < other.pos_;
  }

  bool operator>(const RingToken& other) const {
    return pos_ > other.pos_;
  }

  bool operator<=(const RingToken& other) const {
    return pos_ <= other.pos_;
  }

  bool operator>=(const RingToken& other) const {
    return pos_ >= other.pos_;
  }

  bool operator==(const Node& node) const {
    return *node_ == node;
  }

  bool operator!=(const Node& node) const {
    return !(*node_ == node);
  }

 private:
  RingPosition pos_;
  const Node* node_;
};

/**
 * owned copy of the ring entry. returned by SharedHashRing, where views
 * could not outlive the lock.
 */
template <typename Node>
struct RingEntry {
  RingPosition position;
  Node node;

  bool operator==(const RingEntry& other) const {
    return position == other.position && node == other.node;
  }
};

template <typename Node>
std::ostream& operator<<(std::ostream& os, const RingToken<Node>& token) {
  return os << token.position() << " -> " << token.node();
}

} // namespace mpchash
