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
#include <iterator>
#include <map>
#include <optional>

#include "mpchash/lib/RingToken.h"
#include "mpchash/lib/RingTypes.h"

namespace mpchash {

/**
 * TokenRange is a lazy sequence of ring tokens, starting from some position
 * and moving in specified direction. since positions are on the ring, after
 * the maximum position we continue from the minimum one (and vice versa for
 * counter-clockwise direction). every stored token is visited exactly once.
 *
 * clockwise: tokens with position >= start (ascending), then tokens with
 * position < start (ascending).
 * counter-clockwise: tokens with position <= start (descending), then tokens
 * with position > start (descending).
 *
 * range could be iterated multiple times. both ends of the range are
 * available w/o iteration (front() and back()). range is invalidated by any
 * modification of the ring.
 */
template <typename Node>
class TokenRange {
 public:
  using PositionMap = std::map<RingPosition, Node>;
  using MapIterator = typename PositionMap::const_iterator;

  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = RingToken<Node>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = RingToken<Node>;

    Iterator() = default;

    Iterator(
        const PositionMap* positions,
        MapIterator cur,
        RingDirection dir,
        size_t remaining)
        : positions_(positions), cur_(cur), dir_(dir), remaining_(remaining) {}

    RingToken<Node> operator*() const {
      return RingToken<Node>(cur_->first, cur_->second);
    }

    Iterator& operator++() {
      if (--remaining_ > 0) {
        step();
      }
      return *this;
    }

    Iterator operator++(int) {
      auto prev = *this;
      ++(*this);
      return prev;
    }

    // iterators are only comparable within the same range
    bool operator==(const Iterator& other) const {
      return remaining_ == other.remaining_;
    }

    bool operator!=(const Iterator& other) const {
      return remaining_ != other.remaining_;
    }

   private:
    void step() {
      if (dir_ == RingDirection::Clockwise) {
        if (++cur_ == positions_->end()) {
          cur_ = positions_->begin();
        }
      } else {
        if (cur_ == positions_->begin()) {
          cur_ = positions_->end();
        }
        --cur_;
      }
    }

    const PositionMap* positions_{nullptr};
    MapIterator cur_;
    RingDirection dir_{RingDirection::Clockwise};
    size_t remaining_{0};
  };

  TokenRange(
      const PositionMap& positions,
      RingPosition start,
      RingDirection dir)
      : positions_(&positions), start_(start), dir_(dir) {}

  Iterator begin() const {
    if (positions_->empty()) {
      return end();
    }
    return Iterator(positions_, first(), dir_, positions_->size());
  }

  Iterator end() const {
    return Iterator(positions_, positions_->end(), dir_, 0);
  }

  /**
   * @return first token of the sequence, std::nullopt if the ring is empty
   */
  std::optional<RingToken<Node>> front() const {
    if (positions_->empty()) {
      return std::nullopt;
    }
    auto it = first();
    return RingToken<Node>(it->first, it->second);
  }

  /**
   * @return last token of the sequence, std::nullopt if the ring is empty
   *
   * for clockwise direction this is the nearest token before start.
   */
  std::optional<RingToken<Node>> back() const {
    if (positions_->empty()) {
      return std::nullopt;
    }
    auto it = last();
    return RingToken<Node>(it->first, it->second);
  }

  size_t size() const {
    return positions_->size();
  }

  bool empty() const {
    return positions_->empty();
  }

  RingPosition start() const {
    return start_;
  }

  RingDirection direction() const {
    return dir_;
  }

 private:
  // both helpers expect non empty map
  MapIterator first() const {
    if (dir_ == RingDirection::Clockwise) {
      auto it = positions_->lower_bound(start_);
      return it == positions_->end() ? positions_->begin() : it;
    }
    auto it = positions_->upper_bound(start_);
    return it == positions_->begin() ? std::prev(positions_->end())
                                     : std::prev(it);
  }

  MapIterator last() const {
    if (dir_ == RingDirection::Clockwise) {
      auto it = positions_->lower_bound(start_);
      return it == positions_->begin() ? std::prev(positions_->end())
                                       : std::prev(it);
    }
    auto it = positions_->upper_bound(start_);
    return it == positions_->end() ? positions_->begin() : it;
  }

  const PositionMap* positions_;
  RingPosition start_;
  RingDirection dir_;
};

} // namespace mpchash
