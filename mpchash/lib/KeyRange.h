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

#include <optional>
#include <ostream>
#include <vector>

#include "mpchash/lib/RingTypes.h"

namespace mpchash {

/**
 * half-open range of ring positions: [start, end).
 *
 * if start >= end the range is inverted, and covers union of
 * [start, kMaxRingPosition] and [0, end). if start == end the range covers
 * the whole ring. every (start, end) pair is a valid range.
 */
struct KeyRange {
  RingPosition start{0};
  RingPosition end{0};

  KeyRange() = default;

  KeyRange(RingPosition rangeStart, RingPosition rangeEnd)
      : start(rangeStart), end(rangeEnd) {}

  /**
   * range is inverted if start >= end
   */
  bool isInverted() const {
    return start >= end;
  }

  /**
   * inverted range which ends at 0 does not actually wrap: it stops at the
   * maximum position.
   */
  bool endsAtOrigin() const {
    return end == 0;
  }

  bool isWrapping() const {
    return isInverted() && !endsAtOrigin();
  }

  bool coversWholeRing() const {
    return start == end;
  }

  bool contains(RingPosition pos) const {
    if (isInverted()) {
      return pos >= start || pos < end;
    }
    return pos >= start && pos < end;
  }

  bool isOverlapping(const KeyRange& other) const {
    return contains(other.start) || other.contains(start);
  }

  /**
   * @return true if ranges share a boundary (e.g. [a, b) and [b, c)), and
   * could be concatenated. a range which covers the whole ring is never
   * continuous with anything.
   */
  bool isContinuous(const KeyRange& other) const;

  /**
   * @param KeyRange& other range to merge with
   * @return std::optional<KeyRange> union of two ranges, if it is a single
   * interval. std::nullopt otherwise.
   *
   * whole ring result is always returned as [0, 0).
   */
  std::optional<KeyRange> merged(const KeyRange& other) const;

  /**
   * @return RingPosition number of positions in the range. for inverted
   * ranges (whole ring included) this is one short of the real count, whole
   * ring reports kMaxRingPosition.
   */
  RingPosition size() const {
    if (isInverted()) {
      return kMaxRingPosition - (start - end);
    }
    return end - start;
  }

  /**
   * @param std::vector<KeyRange> ranges to coalesce
   * @return std::vector<KeyRange> minimal set of disjoint ranges with the
   * same union, sorted by start position. ranges are split at the origin,
   * swept in start order and rejoined there; a union covering the ring
   * collapses to [0, 0).
   */
  static std::vector<KeyRange> coalesce(std::vector<KeyRange> ranges);

  bool operator==(const KeyRange& other) const {
    return start == other.start && end == other.end;
  }

  bool operator!=(const KeyRange& other) const {
    return !(*this == other);
  }
};

std::ostream& operator<<(std::ostream& os, const KeyRange& range);

} // namespace mpchash
