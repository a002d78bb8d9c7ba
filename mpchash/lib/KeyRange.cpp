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

#include "mpchash/lib/KeyRange.h"

#include <algorithm>

#include <fmt/format.h>
#include <glog/logging.h>

namespace mpchash {

bool KeyRange::isContinuous(const KeyRange& other) const {
  if (coversWholeRing() || other.coversWholeRing()) {
    return false;
  }
  return end == other.start || other.end == start;
}

std::optional<KeyRange> KeyRange::merged(const KeyRange& other) const {
  if (coversWholeRing() || other.coversWholeRing()) {
    return KeyRange(0, 0);
  }
  if (!isOverlapping(other) && !isContinuous(other)) {
    return std::nullopt;
  }

  RingPosition mergedStart;
  RingPosition mergedEnd;
  if (isInverted() == other.isInverted()) {
    mergedStart = std::min(start, other.start);
    mergedEnd = std::max(end, other.end);
  } else {
    const auto& a = isInverted() ? *this : other;
    const auto& b = isInverted() ? other : *this;
    if (a.start <= b.end) {
      // b is touching a from the left
      mergedStart = std::min(a.start, b.start);
      mergedEnd = a.end;
    } else {
      // b is touching a from the right
      mergedStart = a.start;
      mergedEnd = std::max(a.end, b.end);
    }
  }

  if (mergedStart == mergedEnd) {
    return KeyRange(0, 0);
  }
  return KeyRange(mergedStart, mergedEnd);
}

namespace {
// non empty closed interval [first, last] of ring positions
struct Piece {
  RingPosition first;
  RingPosition last;
};
} // namespace

std::vector<KeyRange> KeyRange::coalesce(std::vector<KeyRange> ranges) {
  std::vector<Piece> pieces;
  pieces.reserve(ranges.size() * 2);
  for (const auto& range : ranges) {
    if (range.coversWholeRing()) {
      return {KeyRange(0, 0)};
    }
    if (!range.isInverted()) {
      pieces.push_back(Piece{range.start, range.end - 1});
      continue;
    }
    // split at the origin
    pieces.push_back(Piece{range.start, kMaxRingPosition});
    if (!range.endsAtOrigin()) {
      pieces.push_back(Piece{0, range.end - 1});
    }
  }
  if (pieces.empty()) {
    return {};
  }

  std::sort(pieces.begin(), pieces.end(), [](const Piece& a, const Piece& b) {
    return a.first < b.first;
  });
  std::vector<Piece> swept{pieces.front()};
  for (size_t i = 1; i < pieces.size(); i++) {
    auto& cur = swept.back();
    // overlapping or touching pieces are merged
    if (cur.last == kMaxRingPosition || pieces[i].first <= cur.last + 1) {
      cur.last = std::max(cur.last, pieces[i].last);
    } else {
      swept.push_back(pieces[i]);
    }
  }

  if (swept.size() == 1 && swept.front().first == 0 &&
      swept.front().last == kMaxRingPosition) {
    return {KeyRange(0, 0)};
  }

  std::vector<KeyRange> result;
  result.reserve(swept.size());
  size_t from = 0;
  size_t to = swept.size();
  if (swept.size() > 1 && swept.front().first == 0 &&
      swept.back().last == kMaxRingPosition) {
    // first and last pieces meet at the origin
    from = 1;
    to = swept.size() - 1;
  }
  for (size_t i = from; i < to; i++) {
    const auto& piece = swept[i];
    result.emplace_back(
        piece.first, piece.last == kMaxRingPosition ? 0 : piece.last + 1);
  }
  if (from == 1) {
    result.emplace_back(swept.back().first, swept.front().last + 1);
  }
  VLOG(4) << "coalesced " << ranges.size() << " ranges into "
          << result.size();
  return result;
}

std::ostream& operator<<(std::ostream& os, const KeyRange& range) {
  return os << fmt::format("[{}, {})", range.start, range.end);
}

} // namespace mpchash
