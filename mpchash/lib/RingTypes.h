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
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>

namespace mpchash {

/**
 * position on the ring. the ring is the whole 64bit space, arithmetic on
 * positions wraps from the maximum value back to zero.
 */
using RingPosition = uint64_t;

constexpr RingPosition kMaxRingPosition =
    std::numeric_limits<RingPosition>::max();

/**
 * number of probes we calculate for a key before selecting its owner.
 * the probe with the minimal distance to the next node wins.
 */
constexpr size_t kDefaultProbeCount = 23;

/**
 * seeds for double hashing. any pair of distinct values would work.
 * kDefaultSeed1 is also used to place nodes on the ring.
 */
constexpr uint64_t kDefaultSeed1 = 12345;
constexpr uint64_t kDefaultSeed2 = 67890;

enum class RingDirection {
  Clockwise,
  CounterClockwise,
};

/**
 * @param RingPosition from start position
 * @param RingPosition to end position
 * @return RingPosition distance when moving clockwise from `from` to `to`
 *
 * when `to` is before `from` we are wrapping around the maximum position.
 * note that the wrapped distance is one short of the modular one.
 */
constexpr RingPosition ringDistance(RingPosition from, RingPosition to) {
  return from > to ? kMaxRingPosition - from + to : to - from;
}

namespace detail {

template <typename T, typename = void>
struct IsEqualityComparable : std::false_type {};

template <typename T>
struct IsEqualityComparable<
    T,
    std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type {};

template <typename T, typename = void>
struct IsLessThanComparable : std::false_type {};

template <typename T>
struct IsLessThanComparable<
    T,
    std::void_t<decltype(std::declval<const T&>() < std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

/**
 * capabilities a node type must have to be placed on the ring: value
 * semantics, equality, total order and a hasher producing 64bit digest.
 */
template <typename Node, typename Hash>
struct IsRingNode
    : std::integral_constant<
          bool,
          std::is_copy_constructible<Node>::value &&
              std::is_copy_assignable<Node>::value &&
              detail::IsEqualityComparable<Node>::value &&
              detail::IsLessThanComparable<Node>::value &&
              std::is_invocable_r<uint64_t, const Hash&, const Node&>::value> {
};

} // namespace mpchash
