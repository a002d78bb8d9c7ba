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

#include <cstdint>
#include <memory>
#include <vector>

#include "mpchash/lib/RingTypes.h"

namespace mpchash {

/**
 * Partitioner implements interface, which is used by HashRing to map keys
 * and nodes to ring positions. keys are reduced to 64bit digest by the ring
 * (with the key's hasher) before they reach the partitioner, so the
 * partitioner only has to spread digests over the ring.
 */
class Partitioner {
 public:
  /**
   * @param uint64_t seed1 seed for node placement and first probe hash
   * @param uint64_t seed2 seed for the probe step hash
   */
  Partitioner(uint64_t seed1, uint64_t seed2) : seed1_(seed1), seed2_(seed2) {}

  virtual ~Partitioner() = default;

  /**
   * @param uint64_t digest of the key
   * @param uint64_t seed to use
   * @return RingPosition position of the key for specified seed
   *
   * same digest and seed must always produce the same position.
   */
  virtual RingPosition positionSeeded(uint64_t digest, uint64_t seed)
      const = 0;

  /**
   * @param uint64_t digest of the key
   * @return RingPosition position of the key under the default seed
   */
  RingPosition position(uint64_t digest) const {
    return positionSeeded(digest, seed1_);
  }

  /**
   * @param uint64_t digest of the key
   * @param size_t k number of positions to generate
   * @return std::vector<RingPosition> probe sequence for the key
   *
   * double hashing: i-th probe is h1 + i * h2 (mod 2^64), where h1 and h2
   * are the key's positions under seed1 and seed2.
   */
  std::vector<RingPosition> positions(uint64_t digest, size_t k) const;

  uint64_t getSeed1() const {
    return seed1_;
  }

  uint64_t getSeed2() const {
    return seed2_;
  }

 private:
  uint64_t seed1_;
  uint64_t seed2_;
};

enum class HashFunction {
  Murmur3,
  Spooky,
};

/**
 * This class implements generic helpers to build partitioners for the ring.
 */
class PartitionerFactory {
 public:
  /**
   * @param HashFunction func to use for position calculation
   * @param uint64_t seed1 seed for node placement and first probe hash
   * @param uint64_t seed2 seed for the probe step hash
   */
  static std::unique_ptr<Partitioner> make(
      HashFunction func,
      uint64_t seed1 = kDefaultSeed1,
      uint64_t seed2 = kDefaultSeed2);
};

} // namespace mpchash
