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

#include "mpchash/lib/Partitioner.h"

#include "mpchash/lib/MurmurPartitioner.h"
#include "mpchash/lib/SpookyPartitioner.h"

namespace mpchash {

std::vector<RingPosition> Partitioner::positions(uint64_t digest, size_t k)
    const {
  std::vector<RingPosition> result;
  result.reserve(k);
  const auto h1 = positionSeeded(digest, seed1_);
  const auto h2 = positionSeeded(digest, seed2_);
  // unsigned arithmetic wraps at 2^64, which is exactly the ring
  for (uint64_t i = 0; i < k; i++) {
    result.push_back(h1 + i * h2);
  }
  return result;
}

std::unique_ptr<Partitioner>
PartitionerFactory::make(HashFunction func, uint64_t seed1, uint64_t seed2) {
  switch (func) {
    case HashFunction::Spooky:
      return std::make_unique<SpookyPartitioner>(seed1, seed2);
    case HashFunction::Murmur3:
    default:
      return std::make_unique<MurmurPartitioner>(seed1, seed2);
  }
}

} // namespace mpchash
