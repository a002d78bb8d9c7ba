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

#include "mpchash/lib/Partitioner.h"

namespace mpchash {

/**
 * MurmurPartitioner places keys on the ring with MurmurHash3's x64 mix of
 * the key digest. this is the default partitioner.
 */
class MurmurPartitioner : public Partitioner {
 public:
  explicit MurmurPartitioner(
      uint64_t seed1 = kDefaultSeed1,
      uint64_t seed2 = kDefaultSeed2)
      : Partitioner(seed1, seed2) {}

  RingPosition positionSeeded(uint64_t digest, uint64_t seed) const override;
};

} // namespace mpchash
