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
#include <string>

#include "mpchash/lib/Partitioner.h"
#include "mpchash/lib/RingTypes.h"

namespace mpchash {

/**
 * @param size_t probeCount number of probes calculated for each key
 * @param HashFunction hashFunction partitioner to use for positions
 * @param uint64_t seed1 seed for node placement and first probe hash
 * @param uint64_t seed2 seed for the probe step hash
 *
 * hash ring config. defaults match ring's default constructor.
 */
struct RingConfig {
  size_t probeCount{kDefaultProbeCount};
  HashFunction hashFunction{HashFunction::Murmur3};
  uint64_t seed1{kDefaultSeed1};
  uint64_t seed2{kDefaultSeed2};
};

/**
 * @param RingConfig& config to validate
 * @throw std::invalid_argument if probe count is zero or seeds are equal
 *
 * with equal seeds every probe would land on the same position.
 */
void validateRingConfig(const RingConfig& config);

/**
 * @param string name of the hash function ("murmur3" or "spooky")
 * @throw std::invalid_argument for unknown names
 */
HashFunction hashFunctionFromString(const std::string& name);

} // namespace mpchash
