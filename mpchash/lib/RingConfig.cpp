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

#include "mpchash/lib/RingConfig.h"

#include <stdexcept>

#include <fmt/format.h>
#include <glog/logging.h>

namespace mpchash {

void validateRingConfig(const RingConfig& config) {
  if (config.probeCount == 0) {
    LOG(ERROR) << "ring config has zero probes";
    throw std::invalid_argument("probe count must be greater than zero");
  }
  if (config.seed1 == config.seed2) {
    LOG(ERROR) << "ring config has equal seeds: " << config.seed1;
    throw std::invalid_argument(fmt::format(
        "seeds for double hashing must differ, both are {}", config.seed1));
  }
}

HashFunction hashFunctionFromString(const std::string& name) {
  if (name == "murmur3") {
    return HashFunction::Murmur3;
  } else if (name == "spooky") {
    return HashFunction::Spooky;
  }
  throw std::invalid_argument(
      fmt::format("unknown hash function: '{}'", name));
}

} // namespace mpchash
