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

namespace mpchash {

/**
 * command line options of the ring simulator
 */
struct SimulatorOptions {
  int64_t nodes;
  int64_t keys;
  int64_t probes;
  // number of replicas to report for the first key; 0 reports none
  int64_t replicas;
};

class RingSimulatorUtils {
 public:
  /**
   * @param const SimulatorOptions& options to check
   *
   * throws std::invalid_argument if nodes, keys or probes is not positive
   * or replicas is negative
   */
  static void validateOptions(const SimulatorOptions& options);
};

} // namespace mpchash
