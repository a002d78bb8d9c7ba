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

#include "mpchash/tools/RingSimulatorUtils.h"

#include <stdexcept>

#include <fmt/format.h>

namespace mpchash {

void RingSimulatorUtils::validateOptions(const SimulatorOptions& options) {
  if (options.nodes <= 0 || options.keys <= 0 || options.probes <= 0) {
    throw std::invalid_argument(fmt::format(
        "nodes, keys and probes must be positive, got {}, {} and {}",
        options.nodes,
        options.keys,
        options.probes));
  }
  if (options.replicas < 0) {
    throw std::invalid_argument(fmt::format(
        "replicas must not be negative, got {}", options.replicas));
  }
}

} // namespace mpchash
