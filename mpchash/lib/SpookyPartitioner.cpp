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

#include "mpchash/lib/SpookyPartitioner.h"

#include <folly/hash/SpookyHashV2.h>

namespace mpchash {

RingPosition SpookyPartitioner::positionSeeded(uint64_t digest, uint64_t seed)
    const {
  return folly::hash::SpookyHashV2::Hash64(&digest, sizeof(digest), seed);
}

} // namespace mpchash
