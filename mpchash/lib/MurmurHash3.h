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
 * standard MurmurHash3_x64_128 body reduced to a single 16 byte block
 * (A, B), returning the low 64 bits of the 128bit result.
 * seed initializes both halves of the state, different seeds give
 * independent hash functions for the same input.
 */
uint64_t
MurmurHash3_x64_64(const uint64_t& A, const uint64_t& B, const uint64_t seed);

} // namespace mpchash
