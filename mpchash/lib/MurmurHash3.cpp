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

#include "mpchash/lib/MurmurHash3.h"

namespace mpchash {

// MurmurHash3_x64_128 by Austin Appleby (public domain), with the block loop
// and tail handling dropped: input is always exactly one 16 byte block.
namespace {
constexpr uint64_t kC1 = 0x87c37b91114253d5llu;
constexpr uint64_t kC2 = 0x4cf5ad432745937fllu;
// length of the (A, B) block in bytes
constexpr uint64_t kBlockLen = 16;

inline uint64_t rotl64(uint64_t x, int8_t r) {
  return (x << r) | (x >> (64 - r));
}

inline uint64_t fmix64(uint64_t k) {
  k ^= k >> 33;
  k *= 0xff51afd7ed558ccdllu;
  k ^= k >> 33;
  k *= 0xc4ceb9fe1a85ec53llu;
  k ^= k >> 33;
  return k;
}
} // namespace

uint64_t
MurmurHash3_x64_64(const uint64_t& A, const uint64_t& B, const uint64_t seed) {
  uint64_t h1 = seed;
  uint64_t h2 = seed;

  h1 ^= rotl64(A * kC1, 31) * kC2;
  h1 = rotl64(h1, 27) + h2;
  h1 = h1 * 5 + 0x52dce729;

  h2 ^= rotl64(B * kC2, 33) * kC1;
  h2 = rotl64(h2, 31) + h1;
  h2 = h2 * 5 + 0x38495ab5;

  h1 ^= kBlockLen;
  h2 ^= kBlockLen;

  h1 += h2;
  h2 += h1;

  h1 = fmix64(h1);
  h2 = fmix64(h2);

  return h1 + h2;
}

} // namespace mpchash
