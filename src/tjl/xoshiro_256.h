/*
 * Copyright 2023 SiFive, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You should have received a copy of LICENSE.Apache2 along with
 * this software. If not, you may obtain a copy at
 *
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <tuple>

namespace tjl {

template <class T>
static std::string to_hex(const T *value) {
  const uint8_t *data = reinterpret_cast<const uint8_t *>(value);
  static const char *hex = "0123456789abcdef";
  char name[2 * sizeof(T) + 1];
  for (size_t i = 0; i < sizeof(T); ++i) {
    name[2 * i + 1] = hex[data[i] & 0xF];
    name[2 * i] = hex[(data[i] >> 4) & 0xF];
  }
  name[2 * sizeof(T)] = '\0';
  return name;
}

// Xoshiro256** after Sebastiano Vigna's reference code. Small state,
// fast, and good enough statistics to name files without collisions.
class xoshiro_256 {
  uint64_t state[4];

  static uint64_t rol64(uint64_t x, int k) { return (x << k) | (x >> (64 - k)); }

 public:
  using result_type = uint64_t;
  static constexpr result_type min() { return 0; }
  static constexpr result_type max() { return ~min(); }

  xoshiro_256() = delete;

  xoshiro_256(std::tuple<uint64_t, uint64_t, uint64_t, uint64_t> seed) {
    state[0] = std::get<0>(seed);
    state[1] = std::get<1>(seed);
    state[2] = std::get<2>(seed);
    state[3] = std::get<3>(seed);
  }

  // Seeds from /dev/urandom, exits the process if that is unreadable.
  static std::tuple<uint64_t, uint64_t, uint64_t, uint64_t> get_rng_seed();

  result_type operator()() {
    uint64_t *s = state;
    uint64_t const result = rol64(s[1] * 5, 7) * 9;
    uint64_t const t = s[1] << 17;

    s[2] ^= s[0];
    s[3] ^= s[1];
    s[1] ^= s[2];
    s[0] ^= s[3];

    s[2] ^= t;
    s[3] = rol64(s[3], 45);

    return result;
  }

  // A 32 character hex name. Unique as long as the generator was
  // seeded from a good source, but not suitable for secrets.
  std::string unique_name() {
    uint8_t data[16];
    uint64_t a = (*this)();
    uint64_t b = (*this)();
    memcpy(data, &a, sizeof(a));
    memcpy(data + sizeof(a), &b, sizeof(b));
    return to_hex<uint8_t[16]>(&data);
  }
};

}  // namespace tjl
