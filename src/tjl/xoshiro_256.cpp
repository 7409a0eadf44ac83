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

// Open Group Base Specifications Issue 7
#define _XOPEN_SOURCE 700
#define _POSIX_C_SOURCE 200809L

#include "xoshiro_256.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstring>

#include "tracing.h"
#include "unique_fd.h"

namespace tjl {

std::tuple<uint64_t, uint64_t, uint64_t, uint64_t> xoshiro_256::get_rng_seed() {
  auto rng_fd = unique_fd::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (!rng_fd) {
    log::fatal("Failed to open /dev/urandom: %s", strerror(rng_fd.error()));
  }

  uint64_t seed_data[4] = {0};
  uint8_t *out = reinterpret_cast<uint8_t *>(seed_data);
  size_t got = 0;
  while (got < sizeof(seed_data)) {
    ssize_t n = read(rng_fd->get(), out + got, sizeof(seed_data) - got);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      log::fatal("Failed to read /dev/urandom: %s", n < 0 ? strerror(errno) : "short read");
    }
    got += n;
  }

  return std::make_tuple(seed_data[0], seed_data[1], seed_data[2], seed_data[3]);
}

}  // namespace tjl
