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

#include "utf8.h"

bool push_utf8(std::string &result, uint32_t rune) {
  if (rune < 0x80) {
    result.push_back(static_cast<char>(rune));
  } else if (rune < 0x800) {
    result.push_back(static_cast<char>(0xC0 | (rune >> 6)));
    result.push_back(static_cast<char>(0x80 | (rune & 0x3F)));
  } else if (rune < 0x10000) {
    if (rune >= 0xD800 && rune < 0xE000) return false;
    result.push_back(static_cast<char>(0xE0 | (rune >> 12)));
    result.push_back(static_cast<char>(0x80 | ((rune >> 6) & 0x3F)));
    result.push_back(static_cast<char>(0x80 | (rune & 0x3F)));
  } else if (rune < 0x110000) {
    result.push_back(static_cast<char>(0xF0 | (rune >> 18)));
    result.push_back(static_cast<char>(0x80 | ((rune >> 12) & 0x3F)));
    result.push_back(static_cast<char>(0x80 | ((rune >> 6) & 0x3F)));
    result.push_back(static_cast<char>(0x80 | (rune & 0x3F)));
  } else {
    return false;
  }
  return true;
}
