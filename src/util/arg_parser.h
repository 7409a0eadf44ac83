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

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "tjl/optional.h"

namespace tjl {

template <class K, class V>
V* get_mut(std::map<K, V>& map, const K& key) {
  auto iter = map.find(key);
  if (iter == map.end()) {
    return nullptr;
  }

  return &iter->second;
}

// An option that takes one value. Given twice, the last one wins.
struct Argument {
  std::string key;
  optional<std::string> value;
  explicit Argument(std::string key) : key(std::move(key)), value() {}
};

// An option that may be repeated, every value is kept in order.
struct ListArgument {
  std::string key;
  std::vector<std::string> values;
  explicit ListArgument(std::string key) : key(std::move(key)), values() {}
};

struct Flag {
  std::string key;
  bool value = false;
  explicit Flag(std::string key) : key(std::move(key)), value(false) {}
};

// Options may be spelled `--key value` or `--key=value`. Options are
// matched by their full key so abbreviations are not accepted.
struct ArgParser {
  std::map<std::string, Argument*> arguments;
  std::map<std::string, ListArgument*> lists;
  std::map<std::string, Flag*> flags;

  ArgParser& arg(Argument& arg) {
    arguments.emplace(arg.key, &arg);
    return *this;
  }

  ArgParser& list(ListArgument& arg) {
    lists.emplace(arg.key, &arg);
    return *this;
  }

  ArgParser& flag(Flag& arg) {
    flags.emplace(arg.key, &arg);
    return *this;
  }

  // Returns false, after reporting to `errs`, on an unknown option or
  // an option missing its value.
  bool parse(int argc, const char* const* argv, std::ostream& errs = std::cerr) {
    auto begin = argv + 1;
    auto end = argv + argc;
    while (begin < end) {
      std::string arg = *begin++;
      optional<std::string> inline_value;
      size_t eq = arg.find('=');
      if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
        inline_value = some(arg.substr(eq + 1));
        arg.resize(eq);
      }

      if (auto* flag = get_mut<std::string, Flag*>(flags, arg)) {
        if (inline_value) {
          errs << "Option '" << arg << "' does not take a value" << std::endl;
          return false;
        }
        (*flag)->value = true;
        continue;
      }

      Argument** argument = get_mut<std::string, Argument*>(arguments, arg);
      ListArgument** many = get_mut<std::string, ListArgument*>(lists, arg);
      if (!argument && !many) {
        errs << "Encountered '" << arg << "' which is not a recognized option" << std::endl;
        return false;
      }

      std::string value;
      if (inline_value) {
        value = std::move(*inline_value);
      } else if (begin < end) {
        value = *begin++;
      } else {
        errs << "Option '" << arg << "' requires a value" << std::endl;
        return false;
      }

      if (argument) {
        (*argument)->value = some(std::move(value));
      } else {
        (*many)->values.emplace_back(std::move(value));
      }
    }
    return true;
  }
};

}  // namespace tjl
