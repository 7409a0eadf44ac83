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

#include <string.h>

#include <iostream>
#include <memory>
#include <sstream>

#include "tjl/tracing.h"
#include "tryjob/maildir.h"
#include "util/arg_parser.h"

// The remote end of `tryjob --connect ssh`: copies one job from stdin
// into a jobdir. The bytes are stored as given, the jobdir scheduler
// decides whether they form a job.
int main(int argc, char** argv) {
  tjl::log::subscribe(std::make_unique<tjl::log::SimpleFormatSubscriber>(std::cerr.rdbuf()));

  tjl::Argument jobdir("--jobdir");
  tjl::ArgParser parser;
  parser.arg(jobdir);
  if (!parser.parse(argc, argv)) return 1;

  if (!jobdir.value) {
    std::cerr << "A jobdir must be specified with " << jobdir.key << std::endl;
    return 1;
  }

  std::stringstream body;
  body << std::cin.rdbuf();
  if (std::cin.bad()) {
    tjl::log::error("reading job from stdin failed")();
    return 1;
  }

  auto maildir = tryjob::Maildir::create(*jobdir.value);
  if (!maildir) {
    tjl::log::error("jobdir %s: %s", jobdir.value->c_str(), strerror(maildir.error()))();
    return 1;
  }

  auto entry = maildir->deliver_bytes(body.str());
  if (!entry) {
    tjl::log::error("delivering into %s: %s", jobdir.value->c_str(), strerror(entry.error()))();
    return 1;
  }

  return 0;
}
