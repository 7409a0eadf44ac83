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

#include <signal.h>
#include <string.h>

#include <iostream>
#include <memory>
#include <vector>

#include "json/json5.h"
#include "tjl/filepath.h"
#include "tjl/tracing.h"
#include "tryjob/build_engine.h"
#include "tryjob/event_loop.h"
#include "tryjob/jobdir_scheduler.h"
#include "tryjob/maildir.h"
#include "tryjob/master_config.h"
#include "tryjob/sqlite_store.h"
#include "tryjob/userpass_scheduler.h"
#include "util/arg_parser.h"

static volatile sig_atomic_t stop_requested = 0;

static void request_stop(int) { stop_requested = 1; }

static void init_logging(const std::string& basedir) {
  tjl::log::subscribe(std::make_unique<tjl::log::FilterSubscriber>(
      std::make_unique<tjl::log::SimpleFormatSubscriber>(std::cerr.rdbuf()),
      [](const tjl::log::Event& e) { return e.is_urgent(); }));

  std::string log_path = tjl::join_paths(basedir, "tryjob-master.log");
  auto log_file = JsonSubscriber::fd_t::open(log_path.c_str());
  if (!log_file) {
    std::cerr << "urgent warning: Could not init logging: " << log_path
              << " failed to open: " << strerror(log_file.error()) << std::endl;
    std::cerr << "urgent warning: Continuing without logging." << std::endl;
    return;
  }
  tjl::log::subscribe(std::make_unique<JsonSubscriber>(std::move(*log_file)));
}

int main(int argc, char** argv) {
  signal(SIGPIPE, SIG_IGN);

  tjl::Argument config_path("--config");
  tjl::ArgParser parser;
  parser.arg(config_path);
  if (!parser.parse(argc, argv)) return 1;

  if (!config_path.value) {
    std::cerr << "A master config must be specified with " << config_path.key << std::endl;
    return 1;
  }

  auto config = tryjob::load_master_config(*config_path.value);
  if (!config) {
    std::cerr << "error: " << config.error() << std::endl;
    return 1;
  }

  tjl::posix_error_t err = tjl::mkdir_with_parents(config->basedir, 0755);
  if (err != 0) {
    std::cerr << "error: mkdir " << config->basedir << ": " << strerror(err) << std::endl;
    return 1;
  }

  init_logging(config->basedir);
  for (const auto& warning : config->warnings) {
    tjl::log::warning("%s", warning.c_str()).urgent()();
  }
  tjl::log::info("starting master from %s", config_path.value->c_str())();

  std::string log_dir = tjl::join_paths(config->basedir, "logs");
  err = tjl::mkdir_with_parents(log_dir, 0755);
  if (err != 0) {
    tjl::log::error("mkdir %s: %s", log_dir.c_str(), strerror(err)).urgent()();
    return 1;
  }

  tryjob::SqliteBuildsetStore store(config->database);
  tryjob::EventLoop loop;

  std::vector<std::unique_ptr<tryjob::UserpassScheduler>> userpass;
  std::vector<std::unique_ptr<tryjob::JobdirScheduler>> jobdirs;

  for (const auto& scheduler : config->schedulers) {
    if (scheduler.type == tryjob::TRY_USERPASS) {
      tryjob::UserpassOptions options;
      options.name = scheduler.name;
      options.builders = scheduler.builders;
      options.listen_address = scheduler.listen;
      options.port = scheduler.port;
      options.users = scheduler.users;
      options.status_interval = config->status_interval;

      userpass.emplace_back(new tryjob::UserpassScheduler(loop, store, std::move(options)));
      auto port = userpass.back()->start();
      if (!port) {
        tjl::log::error("%s: cannot listen on port %u: %s", scheduler.name.c_str(),
                        (unsigned)scheduler.port, strerror(port.error()))
            .urgent()();
        return 1;
      }
      continue;
    }

    auto maildir = tryjob::Maildir::create(scheduler.jobdir);
    if (!maildir) {
      tjl::log::error("%s: cannot create jobdir %s: %s", scheduler.name.c_str(),
                      scheduler.jobdir.c_str(), strerror(maildir.error()))
          .urgent()();
      return 1;
    }

    tryjob::JobdirOptions options;
    options.name = scheduler.name;
    options.builders = scheduler.builders;
    options.poll_interval = scheduler.poll_interval;
    jobdirs.emplace_back(
        new tryjob::JobdirScheduler(loop, store, std::move(*maildir), std::move(options)));
    // Pick up whatever arrived while the master was down.
    jobdirs.back()->poll();
    jobdirs.back()->start();
  }

  tryjob::LocalEngineOptions engine_options;
  engine_options.poll_interval = config->engine_interval;
  engine_options.max_parallel = config->max_parallel;
  engine_options.log_dir = log_dir;
  tryjob::LocalBuildEngine engine(loop, store, config->builders, engine_options);
  engine.start();

  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = request_stop;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  loop.call_every(0.1, [&loop]() {
    if (stop_requested) loop.stop();
  });

  tjl::log::info("master running with %zu builders and %zu schedulers", config->builders.size(),
                 config->schedulers.size())();
  loop.run();

  tjl::log::info("shutting down")();
  engine.stop();
  for (auto& scheduler : jobdirs) scheduler->stop();
  for (auto& scheduler : userpass) scheduler->stop();
  return 0;
}
