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

#include <cstdlib>
#include <iostream>
#include <memory>

#include "json/json5.h"
#include "tjl/tracing.h"
#include "tryjob/client_config.h"
#include "tryjob/event_loop.h"
#include "tryjob/try_client.h"
#include "util/arg_parser.h"

static void print_help(const char* argv0) {
  // clang-format off
  std::cout << std::endl
    << "Usage: " << argv0 << " [OPTIONS]" << std::endl
    << std::endl
    << "  Delivery:" << std::endl
    << "    --connect pb|ssh     How to reach the master (default pb)" << std::endl
    << "    --master HOST:PORT   Userpass scheduler to log into (pb)" << std::endl
    << "                         tryjob-master listens on IPv4 only; write an IPv6" << std::endl
    << "                         host as [ADDR]:PORT" << std::endl
    << "    --username NAME      Login name, also the ssh user" << std::endl
    << "    --passwd SECRET      Login password (pb)" << std::endl
    << "    --host HOST          Machine holding the jobdir (ssh, empty for local)" << std::endl
    << "    --jobdir DIR         Maildir watched by a jobdir scheduler (ssh)" << std::endl
    << "    --ssh-command CMD    Program used to reach --host (default ssh)" << std::endl
    << "    --tryserver CMD      Drop agent run on --host (default tryjob-server)" << std::endl
    << "    --connect-timeout S  Give up on a silent master after S seconds" << std::endl
    << std::endl
    << "  Job:" << std::endl
    << "    --builder NAME       Build on NAME, repeat for more (default all)" << std::endl
    << "    --branch BRANCH      Branch the revision lives on" << std::endl
    << "    --baserev REV        Revision to patch (default tip of branch)" << std::endl
    << "    --diff FILE          Patch to apply, - reads stdin" << std::endl
    << "    --patchlevel N       Strip N leading path components (default 0)" << std::endl
    << "    --repository URL     Repository the revision comes from" << std::endl
    << "    --project NAME       Project the job belongs to" << std::endl
    << "    --who NAME           Who is asking (default $USER)" << std::endl
    << "    --comment TEXT       Free form comment" << std::endl
    << "    --property KEY=VAL   Set a build property, repeat for more" << std::endl
    << std::endl
    << "  Actions:" << std::endl
    << "    --wait               Wait for every build and report the results (pb)" << std::endl
    << "    --wait-interval S    Seconds between progress checks while waiting" << std::endl
    << "    --get-builders       List the builders the scheduler accepts (pb)" << std::endl
    << "    --dryrun             Print the job instead of delivering it" << std::endl
    << "    --config             Print the resolved configuration and exit" << std::endl
    << std::endl
    << "  Other:" << std::endl
    << "    --user-config FILE   Read defaults from FILE instead of tryjob.json" << std::endl
    << "    --log FILE           Append JSON log lines to FILE" << std::endl
    << "    --help               Print this message and exit" << std::endl
    << std::endl;
  // clang-format on
}

static bool parse_seconds(const tjl::Argument& arg, tjl::optional<double>& out) {
  if (!arg.value) return true;
  char* end = nullptr;
  double x = strtod(arg.value->c_str(), &end);
  if (end == arg.value->c_str() || *end != '\0' || x <= 0) {
    std::cerr << "error: " << arg.key << " expects a positive number of seconds, not '"
              << *arg.value << "'" << std::endl;
    return false;
  }
  out = tjl::some(x);
  return true;
}

int main(int argc, char** argv) {
  // A master hanging up mid write is reported through the write error.
  signal(SIGPIPE, SIG_IGN);

  tjl::Argument connect("--connect");
  tjl::Argument master("--master");
  tjl::Argument username("--username");
  tjl::Argument passwd("--passwd");
  tjl::Argument host("--host");
  tjl::Argument jobdir("--jobdir");
  tjl::Argument ssh_command("--ssh-command");
  tjl::Argument tryserver("--tryserver");
  tjl::Argument connect_timeout("--connect-timeout");
  tjl::Argument who("--who");
  tjl::Argument comment("--comment");
  tjl::Argument branch("--branch");
  tjl::Argument baserev("--baserev");
  tjl::Argument diff("--diff");
  tjl::Argument patchlevel("--patchlevel");
  tjl::Argument repository("--repository");
  tjl::Argument project("--project");
  tjl::Argument wait_interval("--wait-interval");
  tjl::Argument user_config("--user-config");
  tjl::Argument log_file("--log");
  tjl::ListArgument builders("--builder");
  tjl::ListArgument properties("--property");
  tjl::Flag wait("--wait");
  tjl::Flag get_builders("--get-builders");
  tjl::Flag dryrun("--dryrun");
  tjl::Flag show_config("--config");
  tjl::Flag help("--help");

  tjl::ArgParser parser;
  parser.arg(connect)
      .arg(master)
      .arg(username)
      .arg(passwd)
      .arg(host)
      .arg(jobdir)
      .arg(ssh_command)
      .arg(tryserver)
      .arg(connect_timeout)
      .arg(who)
      .arg(comment)
      .arg(branch)
      .arg(baserev)
      .arg(diff)
      .arg(patchlevel)
      .arg(repository)
      .arg(project)
      .arg(wait_interval)
      .arg(user_config)
      .arg(log_file)
      .list(builders)
      .list(properties)
      .flag(wait)
      .flag(get_builders)
      .flag(dryrun)
      .flag(show_config)
      .flag(help);

  if (!parser.parse(argc, argv)) {
    print_help(argv[0]);
    return 1;
  }

  if (help.value) {
    print_help(argv[0]);
    return 0;
  }

  if (log_file.value) {
    auto subscriber = JsonSubscriber::create(log_file.value->c_str());
    if (!subscriber) {
      std::cerr << "error: cannot open log " << *log_file.value << ": "
                << strerror(subscriber.error()) << std::endl;
      return 1;
    }
    tjl::log::subscribe(std::make_unique<JsonSubscriber>(std::move(*subscriber)));
  }

  tryjob::ClientConfigOverrides overrides;
  overrides.user_config = user_config.value;
  overrides.connect = connect.value;
  overrides.master = master.value;
  overrides.username = username.value;
  overrides.passwd = passwd.value;
  overrides.host = host.value;
  overrides.jobdir = jobdir.value;
  overrides.ssh_command = ssh_command.value;
  overrides.tryserver = tryserver.value;
  overrides.who = who.value;
  if (!builders.values.empty()) overrides.builders = tjl::some(builders.values);
  if (!parse_seconds(wait_interval, overrides.wait_interval)) return 1;
  if (!parse_seconds(connect_timeout, overrides.connect_timeout)) return 1;

  auto config = tryjob::ClientConfig::load(overrides, std::cerr);
  if (!config) {
    std::cerr << "error: " << config.error() << std::endl;
    return 1;
  }

  if (show_config.value) {
    std::cout << **config;
    return 0;
  }

  auto delivery = (*config)->delivery();
  if (!delivery) {
    std::cerr << "error: " << delivery.error() << std::endl;
    return 1;
  }

  delivery->wait = wait.value;
  delivery->list_builders = get_builders.value;
  delivery->dryrun = dryrun.value;
  delivery->comment = comment.value;
  for (const auto& prop : properties.values) {
    size_t eq = prop.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "error: --property expects KEY=VALUE, not '" << prop << "'" << std::endl;
      return 1;
    }
    delivery->properties[prop.substr(0, eq)] = prop.substr(eq + 1);
  }

  tryjob::SourceStamp base;
  base.branch = branch.value;
  if (baserev.value) base.revision = *baserev.value;
  if (repository.value) base.repository = *repository.value;
  if (project.value) base.project = *project.value;

  int64_t level = 0;
  if (patchlevel.value) {
    char* end = nullptr;
    level = strtoll(patchlevel.value->c_str(), &end, 10);
    if (end == patchlevel.value->c_str() || *end != '\0' || level < 0) {
      std::cerr << "error: --patchlevel expects a non-negative integer, not '"
                << *patchlevel.value << "'" << std::endl;
      return 1;
    }
  }

  tryjob::DiffSourceStamp source(std::move(base), diff.value ? *diff.value : std::string(), level);
  tryjob::EventLoop loop;
  tryjob::StreamOutput output(std::cout);
  tryjob::TryClient client(*delivery, loop, source, output);
  return client.run();
}
