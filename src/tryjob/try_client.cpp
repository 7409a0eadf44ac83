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

#include "try_client.h"

#include <time.h>

#include <fstream>
#include <sstream>

#include "tjl/tracing.h"
#include "tjl/xoshiro_256.h"
#include "tryjob/completion_waiter.h"
#include "tryjob/mailbox_delivery.h"
#include "tryjob/network_transport.h"
#include "tryjob/socket.h"

namespace tryjob {

const char* method_name(ConnectMethod method) {
  switch (method) {
    case ConnectMethod::pb:
      return "pb";
    case ConnectMethod::ssh:
      return "ssh";
  }
  return "pb";
}

tjl::optional<ConnectMethod> parse_connect_method(const std::string& name) {
  if (name == "pb") return tjl::some(ConnectMethod::pb);
  if (name == "ssh") return tjl::some(ConnectMethod::ssh);
  return {};
}

tjl::result<SourceStamp, std::string> DiffSourceStamp::get() {
  SourceStamp out = base;
  if (diff_path.empty()) return tjl::result_value<std::string>(std::move(out));

  std::stringstream body;
  if (diff_path == "-") {
    body << std::cin.rdbuf();
  } else {
    std::ifstream file(diff_path, std::ios::in | std::ios::binary);
    if (!file) {
      return tjl::make_error<SourceStamp, std::string>("cannot read diff " + diff_path);
    }
    body << file.rdbuf();
  }

  out.patch = tjl::some(Patch(patch_level, body.str()));
  return tjl::result_value<std::string>(std::move(out));
}

std::string make_jobid() {
  tjl::xoshiro_256 rng(tjl::xoshiro_256::get_rng_seed());
  return std::to_string((long long)time(nullptr)) + "-" + rng.unique_name();
}

int TryClient::fail(const std::string& why) {
  tjl::log::error("try: %s", why.c_str())();
  output.line("error: " + why);
  return 1;
}

int TryClient::run() {
  output.line(std::string("using '") + method_name(config.connect) + "' connect method");

  if (config.list_builders) {
    if (config.connect == ConnectMethod::ssh) {
      output.line("Cannot get available builders over ssh.");
      return 1;
    }
    return list_builders();
  }

  auto stamp = source.get();
  if (!stamp) return fail(stamp.error());

  Job job;
  job.jobid = make_jobid();
  job.source = std::move(*stamp);
  job.builder_names = config.builders;
  job.comment = config.comment;
  job.who = config.who;
  job.properties = config.properties;
  output.line("job created");

  if (config.dryrun) {
    print_dryrun(job);
    return 0;
  }

  if (config.connect == ConnectMethod::pb) return deliver_pb(job);
  return deliver_ssh(job);
}

int TryClient::list_builders() {
  auto endpoint = split_host_port(config.master);
  if (!endpoint) return fail(endpoint.error());

  NetworkTransport transport(loop, config.connect_timeout);
  auto err = transport.connect(endpoint->first, endpoint->second);
  if (err) return fail(describe(*err));
  err = transport.login(config.username, config.passwd);
  if (err) return fail(describe(*err));

  auto builders = transport.list_builders();
  if (!builders) return fail(describe(builders.error()));

  output.line("The following builders are available for the try scheduler: ");
  for (const auto& builder : *builders) output.line(builder);
  return 0;
}

int TryClient::deliver_pb(const Job& job) {
  output.line("Delivering job; comment= " + (job.comment ? *job.comment : std::string("None")));

  auto endpoint = split_host_port(config.master);
  if (!endpoint) return fail(endpoint.error());

  NetworkTransport transport(loop, config.connect_timeout);
  auto err = transport.connect(endpoint->first, endpoint->second);
  if (err) return fail(describe(*err));
  err = transport.login(config.username, config.passwd);
  if (err) return fail(describe(*err));

  auto ack = transport.submit(job, config.wait);
  if (!ack) return fail(describe(ack.error()));
  tjl::log::info("try: job %s became buildset %ld", job.jobid.c_str(), (long)ack->buildset)();
  output.line("job has been delivered");

  if (!config.wait) {
    output.line("not waiting for builds to finish");
    return 0;
  }

  CompletionWaiter waiter(loop, transport, ack->builders, config.wait_interval);
  auto summary = waiter.wait();
  if (!summary) return fail(describe(summary.error()));

  for (const auto& line : CompletionWaiter::render(*summary)) output.line(line);
  return summary->all_succeeded() ? 0 : 1;
}

int TryClient::deliver_ssh(const Job& job) {
  MailboxTarget target;
  target.host = config.host;
  target.username = config.username;
  target.jobdir = config.jobdir;
  target.ssh_command = config.ssh_command;
  target.tryserver = config.tryserver;

  auto delivered = deliver_to_mailbox(target, job);
  if (!delivered) return fail(delivered.error());
  output.line("job has been delivered");

  if (config.wait) {
    output.line("waiting for builds with ssh is not supported");
  } else {
    output.line("not waiting for builds to finish");
  }
  return 0;
}

void TryClient::print_dryrun(const Job& job) {
  const SourceStamp& source = job.source;
  std::string builders;
  for (const auto& builder : job.builder_names) {
    if (!builders.empty()) builders += ", ";
    builders += builder;
  }

  output.line("Job:");
  output.line("Job: jobid: " + job.jobid);
  output.line("Job: repository: " + source.repository);
  output.line("Job: project: " + source.project);
  output.line("Job: branch: " + (source.branch ? *source.branch : std::string("None")));
  output.line("Job: revision: " + source.revision);
  if (source.patch) {
    output.line("Job: patch level: " + std::to_string(source.patch->level));
    output.line("Job: patch bytes: " + std::to_string(source.patch->body.size()));
  }
  output.line("Job: builders: " + builders);
  output.line("Job: who: " + job.who);
  output.line("Job: comment: " + (job.comment ? *job.comment : std::string("None")));
}

}  // namespace tryjob
