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

#include <sys/socket.h>

#include <cstdint>
#include <string>
#include <vector>

#include "tjl/result.h"
#include "tjl/unique_fd.h"

namespace tryjob {

// A non-blocking TCP listener. An empty address binds every interface
// and port 0 picks an ephemeral port.
tjl::result<tjl::unique_fd, tjl::posix_error_t> listen_tcp(const std::string& address,
                                                           uint16_t port, int backlog);

// The port a socket ended up bound to.
tjl::result<uint16_t, tjl::posix_error_t> local_port(int fd);

// Accepts one pending connection as a non-blocking socket.
tjl::result<tjl::unique_fd, tjl::posix_error_t> accept_client(int listen_fd);

struct TcpAddress {
  struct sockaddr_storage addr;
  socklen_t len;
  int family;
};

// Every stream address `host` resolves to, in getaddrinfo order. The
// error is a readable message.
tjl::result<std::vector<TcpAddress>, std::string> resolve_tcp(const std::string& host,
                                                              uint16_t port);

// Starts a non-blocking connect. A connect still in progress is not an
// error: wait until the socket is writable, then ask connect_result.
tjl::result<tjl::unique_fd, tjl::posix_error_t> start_connect(const TcpAddress& address);

// 0 once a started connect succeeded, otherwise its errno.
tjl::posix_error_t connect_result(int fd);

// Splits `host:port`. An IPv6 host is written in brackets, as in
// `[::1]:8010`. Fails on a missing or out of range port.
tjl::result<std::pair<std::string, uint16_t>, std::string> split_host_port(
    const std::string& endpoint);

}  // namespace tryjob
