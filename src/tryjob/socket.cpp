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

#include "socket.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdlib>

namespace tryjob {

tjl::result<tjl::unique_fd, tjl::posix_error_t> listen_tcp(const std::string& address,
                                                           uint16_t port, int backlog) {
  tjl::unique_fd fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
  if (!fd.valid()) {
    return tjl::make_errno<tjl::unique_fd>();
  }

  int one = 1;
  if (setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == -1) {
    return tjl::make_errno<tjl::unique_fd>();
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    return tjl::make_error<tjl::unique_fd, tjl::posix_error_t>(EINVAL);
  }

  if (bind(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    return tjl::make_errno<tjl::unique_fd>();
  }

  if (listen(fd.get(), backlog) == -1) {
    return tjl::make_errno<tjl::unique_fd>();
  }

  return tjl::make_result<tjl::unique_fd, tjl::posix_error_t>(std::move(fd));
}

tjl::result<uint16_t, tjl::posix_error_t> local_port(int fd) {
  struct sockaddr_in addr;
  socklen_t len = sizeof(addr);
  if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == -1) {
    return tjl::make_errno<uint16_t>();
  }
  return tjl::make_result<uint16_t, tjl::posix_error_t>(ntohs(addr.sin_port));
}

tjl::result<tjl::unique_fd, tjl::posix_error_t> accept_client(int listen_fd) {
  int fd = accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
  if (fd == -1) {
    return tjl::make_errno<tjl::unique_fd>();
  }
  return tjl::make_result<tjl::unique_fd, tjl::posix_error_t>(tjl::unique_fd(fd));
}

tjl::result<std::vector<TcpAddress>, std::string> resolve_tcp(const std::string& host,
                                                              uint16_t port) {
  using out_t = std::vector<TcpAddress>;
  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* found = nullptr;
  std::string service = std::to_string(port);
  int ret = getaddrinfo(host.c_str(), service.c_str(), &hints, &found);
  if (ret != 0) {
    return tjl::make_error<out_t, std::string>("getaddrinfo(" + host + "): " + gai_strerror(ret));
  }

  out_t out;
  for (struct addrinfo* ai = found; ai != nullptr; ai = ai->ai_next) {
    TcpAddress address;
    memset(&address.addr, 0, sizeof(address.addr));
    memcpy(&address.addr, ai->ai_addr, ai->ai_addrlen);
    address.len = ai->ai_addrlen;
    address.family = ai->ai_family;
    out.push_back(address);
  }
  freeaddrinfo(found);

  if (out.empty()) {
    return tjl::make_error<out_t, std::string>("no usable address for " + host);
  }
  return tjl::make_result<out_t, std::string>(std::move(out));
}

tjl::result<tjl::unique_fd, tjl::posix_error_t> start_connect(const TcpAddress& address) {
  tjl::unique_fd fd(socket(address.family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
  if (!fd.valid()) {
    return tjl::make_errno<tjl::unique_fd>();
  }

  if (connect(fd.get(), reinterpret_cast<const sockaddr*>(&address.addr), address.len) == -1 &&
      errno != EINPROGRESS) {
    return tjl::make_errno<tjl::unique_fd>();
  }

  return tjl::make_result<tjl::unique_fd, tjl::posix_error_t>(std::move(fd));
}

tjl::posix_error_t connect_result(int fd) {
  int err = 0;
  socklen_t len = sizeof(err);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) return errno;
  return err;
}

tjl::result<std::pair<std::string, uint16_t>, std::string> split_host_port(
    const std::string& endpoint) {
  using out_t = std::pair<std::string, uint16_t>;
  size_t colon = endpoint.rfind(':');
  if (colon == std::string::npos || colon + 1 == endpoint.size()) {
    return tjl::make_error<out_t, std::string>("expected host:port, got '" + endpoint + "'");
  }

  std::string host = endpoint.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }

  std::string port_text = endpoint.substr(colon + 1);
  char* end = nullptr;
  errno = 0;
  long port = strtol(port_text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || port <= 0 || port > 65535) {
    return tjl::make_error<out_t, std::string>("bad port '" + port_text + "'");
  }

  return tjl::make_result<out_t, std::string>(std::move(host), static_cast<uint16_t>(port));
}

}  // namespace tryjob
