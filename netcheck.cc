/* This file is part of statbar.
 * Copyright (C) 2015 Richard Kettlewell
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307
 * USA
 */
#include "modules.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

/* Try to connect to one address within the deadline */
static bool try_connect(const struct addrinfo *ai, struct timespec deadline) {
  int fd, err = 0;
  socklen_t len = sizeof err;

  if((fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                  ai->ai_protocol)) < 0) {
    log_warning(errno, "socket");
    return false;
  }
  if(connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
    close(fd);
    return true;
  }
  if(errno != EINPROGRESS) {
    log_debug("connect: %s", strerror(errno));
    close(fd);
    return false;
  }
  for(;;) {
    struct timespec now = time_monotonic();
    if(now >= deadline) {
      log_debug("connect: timed out");
      close(fd);
      return false;
    }
    struct timespec left = deadline - now;
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int n = poll(&pfd, 1, left.tv_sec * 1000 + left.tv_nsec / 1000000 + 1);
    if(n < 0) {
      if(errno == EINTR)
        continue;
      fatal(errno, "poll");
    }
    if(n > 0)
      break;
  }
  if(getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
    err = errno;
  close(fd);
  if(err)
    log_debug("connect: %s", strerror(err));
  return err == 0;
}

bool network_check::available() {
  struct addrinfo hints, *res;
  char service[16];
  int rc;

  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_NUMERICSERV;
  snprintf(service, sizeof service, "%d", port);
  if((rc = getaddrinfo(host.c_str(), service, &hints, &res))) {
    log_debug("getaddrinfo %s: %s", host.c_str(), gai_strerror(rc));
    return false;
  }
  struct timespec deadline = time_monotonic() + seconds_to_timespec(timeout);
  bool ok = false;
  for(struct addrinfo *ai = res; ai && !ok; ai = ai->ai_next)
    ok = try_connect(ai, deadline);
  freeaddrinfo(res);
  return ok;
}

std::string network_check::reason() const {
  return "the network is unreachable";
}
