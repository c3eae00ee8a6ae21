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
#include "command.h"
#include "reactor.h"
#include <cassert>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <paths.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/* Milliseconds until a deadline, rounded up, for poll() */
static int millis_until(struct timespec deadline) {
  struct timespec now = time_monotonic();
  if(deadline <= now)
    return 0;
  struct timespec left = deadline - now;
  if(left.tv_sec > 3600)
    return 3600 * 1000;
  return left.tv_sec * 1000 + (left.tv_nsec + 999999) / 1000000;
}

/* Kill the whole process group and reap the child */
static int kill_and_reap(pid_t pid) {
  int status = -1;
  if(kill(-pid, SIGKILL) < 0 && kill(pid, SIGKILL) < 0 && errno != ESRCH)
    log_warning(errno, "kill %d", (int)pid);
  while(waitpid(pid, &status, 0) < 0) {
    if(errno != EINTR)
      fatal(errno, "waitpid");
  }
  return status;
}

/* Start the command.  Returns the read end of its output pipe. */
static bool invoke(const std::vector<std::string> &cmd, pid_t &pid, int &fd,
                   std::string &error) {
  int p[2];
  static int nullfd = -1;
  std::vector<const char *> argv;

  assert(!cmd.empty());
  for(auto &arg: cmd)
    argv.push_back(arg.c_str());
  argv.push_back(NULL);
  // stdin will be /dev/null
  if(nullfd < 0
     && (nullfd = open(_PATH_DEVNULL, O_RDONLY | O_CLOEXEC)) < 0) {
    error = std::string(_PATH_DEVNULL) + ": " + strerror(errno);
    return false;
  }
  // stdout and stderr will be a pipe back to us
  if(pipe(p) < 0) {
    error = std::string("pipe: ") + strerror(errno);
    return false;
  }
  switch(pid = fork()) {
  case 0:
    forking = true;
    onfatal = NULL;
    if(setpgid(0, 0) < 0)
      fatal(errno, "setpgid");
    if(dup2(p[1], 2) < 0 || dup2(p[1], 1) < 0 || dup2(nullfd, 0) < 0)
      fatal(errno, "dup2");
    if(close(p[0]) < 0 || close(p[1]) < 0)
      fatal(errno, "close");
    signals_reset();
    execvp(argv[0], (char **)&argv[0]);
    fatal(errno, "execvp %s", argv[0]);
  default: break;
  case -1:
    error = std::string("fork: ") + strerror(errno);
    close(p[0]);
    close(p[1]);
    return false;
  }
  // Also set the group here, so a kill can't beat the child to it
  if(setpgid(pid, pid) < 0 && errno != EACCES && errno != ESRCH)
    log_warning(errno, "setpgid %d", (int)pid);
  if(close(p[1]) < 0)
    fatal(errno, "close");
  fd = p[0];
  return true;
}

bool run_command(const std::vector<std::string> &cmd, struct timespec timeout,
                 command_output &out) {
  struct timespec deadline = time_monotonic() + timeout;
  char buffer[4096];
  pid_t pid;
  int fd, n;

  out = command_output();
  if(!invoke(cmd, pid, fd, out.error))
    return false;
  log_debug("started %s as %d", cmd[0].c_str(), (int)pid);
  /* Read output until EOF or the deadline */
  for(;;) {
    int ms = millis_until(deadline);
    if(ms == 0) {
      out.timed_out = true;
      break;
    }
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if((n = poll(&pfd, 1, ms)) < 0) {
      if(errno == EINTR || errno == EAGAIN)
        continue;
      fatal(errno, "poll");
    }
    if(n == 0)
      continue;
    if((n = read(fd, buffer, sizeof buffer)) > 0)
      out.output.append(buffer, n);
    else if(n == 0)
      break;
    else if(errno != EINTR && errno != EAGAIN)
      fatal(errno, "read");
  }
  if(close(fd) < 0)
    fatal(errno, "close");
  /* Wait for it to exit, still honoring the deadline */
  while(!out.timed_out) {
    pid_t r = waitpid(pid, &out.status, WNOHANG);
    if(r == pid)
      return true;
    if(r < 0 && errno != EINTR)
      fatal(errno, "waitpid");
    if(millis_until(deadline) == 0) {
      out.timed_out = true;
      break;
    }
    struct timespec pause = {0, 10 * 1000 * 1000};
    nanosleep(&pause, NULL);
  }
  log_warning(0, "%s timed out after %gs, killing %d", cmd[0].c_str(),
              timespec_to_seconds(timeout), (int)pid);
  out.status = kill_and_reap(pid);
  return true;
}

bool run_shell(const std::string &command, struct timespec timeout,
               command_output &out) {
  std::vector<std::string> cmd;
  const char *shell = getenv("SHELL");
  cmd.push_back(shell && *shell ? shell : "sh");
  cmd.push_back("-c");
  cmd.push_back(command);
  return run_command(cmd, timeout, out);
}

std::string describe_status(int status) {
  char buffer[128];
  if(status < 0)
    snprintf(buffer, sizeof buffer, "did not run");
  else if(WIFEXITED(status))
    snprintf(buffer, sizeof buffer, "exited with status %d",
             WEXITSTATUS(status));
  else if(WIFSIGNALED(status))
    snprintf(buffer, sizeof buffer, "killed by %s",
             strsignal(WTERMSIG(status)));
  else
    snprintf(buffer, sizeof buffer, "wait status %#x", (unsigned)status);
  return buffer;
}
