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
#include "reactor.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <utility>

/* Notifications from signal handlers back to the scheduler.  Handled
 * signals are blocked except inside the scheduler's pselect(), so these
 * are never read while a handler is running. */
static volatile sig_atomic_t sigrefresh, sigtoggle, sigterminate;

/* Signal mask on entry */
static sigset_t sigoldmask;

/* Signals we handle */
static sigset_t sighandled;

/* Set once signals_install() has run */
static bool installed;

static void sighandler_refresh(int) {
  sigrefresh = 1;
}

static void sighandler_toggle(int) {
  sigtoggle = sigtoggle + 1;
}

static void sighandler_terminate(int) {
  sigterminate = 1;
}

static const struct {
  const char *name;
  int number;
} signal_names[] = {
    {"HUP", SIGHUP},   {"INT", SIGINT},   {"QUIT", SIGQUIT},
    {"USR1", SIGUSR1}, {"USR2", SIGUSR2}, {"ALRM", SIGALRM},
    {"TERM", SIGTERM}, {"CONT", SIGCONT}, {"WINCH", SIGWINCH},
};

/* Parse a signal name (HUP, SIGUSR1, RTMIN+3, ...) or number.
 * Returns -1 if it is not recognized. */
int parse_signal(const std::string &name) {
  const char *s = name.c_str();
  char *e;
  long n;

  if(!strncasecmp(s, "SIG", 3))
    s += 3;
  if(*s >= '0' && *s <= '9') {
    errno = 0;
    n = strtol(s, &e, 10);
    if(errno || *e || n <= 0 || n >= NSIG)
      return -1;
    return (int)n;
  }
  for(auto &sn: signal_names)
    if(!strcasecmp(s, sn.name))
      return sn.number;
  int base;
  if(!strncasecmp(s, "RTMIN", 5))
    base = SIGRTMIN;
  else if(!strncasecmp(s, "RTMAX", 5))
    base = SIGRTMAX;
  else
    return -1;
  s += 5;
  if(!*s)
    return base;
  if(*s != '+' && *s != '-')
    return -1;
  errno = 0;
  n = strtol(s, &e, 10);
  if(errno || *e || e == s + 1)
    return -1;
  n += base;
  if(n < SIGRTMIN || n > SIGRTMAX)
    return -1;
  return (int)n;
}

/* True if sig may be chosen as the refresh or toggle signal.  Termination
 * and uncatchable signals are taken, SIGPIPE is ignored, SIGCHLD arrives
 * with every subprocess exit and the fault signals are synchronous. */
bool signal_usable(int sig) {
  switch(sig) {
  case SIGINT:
  case SIGTERM:
  case SIGKILL:
  case SIGSTOP:
  case SIGPIPE:
  case SIGCHLD:
  case SIGSEGV:
  case SIGBUS:
  case SIGFPE:
  case SIGILL:
  case SIGTRAP:
  case SIGABRT:
  case SIGSYS: return false;
  default: return sig > 0 && sig < NSIG;
  }
}

/* Set up signal handling.  Must be called before any other thread is
 * created, so that they all inherit the blocked mask. */
void signals_install(const signal_config &config) {
  const std::pair<int, void (*)(int)> signals[] = {
      {config.refresh, sighandler_refresh},
      {config.toggle, sighandler_toggle},
      {SIGINT, sighandler_terminate},
      {SIGTERM, sighandler_terminate},
  };
  struct sigaction sa;
  sigset_t oldmask;

  memset(&sa, 0, sizeof sa);
  if(sigemptyset(&sa.sa_mask) < 0)
    fatal(errno, "sigemptyset");
  if(sigemptyset(&sighandled) < 0)
    fatal(errno, "sigemptyset");
  for(auto &s: signals) {
    sa.sa_handler = s.second;
    if(sigaction(s.first, &sa, NULL) < 0)
      fatal(errno, "sigaction %d", s.first);
    if(sigaddset(&sighandled, s.first) < 0)
      fatal(errno, "sigaddset");
  }
  // A vanished host shows up as EPIPE from the emitter instead
  sa.sa_handler = SIG_IGN;
  if(sigaction(SIGPIPE, &sa, NULL) < 0)
    fatal(errno, "sigaction SIGPIPE");
  if(sigprocmask(SIG_BLOCK, &sighandled, &oldmask) < 0)
    fatal(errno, "sigprocmask");
  // On a second call the old mask already has our signals blocked
  if(!installed)
    sigoldmask = oldmask;
  installed = true;
  log_debug("signals installed: refresh=%d toggle=%d", config.refresh,
            config.toggle);
}

/* Reset signal configuration (used between fork and exec) */
void signals_reset() {
  if(!installed)
    return;
  for(int n = 1; n < NSIG; ++n) {
    if(sigismember(&sighandled, n) == 1 && signal(n, SIG_DFL) == SIG_ERR)
      fatal(errno, "signal");
  }
  if(signal(SIGPIPE, SIG_DFL) == SIG_ERR)
    fatal(errno, "signal");
  if(sigprocmask(SIG_SETMASK, &sigoldmask, 0) < 0)
    fatal(errno, "sigprocmask");
}

/* The mask to use while waiting, with our signals unblocked */
const sigset_t *signals_wait_mask() {
  return &sigoldmask;
}

/* Collect and clear whatever has arrived (call with signals blocked) */
pending_signals signals_collect() {
  pending_signals p;
  p.refresh = sigrefresh;
  p.toggle = sigtoggle;
  p.terminate = sigterminate;
  sigrefresh = 0;
  sigtoggle = 0;
  sigterminate = 0;
  return p;
}

/* Turn collected signals into requests to the worker */
void signals_dispatch(sync_core &core, const pending_signals &p) {
  if(p.refresh) {
    log_info("refresh requested");
    core.wake(true, true);
  }
  if(p.toggle) {
    core.toggle(p.toggle);
    log_info("switching output to format %zu", core.format_index());
  }
}
