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
#include <sys/select.h>

scheduler::scheduler(sync_core &core_, struct timespec interval_):
    core(core_), interval(interval_) {
  struct timespec shortest = seconds_to_timespec(MIN_SECONDS);
  if(interval < shortest)
    interval = shortest;
  // The core starts with a fetch pending, so the first tick is one
  // interval away.
  next = time_monotonic() + interval;
}

void scheduler::run() {
  while(run_once())
    ;
}

bool scheduler::run_once() {
  struct timespec now = time_monotonic(), timeout;

  if(now < next) {
    timeout = next - now;
    /* Wait for the tick or a signal */
    if(pselect(0, NULL, NULL, NULL, &timeout, signals_wait_mask()) < 0) {
      switch(errno) {
      case EINTR:
      case EAGAIN: break;
      default: fatal(errno, "pselect");
      }
    }
  }
  /* Process events */
  pending_signals p = signals_collect();
  if(p.terminate)
    return false;
  signals_dispatch(core, p);
  now = time_monotonic();
  if(now >= next) {
    log_debug("tick");
    core.wake(true, true);
    next = next + interval;
    // After a long stall (e.g. suspend) don't fire a burst of ticks
    if(next <= now)
      next = now + interval;
  }
  return true;
}
