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
#include "statbar.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

#if HAVE_CLOCK_GETTIME
static struct timespec time_posix(clockid_t c) {
  struct timespec ts;
  if(clock_gettime(c, &ts) < 0)
    fatal(errno, "clock_gettime %#x", (unsigned)c);
  return ts;
}
#endif

struct timespec time_monotonic() {
#if HAVE_CLOCK_GETTIME
  return time_posix(CLOCK_MONOTONIC);
#else
#error port me
#endif
}

struct timespec time_realtime() {
#if HAVE_CLOCK_GETTIME
  return time_posix(CLOCK_REALTIME);
#else
  struct timeval tv;
  if(gettimeofday(&tv, NULL) < 0)
    fatal(errno, "gettimeofday");
  struct timespec ts;
  ts.tv_sec = tv.tv_sec;
  ts.tv_nsec = tv.tv_usec * 1000;
  return ts;
#endif
}

/* Split a number of seconds into a timespec.  Negative or NaN values give
 * zero; values above MAX_SECONDS are capped. */
struct timespec seconds_to_timespec(double seconds) {
  double whole, frac;
  struct timespec ts;

  if(!(seconds > 0)) {
    ts.tv_sec = 0;
    ts.tv_nsec = 0;
    return ts;
  }
  if(seconds > MAX_SECONDS)
    seconds = MAX_SECONDS;
  frac = modf(seconds, &whole);
  ts.tv_sec = floor(whole);
  ts.tv_nsec = floor(frac * 1.0E9);
  if(ts.tv_nsec >= BILLION)
    ts.tv_nsec = BILLION - 1;
  return ts;
}

bool parse_seconds(const char *arg, double &value, std::string &error) {
  char *e;

  errno = 0;
  value = strtod(arg, &e);
  if(errno) {
    error = strerror(errno);
    return false;
  }
  if(*e || e == arg) {
    error = "must be a number";
    return false;
  }
  if(!(value >= MIN_SECONDS && value <= MAX_SECONDS)) {
    char buffer[64];
    snprintf(buffer, sizeof buffer, "must be between %g and %g", MIN_SECONDS,
             MAX_SECONDS);
    error = buffer;
    return false;
  }
  return true;
}

double timespec_to_seconds(struct timespec ts) {
  return ts.tv_sec + ts.tv_nsec / 1.0E9;
}

/* Format a realtime timestamp the way the tooltips show it */
std::string human_timestamp(struct timespec when) {
  char buffer[64];
  struct tm tm;
  time_t t = when.tv_sec;

  if(!localtime_r(&t, &tm)
     || strftime(buffer, sizeof buffer, "%Y-%m-%d %H:%M:%S", &tm) == 0)
    return "";
  return buffer;
}
