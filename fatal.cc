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
#include <cassert>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

/* Called to clean up before reporting an fatal error */
int (*onfatal)(void);

/* Set inside a fork */
bool forking;

/* Where log output goes; NULL means stderr */
static FILE *logfp;

/* Name of the agent, used in log lines */
static std::string log_agent = "statbar";

/* Path of the log file, if there is one */
static std::string logfile;

/* True to emit debug lines */
static bool log_debugging;

static const char *const level_names[] = {"DEBUG", "INFO", "WARNING",
                                          "ERROR"};

/* Format and write a log line.  The whole line goes out in a single stdio
 * call, so lines from different threads never interleave. */
static void log_vwrite(log_level level, int errno_value, const char *fmt,
                       va_list ap) {
  char message[1024], stamp[64], errbuf[128];
  time_t now;
  struct tm tm;

  if(level == LEVEL_DEBUG && !log_debugging)
    return;
  vsnprintf(message, sizeof message, fmt, ap);
  time(&now);
  if(!localtime_r(&now, &tm)
     || strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &tm) == 0)
    stamp[0] = 0;
  if(errno_value)
    snprintf(errbuf, sizeof errbuf, ": %s", strerror(errno_value));
  else
    errbuf[0] = 0;
  fprintf(logfp ? logfp : stderr, "%s [%s] %s - %s%s\n", stamp,
          level_names[level], log_agent.c_str(), message, errbuf);
}

/* Open the log.  If path is NULL, a file in the cache directory is used. */
void log_open(const char *agent, const char *path, bool debug) {
  log_agent = agent;
  log_debugging = debug;
  if(path)
    logfile = path;
  else {
    std::string dir = cache_directory();
    if(dir.empty())
      logfile.clear();
    else
      logfile = dir + "/" + log_agent + ".log";
  }
  log_close();
  if(logfile.empty())
    return;
  if(!(logfp = fopen(logfile.c_str(), "a"))) {
    int save_errno = errno;
    fprintf(stderr, "WARNING: %s: %s\n", logfile.c_str(),
            strerror(save_errno));
    logfile.clear();
    return;
  }
  setvbuf(logfp, NULL, _IOLBF, 0);
}

/* Close the log, reverting to stderr */
void log_close() {
  if(logfp) {
    fclose(logfp);
    logfp = NULL;
  }
}

const char *log_path() {
  return logfile.empty() ? "(stderr)" : logfile.c_str();
}

void log_debug(const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  log_vwrite(LEVEL_DEBUG, 0, fmt, ap);
  va_end(ap);
}

void log_info(const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  log_vwrite(LEVEL_INFO, 0, fmt, ap);
  va_end(ap);
}

void log_warning(int errno_value, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  log_vwrite(LEVEL_WARNING, errno_value, fmt, ap);
  va_end(ap);
}

std::string cache_directory() {
  std::string dir;
  const char *e;

  if((e = getenv("XDG_CACHE_HOME")) && *e)
    dir = std::string(e) + "/waybar";
  else if((e = getenv("HOME")) && *e)
    dir = std::string(e) + "/.cache/waybar";
  else
    return "";
  if(mkdir(dir.c_str(), 0700) < 0 && errno != EEXIST) {
    // ~/.cache might not exist yet either
    std::string parent = dir.substr(0, dir.rfind('/'));
    if(mkdir(parent.c_str(), 0700) < 0 && errno != EEXIST)
      return "";
    if(mkdir(dir.c_str(), 0700) < 0 && errno != EEXIST)
      return "";
  }
  return dir;
}

/* Report an error and terminate */
void fatal(int errno_value, const char *fmt, ...) {
  va_list ap;

  assert(fmt);
  if(forking) {
    // Only async-signal-safe calls are allowed here.  stderr is the pipe
    // back to the parent.
    char buffer[512];
    size_t n;
    va_start(ap, fmt);
    vsnprintf(buffer, sizeof buffer, fmt, ap);
    va_end(ap);
    n = strlen(buffer);
    if(errno_value)
      snprintf(buffer + n, sizeof buffer - n, ": %s", strerror(errno_value));
    n = strlen(buffer);
    if(write(2, buffer, n) < 0 || write(2, "\n", 1) < 0) {
      /* nowhere left to report it */
    }
    _exit(127);
  }
  if(onfatal)
    onfatal();
  va_start(ap, fmt);
  fprintf(stderr, "ERROR: ");
  vfprintf(stderr, fmt, ap);
  va_end(ap);
  if(errno_value)
    fprintf(stderr, ": %s\n", strerror(errno_value));
  else
    fprintf(stderr, "\n");
  if(logfp) {
    va_start(ap, fmt);
    log_vwrite(LEVEL_ERROR, errno_value, fmt, ap);
    va_end(ap);
  }
  exit(1);
}
