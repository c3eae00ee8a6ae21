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
#ifndef STATBAR_H
#define STATBAR_H

#include <config.h>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <sys/time.h>

/* Errors and logging ------------------------------------------------------ */

extern int (*onfatal)(void);
extern bool forking;
void fatal(int errno_value, const char *fmt, ...)
    attribute((noreturn)) attribute((format(printf, 2, 3)));

enum log_level {
  LEVEL_DEBUG,
  LEVEL_INFO,
  LEVEL_WARNING,
  LEVEL_ERROR,
};

void log_open(const char *agent, const char *path, bool debug);
void log_close();
const char *log_path();
void log_debug(const char *fmt, ...) attribute((format(printf, 1, 2)));
void log_info(const char *fmt, ...) attribute((format(printf, 1, 2)));
void log_warning(int errno_value, const char *fmt, ...)
    attribute((format(printf, 2, 3)));

// Return $XDG_CACHE_HOME/waybar (or ~/.cache/waybar), creating it if
// necessary.  Returns "" if it cannot be created.
std::string cache_directory();

/* Clocks ------------------------------------------------------------------ */

struct timespec time_monotonic();
struct timespec time_realtime();
struct timespec seconds_to_timespec(double seconds);
double timespec_to_seconds(struct timespec ts);
std::string human_timestamp(struct timespec when);

// Accepted range for intervals and timeouts, in seconds
#define MIN_SECONDS 0.001
#define MAX_SECONDS 1.0E9

// Parse a duration in seconds.  On failure sets error and returns false.
bool parse_seconds(const char *arg, double &value, std::string &error);

#define BILLION (1000 * 1000 * 1000)

inline struct timespec operator+(struct timespec a, struct timespec b) {
  struct timespec r = {a.tv_sec + b.tv_sec, a.tv_nsec + b.tv_nsec};
  while(r.tv_nsec >= BILLION) {
    r.tv_nsec -= BILLION;
    r.tv_sec++;
  }
  return r;
}

inline struct timespec operator-(struct timespec a, struct timespec b) {
  struct timespec r = {a.tv_sec - b.tv_sec, a.tv_nsec - b.tv_nsec};
  while(r.tv_nsec < 0) {
    r.tv_nsec += BILLION;
    r.tv_sec--;
  }
  return r;
}

inline bool operator<(struct timespec a, struct timespec b) {
  if(a.tv_sec < b.tv_sec)
    return true;
  if(a.tv_sec == b.tv_sec && a.tv_nsec < b.tv_nsec)
    return true;
  return false;
}

inline bool operator>(struct timespec a, struct timespec b) {
  return b < a;
}

inline bool operator<=(struct timespec a, struct timespec b) {
  return !(b < a);
}

inline bool operator>=(struct timespec a, struct timespec b) {
  return !(a < b);
}

/* Conversions ------------------------------------------------------------- */

bool valid_unit(const std::string &unit);
std::string pad_float(double number);
std::string byte_converter(double number, const std::string &unit = "auto");
std::string process_bytes(double rate);
std::string float_to_pct(double number);

// Convert bytes in the locale's character encoding to UTF-8.
// Undecodable bytes are replaced with C-style octal escapes.
std::string to_utf8(const std::string &bytes);

/* Glyphs ------------------------------------------------------------------ */

#define GLYPH_ALERT "\xf3\xb0\x80\xa6"         /* md-alert */
#define GLYPH_TIMER "\xf3\xb0\x94\x9b"         /* md-timer-outline */
#define GLYPH_HARDDISK "\xf3\xb0\x8b\x8a"      /* md-harddisk */
#define GLYPH_MEMORY "\xf3\xb0\x8d\x9b"        /* md-memory */
#define GLYPH_CPU "\xf3\xb0\xbb\xa0"           /* md-cpu-64-bit */
#define GLYPH_NETWORK "\xf3\xb0\x9b\xb3"       /* md-network */
#define GLYPH_NETWORK_OFF "\xf3\xb0\xb2\x9b"   /* md-network-off */
#define GLYPH_WIFI "\xf3\xb0\xa4\xa8"          /* md-wifi-strength-4 */
#define GLYPH_WIFI_OFF "\xf3\xb0\xa4\xad"      /* md-wifi-strength-off */
#define GLYPH_CONSOLE "\xf3\xb0\x86\x8d"       /* md-console */
#define GLYPH_ARROW_DOWN "\xee\xaa\x9d"        /* cod-arrow-small-down */
#define GLYPH_ARROW_UP "\xee\xaa\xa0"          /* cod-arrow-small-up */
#define ICON_SPACER "  "

#endif /* STATBAR_H */

/*
Local Variables:
mode:c++
c-basic-offset:2
comment-column:40
fill-column:79
indent-tabs-mode:nil
End:
*/
