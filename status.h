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
#ifndef STATUS_H
#define STATUS_H

#include "statbar.h"
#include <string>

/* Styling class of a status line, as consumed by the host's CSS */
enum status_class {
  CLASS_SUCCESS,
  CLASS_WARNING,
  CLASS_CRITICAL,
  CLASS_ERROR,
  CLASS_LOADING,
};

const char *class_name(status_class c);

/* One rendered status line */
struct status_record {
  status_record(): cls(CLASS_LOADING), has_tooltip(false) {}
  status_record(const std::string &text_, status_class cls_):
      text(text_), cls(cls_), has_tooltip(false) {}
  status_record(const std::string &text_, status_class cls_,
                const std::string &tooltip_):
      text(text_), cls(cls_), has_tooltip(true), tooltip(tooltip_) {}

  std::string text;    // main text
  status_class cls;    // styling class
  bool has_tooltip;    // true if tooltip is present
  std::string tooltip; // tooltip text (if has_tooltip)

  bool operator==(const status_record &that) const {
    return text == that.text && cls == that.cls
           && has_tooltip == that.has_tooltip && tooltip == that.tooltip;
  }
};

/* The outcome of fetching one target.  Either ok, with a payload and the
 * time it was gathered, or not ok, with an error message. */
template <typename T> struct result {
  result(): ok(false), payload(), updated_at() {}

  bool ok;                     // true for success
  T payload;                   // data (if ok)
  struct timespec updated_at;  // when the data was gathered (if ok)
  std::string error;           // what went wrong (if !ok)

  static result success(const T &payload,
                        struct timespec when = time_realtime()) {
    result r;
    r.ok = true;
    r.payload = payload;
    r.updated_at = when;
    return r;
  }

  static result failure(const std::string &error) {
    result r;
    r.error = error;
    return r;
  }
};

/* Writes status records to the host, one JSON object per line */
class emitter {
public:
  explicit emitter(FILE *fp_ = stdout): fp(fp_) {}

  /* Write a record and flush it */
  void emit(const status_record &r);

  /* Serialize a record (without the trailing newline) */
  static std::string to_json(const status_record &r);

  /* Escape a string for embedding in a JSON string literal */
  static std::string escape(const std::string &s);

private:
  FILE *fp;
};

#endif /* STATUS_H */

/*
Local Variables:
mode:c++
c-basic-offset:2
comment-column:40
fill-column:79
indent-tabs-mode:nil
End:
*/
