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
#include "status.h"
#include <cerrno>

const char *class_name(status_class c) {
  switch(c) {
  case CLASS_SUCCESS: return "success";
  case CLASS_WARNING: return "warning";
  case CLASS_CRITICAL: return "critical";
  case CLASS_ERROR: return "error";
  case CLASS_LOADING: return "loading";
  }
  return "error";
}

/* Length of the valid UTF-8 sequence starting at s[pos], or 0 */
static size_t utf8_sequence(const std::string &s, size_t pos) {
  unsigned char c = s[pos];
  size_t len;
  unsigned long cp;

  if(c >= 0xC2 && c <= 0xDF) {
    len = 2;
    cp = c & 0x1F;
  } else if(c >= 0xE0 && c <= 0xEF) {
    len = 3;
    cp = c & 0x0F;
  } else if(c >= 0xF0 && c <= 0xF4) {
    len = 4;
    cp = c & 0x07;
  } else
    return 0;
  if(pos + len > s.size())
    return 0;
  for(size_t n = 1; n < len; ++n) {
    unsigned char cc = s[pos + n];
    if((cc & 0xC0) != 0x80)
      return 0;
    cp = (cp << 6) | (cc & 0x3F);
  }
  // Overlong forms, surrogates and values past U+10FFFF
  if((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)
     || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
    return 0;
  return len;
}

std::string emitter::escape(const std::string &s) {
  std::string r;
  r.reserve(s.size() + 8);
  for(size_t pos = 0; pos < s.size(); ++pos) {
    char c = s[pos];
    switch(c) {
    case '"': r += "\\\""; break;
    case '\\': r += "\\\\"; break;
    case '\b': r += "\\b"; break;
    case '\f': r += "\\f"; break;
    case '\n': r += "\\n"; break;
    case '\r': r += "\\r"; break;
    case '\t': r += "\\t"; break;
    default:
      if((unsigned char)c < 0x20) {
        char buffer[8];
        snprintf(buffer, sizeof buffer, "\\u%04x", (unsigned char)c);
        r += buffer;
      } else if((unsigned char)c < 0x80)
        r += c;
      else if(size_t len = utf8_sequence(s, pos)) {
        r.append(s, pos, len);
        pos += len - 1;
      } else
        r += "\xef\xbf\xbd"; // U+FFFD for each invalid byte
      break;
    }
  }
  return r;
}

std::string emitter::to_json(const status_record &r) {
  std::string json = "{\"text\":\"" + escape(r.text) + "\",\"class\":\""
                     + class_name(r.cls) + "\"";
  if(r.has_tooltip)
    json += ",\"tooltip\":\"" + escape(r.tooltip) + "\"";
  json += "}";
  return json;
}

void emitter::emit(const status_record &r) {
  std::string line = to_json(r);
  line += '\n';
  // The host reads line by line, so the record must go out now
  if(fwrite(line.data(), 1, line.size(), fp) != line.size())
    fatal(errno, "writing status line");
  if(fflush(fp) < 0)
    fatal(errno, "flushing status line");
}
