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
#include <cstring>
#include <iconv.h>
#include <langinfo.h>

#if HAVE_BROKEN_ICONV
typedef const char *iconv_input_type;
#else
typedef char *iconv_input_type;
#endif

std::string to_utf8(const std::string &bytes) {
  // Keep an iconv handle around indefinitely.  Only the worker thread
  // converts subprocess output, so it is never shared.
  static iconv_t cd = (iconv_t)-1;
  if(cd == (iconv_t)-1)
    if((cd = iconv_open("UTF-8", nl_langinfo(CODESET))) == (iconv_t)-1)
      fatal(errno, "iconv_open");
  // Reset shift state from any previous conversion
  iconv(cd, NULL, NULL, NULL, NULL);
  std::string utf8;
  iconv_input_type in = (iconv_input_type)bytes.data();
  size_t inleft = bytes.size();
  while(inleft > 0) {
    char chunk[512];
    char *out = chunk;
    size_t outleft = sizeof chunk;
    size_t rc = iconv(cd, &in, &inleft, &out, &outleft);
    utf8.append(chunk, (sizeof chunk) - outleft);
    if(rc == (size_t)-1) {
      size_t escape;
      switch(errno) {
      case EILSEQ:  // invalid sequence
        escape = 1; // escape one byte and pick up after that
        break;
      case EINVAL:       // incomplete sequence
        escape = inleft; // escape the whole sequence
        break;
      case E2BIG:   // chunk[] not big enough
        escape = 0; // come back round next time
        break;
      default: fatal(errno, "iconv");
      }
      // Use C-like octal escapes for anything that could not be converted
      assert(inleft >= escape);
      while(escape > 0) {
        char buffer[8];
        snprintf(buffer, sizeof buffer, "\\%03o", (unsigned char)*in);
        utf8 += buffer;
        ++in;
        --inleft;
        --escape;
      }
    }
  }
  return utf8;
}
