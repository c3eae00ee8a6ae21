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

std::string format_table(const table_rows &rows) {
  size_t width = 0;
  std::string s;

  for(auto &row: rows)
    if(row.first.size() > width)
      width = row.first.size();
  for(auto &row: rows) {
    if(!s.empty())
      s += '\n';
    s += row.first;
    s.append(width - row.first.size(), ' ');
    s += " : ";
    s += row.second;
  }
  return s;
}

std::string with_timestamp(const std::string &tooltip, struct timespec when) {
  std::string s = tooltip;
  if(!s.empty())
    s += "\n\n";
  return s + "Last updated " + human_timestamp(when);
}

status_class free_class(int pct_free) {
  if(pct_free < 20)
    return CLASS_CRITICAL;
  if(pct_free < 50)
    return CLASS_WARNING;
  return CLASS_SUCCESS;
}

bool read_file(const std::string &path, std::string &contents,
               std::string &error) {
  char buffer[4096];
  size_t n;
  FILE *fp;

  contents.clear();
  if(!(fp = fopen(path.c_str(), "r"))) {
    error = path + ": " + strerror(errno);
    return false;
  }
  while((n = fread(buffer, 1, sizeof buffer, fp)) > 0)
    contents.append(buffer, n);
  if(ferror(fp)) {
    error = path + ": " + strerror(errno);
    fclose(fp);
    return false;
  }
  fclose(fp);
  return true;
}

void sleep_for(double seconds) {
  struct timespec left = seconds_to_timespec(seconds);
  while(nanosleep(&left, &left) < 0) {
    if(errno != EINTR)
      fatal(errno, "nanosleep");
  }
}
