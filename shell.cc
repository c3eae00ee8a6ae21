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
#include "command.h"

/* Split output into its first line and the rest */
static void split_output(const std::string &output, std::string &first,
                         std::string &rest) {
  std::string s = output;
  while(!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  size_t nl = s.find('\n');
  if(nl == std::string::npos) {
    first = s;
    rest.clear();
  } else {
    first = s.substr(0, nl);
    rest = s.substr(nl + 1);
  }
}

/* The last non-blank line of output */
static std::string last_line(const std::string &output) {
  size_t end = output.find_last_not_of("\r\n");
  if(end == std::string::npos)
    return "";
  size_t start = output.rfind('\n', end);
  start = start == std::string::npos ? 0 : start + 1;
  return output.substr(start, end + 1 - start);
}

std::vector<result<command_status>>
command_provider::fetch(const std::vector<std::string> &targets) {
  std::vector<result<command_status>> results;
  char buffer[64];

  for(auto &target: targets) {
    command_output out;
    if(!run_shell(target, seconds_to_timespec(timeout), out)) {
      log_warning(0, "%s: %s", target.c_str(), out.error.c_str());
      results.push_back(result<command_status>::failure(out.error));
      continue;
    }
    if(out.timed_out) {
      snprintf(buffer, sizeof buffer, "timed out after %gs", timeout);
      results.push_back(result<command_status>::failure(buffer));
      continue;
    }
    std::string output = to_utf8(out.output);
    if(out.status != 0) {
      std::string why = last_line(output);
      log_info("%s: %s", target.c_str(), describe_status(out.status).c_str());
      results.push_back(result<command_status>::failure(
          why.empty() ? describe_status(out.status) : why));
      continue;
    }
    command_status s;
    s.command = target;
    split_output(output, s.text, s.details);
    results.push_back(result<command_status>::success(s));
  }
  return results;
}

status_record
command_renderer::render_success(const result<command_status> &r,
                                 int attribute((unused)) mode,
                                 const char *icon) const {
  const command_status &s = r.payload;
  std::string text = s.text;
  if(icon)
    text = std::string(icon) + ICON_SPACER + text;
  else if(text.empty())
    text = std::string(GLYPH_CONSOLE) + ICON_SPACER + s.command;
  return status_record(
      text, CLASS_SUCCESS,
      with_timestamp(s.details.empty() ? s.command : s.details,
                     r.updated_at));
}
