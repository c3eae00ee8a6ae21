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
#include <sstream>

std::map<std::string, cpu_times> parse_proc_stat(const std::string &contents) {
  std::map<std::string, cpu_times> times;
  std::istringstream in(contents);
  std::string line;

  while(std::getline(in, line)) {
    if(line.compare(0, 3, "cpu"))
      continue;
    std::istringstream fields(line);
    std::string name;
    cpu_times t;
    fields >> name >> t.user >> t.nice >> t.system >> t.idle;
    if(!fields)
      continue;
    // Older kernels stop early
    fields >> t.iowait >> t.irq >> t.softirq >> t.steal;
    times[name] = t;
  }
  return times;
}

/* Difference of two counters, treating a reset as zero */
static uint64_t delta(uint64_t before, uint64_t after) {
  return after >= before ? after - before : 0;
}

cpu_usage cpu_between(const std::string &name, const cpu_times &before,
                      const cpu_times &after) {
  cpu_usage u;
  u.name = name;
  uint64_t total = delta(before.total(), after.total());
  if(!total) {
    u.pct_idle = 100;
    return u;
  }
  uint64_t user = delta(before.user, after.user)
                  + delta(before.nice, after.nice);
  uint64_t system = delta(before.system, after.system)
                    + delta(before.irq, after.irq)
                    + delta(before.softirq, after.softirq);
  uint64_t iowait = delta(before.iowait, after.iowait);
  uint64_t idle = delta(before.idle, after.idle) + iowait;
  if(idle > total)
    idle = total;
  u.pct_user = 100.0 * user / total;
  u.pct_system = 100.0 * system / total;
  u.pct_iowait = 100.0 * iowait / total;
  u.pct_idle = 100.0 * idle / total;
  u.pct_used = 100.0 - u.pct_idle;
  return u;
}

bool cpu_provider::sample(std::map<std::string, cpu_times> &times,
                          std::string &error) {
  std::string contents;
  if(!read_file(path, contents, error))
    return false;
  times = parse_proc_stat(contents);
  if(times.empty()) {
    error = path + ": no cpu lines";
    return false;
  }
  return true;
}

std::vector<result<cpu_usage>>
cpu_provider::fetch(const std::vector<std::string> &targets) {
  std::vector<result<cpu_usage>> results;
  std::map<std::string, cpu_times> now;
  std::string error;

  if(previous.empty()) {
    if(!sample(previous, error)) {
      log_warning(0, "%s", error.c_str());
      results.assign(targets.size(), result<cpu_usage>::failure(error));
      return results;
    }
    sleep_for(settle);
  }
  if(!sample(now, error)) {
    log_warning(0, "%s", error.c_str());
    results.assign(targets.size(), result<cpu_usage>::failure(error));
    return results;
  }
  for(auto &target: targets) {
    auto after = now.find(target);
    if(after == now.end()) {
      results.push_back(result<cpu_usage>::failure(target + " doesn't exist"));
      continue;
    }
    // A CPU that came online since the last sample is measured from boot
    auto before = previous.find(target);
    cpu_usage u = cpu_between(
        target, before == previous.end() ? cpu_times() : before->second,
        after->second);
    log_debug("%s: %.2f%% used", target.c_str(), u.pct_used);
    results.push_back(result<cpu_usage>::success(u));
  }
  previous = now;
  return results;
}

static status_class usage_class(double pct_used) {
  if(pct_used >= 90)
    return CLASS_CRITICAL;
  if(pct_used >= 70)
    return CLASS_WARNING;
  return CLASS_SUCCESS;
}

status_record cpu_renderer::render_success(const result<cpu_usage> &r,
                                           int attribute((unused)) mode,
                                           const char *icon) const {
  const cpu_usage &u = r.payload;
  table_rows rows;
  std::string text = std::string(icon ? icon : GLYPH_CPU) + ICON_SPACER;

  if(u.name != "cpu")
    text += u.name + " ";
  text += "user " + float_to_pct(u.pct_user) + ", sys "
          + float_to_pct(u.pct_system) + ", idle " + float_to_pct(u.pct_idle);
  rows.push_back({"CPU", u.name == "cpu" ? "all" : u.name});
  rows.push_back({"User", float_to_pct(u.pct_user)});
  rows.push_back({"System", float_to_pct(u.pct_system)});
  rows.push_back({"I/O wait", float_to_pct(u.pct_iowait)});
  rows.push_back({"Idle", float_to_pct(u.pct_idle)});
  return status_record(text, usage_class(u.pct_used),
                       with_timestamp(format_table(rows), r.updated_at));
}
