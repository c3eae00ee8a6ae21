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
#include <cstdlib>
#include <cstring>
#include <sstream>

std::map<std::string, uint64_t> parse_meminfo(const std::string &contents) {
  std::map<std::string, uint64_t> fields;
  std::istringstream in(contents);
  std::string line;

  while(std::getline(in, line)) {
    size_t colon = line.find(':');
    if(colon == std::string::npos)
      continue;
    const char *s = line.c_str() + colon + 1;
    char *e;
    uint64_t value = strtoull(s, &e, 10);
    if(e == s)
      continue;
    while(*e == ' ')
      ++e;
    if(!strcmp(e, "kB"))
      value *= 1024;
    fields[line.substr(0, colon)] = value;
  }
  return fields;
}

/* Look up a field, returning false if it is missing */
static bool field(const std::map<std::string, uint64_t> &fields,
                  const char *name, uint64_t &value) {
  auto it = fields.find(name);
  if(it == fields.end())
    return false;
  value = it->second;
  return true;
}

static result<memory_usage>
ram_usage(const std::map<std::string, uint64_t> &fields,
          const std::string &path) {
  memory_usage m;
  m.kind = "ram";
  if(!field(fields, "MemTotal", m.total) || m.total == 0)
    return result<memory_usage>::failure(path + ": no MemTotal");
  field(fields, "MemFree", m.free);
  field(fields, "Buffers", m.buffers);
  field(fields, "Cached", m.cached);
  // Kernels before 3.14 have no MemAvailable
  if(!field(fields, "MemAvailable", m.available))
    m.available = m.free + m.buffers + m.cached;
  if(m.available > m.total)
    m.available = m.total;
  m.used = m.total - m.available;
  m.pct_used = (int)(m.used * 100 / m.total);
  return result<memory_usage>::success(m);
}

static result<memory_usage>
swap_usage(const std::map<std::string, uint64_t> &fields,
           const std::string &path) {
  memory_usage m;
  m.kind = "swap";
  if(!field(fields, "SwapTotal", m.total))
    return result<memory_usage>::failure(path + ": no SwapTotal");
  if(m.total == 0)
    return result<memory_usage>::failure("swap is not configured");
  field(fields, "SwapFree", m.free);
  if(m.free > m.total)
    m.free = m.total;
  m.available = m.free;
  m.used = m.total - m.free;
  m.pct_used = (int)(m.used * 100 / m.total);
  return result<memory_usage>::success(m);
}

std::vector<result<memory_usage>>
memory_provider::fetch(const std::vector<std::string> &targets) {
  std::vector<result<memory_usage>> results;
  std::string contents, error;

  if(!read_file(path, contents, error)) {
    log_warning(0, "%s", error.c_str());
    results.assign(targets.size(), result<memory_usage>::failure(error));
    return results;
  }
  std::map<std::string, uint64_t> fields = parse_meminfo(contents);
  for(auto &target: targets) {
    if(target == "ram")
      results.push_back(ram_usage(fields, path));
    else if(target == "swap")
      results.push_back(swap_usage(fields, path));
    else
      results.push_back(
          result<memory_usage>::failure(target + ": unknown memory type"));
  }
  return results;
}

status_record
memory_renderer::render_success(const result<memory_usage> &r,
                                int attribute((unused)) mode,
                                const char *icon) const {
  const memory_usage &m = r.payload;
  bool ram = m.kind == "ram";
  table_rows rows;

  rows.push_back({"Total", byte_converter(m.total, unit)});
  rows.push_back({"Used", byte_converter(m.used, unit)});
  rows.push_back({"Free", byte_converter(m.free, unit)});
  if(ram) {
    rows.push_back({"Buffers", byte_converter(m.buffers, unit)});
    rows.push_back({"Cached", byte_converter(m.cached, unit)});
    rows.push_back({"Available", byte_converter(m.available, unit)});
  }
  std::string tooltip = std::string(ram ? "Memory" : "Swap") + "\n"
                        + format_table(rows);
  return status_record(std::string(icon ? icon : GLYPH_MEMORY) + ICON_SPACER
                           + (ram ? "" : "swap ")
                           + byte_converter(m.used, unit) + " / "
                           + byte_converter(m.total, unit),
                       free_class(100 - m.pct_used),
                       with_timestamp(tooltip, r.updated_at));
}
