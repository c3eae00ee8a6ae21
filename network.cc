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
#include <sys/stat.h>

std::map<std::string, net_counters> parse_net_dev(const std::string &contents) {
  std::map<std::string, net_counters> counters;
  std::istringstream in(contents);
  std::string line;

  while(std::getline(in, line)) {
    size_t colon = line.find(':');
    if(colon == std::string::npos)
      continue; // header
    size_t start = line.find_first_not_of(' ');
    std::string name = line.substr(start, colon - start);
    std::istringstream fields(line.substr(colon + 1));
    uint64_t skip;
    net_counters c;
    fields >> c.rx_bytes;
    for(int n = 0; n < 7; ++n)
      fields >> skip;
    fields >> c.tx_bytes;
    if(fields)
      counters[name] = c;
  }
  return counters;
}

static bool is_directory(const std::string &path) {
  struct stat sb;
  return stat(path.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}

bool network_provider::sample(std::map<std::string, net_counters> &counters,
                              std::string &error) {
  std::string contents;
  if(!read_file(netdev, contents, error))
    return false;
  counters = parse_net_dev(contents);
  return true;
}

std::vector<result<net_usage>>
network_provider::fetch(const std::vector<std::string> &targets) {
  std::vector<result<net_usage>> results;
  std::map<std::string, net_counters> now;
  struct timespec when;
  std::string error;

  if(previous.empty()) {
    if(!sample(previous, error)) {
      log_warning(0, "%s", error.c_str());
      results.assign(targets.size(), result<net_usage>::failure(error));
      return results;
    }
    previous_time = time_monotonic();
    sleep_for(settle);
  }
  if(!sample(now, error)) {
    log_warning(0, "%s", error.c_str());
    results.assign(targets.size(), result<net_usage>::failure(error));
    return results;
  }
  when = time_monotonic();
  double elapsed = timespec_to_seconds(when - previous_time);
  for(auto &target: targets) {
    std::string dir = sysfs + "/" + target;
    if(target.empty() || target.find('/') != std::string::npos
       || !is_directory(dir)) {
      results.push_back(result<net_usage>::failure(target + " doesn't exist"));
      continue;
    }
    auto after = now.find(target);
    if(after == now.end()) {
      results.push_back(
          result<net_usage>::failure(target + ": no statistics"));
      continue;
    }
    net_usage u;
    std::string carrier;
    u.interface = target;
    u.wireless = is_directory(dir + "/wireless");
    // Reading carrier fails with EINVAL while the interface is down
    u.connected = read_file(dir + "/carrier", carrier, error)
                  && carrier.compare(0, 1, "1") == 0;
    u.rx_bytes = after->second.rx_bytes;
    u.tx_bytes = after->second.tx_bytes;
    auto before = previous.find(target);
    if(before != previous.end() && elapsed > 0) {
      if(u.rx_bytes >= before->second.rx_bytes)
        u.rx_rate = (u.rx_bytes - before->second.rx_bytes) / elapsed;
      if(u.tx_bytes >= before->second.tx_bytes)
        u.tx_rate = (u.tx_bytes - before->second.tx_bytes) / elapsed;
    }
    log_debug("%s: connected=%d rx=%.0f/s tx=%.0f/s", target.c_str(),
              u.connected, u.rx_rate, u.tx_rate);
    results.push_back(result<net_usage>::success(u));
  }
  previous = now;
  previous_time = when;
  return results;
}

status_record network_renderer::render_success(const result<net_usage> &r,
                                               int attribute((unused)) mode,
                                               const char *icon) const {
  const net_usage &u = r.payload;
  table_rows rows;

  if(!icon) {
    if(u.wireless)
      icon = u.connected ? GLYPH_WIFI : GLYPH_WIFI_OFF;
    else
      icon = u.connected ? GLYPH_NETWORK : GLYPH_NETWORK_OFF;
  }
  rows.push_back({"Interface", u.interface});
  rows.push_back({"Type", u.wireless ? "wireless" : "wired"});
  rows.push_back({"Carrier", u.connected ? "up" : "down"});
  rows.push_back({"Received", byte_converter(u.rx_bytes)});
  rows.push_back({"Transmitted", byte_converter(u.tx_bytes)});
  std::string tooltip = with_timestamp(format_table(rows), r.updated_at);
  if(!u.connected)
    return status_record(std::string(icon) + ICON_SPACER + u.interface
                             + " disconnected",
                         CLASS_WARNING, tooltip);
  return status_record(std::string(icon) + ICON_SPACER + u.interface + " "
                           + GLYPH_ARROW_DOWN + process_bytes(u.rx_rate) + " "
                           + GLYPH_ARROW_UP + process_bytes(u.tx_rate),
                       CLASS_SUCCESS, tooltip);
}
