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
#ifndef MODULES_H
#define MODULES_H

#include "reactor.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

/* Shared rendering helpers ------------------------------------------------ */

typedef std::vector<std::pair<std::string, std::string>> table_rows;

/* Align rows as "key : value" lines */
std::string format_table(const table_rows &rows);

/* Append a blank line and the update time to a tooltip */
std::string with_timestamp(const std::string &tooltip, struct timespec when);

/* Class for a resource with pct_free percent remaining */
status_class free_class(int pct_free);

/* Availability check ------------------------------------------------------ */

/* Succeeds if a TCP connection can be made to a well-known host */
class network_check: public availability_check {
public:
  network_check(const std::string &host_ = "8.8.8.8", int port_ = 53,
                double timeout_ = 3.0):
      host(host_),
      port(port_), timeout(timeout_) {}
  bool available() override;
  std::string reason() const override;

private:
  std::string host;
  int port;
  double timeout;
};

/* Filesystem -------------------------------------------------------------- */

struct fs_usage {
  std::string mountpoint;
  std::string device;
  std::string fstype;
  std::string options;
  uint64_t total = 0;
  uint64_t used = 0;
  uint64_t free = 0;
  uint64_t avail = 0;
  int pct_used = 0;
};

class filesystem_provider: public provider<fs_usage> {
public:
  explicit filesystem_provider(const std::string &mounts_ = "/proc/self/mounts"):
      mounts(mounts_) {}
  std::vector<result<fs_usage>>
  fetch(const std::vector<std::string> &targets) override;

private:
  std::string mounts;
};

class filesystem_renderer: public renderer<fs_usage> {
public:
  explicit filesystem_renderer(const std::string &unit_): unit(unit_) {}

protected:
  std::string noun() const override {
    return "disk data";
  }
  status_record render_success(const result<fs_usage> &r, int mode,
                               const char *icon) const override;

private:
  std::string unit;
};

/* Memory ------------------------------------------------------------------ */

struct memory_usage {
  std::string kind; // "ram" or "swap"
  uint64_t total = 0;
  uint64_t used = 0;
  uint64_t free = 0;
  uint64_t available = 0;
  uint64_t buffers = 0;
  uint64_t cached = 0;
  int pct_used = 0;
};

/* Parse /proc/meminfo contents into bytes per field */
std::map<std::string, uint64_t> parse_meminfo(const std::string &contents);

class memory_provider: public provider<memory_usage> {
public:
  explicit memory_provider(const std::string &path_ = "/proc/meminfo"):
      path(path_) {}
  std::vector<result<memory_usage>>
  fetch(const std::vector<std::string> &targets) override;

private:
  std::string path;
};

class memory_renderer: public renderer<memory_usage> {
public:
  explicit memory_renderer(const std::string &unit_): unit(unit_) {}

protected:
  std::string noun() const override {
    return "memory data";
  }
  status_record render_success(const result<memory_usage> &r, int mode,
                               const char *icon) const override;

private:
  std::string unit;
};

/* CPU --------------------------------------------------------------------- */

/* Cumulative jiffies for one line of /proc/stat */
struct cpu_times {
  uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0,
           softirq = 0, steal = 0;

  uint64_t total() const {
    return user + nice + system + idle + iowait + irq + softirq + steal;
  }
};

struct cpu_usage {
  std::string name;
  double pct_used = 0;
  double pct_user = 0;
  double pct_system = 0;
  double pct_iowait = 0;
  double pct_idle = 0;
};

std::map<std::string, cpu_times> parse_proc_stat(const std::string &contents);
cpu_usage cpu_between(const std::string &name, const cpu_times &before,
                      const cpu_times &after);

class cpu_provider: public provider<cpu_usage> {
public:
  explicit cpu_provider(const std::string &path_ = "/proc/stat",
                        double settle_ = 1.0):
      path(path_),
      settle(settle_) {}
  std::vector<result<cpu_usage>>
  fetch(const std::vector<std::string> &targets) override;

private:
  bool sample(std::map<std::string, cpu_times> &times, std::string &error);

  std::string path;
  double settle; // gap between the two samples of the first fetch
  std::map<std::string, cpu_times> previous; // empty before the first fetch
};

class cpu_renderer: public renderer<cpu_usage> {
protected:
  std::string noun() const override {
    return "CPU data";
  }
  status_record render_success(const result<cpu_usage> &r, int mode,
                               const char *icon) const override;
};

/* Network ----------------------------------------------------------------- */

struct net_counters {
  uint64_t rx_bytes = 0;
  uint64_t tx_bytes = 0;
};

struct net_usage {
  std::string interface;
  bool wireless = false;
  bool connected = false;
  uint64_t rx_bytes = 0;
  uint64_t tx_bytes = 0;
  double rx_rate = 0; // bytes/second
  double tx_rate = 0; // bytes/second
};

std::map<std::string, net_counters> parse_net_dev(const std::string &contents);

class network_provider: public provider<net_usage> {
public:
  explicit network_provider(const std::string &sysfs_ = "/sys/class/net",
                            const std::string &netdev_ = "/proc/net/dev",
                            double settle_ = 1.0):
      sysfs(sysfs_),
      netdev(netdev_), settle(settle_) {}
  std::vector<result<net_usage>>
  fetch(const std::vector<std::string> &targets) override;

private:
  bool sample(std::map<std::string, net_counters> &counters,
              std::string &error);

  std::string sysfs;
  std::string netdev;
  double settle;
  std::map<std::string, net_counters> previous;
  struct timespec previous_time = {0, 0};
};

class network_renderer: public renderer<net_usage> {
protected:
  std::string noun() const override {
    return "network data";
  }
  status_record render_success(const result<net_usage> &r, int mode,
                               const char *icon) const override;
};

/* Command ----------------------------------------------------------------- */

struct command_status {
  std::string command;
  std::string text;    // first line of output
  std::string details; // remaining lines
};

class command_provider: public provider<command_status> {
public:
  explicit command_provider(double timeout_): timeout(timeout_) {}
  std::vector<result<command_status>>
  fetch(const std::vector<std::string> &targets) override;

private:
  double timeout;
};

class command_renderer: public renderer<command_status> {
protected:
  std::string noun() const override {
    return "command output";
  }
  status_record render_success(const result<command_status> &r, int mode,
                               const char *icon) const override;
};

/* Module table ------------------------------------------------------------ */

struct module_options {
  std::string unit;     // byte unit for display
  double timeout;       // subprocess timeout in seconds
  bool require_network; // pre-check reachability
};

struct module {
  const char *name;
  const char *description;
  const char *default_target; // used when no targets given, or NULL
  bool (*valid_target)(const std::string &target);
  int (*run)(const agent_options &agent, const module_options &options,
             const std::vector<std::string> &targets);
};

extern const module modules[];
extern const size_t nmodules;

const module *find_module(const std::string &name);

/* Read a small file (e.g. under /proc) into a string */
bool read_file(const std::string &path, std::string &contents,
               std::string &error);

/* Sleep for a (fractional) number of seconds */
void sleep_for(double seconds);

#endif /* MODULES_H */

/*
Local Variables:
mode:c++
c-basic-offset:2
comment-column:40
fill-column:79
indent-tabs-mode:nil
End:
*/
