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

static bool valid_mountpoint(const std::string &target) {
  return !target.empty() && target[0] == '/';
}

static bool valid_memory(const std::string &target) {
  return target == "ram" || target == "swap";
}

static bool valid_cpu(const std::string &target) {
  if(target.compare(0, 3, "cpu"))
    return false;
  for(size_t n = 3; n < target.size(); ++n)
    if(target[n] < '0' || target[n] > '9')
      return false;
  return true;
}

static bool valid_interface(const std::string &target) {
  return !target.empty() && target.size() < 16
         && target.find('/') == std::string::npos && target != "."
         && target != "..";
}

static bool valid_command(const std::string &target) {
  return target.find_first_not_of(" \t") != std::string::npos;
}

/* Hand the module's provider and renderer to the reactor */
template <typename T>
static int run_module(const agent_options &agent, const module_options &options,
                      const std::vector<std::string> &targets, provider<T> &p,
                      const renderer<T> &r) {
  network_check check;
  emitter out(stdout);
  return run_agent(agent, targets, p, r, out,
                   options.require_network ? &check : nullptr);
}

static int run_filesystem(const agent_options &agent,
                          const module_options &options,
                          const std::vector<std::string> &targets) {
  filesystem_provider p;
  filesystem_renderer r(options.unit);
  return run_module(agent, options, targets, p, r);
}

static int run_memory(const agent_options &agent,
                      const module_options &options,
                      const std::vector<std::string> &targets) {
  memory_provider p;
  memory_renderer r(options.unit);
  return run_module(agent, options, targets, p, r);
}

static int run_cpu(const agent_options &agent, const module_options &options,
                   const std::vector<std::string> &targets) {
  cpu_provider p;
  cpu_renderer r;
  return run_module(agent, options, targets, p, r);
}

static int run_network(const agent_options &agent,
                       const module_options &options,
                       const std::vector<std::string> &targets) {
  network_provider p;
  network_renderer r;
  return run_module(agent, options, targets, p, r);
}

static int run_shell_module(const agent_options &agent,
                            const module_options &options,
                            const std::vector<std::string> &targets) {
  command_provider p(options.timeout);
  command_renderer r;
  return run_module(agent, options, targets, p, r);
}

const module modules[] = {
    {"filesystem", "usage of mounted filesystems", NULL, valid_mountpoint,
     run_filesystem},
    {"memory", "RAM or swap usage", "ram", valid_memory, run_memory},
    {"cpu", "CPU utilisation", "cpu", valid_cpu, run_cpu},
    {"network", "interface throughput", NULL, valid_interface, run_network},
    {"command", "output of shell commands", NULL, valid_command,
     run_shell_module},
};

const size_t nmodules = sizeof modules / sizeof *modules;

const module *find_module(const std::string &name) {
  for(size_t n = 0; n < nmodules; ++n)
    if(name == modules[n].name)
      return &modules[n];
  return NULL;
}
