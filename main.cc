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
#include <clocale>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <getopt.h>

static void help(FILE *fp);
static void config_error(const char *fmt, ...)
    attribute((noreturn)) attribute((format(printf, 1, 2)));
static double parse_duration(const char *what, const char *arg);
static int parse_signal_option(const char *what, const char *arg);

enum {
  OPT_HELP = 256,
  OPT_VERSION,
};

static const struct option options[] = {
    {"help", no_argument, 0, OPT_HELP},
    {"version", no_argument, 0, OPT_VERSION},
    {"interval", required_argument, 0, 'i'},
    {"test", no_argument, 0, 't'},
    {"debug", no_argument, 0, 'd'},
    {"unit", required_argument, 0, 'u'},
    {"timeout", required_argument, 0, 'T'},
    {"require-network", no_argument, 0, 'N'},
    {"refresh-signal", required_argument, 0, 'r'},
    {"toggle-signal", required_argument, 0, 'g'},
    {"log-file", required_argument, 0, 'l'},
    {0, 0, 0, 0},
};

int main(int argc, char **argv) {
  int n;
  agent_options agent;
  module_options mopts;
  const char *logfile = NULL;
  bool debug = false;

  agent.interval = 5.0;
  agent.test = false;
  agent.signals.refresh = SIGHUP;
  agent.signals.toggle = SIGUSR1;
  mopts.unit = "auto";
  mopts.timeout = 30.0;
  mopts.require_network = false;
  if(!setlocale(LC_ALL, ""))
    log_warning(errno, "setlocale");
  while((n = getopt_long(argc, argv, "+i:tdu:T:Nr:g:l:", options, NULL))
        >= 0) {
    switch(n) {
    case OPT_HELP: help(stdout); return 0;
    case OPT_VERSION: puts(PACKAGE_VERSION); return 0;
    case 'i': agent.interval = parse_duration("interval", optarg); break;
    case 't': agent.test = true; break;
    case 'd': debug = true; break;
    case 'u':
      if(!valid_unit(optarg))
        config_error("invalid unit '%s'", optarg);
      mopts.unit = optarg;
      break;
    case 'T': mopts.timeout = parse_duration("timeout", optarg); break;
    case 'N': mopts.require_network = true; break;
    case 'r':
      agent.signals.refresh = parse_signal_option("refresh signal", optarg);
      break;
    case 'g':
      agent.signals.toggle = parse_signal_option("toggle signal", optarg);
      break;
    case 'l': logfile = optarg; break;
    default: help(stderr); config_error("invalid command line");
    }
  }
  if(agent.signals.refresh == agent.signals.toggle)
    config_error("refresh and toggle signals must differ");
  if(optind >= argc) {
    help(stderr);
    config_error("no module specified");
  }
  const module *m = find_module(argv[optind]);
  if(!m) {
    help(stderr);
    config_error("unknown module '%s'", argv[optind]);
  }
  std::string agent_name = std::string("statbar-") + m->name;
  log_open(agent_name.c_str(), logfile, debug);
  std::vector<std::string> targets(argv + optind + 1, argv + argc);
  if(targets.empty()) {
    if(!m->default_target)
      config_error("%s: no targets given", m->name);
    targets.push_back(m->default_target);
  }
  for(auto &target: targets)
    if(!m->valid_target(target))
      config_error("%s: invalid target '%s'", m->name, target.c_str());
  log_info("%s started, logging to %s", agent_name.c_str(), log_path());
  return m->run(agent, mopts, targets);
}

/* Display usage message */
static void help(FILE *fp) {
  fprintf(fp, "Usage:\n"
              "  statbar [OPTIONS] MODULE [TARGET ...]\n"
              "Options:\n"
              "  -i, --interval SECONDS       Delay between fetches (default 5)\n"
              "  -t, --test                   Fetch once, print and exit\n"
              "  -d, --debug                  Enable debug logging\n"
              "  -u, --unit UNIT              Byte unit (auto, K, Ki, ... Y, Yi)\n"
              "  -T, --timeout SECONDS        Command timeout (default 30)\n"
              "  -N, --require-network        Skip fetches while offline\n"
              "  -r, --refresh-signal SIGNAL  Re-fetch signal (default HUP)\n"
              "  -g, --toggle-signal SIGNAL   Next-target signal (default USR1)\n"
              "  -l, --log-file PATH          Log file\n"
              "  --help                       Display usage message\n"
              "  --version                    Display version string\n"
              "Modules:\n");
  for(size_t n = 0; n < nmodules; ++n)
    fprintf(fp, "  %-12s %s%s%s%s\n", modules[n].name, modules[n].description,
            modules[n].default_target ? " (default " : "",
            modules[n].default_target ? modules[n].default_target : "",
            modules[n].default_target ? ")" : "");
}

/* Report a configuration error to the bar and to stderr, then exit */
static void config_error(const char *fmt, ...) {
  char message[512];
  va_list ap;

  va_start(ap, fmt);
  vsnprintf(message, sizeof message, fmt, ap);
  va_end(ap);
  emitter().emit(
      status_record(std::string(GLYPH_ALERT) + " " + message, CLASS_ERROR));
  fatal(0, "%s", message);
}

static double parse_duration(const char *what, const char *arg) {
  double value;
  std::string error;

  if(!parse_seconds(arg, value, error))
    config_error("invalid %s '%s': %s", what, arg, error.c_str());
  return value;
}

static int parse_signal_option(const char *what, const char *arg) {
  int sig = parse_signal(arg);
  if(sig < 0)
    config_error("invalid %s '%s'", what, arg);
  if(!signal_usable(sig))
    config_error("invalid %s '%s': reserved", what, arg);
  return sig;
}
