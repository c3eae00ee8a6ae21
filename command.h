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
#ifndef COMMAND_H
#define COMMAND_H

#include "statbar.h"
#include <string>
#include <vector>

/* What happened to a subprocess */
struct command_output {
  command_output(): status(-1), timed_out(false) {}
  int status;         // wait status, or -1 if never started
  bool timed_out;     // true if killed at the deadline
  std::string output; // stdout and stderr, interleaved
  std::string error;  // why it could not be started
};

/* Run a command with stdin from /dev/null, capturing its output.  The
 * process group is killed if it runs past the timeout.  Returns false only
 * if the command could not be started at all. */
bool run_command(const std::vector<std::string> &cmd, struct timespec timeout,
                 command_output &out);

/* Run a command via the user's shell */
bool run_shell(const std::string &command, struct timespec timeout,
               command_output &out);

/* Describe a wait status, e.g. "exited with status 2" */
std::string describe_status(int status);

#endif /* COMMAND_H */

/*
Local Variables:
mode:c++
c-basic-offset:2
comment-column:40
fill-column:79
indent-tabs-mode:nil
End:
*/
