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
#ifndef TESTS_HELPERS_H
#define TESTS_HELPERS_H

#include "reactor.h"
#include <atomic>
#include <cstdio>
#include <string>
#include <vector>

/* An emitter whose output can be read back */
class captured_output {
public:
  captured_output(): fp(tmpfile()), out(fp) {}
  ~captured_output() {
    if(fp)
      fclose(fp);
  }

  /* Everything emitted so far, one entry per line */
  std::vector<std::string> lines() {
    std::vector<std::string> result;
    char buffer[4096];
    fflush(fp);
    rewind(fp);
    while(fgets(buffer, sizeof buffer, fp)) {
      std::string line = buffer;
      if(!line.empty() && line.back() == '\n')
        line.pop_back();
      result.push_back(line);
    }
    fseek(fp, 0, SEEK_END);
    return result;
  }

  FILE *fp;
  emitter out;
};

/* Provider double: returns a scripted list and checks for reentrancy */
class fake_provider: public provider<int> {
public:
  std::vector<result<int>>
  fetch(const std::vector<std::string> &targets) override {
    if(++in_flight > 1)
      ++overlaps;
    ++calls;
    std::vector<result<int>> r = scripted;
    if(echo_targets) {
      r.clear();
      for(size_t n = 0; n < targets.size(); ++n)
        r.push_back(result<int>::success((int)n + base));
    }
    if(delay_ms) {
      struct timespec ts = {0, delay_ms * 1000L * 1000L};
      nanosleep(&ts, NULL);
    }
    --in_flight;
    return r;
  }

  bool echo_targets = true;    // one success per target, payload base + n
  int base = 100;
  long delay_ms = 0;
  std::vector<result<int>> scripted; // used when !echo_targets
  int calls = 0;
  std::atomic<int> in_flight{0};
  std::atomic<int> overlaps{0};
};

/* Renderer double: "value <payload> mode <mode>" */
class fake_renderer: public renderer<int> {
protected:
  std::string noun() const override {
    return "test data";
  }
  status_record render_success(const result<int> &r, int mode,
                               const char *icon) const override {
    std::string text = icon ? std::string(icon) + " " : std::string();
    text += "value " + std::to_string(r.payload) + " mode "
            + std::to_string(mode);
    return status_record(text, CLASS_SUCCESS);
  }
};

/* Availability double */
class fake_check: public availability_check {
public:
  explicit fake_check(bool up_): up(up_) {}
  bool available() override {
    ++calls;
    return up;
  }
  std::string reason() const override {
    return "network unreachable";
  }
  bool up;
  int calls = 0;
};

#endif /* TESTS_HELPERS_H */
