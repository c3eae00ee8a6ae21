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
#include "helpers.h"
#include <catch2/catch.hpp>
#include <thread>

static const std::vector<std::string> three = {"a", "b", "c"};

TEST_CASE("first step emits loading lines then the first target",
          "[worker]") {
  shared_state<int> state(three.size());
  fake_provider p;
  fake_renderer r;
  captured_output c;
  worker<int> w(state, three, p, r, c.out);

  w.step();
  std::vector<std::string> lines = c.lines();
  REQUIRE(lines.size() == 4);
  for(size_t n = 0; n < 3; ++n)
    CHECK(lines[n]
          == "{\"text\":\"" GLYPH_TIMER "  Gathering test data...\","
             "\"class\":\"loading\",\"tooltip\":\"Gathering test data...\"}");
  CHECK(lines[3] == "{\"text\":\"value 100 mode 0\",\"class\":\"success\"}");
  CHECK(p.calls == 1);
}

TEST_CASE("a failed fetch renders as an error once per cycle", "[worker]") {
  std::vector<std::string> one = {"host"};
  shared_state<int> state(1);
  fake_provider p;
  fake_renderer r;
  captured_output c;
  worker<int> w(state, one, p, r, c.out);

  p.echo_targets = false;
  p.scripted = {result<int>::failure("network unreachable")};
  w.step();
  std::vector<std::string> lines = c.lines();
  REQUIRE(lines.size() == 2);
  CHECK(lines[1]
        == "{\"text\":\"" GLYPH_ALERT " network unreachable\","
           "\"class\":\"error\"}");
  // Only another tick fetches again
  state.wake(true, true);
  w.step();
  lines = c.lines();
  REQUIRE(lines.size() == 4);
  CHECK(lines[3] == lines[1]);
  CHECK(p.calls == 2);
}

TEST_CASE("two toggles before the worker wakes give one redraw",
          "[worker]") {
  shared_state<int> state(three.size());
  fake_provider p;
  fake_renderer r;
  captured_output c;
  worker<int> w(state, three, p, r, c.out);

  w.step();
  state.toggle();
  state.toggle();
  w.step();
  std::vector<std::string> lines = c.lines();
  REQUIRE(lines.size() == 5);
  CHECK(lines[4] == "{\"text\":\"value 102 mode 2\",\"class\":\"success\"}");
  CHECK(p.calls == 1);
}

TEST_CASE("toggle before the first fetch renders a pending line",
          "[worker]") {
  std::vector<std::string> two = {"x", "y"};
  shared_state<int> state(two.size());
  fake_provider p;
  fake_renderer r;
  captured_output c;
  worker<int> w(state, two, p, r, c.out);

  state.wait_and_drain(); // discard the initial fetch
  state.toggle();
  w.step();
  std::vector<std::string> lines = c.lines();
  REQUIRE(lines.size() == 1);
  CHECK(lines[0]
        == "{\"text\":\"" GLYPH_TIMER "  Waiting for test data...\","
           "\"class\":\"loading\",\"tooltip\":\"No test data yet\"}");
  CHECK(state.format_index() == 1);
  CHECK(p.calls == 0);
}

TEST_CASE("rendering is pure", "[worker]") {
  fake_renderer r;
  result<int> ok = result<int>::success(7, {1000, 0});
  result<int> bad = result<int>::failure("nope");
  CHECK(r.render(ok, 1) == r.render(ok, 1));
  CHECK(emitter::to_json(r.render(ok, 1))
        == emitter::to_json(r.render(ok, 1)));
  CHECK(r.render(bad, 0) == r.render(bad, 0));
}

TEST_CASE("loading lines are derived from the previous results", "[worker]") {
  shared_state<int> state(three.size());
  fake_provider p;
  fake_renderer r;
  captured_output c;
  worker<int> w(state, three, p, r, c.out);

  w.step();
  p.base = 200;
  state.wake(true, true);
  w.step();
  std::vector<std::string> lines = c.lines();
  REQUIRE(lines.size() == 8);
  CHECK(lines[4]
        == "{\"text\":\"" GLYPH_TIMER " value 101 mode 1\","
           "\"class\":\"loading\"}");
  CHECK(lines[5]
        == "{\"text\":\"" GLYPH_TIMER " value 102 mode 2\","
           "\"class\":\"loading\"}");
  CHECK(lines[6]
        == "{\"text\":\"" GLYPH_TIMER " value 100 mode 0\","
           "\"class\":\"loading\"}");
  CHECK(lines[7] == "{\"text\":\"value 200 mode 0\",\"class\":\"success\"}");
}

TEST_CASE("the selected target's loading line comes last", "[worker]") {
  shared_state<int> state(three.size());
  fake_provider p;
  fake_renderer r;
  captured_output c;
  worker<int> w(state, three, p, r, c.out);

  w.step();
  state.toggle(); // select "b"
  w.step();
  state.wake(true, true);
  w.step();
  std::vector<std::string> lines = c.lines();
  REQUIRE(lines.size() == 9);
  CHECK(lines[5].find("value 102 mode 2") != std::string::npos);
  CHECK(lines[6].find("value 100 mode 0") != std::string::npos);
  CHECK(lines[7]
        == "{\"text\":\"" GLYPH_TIMER " value 101 mode 1\","
           "\"class\":\"loading\"}");
  CHECK(lines[8] == "{\"text\":\"value 101 mode 1\",\"class\":\"success\"}");
}

TEST_CASE("an empty fetch keeps the cache and skips rendering",
          "[worker]") {
  shared_state<int> state(three.size());
  fake_provider p;
  fake_renderer r;
  captured_output c;
  worker<int> w(state, three, p, r, c.out);

  w.step();
  p.echo_targets = false;
  state.wake(true, true);
  w.step();
  std::vector<std::string> lines = c.lines();
  REQUIRE(lines.size() == 7); // just the loading lines
  result<int> cached;
  int mode;
  REQUIRE(state.selected(cached, mode));
  CHECK(cached.payload == 100);
  // A later redraw still shows the old data
  state.wake(false, true);
  w.step();
  lines = c.lines();
  REQUIRE(lines.size() == 8);
  CHECK(lines[7] == "{\"text\":\"value 100 mode 0\",\"class\":\"success\"}");
}

TEST_CASE("gather normalises the number of results", "[worker]") {
  fake_provider p;
  p.echo_targets = false;

  SECTION("short results are padded with failures") {
    p.scripted = {result<int>::success(1)};
    std::vector<result<int>> got = gather(three, p, nullptr);
    REQUIRE(got.size() == 3);
    CHECK(got[0].ok);
    CHECK_FALSE(got[1].ok);
    CHECK(got[1].error == "b: no data");
    CHECK(got[2].error == "c: no data");
  }
  SECTION("long results are truncated") {
    p.scripted = {result<int>::success(1), result<int>::success(2),
                  result<int>::success(3), result<int>::success(4)};
    std::vector<std::string> two = {"x", "y"};
    std::vector<result<int>> got = gather(two, p, nullptr);
    REQUIRE(got.size() == 2);
    CHECK(got[1].payload == 2);
  }
  SECTION("empty results stay empty") {
    CHECK(gather(three, p, nullptr).empty());
  }
}

TEST_CASE("an unavailable environment skips the provider", "[worker]") {
  fake_provider p;
  fake_check down(false), up(true);

  std::vector<result<int>> got = gather(three, p, &down);
  CHECK(p.calls == 0);
  CHECK(down.calls == 1);
  REQUIRE(got.size() == 3);
  for(auto &r: got) {
    CHECK_FALSE(r.ok);
    CHECK(r.error == "network unreachable");
  }
  got = gather(three, p, &up);
  CHECK(p.calls == 1);
  REQUIRE(got.size() == 3);
  CHECK(got[2].payload == 102);
}

TEST_CASE("fetches never overlap", "[worker]") {
  shared_state<int> state(three.size());
  fake_provider p;
  fake_renderer r;
  captured_output c;
  worker<int> w(state, three, p, r, c.out);
  std::atomic<bool> finished(false);

  p.delay_ms = 2;
  std::thread t([&]() {
    for(int n = 0; n < 20; ++n)
      w.step();
    finished = true;
  });
  while(!finished) {
    state.wake(true, true);
    struct timespec ts = {0, 500 * 1000};
    nanosleep(&ts, NULL);
  }
  t.join();
  CHECK(p.overlaps.load() == 0);
  CHECK(p.calls == 20);
}

TEST_CASE("test mode prints one line per target in order", "[agent]") {
  agent_options options = {5.0, true, {SIGHUP, SIGUSR1}};
  fake_provider p;
  fake_renderer r;
  captured_output c;

  SECTION("every target is rendered with its own index") {
    CHECK(run_agent(options, three, p, r, c.out, nullptr) == 0);
    std::vector<std::string> lines = c.lines();
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "{\"text\":\"value 100 mode 0\",\"class\":\"success\"}");
    CHECK(lines[1] == "{\"text\":\"value 101 mode 1\",\"class\":\"success\"}");
    CHECK(lines[2] == "{\"text\":\"value 102 mode 2\",\"class\":\"success\"}");
    CHECK(p.calls == 1);
  }
  SECTION("no results print nothing") {
    p.echo_targets = false;
    CHECK(run_agent(options, three, p, r, c.out, nullptr) == 0);
    CHECK(c.lines().empty());
  }
  SECTION("failures are rendered in place") {
    fake_check down(false);
    CHECK(run_agent(options, three, p, r, c.out, &down) == 0);
    std::vector<std::string> lines = c.lines();
    REQUIRE(lines.size() == 3);
    for(auto &line: lines)
      CHECK(line
            == "{\"text\":\"" GLYPH_ALERT " network unreachable\","
               "\"class\":\"error\"}");
    CHECK(p.calls == 0);
  }
}
