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
#ifndef REACTOR_H
#define REACTOR_H

#include "status.h"
#include <csignal>
#include <exception>
#include <pthread.h>
#include <string>
#include <unistd.h>
#include <vector>

/* Synchronization core ---------------------------------------------------- */

/* What the worker has been asked to do */
struct triggers {
  bool fetch;  // gather fresh data
  bool redraw; // render and emit
};

/* One mutex and condition variable guarding the trigger flags and the
 * format index.  shared_state<T> adds the cached results under the same
 * lock. */
class sync_core {
public:
  explicit sync_core(size_t nformats);
  sync_core(const sync_core &) = delete;
  sync_core &operator=(const sync_core &) = delete;
  ~sync_core();

  /* Request work.  A fetch implies a redraw.  Repeated wakes before the
   * worker drains them collapse into a single pending trigger. */
  void wake(bool fetch, bool redraw);

  /* Advance the format index by count and request a redraw */
  void toggle(unsigned count = 1);

  /* Block until there is work, then return and clear the flags */
  triggers wait_and_drain();

  size_t format_index() const;

  size_t formats() const {
    return nformats;
  }

protected:
  friend class core_lock;

  void lock() const;
  void unlock() const;

  // Only call with the lock held
  size_t format_index_locked() const {
    return index;
  }

private:
  mutable pthread_mutex_t mutex;
  pthread_cond_t cond;
  bool needs_fetch;
  bool needs_redraw;
  size_t index;
  const size_t nformats;
};

/* Holds the core lock for its lifetime */
class core_lock {
public:
  explicit core_lock(const sync_core &c_): c(c_) {
    c.lock();
  }
  ~core_lock() {
    c.unlock();
  }

private:
  const sync_core &c;
};

/* Trigger flags plus the most recent result for each target */
template <typename T> class shared_state: public sync_core {
public:
  explicit shared_state(size_t ntargets): sync_core(ntargets) {}

  /* Replace the cache in one step */
  void store(const std::vector<result<T>> &results) {
    core_lock l(*this);
    cached = results;
  }

  /* Copy out the result at the current format index.
   * Returns false if nothing has been fetched yet; mode is set either
   * way. */
  bool selected(result<T> &r, int &mode) const {
    core_lock l(*this);
    mode = (int)format_index_locked();
    if(cached.empty())
      return false;
    r = cached.at(mode);
    return true;
  }

  /* Copy out every cached result; empty if nothing has been fetched yet */
  void snapshot(std::vector<result<T>> &all, int &mode) const {
    core_lock l(*this);
    mode = (int)format_index_locked();
    all = cached;
  }

  bool empty() const {
    core_lock l(*this);
    return cached.empty();
  }

private:
  std::vector<result<T>> cached;
};

/* Collaborators ----------------------------------------------------------- */

/* Gathers data for all targets.  Failures are returned as failed results,
 * never thrown. */
template <typename T> class provider {
public:
  virtual ~provider() {}
  virtual std::vector<result<T>>
  fetch(const std::vector<std::string> &targets) = 0;
};

/* Turns a result into a status line.  Must have no side effects. */
template <typename T> class renderer {
public:
  virtual ~renderer() {}

  status_record render(const result<T> &r, int mode) const {
    if(!r.ok)
      return status_record(std::string(GLYPH_ALERT) + " " + r.error,
                           CLASS_ERROR);
    return render_success(r, mode, nullptr);
  }

  /* Placeholder shown while a fetch is in progress, based on the previous
   * result where there is one */
  status_record loading(const result<T> *stale, int mode) const {
    if(stale && stale->ok) {
      status_record rec = render_success(*stale, mode, GLYPH_TIMER);
      rec.cls = CLASS_LOADING;
      return rec;
    }
    return status_record(std::string(GLYPH_TIMER) + ICON_SPACER + "Gathering "
                             + noun() + "...",
                         CLASS_LOADING, "Gathering " + noun() + "...");
  }

  /* Placeholder shown when a redraw happens before any data exists */
  status_record pending(int attribute((unused)) mode) const {
    return status_record(std::string(GLYPH_TIMER) + ICON_SPACER + "Waiting for "
                             + noun() + "...",
                         CLASS_LOADING, "No " + noun() + " yet");
  }

protected:
  /* What is being gathered, e.g. "disk data" */
  virtual std::string noun() const = 0;

  /* Render a successful result.  If icon is not null it replaces the
   * module's usual icon. */
  virtual status_record render_success(const result<T> &r, int mode,
                                       const char *icon) const = 0;
};

/* A cheap test run before fetching, e.g. for network connectivity */
class availability_check {
public:
  virtual ~availability_check() {}
  virtual bool available() = 0;
  virtual std::string reason() const = 0;
};

/* Signal bridge ----------------------------------------------------------- */

struct signal_config {
  int refresh; // re-fetch and redraw
  int toggle;  // redraw at the next format index
};

/* What arrived since the last collection */
struct pending_signals {
  unsigned refresh;
  unsigned toggle;
  bool terminate;
};

int parse_signal(const std::string &name);
bool signal_usable(int sig);
void signals_install(const signal_config &config);
void signals_reset();
const sigset_t *signals_wait_mask();
pending_signals signals_collect();
void signals_dispatch(sync_core &core, const pending_signals &p);

/* Scheduler --------------------------------------------------------------- */

/* Periodically requests a fetch; also the thread that receives signals */
class scheduler {
public:
  scheduler(sync_core &core_, struct timespec interval_);

  /* Run until a termination signal arrives */
  void run();

  /* Wait for the next tick or signal and act on it.
   * Returns false if termination was requested. */
  bool run_once();

private:
  sync_core &core;
  struct timespec interval;
  struct timespec next; // monotonic time of the next tick
};

/* Worker loop ------------------------------------------------------------- */

/* Run the availability check and the provider, producing exactly one result
 * per target (or none at all) */
template <typename T>
std::vector<result<T>> gather(const std::vector<std::string> &targets,
                              provider<T> &p, availability_check *check) {
  std::vector<result<T>> results;
  if(check && !check->available()) {
    log_info("skipping fetch: %s", check->reason().c_str());
    results.assign(targets.size(), result<T>::failure(check->reason()));
    return results;
  }
  results = p.fetch(targets);
  if(results.empty())
    return results;
  if(results.size() != targets.size())
    log_warning(0, "provider returned %zu results for %zu targets",
                results.size(), targets.size());
  while(results.size() < targets.size())
    results.push_back(
        result<T>::failure(targets[results.size()] + ": no data"));
  results.resize(targets.size());
  return results;
}

/* The single consumer of the shared state */
template <typename T> class worker {
public:
  worker(shared_state<T> &state_, const std::vector<std::string> &targets_,
         provider<T> &fetcher_, const renderer<T> &painter_, emitter &out_,
         availability_check *check_ = nullptr):
      state(state_),
      targets(targets_), fetcher(fetcher_), painter(painter_), out(out_),
      check(check_) {}

  /* Start the worker thread */
  void start() {
    int rc;
    if((rc = pthread_create(&thread, NULL, thread_main, this)))
      fatal(rc, "pthread_create");
  }

  /* Process triggers forever */
  void run() {
    try {
      for(;;)
        step();
    } catch(std::exception &e) {
      fatal(0, "worker: %s", e.what());
    }
  }

  /* Wait for one trigger and process it */
  void step() {
    triggers t = state.wait_and_drain();
    result<T> r;
    int mode;

    log_debug("woken: fetch=%d redraw=%d", t.fetch, t.redraw);
    if(t.fetch) {
      // Keep the bar non-blank while a slow fetch runs.  One placeholder
      // per target; the host shows the last line, so the selected target
      // goes last.
      std::vector<result<T>> stale;
      state.snapshot(stale, mode);
      for(size_t n = 1; n <= targets.size(); ++n) {
        size_t k = (mode + n) % targets.size();
        out.emit(painter.loading(k < stale.size() ? &stale[k] : nullptr,
                                 (int)k));
      }
      std::vector<result<T>> results = gather(targets, fetcher, check);
      if(results.empty()) {
        log_warning(0, "fetch produced no results");
        return;
      }
      state.store(results);
    }
    if(t.redraw) {
      if(state.selected(r, mode))
        out.emit(painter.render(r, mode));
      else
        out.emit(painter.pending(mode));
    }
  }

private:
  static void *thread_main(void *arg) {
    static_cast<worker *>(arg)->run();
    return NULL;
  }

  shared_state<T> &state;
  const std::vector<std::string> targets;
  provider<T> &fetcher;
  const renderer<T> &painter;
  emitter &out;
  availability_check *check;
  pthread_t thread;
};

/* Agent ------------------------------------------------------------------- */

struct agent_options {
  double interval;       // seconds between fetches
  bool test;             // fetch once and exit
  signal_config signals; // refresh and toggle signals
};

/* Run a module: either a single synchronous pass (test mode), or the
 * reactor, which exits the process when a termination signal arrives.
 * Status lines go to out. */
template <typename T>
int run_agent(const agent_options &options,
              const std::vector<std::string> &targets, provider<T> &p,
              const renderer<T> &r, emitter &out, availability_check *check) {
  if(targets.empty())
    fatal(0, "no targets configured");
  if(options.test) {
    std::vector<result<T>> results = gather(targets, p, check);
    for(size_t n = 0; n < results.size(); ++n)
      out.emit(r.render(results[n], (int)n));
    return 0;
  }
  // These live until the process exits; the worker never stops.
  shared_state<T> *state = new shared_state<T>(targets.size());
  worker<T> *w = new worker<T>(*state, targets, p, r, out, check);
  signals_install(options.signals);
  log_info("starting: %zu targets, interval %gs", targets.size(),
           options.interval);
  w->start();
  scheduler sched(*state, seconds_to_timespec(options.interval));
  sched.run();
  log_info("terminating on request");
  // The worker may still be inside a fetch, so static destructors must not
  // run underneath it.  Everything it writes is already flushed per line.
  fflush(NULL);
  _exit(0);
}

#endif /* REACTOR_H */

/*
Local Variables:
mode:c++
c-basic-offset:2
comment-column:40
fill-column:79
indent-tabs-mode:nil
End:
*/
