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
#include "reactor.h"

// Both flags start set, forcing an initial fetch and render.
sync_core::sync_core(size_t nformats_):
    needs_fetch(true), needs_redraw(true), index(0), nformats(nformats_) {
  int rc;
  if(!nformats)
    fatal(0, "no targets configured");
  if((rc = pthread_mutex_init(&mutex, NULL)))
    fatal(rc, "pthread_mutex_init");
  if((rc = pthread_cond_init(&cond, NULL)))
    fatal(rc, "pthread_cond_init");
}

sync_core::~sync_core() {
  pthread_cond_destroy(&cond);
  pthread_mutex_destroy(&mutex);
}

void sync_core::lock() const {
  int rc;
  if((rc = pthread_mutex_lock(&mutex)))
    fatal(rc, "pthread_mutex_lock");
}

void sync_core::unlock() const {
  int rc;
  if((rc = pthread_mutex_unlock(&mutex)))
    fatal(rc, "pthread_mutex_unlock");
}

void sync_core::wake(bool fetch, bool redraw) {
  int rc;
  core_lock l(*this);
  needs_fetch |= fetch;
  // Fresh data is always rendered
  needs_redraw |= redraw || fetch;
  if((rc = pthread_cond_signal(&cond)))
    fatal(rc, "pthread_cond_signal");
}

void sync_core::toggle(unsigned count) {
  int rc;
  core_lock l(*this);
  index = (index + count) % nformats;
  needs_redraw = true;
  if((rc = pthread_cond_signal(&cond)))
    fatal(rc, "pthread_cond_signal");
}

triggers sync_core::wait_and_drain() {
  int rc;
  triggers t;
  core_lock l(*this);
  // Wakeups can be spurious, so re-check every time
  while(!(needs_fetch || needs_redraw))
    if((rc = pthread_cond_wait(&cond, &mutex)))
      fatal(rc, "pthread_cond_wait");
  t.fetch = needs_fetch;
  t.redraw = needs_redraw;
  needs_fetch = false;
  needs_redraw = false;
  return t;
}

size_t sync_core::format_index() const {
  core_lock l(*this);
  return index;
}
