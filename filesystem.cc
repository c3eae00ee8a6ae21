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
#include <cstring>
#include <mntent.h>
#include <sys/statvfs.h>

/* Find mount table entries for each target.  Later entries shadow earlier
 * ones, as with stacked mounts. */
static bool read_mounts(const std::string &path,
                        const std::vector<std::string> &targets,
                        std::vector<fs_usage> &found, std::string &error) {
  struct mntent entry, *m;
  char buffer[4096];
  FILE *fp;

  found.assign(targets.size(), fs_usage());
  if(!(fp = setmntent(path.c_str(), "r"))) {
    error = path + ": " + strerror(errno);
    return false;
  }
  while((m = getmntent_r(fp, &entry, buffer, sizeof buffer))) {
    for(size_t n = 0; n < targets.size(); ++n) {
      if(targets[n] != m->mnt_dir)
        continue;
      found[n].mountpoint = m->mnt_dir;
      found[n].device = m->mnt_fsname;
      found[n].fstype = m->mnt_type;
      found[n].options = m->mnt_opts;
    }
  }
  endmntent(fp);
  return true;
}

/* Fill in the sizes the way df(1) does */
static bool measure(fs_usage &fs, std::string &error) {
  struct statvfs sv;
  if(statvfs(fs.mountpoint.c_str(), &sv) < 0) {
    error = fs.mountpoint + ": " + strerror(errno);
    return false;
  }
  uint64_t frsize = sv.f_frsize ? sv.f_frsize : sv.f_bsize;
  fs.total = (uint64_t)sv.f_blocks * frsize;
  fs.free = (uint64_t)sv.f_bfree * frsize;
  fs.avail = (uint64_t)sv.f_bavail * frsize;
  fs.used = fs.total - fs.free;
  uint64_t usable = fs.used + fs.avail;
  if(usable)
    fs.pct_used = (int)((fs.used * 100 + usable - 1) / usable);
  else
    fs.pct_used = 0;
  return true;
}

std::vector<result<fs_usage>>
filesystem_provider::fetch(const std::vector<std::string> &targets) {
  std::vector<result<fs_usage>> results;
  std::vector<fs_usage> found;
  std::string error;

  if(!read_mounts(mounts, targets, found, error)) {
    log_warning(0, "%s", error.c_str());
    results.assign(targets.size(), result<fs_usage>::failure(error));
    return results;
  }
  for(size_t n = 0; n < targets.size(); ++n) {
    if(found[n].mountpoint.empty()) {
      results.push_back(
          result<fs_usage>::failure(targets[n] + " doesn't exist"));
      continue;
    }
    if(!measure(found[n], error)) {
      log_warning(0, "%s", error.c_str());
      results.push_back(result<fs_usage>::failure(error));
      continue;
    }
    log_debug("%s: %d%% used", targets[n].c_str(), found[n].pct_used);
    results.push_back(result<fs_usage>::success(found[n]));
  }
  return results;
}

status_record
filesystem_renderer::render_success(const result<fs_usage> &r,
                                    int attribute((unused)) mode,
                                    const char *icon) const {
  const fs_usage &fs = r.payload;
  table_rows rows;

  rows.push_back({"Filesystem", fs.device});
  rows.push_back({"Mountpoint", fs.mountpoint});
  rows.push_back({"Type", fs.fstype});
  rows.push_back({"Options", fs.options});
  return status_record(std::string(icon ? icon : GLYPH_HARDDISK)
                           + ICON_SPACER + fs.mountpoint + " "
                           + byte_converter(fs.used, unit) + " / "
                           + byte_converter(fs.total, unit),
                       free_class(100 - fs.pct_used),
                       with_timestamp(format_table(rows), r.updated_at));
}
