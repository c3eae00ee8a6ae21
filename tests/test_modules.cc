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
#include <catch2/catch.hpp>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

/* A scratch directory, removed with its contents afterwards */
class scratch_dir {
public:
  scratch_dir() {
    char pattern[] = "/tmp/statbar-test.XXXXXX";
    REQUIRE(mkdtemp(pattern));
    path = pattern;
  }
  ~scratch_dir() {
    for(auto it = files.rbegin(); it != files.rend(); ++it)
      unlink(it->c_str());
    for(auto it = dirs.rbegin(); it != dirs.rend(); ++it)
      rmdir(it->c_str());
    rmdir(path.c_str());
  }

  std::string mkdir(const std::string &name) {
    std::string p = path + "/" + name;
    REQUIRE(::mkdir(p.c_str(), 0700) == 0);
    dirs.push_back(p);
    return p;
  }

  std::string write(const std::string &name, const std::string &contents) {
    std::string p = path + "/" + name;
    FILE *fp = fopen(p.c_str(), "w");
    REQUIRE(fp);
    REQUIRE(fwrite(contents.data(), 1, contents.size(), fp)
            == contents.size());
    REQUIRE(fclose(fp) == 0);
    files.push_back(p);
    return p;
  }

  std::string path;

private:
  std::vector<std::string> files, dirs;
};

static const char meminfo[] = "MemTotal:        4194304 kB\n"
                              "MemFree:          524288 kB\n"
                              "MemAvailable:    1048576 kB\n"
                              "Buffers:          131072 kB\n"
                              "Cached:           262144 kB\n"
                              "SwapCached:            0 kB\n"
                              "SwapTotal:             0 kB\n"
                              "SwapFree:              0 kB\n"
                              "HugePages_Total:       0\n";

TEST_CASE("meminfo fields are parsed into bytes", "[memory]") {
  std::map<std::string, uint64_t> fields = parse_meminfo(meminfo);
  CHECK(fields["MemTotal"] == 4194304ULL * 1024);
  CHECK(fields["Cached"] == 262144ULL * 1024);
  CHECK(fields["HugePages_Total"] == 0);
  CHECK(fields.count("Nonsense") == 0);
}

TEST_CASE("memory usage per target", "[memory]") {
  scratch_dir dir;
  memory_provider p(dir.write("meminfo", meminfo));
  std::vector<result<memory_usage>> got = p.fetch({"ram", "swap", "disk"});
  REQUIRE(got.size() == 3);
  REQUIRE(got[0].ok);
  CHECK(got[0].payload.total == 4ULL << 30);
  CHECK(got[0].payload.used == 3ULL << 30);
  CHECK(got[0].payload.pct_used == 75);
  CHECK_FALSE(got[1].ok);
  CHECK(got[1].error == "swap is not configured");
  CHECK_FALSE(got[2].ok);

  memory_renderer r("auto");
  status_record rec = r.render(got[0], 0);
  CHECK(rec.text == GLYPH_MEMORY "  3.00 GiB / 4.00 GiB");
  CHECK(rec.cls == CLASS_WARNING);
  REQUIRE(rec.has_tooltip);
  CHECK(rec.tooltip.compare(0, 7, "Memory\n") == 0);
  CHECK(rec.tooltip.find("Available : 1.00 GiB") != std::string::npos);
  CHECK(rec.tooltip.find("\n\nLast updated ") != std::string::npos);
  CHECK(r.render(got[1], 1)
        == status_record(GLYPH_ALERT " swap is not configured", CLASS_ERROR));
}

TEST_CASE("a missing meminfo fails every target", "[memory]") {
  memory_provider p("/nonexistent/meminfo");
  std::vector<result<memory_usage>> got = p.fetch({"ram", "swap"});
  REQUIRE(got.size() == 2);
  CHECK_FALSE(got[0].ok);
  CHECK(got[0].error.find("/nonexistent/meminfo") == 0);
}

TEST_CASE("proc stat lines are parsed", "[cpu]") {
  std::map<std::string, cpu_times> times = parse_proc_stat(
      "cpu  100 0 50 800 50 0 0 0 0 0\n"
      "cpu0 60 0 30 400 25 0 0 0 0 0\n"
      "intr 12345 0 0\n"
      "ctxt 999\n");
  REQUIRE(times.size() == 2);
  CHECK(times["cpu"].user == 100);
  CHECK(times["cpu"].total() == 1000);
  CHECK(times["cpu0"].iowait == 25);
}

TEST_CASE("cpu usage between two samples", "[cpu]") {
  cpu_times before, after;
  before.user = 100;
  before.system = 50;
  before.idle = 800;
  before.iowait = 50;
  after = before;
  after.user += 30;
  after.system += 20;
  after.idle += 40;
  after.iowait += 10;
  cpu_usage u = cpu_between("cpu", before, after);
  CHECK(u.pct_user == Approx(30));
  CHECK(u.pct_system == Approx(20));
  CHECK(u.pct_iowait == Approx(10));
  CHECK(u.pct_idle == Approx(50));
  CHECK(u.pct_used == Approx(50));

  cpu_usage still = cpu_between("cpu", before, before);
  CHECK(still.pct_used == 0);
  CHECK(still.pct_idle == 100);
}

TEST_CASE("cpu provider reports each target", "[cpu]") {
  scratch_dir dir;
  cpu_provider p(dir.write("stat", "cpu  100 0 50 800 50 0 0 0\n"
                                   "cpu0 100 0 50 800 50 0 0 0\n"),
                 0);
  std::vector<result<cpu_usage>> got = p.fetch({"cpu", "cpu0", "cpu9"});
  REQUIRE(got.size() == 3);
  REQUIRE(got[0].ok);
  CHECK(got[0].payload.pct_used == 0);
  CHECK(got[1].ok);
  CHECK_FALSE(got[2].ok);
  CHECK(got[2].error == "cpu9 doesn't exist");
}

TEST_CASE("cpu classes follow utilisation", "[cpu]") {
  cpu_renderer r;
  cpu_usage u;
  u.name = "cpu";
  u.pct_used = 95;
  CHECK(r.render(result<cpu_usage>::success(u), 0).cls == CLASS_CRITICAL);
  u.pct_used = 75;
  CHECK(r.render(result<cpu_usage>::success(u), 0).cls == CLASS_WARNING);
  u.pct_used = 10;
  u.pct_user = 6;
  u.pct_system = 4;
  u.pct_idle = 90;
  status_record rec = r.render(result<cpu_usage>::success(u), 0);
  CHECK(rec.cls == CLASS_SUCCESS);
  CHECK(rec.text == GLYPH_CPU "  user 6.00%, sys 4.00%, idle 90.00%");
  u.name = "cpu3";
  CHECK(r.render(result<cpu_usage>::success(u), 0).text
        == GLYPH_CPU "  cpu3 user 6.00%, sys 4.00%, idle 90.00%");
}

static const char net_dev[] =
    "Inter-|   Receive                            "
    "                    |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes"
    "    packets errs drop fifo colls carrier compressed\n"
    "    lo:    1000      10    0    0    0     0          0         0"
    "     1000      10    0    0    0     0       0          0\n"
    "  eth0: 5000000    4000    0    0    0     0          0        12"
    "   250000    2000    0    0    0     0       0          0\n";

TEST_CASE("net dev counters are parsed", "[network]") {
  std::map<std::string, net_counters> counters = parse_net_dev(net_dev);
  REQUIRE(counters.size() == 2);
  CHECK(counters["lo"].rx_bytes == 1000);
  CHECK(counters["eth0"].rx_bytes == 5000000);
  CHECK(counters["eth0"].tx_bytes == 250000);
}

TEST_CASE("network provider checks interfaces", "[network]") {
  scratch_dir dir;
  dir.mkdir("net");
  dir.mkdir("net/eth0");
  dir.write("net/eth0/carrier", "1\n");
  dir.mkdir("net/lo");
  dir.write("net/lo/carrier", "0\n");
  network_provider p(dir.path + "/net", dir.write("dev", net_dev), 0);
  std::vector<result<net_usage>> got = p.fetch({"eth0", "lo", "wlan9"});
  REQUIRE(got.size() == 3);
  REQUIRE(got[0].ok);
  CHECK(got[0].payload.connected);
  CHECK_FALSE(got[0].payload.wireless);
  CHECK(got[0].payload.rx_bytes == 5000000);
  CHECK(got[0].payload.rx_rate == 0);
  REQUIRE(got[1].ok);
  CHECK_FALSE(got[1].payload.connected);
  CHECK_FALSE(got[2].ok);
  CHECK(got[2].error == "wlan9 doesn't exist");
}

TEST_CASE("network rendering depends on the carrier", "[network]") {
  network_renderer r;
  net_usage u;
  u.interface = "eth0";
  u.connected = true;
  u.rx_rate = 1536;
  status_record rec = r.render(result<net_usage>::success(u), 0);
  CHECK(rec.text
        == GLYPH_NETWORK "  eth0 " GLYPH_ARROW_DOWN "1.50 KiB/s " GLYPH_ARROW_UP
                         "0.00 B/s");
  CHECK(rec.cls == CLASS_SUCCESS);
  CHECK(rec.tooltip.find("Carrier     : up") != std::string::npos);

  u.connected = false;
  u.wireless = true;
  rec = r.render(result<net_usage>::success(u), 0);
  CHECK(rec.text == GLYPH_WIFI_OFF "  eth0 disconnected");
  CHECK(rec.cls == CLASS_WARNING);
}

TEST_CASE("filesystem provider finds mountpoints", "[filesystem]") {
  scratch_dir dir;
  filesystem_provider p(dir.write("mounts",
                                  "/dev/root / ext4 rw,relatime 0 0\n"
                                  "tmpfs /statbar-gone tmpfs rw 0 0\n"));
  std::vector<result<fs_usage>> got =
      p.fetch({"/", "/nowhere", "/statbar-gone"});
  REQUIRE(got.size() == 3);
  REQUIRE(got[0].ok);
  CHECK(got[0].payload.device == "/dev/root");
  CHECK(got[0].payload.fstype == "ext4");
  CHECK(got[0].payload.total >= got[0].payload.used);
  CHECK(got[0].payload.pct_used >= 0);
  CHECK(got[0].payload.pct_used <= 100);
  CHECK_FALSE(got[1].ok);
  CHECK(got[1].error == "/nowhere doesn't exist");
  CHECK_FALSE(got[2].ok);
  CHECK(got[2].error.find("/statbar-gone: ") == 0);
}

TEST_CASE("filesystem rendering", "[filesystem]") {
  fs_usage fs;
  fs.mountpoint = "/home";
  fs.device = "/dev/sda2";
  fs.fstype = "xfs";
  fs.options = "rw";
  fs.total = 100ULL << 30;
  fs.used = 90ULL << 30;
  fs.pct_used = 90;
  filesystem_renderer r("Gi");
  result<fs_usage> res = result<fs_usage>::success(fs, {0, 0});
  status_record rec = r.render(res, 0);
  CHECK(rec.text == GLYPH_HARDDISK "  /home 90.00 GiB / 100.00 GiB");
  CHECK(rec.cls == CLASS_CRITICAL);
  std::string head = "Filesystem : /dev/sda2\n"
                     "Mountpoint : /home\n"
                     "Type       : xfs\n";
  CHECK(rec.tooltip.compare(0, head.size(), head) == 0);
  CHECK(rec.tooltip.find("Options    : rw\n\nLast updated ")
        != std::string::npos);
  // Loading swaps the icon and class but keeps the data
  status_record loading = r.loading(&res, 0);
  CHECK(loading.text == GLYPH_TIMER "  /home 90.00 GiB / 100.00 GiB");
  CHECK(loading.cls == CLASS_LOADING);
  CHECK(loading.tooltip == rec.tooltip);
}

TEST_CASE("module table", "[modules]") {
  const module *m = find_module("memory");
  REQUIRE(m);
  CHECK(std::string(m->default_target) == "ram");
  CHECK(m->valid_target("swap"));
  CHECK_FALSE(m->valid_target("disk"));
  CHECK_FALSE(find_module("weather"));
  REQUIRE((m = find_module("cpu")));
  CHECK(m->valid_target("cpu"));
  CHECK(m->valid_target("cpu12"));
  CHECK_FALSE(m->valid_target("cpux"));
  REQUIRE((m = find_module("filesystem")));
  CHECK(m->default_target == NULL);
  CHECK(m->valid_target("/"));
  CHECK_FALSE(m->valid_target("home"));
  REQUIRE((m = find_module("network")));
  CHECK_FALSE(m->valid_target("../etc"));
  REQUIRE((m = find_module("command")));
  CHECK_FALSE(m->valid_target("  "));
}
