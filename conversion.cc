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
#include "statbar.h"
#include <cmath>
#include <cstring>

/* Decimal and binary prefixes, indexed by power */
static const char *const decimal_prefixes[] = {"",  "K", "M", "G", "T",
                                               "P", "E", "Z", "Y"};
static const char *const binary_prefixes[] = {"",   "Ki", "Mi", "Gi", "Ti",
                                              "Pi", "Ei", "Zi", "Yi"};
static const int max_power = 8;

/* Return the power for an explicit unit, or -1 */
static int unit_power(const std::string &unit) {
  for(int n = 1; n <= max_power; ++n)
    if(unit == decimal_prefixes[n] || unit == binary_prefixes[n])
      return n;
  return -1;
}

bool valid_unit(const std::string &unit) {
  return unit == "auto" || unit_power(unit) > 0;
}

std::string pad_float(double number) {
  char buffer[64];
  snprintf(buffer, sizeof buffer, "%.2f", number);
  return buffer;
}

std::string byte_converter(double number, const std::string &unit) {
  if(unit.empty() || unit == "auto") {
    for(int n = 0; n <= max_power; ++n) {
      if(fabs(number) < 1024.0 || n == max_power)
        return pad_float(number) + " " + binary_prefixes[n] + "B";
      number /= 1024;
    }
  }
  int power = unit_power(unit);
  if(power < 0)
    return pad_float(number) + " B";
  double divisor = (unit.size() == 2 && unit[1] == 'i') ? 1024 : 1000;
  double value = number / pow(divisor, power);
  return pad_float(value) + " " + unit + "B";
}

/* Format a data rate, e.g. 1.50 MiB/s */
std::string process_bytes(double rate) {
  for(int n = 0; n < max_power; ++n) {
    if(fabs(rate) < 1024.0)
      return pad_float(rate) + " " + binary_prefixes[n] + "B/s";
    rate /= 1024;
  }
  return pad_float(rate) + " YiB/s";
}

std::string float_to_pct(double number) {
  return pad_float(number) + "%";
}
