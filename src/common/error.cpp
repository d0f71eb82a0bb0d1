/*
 * Copyright (C) 2011 Vyatta, Inc.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstdio>
#include <cstdarg>
#include <vector>
#include <string>

#include <common/error.hpp>

using namespace std;
using namespace hcfg;

void
Error::set(ErrorKind kind, const char *fmt, ...)
{
  char buf[512];
  va_list alist, acopy;
  va_start(alist, fmt);
  va_copy(acopy, alist);
  int n = vsnprintf(buf, sizeof(buf), fmt, alist);
  va_end(alist);
  _kind = kind;
  if (n < 0) {
    _message.clear();
  } else if (static_cast<size_t>(n) < sizeof(buf)) {
    _message = buf;
  } else {
    // too long for the stack buffer
    vector<char> big(n + 1);
    vsnprintf(&(big[0]), big.size(), fmt, acopy);
    _message.assign(&(big[0]), n);
  }
  va_end(acopy);
}

string
Error::to_string() const
{
  return (string(kindName(_kind)) + ": " + _message);
}

const char *
Error::kindName(ErrorKind kind)
{
  switch (kind) {
  case ERR_NONE:
    return "none";
  case ERR_MALFORMED_HIERARCHY:
    return "malformed hierarchy";
  case ERR_EMPTY_TEXT:
    return "empty text";
  case ERR_INVALID_RULE_PATTERN:
    return "invalid rule pattern";
  case ERR_AMBIGUOUS_IDEMPOTENT_MATCH:
    return "ambiguous idempotent match";
  case ERR_DRIVER_FILE:
    return "driver file";
  case ERR_CONFIG_FILE:
    return "config file";
  }
  return "unknown";
}
