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
#include <cstdlib>
#include <cstdarg>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>

#include <common/output.hpp>

using namespace std;

////// constants
const string hcfg::C_ENV_LOGFILE = "HCFG_LOGFILE";
const string hcfg::C_ENV_DEBUG = "HCFG_DEBUG";
const string hcfg::C_ENV_DRIVER = "HCFG_DRIVER";
const string hcfg::C_ENV_PLATFORM = "HCFG_PLATFORM";

const string hcfg::C_LOGFILE_DEFAULT = "/tmp/hcfg-internal.log";

static FILE *out_stream = NULL;
static FILE *err_stream = NULL;

string
hcfg::get_env(const string& name, const string& def)
{
  const char *val = getenv(name.c_str());
  if (!val || !val[0]) {
    return def;
  }
  return val;
}

void
hcfg::set_output_streams(FILE *out, FILE *err)
{
  out_stream = out;
  err_stream = err;
}

void
hcfg::output_user(const char *fmt, ...)
{
  va_list alist;
  va_start(alist, fmt);
  voutput_user(out_stream, stdout, fmt, alist);
  va_end(alist);
}

void
hcfg::output_user_err(const char *fmt, ...)
{
  va_list alist;
  va_start(alist, fmt);
  voutput_user(err_stream, stderr, fmt, alist);
  va_end(alist);
}

void
hcfg::output_internal(const char *fmt, ...)
{
  va_list alist;
  va_start(alist, fmt);
  voutput_internal(fmt, alist);
  va_end(alist);
}

void
hcfg::voutput_user(FILE *out, FILE *dout, const char *fmt, va_list alist)
{
  if (out) {
    vfprintf(out, fmt, alist);
  } else if (dout) {
    vfprintf(dout, fmt, alist);
  } else {
    vprintf(fmt, alist);
  }
}

void
hcfg::voutput_internal(const char *fmt, va_list alist)
{
  string logfile = get_env(C_ENV_LOGFILE, C_LOGFILE_DEFAULT);
  int fdout = -1;
  FILE *fout = NULL;
  do {
    if ((fdout = open(logfile.c_str(), O_WRONLY | O_CREAT, 0660)) == -1) {
      break;
    }
    if (lseek(fdout, 0, SEEK_END) == ((off_t) -1)) {
      break;
    }
    if ((fout = fdopen(fdout, "a")) == NULL) {
      break;
    }
    vfprintf(fout, fmt, alist);
  } while (0);
  if (fout) {
    fclose(fout);
    // fdout is implicitly closed
  } else if (fdout >= 0) {
    close(fdout);
  }
}

bool
hcfg::debug_enabled()
{
  string v = get_env(C_ENV_DEBUG);
  return (v != "" && v != "0");
}
