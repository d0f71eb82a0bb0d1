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

#ifndef _HCFG_OUTPUT_HPP_
#define _HCFG_OUTPUT_HPP_
#include <cstdio>
#include <cstdarg>
#include <string>

namespace hcfg { // begin namespace hcfg

// environment
extern const std::string C_ENV_LOGFILE;
extern const std::string C_ENV_DEBUG;
extern const std::string C_ENV_DRIVER;
extern const std::string C_ENV_PLATFORM;

extern const std::string C_LOGFILE_DEFAULT;

/* get the value of an environment variable, or "def" if it is not set or
 * is empty.
 */
std::string get_env(const std::string& name, const std::string& def = "");

/* output streams for "user" output. NULL (the default) means stdout and
 * stderr, respectively.
 */
void set_output_streams(FILE *out, FILE *err);

void output_user(const char *fmt, ...)
  __attribute__((format(__printf__,1,2)));
void output_user_err(const char *fmt, ...)
  __attribute__((format(__printf__,1,2)));

// append to the internal log file (see C_ENV_LOGFILE)
void output_internal(const char *fmt, ...)
  __attribute__((format(__printf__,1,2)));

void voutput_user(FILE *out, FILE *dout, const char *fmt, va_list alist);
void voutput_internal(const char *fmt, va_list alist);

// whether debug tracing has been requested through C_ENV_DEBUG
bool debug_enabled();

} // end namespace hcfg

#endif /* _HCFG_OUTPUT_HPP_ */
