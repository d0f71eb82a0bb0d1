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

#ifndef _HCFG_ERROR_HPP_
#define _HCFG_ERROR_HPP_
#include <string>

namespace hcfg { // begin namespace hcfg

enum ErrorKind {
  ERR_NONE,
  ERR_MALFORMED_HIERARCHY,
  ERR_EMPTY_TEXT,
  ERR_INVALID_RULE_PATTERN,
  ERR_AMBIGUOUS_IDEMPOTENT_MATCH,
  ERR_DRIVER_FILE,
  ERR_CONFIG_FILE
};

/* error record filled in by functions that can fail on malformed input.
 * such functions return NULL or false and describe the problem here.
 */
class Error {
public:
  Error() : _kind(ERR_NONE) {}
  Error(ErrorKind kind, const std::string& msg)
    : _kind(kind), _message(msg) {}

  void set(ErrorKind kind, const char *fmt, ...)
    __attribute__((format(__printf__,3,4)));
  void clear() {
    _kind = ERR_NONE;
    _message.clear();
  }

  bool isSet() const { return (_kind != ERR_NONE); }
  ErrorKind getKind() const { return _kind; }
  const std::string& getMessage() const { return _message; }
  std::string to_string() const;

  static const char *kindName(ErrorKind kind);

private:
  ErrorKind _kind;
  std::string _message;
};

} // end namespace hcfg

#endif /* _HCFG_ERROR_HPP_ */
