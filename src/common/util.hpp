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

#ifndef _HCFG_UTIL_HPP_
#define _HCFG_UTIL_HPP_
#include <string>
#include <unordered_map>

namespace hcfg { // begin namespace hcfg

template<class K, class V, class H = std::hash<K> >
  class MapT : public std::unordered_map<K, V, H> {};

inline bool
str_startswith(const std::string& s, const std::string& pfx)
{
  return (s.size() >= pfx.size() && s.compare(0, pfx.size(), pfx) == 0);
}

inline bool
str_endswith(const std::string& s, const std::string& sfx)
{
  return (s.size() >= sfx.size()
          && s.compare(s.size() - sfx.size(), sfx.size(), sfx) == 0);
}

// strip leading and trailing whitespace
inline std::string
str_strip(const std::string& s)
{
  static const char *ws = " \t\r\n\v\f";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) {
    return "";
  }
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

} // end namespace hcfg

#endif /* _HCFG_UTIL_HPP_ */
