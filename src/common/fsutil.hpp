/*
 * Copyright (C) 2010 Vyatta, Inc.
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

#ifndef _HCFG_FSUTIL_HPP_
#define _HCFG_FSUTIL_HPP_
#include <string>

namespace hcfg { // begin namespace hcfg

// limit for files read in one piece (configs, drivers, tag rules)
extern const size_t C_MAX_FILE_SIZE;

/* read the whole file into data. the file must exist, be a regular file,
 * and be smaller than C_MAX_FILE_SIZE. on failure "why" says what went
 * wrong.
 */
bool read_whole_file(const std::string& path, std::string& data,
                     std::string& why);

} // end namespace hcfg

#endif /* _HCFG_FSUTIL_HPP_ */
