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

#include <string>
#include <fstream>
#include <sstream>
#include <boost/filesystem.hpp>

#include <common/output.hpp>
#include <common/fsutil.hpp>

namespace b_fs = boost::filesystem;
namespace b_s = boost::system;

using namespace hcfg;
using namespace std;

const size_t hcfg::C_MAX_FILE_SIZE = 16 * 1024 * 1024;

bool
hcfg::read_whole_file(const string& path, string& data, string& why)
{
  b_s::error_code ec;
  b_fs::file_status fs = b_fs::status(path, ec);
  if (ec || !b_fs::exists(fs)) {
    why = "file does not exist";
    return false;
  }
  if (!b_fs::is_regular_file(fs)) {
    why = "not a regular file";
    return false;
  }
  try {
    if (b_fs::file_size(path) > C_MAX_FILE_SIZE) {
      output_internal("read_whole_file [%s] too large\n", path.c_str());
      why = "file too large";
      return false;
    }

    stringbuf sbuf;
    ifstream fin(path.c_str());
    fin >> &sbuf;
    fin.close();
    /* note: an empty file gives (eof() && fail()) so only checking bad()
     *       and eof() (we want the whole file).
     */
    if (fin.bad() || !fin.eof()) {
      why = "read failed";
      return false;
    }
    data = sbuf.str();
  } catch (const b_fs::filesystem_error& e) {
    why = e.what();
    return false;
  }
  return true;
}
