/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include "walarc/assorted/rich_backtrace.hpp"

#include <execinfo.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "walarc/assorted/assorted_func.hpp"

namespace walarc {
namespace assorted {
namespace {
const int kMaxDepth = 64;

/**
 * Demangles the function part of one line from backtrace_symbols().
 *  Case 1: /foo/hoge/test_dummy(_ZN6walarc5func3Ev+0x9) [0x43e479]
 *  Case 2: /foo/hoge/libwalarc-core.so(+0x3075a5) [0x7f1b6b8b05a5]
 *  Case 3: /lib64/libpthread.so.0() [0x3d1ee0ef90]
 */
std::string demangle_symbol(const std::string& symbol) {
  std::size_t pos = symbol.find("(");
  std::size_t pos2 = symbol.find(")", pos);
  if (pos == std::string::npos || pos2 == std::string::npos || pos2 == pos + 1
    || symbol[pos + 1] == '+') {
    return symbol;
  }
  std::size_t plus = symbol.find("+", pos);
  if (plus == std::string::npos || plus > pos2) {
    return symbol;
  }
  std::string mangled = symbol.substr(pos + 1, plus - pos - 1);
  std::stringstream str;
  str << symbol.substr(0, pos) << " : " << demangle_type_name(mangled.c_str())
    << " +" << symbol.substr(plus + 1, pos2 - plus - 1) << symbol.substr(pos2 + 1);
  return str.str();
}
}  // namespace

std::vector<std::string> get_backtrace() {
  std::vector<std::string> ret;
  void* addresses[kMaxDepth];
  int depth = ::backtrace(addresses, kMaxDepth);
  char** symbols = ::backtrace_symbols(addresses, depth);
  if (symbols == nullptr) {
    return ret;
  }
  for (int i = 1; i < depth; ++i) {  // start from 1 to skip this method
    ret.emplace_back(demangle_symbol(symbols[i]));
  }
  ::free(symbols);
  return ret;
}

}  // namespace assorted
}  // namespace walarc
