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
#include "walarc/fs/path.hpp"

#include <dirent.h>

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

#include "walarc/fs/filesystem.hpp"

namespace walarc {
namespace fs {
Path::Path(const std::string& s) {
  if (s.empty() || s[0] == kSeparator) {
    pathname_ = s;
  } else {
    Path absolute = current_path();
    absolute /= s;
    pathname_ = absolute.pathname_;
  }
}

std::string Path::filename() const {
  std::size_t pos = pathname_.rfind(kSeparator);
  return pos == std::string::npos ? pathname_ : pathname_.substr(pos + 1);
}

Path Path::parent_path() const {
  Path ret;
  std::size_t pos = pathname_.rfind(kSeparator);
  if (pos != std::string::npos) {
    ret.pathname_ = pos == 0 ? std::string(1, kSeparator) : pathname_.substr(0, pos);
  }
  return ret;
}

std::vector< Path > Path::child_paths() const {
  std::vector< Path > children;
  DIR* dir = ::opendir(c_str());
  if (dir == nullptr) {
    return children;
  }
  for (dirent* e = ::readdir(dir); e != nullptr; e = ::readdir(dir)) {
    const std::string name(e->d_name);
    if (name == "." || name == "..") {
      continue;
    }
    Path child(*this);
    child /= name;
    children.push_back(child);
  }
  ::closedir(dir);
  std::sort(children.begin(), children.end());
  return children;
}

bool Path::relative_to(const Path& base, std::string* out) const {
  std::string prefix = base.pathname_;
  if (prefix.empty() || prefix[prefix.size() - 1] != kSeparator) {
    prefix += kSeparator;
  }
  if (pathname_.size() <= prefix.size() || pathname_.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  *out = pathname_.substr(prefix.size());
  return true;
}

std::ostream& operator<<(std::ostream& o, const Path& v) {
  o << v.string();
  return o;
}

}  // namespace fs
}  // namespace walarc
