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
#ifndef WALARC_FS_PATH_HPP_
#define WALARC_FS_PATH_HPP_
#include <iosfwd>
#include <string>
#include <vector>

#include "walarc/cxx11.hpp"

namespace walarc {
namespace fs {
/**
 * @brief An absolute POSIX path.
 * @ingroup FILESYSTEM
 * @details
 * archive_command passes %p relative to the data directory, so a relative string given to
 * the constructor is resolved against the current directory right away.
 */
class Path {
 public:
  static const char kSeparator = '/';

  Path() {}
  explicit Path(const std::string& s);

  Path& operator/=(const Path& p) { return operator/=(p.pathname_); }
  Path& operator/=(const std::string& s) {
    if (!pathname_.empty() && pathname_[pathname_.size() - 1] != kSeparator) {
      pathname_ += kSeparator;
    }
    pathname_ += s;
    return *this;
  }

  const char*         c_str()  const { return pathname_.c_str(); }
  const std::string&  string() const { return pathname_; }
  bool                empty() const { return pathname_.empty(); }
  bool                root() const { return pathname_.size() == 1 && pathname_[0] == kSeparator; }

  /** Empty path if this has no separator. "/" for "/foo". */
  Path                parent_path() const;
  /** The last component, such as the segment name of a WAL file path. */
  std::string         filename() const;
  /** Direct children sorted by name, excluding "." and "..". Empty unless a directory. */
  std::vector< Path > child_paths() const;
  /**
   * @brief This path relative to base, such as "base/16384/1259" under a data directory.
   * @return false if this is not under base
   */
  bool                relative_to(const Path& base, std::string* out) const;

  friend  std::ostream& operator<<(std::ostream& o, const Path& v);

 private:
  std::string pathname_;
};

inline bool operator==(const Path& lhs, const Path& rhs) { return lhs.string() == rhs.string(); }
inline bool operator!=(const Path& lhs, const Path& rhs) { return lhs.string() != rhs.string(); }
inline bool operator<(const Path& lhs, const Path& rhs) { return lhs.string() < rhs.string(); }

}  // namespace fs
}  // namespace walarc
#endif  // WALARC_FS_PATH_HPP_
