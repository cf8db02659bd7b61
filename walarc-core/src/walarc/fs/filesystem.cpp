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
#include "walarc/fs/filesystem.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include "walarc/fs/path.hpp"

namespace walarc {
namespace fs {
namespace {
FileStatus to_status(int ret, const struct stat& st) {
  FileStatus s;
  if (ret != 0) {
    // a missing file is an answer, not an error
    s.type_ = (errno == ENOENT || errno == ENOTDIR) ? FileStatus::kNotFound : FileStatus::kError;
    return s;
  }
  if (S_ISDIR(st.st_mode)) {
    s.type_ = FileStatus::kDirectory;
  } else if (S_ISREG(st.st_mode)) {
    s.type_ = FileStatus::kRegular;
  } else if (S_ISLNK(st.st_mode)) {
    s.type_ = FileStatus::kSymlink;
  } else {
    s.type_ = FileStatus::kOther;
  }
  s.mode_ = static_cast<uint32_t>(st.st_mode & 07777);
  s.size_ = static_cast<uint64_t>(st.st_size);
  s.mtime_ = static_cast<uint64_t>(st.st_mtime);
  return s;
}

/** fsync on an fd opened read-only, which works for folders too. */
bool fsync_descriptor_of(const Path& path) {
  int descriptor = ::open(path.c_str(), O_RDONLY);
  if (descriptor < 0) {
    return false;
  }
  int ret = ::fsync(descriptor);
  ::close(descriptor);
  return ret == 0;
}
}  // namespace

FileStatus status(const Path& p) {
  struct stat st;
  return to_status(::stat(p.c_str(), &st), st);
}

FileStatus symlink_status(const Path& p) {
  struct stat st;
  return to_status(::lstat(p.c_str(), &st), st);
}

Path current_path() {
  std::vector<char> buffer(256);
  while (::getcwd(&buffer[0], buffer.size()) == nullptr) {
    if (errno != ERANGE) {
      return Path();
    }
    buffer.resize(buffer.size() * 2);
  }
  return Path(std::string(&buffer[0]));
}

bool create_directories(const Path& p, bool sync) {
  if (is_directory(p) || create_directory(p, sync)) {
    return true;
  }
  Path parent = p.parent_path();
  if (parent.empty() || !create_directories(parent, sync)) {
    return false;
  }
  // another thread may create it between the two attempts
  return create_directory(p, sync) || is_directory(p);
}

bool create_directory(const Path& p, bool sync) {
  if (::mkdir(p.c_str(), S_IRWXU) != 0) {
    return false;
  }
  return !sync || fsync(p, true);
}

bool remove(const Path& p) {
  FileStatus s = symlink_status(p);
  if (!s.exists()) {
    return false;
  }
  return (s.is_directory() ? ::rmdir(p.c_str()) : ::unlink(p.c_str())) == 0;
}

uint64_t remove_all(const Path& p) {
  uint64_t count = 1;
  if (symlink_status(p).is_directory()) {
    std::vector< Path > children = p.child_paths();
    for (const Path& child : children) {
      count += remove_all(child);
    }
  }
  remove(p);
  return count;
}

std::string unique_name(const std::string& model, uint64_t differentiator) {
  const char* kHexChars = "0123456789abcdef";
  uint64_t seed64 = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  seed64 += ::getpid();
  seed64 ^= differentiator * 0x9E3779B97F4A7C15ULL;
  uint32_t seed32 = static_cast<uint32_t>((seed64 >> 32) ^ seed64);
  std::string s(model);
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%') {
      seed32 = ::rand_r(&seed32);
      s[i] = kHexChars[seed32 & 0xF];
    }
  }
  return s;
}

bool atomic_rename(const Path& old_path, const Path& new_path) {
  return ::rename(old_path.c_str(), new_path.c_str()) == 0;
}

bool fsync(const Path& path, bool sync_parent_directory) {
  if (!fsync_descriptor_of(path)) {
    return false;
  }
  return !sync_parent_directory || fsync_descriptor_of(path.parent_path());
}

bool durable_atomic_rename(const Path& old_path, const Path& new_path) {
  return fsync(old_path, false)
    && atomic_rename(old_path, new_path)
    && fsync(new_path.parent_path(), false);
}

}  // namespace fs
}  // namespace walarc
