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
#ifndef WALARC_FS_FILESYSTEM_HPP_
#define WALARC_FS_FILESYSTEM_HPP_
#include <stdint.h>

#include <string>

#include "walarc/fs/fwd.hpp"
#include "walarc/fs/path.hpp"

/**
 * @defgroup FILESYSTEM Filesystem wrapper
 * @ingroup IDIOMS
 * @brief The POSIX calls the archiver needs on the database host.
 * @details
 * Walking the data directory, scanning archive_status, and renaming .ready markers and
 * uploaded objects durably. Functions here report failures by their return value and
 * leave errno set, so that callers can pick the ErrorCode that fits.
 */
namespace walarc {
namespace fs {

/**
 * @brief What one stat() or lstat() told about a file.
 * @ingroup FILESYSTEM
 * @details
 * A tar header needs the type, mode, size and mtime of the same moment, so they come together.
 */
struct FileStatus {
  enum Type {
    /** stat() failed for a reason other than a missing file. errno tells why. */
    kError = 0,
    kNotFound,
    kRegular,
    kDirectory,
    kSymlink,
    /** fifo, socket or device. */
    kOther,
  };
  FileStatus() : type_(kError), mode_(0), size_(0), mtime_(0) {}

  bool known() const            { return type_ != kError; }
  bool exists() const           { return type_ != kError && type_ != kNotFound; }
  bool is_regular_file() const  { return type_ == kRegular; }
  bool is_directory() const     { return type_ == kDirectory; }
  bool is_symlink() const       { return type_ == kSymlink; }

  Type      type_;
  /** Permission bits, such as 0600. */
  uint32_t  mode_;
  /** Bytes. Meaningful only for a regular file. */
  uint64_t  size_;
  /** Seconds since epoch. */
  uint64_t  mtime_;
};

/** Follows symlinks. @ingroup FILESYSTEM */
FileStatus  status(const Path& p);
/** Describes a symlink itself rather than its target. @ingroup FILESYSTEM */
FileStatus  symlink_status(const Path& p);

inline bool exists(const Path& p) { return status(p).exists(); }
inline bool is_directory(const Path& p) { return status(p).is_directory(); }
inline bool is_regular_file(const Path& p) { return status(p).is_regular_file(); }
/** uint64_t(-1) unless a regular file. */
inline uint64_t file_size(const Path& p) {
  FileStatus s = status(p);
  return s.is_regular_file() ? s.size_ : static_cast<uint64_t>(-1);
}
/** 0 if the file does not exist. */
inline uint32_t file_mode(const Path& p) { return status(p).mode_; }

/** @ingroup FILESYSTEM */
Path        current_path();

/**
 * @brief mkdir -p with mode 0700.
 * @ingroup FILESYSTEM
 * @param[in] sync whether to fsync each created folder and its parent
 * @return whether the folder exists now
 */
bool        create_directories(const Path& p, bool sync = false);
/**
 * mkdir with mode 0700.
 * @ingroup FILESYSTEM
 * @return false if it already exists. Storage clients use this to claim a unique name.
 */
bool        create_directory(const Path& p, bool sync = false);
/** Removes a file, a symlink or an empty folder. @ingroup FILESYSTEM */
bool        remove(const Path& p);
/**
 * rm -rf. Does not follow symlinks.
 * @ingroup FILESYSTEM
 * @return number of entries visited, including p itself
 */
uint64_t    remove_all(const Path& p);
/**
 * Replaces each % in model with a random hex digit.
 * @ingroup FILESYSTEM
 * @param[in] differentiator give different values from threads calling this concurrently
 */
std::string unique_name(const std::string& model, uint64_t differentiator = 0);

/**
 * fsync() on the file or folder, and optionally on its parent folder.
 * @ingroup FILESYSTEM
 */
bool        fsync(const Path& path, bool sync_parent_directory = false);
/**
 * rename(2). Replaces new_path if it exists.
 * @ingroup FILESYSTEM
 */
bool        atomic_rename(const Path& old_path, const Path& new_path);
/**
 * @brief fsync() the file, rename it, then fsync() the folder.
 * @ingroup FILESYSTEM
 * @details
 * After this returns true, a crash leaves new_path with the new content.
 * Both paths must be in the same folder.
 */
bool        durable_atomic_rename(const Path& old_path, const Path& new_path);

}  // namespace fs
}  // namespace walarc
#endif  // WALARC_FS_FILESYSTEM_HPP_
