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
#ifndef WALARC_ARCHIVE_ARCHIVE_PATHS_HPP_
#define WALARC_ARCHIVE_ARCHIVE_PATHS_HPP_
#include <iosfwd>
#include <string>

#include "walarc/error_code.hpp"

/**
 * @defgroup ARCHIVE Archiving
 * @brief WAL push, base backup push, and the engine that wires them to storage.
 * @details
 * Objects are laid out like this under a server prefix:
 * @code
 * <server>/wal_005/<segment>.lz4
 * <server>/basebackups_005/<backup>/tar_partitions/part_001.tar.lz4
 * <server>/basebackups_005/<backup>/tar_partitions/pg_control.tar.lz4
 * <server>/basebackups_005/<backup>_backup_stop_sentinel.xml
 * @endcode
 */
namespace walarc {
namespace archive {
/**
 * @brief Parsed form of "<scheme>://<bucket>/<server>".
 * @ingroup ARCHIVE
 */
struct StoragePrefix {
  std::string scheme_;
  std::string bucket_;
  /** May be empty. Never starts or ends with '/'. */
  std::string server_;

  /**
   * @return kErrorCodeConfInvalidPrefix if the scheme or the bucket is missing
   */
  static ErrorCode parse(const std::string& text, StoragePrefix* out);

  friend std::ostream& operator<<(std::ostream& o, const StoragePrefix& v);
};

/**
 * @brief Removes leading '/' and collapses "//" so that the path is a valid object key.
 * @ingroup ARCHIVE
 */
std::string sanitize_path(const std::string& path);

/** @brief "<server>/wal_005/<segment_file_name>.lz4" @ingroup ARCHIVE */
std::string wal_object_path(const std::string& server, const std::string& segment_file_name);

/** @brief "<server>/basebackups_005/<backup>/tar_partitions/" @ingroup ARCHIVE */
std::string partitions_prefix(const std::string& server, const std::string& backup_name);

/** @brief "<server>/basebackups_005/<backup>_backup_stop_sentinel.xml" @ingroup ARCHIVE */
std::string sentinel_object_path(const std::string& server, const std::string& backup_name);

}  // namespace archive
}  // namespace walarc
#endif  // WALARC_ARCHIVE_ARCHIVE_PATHS_HPP_
