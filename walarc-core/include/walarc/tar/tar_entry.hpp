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
#ifndef WALARC_TAR_TAR_ENTRY_HPP_
#define WALARC_TAR_TAR_ENTRY_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "walarc/error_code.hpp"

/**
 * @defgroup TAR Tar Archives
 * @brief Streaming ustar archives and the bounded queue of tar parts that makes a base backup.
 */
namespace walarc {
namespace tar {
/**
 * @brief Size of a header block and the unit of padding in ustar.
 * @ingroup TAR
 */
const uint32_t kTarBlockSize = 512;

/**
 * @brief Type of an entry. Values are the typeflag byte of ustar.
 * @ingroup TAR
 */
enum TarEntryType {
  kTarRegularFile = '0',
  kTarSymlink = '2',
  kTarDirectory = '5',
};

/**
 * @brief Metadata of one entry in a tar archive.
 * @ingroup TAR
 * This is a POD-like struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct TarEntry {
  TarEntry() : type_(kTarRegularFile), mode_(0644), size_(0), mtime_(0) {}

  /** Path inside the archive. Up to 255 bytes. Directories end with '/'. */
  std::string   name_;
  TarEntryType  type_;
  /** Permission bits only. */
  uint32_t      mode_;
  /** Bytes of body. Always 0 unless a regular file. */
  uint64_t      size_;
  /** Seconds since epoch. */
  uint64_t      mtime_;
  /** Target of a symlink. */
  std::string   link_name_;

  /**
   * @brief Serializes into a ustar header block.
   * @param[out] block kTarBlockSize bytes
   * @return kErrorCodeTarNameTooLong if the name does not fit in the name and prefix fields
   */
  ErrorCode     encode(char* block) const;
  /**
   * @brief Parses a ustar header block.
   * @return kErrorCodeTarCorrupted on a bad checksum or malformed number
   */
  ErrorCode     decode(const char* block);

  friend std::ostream& operator<<(std::ostream& o, const TarEntry& v);
};

/**
 * @brief Bytes of padding after a body of the given size.
 * @ingroup TAR
 */
inline uint64_t tar_padding(uint64_t size) {
  return (kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize;
}

}  // namespace tar
}  // namespace walarc
#endif  // WALARC_TAR_TAR_ENTRY_HPP_
