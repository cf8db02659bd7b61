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
#ifndef WALARC_ARCHIVE_BACKUP_SENTINEL_HPP_
#define WALARC_ARCHIVE_BACKUP_SENTINEL_HPP_
#include <stdint.h>

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/externalize/externalizable.hpp"

namespace walarc {
namespace archive {
/**
 * @brief Metadata object written last, after every part of a base backup is stored.
 * @ingroup ARCHIVE
 * @details
 * A backup without its sentinel is incomplete and must be ignored by whoever restores.
 * This is a POD-like struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct BackupSentinel CXX11_FINAL : public virtual externalize::Externalizable {
  BackupSentinel();

  std::string backup_name_;
  /** LSN reported when the backup stopped, in "<hex>/<hex>" form. */
  std::string finish_lsn_;
  /** Number of tar parts stored, including the sentinel part. */
  uint32_t    part_count_;
  /** Bytes of tar before compression. */
  int64_t     uncompressed_size_;
  /** Opaque text given by the user. */
  std::string user_data_;

  EXTERNALIZABLE(BackupSentinel);
};
}  // namespace archive
}  // namespace walarc
#endif  // WALARC_ARCHIVE_BACKUP_SENTINEL_HPP_
