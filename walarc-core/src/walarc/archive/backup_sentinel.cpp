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
#include "walarc/archive/backup_sentinel.hpp"
#include "walarc/externalize/externalizable.hpp"
#include "walarc/wal/segment_name.hpp"

namespace walarc {
namespace archive {
BackupSentinel::BackupSentinel()
  : backup_name_(""), finish_lsn_(""), part_count_(0), uncompressed_size_(0), user_data_("") {
}

ErrorStack BackupSentinel::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, backup_name_);
  EXTERNALIZE_LOAD_ELEMENT(element, finish_lsn_);
  EXTERNALIZE_LOAD_ELEMENT(element, part_count_);
  EXTERNALIZE_LOAD_ELEMENT(element, uncompressed_size_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, user_data_, "");
  if (!finish_lsn_.empty()) {
    wal::Lsn lsn;
    WRAP_ERROR_CODE(wal::parse_lsn(finish_lsn_, &lsn));
  }
  return kRetOk;
}

ErrorStack BackupSentinel::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Written after every part of the backup is stored"));
  EXTERNALIZE_SAVE_ELEMENT(element, backup_name_, "");
  EXTERNALIZE_SAVE_ELEMENT(element, finish_lsn_, "LSN when the backup stopped");
  EXTERNALIZE_SAVE_ELEMENT(element, part_count_, "Number of tar parts stored");
  EXTERNALIZE_SAVE_ELEMENT(element, uncompressed_size_, "Bytes of tar before compression");
  EXTERNALIZE_SAVE_ELEMENT(element, user_data_, "Opaque text given by the user");
  return kRetOk;
}

}  // namespace archive
}  // namespace walarc
