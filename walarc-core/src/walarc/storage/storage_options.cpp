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
#include "walarc/storage/storage_options.hpp"

#include <glog/logging.h>

#include "walarc/externalize/externalizable.hpp"

namespace walarc {
namespace storage {
const char* const StorageOptions::kSseKms = "aws:kms";

StorageOptions::StorageOptions() :
  storage_class_("STANDARD"),
  server_side_encryption_(""),
  sse_kms_key_id_(""),
  max_retries_(kDefaultMaxRetries),
  retry_base_delay_ms_(kDefaultRetryBaseDelayMs),
  part_size_kb_(kDefaultPartSizeKb),
  upload_concurrency_(kDefaultUploadConcurrency) {
}

ErrorCode StorageOptions::validate() const {
  const bool kms_mode = server_side_encryption_ == kSseKms;
  if (kms_mode && sse_kms_key_id_.empty()) {
    LOG(ERROR) << "server_side_encryption_=" << kSseKms << " requires sse_kms_key_id_";
    return kErrorCodeConfSseKmsMismatch;
  } else if (!kms_mode && !sse_kms_key_id_.empty()) {
    LOG(ERROR) << "sse_kms_key_id_ is given, but server_side_encryption_ is '"
      << server_side_encryption_ << "', not " << kSseKms;
    return kErrorCodeConfSseKmsMismatch;
  }
  if (part_size_kb_ == 0 || upload_concurrency_ == 0) {
    return kErrorCodeConfValueOutofrange;
  }
  return kErrorCodeOk;
}

ErrorStack StorageOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, storage_class_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, server_side_encryption_, "");
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, sse_kms_key_id_, "");
  EXTERNALIZE_LOAD_ELEMENT(element, max_retries_);
  EXTERNALIZE_LOAD_ELEMENT(element, retry_base_delay_ms_);
  EXTERNALIZE_LOAD_ELEMENT(element, part_size_kb_);
  EXTERNALIZE_LOAD_ELEMENT(element, upload_concurrency_);
  return kRetOk;
}

ErrorStack StorageOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for the object storage client"));

  EXTERNALIZE_SAVE_ELEMENT(element, storage_class_, "Storage class of stored objects.");
  EXTERNALIZE_SAVE_ELEMENT(element, server_side_encryption_,
    "Server-side encryption mode: empty, AES256 or aws:kms.");
  EXTERNALIZE_SAVE_ELEMENT(element, sse_kms_key_id_,
    "Key id. Must be given iff server_side_encryption_ is aws:kms.");
  EXTERNALIZE_SAVE_ELEMENT(element, max_retries_,
    "How many times a transient transport failure is retried per request.");
  EXTERNALIZE_SAVE_ELEMENT(element, retry_base_delay_ms_,
    "Delay before the first retry in milliseconds. Doubles on each following retry.");
  EXTERNALIZE_SAVE_ELEMENT(element, part_size_kb_, "Size of one multipart upload part in KB.");
  EXTERNALIZE_SAVE_ELEMENT(element, upload_concurrency_,
    "How many parts of one object are uploaded in parallel.");
  return kRetOk;
}

}  // namespace storage
}  // namespace walarc
