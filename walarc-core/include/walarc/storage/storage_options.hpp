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
#ifndef WALARC_STORAGE_STORAGE_OPTIONS_HPP_
#define WALARC_STORAGE_STORAGE_OPTIONS_HPP_
#include <stdint.h>

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"
#include "walarc/externalize/externalizable.hpp"

namespace walarc {
namespace storage {
/**
 * @brief Set of options handed to the object storage client.
 * @ingroup STORAGE
 * This is a POD-like struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct StorageOptions CXX11_FINAL : public virtual externalize::Externalizable {
  enum Constants {
    kDefaultMaxRetries = 7,
    kDefaultRetryBaseDelayMs = 100,
    kDefaultPartSizeKb = 20 << 10,
    kDefaultUploadConcurrency = 10,
  };

  /** The only server-side encryption mode that takes a key id. */
  static const char* const kSseKms;

  StorageOptions();

  /** Storage class of stored objects. Default is "STANDARD". */
  std::string     storage_class_;

  /**
   * @brief Server-side encryption mode: "" (none), "AES256" or "aws:kms".
   */
  std::string     server_side_encryption_;

  /**
   * @brief Key id for "aws:kms". Mandatory with that mode and forbidden without it.
   */
  std::string     sse_kms_key_id_;

  /** How many times a transient transport failure is retried per request. Default 7. */
  uint16_t        max_retries_;

  /**
   * @brief Delay before the first retry in milliseconds.
   * @details
   * The delay doubles on each following retry. Default 100ms.
   */
  uint32_t        retry_base_delay_ms_;

  /**
   * @brief Size of one multipart upload part in KB. Default 20MB.
   * @details
   * Up to upload_concurrency_ parts of this size are held in memory per object.
   */
  uint32_t        part_size_kb_;

  /** How many parts of one object are uploaded in parallel. Default 10. */
  uint16_t        upload_concurrency_;

  uint64_t        get_part_size_bytes() const { return static_cast<uint64_t>(part_size_kb_) << 10; }

  /**
   * @brief Checks the combination of values.
   * @return kErrorCodeConfSseKmsMismatch if a key id is given without "aws:kms" or the other
   * way around. kErrorCodeConfValueOutofrange if sizes or concurrency are zero.
   */
  ErrorCode       validate() const;

  EXTERNALIZABLE(StorageOptions);
};
}  // namespace storage
}  // namespace walarc
#endif  // WALARC_STORAGE_STORAGE_OPTIONS_HPP_
