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
#ifndef WALARC_TAR_TAR_PART_IMPL_HPP_
#define WALARC_TAR_TAR_PART_IMPL_HPP_
#include <stdint.h>

#include <iosfwd>
#include <memory>
#include <string>

#include "walarc/error_code.hpp"
#include "walarc/crypto/fwd.hpp"
#include "walarc/storage/fwd.hpp"
#include "walarc/stream/fwd.hpp"
#include "walarc/tar/fwd.hpp"
#include "walarc/tar/tar_entry.hpp"

namespace walarc {
namespace tar {
/**
 * @brief One tar stream of a base backup, uploaded as one object.
 * @ingroup TAR
 * @details
 * The upload starts lazily at the first entry, so a part that never receives an entry
 * costs nothing and leaves no object behind.
 * A part is owned by one thread at a time, thus nothing here is synchronized.
 * Once an add fails, the upload is aborted and every later call returns the same error.
 */
class TarPart final {
 public:
  TarPart(
    uint32_t part_number,
    const std::string& object_path,
    storage::Uploader* uploader,
    crypto::Crypter* crypter,
    bool verify);
  ~TarPart();

  TarPart(const TarPart &other) = delete;
  TarPart& operator=(const TarPart &other) = delete;

  /** Starts the upload. Idempotent. */
  ErrorCode set_up();

  /** Adds an entry whose body is read from the source. */
  ErrorCode add_entry(const TarEntry& entry, stream::ByteSource* body);
  /** Adds an entry whose body is in memory. */
  ErrorCode add_buffer(const TarEntry& entry, const void* data);

  /**
   * @brief Ends the tar stream. The upload goes on in the background until wait().
   * @details
   * Idempotent. A part never set up is simply marked closed.
   */
  ErrorCode close();

  /**
   * @brief Blocks until the upload is over.
   * @param[out] result optional
   * @return kErrorCodeOk for a part never set up
   */
  ErrorCode wait(storage::UploadResult* result);

  uint32_t  get_part_number() const { return part_number_; }
  const std::string& get_object_path() const { return object_path_; }
  /** Uncompressed bytes of tar written so far. */
  uint64_t  get_size() const;
  uint32_t  get_entry_count() const;
  bool      is_set_up() const { return pipe_ != nullptr; }
  bool      is_closed() const { return closed_; }
  /** Whether wait() would return without blocking. True for a part never set up. */
  bool      is_upload_over() const;

  friend std::ostream& operator<<(std::ostream& o, const TarPart& v);

 private:
  ErrorCode fail(ErrorCode cause);

  const uint32_t                      part_number_;
  const std::string                   object_path_;
  storage::Uploader* const            uploader_;
  crypto::Crypter* const              crypter_;
  const bool                          verify_;

  std::unique_ptr<storage::StreamPipe> pipe_;
  std::unique_ptr<TarWriter>          writer_;
  ErrorCode                           error_;
  bool                                closed_;
};

}  // namespace tar
}  // namespace walarc
#endif  // WALARC_TAR_TAR_PART_IMPL_HPP_
