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
#ifndef WALARC_TAR_TAR_WRITER_HPP_
#define WALARC_TAR_TAR_WRITER_HPP_
#include <stdint.h>

#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"
#include "walarc/stream/fwd.hpp"
#include "walarc/tar/tar_entry.hpp"

namespace walarc {
namespace tar {
/**
 * @brief Writes a ustar archive into a ByteSink, one entry at a time.
 * @ingroup TAR
 * @details
 * Each entry is a header block followed by exactly TarEntry::size_ bytes of body padded to the
 * block size. close() writes the two zero blocks that end an archive, but does not close the
 * sink. Adding an entry after close() fails with kErrorCodeTarWriteAfterClose.
 */
class TarWriter CXX11_FINAL {
 public:
  explicit TarWriter(stream::ByteSink* sink);

  // non-copyable assignable.
  TarWriter(const TarWriter &other) CXX11_FUNC_DELETE;
  TarWriter& operator=(const TarWriter &other) CXX11_FUNC_DELETE;

  /**
   * @brief Adds an entry.
   * @param[in] body provides the body of a regular file. Ignored for other types.
   * Only the first TarEntry::size_ bytes are read.
   * @return kErrorCodeTarSizeMismatch if the body ends before TarEntry::size_ bytes,
   * in which case the archive is broken and should be abandoned.
   */
  ErrorCode add_entry(const TarEntry& entry, stream::ByteSource* body);

  /** Adds a regular file whose body is in memory. */
  ErrorCode add_buffer(const TarEntry& entry, const void* data);

  /** Ends the archive. Idempotent. */
  ErrorCode close();

  bool      is_closed() const { return closed_; }
  /** Bytes written so far, including headers and padding. */
  uint64_t  get_written_bytes() const { return written_bytes_; }
  uint32_t  get_entry_count() const { return entry_count_; }

 private:
  ErrorCode write_padding(uint64_t body_size);

  stream::ByteSink* const sink_;
  uint64_t                written_bytes_;
  uint32_t                entry_count_;
  bool                    closed_;
};

}  // namespace tar
}  // namespace walarc
#endif  // WALARC_TAR_TAR_WRITER_HPP_
