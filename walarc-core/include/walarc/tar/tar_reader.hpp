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
#ifndef WALARC_TAR_TAR_READER_HPP_
#define WALARC_TAR_TAR_READER_HPP_
#include <stdint.h>

#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"
#include "walarc/stream/fwd.hpp"
#include "walarc/tar/tar_entry.hpp"

namespace walarc {
namespace tar {
/**
 * @brief Reads a ustar archive written by TarWriter from a ByteSource.
 * @ingroup TAR
 * @details
 * Call next() to move to the following entry, then optionally read_body() to receive its body.
 * A body not read is skipped by the next call of next().
 */
class TarReader CXX11_FINAL {
 public:
  explicit TarReader(stream::ByteSource* source);

  // non-copyable assignable.
  TarReader(const TarReader &other) CXX11_FUNC_DELETE;
  TarReader& operator=(const TarReader &other) CXX11_FUNC_DELETE;

  /**
   * @brief Moves to the next entry.
   * @param[out] entry metadata of the entry
   * @param[out] end true if the archive ended. entry is untouched then.
   */
  ErrorCode next(TarEntry* entry, bool* end);

  /** Writes the body of the current entry into the sink. Does not close the sink. */
  ErrorCode read_body(stream::ByteSink* sink);

 private:
  ErrorCode skip_rest();

  stream::ByteSource* const source_;
  /** Unread bytes of the current body. */
  uint64_t                  remaining_body_;
  /** Padding after the current body. */
  uint64_t                  remaining_padding_;
  bool                      ended_;
};

}  // namespace tar
}  // namespace walarc
#endif  // WALARC_TAR_TAR_READER_HPP_
