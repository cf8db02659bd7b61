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
#ifndef WALARC_ARCHIVE_WAL_PUSHER_IMPL_HPP_
#define WALARC_ARCHIVE_WAL_PUSHER_IMPL_HPP_
#include <stdint.h>

#include <string>

#include "walarc/error_code.hpp"
#include "walarc/archive/segment_archiver.hpp"
#include "walarc/crypto/fwd.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/storage/fwd.hpp"

namespace walarc {
namespace archive {
/**
 * @brief Archives WAL segments as <server>/wal_005/<segment>.lz4.
 * @ingroup ARCHIVE
 */
class WalPusher final : public SegmentArchiver {
 public:
  WalPusher(
    storage::Uploader* uploader,
    crypto::Crypter* crypter,
    const std::string& server,
    bool verify);

  WalPusher(const WalPusher &other) = delete;
  WalPusher& operator=(const WalPusher &other) = delete;

  /** Compresses, encrypts if armed, uploads, and verifies if asked, one segment file. */
  ErrorCode archive_segment(const fs::Path& segment_file) override;

  /**
   * @brief The archive command for one segment.
   * @details
   * While this segment is uploaded, up to background_workers other ready segments of the same
   * folder are uploaded too. Those are drained before returning, but their failures only
   * go to the log.
   */
  ErrorCode push(const fs::Path& segment_file, int32_t background_workers);

 private:
  storage::Uploader* const  uploader_;
  crypto::Crypter* const    crypter_;
  const std::string         server_;
  const bool                verify_;
};

}  // namespace archive
}  // namespace walarc
#endif  // WALARC_ARCHIVE_WAL_PUSHER_IMPL_HPP_
