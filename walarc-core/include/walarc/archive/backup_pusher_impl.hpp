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
#ifndef WALARC_ARCHIVE_BACKUP_PUSHER_IMPL_HPP_
#define WALARC_ARCHIVE_BACKUP_PUSHER_IMPL_HPP_
#include <stdint.h>

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

#include "walarc/error_code.hpp"
#include "walarc/archive/fwd.hpp"
#include "walarc/crypto/fwd.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/storage/fwd.hpp"
#include "walarc/tar/fwd.hpp"

namespace walarc {
namespace archive {
/**
 * @brief What to back up and what the database reported when the backup stopped.
 * @ingroup ARCHIVE
 */
struct BackupRequest {
  BackupRequest() : producers_(4) {}

  fs::Path    data_dir_;
  std::string backup_name_;
  /** "<hex>/<hex>". Empty if unknown. */
  std::string finish_lsn_;
  /** Content of backup_label. No label part is stored if empty. */
  std::string backup_label_;
  std::string tablespace_map_;
  std::string user_data_;
  /** Threads that read files into tar parts. */
  uint16_t    producers_;

  friend std::ostream& operator<<(std::ostream& o, const BackupRequest& v);
};

/**
 * @brief Packs a data directory into tar parts and stores them with a sentinel.
 * @ingroup ARCHIVE
 * @details
 * Steps:
 *  \li Walk the data directory. The contents of pg_wal and pg_xlog, postmaster.pid and
 * postmaster.opts are skipped. global/pg_control is kept aside.
 *  \li Producer threads take entries in walk order and write them into parts of a
 * TarBundleQueue.
 *  \li After every part is stored, pg_control goes alone into the sentinel part, then
 * backup_label and tablespace_map into one more part.
 *  \li Finally the BackupSentinel is stored as XML. Its existence marks the backup complete.
 */
class BackupPusher final {
 public:
  static const char* const kPgControlPath;

  BackupPusher(
    storage::Uploader* uploader,
    crypto::Crypter* crypter,
    const std::string& server,
    uint32_t tar_concurrency,
    uint64_t tar_size_threshold,
    bool verify);

  BackupPusher(const BackupPusher &other) = delete;
  BackupPusher& operator=(const BackupPusher &other) = delete;

  /**
   * @param[out] sentinel what was stored as the sentinel
   * @return kErrorCodeArchiveNoDataDir, kErrorCodeArchiveNoSentinel if global/pg_control is
   * missing, or the first error of storing parts.
   */
  ErrorCode push(const BackupRequest& request, BackupSentinel* sentinel);

  /** Whether the walk skips the path, relative to the data directory. */
  static bool is_excluded(const std::string& relative_path);

 private:
  /** Collects entries to archive, depth first, parents before children. */
  ErrorCode walk(const fs::Path& root, const fs::Path& folder, std::vector<fs::Path>* out);
  void      handle_producer(tar::TarBundleQueue* bundle, const fs::Path& root);
  ErrorCode add_to_part(tar::TarPart* part, const fs::Path& root, const fs::Path& path);
  void      remember_error(ErrorCode code);
  ErrorCode store_sentinel(const std::string& server, const BackupSentinel& sentinel);

  storage::Uploader* const  uploader_;
  crypto::Crypter* const    crypter_;
  const std::string         server_;
  const uint32_t            tar_concurrency_;
  const uint64_t            tar_size_threshold_;
  const bool                verify_;

  /** Set up in each push(). Producers take entries_[next_entry_++]. */
  std::vector<fs::Path>     entries_;
  std::atomic<uint64_t>     next_entry_;
  std::mutex                error_mutex_;
  ErrorCode                 first_error_;
};

}  // namespace archive
}  // namespace walarc
#endif  // WALARC_ARCHIVE_BACKUP_PUSHER_IMPL_HPP_
