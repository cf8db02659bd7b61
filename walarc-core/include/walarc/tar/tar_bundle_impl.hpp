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
#ifndef WALARC_TAR_TAR_BUNDLE_IMPL_HPP_
#define WALARC_TAR_TAR_BUNDLE_IMPL_HPP_
#include <stdint.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "walarc/error_code.hpp"
#include "walarc/crypto/fwd.hpp"
#include "walarc/storage/fwd.hpp"
#include "walarc/stream/fwd.hpp"
#include "walarc/tar/fwd.hpp"
#include "walarc/tar/tar_entry.hpp"

namespace walarc {
namespace tar {
/**
 * @brief Bounded pool of tar parts shared by the threads that pack a base backup.
 * @ingroup TAR
 * @details
 * start() creates a fixed number of parts. A producer dequeue()s a part, writes entries into
 * it without any locking, and gives it back with enqueue_back(). When the part is rotated,
 * it is closed and its upload continues in the background while a fresh part with the next
 * number takes its slot. Hence the number of parts in existence, and of open tar streams,
 * never exceeds the concurrency however many producers there are.
 * A rotated part is kept only until its upload is over; the next rotation that sees it
 * finished joins its upload and releases it, so a long backup holds no more than the parts
 * still uploading.
 *
 * finish() must be called after every producer gave its part back.
 * It closes the remaining parts, waits for every upload, and returns the first error.
 */
class TarBundleQueue final {
 public:
  /**
   * Liveness needs a slot being written, a slot being uploaded, and a slot about to be
   * created at the same time.
   */
  static const uint32_t kMinConcurrency = 3;
  static const char* const kSentinelPartName;

  /**
   * @param[in] partitions_prefix object path under which parts are stored, ending with '/'
   * @param[in] size_threshold a part holding this many bytes or more is rotated
   */
  TarBundleQueue(
    storage::Uploader* uploader,
    crypto::Crypter* crypter,
    const std::string& partitions_prefix,
    uint64_t size_threshold,
    bool verify);
  ~TarBundleQueue();

  TarBundleQueue(const TarBundleQueue &other) = delete;
  TarBundleQueue& operator=(const TarBundleQueue &other) = delete;

  /** Creates the parts. A concurrency below kMinConcurrency is raised to it. */
  void      start(uint32_t concurrency);

  /** Takes a part. Blocks while every part is taken. */
  TarPart*  dequeue();

  /**
   * @brief Gives the part back.
   * @param[in] rotate whether to close the part and put a new one in its slot
   * @return error of closing the part. The slot is refilled even then.
   */
  ErrorCode enqueue_back(TarPart* part, bool rotate);

  /** enqueue_back() rotating iff the part reached the size threshold. */
  ErrorCode check_size_and_enqueue_back(TarPart* part);

  /**
   * @brief Closes the parts in the queue, waits for all uploads, and reports the first error.
   * @details
   * Every upload is waited for even after one failed. Parts never written to are dropped.
   */
  ErrorCode finish();

  /**
   * @brief Uploads one file alone as the sentinel part, named kSentinelPartName.
   * @details
   * Call this after finish() succeeded, so the sentinel exists only if the rest does.
   * Blocks until the upload is over.
   */
  ErrorCode handle_sentinel(const TarEntry& entry, stream::ByteSource* body);

  /**
   * @brief Uploads backup_label and tablespace_map (mode 0600) as one extra numbered part.
   * Blocks until the upload is over.
   */
  ErrorCode handle_label_files(const std::string& backup_label, const std::string& tablespace_map);

  uint32_t  get_concurrency() const { return concurrency_; }
  /** Parts created so far, including ones later dropped. */
  uint32_t  get_created_part_count() const { return created_parts_; }
  /** Parts that became objects. */
  uint32_t  get_uploaded_part_count() const { return uploaded_parts_; }
  /** Parts in existence and not yet closed. Never more than the concurrency. */
  uint32_t  get_live_part_count() const { return live_parts_; }
  /** Parts held by this object: the open ones and the closed ones not yet released. */
  uint32_t  get_retained_part_count() const;
  /** Uncompressed tar bytes of every closed part. */
  uint64_t  get_uncompressed_bytes() const { return uncompressed_bytes_; }
  uint64_t  get_size_threshold() const { return size_threshold_; }

  friend std::ostream& operator<<(std::ostream& o, const TarBundleQueue& v);

 private:
  /** Creates a numbered part held in open_parts_. Does not put it into the queue. */
  TarPart*  new_part();
  /** Closes the part, accounts for it, and moves it to closed_parts_. */
  ErrorCode retire_part(TarPart* part);
  /**
   * Waits and releases the closed parts whose upload is over, or all of them.
   * Their errors go to first_error_.
   */
  void      release_closed_parts(bool all);
  /** Closes and waits a part used outside the queue. */
  ErrorCode upload_dedicated_part(TarPart* part);
  void      remember_error(ErrorCode code);

  storage::Uploader* const  uploader_;
  crypto::Crypter* const    crypter_;
  const std::string         partitions_prefix_;
  const uint64_t            size_threshold_;
  const bool                verify_;
  uint32_t                  concurrency_;

  /** Protects open_parts_, closed_parts_, queue_ and first_error_. */
  mutable std::mutex        mutex_;
  std::condition_variable   queue_not_empty_;
  /** Parts in the queue or taken by a producer. At most the concurrency. */
  std::vector< std::unique_ptr<TarPart> > open_parts_;
  /** Rotated parts whose upload may still be running. */
  std::vector< std::unique_ptr<TarPart> > closed_parts_;
  std::deque<TarPart*>      queue_;
  ErrorCode                 first_error_;

  std::atomic<uint32_t>     created_parts_;
  std::atomic<uint32_t>     uploaded_parts_;
  std::atomic<uint32_t>     live_parts_;
  std::atomic<uint64_t>     uncompressed_bytes_;
  bool                      finished_;
};

}  // namespace tar
}  // namespace walarc
#endif  // WALARC_TAR_TAR_BUNDLE_IMPL_HPP_
