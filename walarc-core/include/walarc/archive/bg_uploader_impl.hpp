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
#ifndef WALARC_ARCHIVE_BG_UPLOADER_IMPL_HPP_
#define WALARC_ARCHIVE_BG_UPLOADER_IMPL_HPP_
#include <stdint.h>

#include <atomic>
#include <iosfwd>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "walarc/archive/segment_archiver.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/thread/stoppable_thread_impl.hpp"
#include "walarc/thread/wait_group_impl.hpp"

namespace walarc {
namespace archive {
/**
 * @brief Daemon that uploads the other sealed WAL segments while one is being archived.
 * @ingroup ARCHIVE
 * @details
 * The database marks each sealed segment with archive_status/<segment>.ready. A scanner thread
 * lists those markers and dispatches a worker thread for each marker not seen before, as long
 * as fewer than max_workers are running. A worker archives the segment then renames the
 * marker to <segment>.done. Each finishing worker wakes the scanner up, so discovery follows
 * the work rather than a polling interval.
 *
 * A marker name is dispatched at most once at a time: the check-and-insert into the seen set
 * happens under a mutex. A name that succeeded is never dispatched again. A name whose upload
 * or rename failed is NOT kept out for the daemon's lifetime: it is taken out of the seen set
 * so that a later scan dispatches it a second time, up to kMaxAttempts times in total. After
 * that it stays in the set and is left for the next archive command.
 *
 * Each scan first joins the workers that finished since the previous one, so exited worker
 * threads do not pile up over a long session.
 *
 * Once kTotalUploadLimit segments were uploaded, no more is dispatched. This bounds the work
 * one archive command does in the background; it is not an error.
 *
 * stop() is a drain, not a cancellation: segments already dispatched are always finished.
 */
class BackgroundSegmentUploader final {
 public:
  static const uint32_t kTotalUploadLimit = 1024;
  static const uint32_t kMaxAttempts = 3;
  static const char* const kArchiveStatusFolder;
  static const char* const kReadySuffix;
  static const char* const kDoneSuffix;

  explicit BackgroundSegmentUploader(SegmentArchiver* archiver);
  /** Calls stop(). */
  ~BackgroundSegmentUploader();

  BackgroundSegmentUploader(const BackgroundSegmentUploader &other) = delete;
  BackgroundSegmentUploader& operator=(const BackgroundSegmentUploader &other) = delete;

  /**
   * @brief Starts scanning the folder of the given segment.
   * @param[in] segment_file the segment the caller archives by itself. Never dispatched here.
   * @param[in] max_workers does nothing if less than 1
   */
  void      start(const fs::Path& segment_file, int32_t max_workers);

  /** Stops dispatching and waits until every worker is done. Idempotent. */
  void      stop();

  bool      is_started() const { return started_; }
  uint32_t  get_total_uploaded() const { return total_uploaded_; }
  int32_t   get_running_workers() const { return running_workers_; }
  /** Segments that failed kMaxAttempts times. */
  uint32_t  get_poisoned_count() const { return poisoned_count_; }
  /** Worker threads started and not joined yet, finished or not. */
  uint32_t  get_unjoined_worker_count() const;

  friend std::ostream& operator<<(std::ostream& o, const BackgroundSegmentUploader& v);

 private:
  /** One pass over the markers. Called only by the scanner thread. */
  void      scan_once();
  /** Joins the workers that reported themselves in finished_workers_. */
  void      join_finished_workers();
  void      handle_worker(uint64_t worker_id, const std::string& ready_name);
  bool      has_free_slot() const { return running_workers_ < max_workers_; }
  bool      should_keep_dispatching() const {
    return max_workers_ > 0 && total_uploaded_ < kTotalUploadLimit;
  }
  /** Makes the name eligible again, unless it failed too many times. */
  void      on_failure(const std::string& ready_name);

  SegmentArchiver* const    archiver_;
  fs::Path                  wal_folder_;
  fs::Path                  status_folder_;

  std::atomic<int32_t>      max_workers_;
  std::atomic<int32_t>      running_workers_;
  std::atomic<uint32_t>     total_uploaded_;
  std::atomic<uint32_t>     poisoned_count_;
  bool                      started_;

  /** Protects seen_, attempts_, workers_, finished_workers_ and next_worker_id_. */
  mutable std::mutex        mutex_;
  /** Marker names ever dispatched and not given back by on_failure(). */
  std::set<std::string>     seen_;
  /** Failure count per marker name. */
  std::map<std::string, uint32_t> attempts_;
  std::map<uint64_t, std::thread> workers_;
  /** Workers whose thread function is about to return. */
  std::vector<uint64_t>     finished_workers_;
  uint64_t                  next_worker_id_;

  thread::WaitGroup         running_;
  thread::StoppableThread   scanner_;
};

}  // namespace archive
}  // namespace walarc
#endif  // WALARC_ARCHIVE_BG_UPLOADER_IMPL_HPP_
