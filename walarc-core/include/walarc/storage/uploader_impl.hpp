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
#ifndef WALARC_STORAGE_UPLOADER_IMPL_HPP_
#define WALARC_STORAGE_UPLOADER_IMPL_HPP_
#include <atomic>
#include <iosfwd>
#include <string>

#include "walarc/error_code.hpp"
#include "walarc/storage/fwd.hpp"
#include "walarc/storage/storage_client.hpp"
#include "walarc/stream/fwd.hpp"
#include "walarc/thread/wait_group_impl.hpp"

namespace walarc {
namespace storage {
/**
 * @brief Outcome of one object submission.
 * @ingroup STORAGE
 */
struct UploadResult {
  UploadResult() : error_(kErrorCodeOk) {}

  std::string path_;
  /** Where the store put the object. Empty on failure. */
  std::string location_;
  /** MD5 of the uploaded bytes in hex, if they were checksummed on the way. */
  std::string checksum_;
  ErrorCode   error_;

  bool is_success() const { return error_ == kErrorCodeOk; }
  friend std::ostream& operator<<(std::ostream& o, const UploadResult& v);
};

/**
 * @brief Submits streams to a StorageClient and keeps track of asynchronous uploads.
 * @ingroup STORAGE
 * @details
 * submit() may be called from any number of threads at once. Retries happen inside the
 * StorageClient, and are logged here as warnings; only the final failure is an error.
 *
 * Whoever uploads asynchronously calls register_upload() before spawning the thread and
 * complete_upload() when it finishes, successful or not. await_all() then blocks until every
 * registered upload is over, so that a backup is never declared done while bytes are in flight.
 */
class Uploader final : public RetryListener {
 public:
  explicit Uploader(StorageClient* client);

  Uploader(const Uploader &other) = delete;
  Uploader& operator=(const Uploader &other) = delete;

  /**
   * @brief Uploads the whole source as the object at path.
   * @param[out] result filled on success and on failure
   */
  ErrorCode submit(stream::ByteSource* source, const std::string& path, UploadResult* result);

  /** Checksum the store reports for the object. */
  ErrorCode head(const std::string& path, std::string* checksum);

  void      register_upload() { outstanding_.add(); }
  void      complete_upload() { outstanding_.done(); }
  void      await_all() { outstanding_.wait(); }
  uint32_t  get_outstanding_count() const { return outstanding_.get_count(); }

  /** Whether the most recent submit() succeeded. Meaningless under concurrent submits. */
  bool      is_last_success() const { return last_success_; }

  StorageClient* get_client() const { return client_; }

  void      on_retry(const std::string& path, uint32_t attempt, ErrorCode cause) override;

 private:
  StorageClient* const  client_;
  thread::WaitGroup     outstanding_;
  std::atomic<bool>     last_success_;
};

}  // namespace storage
}  // namespace walarc
#endif  // WALARC_STORAGE_UPLOADER_IMPL_HPP_
