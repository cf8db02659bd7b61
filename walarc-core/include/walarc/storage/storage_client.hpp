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
#ifndef WALARC_STORAGE_STORAGE_CLIENT_HPP_
#define WALARC_STORAGE_STORAGE_CLIENT_HPP_
#include <stdint.h>

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"
#include "walarc/storage/storage_options.hpp"
#include "walarc/stream/fwd.hpp"

/**
 * @defgroup STORAGE Object Storage
 * @brief Ships byte streams to remote objects.
 * @details
 * StorageClient implements the multipart protocol common to object stores on top of four
 * primitive requests that each backend provides. Uploader adds logging and join bookkeeping
 * on top of it, and StreamPipe connects a compressing/encrypting writer to an Uploader.
 */
namespace walarc {
namespace storage {
/**
 * @brief Receives a notification each time a request is retried.
 * @ingroup STORAGE
 * @details
 * Called from whichever thread ran the failed request, possibly several at once.
 */
class RetryListener {
 public:
  virtual ~RetryListener() {}
  /**
   * @param[in] path the object being uploaded
   * @param[in] attempt 1 for the first retry
   * @param[in] cause the transient error that triggered this retry
   */
  virtual void on_retry(const std::string& path, uint32_t attempt, ErrorCode cause) = 0;
};

/**
 * @brief Interface to one object store.
 * @ingroup STORAGE
 * @details
 * submit_object() reads the source in StorageOptions::part_size_kb_ chunks and uploads each chunk
 * as a part, with up to StorageOptions::upload_concurrency_ parts in flight.
 * A request failing with kErrorCodeStorageTransport is retried up to
 * StorageOptions::max_retries_ times with exponential backoff. Any other error, or a request
 * still failing after the last retry, aborts the multipart upload so that no partial object
 * ever becomes visible.
 *
 * Derived classes must allow concurrent calls of every method.
 */
class StorageClient {
 public:
  explicit StorageClient(const StorageOptions& options) : options_(options) {}
  virtual ~StorageClient() {}

  // non-copyable assignable.
  StorageClient(const StorageClient &other) CXX11_FUNC_DELETE;
  StorageClient& operator=(const StorageClient &other) CXX11_FUNC_DELETE;

  /**
   * @brief Uploads everything the source provides as one object.
   * @param[in] path object path relative to the bucket, without leading slash
   * @param[in] source read until its end. Left half-read on failure.
   * @param[in] listener optional. notified of each retry.
   * @param[out] location where the object was stored
   * @return kErrorCodeStorageRetryExhausted when transient failures exceeded the retry budget.
   * An error returned by the source is returned as it is.
   */
  ErrorCode submit_object(
    const std::string& path,
    stream::ByteSource* source,
    RetryListener* listener,
    std::string* location);

  /**
   * @brief Returns the checksum the store keeps for the object.
   * @param[out] checksum 32 lower-case hex characters of MD5
   * @return kErrorCodeStorageNoSuchObject if the object does not exist
   */
  virtual ErrorCode head_object(const std::string& path, std::string* checksum) = 0;

  /** URL scheme this client serves, such as "file". */
  virtual const char* get_scheme() const = 0;

  const StorageOptions& get_options() const { return options_; }

 protected:
  virtual ErrorCode create_multipart(const std::string& path, std::string* upload_id) = 0;
  /** part_number starts from 1. */
  virtual ErrorCode upload_part(
    const std::string& upload_id,
    uint32_t part_number,
    const char* data,
    uint64_t size) = 0;
  virtual ErrorCode complete_multipart(
    const std::string& path,
    const std::string& upload_id,
    uint32_t part_count,
    std::string* location) = 0;
  virtual ErrorCode abort_multipart(const std::string& upload_id) = 0;

  const StorageOptions  options_;
};

}  // namespace storage
}  // namespace walarc
#endif  // WALARC_STORAGE_STORAGE_CLIENT_HPP_
