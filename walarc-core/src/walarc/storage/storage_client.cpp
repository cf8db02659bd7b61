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
#include "walarc/storage/storage_client.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "walarc/assert_nd.hpp"
#include "walarc/stream/byte_stream.hpp"

namespace walarc {
namespace storage {
namespace {
/** Upper bound of the backoff shift so that the delay does not overflow. */
const uint32_t kMaxBackoffShift = 10;

/** One part being uploaded by its own thread. */
struct PartUpload {
  PartUpload() : part_number_(0), size_(0), result_(kErrorCodeOk) {}
  uint32_t            part_number_;
  std::vector<char>   data_;
  uint64_t            size_;
  ErrorCode           result_;
  std::thread         thread_;
};

/**
 * Runs the request until it succeeds, fails with a non-transient error, or runs out of retries.
 */
template <typename REQUEST>
ErrorCode retry_request(
  const StorageOptions& options,
  const std::string& path,
  RetryListener* listener,
  REQUEST request) {
  for (uint32_t attempt = 0;; ++attempt) {
    ErrorCode code = request();
    if (code != kErrorCodeStorageTransport) {
      return code;
    }
    if (attempt >= options.max_retries_) {
      VLOG(0) << "Gave up on " << path << " after " << attempt << " retries";
      return kErrorCodeStorageRetryExhausted;
    }
    if (listener) {
      listener->on_retry(path, attempt + 1U, code);
    }
    uint64_t delay_ms = static_cast<uint64_t>(options.retry_base_delay_ms_)
      << std::min(attempt, kMaxBackoffShift);
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
  }
}

/** Joins the oldest part and keeps the first error. */
void join_front(std::deque< std::unique_ptr<PartUpload> >* in_flight, ErrorCode* result) {
  ASSERT_ND(!in_flight->empty());
  PartUpload* part = in_flight->front().get();
  part->thread_.join();
  if (part->result_ != kErrorCodeOk && *result == kErrorCodeOk) {
    *result = part->result_;
  }
  in_flight->pop_front();
}
}  // namespace

ErrorCode StorageClient::submit_object(
  const std::string& path,
  stream::ByteSource* source,
  RetryListener* listener,
  std::string* location) {
  ASSERT_ND(source);
  ASSERT_ND(location);
  std::string upload_id;
  CHECK_ERROR_CODE(retry_request(options_, path, listener, [&]() {
    return create_multipart(path, &upload_id);
  }));
  VLOG(1) << "Started multipart upload " << upload_id << " for " << path;

  const uint64_t part_size = options_.get_part_size_bytes();
  const uint32_t concurrency = options_.upload_concurrency_;
  std::deque< std::unique_ptr<PartUpload> > in_flight;
  ErrorCode result = kErrorCodeOk;
  uint32_t part_count = 0;
  uint64_t total_bytes = 0;
  while (true) {
    while (in_flight.size() >= concurrency) {
      join_front(&in_flight, &result);
    }
    if (result != kErrorCodeOk) {
      break;
    }

    std::unique_ptr<PartUpload> part(new PartUpload());
    part->data_.resize(part_size);
    uint64_t read_bytes = 0;
    ErrorCode read_result = stream::read_fully(source, part->data_.data(), part_size, &read_bytes);
    if (read_result != kErrorCodeOk) {
      LOG(WARNING) << "Source of " << path << " failed after " << total_bytes << " bytes: "
        << get_error_name(read_result);
      result = read_result;
      break;
    }
    if (read_bytes == 0 && part_count > 0) {
      break;
    }
    // an empty object still has one empty part.
    part->size_ = read_bytes;
    part->part_number_ = ++part_count;
    total_bytes += read_bytes;
    PartUpload* raw = part.get();
    raw->thread_ = std::thread([this, raw, &path, &upload_id, listener]() {
      raw->result_ = retry_request(options_, path, listener, [this, raw, &upload_id]() {
        return upload_part(upload_id, raw->part_number_, raw->data_.data(), raw->size_);
      });
    });
    in_flight.push_back(std::move(part));
    if (read_bytes < part_size) {
      break;  // read_fully() returns a short read only at the end of stream
    }
  }
  while (!in_flight.empty()) {
    join_front(&in_flight, &result);
  }

  if (result == kErrorCodeOk) {
    result = retry_request(options_, path, listener, [&]() {
      return complete_multipart(path, upload_id, part_count, location);
    });
  }
  if (result != kErrorCodeOk) {
    ErrorCode abort_result = abort_multipart(upload_id);
    if (abort_result != kErrorCodeOk) {
      LOG(WARNING) << "Could not abort multipart upload " << upload_id << " of " << path
        << ": " << get_error_name(abort_result) << ". Its parts are left in the store.";
    }
    return result;
  }

  VLOG(0) << "Uploaded " << path << " (" << total_bytes << " bytes in " << part_count
    << " parts) to " << *location;
  return kErrorCodeOk;
}

}  // namespace storage
}  // namespace walarc
