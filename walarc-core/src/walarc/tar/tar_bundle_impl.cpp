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
#include "walarc/tar/tar_bundle_impl.hpp"

#include <glog/logging.h>

#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

#include "walarc/assert_nd.hpp"
#include "walarc/storage/uploader_impl.hpp"
#include "walarc/tar/tar_part_impl.hpp"

namespace walarc {
namespace tar {
const char* const TarBundleQueue::kSentinelPartName = "pg_control.tar.lz4";

namespace {
std::string make_part_name(uint32_t part_number) {
  std::stringstream str;
  str << "part_" << std::setw(3) << std::setfill('0') << part_number << ".tar.lz4";
  return str.str();
}
}  // namespace

TarBundleQueue::TarBundleQueue(
  storage::Uploader* uploader,
  crypto::Crypter* crypter,
  const std::string& partitions_prefix,
  uint64_t size_threshold,
  bool verify)
  : uploader_(uploader),
    crypter_(crypter),
    partitions_prefix_(partitions_prefix),
    size_threshold_(size_threshold),
    verify_(verify),
    concurrency_(0),
    first_error_(kErrorCodeOk),
    created_parts_(0),
    uploaded_parts_(0),
    live_parts_(0),
    uncompressed_bytes_(0),
    finished_(false) {
  ASSERT_ND(uploader_);
  ASSERT_ND(crypter_);
}

TarBundleQueue::~TarBundleQueue() {
  if (concurrency_ > 0 && !finished_) {
    LOG(WARNING) << "TarBundleQueue destructed without finish(). Open parts are aborted";
  }
  // each TarPart aborts its upload if still open, then joins it.
  open_parts_.clear();
  closed_parts_.clear();
}

void TarBundleQueue::start(uint32_t concurrency) {
  ASSERT_ND(concurrency_ == 0);
  if (concurrency < kMinConcurrency) {
    LOG(INFO) << "Tar upload concurrency " << concurrency << " is raised to " << kMinConcurrency;
    concurrency = kMinConcurrency;
  }
  concurrency_ = concurrency;
  std::lock_guard<std::mutex> guard(mutex_);
  for (uint32_t i = 0; i < concurrency_; ++i) {
    queue_.push_back(new_part());
  }
}

TarPart* TarBundleQueue::new_part() {
  uint32_t part_number = ++created_parts_;
  TarPart* part = new TarPart(
    part_number, partitions_prefix_ + make_part_name(part_number), uploader_, crypter_, verify_);
  open_parts_.emplace_back(part);
  ++live_parts_;
  ASSERT_ND(live_parts_ <= concurrency_);
  return part;
}

TarPart* TarBundleQueue::dequeue() {
  std::unique_lock<std::mutex> lock(mutex_);
  queue_not_empty_.wait(lock, [this]{ return !queue_.empty(); });
  TarPart* part = queue_.front();
  queue_.pop_front();
  return part;
}

void TarBundleQueue::remember_error(ErrorCode code) {
  if (code == kErrorCodeOk) {
    return;
  }
  std::lock_guard<std::mutex> guard(mutex_);
  if (first_error_ == kErrorCodeOk) {
    first_error_ = code;
  }
}

ErrorCode TarBundleQueue::retire_part(TarPart* part) {
  ErrorCode code = part->close();
  --live_parts_;
  if (part->is_set_up()) {
    ++uploaded_parts_;
    uncompressed_bytes_ += part->get_size();
  }
  remember_error(code);
  std::lock_guard<std::mutex> guard(mutex_);
  for (auto it = open_parts_.begin(); it != open_parts_.end(); ++it) {
    if (it->get() == part) {
      closed_parts_.emplace_back(std::move(*it));
      open_parts_.erase(it);
      break;
    }
  }
  return code;
}

void TarBundleQueue::release_closed_parts(bool all) {
  std::vector< std::unique_ptr<TarPart> > released;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto kept = closed_parts_.begin();
    for (auto it = closed_parts_.begin(); it != closed_parts_.end(); ++it) {
      if (all || (*it)->is_upload_over()) {
        released.emplace_back(std::move(*it));
      } else {
        *kept++ = std::move(*it);
      }
    }
    closed_parts_.erase(kept, closed_parts_.end());
  }
  for (const std::unique_ptr<TarPart>& part : released) {
    remember_error(part->wait(nullptr));
  }
}

uint32_t TarBundleQueue::get_retained_part_count() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return open_parts_.size() + closed_parts_.size();
}

ErrorCode TarBundleQueue::enqueue_back(TarPart* part, bool rotate) {
  if (!rotate) {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      queue_.push_back(part);
    }
    queue_not_empty_.notify_one();
    return kErrorCodeOk;
  }
  // closing blocks until the upload consumed the tail, so do it outside the lock.
  ErrorCode code = retire_part(part);
  {
    std::lock_guard<std::mutex> guard(mutex_);
    queue_.push_back(new_part());
  }
  queue_not_empty_.notify_one();
  release_closed_parts(false);
  return code;
}

ErrorCode TarBundleQueue::check_size_and_enqueue_back(TarPart* part) {
  return enqueue_back(part, part->get_size() >= size_threshold_);
}

ErrorCode TarBundleQueue::finish() {
  ASSERT_ND(!finished_);
  finished_ = true;
  std::deque<TarPart*> remaining;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    remaining.swap(queue_);
  }
  if (remaining.size() != concurrency_) {
    LOG(ERROR) << "finish() found " << remaining.size() << " parts in the queue, expected "
      << concurrency_ << ". A producer did not give its part back";
  }
  for (TarPart* part : remaining) {
    retire_part(part);  // failures are kept in first_error_
  }

  uploader_->await_all();
  release_closed_parts(true);

  std::lock_guard<std::mutex> guard(mutex_);
  if (first_error_ != kErrorCodeOk) {
    LOG(ERROR) << "At least one part of the bundle failed: " << get_error_name(first_error_);
  } else {
    LOG(INFO) << "Uploaded " << uploaded_parts_.load() << " parts, " << uncompressed_bytes_.load()
      << " bytes before compression";
  }
  return first_error_;
}

ErrorCode TarBundleQueue::upload_dedicated_part(TarPart* part) {
  ErrorCode code = part->close();
  ErrorCode upload_code = part->wait(nullptr);
  if (code == kErrorCodeOk) {
    code = upload_code;
  }
  if (code == kErrorCodeOk) {
    ++uploaded_parts_;
    uncompressed_bytes_ += part->get_size();
  }
  return code;
}

ErrorCode TarBundleQueue::handle_sentinel(const TarEntry& entry, stream::ByteSource* body) {
  // numbered 0, as it is not one of the numbered part objects
  TarPart part(0, partitions_prefix_ + kSentinelPartName, uploader_, crypter_, verify_);
  ErrorCode code = part.add_entry(entry, body);
  ErrorCode upload_code = upload_dedicated_part(&part);
  return code != kErrorCodeOk ? code : upload_code;
}

ErrorCode TarBundleQueue::handle_label_files(
  const std::string& backup_label,
  const std::string& tablespace_map) {
  uint32_t part_number = ++created_parts_;
  TarPart part(
    part_number, partitions_prefix_ + make_part_name(part_number), uploader_, crypter_, verify_);
  TarEntry entry;
  entry.name_ = "backup_label";
  entry.mode_ = 0600;
  entry.size_ = backup_label.size();
  ErrorCode code = part.add_buffer(entry, backup_label.data());
  if (code == kErrorCodeOk) {
    entry.name_ = "tablespace_map";
    entry.size_ = tablespace_map.size();
    code = part.add_buffer(entry, tablespace_map.data());
  }
  ErrorCode upload_code = upload_dedicated_part(&part);
  return code != kErrorCodeOk ? code : upload_code;
}

std::ostream& operator<<(std::ostream& o, const TarBundleQueue& v) {
  o << "<TarBundleQueue>"
    << "<partitions_prefix_>" << v.partitions_prefix_ << "</partitions_prefix_>"
    << "<size_threshold_>" << v.size_threshold_ << "</size_threshold_>"
    << "<concurrency_>" << v.concurrency_ << "</concurrency_>"
    << "<created_parts_>" << v.created_parts_.load() << "</created_parts_>"
    << "<uploaded_parts_>" << v.uploaded_parts_.load() << "</uploaded_parts_>"
    << "<live_parts_>" << v.live_parts_.load() << "</live_parts_>"
    << "<uncompressed_bytes_>" << v.uncompressed_bytes_.load() << "</uncompressed_bytes_>"
    << "</TarBundleQueue>";
  return o;
}

}  // namespace tar
}  // namespace walarc
