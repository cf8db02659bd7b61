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
#include "walarc/archive/bg_uploader_impl.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "walarc/assert_nd.hpp"
#include "walarc/assorted/assorted_func.hpp"
#include "walarc/fs/filesystem.hpp"

namespace walarc {
namespace archive {
const char* const BackgroundSegmentUploader::kArchiveStatusFolder = "archive_status";
const char* const BackgroundSegmentUploader::kReadySuffix = ".ready";
const char* const BackgroundSegmentUploader::kDoneSuffix = ".done";

namespace {
/** The scanner also looks on its own this often, for markers created meanwhile. */
const std::chrono::milliseconds kScanInterval(500);
}  // namespace

BackgroundSegmentUploader::BackgroundSegmentUploader(SegmentArchiver* archiver)
  : archiver_(archiver),
    max_workers_(0),
    running_workers_(0),
    total_uploaded_(0),
    poisoned_count_(0),
    started_(false),
    next_worker_id_(0) {
  ASSERT_ND(archiver_);
}

BackgroundSegmentUploader::~BackgroundSegmentUploader() {
  stop();
}

void BackgroundSegmentUploader::start(const fs::Path& segment_file, int32_t max_workers) {
  ASSERT_ND(!started_);
  if (max_workers < 1) {
    VLOG(0) << "Background upload is disabled";
    return;
  }
  wal_folder_ = segment_file.parent_path();
  status_folder_ = wal_folder_;
  status_folder_ /= kArchiveStatusFolder;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    seen_.insert(segment_file.filename() + kReadySuffix);
  }
  max_workers_ = max_workers;
  started_ = true;
  scanner_.start("BackgroundSegmentUploader", kScanInterval, [this]{ scan_once(); });
}

void BackgroundSegmentUploader::stop() {
  if (!started_) {
    return;
  }
  max_workers_ = 0;  // no more dispatch
  scanner_.stop();
  running_.wait();
  std::map<uint64_t, std::thread> workers;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    workers.swap(workers_);
    finished_workers_.clear();
  }
  for (auto& worker : workers) {
    worker.second.join();
  }
  ASSERT_ND(running_workers_ == 0);
  started_ = false;
  LOG(INFO) << "Background upload stopped. " << total_uploaded_.load() << " segments uploaded, "
    << poisoned_count_.load() << " given up";
}

uint32_t BackgroundSegmentUploader::get_unjoined_worker_count() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return workers_.size();
}

void BackgroundSegmentUploader::join_finished_workers() {
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    for (uint64_t id : finished_workers_) {
      auto it = workers_.find(id);
      if (it != workers_.end()) {
        finished.emplace_back(std::move(it->second));
        workers_.erase(it);
      }
    }
    finished_workers_.clear();
  }
  for (std::thread& worker : finished) {
    worker.join();
  }
}

void BackgroundSegmentUploader::scan_once() {
  join_finished_workers();
  if (!should_keep_dispatching()) {
    return;
  }
  if (!fs::is_directory(status_folder_)) {
    LOG(WARNING) << "Could not list " << status_folder_ << ": "
      << get_error_name(kErrorCodeFsListFailed);
    return;
  }
  std::vector<std::string> names;
  for (const fs::Path& child : status_folder_.child_paths()) {
    names.push_back(child.filename());
  }
  // segment names sort in WAL order
  std::sort(names.begin(), names.end());

  for (const std::string& name : names) {
    if (!has_free_slot()) {
      break;
    }
    if (!assorted::ends_with(name, kReadySuffix)) {
      continue;
    }
    if (!should_keep_dispatching()) {
      VLOG(0) << "Reached " << total_uploaded_.load() << " background uploads. Leaving the rest";
      break;
    }
    {
      std::lock_guard<std::mutex> guard(mutex_);
      if (!seen_.insert(name).second) {
        continue;
      }
      ++running_workers_;
      running_.add();
      uint64_t id = next_worker_id_++;
      workers_[id] = std::thread(&BackgroundSegmentUploader::handle_worker, this, id, name);
    }
    VLOG(0) << "Dispatched background upload of " << name;
  }
}

void BackgroundSegmentUploader::on_failure(const std::string& ready_name) {
  std::lock_guard<std::mutex> guard(mutex_);
  uint32_t attempts = ++attempts_[ready_name];
  if (attempts < kMaxAttempts) {
    seen_.erase(ready_name);
  } else {
    ++poisoned_count_;
    LOG(ERROR) << "Gave up background upload of " << ready_name << " after " << attempts
      << " attempts. It is left for the next archive command";
  }
}

void BackgroundSegmentUploader::handle_worker(uint64_t worker_id, const std::string& ready_name) {
  const std::string segment = ready_name.substr(0, ready_name.size() - std::strlen(kReadySuffix));
  fs::Path segment_file(wal_folder_);
  segment_file /= segment;

  ErrorCode code = archiver_->archive_segment(segment_file);
  if (code == kErrorCodeOk) {
    fs::Path ready(status_folder_);
    ready /= ready_name;
    fs::Path done(status_folder_);
    done /= segment + kDoneSuffix;
    if (fs::atomic_rename(ready, done)) {
      ++total_uploaded_;
    } else {
      LOG(WARNING) << "Error renaming " << ready << " to " << done << ": "
        << assorted::os_error();
      code = kErrorCodeFsRenameFailed;
    }
  } else {
    LOG(WARNING) << "Background upload of " << segment << " failed: " << get_error_name(code);
  }
  if (code != kErrorCodeOk) {
    on_failure(ready_name);
  }

  {
    std::lock_guard<std::mutex> guard(mutex_);
    finished_workers_.push_back(worker_id);
  }
  --running_workers_;
  scanner_.wakeup();
  running_.done();
}

std::ostream& operator<<(std::ostream& o, const BackgroundSegmentUploader& v) {
  o << "<BackgroundSegmentUploader>"
    << "<wal_folder_>" << v.wal_folder_ << "</wal_folder_>"
    << "<max_workers_>" << v.max_workers_.load() << "</max_workers_>"
    << "<running_workers_>" << v.running_workers_.load() << "</running_workers_>"
    << "<total_uploaded_>" << v.total_uploaded_.load() << "</total_uploaded_>"
    << "<poisoned_count_>" << v.poisoned_count_.load() << "</poisoned_count_>"
    << v.scanner_
    << "</BackgroundSegmentUploader>";
  return o;
}

}  // namespace archive
}  // namespace walarc
