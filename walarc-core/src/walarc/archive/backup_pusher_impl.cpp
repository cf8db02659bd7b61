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
#include "walarc/archive/backup_pusher_impl.hpp"

#include <unistd.h>
#include <glog/logging.h>

#include <algorithm>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include "walarc/assert_nd.hpp"
#include "walarc/archive/archive_paths.hpp"
#include "walarc/archive/backup_sentinel.hpp"
#include "walarc/assorted/assorted_func.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/storage/uploader_impl.hpp"
#include "walarc/stream/file_stream.hpp"
#include "walarc/stream/memory_stream.hpp"
#include "walarc/tar/tar_bundle_impl.hpp"
#include "walarc/tar/tar_entry.hpp"
#include "walarc/tar/tar_part_impl.hpp"
#include "walarc/wal/segment_name.hpp"

namespace walarc {
namespace archive {
const char* const BackupPusher::kPgControlPath = "global/pg_control";

namespace {
/** Path of the entry relative to the data directory. */
std::string relative_name(const fs::Path& root, const fs::Path& path) {
  std::string name;
  bool under_root = path.relative_to(root, &name);
  ASSERT_ND(under_root);
  return under_root ? name : path.string();
}
}  // namespace

BackupPusher::BackupPusher(
  storage::Uploader* uploader,
  crypto::Crypter* crypter,
  const std::string& server,
  uint32_t tar_concurrency,
  uint64_t tar_size_threshold,
  bool verify)
  : uploader_(uploader),
    crypter_(crypter),
    server_(server),
    tar_concurrency_(tar_concurrency),
    tar_size_threshold_(tar_size_threshold),
    verify_(verify),
    next_entry_(0),
    first_error_(kErrorCodeOk) {
  ASSERT_ND(uploader_);
  ASSERT_ND(crypter_);
}

bool BackupPusher::is_excluded(const std::string& relative_path) {
  return relative_path == "postmaster.pid"
    || relative_path == "postmaster.opts"
    || relative_path == kPgControlPath
    || assorted::starts_with(relative_path, "pg_wal/")
    || assorted::starts_with(relative_path, "pg_xlog/");
}

ErrorCode BackupPusher::walk(
  const fs::Path& root,
  const fs::Path& folder,
  std::vector<fs::Path>* out) {
  std::vector<fs::Path> children = folder.child_paths();
  for (const fs::Path& child : children) {
    if (is_excluded(relative_name(root, child))) {
      VLOG(1) << "Skipped " << child;
      continue;
    }
    fs::FileStatus status = fs::symlink_status(child);
    if (status.is_directory()) {
      out->push_back(child);
      CHECK_ERROR_CODE(walk(root, child, out));
    } else if (status.is_regular_file() || status.is_symlink()) {
      out->push_back(child);
    } else if (!status.known()) {
      LOG(ERROR) << "Could not stat " << child << ": " << assorted::os_error();
      return kErrorCodeFsListFailed;
    }
  }
  return kErrorCodeOk;
}

ErrorCode BackupPusher::add_to_part(
  tar::TarPart* part,
  const fs::Path& root,
  const fs::Path& path) {
  tar::TarEntry entry;
  entry.name_ = relative_name(root, path);
  fs::FileStatus status = fs::symlink_status(path);
  if (!status.exists()) {
    LOG(WARNING) << path << " disappeared during the backup. Skipped";
    return kErrorCodeOk;
  }
  entry.mtime_ = status.mtime_;
  entry.mode_ = status.mode_;
  if (status.is_directory()) {
    entry.type_ = tar::kTarDirectory;
    entry.name_ += '/';
    return part->add_entry(entry, nullptr);
  } else if (status.is_symlink()) {
    char target[4096];
    ssize_t length = ::readlink(path.c_str(), target, sizeof(target) - 1);
    if (length < 0) {
      LOG(ERROR) << "Could not read the symlink " << path << ": " << assorted::os_error();
      return kErrorCodeFsReadFailed;
    }
    entry.type_ = tar::kTarSymlink;
    entry.mode_ = 0777;
    entry.link_name_ = std::string(target, length);
    return part->add_entry(entry, nullptr);
  }

  entry.size_ = status.size_;
  stream::FileSource source(path);
  ErrorCode code = source.open();
  if (code == kErrorCodeFsNotFound) {
    LOG(WARNING) << path << " disappeared during the backup. Skipped";
    return kErrorCodeOk;
  }
  CHECK_ERROR_CODE(code);
  return part->add_entry(entry, &source);
}

void BackupPusher::remember_error(ErrorCode code) {
  if (code == kErrorCodeOk) {
    return;
  }
  std::lock_guard<std::mutex> guard(error_mutex_);
  if (first_error_ == kErrorCodeOk) {
    first_error_ = code;
  }
}

void BackupPusher::handle_producer(tar::TarBundleQueue* bundle, const fs::Path& root) {
  while (true) {
    {
      std::lock_guard<std::mutex> guard(error_mutex_);
      if (first_error_ != kErrorCodeOk) {
        break;
      }
    }
    uint64_t index = next_entry_++;
    if (index >= entries_.size()) {
      break;
    }
    tar::TarPart* part = bundle->dequeue();
    ErrorCode code = add_to_part(part, root, entries_[index]);
    if (code != kErrorCodeOk) {
      LOG(ERROR) << "Failed to add " << entries_[index] << ": " << get_error_name(code);
      remember_error(code);
      // a broken part is closed right away. its error is reported by finish() too.
      remember_error(bundle->enqueue_back(part, true));
    } else {
      remember_error(bundle->check_size_and_enqueue_back(part));
    }
  }
}

ErrorCode BackupPusher::store_sentinel(const std::string& server, const BackupSentinel& sentinel) {
  std::string xml;
  ErrorStack save_result = sentinel.save_to_string(&xml);
  if (save_result.is_error()) {
    LOG(ERROR) << "Could not serialize the sentinel: " << save_result;
    return save_result.get_error_code();
  }
  stream::MemorySource source(xml);
  storage::UploadResult result;
  CHECK_ERROR_CODE(uploader_->submit(
    &source,
    sentinel_object_path(server, sentinel.backup_name_),
    &result));
  LOG(INFO) << "Stored the backup sentinel at " << result.location_;
  return kErrorCodeOk;
}

ErrorCode BackupPusher::push(const BackupRequest& request, BackupSentinel* sentinel) {
  LOG(INFO) << "Backup push: " << request;
  if (!request.finish_lsn_.empty()) {
    wal::Lsn lsn;
    CHECK_ERROR_CODE(wal::parse_lsn(request.finish_lsn_, &lsn));
  }
  if (!fs::is_directory(request.data_dir_)) {
    LOG(ERROR) << request.data_dir_ << " is not a folder";
    return kErrorCodeArchiveNoDataDir;
  }
  fs::Path pg_control(request.data_dir_);
  pg_control /= kPgControlPath;
  if (!fs::is_regular_file(pg_control)) {
    LOG(ERROR) << pg_control << " does not exist. Is this a data directory?";
    return kErrorCodeArchiveNoSentinel;
  }

  entries_.clear();
  next_entry_ = 0;
  first_error_ = kErrorCodeOk;
  CHECK_ERROR_CODE(walk(request.data_dir_, request.data_dir_, &entries_));
  LOG(INFO) << "Found " << entries_.size() << " entries to archive in " << request.data_dir_;

  tar::TarBundleQueue bundle(
    uploader_,
    crypter_,
    partitions_prefix(server_, request.backup_name_),
    tar_size_threshold_,
    verify_);
  bundle.start(tar_concurrency_);
  std::vector<std::thread> producers;
  const uint16_t producer_count = std::max<uint16_t>(request.producers_, 1);
  for (uint16_t i = 0; i < producer_count; ++i) {
    producers.emplace_back(&BackupPusher::handle_producer, this, &bundle, request.data_dir_);
  }
  for (std::thread& producer : producers) {
    producer.join();
  }
  ErrorCode finish_result = bundle.finish();
  if (first_error_ != kErrorCodeOk) {
    return first_error_;
  }
  CHECK_ERROR_CODE(finish_result);

  fs::FileStatus control_status = fs::status(pg_control);
  tar::TarEntry control_entry;
  control_entry.name_ = kPgControlPath;
  control_entry.mode_ = control_status.mode_;
  control_entry.size_ = control_status.size_;
  control_entry.mtime_ = control_status.mtime_;
  stream::FileSource control_source(pg_control);
  CHECK_ERROR_CODE(control_source.open());
  CHECK_ERROR_CODE(bundle.handle_sentinel(control_entry, &control_source));

  if (!request.backup_label_.empty()) {
    CHECK_ERROR_CODE(bundle.handle_label_files(request.backup_label_, request.tablespace_map_));
  }

  sentinel->backup_name_ = request.backup_name_;
  sentinel->finish_lsn_ = request.finish_lsn_;
  sentinel->part_count_ = bundle.get_uploaded_part_count();
  sentinel->uncompressed_size_ = static_cast<int64_t>(bundle.get_uncompressed_bytes());
  sentinel->user_data_ = request.user_data_;
  CHECK_ERROR_CODE(store_sentinel(server_, *sentinel));
  LOG(INFO) << "Backup " << request.backup_name_ << " is complete with "
    << sentinel->part_count_ << " parts";
  return kErrorCodeOk;
}

std::ostream& operator<<(std::ostream& o, const BackupRequest& v) {
  o << "<BackupRequest>"
    << "<data_dir_>" << v.data_dir_ << "</data_dir_>"
    << "<backup_name_>" << v.backup_name_ << "</backup_name_>"
    << "<finish_lsn_>" << v.finish_lsn_ << "</finish_lsn_>"
    << "<producers_>" << v.producers_ << "</producers_>"
    << "</BackupRequest>";
  return o;
}

}  // namespace archive
}  // namespace walarc
