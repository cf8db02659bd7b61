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
#include "walarc/archive/archiver_pimpl.hpp"

#include <glog/logging.h>

#include <string>

#include "walarc/archive/backup_pusher_impl.hpp"
#include "walarc/archive/backup_sentinel.hpp"
#include "walarc/archive/wal_pusher_impl.hpp"
#include "walarc/crypto/openssl_crypter_impl.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/storage/filesystem_storage_client.hpp"

namespace walarc {
namespace archive {
ArchiverPimpl::ArchiverPimpl(const ArchiveOptions& options)
  : options_(options), debug_(options_.debugging_) {
}

ErrorStack ArchiverPimpl::initialize_once() {
  CHECK_ERROR(debug_.initialize());  // glog is available since now
  LOG(INFO) << "Initializing walarc for " << options_.storage_prefix_ << "...";
  WRAP_ERROR_CODE(options_.storage_.validate());
  WRAP_ERROR_CODE(StoragePrefix::parse(options_.storage_prefix_, &prefix_));
  WRAP_ERROR_CODE(create_storage_client());

  if (options_.crypto_.is_armed()) {
    LOG(INFO) << "Objects are encrypted with " << options_.crypto_.public_key_path_;
    crypter_.reset(new crypto::OpensslCrypter(options_.crypto_));
  } else {
    crypter_.reset(new crypto::NoopCrypter());
  }
  uploader_.reset(new storage::Uploader(storage_client_.get()));
  LOG(INFO) << "Initialized walarc. server=" << prefix_.server_;
  return kRetOk;
}

ErrorCode ArchiverPimpl::create_storage_client() {
  if (prefix_.scheme_ != "file") {
    LOG(ERROR) << "Scheme '" << prefix_.scheme_ << "' is not served by this build";
    return kErrorCodeStorageUnsupportedScheme;
  }
  fs::Path root(options_.local_bucket_root_);
  root /= prefix_.bucket_;
  if (!fs::create_directories(root)) {
    LOG(ERROR) << "Could not create the bucket folder " << root;
    return kErrorCodeFsMkdirFailed;
  }
  storage_client_.reset(new storage::FilesystemStorageClient(options_.storage_, root));
  return kErrorCodeOk;
}

ErrorStack ArchiverPimpl::uninitialize_once() {
  LOG(INFO) << "Uninitializing walarc...";
  if (uploader_) {
    // uploads started by this process must not outlive the objects they use
    uploader_->await_all();
    uploader_.reset();
  }
  crypter_.reset();
  storage_client_.reset();
  // glog goes away at last
  return debug_.uninitialize();
}

ErrorStack ArchiverPimpl::wal_push(const fs::Path& segment_file) {
  if (!is_initialized()) {
    return ERROR_STACK(kErrorCodeNotInitialized);
  }
  WalPusher pusher(uploader_.get(), crypter_.get(), prefix_.server_, options_.verify_upload_);
  WRAP_ERROR_CODE(pusher.push(segment_file, options_.background_upload_workers_));
  return kRetOk;
}

ErrorStack ArchiverPimpl::backup_push(const BackupRequest& request, BackupSentinel* sentinel) {
  if (!is_initialized()) {
    return ERROR_STACK(kErrorCodeNotInitialized);
  }
  BackupRequest effective(request);
  if (effective.user_data_.empty()) {
    effective.user_data_ = options_.sentinel_user_data_;
  }
  BackupPusher pusher(
    uploader_.get(),
    crypter_.get(),
    prefix_.server_,
    options_.tar_upload_concurrency_,
    options_.tar_size_threshold_,
    options_.verify_upload_);
  BackupSentinel stored;
  ErrorCode code = pusher.push(effective, &stored);
  if (code != kErrorCodeOk) {
    return ERROR_STACK_MSG(code, effective.backup_name_.c_str());
  }
  LOG(INFO) << "Backup " << stored.backup_name_ << " is complete with " << stored.part_count_
    << " parts";
  if (sentinel) {
    *sentinel = stored;
  }
  return kRetOk;
}

}  // namespace archive
}  // namespace walarc
