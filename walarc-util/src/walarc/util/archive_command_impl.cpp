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
#include "walarc/util/archive_command.hpp"

#include <glog/logging.h>

#include <iostream>
#include <string>

#include "walarc/archive/archive_options.hpp"
#include "walarc/archive/archiver.hpp"
#include "walarc/archive/backup_pusher_impl.hpp"
#include "walarc/archive/backup_sentinel.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/stream/byte_stream.hpp"
#include "walarc/stream/file_stream.hpp"
#include "walarc/stream/memory_stream.hpp"

namespace walarc {
namespace util {

ArchiveCommand::Command ArchiveCommand::parse_command(const std::string& name) {
  if (name == "wal-push") {
    return kWalPush;
  } else if (name == "backup-push") {
    return kBackupPush;
  }
  return kInvalidCommand;
}

const char* ArchiveCommand::command_name(Command command) {
  switch (command) {
    case kWalPush: return "wal-push";
    case kBackupPush: return "backup-push";
    default: return "invalid";
  }
}

namespace {
/** Reads a whole small file such as backup_label. */
ErrorStack read_text_file(const fs::Path& path, std::string* out) {
  stream::FileSource source(path);
  WRAP_ERROR_CODE(source.open());
  stream::MemorySink sink;
  uint64_t copied;
  WRAP_ERROR_CODE(stream::copy_stream(&source, &sink, &copied));
  *out = sink.get_data();
  return kRetOk;
}
}  // namespace

int ArchiveCommand::run() {
  ErrorStack result = run_impl();
  if (result.is_error()) {
    std::cerr << command_name(command_) << " failed: " << result << std::endl;
    return 1;
  }
  return 0;
}

ErrorStack ArchiveCommand::run_impl() {
  if (command_ == kInvalidCommand) {
    return ERROR_STACK_MSG(kErrorCodeInvalidParameter, "unknown command");
  }
  archive::ArchiveOptions options;
  if (!config_file_.empty()) {
    CHECK_ERROR(options.load_from_file(config_file_));
  }
  CHECK_ERROR(options.load_from_env());
  if (verify_) {
    options.verify_upload_ = true;
  }
  options.debugging_.debug_log_to_stderr_ = true;
  if (verbose_ > 0) {
    options.debugging_.verbose_log_level_ = verbose_;
  }

  archive::Archiver archiver(options);
  CHECK_ERROR(archiver.initialize());
  ErrorStack result;
  if (command_ == kWalPush) {
    result = archiver.wal_push(target_);
  } else {
    archive::BackupRequest request;
    request.data_dir_ = target_;
    request.backup_name_ = backup_name_;
    request.finish_lsn_ = finish_lsn_;
    request.user_data_ = user_data_;
    request.producers_ = producers_;
    if (!backup_label_file_.empty()) {
      result = read_text_file(backup_label_file_, &request.backup_label_);
    }
    if (!result.is_error() && !tablespace_map_file_.empty()) {
      result = read_text_file(tablespace_map_file_, &request.tablespace_map_);
    }
    if (!result.is_error()) {
      archive::BackupSentinel sentinel;
      result = archiver.backup_push(request, &sentinel);
      if (!result.is_error()) {
        std::cout << sentinel << std::endl;
      }
    }
  }
  // uninitialize even after a failure, but report the command's error first
  ErrorStack uninit = archiver.uninitialize();
  if (result.is_error()) {
    return result;
  }
  return uninit;
}

std::ostream& operator<<(std::ostream& o, const ArchiveCommand& v) {
  o << "<ArchiveCommand>"
    << "<command_>" << ArchiveCommand::command_name(v.command_) << "</command_>"
    << "<target_>" << v.target_ << "</target_>"
    << "<config_file_>" << v.config_file_ << "</config_file_>"
    << "<verify_>" << v.verify_ << "</verify_>"
    << "<backup_name_>" << v.backup_name_ << "</backup_name_>"
    << "<finish_lsn_>" << v.finish_lsn_ << "</finish_lsn_>"
    << "<producers_>" << v.producers_ << "</producers_>"
    << "</ArchiveCommand>";
  return o;
}

}  // namespace util
}  // namespace walarc
