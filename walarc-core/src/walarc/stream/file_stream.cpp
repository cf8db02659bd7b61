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
#include "walarc/stream/file_stream.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <ostream>

#include "walarc/assorted/assorted_func.hpp"
#include "walarc/fs/filesystem.hpp"

namespace walarc {
namespace stream {

FileSource::FileSource(const fs::Path& path)
  : path_(path), descriptor_(kInvalidDescriptor), read_bytes_(0) {
}

FileSource::~FileSource() {
  close();
}

ErrorCode FileSource::open() {
  if (is_opened()) {
    return kErrorCodeOk;
  }
  descriptor_ = ::open(path_.c_str(), O_RDONLY);
  if (descriptor_ == kInvalidDescriptor) {
    int error_number = errno;
    LOG(ERROR) << "FileSource::open(): failed to open " << path_
      << ". err=" << assorted::os_error(error_number);
    return error_number == ENOENT ? kErrorCodeFsNotFound : kErrorCodeFsOpenFailed;
  }
  VLOG(1) << "FileSource::open(): opened " << path_;
  return kErrorCodeOk;
}

ErrorCode FileSource::read(void* buffer, uint64_t desired, uint64_t* read_bytes) {
  *read_bytes = 0;
  if (!is_opened()) {
    LOG(ERROR) << "File not opened yet, or closed. this=" << *this;
    return kErrorCodeFsReadFailed;
  }
  while (true) {
    ssize_t ret = ::read(descriptor_, buffer, desired);
    if (ret >= 0) {
      *read_bytes = static_cast<uint64_t>(ret);
      read_bytes_ += *read_bytes;
      return kErrorCodeOk;
    } else if (errno != EINTR) {
      LOG(ERROR) << "FileSource::read(): error. this=" << *this
        << ", desired=" << desired << ", err=" << assorted::os_error();
      return kErrorCodeFsReadFailed;
    }
  }
}

void FileSource::close() {
  if (is_opened()) {
    ::close(descriptor_);
    descriptor_ = kInvalidDescriptor;
  }
}

std::ostream& operator<<(std::ostream& o, const FileSource& v) {
  o << "<FileSource>"
    << "<path>" << v.path_ << "</path>"
    << "<descriptor>" << v.descriptor_ << "</descriptor>"
    << "<read_bytes_>" << v.read_bytes_ << "</read_bytes_>"
    << "</FileSource>";
  return o;
}

FileSink::FileSink(const fs::Path& path)
  : path_(path), descriptor_(kInvalidDescriptor), written_bytes_(0), closed_(false) {
}

FileSink::~FileSink() {
  if (is_opened()) {
    // Not closed by the owner. We can't report an error from here, so just release it.
    LOG(WARNING) << "FileSink destructed without close(). " << *this;
    ::close(descriptor_);
    descriptor_ = kInvalidDescriptor;
  }
}

ErrorCode FileSink::open(uint32_t mode) {
  if (is_opened()) {
    return kErrorCodeOk;
  }
  fs::Path folder(path_.parent_path());
  if (!folder.empty() && !fs::exists(folder)) {
    if (!fs::create_directories(folder, false)) {
      LOG(ERROR) << "FileSink::open(): failed to create parent folder: "
        << folder << ". err=" << assorted::os_error();
      return kErrorCodeFsMkdirFailed;
    }
  }
  descriptor_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, static_cast<mode_t>(mode));
  if (descriptor_ == kInvalidDescriptor) {
    LOG(ERROR) << "FileSink::open(): failed to open " << path_
      << ". err=" << assorted::os_error();
    return kErrorCodeFsOpenFailed;
  }
  closed_ = false;
  written_bytes_ = 0;
  return kErrorCodeOk;
}

ErrorCode FileSink::write(const void* buffer, uint64_t size) {
  if (closed_) {
    return kErrorCodeStrAlreadyClosed;
  } else if (!is_opened()) {
    LOG(ERROR) << "File not opened yet. this=" << *this;
    return kErrorCodeFsWriteFailed;
  }
  // underlying POSIX filesystem might split the write for severel reasons. so, while loop.
  const char* position = reinterpret_cast<const char*>(buffer);
  uint64_t remaining = size;
  while (remaining > 0) {
    ssize_t ret = ::write(descriptor_, position, remaining);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "FileSink::write(): error. this=" << *this
        << ", remaining=" << remaining << ", err=" << assorted::os_error();
      return kErrorCodeFsWriteFailed;
    }
    position += ret;
    remaining -= ret;
    written_bytes_ += ret;
  }
  return kErrorCodeOk;
}

ErrorCode FileSink::close() {
  if (closed_ || !is_opened()) {
    closed_ = true;
    return kErrorCodeOk;
  }
  closed_ = true;
  ErrorCode result = kErrorCodeOk;
  if (::fsync(descriptor_) != 0) {
    LOG(ERROR) << "FileSink::close(): fsync failed. this=" << *this
      << ", err=" << assorted::os_error();
    result = kErrorCodeFsSyncFailed;
  }
  if (::close(descriptor_) != 0 && result == kErrorCodeOk) {
    LOG(ERROR) << "FileSink::close(): close failed. this=" << *this
      << ", err=" << assorted::os_error();
    result = kErrorCodeFsWriteFailed;
  }
  descriptor_ = kInvalidDescriptor;
  return result;
}

std::ostream& operator<<(std::ostream& o, const FileSink& v) {
  o << "<FileSink>"
    << "<path>" << v.path_ << "</path>"
    << "<descriptor>" << v.descriptor_ << "</descriptor>"
    << "<written_bytes_>" << v.written_bytes_ << "</written_bytes_>"
    << "</FileSink>";
  return o;
}

}  // namespace stream
}  // namespace walarc
