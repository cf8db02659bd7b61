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
#include "walarc/tar/tar_part_impl.hpp"

#include <glog/logging.h>

#include <ostream>
#include <string>

#include "walarc/assert_nd.hpp"
#include "walarc/storage/stream_pipe_impl.hpp"
#include "walarc/storage/uploader_impl.hpp"
#include "walarc/tar/tar_writer.hpp"

namespace walarc {
namespace tar {

TarPart::TarPart(
  uint32_t part_number,
  const std::string& object_path,
  storage::Uploader* uploader,
  crypto::Crypter* crypter,
  bool verify)
  : part_number_(part_number),
    object_path_(object_path),
    uploader_(uploader),
    crypter_(crypter),
    verify_(verify),
    error_(kErrorCodeOk),
    closed_(false) {
}

TarPart::~TarPart() {
  // writer_ refers to a stage owned by pipe_
  writer_.reset();
  pipe_.reset();
}

ErrorCode TarPart::set_up() {
  if (error_ != kErrorCodeOk) {
    return error_;
  }
  if (closed_) {
    return kErrorCodeTarWriteAfterClose;
  }
  if (pipe_) {
    return kErrorCodeOk;
  }
  std::unique_ptr<storage::StreamPipe> pipe(
    new storage::StreamPipe(uploader_, crypter_, object_path_, verify_));
  stream::ByteSink* sink;
  ErrorCode code = pipe->start(&sink);
  if (code != kErrorCodeOk) {
    error_ = code;
    return code;
  }
  pipe_ = std::move(pipe);
  writer_.reset(new TarWriter(sink));
  LOG(INFO) << "Starting part " << part_number_ << " (" << object_path_ << ")";
  return kErrorCodeOk;
}

ErrorCode TarPart::fail(ErrorCode cause) {
  ASSERT_ND(cause != kErrorCodeOk);
  LOG(ERROR) << "Part " << part_number_ << " failed: " << get_error_name(cause)
    << ". Aborting its upload";
  error_ = cause;
  if (pipe_) {
    pipe_->abort(cause);
  }
  return cause;
}

ErrorCode TarPart::add_entry(const TarEntry& entry, stream::ByteSource* body) {
  CHECK_ERROR_CODE(set_up());
  ErrorCode code = writer_->add_entry(entry, body);
  if (code != kErrorCodeOk) {
    return fail(code);
  }
  return kErrorCodeOk;
}

ErrorCode TarPart::add_buffer(const TarEntry& entry, const void* data) {
  CHECK_ERROR_CODE(set_up());
  ErrorCode code = writer_->add_buffer(entry, data);
  if (code != kErrorCodeOk) {
    return fail(code);
  }
  return kErrorCodeOk;
}

ErrorCode TarPart::close() {
  if (closed_) {
    return error_;
  }
  closed_ = true;
  if (error_ != kErrorCodeOk || !pipe_) {
    return error_;
  }
  ErrorCode code = writer_->close();
  if (code != kErrorCodeOk) {
    return fail(code);
  }
  // StreamPipe::close() aborts the upload itself when it fails.
  error_ = pipe_->close();
  VLOG(0) << "Closed part " << part_number_ << ", " << writer_->get_written_bytes() << " bytes";
  return error_;
}

ErrorCode TarPart::wait(storage::UploadResult* result) {
  ASSERT_ND(closed_);
  if (!pipe_) {
    return error_;
  }
  ErrorCode code = pipe_->wait(result);
  return error_ != kErrorCodeOk ? error_ : code;
}

bool TarPart::is_upload_over() const {
  return !pipe_ || pipe_->is_upload_over();
}

uint64_t TarPart::get_size() const {
  return writer_ ? writer_->get_written_bytes() : 0;
}

uint32_t TarPart::get_entry_count() const {
  return writer_ ? writer_->get_entry_count() : 0;
}

std::ostream& operator<<(std::ostream& o, const TarPart& v) {
  o << "<TarPart>"
    << "<part_number_>" << v.part_number_ << "</part_number_>"
    << "<object_path_>" << v.object_path_ << "</object_path_>"
    << "<size>" << v.get_size() << "</size>"
    << "<closed_>" << v.closed_ << "</closed_>"
    << "<error_>" << get_error_name(v.error_) << "</error_>"
    << "</TarPart>";
  return o;
}

}  // namespace tar
}  // namespace walarc
