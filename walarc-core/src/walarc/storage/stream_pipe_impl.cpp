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
#include "walarc/storage/stream_pipe_impl.hpp"

#include <glog/logging.h>

#include <memory>
#include <ostream>
#include <string>

#include "walarc/assert_nd.hpp"
#include "walarc/crypto/crypter.hpp"
#include "walarc/stream/md5_source.hpp"

namespace walarc {
namespace storage {

StreamPipe::StreamPipe(
  Uploader* uploader,
  crypto::Crypter* crypter,
  const std::string& path,
  bool verify)
  : uploader_(uploader),
    crypter_(crypter),
    path_(path),
    verify_(verify),
    started_(false),
    closed_(false),
    joined_(false),
    upload_over_(false) {
  ASSERT_ND(uploader_);
  ASSERT_ND(crypter_);
}

StreamPipe::~StreamPipe() {
  if (started_ && !closed_) {
    LOG(WARNING) << "StreamPipe of " << path_ << " destructed without close(). Aborting it";
    abort(kErrorCodeStrPipeAborted);
  }
  if (started_ && !joined_) {
    upload_thread_.join();
    joined_ = true;
  }
}

ErrorCode StreamPipe::start(stream::ByteSink** sink) {
  ASSERT_ND(!started_);
  stream::ByteSink* encrypt_sink = nullptr;
  CHECK_ERROR_CODE(crypter_->encrypt(pipe_.get_writer(), &encrypt_sink));
  encrypt_sink_.reset(encrypt_sink);
  compress_sink_.reset(new stream::Lz4CompressSink(encrypt_sink_.get()));

  uploader_->register_upload();
  started_ = true;
  upload_thread_ = std::thread(&StreamPipe::upload_thread_main, this);
  *sink = compress_sink_.get();
  return kErrorCodeOk;
}

ErrorCode StreamPipe::close() {
  ASSERT_ND(started_);
  if (closed_) {
    return kErrorCodeOk;
  }
  closed_ = true;
  ErrorCode result = compress_sink_->close();
  if (result != kErrorCodeOk) {
    LOG(ERROR) << "Failed to flush the stream of " << path_ << ": " << get_error_name(result);
    pipe_.close_write(result);
  }
  return result;
}

void StreamPipe::abort(ErrorCode cause) {
  ASSERT_ND(started_);
  ASSERT_ND(cause != kErrorCodeOk);
  if (closed_) {
    return;
  }
  closed_ = true;
  pipe_.close_write(cause);
}

ErrorCode StreamPipe::wait(UploadResult* result) {
  ASSERT_ND(started_);
  if (!joined_) {
    upload_thread_.join();
    joined_ = true;
  }
  if (result) {
    *result = result_;
  }
  return result_.error_;
}

ErrorCode StreamPipe::upload_all(stream::ByteSource* source, UploadResult* result) {
  stream::ByteSink* sink;
  CHECK_ERROR_CODE(start(&sink));
  uint64_t copied = 0;
  ErrorCode local_result = stream::copy_stream(source, sink, &copied);
  if (local_result != kErrorCodeOk) {
    abort(local_result);
  } else {
    local_result = close();
  }
  ErrorCode upload_result = wait(result);
  if (local_result != kErrorCodeOk) {
    // the upload merely saw the abort. the local error is the root cause.
    return local_result;
  }
  return upload_result;
}

uint64_t StreamPipe::get_uncompressed_bytes() const {
  return compress_sink_ ? compress_sink_->get_uncompressed_bytes() : 0;
}

void StreamPipe::upload_thread_main() {
  stream::ByteSource* body = pipe_.get_reader();
  std::unique_ptr<stream::Md5Source> md5;
  if (verify_) {
    md5.reset(new stream::Md5Source(body));
    body = md5.get();
  }

  ErrorCode code = uploader_->submit(body, path_, &result_);
  if (code == kErrorCodeOk && verify_) {
    code = md5->hex_digest(&result_.checksum_);
    std::string remote_checksum;
    if (code == kErrorCodeOk) {
      code = uploader_->head(path_, &remote_checksum);
    }
    if (code == kErrorCodeOk && remote_checksum != result_.checksum_) {
      LOG(ERROR) << "Integrity check of " << path_ << " failed. We sent "
        << result_.checksum_ << ", the store has " << remote_checksum;
      code = kErrorCodeIntegrityMismatch;
    } else if (code == kErrorCodeOk) {
      VLOG(0) << "Verified " << path_ << ", md5=" << remote_checksum;
    }
  }
  // lets the writer out if the upload stopped reading before the end.
  pipe_.close_read(code);
  result_.error_ = code;
  upload_over_ = true;
  uploader_->complete_upload();
}

std::ostream& operator<<(std::ostream& o, const StreamPipe& v) {
  o << "<StreamPipe>"
    << "<path_>" << v.path_ << "</path_>"
    << "<verify_>" << v.verify_ << "</verify_>"
    << "<started_>" << v.started_ << "</started_>"
    << "<closed_>" << v.closed_ << "</closed_>"
    << "<uncompressed_bytes>" << v.get_uncompressed_bytes() << "</uncompressed_bytes>"
    << v.pipe_
    << "</StreamPipe>";
  return o;
}

}  // namespace storage
}  // namespace walarc
