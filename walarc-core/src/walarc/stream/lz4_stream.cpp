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
#include "walarc/stream/lz4_stream.hpp"

#include <glog/logging.h>
#include <lz4frame.h>

#include <cstring>
#include <vector>

namespace walarc {
namespace stream {
/** We feed LZ4F at most this many bytes at once so that out_buffer_ has a fixed bound. */
const uint64_t kLz4ChunkSize = 1ULL << 16;

Lz4CompressSink::Lz4CompressSink(ByteSink* downstream)
  : downstream_(downstream),
    context_(nullptr),
    begun_(false),
    closed_(false),
    uncompressed_bytes_(0),
    compressed_bytes_(0) {
}

Lz4CompressSink::~Lz4CompressSink() {
  if (context_) {
    LZ4F_freeCompressionContext(context_);
    context_ = nullptr;
  }
}

ErrorCode Lz4CompressSink::begin_frame() {
  if (begun_) {
    return kErrorCodeOk;
  }
  LZ4F_errorCode_t created = LZ4F_createCompressionContext(&context_, LZ4F_VERSION);
  if (LZ4F_isError(created)) {
    LOG(ERROR) << "LZ4F_createCompressionContext failed: " << LZ4F_getErrorName(created);
    return kErrorCodeStrCompressFailed;
  }
  std::size_t bound = LZ4F_compressBound(kLz4ChunkSize, nullptr);
  if (bound < LZ4F_HEADER_SIZE_MAX) {
    bound = LZ4F_HEADER_SIZE_MAX;
  }
  out_buffer_.resize(bound);
  std::size_t header = LZ4F_compressBegin(context_, &out_buffer_[0], out_buffer_.size(), nullptr);
  if (LZ4F_isError(header)) {
    LOG(ERROR) << "LZ4F_compressBegin failed: " << LZ4F_getErrorName(header);
    return kErrorCodeStrCompressFailed;
  }
  begun_ = true;
  return forward(header);
}

ErrorCode Lz4CompressSink::forward(uint64_t size) {
  if (size == 0) {
    return kErrorCodeOk;
  }
  compressed_bytes_ += size;
  return downstream_->write(&out_buffer_[0], size);
}

ErrorCode Lz4CompressSink::write(const void* buffer, uint64_t size) {
  if (closed_) {
    return kErrorCodeStrAlreadyClosed;
  }
  CHECK_ERROR_CODE(begin_frame());
  const char* position = reinterpret_cast<const char*>(buffer);
  uint64_t remaining = size;
  while (remaining > 0) {
    uint64_t chunk = remaining < kLz4ChunkSize ? remaining : kLz4ChunkSize;
    std::size_t produced = LZ4F_compressUpdate(
      context_, &out_buffer_[0], out_buffer_.size(), position, chunk, nullptr);
    if (LZ4F_isError(produced)) {
      LOG(ERROR) << "LZ4F_compressUpdate failed: " << LZ4F_getErrorName(produced);
      return kErrorCodeStrCompressFailed;
    }
    CHECK_ERROR_CODE(forward(produced));
    position += chunk;
    remaining -= chunk;
    uncompressed_bytes_ += chunk;
  }
  return kErrorCodeOk;
}

ErrorCode Lz4CompressSink::close() {
  if (closed_) {
    return kErrorCodeOk;
  }
  closed_ = true;
  ErrorCode result = begin_frame();
  if (result == kErrorCodeOk) {
    std::size_t produced = LZ4F_compressEnd(context_, &out_buffer_[0], out_buffer_.size(), nullptr);
    if (LZ4F_isError(produced)) {
      LOG(ERROR) << "LZ4F_compressEnd failed: " << LZ4F_getErrorName(produced);
      result = kErrorCodeStrCompressFailed;
    } else {
      result = forward(produced);
    }
  }
  if (result != kErrorCodeOk) {
    // a clean close downstream would publish a truncated frame. leave it to the owner to abort.
    return result;
  }
  VLOG(1) << "Lz4CompressSink closed. " << uncompressed_bytes_ << " bytes into "
    << compressed_bytes_ << " bytes";
  return downstream_->close();
}

Lz4DecompressSource::Lz4DecompressSource(ByteSource* upstream)
  : upstream_(upstream),
    context_(nullptr),
    in_buffer_(kLz4ChunkSize),
    in_position_(0),
    in_size_(0),
    upstream_eof_(false),
    started_(false),
    frame_done_(false) {
}

Lz4DecompressSource::~Lz4DecompressSource() {
  if (context_) {
    LZ4F_freeDecompressionContext(context_);
    context_ = nullptr;
  }
}

ErrorCode Lz4DecompressSource::read(void* buffer, uint64_t desired, uint64_t* read_bytes) {
  *read_bytes = 0;
  if (desired == 0) {
    return kErrorCodeOk;
  }
  if (context_ == nullptr) {
    LZ4F_errorCode_t created = LZ4F_createDecompressionContext(&context_, LZ4F_VERSION);
    if (LZ4F_isError(created)) {
      LOG(ERROR) << "LZ4F_createDecompressionContext failed: " << LZ4F_getErrorName(created);
      return kErrorCodeStrDecompressFailed;
    }
  }
  while (true) {
    std::size_t src_size = in_size_ - in_position_;
    // with no new input, LZ4F may still hold decoded bytes that didn't fit the last time.
    if (src_size > 0 || (started_ && !frame_done_)) {
      std::size_t dst_size = desired;
      std::size_t hint = LZ4F_decompress(
        context_, buffer, &dst_size, &in_buffer_[in_position_], &src_size, nullptr);
      if (LZ4F_isError(hint)) {
        LOG(ERROR) << "LZ4F_decompress failed: " << LZ4F_getErrorName(hint);
        return kErrorCodeStrDecompressFailed;
      }
      started_ = true;
      in_position_ += src_size;
      frame_done_ = (hint == 0);
      if (dst_size > 0) {
        *read_bytes = dst_size;
        return kErrorCodeOk;
      }
    }
    if (in_position_ < in_size_) {
      continue;
    }
    if (upstream_eof_) {
      if (started_ && !frame_done_) {
        LOG(ERROR) << "LZ4 stream ended in the middle of a frame";
        return kErrorCodeStrDecompressFailed;
      }
      return kErrorCodeOk;
    }
    uint64_t got = 0;
    CHECK_ERROR_CODE(upstream_->read(&in_buffer_[0], in_buffer_.size(), &got));
    in_position_ = 0;
    in_size_ = got;
    if (got == 0) {
      upstream_eof_ = true;
    }
  }
}

}  // namespace stream
}  // namespace walarc
