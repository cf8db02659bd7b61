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
#include "walarc/stream/pipe_impl.hpp"

#include <glog/logging.h>

#include <cstring>
#include <ostream>

#include "walarc/assert_nd.hpp"

namespace walarc {
namespace stream {

Pipe::Pipe()
  : pending_(nullptr),
    pending_size_(0),
    write_closed_(false),
    read_closed_(false),
    write_close_cause_(kErrorCodeOk),
    read_close_cause_(kErrorCodeOk),
    transferred_(0),
    reader_(this),
    writer_(this) {
}

ErrorCode Pipe::write(const void* buffer, uint64_t size) {
  if (write_closed_) {
    return kErrorCodeStrAlreadyClosed;
  } else if (read_closed_) {
    return read_close_cause_;
  } else if (size == 0) {
    return kErrorCodeOk;
  }
  condition_.notify_all([this, buffer, size]{
    pending_ = reinterpret_cast<const char*>(buffer);
    pending_size_ = size;
  });
  condition_.wait([this]{ return pending_size_ == 0 || read_closed_; });
  if (pending_size_ > 0) {
    // the reader went away with our bytes half-consumed. forget about the buffer.
    condition_.notify_all([this]{
      pending_ = nullptr;
      pending_size_ = 0;
    });
    return read_close_cause_;
  }
  return kErrorCodeOk;
}

ErrorCode Pipe::read(void* buffer, uint64_t desired, uint64_t* read_bytes) {
  *read_bytes = 0;
  if (read_closed_) {
    return kErrorCodeStrAlreadyClosed;
  } else if (desired == 0) {
    return kErrorCodeOk;
  }
  condition_.wait([this]{ return pending_size_ > 0 || write_closed_; });
  if (pending_size_ == 0) {
    ASSERT_ND(write_closed_);
    return write_close_cause_;  // kErrorCodeOk means a clean EOF
  }
  // Only this thread consumes pending_, and the writer is blocked until it is fully consumed.
  uint64_t copied = desired < pending_size_ ? desired : pending_size_;
  std::memcpy(buffer, pending_, copied);
  condition_.notify_all([this, copied]{
    pending_ += copied;
    pending_size_ -= copied;
  });
  transferred_ += copied;
  *read_bytes = copied;
  return kErrorCodeOk;
}

void Pipe::close_write(ErrorCode cause) {
  condition_.notify_all([this, cause]{
    if (!write_closed_) {
      write_close_cause_ = cause;
      write_closed_ = true;
    }
  });
  if (cause != kErrorCodeOk) {
    LOG(INFO) << "Pipe write side closed with " << get_error_name(cause) << ". " << *this;
  }
}

void Pipe::close_read(ErrorCode cause) {
  condition_.notify_all([this, cause]{
    if (!read_closed_) {
      read_close_cause_ = cause == kErrorCodeOk ? kErrorCodeStrPipeClosed : cause;
      read_closed_ = true;
    }
  });
}

ErrorCode PipeReader::read(void* buffer, uint64_t desired, uint64_t* read_bytes) {
  return pipe_->read(buffer, desired, read_bytes);
}

ErrorCode PipeWriter::write(const void* buffer, uint64_t size) {
  return pipe_->write(buffer, size);
}

ErrorCode PipeWriter::close() {
  pipe_->close_write(kErrorCodeOk);
  return kErrorCodeOk;
}

std::ostream& operator<<(std::ostream& o, const Pipe& v) {
  o << "<Pipe>"
    << "<transferred_>" << v.transferred_.load() << "</transferred_>"
    << "<write_closed_>" << v.write_closed_.load() << "</write_closed_>"
    << "<read_closed_>" << v.read_closed_.load() << "</read_closed_>"
    << "</Pipe>";
  return o;
}

}  // namespace stream
}  // namespace walarc
