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
#include "walarc/tar/tar_writer.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cstring>

#include "walarc/assert_nd.hpp"
#include "walarc/stream/byte_stream.hpp"

namespace walarc {
namespace tar {
namespace {
const char kZeroBlock[kTarBlockSize] = {0};
}  // namespace

TarWriter::TarWriter(stream::ByteSink* sink)
  : sink_(sink), written_bytes_(0), entry_count_(0), closed_(false) {
  ASSERT_ND(sink_);
}

ErrorCode TarWriter::write_padding(uint64_t body_size) {
  uint64_t padding = tar_padding(body_size);
  if (padding > 0) {
    CHECK_ERROR_CODE(sink_->write(kZeroBlock, padding));
    written_bytes_ += padding;
  }
  return kErrorCodeOk;
}

ErrorCode TarWriter::add_entry(const TarEntry& entry, stream::ByteSource* body) {
  if (closed_) {
    LOG(ERROR) << "Tried to add " << entry.name_ << " to a closed tar archive";
    return kErrorCodeTarWriteAfterClose;
  }
  char header[kTarBlockSize];
  CHECK_ERROR_CODE(entry.encode(header));
  CHECK_ERROR_CODE(sink_->write(header, kTarBlockSize));
  written_bytes_ += kTarBlockSize;
  ++entry_count_;
  if (entry.type_ != kTarRegularFile || entry.size_ == 0) {
    return kErrorCodeOk;
  }

  ASSERT_ND(body);
  char buffer[1 << 14];
  uint64_t remaining = entry.size_;
  while (remaining > 0) {
    uint64_t desired = std::min<uint64_t>(remaining, sizeof(buffer));
    uint64_t read_bytes;
    CHECK_ERROR_CODE(stream::read_fully(body, buffer, desired, &read_bytes));
    if (read_bytes == 0) {
      LOG(ERROR) << entry.name_ << " ended after " << (entry.size_ - remaining) << " bytes, "
        << "but its header says " << entry.size_ << " bytes. Did it shrink while reading it?";
      return kErrorCodeTarSizeMismatch;
    }
    CHECK_ERROR_CODE(sink_->write(buffer, read_bytes));
    written_bytes_ += read_bytes;
    remaining -= read_bytes;
  }
  return write_padding(entry.size_);
}

ErrorCode TarWriter::add_buffer(const TarEntry& entry, const void* data) {
  if (closed_) {
    LOG(ERROR) << "Tried to add " << entry.name_ << " to a closed tar archive";
    return kErrorCodeTarWriteAfterClose;
  }
  char header[kTarBlockSize];
  CHECK_ERROR_CODE(entry.encode(header));
  CHECK_ERROR_CODE(sink_->write(header, kTarBlockSize));
  written_bytes_ += kTarBlockSize;
  ++entry_count_;
  if (entry.type_ != kTarRegularFile || entry.size_ == 0) {
    return kErrorCodeOk;
  }
  CHECK_ERROR_CODE(sink_->write(data, entry.size_));
  written_bytes_ += entry.size_;
  return write_padding(entry.size_);
}

ErrorCode TarWriter::close() {
  if (closed_) {
    return kErrorCodeOk;
  }
  closed_ = true;
  CHECK_ERROR_CODE(sink_->write(kZeroBlock, kTarBlockSize));
  CHECK_ERROR_CODE(sink_->write(kZeroBlock, kTarBlockSize));
  written_bytes_ += kTarBlockSize * 2U;
  return kErrorCodeOk;
}

}  // namespace tar
}  // namespace walarc
