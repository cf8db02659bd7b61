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
#include "walarc/tar/tar_reader.hpp"

#include <glog/logging.h>

#include <algorithm>

#include "walarc/assert_nd.hpp"
#include "walarc/stream/byte_stream.hpp"

namespace walarc {
namespace tar {

TarReader::TarReader(stream::ByteSource* source)
  : source_(source), remaining_body_(0), remaining_padding_(0), ended_(false) {
  ASSERT_ND(source_);
}

ErrorCode TarReader::skip_rest() {
  char buffer[kTarBlockSize * 8];
  uint64_t remaining = remaining_body_ + remaining_padding_;
  while (remaining > 0) {
    uint64_t desired = std::min<uint64_t>(remaining, sizeof(buffer));
    uint64_t read_bytes;
    CHECK_ERROR_CODE(stream::read_fully(source_, buffer, desired, &read_bytes));
    if (read_bytes < desired) {
      return kErrorCodeTarCorrupted;
    }
    remaining -= read_bytes;
  }
  remaining_body_ = 0;
  remaining_padding_ = 0;
  return kErrorCodeOk;
}

ErrorCode TarReader::next(TarEntry* entry, bool* end) {
  *end = false;
  if (ended_) {
    *end = true;
    return kErrorCodeOk;
  }
  CHECK_ERROR_CODE(skip_rest());
  char block[kTarBlockSize];
  uint64_t read_bytes;
  CHECK_ERROR_CODE(stream::read_fully(source_, block, kTarBlockSize, &read_bytes));
  if (read_bytes == 0) {
    // tolerate a missing end-of-archive marker
    ended_ = true;
    *end = true;
    return kErrorCodeOk;
  } else if (read_bytes < kTarBlockSize) {
    return kErrorCodeTarCorrupted;
  }
  bool all_zero = true;
  for (uint32_t i = 0; i < kTarBlockSize; ++i) {
    if (block[i] != 0) {
      all_zero = false;
      break;
    }
  }
  if (all_zero) {
    ended_ = true;
    *end = true;
    return kErrorCodeOk;
  }
  CHECK_ERROR_CODE(entry->decode(block));
  if (entry->type_ == kTarRegularFile) {
    remaining_body_ = entry->size_;
    remaining_padding_ = tar_padding(entry->size_);
  }
  VLOG(1) << "Read tar header " << *entry;
  return kErrorCodeOk;
}

ErrorCode TarReader::read_body(stream::ByteSink* sink) {
  char buffer[1 << 14];
  while (remaining_body_ > 0) {
    uint64_t desired = std::min<uint64_t>(remaining_body_, sizeof(buffer));
    uint64_t read_bytes;
    CHECK_ERROR_CODE(stream::read_fully(source_, buffer, desired, &read_bytes));
    if (read_bytes < desired) {
      return kErrorCodeTarCorrupted;
    }
    CHECK_ERROR_CODE(sink->write(buffer, read_bytes));
    remaining_body_ -= read_bytes;
  }
  return kErrorCodeOk;
}

}  // namespace tar
}  // namespace walarc
