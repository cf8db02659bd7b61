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
#include "walarc/stream/byte_stream.hpp"

#include <vector>

namespace walarc {
namespace stream {
const uint64_t kCopyBufferSize = 1ULL << 16;

ErrorCode read_fully(ByteSource* source, void* buffer, uint64_t desired, uint64_t* read_bytes) {
  char* position = reinterpret_cast<char*>(buffer);
  uint64_t total = 0;
  while (total < desired) {
    uint64_t got = 0;
    ErrorCode code = source->read(position + total, desired - total, &got);
    if (code != kErrorCodeOk) {
      *read_bytes = total;
      return code;
    }
    if (got == 0) {
      break;
    }
    total += got;
  }
  *read_bytes = total;
  return kErrorCodeOk;
}

ErrorCode copy_stream(ByteSource* source, ByteSink* sink, uint64_t* copied_bytes) {
  std::vector<char> buffer(kCopyBufferSize);
  uint64_t total = 0;
  ErrorCode result = kErrorCodeOk;
  while (true) {
    uint64_t got = 0;
    result = source->read(&buffer[0], buffer.size(), &got);
    if (result != kErrorCodeOk || got == 0) {
      break;
    }
    result = sink->write(&buffer[0], got);
    if (result != kErrorCodeOk) {
      break;
    }
    total += got;
  }
  if (copied_bytes) {
    *copied_bytes = total;
  }
  return result;
}

}  // namespace stream
}  // namespace walarc
