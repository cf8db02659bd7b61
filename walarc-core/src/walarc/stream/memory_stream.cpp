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
#include "walarc/stream/memory_stream.hpp"

#include <cstring>
#include <string>

namespace walarc {
namespace stream {

ErrorCode MemorySource::read(void* buffer, uint64_t desired, uint64_t* read_bytes) {
  uint64_t remaining = data_.size() - position_;
  uint64_t copied = desired < remaining ? desired : remaining;
  if (copied > 0) {
    std::memcpy(buffer, data_.data() + position_, copied);
    position_ += copied;
  }
  *read_bytes = copied;
  return kErrorCodeOk;
}

ErrorCode MemorySink::write(const void* buffer, uint64_t size) {
  if (closed_) {
    return kErrorCodeStrAlreadyClosed;
  }
  data_.append(reinterpret_cast<const char*>(buffer), size);
  return kErrorCodeOk;
}

}  // namespace stream
}  // namespace walarc
