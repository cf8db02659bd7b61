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
#ifndef WALARC_STREAM_MEMORY_STREAM_HPP_
#define WALARC_STREAM_MEMORY_STREAM_HPP_
#include <stdint.h>

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/stream/byte_stream.hpp"

namespace walarc {
namespace stream {
/**
 * @brief Reads bytes out of an in-memory string.
 * @ingroup STREAM
 */
class MemorySource CXX11_FINAL : public ByteSource {
 public:
  explicit MemorySource(const std::string& data) : data_(data), position_(0) {}
  ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) CXX11_OVERRIDE;

 private:
  const std::string data_;
  uint64_t          position_;
};

/**
 * @brief Accumulates written bytes in memory. Small objects such as backup labels and sentinels.
 * @ingroup STREAM
 */
class MemorySink CXX11_FINAL : public ByteSink {
 public:
  MemorySink() : closed_(false) {}
  ErrorCode write(const void* buffer, uint64_t size) CXX11_OVERRIDE;
  ErrorCode close() CXX11_OVERRIDE { closed_ = true; return kErrorCodeOk; }

  const std::string&  get_data() const { return data_; }
  bool                is_closed() const { return closed_; }

 private:
  std::string data_;
  bool        closed_;
};

}  // namespace stream
}  // namespace walarc
#endif  // WALARC_STREAM_MEMORY_STREAM_HPP_
