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
#ifndef WALARC_STREAM_LZ4_STREAM_HPP_
#define WALARC_STREAM_LZ4_STREAM_HPP_
#include <stdint.h>

#include <vector>

#include "walarc/cxx11.hpp"
#include "walarc/stream/byte_stream.hpp"

// forward declarations for lz4frame. avoid exposing the C header to client programs.
struct LZ4F_cctx_s;
struct LZ4F_dctx_s;

namespace walarc {
namespace stream {
/**
 * @brief Compresses written bytes into one LZ4 frame and forwards them to the downstream sink.
 * @ingroup STREAM
 * @details
 * The frame header is emitted lazily on the first write (or at close() for an empty stream),
 * so constructing this object does not touch the downstream.
 * close() writes the frame end mark and then closes the downstream.
 */
class Lz4CompressSink CXX11_FINAL : public ByteSink {
 public:
  explicit Lz4CompressSink(ByteSink* downstream);
  ~Lz4CompressSink();

  // non-copyable assignable.
  Lz4CompressSink(const Lz4CompressSink &other) CXX11_FUNC_DELETE;
  Lz4CompressSink& operator=(const Lz4CompressSink &other) CXX11_FUNC_DELETE;

  ErrorCode write(const void* buffer, uint64_t size) CXX11_OVERRIDE;
  ErrorCode close() CXX11_OVERRIDE;

  uint64_t  get_uncompressed_bytes() const { return uncompressed_bytes_; }
  uint64_t  get_compressed_bytes() const { return compressed_bytes_; }

 private:
  ErrorCode begin_frame();
  ErrorCode forward(uint64_t size);

  ByteSink* const     downstream_;
  LZ4F_cctx_s*        context_;
  std::vector<char>   out_buffer_;
  bool                begun_;
  bool                closed_;
  uint64_t            uncompressed_bytes_;
  uint64_t            compressed_bytes_;
};

/**
 * @brief Decompresses LZ4 frames pulled from the upstream source.
 * @ingroup STREAM
 * @details
 * Concatenated frames are decoded one after another.
 * A stream that ends in the middle of a frame fails with kErrorCodeStrDecompressFailed.
 */
class Lz4DecompressSource CXX11_FINAL : public ByteSource {
 public:
  explicit Lz4DecompressSource(ByteSource* upstream);
  ~Lz4DecompressSource();

  // non-copyable assignable.
  Lz4DecompressSource(const Lz4DecompressSource &other) CXX11_FUNC_DELETE;
  Lz4DecompressSource& operator=(const Lz4DecompressSource &other) CXX11_FUNC_DELETE;

  ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) CXX11_OVERRIDE;

 private:
  ByteSource* const   upstream_;
  LZ4F_dctx_s*        context_;
  std::vector<char>   in_buffer_;
  uint64_t            in_position_;
  uint64_t            in_size_;
  bool                upstream_eof_;
  bool                started_;
  bool                frame_done_;
};

}  // namespace stream
}  // namespace walarc
#endif  // WALARC_STREAM_LZ4_STREAM_HPP_
