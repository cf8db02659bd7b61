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
#ifndef WALARC_STREAM_BYTE_STREAM_HPP_
#define WALARC_STREAM_BYTE_STREAM_HPP_
#include <stdint.h>

#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"

/**
 * @defgroup STREAM Byte Streams
 * @brief Composable stages that move bytes from a source to a sink.
 * @details
 * An archived object is never materialized in memory. Bytes are pulled from a ByteSource
 * or pushed into a ByteSink, and each transform (compression, encryption, checksum)
 * is itself a source or a sink wrapping another one:
 * @code
 * tar writer -> Lz4CompressSink -> encrypting sink -> PipeWriter ~~ PipeReader -> Md5Source
 *                                                                      -> StorageClient
 * @endcode
 * Wrapping stages never own what they wrap. Whoever builds a chain owns every stage
 * and must destroy them downstream-last.
 */
namespace walarc {
namespace stream {

/**
 * @brief Pull side of a byte stream.
 * @ingroup STREAM
 */
class ByteSource {
 public:
  virtual ~ByteSource() {}
  /**
   * @brief Reads at most desired bytes.
   * @param[out] buffer receives the bytes
   * @param[in] desired capacity of buffer
   * @param[out] read_bytes number of bytes actually read. 0 with kErrorCodeOk means end of stream.
   * @details
   * May return fewer bytes than desired even before the end of stream.
   * Blocks while no byte is available yet.
   */
  virtual ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) = 0;
};

/**
 * @brief Push side of a byte stream.
 * @ingroup STREAM
 */
class ByteSink {
 public:
  virtual ~ByteSink() {}
  /**
   * @brief Writes all the given bytes or fails.
   * @details
   * Blocks until the bytes are accepted downstream.
   */
  virtual ErrorCode write(const void* buffer, uint64_t size) = 0;
  /**
   * @brief Flushes whatever this stage holds and closes the downstream stage too.
   * @details
   * Closing is what tells the far end of the chain that the stream is complete.
   * If this stage fails to flush, the downstream is left open and the error is returned,
   * so that whoever owns the chain can abort the far end instead of publishing a truncated stream.
   * Idempotent. Writes after close() fail with kErrorCodeStrAlreadyClosed.
   */
  virtual ErrorCode close() = 0;
};

/**
 * @brief Repeats ByteSource::read() until desired bytes are read or the stream ends.
 * @ingroup STREAM
 * @param[out] read_bytes less than desired only at the end of stream.
 */
ErrorCode read_fully(ByteSource* source, void* buffer, uint64_t desired, uint64_t* read_bytes);

/**
 * @brief Moves every byte from source to sink. Does not close the sink.
 * @ingroup STREAM
 * @param[out] copied_bytes optional. number of bytes moved, even on failure.
 */
ErrorCode copy_stream(ByteSource* source, ByteSink* sink, uint64_t* copied_bytes);

}  // namespace stream
}  // namespace walarc
#endif  // WALARC_STREAM_BYTE_STREAM_HPP_
