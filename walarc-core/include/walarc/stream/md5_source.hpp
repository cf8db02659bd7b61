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
#ifndef WALARC_STREAM_MD5_SOURCE_HPP_
#define WALARC_STREAM_MD5_SOURCE_HPP_
#include <stdint.h>

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/stream/byte_stream.hpp"

// forward declaration for openssl.
struct evp_md_ctx_st;

namespace walarc {
namespace stream {
/**
 * @brief Passes bytes through from the upstream while keeping a running MD5 of them.
 * @ingroup STREAM
 * @details
 * Object stores report MD5 of single-part objects as their checksum (ETag), so this is what
 * we compare with after an upload to detect silent corruption.
 */
class Md5Source CXX11_FINAL : public ByteSource {
 public:
  explicit Md5Source(ByteSource* upstream);
  ~Md5Source();

  // non-copyable assignable.
  Md5Source(const Md5Source &other) CXX11_FUNC_DELETE;
  Md5Source& operator=(const Md5Source &other) CXX11_FUNC_DELETE;

  ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) CXX11_OVERRIDE;

  /**
   * @brief Finalizes the digest of everything read so far.
   * @param[out] out 32 lower-case hex characters
   * @details
   * No more read() after this.
   */
  ErrorCode hex_digest(std::string* out);

  uint64_t  get_read_bytes() const { return read_bytes_; }

 private:
  ByteSource* const upstream_;
  evp_md_ctx_st*    context_;
  bool              failed_;
  bool              finalized_;
  std::string       digest_;
  uint64_t          read_bytes_;
};

}  // namespace stream
}  // namespace walarc
#endif  // WALARC_STREAM_MD5_SOURCE_HPP_
