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
#include "walarc/crypto/crypter.hpp"

#include <stdint.h>

#include "walarc/stream/byte_stream.hpp"

namespace walarc {
namespace crypto {
namespace {
class ForwardingSink final : public stream::ByteSink {
 public:
  explicit ForwardingSink(stream::ByteSink* downstream) : downstream_(downstream) {}
  ErrorCode write(const void* buffer, uint64_t size) override {
    return downstream_->write(buffer, size);
  }
  ErrorCode close() override { return downstream_->close(); }
 private:
  stream::ByteSink* const downstream_;
};

class ForwardingSource final : public stream::ByteSource {
 public:
  explicit ForwardingSource(stream::ByteSource* upstream) : upstream_(upstream) {}
  ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) override {
    return upstream_->read(buffer, desired, read_bytes);
  }
 private:
  stream::ByteSource* const upstream_;
};
}  // namespace

ErrorCode NoopCrypter::encrypt(stream::ByteSink* downstream, stream::ByteSink** out) {
  *out = new ForwardingSink(downstream);
  return kErrorCodeOk;
}

ErrorCode NoopCrypter::decrypt(stream::ByteSource* upstream, stream::ByteSource** out) {
  *out = new ForwardingSource(upstream);
  return kErrorCodeOk;
}

}  // namespace crypto
}  // namespace walarc
