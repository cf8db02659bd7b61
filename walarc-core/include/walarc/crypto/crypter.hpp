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
#ifndef WALARC_CRYPTO_CRYPTER_HPP_
#define WALARC_CRYPTO_CRYPTER_HPP_

#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"
#include "walarc/stream/fwd.hpp"

/**
 * @defgroup CRYPTO Encryption
 * @brief Optional client-side encryption of archived objects.
 */
namespace walarc {
namespace crypto {
/**
 * @brief Stream transform that encrypts on the way out and decrypts on the way back.
 * @ingroup CRYPTO
 * @details
 * Implementations are stateless apart from lazily loaded keys, so one instance is shared by
 * every concurrent upload. The returned stages only block on the stream they wrap.
 */
class Crypter {
 public:
  virtual ~Crypter() {}

  /** Whether this actually transforms bytes. */
  virtual bool      is_armed() const = 0;

  /**
   * @brief Wraps the downstream sink with an encrypting stage.
   * @param[in] downstream receives the ciphertext. Not owned. Closed when the returned sink closes.
   * @param[out] out the new stage. The caller takes ownership and deletes it.
   * @return kErrorCodeCryptoConfig if armed but no usable public key is configured.
   * Nothing is written to the downstream in that case.
   */
  virtual ErrorCode encrypt(stream::ByteSink* downstream, stream::ByteSink** out) = 0;

  /**
   * @brief Wraps the upstream source with a decrypting stage.
   * @param[in] upstream provides the ciphertext. Not owned.
   * @param[out] out the new stage. The caller takes ownership and deletes it.
   */
  virtual ErrorCode decrypt(stream::ByteSource* upstream, stream::ByteSource** out) = 0;
};

/**
 * @brief Pass-through Crypter used when encryption is not configured.
 * @ingroup CRYPTO
 */
class NoopCrypter CXX11_FINAL : public Crypter {
 public:
  bool      is_armed() const CXX11_OVERRIDE { return false; }
  ErrorCode encrypt(stream::ByteSink* downstream, stream::ByteSink** out) CXX11_OVERRIDE;
  ErrorCode decrypt(stream::ByteSource* upstream, stream::ByteSource** out) CXX11_OVERRIDE;
};

}  // namespace crypto
}  // namespace walarc
#endif  // WALARC_CRYPTO_CRYPTER_HPP_
