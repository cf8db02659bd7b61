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
#ifndef WALARC_CRYPTO_OPENSSL_CRYPTER_IMPL_HPP_
#define WALARC_CRYPTO_OPENSSL_CRYPTER_IMPL_HPP_

#include <openssl/evp.h>
#include <stdint.h>

#include <memory>
#include <mutex>
#include <string>

#include "walarc/error_code.hpp"
#include "walarc/crypto/crypter.hpp"
#include "walarc/crypto/crypto_options.hpp"

namespace walarc {
namespace crypto {

template<typename T, void (*fn)(T*)>
struct OpensslDeleter {
  void operator()(T* ptr) const { fn(ptr); }
};

/** unique_ptr that releases the openssl object with the matching free function. */
template<typename T, void (*fn)(T*)>
using OpensslHandle = std::unique_ptr<T, OpensslDeleter<T, fn> >;

typedef OpensslHandle<BIO, BIO_free_all>                  BioPtr;
typedef OpensslHandle<EVP_PKEY, EVP_PKEY_free>            EvpPkeyPtr;
typedef OpensslHandle<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free> EvpCipherCtxPtr;

/** Takes another reference of the key so that a stage can outlive the crypter's copy. */
EvpPkeyPtr share_key(EVP_PKEY* key);

/** Last error in openssl's thread-local error queue, for logging. */
std::string get_openssl_error();

/**
 * @brief Envelope encryption with an RSA key pair.
 * @ingroup CRYPTO
 * @details
 * Every object gets a fresh random AES-256-CBC data key, which is wrapped with the RSA public
 * key (EVP_SealInit). The ciphertext stream is laid out as follows, integers big-endian:
 * @code
 * "WLAC1" | uint32 wrapped key length | wrapped key | IV (16 bytes) | AES-256-CBC ciphertext
 * @endcode
 * Decryption unwraps the data key with the RSA private key (EVP_OpenInit).
 *
 * Keys are read from the PEM files in CryptoOptions on first use and cached. A missing or
 * unreadable key makes encrypt()/decrypt() fail with kErrorCodeCryptoConfig before anything
 * is written.
 */
class OpensslCrypter final : public Crypter {
 public:
  /** Magic bytes at the beginning of every encrypted object. */
  static const char     kMagic[];
  static const uint32_t kMagicLength = 5;
  /** Sanity bound of the wrapped key length in the header. RSA-32768 would be 4096. */
  static const uint32_t kMaxWrappedKeyLength = 4096;

  explicit OpensslCrypter(const CryptoOptions& options) : options_(options) {}

  OpensslCrypter(const OpensslCrypter &other) = delete;
  OpensslCrypter& operator=(const OpensslCrypter &other) = delete;

  bool      is_armed() const override { return true; }
  ErrorCode encrypt(stream::ByteSink* downstream, stream::ByteSink** out) override;
  ErrorCode decrypt(stream::ByteSource* upstream, stream::ByteSource** out) override;

 private:
  ErrorCode load_public_key(EvpPkeyPtr* out);
  ErrorCode load_private_key(EvpPkeyPtr* out);

  const CryptoOptions options_;
  /** Protects the cached keys below. */
  std::mutex          mutex_;
  EvpPkeyPtr          public_key_;
  EvpPkeyPtr          private_key_;
};

}  // namespace crypto
}  // namespace walarc
#endif  // WALARC_CRYPTO_OPENSSL_CRYPTER_IMPL_HPP_
