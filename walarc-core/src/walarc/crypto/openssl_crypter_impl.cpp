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
#include "walarc/crypto/openssl_crypter_impl.hpp"

#include <glog/logging.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include "walarc/stream/byte_stream.hpp"

namespace walarc {
namespace crypto {
const char OpensslCrypter::kMagic[] = "WLAC1";
const uint32_t OpensslCrypter::kMagicLength;
const uint32_t OpensslCrypter::kMaxWrappedKeyLength;

/** Bytes fed to the cipher at once. The output buffer is this plus one block. */
const int kCipherChunkSize = 1 << 16;

EvpPkeyPtr share_key(EVP_PKEY* key) {
  EVP_PKEY_up_ref(key);
  return EvpPkeyPtr(key);
}

std::string get_openssl_error() {
  unsigned long code = ERR_get_error();  // NOLINT(runtime/int) openssl API
  if (code == 0) {
    return "no openssl error";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return std::string(buffer);
}

namespace {
void put_uint32_be(uint32_t value, unsigned char* out) {
  out[0] = static_cast<unsigned char>(value >> 24);
  out[1] = static_cast<unsigned char>(value >> 16);
  out[2] = static_cast<unsigned char>(value >> 8);
  out[3] = static_cast<unsigned char>(value);
}

uint32_t get_uint32_be(const unsigned char* in) {
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16)
    | (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

/**
 * Encrypting stage. The envelope header is produced on the first write or at close,
 * so an object is never left without it.
 */
class SealSink final : public stream::ByteSink {
 public:
  SealSink(stream::ByteSink* downstream, EvpPkeyPtr&& key)
    : downstream_(downstream), key_(std::move(key)), begun_(false), closed_(false),
      out_buffer_(kCipherChunkSize + EVP_MAX_BLOCK_LENGTH) {}

  ErrorCode write(const void* buffer, uint64_t size) override {
    if (closed_) {
      return kErrorCodeStrAlreadyClosed;
    }
    CHECK_ERROR_CODE(begin());
    const unsigned char* position = reinterpret_cast<const unsigned char*>(buffer);
    uint64_t remaining = size;
    while (remaining > 0) {
      int chunk = remaining < static_cast<uint64_t>(kCipherChunkSize)
        ? static_cast<int>(remaining) : kCipherChunkSize;
      int produced = 0;
      if (EVP_SealUpdate(context_.get(), &out_buffer_[0], &produced, position, chunk) != 1) {
        LOG(ERROR) << "EVP_SealUpdate failed: " << get_openssl_error();
        return kErrorCodeCryptoEncryptFailed;
      }
      if (produced > 0) {
        CHECK_ERROR_CODE(downstream_->write(&out_buffer_[0], produced));
      }
      position += chunk;
      remaining -= chunk;
    }
    return kErrorCodeOk;
  }

  ErrorCode close() override {
    if (closed_) {
      return kErrorCodeOk;
    }
    closed_ = true;
    ErrorCode result = begin();
    if (result == kErrorCodeOk) {
      int produced = 0;
      if (EVP_SealFinal(context_.get(), &out_buffer_[0], &produced) != 1) {
        LOG(ERROR) << "EVP_SealFinal failed: " << get_openssl_error();
        result = kErrorCodeCryptoEncryptFailed;
      } else if (produced > 0) {
        result = downstream_->write(&out_buffer_[0], produced);
      }
    }
    if (result != kErrorCodeOk) {
      return result;
    }
    return downstream_->close();
  }

 private:
  ErrorCode begin() {
    if (begun_) {
      return kErrorCodeOk;
    }
    context_.reset(EVP_CIPHER_CTX_new());
    if (!context_) {
      return kErrorCodeOutofmemory;
    }
    std::vector<unsigned char> wrapped_key(EVP_PKEY_get_size(key_.get()));
    int wrapped_key_length = 0;
    unsigned char iv[EVP_MAX_IV_LENGTH];
    unsigned char* wrapped_key_ptr = &wrapped_key[0];
    EVP_PKEY* key_ptr = key_.get();
    if (EVP_SealInit(context_.get(), EVP_aes_256_cbc(), &wrapped_key_ptr, &wrapped_key_length,
      iv, &key_ptr, 1) != 1) {
      LOG(ERROR) << "EVP_SealInit failed: " << get_openssl_error();
      return kErrorCodeCryptoEncryptFailed;
    }
    begun_ = true;
    std::vector<unsigned char> header(OpensslCrypter::kMagicLength + 4U);
    std::memcpy(&header[0], OpensslCrypter::kMagic, OpensslCrypter::kMagicLength);
    put_uint32_be(wrapped_key_length, &header[OpensslCrypter::kMagicLength]);
    header.insert(header.end(), wrapped_key.begin(), wrapped_key.begin() + wrapped_key_length);
    header.insert(header.end(), iv, iv + EVP_CIPHER_get_iv_length(EVP_aes_256_cbc()));
    return downstream_->write(&header[0], header.size());
  }

  stream::ByteSink* const     downstream_;
  EvpPkeyPtr                  key_;
  EvpCipherCtxPtr             context_;
  bool                        begun_;
  bool                        closed_;
  std::vector<unsigned char>  out_buffer_;
};

/** Decrypting stage. Parses the envelope header on the first read. */
class OpenSource final : public stream::ByteSource {
 public:
  OpenSource(stream::ByteSource* upstream, EvpPkeyPtr&& key)
    : upstream_(upstream), key_(std::move(key)), begun_(false), finished_(false),
      in_buffer_(kCipherChunkSize), out_buffer_(kCipherChunkSize + EVP_MAX_BLOCK_LENGTH),
      out_position_(0), out_size_(0) {}

  ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) override {
    *read_bytes = 0;
    CHECK_ERROR_CODE(begin());
    while (out_position_ == out_size_) {
      if (finished_) {
        return kErrorCodeOk;
      }
      CHECK_ERROR_CODE(refill());
    }
    uint64_t available = out_size_ - out_position_;
    uint64_t copied = desired < available ? desired : available;
    std::memcpy(buffer, &out_buffer_[out_position_], copied);
    out_position_ += copied;
    *read_bytes = copied;
    return kErrorCodeOk;
  }

 private:
  ErrorCode begin() {
    if (begun_) {
      return kErrorCodeOk;
    }
    unsigned char prefix[OpensslCrypter::kMagicLength + 4U];
    uint64_t got = 0;
    CHECK_ERROR_CODE(stream::read_fully(upstream_, prefix, sizeof(prefix), &got));
    if (got != sizeof(prefix)
      || std::memcmp(prefix, OpensslCrypter::kMagic, OpensslCrypter::kMagicLength) != 0) {
      LOG(ERROR) << "Encrypted stream does not start with the expected magic";
      return kErrorCodeCryptoBadHeader;
    }
    uint32_t wrapped_key_length = get_uint32_be(prefix + OpensslCrypter::kMagicLength);
    if (wrapped_key_length == 0 || wrapped_key_length > OpensslCrypter::kMaxWrappedKeyLength) {
      LOG(ERROR) << "Wrapped key length out of range: " << wrapped_key_length;
      return kErrorCodeCryptoBadHeader;
    }
    std::vector<unsigned char> wrapped_key(wrapped_key_length);
    CHECK_ERROR_CODE(stream::read_fully(upstream_, &wrapped_key[0], wrapped_key_length, &got));
    if (got != wrapped_key_length) {
      return kErrorCodeCryptoBadHeader;
    }
    const int iv_length = EVP_CIPHER_get_iv_length(EVP_aes_256_cbc());
    unsigned char iv[EVP_MAX_IV_LENGTH];
    CHECK_ERROR_CODE(stream::read_fully(upstream_, iv, iv_length, &got));
    if (got != static_cast<uint64_t>(iv_length)) {
      return kErrorCodeCryptoBadHeader;
    }
    context_.reset(EVP_CIPHER_CTX_new());
    if (!context_) {
      return kErrorCodeOutofmemory;
    }
    if (EVP_OpenInit(context_.get(), EVP_aes_256_cbc(), &wrapped_key[0], wrapped_key_length,
      iv, key_.get()) != 1) {
      LOG(ERROR) << "EVP_OpenInit failed. Wrong private key? " << get_openssl_error();
      return kErrorCodeCryptoDecryptFailed;
    }
    begun_ = true;
    return kErrorCodeOk;
  }

  ErrorCode refill() {
    uint64_t got = 0;
    CHECK_ERROR_CODE(upstream_->read(&in_buffer_[0], in_buffer_.size(), &got));
    int produced = 0;
    out_position_ = 0;
    if (got == 0) {
      if (EVP_OpenFinal(context_.get(), &out_buffer_[0], &produced) != 1) {
        LOG(ERROR) << "EVP_OpenFinal failed. Truncated or corrupted: " << get_openssl_error();
        return kErrorCodeCryptoDecryptFailed;
      }
      finished_ = true;
    } else if (EVP_OpenUpdate(context_.get(), &out_buffer_[0], &produced, &in_buffer_[0],
      static_cast<int>(got)) != 1) {
      LOG(ERROR) << "EVP_OpenUpdate failed: " << get_openssl_error();
      return kErrorCodeCryptoDecryptFailed;
    }
    out_size_ = produced;
    return kErrorCodeOk;
  }

  stream::ByteSource* const   upstream_;
  EvpPkeyPtr                  key_;
  EvpCipherCtxPtr             context_;
  bool                        begun_;
  bool                        finished_;
  std::vector<unsigned char>  in_buffer_;
  std::vector<unsigned char>  out_buffer_;
  uint64_t                    out_position_;
  uint64_t                    out_size_;
};

ErrorCode read_pem_key(const std::string& path, bool is_private, EvpPkeyPtr* out) {
  if (path.empty()) {
    LOG(ERROR) << (is_private ? "Private" : "Public") << " key path is not configured";
    return kErrorCodeCryptoConfig;
  }
  BioPtr bio(BIO_new_file(path.c_str(), "r"));
  if (!bio) {
    LOG(ERROR) << "Could not open key file " << path << ": " << get_openssl_error();
    return kErrorCodeCryptoConfig;
  }
  EVP_PKEY* key;
  if (is_private) {
    key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  } else {
    key = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
  }
  if (key == nullptr) {
    LOG(ERROR) << "Could not parse key file " << path << ": " << get_openssl_error();
    return kErrorCodeCryptoConfig;
  }
  EvpPkeyPtr loaded(key);
  // the per-object AES key is wrapped by RSA. Other key types fail only at the first write.
  if (EVP_PKEY_base_id(key) != EVP_PKEY_RSA) {
    LOG(ERROR) << "Key file " << path << " does not hold an RSA key. type="
      << OBJ_nid2sn(EVP_PKEY_base_id(key));
    return kErrorCodeCryptoConfig;
  }
  *out = std::move(loaded);
  LOG(INFO) << "Loaded " << (is_private ? "private" : "public") << " key from " << path;
  return kErrorCodeOk;
}
}  // namespace

ErrorCode OpensslCrypter::load_public_key(EvpPkeyPtr* out) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!public_key_) {
    CHECK_ERROR_CODE(read_pem_key(options_.public_key_path_, false, &public_key_));
  }
  *out = share_key(public_key_.get());
  return kErrorCodeOk;
}

ErrorCode OpensslCrypter::load_private_key(EvpPkeyPtr* out) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!private_key_) {
    CHECK_ERROR_CODE(read_pem_key(options_.private_key_path_, true, &private_key_));
  }
  *out = share_key(private_key_.get());
  return kErrorCodeOk;
}

ErrorCode OpensslCrypter::encrypt(stream::ByteSink* downstream, stream::ByteSink** out) {
  EvpPkeyPtr key;
  CHECK_ERROR_CODE(load_public_key(&key));
  *out = new SealSink(downstream, std::move(key));
  return kErrorCodeOk;
}

ErrorCode OpensslCrypter::decrypt(stream::ByteSource* upstream, stream::ByteSource** out) {
  EvpPkeyPtr key;
  CHECK_ERROR_CODE(load_private_key(&key));
  *out = new OpenSource(upstream, std::move(key));
  return kErrorCodeOk;
}

}  // namespace crypto
}  // namespace walarc
