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
#include <stdint.h>
#include <gtest/gtest.h>
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <memory>
#include <string>

#include "walarc/error_code.hpp"
#include "walarc/test_common.hpp"
#include "walarc/crypto/crypter.hpp"
#include "walarc/crypto/crypto_options.hpp"
#include "walarc/crypto/openssl_crypter_impl.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/stream/byte_stream.hpp"
#include "walarc/stream/memory_stream.hpp"

/**
 * @file test_crypter.cpp
 * Testcases for walarc::crypto::NoopCrypter and walarc::crypto::OpensslCrypter.
 */

namespace walarc {
namespace crypto {
DEFINE_TEST_CASE_PACKAGE(CrypterTest, walarc.crypto);

/** Writes the key pair into two PEM files in a random folder, and frees the key. */
CryptoOptions write_keys(EVP_PKEY* key) {
  fs::Path folder(fs::Path(get_random_tmp_file_path("keys")).parent_path());
  CryptoOptions options;
  options.public_key_path_ = (fs::Path(folder) /= "public.pem").string();
  options.private_key_path_ = (fs::Path(folder) /= "private.pem").string();

  EXPECT_NE(nullptr, key);
  BIO* pub = BIO_new_file(options.public_key_path_.c_str(), "w");
  EXPECT_EQ(1, PEM_write_bio_PUBKEY(pub, key));
  BIO_free(pub);
  BIO* priv = BIO_new_file(options.private_key_path_.c_str(), "w");
  EXPECT_EQ(1, PEM_write_bio_PrivateKey(priv, key, nullptr, nullptr, 0, nullptr, nullptr));
  BIO_free(priv);
  EVP_PKEY_free(key);
  return options;
}

CryptoOptions generate_keys() {
  return write_keys(EVP_RSA_gen(2048));
}

void remove_keys(const CryptoOptions& options) {
  fs::remove_all(fs::Path(options.public_key_path_).parent_path());
}

/** Encrypts the plaintext into a string. */
ErrorCode encrypt_all(Crypter* crypter, const std::string& plaintext, std::string* out) {
  stream::MemorySink ciphertext;
  stream::ByteSink* sink = nullptr;
  CHECK_ERROR_CODE(crypter->encrypt(&ciphertext, &sink));
  std::unique_ptr<stream::ByteSink> sink_holder(sink);
  CHECK_ERROR_CODE(sink->write(plaintext.data(), plaintext.size()));
  CHECK_ERROR_CODE(sink->close());
  EXPECT_TRUE(ciphertext.is_closed());
  *out = ciphertext.get_data();
  return kErrorCodeOk;
}

ErrorCode decrypt_all(Crypter* crypter, const std::string& ciphertext, std::string* out) {
  stream::MemorySource upstream(ciphertext);
  stream::ByteSource* source = nullptr;
  CHECK_ERROR_CODE(crypter->decrypt(&upstream, &source));
  std::unique_ptr<stream::ByteSource> source_holder(source);
  stream::MemorySink plaintext;
  uint64_t copied;
  CHECK_ERROR_CODE(stream::copy_stream(source, &plaintext, &copied));
  *out = plaintext.get_data();
  return kErrorCodeOk;
}

TEST(CrypterTest, Noop) {
  NoopCrypter crypter;
  EXPECT_FALSE(crypter.is_armed());
  std::string ciphertext;
  EXPECT_EQ(kErrorCodeOk, encrypt_all(&crypter, "plain", &ciphertext));
  EXPECT_EQ(std::string("plain"), ciphertext);
  std::string plaintext;
  EXPECT_EQ(kErrorCodeOk, decrypt_all(&crypter, ciphertext, &plaintext));
  EXPECT_EQ(std::string("plain"), plaintext);
}

TEST(CrypterTest, RoundTrip) {
  CryptoOptions options = generate_keys();
  EXPECT_TRUE(options.is_armed());
  OpensslCrypter crypter(options);
  EXPECT_TRUE(crypter.is_armed());
  const uint32_t kSizes[] = {0, 1, 15, 16, 17, 100000};
  for (uint32_t size : kSizes) {
    std::string data(size, '\0');
    for (uint32_t i = 0; i < size; ++i) {
      data[i] = static_cast<char>(i * 31 + 7);
    }
    std::string ciphertext;
    EXPECT_EQ(kErrorCodeOk, encrypt_all(&crypter, data, &ciphertext));
    EXPECT_EQ(0, ciphertext.compare(0, OpensslCrypter::kMagicLength, OpensslCrypter::kMagic));
    EXPECT_GT(ciphertext.size(), data.size());
    if (size > 16U) {
      EXPECT_EQ(std::string::npos, ciphertext.find(data.substr(0, 16)));
    }
    std::string plaintext;
    EXPECT_EQ(kErrorCodeOk, decrypt_all(&crypter, ciphertext, &plaintext));
    EXPECT_EQ(data, plaintext);
  }
  remove_keys(options);
}

TEST(CrypterTest, FreshKeyPerObject) {
  CryptoOptions options = generate_keys();
  OpensslCrypter crypter(options);
  std::string first;
  std::string second;
  EXPECT_EQ(kErrorCodeOk, encrypt_all(&crypter, "same text", &first));
  EXPECT_EQ(kErrorCodeOk, encrypt_all(&crypter, "same text", &second));
  EXPECT_NE(first, second);
  remove_keys(options);
}

TEST(CrypterTest, MissingKey) {
  CryptoOptions options;
  options.public_key_path_ = get_random_tmp_file_path("no_such_key.pem");
  options.private_key_path_ = options.public_key_path_;
  EXPECT_TRUE(options.is_armed());
  OpensslCrypter crypter(options);
  stream::MemorySink ciphertext;
  stream::ByteSink* sink = nullptr;
  EXPECT_EQ(kErrorCodeCryptoConfig, crypter.encrypt(&ciphertext, &sink));
  EXPECT_EQ(nullptr, sink);
  EXPECT_TRUE(ciphertext.get_data().empty());
  EXPECT_FALSE(ciphertext.is_closed());
  fs::remove_all(fs::Path(options.public_key_path_).parent_path());
}

TEST(CrypterTest, NonRsaKey) {
  CryptoOptions options = write_keys(EVP_EC_gen("P-256"));
  OpensslCrypter crypter(options);
  EXPECT_TRUE(crypter.is_armed());
  stream::MemorySink ciphertext;
  stream::ByteSink* sink = nullptr;
  // refused when the stage is built, before any byte is written
  EXPECT_EQ(kErrorCodeCryptoConfig, crypter.encrypt(&ciphertext, &sink));
  EXPECT_EQ(nullptr, sink);
  EXPECT_TRUE(ciphertext.get_data().empty());
  stream::MemorySource upstream(std::string("irrelevant"));
  stream::ByteSource* source = nullptr;
  EXPECT_EQ(kErrorCodeCryptoConfig, crypter.decrypt(&upstream, &source));
  EXPECT_EQ(nullptr, source);
  remove_keys(options);
}

TEST(CrypterTest, WrongKey) {
  CryptoOptions options = generate_keys();
  CryptoOptions others = generate_keys();
  OpensslCrypter crypter(options);
  OpensslCrypter other_crypter(others);
  std::string ciphertext;
  EXPECT_EQ(kErrorCodeOk, encrypt_all(&crypter, "secret", &ciphertext));
  std::string plaintext;
  ErrorCode code = decrypt_all(&other_crypter, ciphertext, &plaintext);
  // RSA implicit rejection may hand out a bogus data key instead of failing in EVP_OpenInit.
  // Then the CBC padding check at the end almost always fails. Either way no secret leaks.
  if (code != kErrorCodeOk) {
    EXPECT_EQ(kErrorCodeCryptoDecryptFailed, code);
  } else {
    EXPECT_NE(std::string("secret"), plaintext);
  }
  remove_keys(options);
  remove_keys(others);
}

TEST(CrypterTest, BadHeader) {
  CryptoOptions options = generate_keys();
  OpensslCrypter crypter(options);
  std::string plaintext;
  EXPECT_EQ(kErrorCodeCryptoBadHeader,
            decrypt_all(&crypter, "this is not an encrypted object", &plaintext));
  EXPECT_EQ(kErrorCodeCryptoBadHeader, decrypt_all(&crypter, "WL", &plaintext));
  remove_keys(options);
}

}  // namespace crypto
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(CrypterTest, walarc.crypto);
