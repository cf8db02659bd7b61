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
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <cstring>
#include <memory>
#include <string>

#include "walarc/error_code.hpp"
#include "walarc/test_common.hpp"
#include "walarc/crypto/crypter.hpp"
#include "walarc/crypto/crypto_options.hpp"
#include "walarc/crypto/openssl_crypter_impl.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/storage/filesystem_storage_client.hpp"
#include "walarc/storage/storage_options.hpp"
#include "walarc/storage/stream_pipe_impl.hpp"
#include "walarc/storage/uploader_impl.hpp"
#include "walarc/stream/byte_stream.hpp"
#include "walarc/stream/file_stream.hpp"
#include "walarc/stream/lz4_stream.hpp"
#include "walarc/stream/memory_stream.hpp"

/**
 * @file test_stream_pipe.cpp
 * Testcases for walarc::storage::StreamPipe.
 */

namespace walarc {
namespace storage {
DEFINE_TEST_CASE_PACKAGE(StreamPipeTest, walarc.storage);

StorageOptions tiny_storage_options() {
  StorageOptions options;
  options.part_size_kb_ = 32;
  options.upload_concurrency_ = 2;
  options.retry_base_delay_ms_ = 1;
  return options;
}

std::string make_text(uint32_t lines) {
  std::string data;
  for (uint32_t i = 0; i < lines; ++i) {
    data += "line " + std::to_string(i) + " of a write-ahead log segment\n";
  }
  return data;
}

/** Reads the object back through LZ4. */
std::string read_object(FilesystemStorageClient* client, const std::string& path) {
  stream::FileSource file(client->get_object_path(path));
  EXPECT_EQ(kErrorCodeOk, file.open());
  stream::Lz4DecompressSource decompressor(&file);
  stream::MemorySink sink;
  EXPECT_EQ(kErrorCodeOk, stream::copy_stream(&decompressor, &sink, nullptr));
  return sink.get_data();
}

/** Reports a checksum that never matches. */
class LyingStorageClient : public FilesystemStorageClient {
 public:
  LyingStorageClient(const StorageOptions& options, const fs::Path& root)
    : FilesystemStorageClient(options, root) {}
  ErrorCode head_object(const std::string& path, std::string* checksum) override {
    CHECK_ERROR_CODE(FilesystemStorageClient::head_object(path, checksum));
    *checksum = "00000000000000000000000000000000";
    return kErrorCodeOk;
  }
};

/** A fresh RSA key pair in PEM files under a random folder. */
crypto::CryptoOptions generate_keys() {
  fs::Path folder(fs::Path(get_random_tmp_file_path("keys")).parent_path());
  crypto::CryptoOptions options;
  options.public_key_path_ = (fs::Path(folder) /= "public.pem").string();
  options.private_key_path_ = (fs::Path(folder) /= "private.pem").string();
  EVP_PKEY* key = EVP_RSA_gen(2048);
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

/** Decrypts the whole object, without decompressing it. */
std::string decrypt_object(
  FilesystemStorageClient* client,
  crypto::Crypter* crypter,
  const std::string& path) {
  stream::FileSource file(client->get_object_path(path));
  EXPECT_EQ(kErrorCodeOk, file.open());
  stream::ByteSource* decrypted = nullptr;
  EXPECT_EQ(kErrorCodeOk, crypter->decrypt(&file, &decrypted));
  std::unique_ptr<stream::ByteSource> holder(decrypted);
  stream::MemorySink sink;
  EXPECT_EQ(kErrorCodeOk, stream::copy_stream(decrypted, &sink, nullptr));
  return sink.get_data();
}

fs::Path random_root() {
  return fs::Path(std::string("tmp_buckets/") + get_random_name());
}

TEST(StreamPipeTest, UploadAll) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  Uploader uploader(&client);
  crypto::NoopCrypter crypter;
  const std::string data = make_text(20000);
  {
    StreamPipe pipe(&uploader, &crypter, "srv/wal_005/000000010000000000000001.lz4", true);
    stream::MemorySource source(data);
    UploadResult result;
    EXPECT_EQ(kErrorCodeOk, pipe.upload_all(&source, &result));
    EXPECT_TRUE(result.is_success());
    EXPECT_FALSE(result.location_.empty());
    EXPECT_TRUE(result.is_success());
    EXPECT_EQ(data.size(), pipe.get_uncompressed_bytes());
    EXPECT_TRUE(pipe.is_closed());
    std::string remote;
    EXPECT_EQ(kErrorCodeOk, uploader.head(pipe.get_path(), &remote));
    EXPECT_EQ(result.checksum_, remote);
  }
  EXPECT_EQ(0U, uploader.get_outstanding_count());
  EXPECT_EQ(data, read_object(&client, "srv/wal_005/000000010000000000000001.lz4"));
  EXPECT_LT(fs::file_size(client.get_object_path("srv/wal_005/000000010000000000000001.lz4")),
            data.size());
  fs::remove_all(root);
}

TEST(StreamPipeTest, WriteThenClose) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  Uploader uploader(&client);
  crypto::NoopCrypter crypter;
  StreamPipe pipe(&uploader, &crypter, "written", false);
  stream::ByteSink* sink = nullptr;
  EXPECT_EQ(kErrorCodeOk, pipe.start(&sink));
  EXPECT_TRUE(pipe.is_started());
  EXPECT_EQ(1U, uploader.get_outstanding_count());
  std::string expected;
  for (int i = 0; i < 100; ++i) {
    std::string piece = make_text(i + 1);
    EXPECT_EQ(kErrorCodeOk, sink->write(piece.data(), piece.size()));
    expected += piece;
  }
  EXPECT_EQ(kErrorCodeOk, pipe.close());
  EXPECT_EQ(kErrorCodeOk, pipe.close());
  UploadResult result;
  EXPECT_EQ(kErrorCodeOk, pipe.wait(&result));
  EXPECT_TRUE(result.checksum_.empty());
  uploader.await_all();
  EXPECT_EQ(expected, read_object(&client, "written"));
  fs::remove_all(root);
}

TEST(StreamPipeTest, Abort) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  Uploader uploader(&client);
  crypto::NoopCrypter crypter;
  StreamPipe pipe(&uploader, &crypter, "aborted", true);
  stream::ByteSink* sink = nullptr;
  EXPECT_EQ(kErrorCodeOk, pipe.start(&sink));
  const std::string data = make_text(10000);
  EXPECT_EQ(kErrorCodeOk, sink->write(data.data(), data.size()));
  pipe.abort(kErrorCodeFsReadFailed);
  UploadResult result;
  EXPECT_EQ(kErrorCodeFsReadFailed, pipe.wait(&result));
  EXPECT_FALSE(result.is_success());
  EXPECT_FALSE(fs::exists(client.get_object_path("aborted")));
  EXPECT_FALSE(uploader.is_last_success());
  fs::remove_all(root);
}

TEST(StreamPipeTest, DestructWithoutClose) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  Uploader uploader(&client);
  crypto::NoopCrypter crypter;
  {
    StreamPipe pipe(&uploader, &crypter, "forgotten", false);
    stream::ByteSink* sink = nullptr;
    EXPECT_EQ(kErrorCodeOk, pipe.start(&sink));
    EXPECT_EQ(kErrorCodeOk, sink->write("abc", 3));
  }
  EXPECT_EQ(0U, uploader.get_outstanding_count());
  EXPECT_FALSE(fs::exists(client.get_object_path("forgotten")));
  fs::remove_all(root);
}

TEST(StreamPipeTest, VerifyMismatch) {
  fs::Path root(random_root());
  LyingStorageClient client(tiny_storage_options(), root);
  Uploader uploader(&client);
  crypto::NoopCrypter crypter;
  StreamPipe pipe(&uploader, &crypter, "lied", true);
  stream::MemorySource source(make_text(100));
  UploadResult result;
  EXPECT_EQ(kErrorCodeIntegrityMismatch, pipe.upload_all(&source, &result));
  EXPECT_EQ(kErrorCodeIntegrityMismatch, result.error_);

  // without verification nobody asks the store
  StreamPipe unverified(&uploader, &crypter, "lied2", false);
  stream::MemorySource source2(make_text(100));
  EXPECT_EQ(kErrorCodeOk, unverified.upload_all(&source2, &result));
  fs::remove_all(root);
}

TEST(StreamPipeTest, EncryptedRoundTrip) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  Uploader uploader(&client);
  crypto::CryptoOptions crypto_options = generate_keys();
  crypto::OpensslCrypter crypter(crypto_options);
  const std::string path("srv/wal_005/000000010000000000000002.lz4");
  const std::string data = make_text(20000);
  {
    StreamPipe pipe(&uploader, &crypter, path, true);
    stream::MemorySource source(data);
    UploadResult result;
    EXPECT_EQ(kErrorCodeOk, pipe.upload_all(&source, &result));
    EXPECT_TRUE(result.is_success());
  }
  EXPECT_EQ(0U, uploader.get_outstanding_count());

  // the stored bytes are the encryption of the LZ4 frame, not the other way around
  std::string stored;
  {
    stream::FileSource file(client.get_object_path(path));
    EXPECT_EQ(kErrorCodeOk, file.open());
    stream::MemorySink sink;
    EXPECT_EQ(kErrorCodeOk, stream::copy_stream(&file, &sink, nullptr));
    stored = sink.get_data();
  }
  ASSERT_GT(stored.size(), 5U);
  EXPECT_EQ(0, stored.compare(0, crypto::OpensslCrypter::kMagicLength,
                              crypto::OpensslCrypter::kMagic));
  EXPECT_EQ(std::string::npos, stored.find("write-ahead log segment"));

  std::string compressed = decrypt_object(&client, &crypter, path);
  const unsigned char kLz4FrameMagic[] = {0x04, 0x22, 0x4D, 0x18};
  ASSERT_GT(compressed.size(), 4U);
  EXPECT_EQ(0, std::memcmp(compressed.data(), kLz4FrameMagic, 4));
  EXPECT_LT(compressed.size(), data.size());

  stream::MemorySource compressed_source(compressed);
  stream::Lz4DecompressSource decompressor(&compressed_source);
  stream::MemorySink plain;
  EXPECT_EQ(kErrorCodeOk, stream::copy_stream(&decompressor, &plain, nullptr));
  EXPECT_EQ(data, plain.get_data());

  fs::remove_all(fs::Path(crypto_options.public_key_path_).parent_path());
  fs::remove_all(root);
}

TEST(StreamPipeTest, CryptoConfigFailsEarly) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  Uploader uploader(&client);
  crypto::CryptoOptions crypto_options;
  crypto_options.public_key_path_ = get_random_tmp_file_path("missing_public.pem");
  crypto::OpensslCrypter crypter(crypto_options);
  StreamPipe pipe(&uploader, &crypter, "encrypted", false);
  stream::ByteSink* sink = nullptr;
  EXPECT_EQ(kErrorCodeCryptoConfig, pipe.start(&sink));
  EXPECT_FALSE(pipe.is_started());
  EXPECT_EQ(0U, uploader.get_outstanding_count());
  EXPECT_FALSE(fs::exists(client.get_object_path("encrypted")));
  fs::remove_all(fs::Path(crypto_options.public_key_path_).parent_path());
  fs::remove_all(root);
}

}  // namespace storage
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(StreamPipeTest, walarc.storage);
