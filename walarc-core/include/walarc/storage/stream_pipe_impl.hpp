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
#ifndef WALARC_STORAGE_STREAM_PIPE_IMPL_HPP_
#define WALARC_STORAGE_STREAM_PIPE_IMPL_HPP_
#include <stdint.h>

#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>
#include <thread>

#include "walarc/error_code.hpp"
#include "walarc/crypto/fwd.hpp"
#include "walarc/storage/fwd.hpp"
#include "walarc/storage/uploader_impl.hpp"
#include "walarc/stream/byte_stream.hpp"
#include "walarc/stream/lz4_stream.hpp"
#include "walarc/stream/pipe_impl.hpp"

namespace walarc {
namespace storage {
/**
 * @brief Turns bytes written by the caller into one compressed, optionally encrypted and
 * optionally verified remote object.
 * @ingroup STORAGE
 * @details
 * The chain is:
 * @code
 * caller -> Lz4CompressSink -> [encrypting sink] -> Pipe ~~ [Md5Source] -> Uploader::submit()
 * @endcode
 * The right half runs in an upload thread started by start(), so the object is uploaded
 * while it is being produced and the pipe throttles the producer to the upload speed.
 *
 * The write end of the pipe is closed exactly once on every path:
 *  \li close() flushes the chain and closes it cleanly. If flushing fails, the pipe is closed
 *  with the error instead, so the store discards the partial object.
 *  \li abort() closes it with an error.
 *  \li the destructor aborts if neither happened.
 *
 * When verify is requested, the checksum of the bytes that went through the pipe is
 * compared with what the store reports afterwards. A mismatch is
 * kErrorCodeIntegrityMismatch, which is never retried.
 *
 * One thread writes and closes; wait() may be called from the same or another thread.
 */
class StreamPipe final {
 public:
  StreamPipe(Uploader* uploader, crypto::Crypter* crypter, const std::string& path, bool verify);
  /** Aborts if still open, then joins the upload thread. */
  ~StreamPipe();

  StreamPipe(const StreamPipe &other) = delete;
  StreamPipe& operator=(const StreamPipe &other) = delete;

  /**
   * @brief Builds the chain and starts uploading.
   * @param[out] sink where the caller writes the plain bytes. Owned by this object.
   * @details
   * Fails with kErrorCodeCryptoConfig before anything is spawned or written if encryption is
   * armed but unusable. The upload is registered with the uploader's outstanding uploads.
   */
  ErrorCode start(stream::ByteSink** sink);

  /** End of the stream. Idempotent. */
  ErrorCode close();

  /** Makes the upload fail with the cause. No-op after close(). */
  void      abort(ErrorCode cause);

  /**
   * @brief Joins the upload thread.
   * @param[out] result optional. the outcome of the upload.
   * @return the error of the upload or of its verification
   * @pre close() or abort() was called. Otherwise this blocks forever.
   */
  ErrorCode wait(UploadResult* result);

  /** Convenience for a file: start(), copy everything, close(), wait(). */
  ErrorCode upload_all(stream::ByteSource* source, UploadResult* result);

  const std::string& get_path() const { return path_; }
  bool      is_started() const { return started_; }
  bool      is_closed() const { return closed_; }
  /** Whether the upload thread is done, so that wait() would not block. */
  bool      is_upload_over() const { return upload_over_.load(); }
  uint64_t  get_uncompressed_bytes() const;

  friend std::ostream& operator<<(std::ostream& o, const StreamPipe& v);

 private:
  void      upload_thread_main();

  Uploader* const                           uploader_;
  crypto::Crypter* const                    crypter_;
  const std::string                         path_;
  const bool                                verify_;

  stream::Pipe                              pipe_;
  /** Owned. Wraps the writer of pipe_. */
  std::unique_ptr<stream::ByteSink>         encrypt_sink_;
  std::unique_ptr<stream::Lz4CompressSink>  compress_sink_;

  std::thread                               upload_thread_;
  UploadResult                              result_;
  bool                                      started_;
  bool                                      closed_;
  bool                                      joined_;
  /** Set by the upload thread right before it deregisters from the uploader. */
  std::atomic<bool>                         upload_over_;
};

}  // namespace storage
}  // namespace walarc
#endif  // WALARC_STORAGE_STREAM_PIPE_IMPL_HPP_
