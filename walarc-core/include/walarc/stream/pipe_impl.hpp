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
#ifndef WALARC_STREAM_PIPE_IMPL_HPP_
#define WALARC_STREAM_PIPE_IMPL_HPP_
#include <stdint.h>

#include <atomic>
#include <iosfwd>

#include "walarc/error_code.hpp"
#include "walarc/stream/byte_stream.hpp"
#include "walarc/thread/condition_variable_impl.hpp"

namespace walarc {
namespace stream {
class Pipe;

/** @brief ByteSource view of the read end of a Pipe. @ingroup STREAM */
class PipeReader final : public ByteSource {
 public:
  explicit PipeReader(Pipe* pipe) : pipe_(pipe) {}
  ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) override;
 private:
  Pipe* const pipe_;
};

/** @brief ByteSink view of the write end of a Pipe. close() is a clean end of stream. */
class PipeWriter final : public ByteSink {
 public:
  explicit PipeWriter(Pipe* pipe) : pipe_(pipe) {}
  ErrorCode write(const void* buffer, uint64_t size) override;
  ErrorCode close() override;
 private:
  Pipe* const pipe_;
};

/**
 * @brief In-process unbuffered pipe between exactly one writer thread and one reader thread.
 * @ingroup STREAM
 * @details
 * write() hands the caller's buffer to the reader and blocks until the reader has copied all of
 * it out, so a slow reader throttles the writer with no intermediate buffer.
 *
 * Either end can close with a cause:
 *  \li close_write(kErrorCodeOk) is a clean end of stream: the reader drains then sees EOF.
 *  \li close_write(error) makes the reader's next read() fail with that error.
 *  \li close_read(error) makes the writer's pending and future write() fail with that error
 *  (kErrorCodeStrPipeClosed if the cause is kErrorCodeOk).
 *
 * Each close_xxx() is idempotent. Only the first cause is kept.
 * The writer \b must close its end on every path, otherwise the reader waits forever.
 */
class Pipe final {
 public:
  Pipe();
  ~Pipe() {}

  Pipe(const Pipe &other) = delete;
  Pipe& operator=(const Pipe &other) = delete;

  ErrorCode   write(const void* buffer, uint64_t size);
  ErrorCode   read(void* buffer, uint64_t desired, uint64_t* read_bytes);
  void        close_write(ErrorCode cause);
  void        close_read(ErrorCode cause);

  bool        is_write_closed() const { return write_closed_; }
  bool        is_read_closed() const { return read_closed_; }

  PipeReader* get_reader() { return &reader_; }
  PipeWriter* get_writer() { return &writer_; }

  friend std::ostream& operator<<(std::ostream& o, const Pipe& v);

 private:
  thread::ConditionVariable condition_;
  /** The writer's buffer not yet copied out by the reader. Changed only under condition_. */
  const char*               pending_;
  uint64_t                  pending_size_;
  std::atomic<bool>         write_closed_;
  std::atomic<bool>         read_closed_;
  ErrorCode                 write_close_cause_;
  ErrorCode                 read_close_cause_;
  /** Total bytes transferred so far. Only for debug logging. */
  std::atomic<uint64_t>     transferred_;
  PipeReader                reader_;
  PipeWriter                writer_;
};

}  // namespace stream
}  // namespace walarc
#endif  // WALARC_STREAM_PIPE_IMPL_HPP_
