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
#ifndef WALARC_STREAM_FILE_STREAM_HPP_
#define WALARC_STREAM_FILE_STREAM_HPP_
#include <stdint.h>

#include <iosfwd>

#include "walarc/cxx11.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/stream/byte_stream.hpp"

namespace walarc {
namespace stream {
/**
 * @brief Sequentially reads a local file with POSIX read().
 * @ingroup STREAM
 */
class FileSource CXX11_FINAL : public ByteSource {
 public:
  explicit FileSource(const fs::Path& path);
  ~FileSource();

  // non-copyable assignable.
  FileSource(const FileSource &other) CXX11_FUNC_DELETE;
  FileSource& operator=(const FileSource &other) CXX11_FUNC_DELETE;

  /** @return kErrorCodeFsNotFound or kErrorCodeFsOpenFailed on failure. */
  ErrorCode open();
  ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) CXX11_OVERRIDE;
  /** Closes the descriptor if opened. Idempotent. */
  void      close();

  bool      is_opened() const { return descriptor_ != kInvalidDescriptor; }
  const fs::Path& get_path() const { return path_; }
  uint64_t  get_read_bytes() const { return read_bytes_; }

  friend std::ostream& operator<<(std::ostream& o, const FileSource& v);

 private:
  static const int kInvalidDescriptor = -1;
  const fs::Path  path_;
  int             descriptor_;
  uint64_t        read_bytes_;
};

/**
 * @brief Writes a local file with POSIX write(). close() makes it durable.
 * @ingroup STREAM
 * @details
 * open() creates missing parent folders and truncates an existing file.
 */
class FileSink CXX11_FINAL : public ByteSink {
 public:
  explicit FileSink(const fs::Path& path);
  ~FileSink();

  // non-copyable assignable.
  FileSink(const FileSink &other) CXX11_FUNC_DELETE;
  FileSink& operator=(const FileSink &other) CXX11_FUNC_DELETE;

  /** @param[in] mode permission bits of a newly created file. */
  ErrorCode open(uint32_t mode = 0644);
  ErrorCode write(const void* buffer, uint64_t size) CXX11_OVERRIDE;
  /** fsync() then close(). Idempotent. */
  ErrorCode close() CXX11_OVERRIDE;

  bool      is_opened() const { return descriptor_ != kInvalidDescriptor; }
  uint64_t  get_written_bytes() const { return written_bytes_; }

  friend std::ostream& operator<<(std::ostream& o, const FileSink& v);

 private:
  static const int kInvalidDescriptor = -1;
  const fs::Path  path_;
  int             descriptor_;
  uint64_t        written_bytes_;
  bool            closed_;
};

}  // namespace stream
}  // namespace walarc
#endif  // WALARC_STREAM_FILE_STREAM_HPP_
