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
#ifndef WALARC_ARCHIVE_ARCHIVER_HPP_
#define WALARC_ARCHIVE_ARCHIVER_HPP_

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/error_stack.hpp"
#include "walarc/initializable.hpp"
#include "walarc/archive/fwd.hpp"
#include "walarc/fs/fwd.hpp"

/**
 * @defgroup ARCHIVE Archive
 * @brief \b Archiver, the entry point of walarc.
 * @details
 * Every command starts from an Archiver instance.
 * @code{.cpp}
 * archive::ArchiveOptions options;
 * CHECK_ERROR(options.load_from_env());
 * archive::Archiver archiver(options);
 * CHECK_ERROR(archiver.initialize());
 * ErrorStack result = archiver.wal_push(fs::Path("pg_wal/000000010000000000000003"));
 * CHECK_ERROR(archiver.uninitialize());
 * @endcode
 */

namespace walarc {
namespace archive {
class ArchiverPimpl;

/**
 * @brief Archiver wires options, logging, storage, encryption and uploads together.
 * @ingroup ARCHIVE
 * @details
 * initialize() validates the options, starts glog, parses the storage prefix and instantiates
 * the storage client for its scheme. Only the "file" scheme is available, which stores objects
 * under ArchiveOptions::local_bucket_root_/<bucket>. An armed CryptoOptions selects the
 * OpenSSL crypter.
 */
class Archiver CXX11_FINAL : public virtual Initializable {
 public:
  /** Instantiates an archiver object which is \b NOT initialized yet. */
  explicit Archiver(const ArchiveOptions &options);

  /** Do NOT rely on this destructor to release resources. Call uninitialize() instead. */
  ~Archiver();

  // Disable default constructors
  Archiver() CXX11_FUNC_DELETE;
  Archiver(const Archiver &) CXX11_FUNC_DELETE;
  Archiver& operator=(const Archiver &) CXX11_FUNC_DELETE;

  ErrorStack  initialize() CXX11_OVERRIDE;
  bool        is_initialized() const CXX11_OVERRIDE;
  ErrorStack  uninitialize() CXX11_OVERRIDE;

  const ArchiveOptions&   get_options() const;
  /** Server part of the storage prefix. Valid after initialize(). */
  const std::string&      get_server() const;

  /**
   * @brief Archives one WAL segment file.
   * @details
   * When background_upload_workers_ is positive, other ready segments of the same folder are
   * uploaded meanwhile and drained before this returns.
   */
  ErrorStack  wal_push(const fs::Path& segment_file);

  /**
   * @brief Takes a base backup of a data directory.
   * @param[in] request what to back up. An empty user_data_ takes
   * ArchiveOptions::sentinel_user_data_.
   * @param[out] sentinel what was stored as the backup sentinel. Can be null.
   */
  ErrorStack  backup_push(const BackupRequest& request, BackupSentinel* sentinel);

 private:
  ArchiverPimpl* pimpl_;
};
}  // namespace archive
}  // namespace walarc
#endif  // WALARC_ARCHIVE_ARCHIVER_HPP_
