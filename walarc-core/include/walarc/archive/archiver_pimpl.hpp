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
#ifndef WALARC_ARCHIVE_ARCHIVER_PIMPL_HPP_
#define WALARC_ARCHIVE_ARCHIVER_PIMPL_HPP_

#include <memory>
#include <string>

#include "walarc/initializable.hpp"
#include "walarc/archive/archive_options.hpp"
#include "walarc/archive/archive_paths.hpp"
#include "walarc/archive/fwd.hpp"
// This is pimpl. no need for further indirections. just include them all.
#include "walarc/crypto/crypter.hpp"
#include "walarc/debugging/debugging_supports.hpp"
#include "walarc/storage/storage_client.hpp"
#include "walarc/storage/uploader_impl.hpp"

namespace walarc {
namespace archive {
/**
 * @brief Pimpl object of Archiver.
 * @ingroup ARCHIVE
 * @details
 * Do not include this header from a client program unless you know what you are doing.
 */
class ArchiverPimpl final : public DefaultInitializable {
 public:
  ArchiverPimpl() = delete;
  explicit ArchiverPimpl(const ArchiveOptions &options);

  ErrorStack  initialize_once() override;
  ErrorStack  uninitialize_once() override;

  ErrorStack  wal_push(const fs::Path& segment_file);
  ErrorStack  backup_push(const BackupRequest& request, BackupSentinel* sentinel);

  /** Instantiates the storage client for the scheme of prefix_. */
  ErrorCode   create_storage_client();

  /** Options given at boot time. Immutable once initialize() started. */
  const ArchiveOptions                  options_;
  debugging::DebuggingSupports          debug_;
  StoragePrefix                         prefix_;

  std::unique_ptr<storage::StorageClient> storage_client_;
  std::unique_ptr<crypto::Crypter>        crypter_;
  std::unique_ptr<storage::Uploader>      uploader_;
};
}  // namespace archive
}  // namespace walarc
#endif  // WALARC_ARCHIVE_ARCHIVER_PIMPL_HPP_
