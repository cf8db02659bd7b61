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
#include "walarc/archive/archiver.hpp"

#include <string>

#include "walarc/archive/archiver_pimpl.hpp"

namespace walarc {
namespace archive {
Archiver::Archiver(const ArchiveOptions& options) : pimpl_(nullptr) {
  pimpl_ = new ArchiverPimpl(options);
}
Archiver::~Archiver() {
  delete pimpl_;
}

// simply forward to pimpl object
const ArchiveOptions& Archiver::get_options() const { return pimpl_->options_; }
const std::string&    Archiver::get_server() const  { return pimpl_->prefix_.server_; }

bool        Archiver::is_initialized() const  { return pimpl_->is_initialized(); }
ErrorStack  Archiver::initialize()            { return pimpl_->initialize(); }
ErrorStack  Archiver::uninitialize()          { return pimpl_->uninitialize(); }

ErrorStack Archiver::wal_push(const fs::Path& segment_file) {
  return pimpl_->wal_push(segment_file);
}
ErrorStack Archiver::backup_push(const BackupRequest& request, BackupSentinel* sentinel) {
  return pimpl_->backup_push(request, sentinel);
}

}  // namespace archive
}  // namespace walarc
