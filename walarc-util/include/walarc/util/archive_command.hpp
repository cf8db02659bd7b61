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
#ifndef WALARC_UTIL_ARCHIVE_COMMAND_HPP_
#define WALARC_UTIL_ARCHIVE_COMMAND_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "walarc/error_stack.hpp"
#include "walarc/fs/path.hpp"

namespace walarc {
namespace util {
/**
 * @brief One invocation of walarc_util, already parsed from the command line.
 * @details
 * run() loads the options, boots an archive::Archiver, runs the command and shuts the archiver
 * down. The return value is the exit status of the process.
 */
struct ArchiveCommand {
  enum Command {
    kInvalidCommand = 0,
    kWalPush,
    kBackupPush,
  };
  static Command parse_command(const std::string& name);
  static const char* command_name(Command command);

  ArchiveCommand() : command_(kInvalidCommand), verify_(false), producers_(4), verbose_(0) {}

  Command     command_;
  /** Segment file of wal-push or data directory of backup-push. */
  fs::Path    target_;
  /** XML written by ArchiveOptions::save_to_file(). Empty to start from the defaults. */
  fs::Path    config_file_;
  /** Forces verification of uploads even if the options do not ask for it. */
  bool        verify_;

  std::string backup_name_;
  std::string finish_lsn_;
  /** Files whose contents become backup_label and tablespace_map. Empty if not given. */
  fs::Path    backup_label_file_;
  fs::Path    tablespace_map_file_;
  std::string user_data_;
  uint16_t    producers_;
  int32_t     verbose_;

  int         run();
  ErrorStack  run_impl();

  friend std::ostream& operator<<(std::ostream& o, const ArchiveCommand& v);
};
}  // namespace util
}  // namespace walarc
#endif  // WALARC_UTIL_ARCHIVE_COMMAND_HPP_
