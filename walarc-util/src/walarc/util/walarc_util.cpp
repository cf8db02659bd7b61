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
#include <gflags/gflags.h>
#include <stdint.h>

#include <iostream>
#include <string>

#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/util/archive_command.hpp"

/**
 * @file walarc_util.cpp
 * @brief Command line front end of walarc
 * @details
 * Archives one WAL segment or takes a base backup, configured by an XML file, environment
 * variables and the flags below.
 */
DEFINE_string(command, "", "wal-push or backup-push.");
DEFINE_string(config, "", "XML file of ArchiveOptions. Environment variables override it.");
DEFINE_bool(verify, false, "Verify every upload by comparing checksums, as WALG_VERIFY_UPLOAD.");
DEFINE_string(backup_name, "", "Name of the base backup. Required by backup-push.");
DEFINE_string(finish_lsn, "", "LSN at which the backup finished, such as 0/3000138.");
DEFINE_string(backup_label_file, "", "File whose content is stored as backup_label.");
DEFINE_string(tablespace_map_file, "", "File whose content is stored as tablespace_map.");
DEFINE_string(user_data, "", "Opaque text stored in the backup sentinel.");
DEFINE_int32(producers, 4, "Number of threads that write files into tar parts.");
DEFINE_int32(verbose, 0, "glog verbosity (FLAGS_v).");

bool ValidateCommand(const char* flagname, const std::string& value) {
  if (walarc::util::ArchiveCommand::parse_command(value)
    != walarc::util::ArchiveCommand::kInvalidCommand) {
    return true;
  }
  std::cout << "Invalid value for --" << flagname << ": " << value << std::endl;
  return false;
}

bool ValidateProducers(const char* flagname, int32_t value) {
  if (value >= 1 && value <= 256) {
    return true;
  }
  std::cout << "Invalid value for --" << flagname << ": " << value << std::endl;
  return false;
}

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("WAL and base backup archiver\n"
    "  Usage: walarc_util --command=<command> <flags> <target>\n"
    "  Example: walarc_util --command=wal-push pg_wal/000000010000000000000003\n"
    "  Example2: walarc_util --command=backup-push --backup_name=base_000000010000000000000004"
    " --config=/etc/walarc.xml /var/lib/postgresql/data");
  gflags::RegisterFlagValidator(&FLAGS_command,    &ValidateCommand);
  gflags::RegisterFlagValidator(&FLAGS_producers,  &ValidateProducers);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc != 2) {
    std::cerr << "Specify exactly one target" << std::endl;
    return 1;
  }

  walarc::util::ArchiveCommand command;
  command.command_ = walarc::util::ArchiveCommand::parse_command(FLAGS_command);
  command.target_ = walarc::fs::Path(std::string(argv[1]));
  if (!FLAGS_config.empty()) {
    command.config_file_ = walarc::fs::Path(FLAGS_config);
  }
  command.verify_ = FLAGS_verify;
  command.backup_name_ = FLAGS_backup_name;
  command.finish_lsn_ = FLAGS_finish_lsn;
  if (!FLAGS_backup_label_file.empty()) {
    command.backup_label_file_ = walarc::fs::Path(FLAGS_backup_label_file);
  }
  if (!FLAGS_tablespace_map_file.empty()) {
    command.tablespace_map_file_ = walarc::fs::Path(FLAGS_tablespace_map_file);
  }
  command.user_data_ = FLAGS_user_data;
  command.producers_ = static_cast<uint16_t>(FLAGS_producers);
  command.verbose_ = FLAGS_verbose;

  if (command.command_ == walarc::util::ArchiveCommand::kWalPush) {
    if (!walarc::fs::is_regular_file(command.target_)) {
      std::cerr << "Not a regular file: " << command.target_ << std::endl;
      return 1;
    }
  } else {
    if (!walarc::fs::is_directory(command.target_)) {
      std::cerr << "Not a directory: " << command.target_ << std::endl;
      return 1;
    }
    if (command.backup_name_.empty()) {
      std::cerr << "--backup_name is required by backup-push" << std::endl;
      return 1;
    }
  }
  return command.run();
}
