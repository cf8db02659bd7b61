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
#ifndef WALARC_TEST_COMMON_HPP_
#define WALARC_TEST_COMMON_HPP_

#include <string>

#include "walarc/archive/archive_options.hpp"
#include "walarc/fs/fwd.hpp"

namespace walarc {
  /** "%%%%_%%%%_%%%%_%%%%" filled with hex digits, seeded by the command line. */
  std::string     get_random_name();

  /** tmp_files/<random name>/<name>. The folder is created, the file is not. */
  std::string     get_random_tmp_file_path(const std::string& name);

  /**
   * Options for a file:// bucket under a random folder, with parts and tar thresholds small
   * enough that a few hundred KB of test data rotate tars and upload in several parts.
   */
  archive::ArchiveOptions get_tiny_options();

  /** Removes the bucket folder of get_tiny_options(). */
  void            cleanup_test(const archive::ArchiveOptions& options);

  /** Writes the given content to a file, creating parent folders. Returns false on failure. */
  bool            write_test_file(const fs::Path& path, const std::string& content);

  /**
   * Remembers the test names and the --gtest_output file, and makes SIGSEGV, SIGABRT,
   * SIGBUS and SIGFPE write a failed testcase with the backtrace into that file.
   */
  void            register_signal_handlers(
    const char* test_case_name,
    const char* package_name,
    int argc,
    char** argv);

  /**
   * Writes a failed result xml before any test runs. gtest replaces it on a normal exit, so
   * it survives only when the process is killed, for example by a ctest timeout.
   */
  void            pre_populate_error_result_xml();
}  // namespace walarc

#define TEST_QUOTE(str) #str
#define TEST_EXPAND_AND_QUOTE(str) TEST_QUOTE(str)

/** Names the testcase and the package so that each test can print them. */
#define DEFINE_TEST_CASE_PACKAGE(test_case_name, package_name) \
  const char* kTestCaseName = TEST_EXPAND_AND_QUOTE(test_case_name); \
  const char* kTestPackageName = TEST_EXPAND_AND_QUOTE(package_name);

/** main() of every test executable. */
#define TEST_MAIN_CAPTURE_SIGNALS(test_case_name, package_name) \
  int main(int argc, char **argv) { \
    walarc::register_signal_handlers( \
      TEST_EXPAND_AND_QUOTE(test_case_name), \
      TEST_EXPAND_AND_QUOTE(package_name), \
      argc, \
      argv); \
    walarc::pre_populate_error_result_xml(); \
    ::testing::InitGoogleTest(&argc, argv); \
    return RUN_ALL_TESTS(); \
  }

#endif  // WALARC_TEST_COMMON_HPP_
