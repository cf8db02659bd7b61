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
#ifndef WALARC_ASSERT_ND_HPP_
#define WALARC_ASSERT_ND_HPP_

#include <string>

/**
 * @def ASSERT_ND(x)
 * @ingroup IDIOMS
 * @brief assert() that prints a backtrace, and that compiles to nothing with NDEBUG.
 * @details
 * In release builds \b x is kept only inside sizeof() so that variables used solely in
 * assertions do not cause unused-variable warnings.
 * Only for invariants of walarc itself. Bad input and I/O failures are returned as ErrorCode.
 */
namespace walarc {
/** Backtrace of the calling thread, one frame per line. Best-effort. */
std::string print_backtrace();

/** Writes the failed assertion and a backtrace to stderr. Called by ASSERT_ND. */
void print_assert_backtrace(const char* file, const char* func, int line, const char* expr);
}  // namespace walarc

#ifdef NDEBUG
#define ASSERT_ND(x) do { (void) sizeof(x); } while (0)
#else  // NDEBUG
#include <cassert>
#define ASSERT_QUOTE(str) #str
#define ASSERT_ND(x) do { if (!(x)) { \
  walarc::print_assert_backtrace(__FILE__, __FUNCTION__, __LINE__, ASSERT_QUOTE(x)); \
  assert(x); \
  } } while (0)
#endif  // NDEBUG

#endif  // WALARC_ASSERT_ND_HPP_
