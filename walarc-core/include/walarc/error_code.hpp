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
#ifndef WALARC_ERROR_CODE_HPP_
#define WALARC_ERROR_CODE_HPP_

#include "walarc/compiler.hpp"

namespace walarc {

/**
 * @defgroup ERRORCODES Error codes, messages, and stacktraces
 * @brief ErrorCode enumerates every failure of walarc. ErrorStack adds where it happened.
 * @details
 * Each line of error_code.xmacro defines one code, its value and its message.
 * Stream stages, storage clients and other leaf functions return ErrorCode.
 * Operations that a command runs end to end return ErrorStack.
 * @see http://en.wikipedia.org/wiki/X_Macro
 */

#define X(a, b, c) /** b: c. */ a = b,
/**
 * @var ErrorCode
 * @ingroup ERRORCODES
 * @brief Enum of error codes defined in error_code.xmacro.
 */
enum ErrorCode {
  /** 0 means no-error. */
  kErrorCodeOk = 0,
#include "walarc/error_code.xmacro" // NOLINT
};
#undef X

/** Name of the enum value, such as "kErrorCodeFsNotFound". */
inline const char* get_error_name(ErrorCode code) {
#define X_QUOTE(str) #str
#define X(a, b, c) case a: return X_QUOTE(a);
  switch (code) {
    case kErrorCodeOk: return "kErrorCodeOk";
#include "walarc/error_code.xmacro" // NOLINT
  }
#undef X
#undef X_QUOTE
  return "Unexpected error code";
}

/** Human-readable message of the code. */
inline const char* get_error_message(ErrorCode code) {
#define X(a, b, c) case a: return c;
  switch (code) {
    case kErrorCodeOk: return "no_error";
#include "walarc/error_code.xmacro" // NOLINT
  }
#undef X
  return "Unexpected error code";
}

}  // namespace walarc

/**
 * @def CHECK_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief Returns the ErrorCode \b x gives when it is not kErrorCodeOk.
 * @details
 * Only for functions returning ErrorCode. Use WRAP_ERROR_CODE(x) in those returning ErrorStack.
 */
#define CHECK_ERROR_CODE(x)\
{\
  walarc::ErrorCode __e = x;\
  if (UNLIKELY(__e != walarc::kErrorCodeOk)) {\
    return __e;\
  }\
}

#endif  // WALARC_ERROR_CODE_HPP_
