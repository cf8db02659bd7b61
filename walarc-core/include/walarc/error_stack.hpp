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
#ifndef WALARC_ERROR_STACK_HPP_
#define WALARC_ERROR_STACK_HPP_

#include <stdint.h>

#include <cerrno>
#include <iosfwd>
#include <string>

#include "walarc/compiler.hpp"
#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"

namespace walarc {

/**
 * @brief The result of an archive operation, with where it failed and why.
 * @ingroup ERRORCODES
 * @details
 * Returned by the operations that run a whole command, such as a WAL push or a backup push.
 * Leaf functions return a plain ErrorCode instead. WRAP_ERROR_CODE converts one into this.
 *
 * An error carries the errno observed when it was created, an optional message naming
 * the segment or file involved, and the source locations it passed through on the way up.
 * A success carries nothing but the code.
 *
 * In debug builds, destructing an error that nobody looked at aborts the program.
 */
class ErrorStack {
 public:
  /** A source location the error passed through. Strings are literals, never copied. */
  struct Frame {
    const char* file_;
    const char* func_;
    uint32_t    line_;
  };
  enum Constants {
    /** Locations beyond this depth are dropped. */
    kMaxFrames = 8,
  };

  ErrorStack() : os_errno_(0), error_code_(kErrorCodeOk), frame_count_(0), checked_(true) {}
  explicit ErrorStack(ErrorCode code)
    : os_errno_(errno), error_code_(code), frame_count_(0), checked_(false) {}
  /** Creates an error at the given location. code must not be kErrorCodeOk. */
  ErrorStack(const char* file, const char* func, uint32_t line, ErrorCode code,
        const char* message = CXX11_NULLPTR);
  /** Copies other and adds one more location when it is an error. */
  ErrorStack(const ErrorStack& other, const char* file, const char* func, uint32_t line);
  ErrorStack(const ErrorStack& other);
  ErrorStack& operator=(const ErrorStack& other);
  ~ErrorStack();

  bool is_error() const {
    checked_ = true;
    return error_code_ != kErrorCodeOk;
  }
  ErrorCode get_error_code() const {
    checked_ = true;
    return error_code_;
  }
  const char*         get_message() const { return get_error_message(error_code_); }
  const std::string&  get_custom_message() const { return message_; }
  int                 get_os_errno() const { return os_errno_; }
  uint16_t            get_frame_count() const { return frame_count_; }
  const Frame&        get_frame(uint16_t index) const { return frames_[index]; }

  /** Writes this error with its locations and the current backtrace, then aborts. */
  void                dump_and_abort(const char* abort_message) const;

  friend std::ostream& operator<<(std::ostream& o, const ErrorStack& obj);

 private:
  void push_frame(const char* file, const char* func, uint32_t line);

  /** frames_[0] is where the error was created. */
  Frame           frames_[kMaxFrames];
  std::string     message_;
  int             os_errno_;
  ErrorCode       error_code_;
  uint16_t        frame_count_;
  /** Copying an error hands the obligation to check it over to the copy. */
  mutable bool    checked_;
};

/**
 * @var kRetOk
 * @ingroup ERRORCODES
 * @brief Normal return value for no-error case.
 */
const ErrorStack kRetOk;

}  // namespace walarc

/**
 * @def ERROR_STACK(e)
 * @ingroup ERRORCODES
 * @brief Creates an ErrorStack of the given walarc::ErrorCode at the current location.
 */
#define ERROR_STACK(e)      walarc::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e)

/**
 * @def ERROR_STACK_MSG(e, m)
 * @ingroup ERRORCODES
 * @brief ERROR_STACK(e) with a message, usually the path of the file or object involved.
 */
#define ERROR_STACK_MSG(e, m)   walarc::ErrorStack(__FILE__, __FUNCTION__, __LINE__, e, m)

/**
 * @def CHECK_ERROR(x)
 * @ingroup ERRORCODES
 * @brief Returns the ErrorStack \b x gives, with this location added, when it is an error.
 * @note Named so because glog defines CHECK.
 */
#define CHECK_ERROR(x)\
{\
  walarc::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    return walarc::ErrorStack(__e, __FILE__, __FUNCTION__, __LINE__);\
  }\
}

/**
 * @def WRAP_ERROR_CODE(x)
 * @ingroup ERRORCODES
 * @brief Returns an ErrorStack created here when the ErrorCode \b x gives is an error.
 */
#define WRAP_ERROR_CODE(x)\
{\
  walarc::ErrorCode __e = x;\
  if (UNLIKELY(__e != walarc::kErrorCodeOk)) {return ERROR_STACK(__e);}\
}

/**
 * @def CHECK_OUTOFMEMORY(ptr)
 * @ingroup ERRORCODES
 * @brief Returns kErrorCodeOutofmemory when \b ptr is null.
 */
#define CHECK_OUTOFMEMORY(ptr)\
if (UNLIKELY(!ptr)) {\
  return walarc::ErrorStack(__FILE__, __FUNCTION__, __LINE__, walarc::kErrorCodeOutofmemory);\
}

/**
 * @def COERCE_ERROR(x)
 * @ingroup ERRORCODES
 * @brief Aborts when \b x gives an error. Only for places that never fail, such as tests.
 */
#define COERCE_ERROR(x)\
{\
  walarc::ErrorStack __e(x);\
  if (UNLIKELY(__e.is_error())) {\
    __e.dump_and_abort("Unexpected error happened");\
  }\
}

#endif  // WALARC_ERROR_STACK_HPP_
