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
#include "walarc/assorted/assorted_func.hpp"

#include <cxxabi.h>
#include <stdint.h>
#include <string.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <string>

namespace walarc {
namespace assorted {

std::string replace_all(const std::string& target, const std::string& search,
               const std::string& replacement) {
  if (search.empty()) {
    return target;
  }
  std::string subject = target;
  for (std::size_t pos = subject.find(search);
    pos != std::string::npos;
    pos = subject.find(search, pos + replacement.size())) {
    subject.replace(pos, search.size(), replacement);
  }
  return subject;
}

bool starts_with(const std::string& str, const std::string& prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size()
    && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_hex_string(const unsigned char* data, uint32_t length) {
  const char* kHexChars = "0123456789abcdef";
  std::string ret(length * 2U, '0');
  for (uint32_t i = 0; i < length; ++i) {
    ret[i * 2U] = kHexChars[data[i] >> 4];
    ret[i * 2U + 1U] = kHexChars[data[i] & 0xF];
  }
  return ret;
}

std::string os_error() {
  return os_error(errno);
}

std::string os_error(int error_number) {
  if (error_number == 0) {
    return "[No Error]";
  }
  char buffer[256];
  buffer[0] = '\0';
  // GNU strerror_r may return a static string instead of filling the buffer.
#if defined(_GNU_SOURCE)
  const char* message = ::strerror_r(error_number, buffer, sizeof(buffer));
#else  // defined(_GNU_SOURCE)
  const char* message = buffer;
  if (::strerror_r(error_number, buffer, sizeof(buffer)) != 0) {
    message = "unknown error";
  }
#endif  // defined(_GNU_SOURCE)
  std::stringstream str;
  str << "[Errno " << error_number << "] " << message;
  return str.str();
}

std::string get_current_executable_path() {
  char buf[1024];
  ssize_t len = ::readlink("/proc/self/exe", buf, sizeof(buf));
  return len < 0 ? std::string() : std::string(buf, len);
}

std::string demangle_type_name(const char* mangled_name) {
  int status;
  char* demangled = abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status);
  if (demangled == nullptr) {
    return mangled_name;
  }
  std::string ret(demangled);
  ::free(demangled);
  return ret;
}

}  // namespace assorted
}  // namespace walarc
