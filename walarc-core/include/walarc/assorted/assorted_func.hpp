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
#ifndef WALARC_ASSORTED_ASSORTED_FUNC_HPP_
#define WALARC_ASSORTED_ASSORTED_FUNC_HPP_
#include <stdint.h>

#include <string>

/**
 * @defgroup ASSORTED Assorted Methods and Classes
 * @ingroup IDIOMS
 * @brief Small string and OS helpers shared by the packages.
 */
namespace walarc {
namespace assorted {

/** @ingroup ASSORTED */
std::string replace_all(const std::string& target, const std::string& search,
               const std::string& replacement);
/** @ingroup ASSORTED */
bool        starts_with(const std::string& str, const std::string& prefix);
/** @ingroup ASSORTED */
bool        ends_with(const std::string& str, const std::string& suffix);

/**
 * @brief Two lower-case hex digits per byte, as storages print MD5 checksums.
 * @ingroup ASSORTED
 */
std::string to_hex_string(const unsigned char* data, uint32_t length);

/**
 * @brief Thread-safe strerror() of the current errno, with the number.
 * @ingroup ASSORTED
 */
std::string os_error();
std::string os_error(int error_number);

/**
 * @brief Path of the running binary.
 * @ingroup ASSORTED
 * @details
 * Tests put it into their temporary folder names so that concurrent test binaries do not collide.
 */
std::string get_current_executable_path();

/**
 * @brief Demangles a C++ symbol, or returns it as it is.
 * @ingroup ASSORTED
 */
std::string demangle_type_name(const char* mangled_name);

}  // namespace assorted
}  // namespace walarc

#endif  // WALARC_ASSORTED_ASSORTED_FUNC_HPP_
