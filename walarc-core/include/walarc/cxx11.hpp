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
#ifndef WALARC_CXX11_HPP_
#define WALARC_CXX11_HPP_
/**
 * @defgroup CXX11 C++11 Keywords in Public Headers
 * @ingroup IDIOMS
 * @brief Public headers spell C++11 keywords through these macros.
 * @details
 * A program that embeds the archiver, such as a backup agent built with an older dialect,
 * can include the public headers of libwalarc-core. Its own *_impl.hpp and *.cpp files
 * need C++11 regardless.
 */
#if __cplusplus < 201103L
#define WALARC_NO_CXX11
#endif  // __cplusplus < 201103L

#ifdef WALARC_NO_CXX11
#define CXX11_FUNC_DELETE
#define CXX11_FINAL
#define CXX11_NULLPTR NULL
#define CXX11_NOEXCEPT
#define CXX11_OVERRIDE
#else   // WALARC_NO_CXX11
#define CXX11_FUNC_DELETE = delete
#define CXX11_FINAL final
#define CXX11_NULLPTR nullptr
#define CXX11_NOEXCEPT noexcept
#define CXX11_OVERRIDE override
#endif  // WALARC_NO_CXX11

#endif  // WALARC_CXX11_HPP_
