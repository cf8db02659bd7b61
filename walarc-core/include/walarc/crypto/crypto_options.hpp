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
#ifndef WALARC_CRYPTO_CRYPTO_OPTIONS_HPP_
#define WALARC_CRYPTO_CRYPTO_OPTIONS_HPP_

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/externalize/externalizable.hpp"

namespace walarc {
namespace crypto {
/**
 * @brief Set of options for client-side encryption of archived objects.
 * @ingroup CRYPTO
 * This is a POD-like struct. Default destructor/copy-constructor/assignment operator work fine.
 */
struct CryptoOptions CXX11_FINAL : public virtual externalize::Externalizable {
  CryptoOptions();

  /**
   * @brief PEM file of the RSA public key that wraps each object's data key.
   * @details
   * Encryption is armed iff this is non-empty. Default is "" (not armed).
   */
  std::string     public_key_path_;

  /**
   * @brief PEM file of the RSA private key to decrypt objects. Only needed to read back.
   */
  std::string     private_key_path_;

  bool            is_armed() const { return !public_key_path_.empty(); }

  EXTERNALIZABLE(CryptoOptions);
};
}  // namespace crypto
}  // namespace walarc
#endif  // WALARC_CRYPTO_CRYPTO_OPTIONS_HPP_
