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
#include "walarc/crypto/crypto_options.hpp"
#include "walarc/externalize/externalizable.hpp"
namespace walarc {
namespace crypto {
CryptoOptions::CryptoOptions() : public_key_path_(""), private_key_path_("") {
}

ErrorStack CryptoOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, public_key_path_, "");
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, private_key_path_, "");
  return kRetOk;
}

ErrorStack CryptoOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options for client-side encryption"));
  EXTERNALIZE_SAVE_ELEMENT(element, public_key_path_,
    "PEM file of the RSA public key. Encryption is armed iff this is non-empty.");
  EXTERNALIZE_SAVE_ELEMENT(element, private_key_path_,
    "PEM file of the RSA private key. Only needed to decrypt.");
  return kRetOk;
}

}  // namespace crypto
}  // namespace walarc
