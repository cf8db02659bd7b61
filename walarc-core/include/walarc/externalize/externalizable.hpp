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
#ifndef WALARC_EXTERNALIZE_EXTERNALIZABLE_HPP_
#define WALARC_EXTERNALIZE_EXTERNALIZABLE_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/error_stack.hpp"
#include "walarc/fs/fwd.hpp"

/**
 * @defgroup EXTERNALIZE Externalization
 * @ingroup IDIOMS
 * @brief Options and backup sentinels as XML, via tinyxml2.
 * @details
 * A class derives from Externalizable, invokes EXTERNALIZABLE() in its definition, and
 * writes load() and save() with the EXTERNALIZE_XXX macros. Each member becomes one element
 * named after the member, preceded by a comment that explains it.
 */

namespace tinyxml2 {
  class XMLElement;
}  // namespace tinyxml2

namespace walarc {
namespace externalize {
/**
 * @brief An object that can be written to and read from XML.
 * @ingroup EXTERNALIZE
 */
struct Externalizable {
  virtual ~Externalizable() {}

  /** Reads members from the element. Fails on a missing mandatory element or a bad value. */
  virtual ErrorStack load(tinyxml2::XMLElement* element) = 0;
  /** Writes members as child elements. The caller names the element itself. */
  virtual ErrorStack save(tinyxml2::XMLElement* element) const = 0;
  /** Tag of the root element when this object is the whole document. */
  virtual const char* get_tag_name() const = 0;
  /** operator= of the derived class. other must be of the same class. */
  virtual void assign(const walarc::externalize::Externalizable *other) = 0;

  /** The XML text, or the error that prevented it. Never fails. */
  void        save_to_stream(std::ostream* ptr) const;
  ErrorStack  save_to_string(std::string* out) const;
  ErrorStack  load_from_string(const std::string& xml);
  ErrorStack  load_from_file(const fs::Path &path);
  /**
   * @brief Writes a temporary file next to path and renames it over path durably.
   * @details
   * Readers see either the old or the new content. Missing folders are created.
   */
  ErrorStack  save_to_file(const fs::Path &path) const;

  /** Puts a comment right before the element. No-op for an empty comment. */
  static ErrorStack insert_comment(tinyxml2::XMLElement* element, const std::string& comment);

  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, const std::string& value);
  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, bool value);
  /** Integers. Instantiated in the cpp for int16_t, uint16_t, uint32_t and int64_t. */
  template <typename T>
  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, T value);
  template <typename ENUM>
  static ErrorStack add_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, ENUM value) {
    return add_element<int64_t>(parent, tag, comment, static_cast<int64_t>(value));
  }
  static ErrorStack add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, const Externalizable& child);

  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  std::string* out, bool optional = false, const char* value = "");
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  bool* out, bool optional = false, bool value = false);
  /**
   * Integers. A value that does not fit T is kErrorCodeConfValueOutofrange.
   * Instantiated for the same types as add_element().
   */
  template <typename T>
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  T* out, bool optional = false, T value = T());
  template <typename ENUM>
  static ErrorStack get_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
          ENUM* out) {
    int64_t tmp;
    CHECK_ERROR(get_element<int64_t>(parent, tag, &tmp));
    if (static_cast<int64_t>(static_cast<ENUM>(tmp)) != tmp) {
      return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, tag.c_str());
    }
    *out = static_cast<ENUM>(tmp);
    return kRetOk;
  }
  static ErrorStack get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
            Externalizable* child, bool optional = false);
};

}  // namespace externalize
}  // namespace walarc

#define EX_QUOTE(str) #str
#define EX_EXPAND(str) EX_QUOTE(str)

/**
 * @def EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment)
 * @ingroup EXTERNALIZE
 * @brief Saves the member \b attribute as a child element of the same name.
 */
#define EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_element(element, EX_EXPAND(attribute), comment, attribute))
#define EXTERNALIZE_SAVE_ENUM_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_enum_element(element, EX_EXPAND(attribute), comment, attribute))

/**
 * @def EXTERNALIZE_LOAD_ELEMENT(element, attribute)
 * @ingroup EXTERNALIZE
 * @brief Loads the member \b attribute from the child element of the same name.
 */
#define EXTERNALIZE_LOAD_ELEMENT(element, attribute) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute))
/** Same as EXTERNALIZE_LOAD_ELEMENT, but a missing element gives default_value. */
#define EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, attribute, default_value) \
  CHECK_ERROR(get_element(element, EX_EXPAND(attribute), & attribute, true, default_value))
#define EXTERNALIZE_LOAD_ENUM_ELEMENT(element, attribute) \
  CHECK_ERROR(get_enum_element(element, EX_EXPAND(attribute), & attribute))

/**
 * @def EXTERNALIZABLE(clazz)
 * @ingroup EXTERNALIZE
 * @brief Declares load() and save(), and defines the rest of Externalizable for clazz.
 * @details
 * operator<< of clazz prints the XML.
 */
#define EXTERNALIZABLE(clazz) \
  ErrorStack load(tinyxml2::XMLElement* element) CXX11_OVERRIDE;\
  ErrorStack save(tinyxml2::XMLElement* element) const CXX11_OVERRIDE;\
  const char* get_tag_name() const CXX11_OVERRIDE { return EX_EXPAND(clazz); }\
  void assign(const walarc::externalize::Externalizable *other) CXX11_OVERRIDE {\
    *this = *dynamic_cast< const clazz * >(other);\
  }\
  friend std::ostream& operator<<(std::ostream& o, const clazz & v) {\
    v.save_to_stream(&o);\
    return o;\
  }

#endif  // WALARC_EXTERNALIZE_EXTERNALIZABLE_HPP_
