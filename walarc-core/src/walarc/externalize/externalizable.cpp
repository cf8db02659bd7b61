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
#include "walarc/externalize/externalizable.hpp"

#include <glog/logging.h>
#include <tinyxml2.h>

#include <limits>
#include <ostream>
#include <sstream>
#include <string>

#include "walarc/assorted/assorted_func.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/stream/file_stream.hpp"

namespace walarc {
namespace externalize {
namespace {
/** Loads the root element of a parsed document into target. name is for messages. */
ErrorStack load_document(
  tinyxml2::XMLDocument* document,
  tinyxml2::XMLError parse_result,
  const std::string& name,
  Externalizable* target) {
  if (parse_result != tinyxml2::XML_SUCCESS) {
    std::stringstream message;
    message << name << ": " << document->ErrorStr();
    return ERROR_STACK_MSG(kErrorCodeConfParseFailed, message.str().c_str());
  }
  if (document->RootElement() == nullptr) {
    return ERROR_STACK_MSG(kErrorCodeConfEmptyXml, name.c_str());
  }
  CHECK_ERROR(target->load(document->RootElement()));
  return kRetOk;
}

tinyxml2::XMLElement* new_child(tinyxml2::XMLElement* parent, const std::string& tag) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  if (element) {
    parent->InsertEndChild(element);
  }
  return element;
}
}  // namespace

ErrorStack Externalizable::load_from_string(const std::string& xml) {
  tinyxml2::XMLDocument document;
  tinyxml2::XMLError result = document.Parse(xml.data(), xml.size());
  return load_document(&document, result, "(string)", this);
}

ErrorStack Externalizable::load_from_file(const fs::Path& path) {
  if (!fs::is_regular_file(path)) {
    return ERROR_STACK_MSG(kErrorCodeConfFileNotFound, path.c_str());
  }
  tinyxml2::XMLDocument document;
  tinyxml2::XMLError result = document.LoadFile(path.c_str());
  CHECK_ERROR(load_document(&document, result, path.string(), this));
  VLOG(0) << "Loaded " << get_tag_name() << " from " << path;
  return kRetOk;
}

ErrorStack Externalizable::save_to_string(std::string* out) const {
  tinyxml2::XMLDocument document;
  tinyxml2::XMLElement* root = document.NewElement(get_tag_name());
  CHECK_OUTOFMEMORY(root);
  document.InsertFirstChild(root);
  CHECK_ERROR(save(root));
  tinyxml2::XMLPrinter printer;
  document.Print(&printer);
  *out = printer.CStr();
  return kRetOk;
}

void Externalizable::save_to_stream(std::ostream* ptr) const {
  std::string xml;
  ErrorStack result = save_to_string(&xml);
  if (result.is_error()) {
    *ptr << "<!-- " << get_tag_name() << " could not be printed: " << result << " -->";
  } else {
    *ptr << xml;
  }
}

ErrorStack Externalizable::save_to_file(const fs::Path& path) const {
  std::string xml;
  CHECK_ERROR(save_to_string(&xml));

  fs::Path tmp_path(path.string() + ".tmp_" + fs::unique_name("%%%%%%%%"));
  stream::FileSink sink(tmp_path);
  ErrorCode code = sink.open(0600);
  if (code == kErrorCodeFsMkdirFailed) {
    return ERROR_STACK_MSG(kErrorCodeConfMkdirsFailed, path.c_str());
  }
  if (code == kErrorCodeOk) {
    code = sink.write(xml.data(), xml.size());
  }
  // close() fsyncs the temporary file, so the rename below is all that is left
  ErrorCode close_code = sink.close();
  if (code == kErrorCodeOk) {
    code = close_code;
  }
  if (code != kErrorCodeOk) {
    fs::remove(tmp_path);
    return ERROR_STACK_MSG(kErrorCodeConfCouldNotWrite, tmp_path.c_str());
  }
  if (!fs::atomic_rename(tmp_path, path) || !fs::fsync(path, true)) {
    std::string message = path.string() + ": " + assorted::os_error();
    fs::remove(tmp_path);
    return ERROR_STACK_MSG(kErrorCodeConfCouldNotRename, message.c_str());
  }
  return kRetOk;
}

ErrorStack Externalizable::insert_comment(tinyxml2::XMLElement* element,
                      const std::string& comment) {
  if (comment.empty()) {
    return kRetOk;
  }
  tinyxml2::XMLComment* node = element->GetDocument()->NewComment(comment.c_str());
  CHECK_OUTOFMEMORY(node);
  tinyxml2::XMLNode* parent = element->Parent();
  tinyxml2::XMLNode* previous = element->PreviousSibling();
  if (parent == nullptr) {
    element->GetDocument()->InsertFirstChild(node);
  } else if (previous) {
    parent->InsertAfterChild(previous, node);
  } else {
    parent->InsertFirstChild(node);
  }
  return kRetOk;
}

ErrorStack Externalizable::add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, const std::string& value) {
  tinyxml2::XMLElement* element = new_child(parent, tag);
  CHECK_OUTOFMEMORY(element);
  element->SetText(value.c_str());
  return insert_comment(element, comment);
}

ErrorStack Externalizable::add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, bool value) {
  tinyxml2::XMLElement* element = new_child(parent, tag);
  CHECK_OUTOFMEMORY(element);
  element->SetText(value);
  return insert_comment(element, comment);
}

template <typename T>
ErrorStack Externalizable::add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, T value) {
  tinyxml2::XMLElement* element = new_child(parent, tag);
  CHECK_OUTOFMEMORY(element);
  element->SetText(static_cast<int64_t>(value));
  return insert_comment(element, comment);
}

ErrorStack Externalizable::add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     const std::string& comment, const Externalizable& child) {
  tinyxml2::XMLElement* element = new_child(parent, tag);
  CHECK_OUTOFMEMORY(element);
  CHECK_ERROR(insert_comment(element, comment));
  return child.save(element);
}

ErrorStack Externalizable::get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  std::string* out, bool optional, const char* value) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element == nullptr) {
    if (!optional) {
      return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
    }
    *out = value;
    return kRetOk;
  }
  // an empty element is an empty string, not a missing one
  const char* text = element->GetText();
  *out = text ? text : "";
  return kRetOk;
}

ErrorStack Externalizable::get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  bool* out, bool optional, bool value) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element == nullptr) {
    if (!optional) {
      return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
    }
    *out = value;
    return kRetOk;
  }
  if (element->QueryBoolText(out) != tinyxml2::XML_SUCCESS) {
    return ERROR_STACK_MSG(kErrorCodeConfInvalidElement, tag.c_str());
  }
  return kRetOk;
}

template <typename T>
ErrorStack Externalizable::get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  T* out, bool optional, T value) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element == nullptr) {
    if (!optional) {
      return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
    }
    *out = value;
    return kRetOk;
  }
  int64_t parsed;
  if (element->QueryInt64Text(&parsed) != tinyxml2::XML_SUCCESS) {
    return ERROR_STACK_MSG(kErrorCodeConfInvalidElement, tag.c_str());
  }
  if (parsed < static_cast<int64_t>(std::numeric_limits<T>::min())
    || (std::numeric_limits<T>::digits < 63
      && parsed > static_cast<int64_t>(std::numeric_limits<T>::max()))) {
    return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, tag.c_str());
  }
  *out = static_cast<T>(parsed);
  return kRetOk;
}

// @cond DOXYGEN_IGNORE
#define EX_INSTANTIATE(T)\
  template ErrorStack Externalizable::add_element< T >(\
    tinyxml2::XMLElement*, const std::string&, const std::string&, T);\
  template ErrorStack Externalizable::get_element< T >(\
    tinyxml2::XMLElement*, const std::string&, T*, bool, T)
EX_INSTANTIATE(int16_t);
EX_INSTANTIATE(uint16_t);
EX_INSTANTIATE(uint32_t);
EX_INSTANTIATE(int64_t);
#undef EX_INSTANTIATE
// @endcond

ErrorStack Externalizable::get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     Externalizable* child, bool optional) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element) {
    return child->load(element);
  } else if (optional) {
    return kRetOk;
  }
  return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
}

}  // namespace externalize
}  // namespace walarc
