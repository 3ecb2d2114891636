// Copyright 2017-2020 The Verible Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef PIECEMEAL_COMMON_UTIL_ENUM_FLAGS_H_
#define PIECEMEAL_COMMON_UTIL_ENUM_FLAGS_H_

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "piecemeal/common/util/logging.h"

namespace piecemeal {

namespace internal {
// Functor that extracts the first element of a pair and appends it to a string.
// Suitable for use with absl::StrJoin()'s formatter arguments.
struct FirstElementFormatter {
  template <class P>
  void operator()(std::string *out, const P &p) const {
    out->append(p.first.begin(), p.first.end());
  }
};
}  // namespace internal

// EnumNameMap provides a consistent way to parse and unparse enumerations with
// string/named representations, which makes enumerations usable as absl flags.
//
// Usage:
//
//   // .h
//   enum class IndentKind { ... };
//   std::ostream &operator<<(std::ostream &stream, IndentKind p);
//   bool AbslParseFlag(absl::string_view text, IndentKind *mode,
//                      std::string *error);
//   std::string AbslUnparseFlag(const IndentKind &mode);
//
//   // .cc
//   static const EnumNameMap<IndentKind> &IndentKindNames() {
//     static const EnumNameMap<IndentKind> kNames({
//         {"block", IndentKind::kBlock}, ...});
//     return kNames;
//   }
//
// The table is small, so lookups are linear in both directions.
template <typename EnumType>
class EnumNameMap {
  // String-literals are acceptable sources of string_views here: the mapped
  // names must outlive this object.
  using key_type = absl::string_view;
  using entry_type = std::pair<key_type, EnumType>;

 public:
  // Names and values must each be unique, or this is a fatal error.
  EnumNameMap(std::initializer_list<entry_type> pairs) : entries_(pairs) {
    for (auto iter = entries_.begin(); iter != entries_.end(); ++iter) {
      for (auto other = entries_.begin(); other != iter; ++other) {
        CHECK(other->first != iter->first) << "duplicate name: " << iter->first;
        CHECK(other->second != iter->second)
            << "duplicate value for name: " << iter->first;
      }
    }
  }
  ~EnumNameMap() = default;

  EnumNameMap(const EnumNameMap &) = delete;
  EnumNameMap(EnumNameMap &&) = delete;
  EnumNameMap &operator=(const EnumNameMap &) = delete;
  EnumNameMap &operator=(EnumNameMap &&) = delete;

  // Print a list of string representations of the enums.
  std::ostream &ListNames(std::ostream &stream, absl::string_view sep) const {
    return stream << absl::StrJoin(entries_, sep,
                                   internal::FirstElementFormatter());
  }

  // Converts the name of an enum to its corresponding value.
  // 'type_name' is a text name for the enum type used in diagnostics.
  // This variant writes diagnostics to the 'errstream' stream.
  // Returns true if successful.
  bool Parse(key_type text, EnumType *enum_value, std::ostream &errstream,
             absl::string_view type_name) const {
    for (const auto &entry : entries_) {
      if (entry.first == text) {
        *enum_value = entry.second;
        return true;
      }
    }
    errstream << "Invalid " << type_name << ": '" << text
              << "'\nValid options are: ";
    ListNames(errstream, ",");
    return false;
  }

  // Same as above, but appends diagnostics to the 'error' string.
  bool Parse(key_type text, EnumType *enum_value, std::string *error,
             absl::string_view type_name) const {
    std::ostringstream stream;
    const bool success = Parse(text, enum_value, stream, type_name);
    *error += stream.str();
    return success;
  }

  // Returns the string representation of an enum.
  absl::string_view EnumName(EnumType value) const {
    for (const auto &entry : entries_) {
      if (entry.second == value) return entry.first;
    }
    return "???";
  }

  // Prints the string representation of an enum to stream.
  std::ostream &Unparse(EnumType value, std::ostream &stream) const {
    return stream << EnumName(value);
  }

 protected:  // for testing
  const std::vector<entry_type> &entries() const { return entries_; }

 private:
  std::vector<entry_type> entries_;
};

}  // namespace piecemeal

#endif  // PIECEMEAL_COMMON_UTIL_ENUM_FLAGS_H_
