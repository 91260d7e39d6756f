/* Copyright 2016 Google Inc. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#ifndef KERNCHECK_KERNEL_NAME_H_
#define KERNCHECK_KERNEL_NAME_H_

#include <stdint.h>

#include <string>
#include <unordered_set>

namespace kerncheck {

class Name;

// Names are interned, so two names with the same components are the same
// pointer and can be compared and hashed as pointers.
typedef const Name* NamePtr;

// Hierarchical identifier such as `nat.rec` or `_private.1234.foo`.
class Name final {
  // Private struct for construction purposes
  struct Secret {};

 public:
  enum NameKind { ANONYMOUS, STRING, NUMERAL };

  bool is_anonymous() const { return kind_ == ANONYMOUS; }
  bool is_string() const { return kind_ == STRING; }
  bool is_numeral() const { return kind_ == NUMERAL; }
  NamePtr prefix() const { return prefix_; }
  const std::string& str() const { return str_; }
  uint64_t num() const { return num_; }
  uint64_t hash() const { return hash_; }

  // Dotted rendering, e.g. "quot.mk" or "a.1.b". The anonymous name is "[anonymous]".
  std::string to_string() const;

  // Shallow equality used by the intern table
  bool operator==(const Name& rhs) const;

  friend NamePtr anonymous_name();
  friend NamePtr name_extend(NamePtr prefix, const std::string& component);
  friend NamePtr name_extend(NamePtr prefix, uint64_t component);

  // Public but uncallable
  Name(NameKind kind, NamePtr prefix, const std::string& str, uint64_t num,
       Secret);

 private:
  const NameKind kind_;
  const NamePtr prefix_;
  const std::string str_;
  const uint64_t num_;
  const uint64_t hash_;
};

NamePtr anonymous_name();
NamePtr name_extend(NamePtr prefix, const std::string& component);
NamePtr name_extend(NamePtr prefix, uint64_t component);

// Splits on '.' and extends the anonymous name with each string component.
NamePtr mk_name(const std::string& dotted);

// Returns base if it is not in avoid, otherwise base.1, base.2, ...
NamePtr fresh_name(NamePtr base, const std::unordered_set<NamePtr>& avoid);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_NAME_H_
