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

#include "kerncheck/kernel/name.h"

#include <vector>

#include "kerncheck/kernel/intern_table.h"
#include "tensorflow/core/lib/hash/hash.h"
#include "tensorflow/core/lib/strings/str_util.h"

namespace kerncheck {

static const uint64_t kAnonymousHash = 1723;

static uint64_t name_hash(Name::NameKind kind, NamePtr prefix,
                          const std::string& str, uint64_t num) {
  if (kind == Name::ANONYMOUS) return kAnonymousHash;
  const uint64_t component =
      kind == Name::STRING ? tensorflow::Hash64(str.data(), str.size(), 11)
                           : tensorflow::Hash64Combine(num, 13);
  return tensorflow::Hash64Combine(prefix->hash(), component);
}

Name::Name(NameKind kind, NamePtr prefix, const std::string& str, uint64_t num,
           Secret)
    : kind_(kind),
      prefix_(prefix),
      str_(str),
      num_(num),
      hash_(name_hash(kind, prefix, str, num)) {}

bool Name::operator==(const Name& rhs) const {
  return kind_ == rhs.kind_ && prefix_ == rhs.prefix_ && num_ == rhs.num_ &&
         str_ == rhs.str_;
}

std::string Name::to_string() const {
  if (is_anonymous()) return "[anonymous]";
  std::vector<NamePtr> components;
  for (NamePtr n = this; !n->is_anonymous(); n = n->prefix()) {
    components.push_back(n);
  }
  std::string out;
  for (auto it = components.rbegin(); it != components.rend(); ++it) {
    if (!out.empty()) out += '.';
    if ((*it)->is_string()) {
      out += (*it)->str();
    } else {
      out += std::to_string((*it)->num());
    }
  }
  return out;
}

static InternTable<Name>* name_table() {
  static InternTable<Name>* table = new InternTable<Name>;
  return table;
}

NamePtr anonymous_name() {
  static NamePtr anonymous =
      new Name(Name::ANONYMOUS, nullptr, "", 0, Name::Secret());
  return anonymous;
}

NamePtr name_extend(NamePtr prefix, const std::string& component) {
  return name_table()->intern(
      Name(Name::STRING, prefix, component, 0, Name::Secret()));
}

NamePtr name_extend(NamePtr prefix, uint64_t component) {
  return name_table()->intern(
      Name(Name::NUMERAL, prefix, "", component, Name::Secret()));
}

NamePtr mk_name(const std::string& dotted) {
  NamePtr name = anonymous_name();
  for (const std::string& part : tensorflow::str_util::Split(dotted, '.')) {
    name = name_extend(name, part);
  }
  return name;
}

NamePtr fresh_name(NamePtr base, const std::unordered_set<NamePtr>& avoid) {
  NamePtr candidate = base;
  for (uint64_t i = 1; avoid.count(candidate) > 0; ++i) {
    candidate = name_extend(base, i);
  }
  return candidate;
}

}  // namespace kerncheck
