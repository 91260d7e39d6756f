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

// Append-only store of certified declarations and their reduction rules.
//
// Lookups may run concurrently from any number of threads. Commits are
// serialized and all-or-nothing: a reader sees either none or all of the
// declarations of a group. Declarations are never removed, so the pointers
// handed out stay valid for the lifetime of the environment.

#ifndef KERNCHECK_KERNEL_ENVIRONMENT_H_
#define KERNCHECK_KERNEL_ENVIRONMENT_H_

#include <memory>
#include <unordered_map>
#include <vector>

#include "kerncheck/kernel/declaration.h"
#include "kerncheck/kernel/reduction.h"
#include "tensorflow/core/lib/core/status.h"
#include "tensorflow/core/platform/macros.h"
#include "tensorflow/core/platform/mutex.h"
#include "tensorflow/core/platform/thread_annotations.h"

namespace kerncheck {

// Declarations and rules that must become visible together
struct DeclarationGroup {
  std::vector<std::unique_ptr<Declaration> > declarations;
  std::vector<ReductionRulePtr> rules;
};

class Environment {
 public:
  Environment() = default;

  // nullptr if name is not committed
  const Declaration* Lookup(NamePtr name) const;

  // Rules whose head is the given constant, or nullptr if there are none
  const ReductionRuleSet* GetReductionRules(NamePtr head) const;

  // Definition height, 0 for anything that is not a committed definition
  uint32_t Height(NamePtr name) const;

  // Adds the group, or fails with DuplicateName or UnknownReference and
  // leaves the environment unchanged.
  tensorflow::Status Commit(DeclarationGroup group);

  size_t size() const;

 private:
  // Checks the references of decl against the committed declarations and
  // the other members of its group.
  tensorflow::Status CheckReferences(
      const Declaration& decl,
      const std::unordered_map<NamePtr, const Declaration*>& group) const
      SHARED_LOCKS_REQUIRED(mu_);

  mutable tensorflow::mutex mu_;
  std::unordered_map<NamePtr, std::unique_ptr<const Declaration> >
      declarations_ GUARDED_BY(mu_);
  std::unordered_map<NamePtr, std::unique_ptr<ReductionRuleSet> > rules_
      GUARDED_BY(mu_);

  TF_DISALLOW_COPY_AND_ASSIGN(Environment);
};

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_ENVIRONMENT_H_
