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

#include "kerncheck/kernel/environment.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "kerncheck/kernel/error.h"
#include "kerncheck/kernel/general.h"
#include "kerncheck/kernel/printer.h"
#include "tensorflow/core/lib/core/errors.h"
#include "tensorflow/core/platform/logging.h"

namespace kerncheck {

std::unique_ptr<Declaration> mk_axiom_decl(
    NamePtr name, const std::vector<NamePtr>& univ_params, ExprPtr type) {
  std::unique_ptr<Declaration> decl(new Declaration);
  decl->kind = Declaration::AXIOM;
  decl->name = name;
  decl->univ_params = univ_params;
  decl->type = type;
  return decl;
}

std::unique_ptr<Declaration> mk_definition_decl(
    NamePtr name, const std::vector<NamePtr>& univ_params, ExprPtr type,
    ExprPtr value, uint32_t height) {
  std::unique_ptr<Declaration> decl(new Declaration);
  decl->kind = Declaration::DEFINITION;
  decl->name = name;
  decl->univ_params = univ_params;
  decl->type = type;
  decl->value = value;
  decl->height = height;
  return decl;
}

const Declaration* Environment::Lookup(NamePtr name) const {
  tensorflow::tf_shared_lock lock(mu_);
  auto it = declarations_.find(name);
  return it == declarations_.end() ? nullptr : it->second.get();
}

const ReductionRuleSet* Environment::GetReductionRules(NamePtr head) const {
  tensorflow::tf_shared_lock lock(mu_);
  auto it = rules_.find(head);
  return it == rules_.end() ? nullptr : it->second.get();
}

uint32_t Environment::Height(NamePtr name) const {
  const Declaration* decl = Lookup(name);
  return decl == nullptr ? 0 : decl->height;
}

size_t Environment::size() const {
  tensorflow::tf_shared_lock lock(mu_);
  return declarations_.size();
}

tensorflow::Status Environment::CheckReferences(
    const Declaration& decl,
    const std::unordered_map<NamePtr, const Declaration*>& group) const {
  tensorflow::Status status;
  // Values may only refer to committed declarations
  auto check = [&](ExprPtr e, bool group_visible) {
    if (e == nullptr) return;
    if (e->has_loose_vars()) {
      status = KernelError(kUnknownReference, "loose bound variable in ",
                           decl.name->to_string());
      return;
    }
    if (e->has_locals()) {
      status = tensorflow::errors::Internal("free local in ",
                                            decl.name->to_string());
      return;
    }
    std::unordered_set<NamePtr> params;
    collect_level_params(e, &params);
    for (NamePtr param : params) {
      if (std::find(decl.univ_params.begin(), decl.univ_params.end(), param) ==
          decl.univ_params.end()) {
        status = KernelError(kUnknownReference, "undeclared universe ",
                             param->to_string(), " in ",
                             decl.name->to_string());
        return;
      }
    }
    for (ExprPtr c : collect_consts(e)) {
      const Declaration* target = nullptr;
      auto it = group.find(c->const_name());
      if (group_visible && it != group.end()) {
        target = it->second;
      } else {
        auto committed = declarations_.find(c->const_name());
        if (committed != declarations_.end()) target = committed->second.get();
      }
      if (target == nullptr) {
        status = KernelError(kUnknownReference, "unknown constant ",
                             c->const_name()->to_string(), " in ",
                             decl.name->to_string());
        return;
      }
      if (target->univ_params.size() != c->const_levels().size()) {
        status = KernelError(kUnknownReference, "constant ",
                             c->const_name()->to_string(), " expects ",
                             target->univ_params.size(),
                             " universe arguments in ",
                             decl.name->to_string());
        return;
      }
    }
  };
  check(decl.type, true);
  if (status.ok()) check(decl.value, false);
  return status;
}

tensorflow::Status Environment::Commit(DeclarationGroup group) {
  std::unordered_map<NamePtr, const Declaration*> members;
  for (const auto& decl : group.declarations) {
    if (!members.emplace(decl->name, decl.get()).second) {
      return KernelError(kDuplicateName, decl->name->to_string(),
                         " occurs twice in one group");
    }
  }
  {
    tensorflow::tf_shared_lock lock(mu_);
    for (const auto& decl : group.declarations) {
      if (declarations_.count(decl->name) > 0) {
        return KernelError(kDuplicateName, decl->name->to_string(),
                           " is already declared");
      }
      TF_RETURN_IF_ERROR(CheckReferences(*decl, members));
    }
  }

  tensorflow::mutex_lock lock(mu_);
  // A concurrent commit may have taken one of the names meanwhile
  for (const auto& decl : group.declarations) {
    if (declarations_.count(decl->name) > 0) {
      return KernelError(kDuplicateName, decl->name->to_string(),
                         " is already declared");
    }
  }
  for (auto& decl : group.declarations) {
    VLOG(1) << "Committed " << decl->name;
    NamePtr name = decl->name;
    declarations_[name].reset(decl.release());
  }
  for (auto& rule : group.rules) {
    std::unique_ptr<ReductionRuleSet>& rules = rules_[rule->head];
    if (rules == nullptr) rules.reset(new ReductionRuleSet);
    rules->Add(std::move(rule));
  }
  return tensorflow::Status::OK();
}

}  // namespace kerncheck
