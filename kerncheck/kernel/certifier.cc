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

#include "kerncheck/kernel/certifier.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "kerncheck/kernel/general.h"
#include "kerncheck/kernel/inductive.h"
#include "kerncheck/kernel/printer.h"
#include "kerncheck/kernel/quotient.h"
#include "kerncheck/kernel/stack_guard.h"
#include "kerncheck/kernel/type_checker.h"
#include "tensorflow/core/lib/core/errors.h"
#include "tensorflow/core/platform/logging.h"

namespace kerncheck {

using tensorflow::Status;

namespace {

Status CheckClosed(NamePtr name, ExprPtr e, const char* what) {
  if (e->has_loose_vars()) {
    return KernelError(kUnknownReference, "loose bound variable in the ", what,
                       " of ", name->to_string());
  }
  if (e->has_locals()) {
    return tensorflow::errors::InvalidArgument("free local in the ", what,
                                               " of ", name->to_string());
  }
  return Status::OK();
}

Status CheckHeader(const ExportedDeclaration& decl) {
  std::unordered_set<NamePtr> seen;
  for (NamePtr param : decl.univ_params) {
    if (!seen.insert(param).second) {
      return KernelError(kDuplicateName, "universe parameter ",
                         param->to_string(), " of ", decl.name->to_string(),
                         " occurs twice");
    }
  }
  TF_RETURN_IF_ERROR(CheckClosed(decl.name, decl.type, "type"));
  for (const auto& constructor : decl.constructors) {
    TF_RETURN_IF_ERROR(
        CheckClosed(constructor.first, constructor.second, "type"));
  }
  return Status::OK();
}

// Turns the outcome of a stage into a rejection. Statuses that are not
// kernel rejections are passed through.
Status Conclude(const ExportedDeclaration& decl, const TypeChecker& checker,
                const Status& status, std::unique_ptr<Rejection>* rejection) {
  if (StackGuard::exhausted()) {
    StackGuard::clear_exhausted();
    rejection->reset(new Rejection{
        kStackExhausted, decl.name, nullptr, nullptr,
        KernelError(kStackExhausted, "stack ceiling reached while checking ",
                    decl.name->to_string())
            .error_message(),
        nullptr});
    return Status::OK();
  }
  if (status.ok()) return status;
  ErrorKind kind;
  if (!GetErrorKind(status, &kind)) return status;
  rejection->reset(new Rejection{kind, decl.name, checker.mismatch_lhs(),
                                 checker.mismatch_rhs(),
                                 status.error_message(),
                                 checker.shared_local_context()});
  return Status::OK();
}

}  // namespace

uint32_t DefinitionHeight(const Environment& env, ExprPtr value) {
  std::unordered_set<NamePtr> names;
  collect_const_names(value, &names);
  uint32_t height = 0;
  for (NamePtr name : names) height = std::max(height, env.Height(name));
  return height + 1;
}

Status Certifier::CertifySignature(const ExportedDeclaration& decl,
                                   std::unique_ptr<Rejection>* rejection) {
  rejection->reset();
  StackGuard::clear_exhausted();
  TypeChecker checker(env_);
  checker.set_univ_params(decl.univ_params);

  // Results computed after a refused segment are not trusted
  auto commit = [&](DeclarationGroup group) -> Status {
    if (StackGuard::exhausted()) {
      return KernelError(kStackExhausted, "not committing ",
                         decl.name->to_string());
    }
    return env_->Commit(std::move(group));
  };
  auto run = [&]() -> Status {
    TF_RETURN_IF_ERROR(CheckHeader(decl));
    switch (decl.kind) {
      case ExportedDeclaration::AXIOM: {
        LevelPtr level;
        TF_RETURN_IF_ERROR(checker.InferSortLevel(decl.type, &level));
        DeclarationGroup group;
        group.declarations.push_back(
            mk_axiom_decl(decl.name, decl.univ_params, decl.type));
        return commit(std::move(group));
      }
      case ExportedDeclaration::DEFINITION: {
        LevelPtr level;
        TF_RETURN_IF_ERROR(checker.InferSortLevel(decl.type, &level));
        TF_RETURN_IF_ERROR(CheckClosed(decl.name, decl.value, "value"));
        DeclarationGroup group;
        group.declarations.push_back(
            mk_definition_decl(decl.name, decl.univ_params, decl.type,
                               decl.value, DefinitionHeight(*env_, decl.value)));
        return commit(std::move(group));
      }
      case ExportedDeclaration::INDUCTIVE: {
        InductiveValidator validator(&checker, decl);
        DeclarationGroup group;
        TF_RETURN_IF_ERROR(validator.Run(&group));
        VLOG(2) << "Inductive " << decl.name << ": elim_to_prop "
                << validator.elim_to_prop() << ", dependent "
                << validator.dependent_elim() << ", k_like "
                << validator.k_like();
        return commit(std::move(group));
      }
      case ExportedDeclaration::QUOTIENT: {
        DeclarationGroup group;
        TF_RETURN_IF_ERROR(BuildQuotient(&checker, &group));
        return commit(std::move(group));
      }
    }
    return tensorflow::errors::Internal("unknown declaration kind ",
                                        static_cast<int>(decl.kind));
  };
  return Conclude(decl, checker, run(), rejection);
}

Status Certifier::CertifyBody(const ExportedDeclaration& decl,
                              std::unique_ptr<Rejection>* rejection) const {
  rejection->reset();
  if (decl.kind != ExportedDeclaration::DEFINITION) return Status::OK();
  StackGuard::clear_exhausted();
  VLOG(2) << "Checking body of " << decl.name;
  TypeChecker checker(env_);
  checker.set_univ_params(decl.univ_params);

  auto run = [&]() -> Status {
    ExprPtr inferred;
    TF_RETURN_IF_ERROR(checker.Infer(decl.value, &inferred));
    return checker.RequireDefEq(
        kTypeMismatch, decl.type, inferred,
        tensorflow::strings::StrCat("value of ", decl.name->to_string()));
  };
  return Conclude(decl, checker, run(), rejection);
}

Status Certifier::Certify(const ExportedDeclaration& decl,
                          std::unique_ptr<Rejection>* rejection) {
  TF_RETURN_IF_ERROR(CertifySignature(decl, rejection));
  if (*rejection != nullptr) return Status::OK();
  return CertifyBody(decl, rejection);
}

}  // namespace kerncheck
