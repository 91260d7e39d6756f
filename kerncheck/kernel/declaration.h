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

#ifndef KERNCHECK_KERNEL_DECLARATION_H_
#define KERNCHECK_KERNEL_DECLARATION_H_

#include <stdint.h>

#include <memory>
#include <utility>
#include <vector>

#include "kerncheck/kernel/expr.h"
#include "kerncheck/kernel/reduction.h"

namespace kerncheck {

// Committed declaration. Fields beyond the common header are only
// meaningful for the kinds noted next to them.
struct Declaration {
  enum DeclarationKind {
    AXIOM,
    DEFINITION,
    INDUCTIVE,
    CONSTRUCTOR,
    RECURSOR,
    QUOTIENT
  };

  DeclarationKind kind = AXIOM;
  NamePtr name = nullptr;
  std::vector<NamePtr> univ_params;
  ExprPtr type = nullptr;

  // DEFINITION
  ExprPtr value = nullptr;
  uint32_t height = 0;

  // INDUCTIVE, CONSTRUCTOR, RECURSOR
  uint64_t num_params = 0;
  // INDUCTIVE, RECURSOR
  uint64_t num_indices = 0;
  // CONSTRUCTOR, RECURSOR
  NamePtr inductive = nullptr;
  // INDUCTIVE
  std::vector<NamePtr> constructors;
  NamePtr recursor = nullptr;
  // CONSTRUCTOR
  uint64_t num_fields = 0;
  // RECURSOR
  uint64_t num_motives = 0;
  uint64_t num_minors = 0;
  bool k_like = false;
  std::vector<std::pair<NamePtr, ReductionRulePtr> > rules;

  bool is_definition() const { return kind == DEFINITION; }
};

std::unique_ptr<Declaration> mk_axiom_decl(
    NamePtr name, const std::vector<NamePtr>& univ_params, ExprPtr type);

std::unique_ptr<Declaration> mk_definition_decl(
    NamePtr name, const std::vector<NamePtr>& univ_params, ExprPtr type,
    ExprPtr value, uint32_t height);

// Exported declaration as read from the input, before any checking
struct ExportedDeclaration {
  enum ExportKind { AXIOM, DEFINITION, INDUCTIVE, QUOTIENT };

  ExportKind kind = AXIOM;
  NamePtr name = nullptr;
  std::vector<NamePtr> univ_params;
  ExprPtr type = nullptr;
  // DEFINITION
  ExprPtr value = nullptr;
  // INDUCTIVE
  uint64_t num_params = 0;
  std::vector<std::pair<NamePtr, ExprPtr> > constructors;
};

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_DECLARATION_H_
