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

// Checks an inductive family and derives its recursor.
//
// For a family I with parameters ps, indices is and constructors cs, the
// derived recursor is
//
//   I.rec : Π ps {C : Π is (x : I ps is), Sort e} (m_c)* is (x : I ps is),
//           C is x
//
// with one computation rule per constructor
//
//   I.rec ps C ms is (c ps fs)  ~>  m_c fs (λ eps, I.rec ps C ms idx (f eps))*
//
// where the second group ranges over the recursive fields f of c. A family
// in Prop with a single constructor without fields gets the K-like rule
//
//   I.rec ps C m is x  ~>  m       provided is == the indices of c ps.

#ifndef KERNCHECK_KERNEL_INDUCTIVE_H_
#define KERNCHECK_KERNEL_INDUCTIVE_H_

#include <memory>
#include <utility>
#include <vector>

#include "kerncheck/kernel/declaration.h"
#include "kerncheck/kernel/environment.h"
#include "kerncheck/kernel/type_checker.h"
#include "tensorflow/core/lib/core/status.h"
#include "tensorflow/core/platform/macros.h"

namespace kerncheck {

class InductiveValidator {
 public:
  // decl must be an INDUCTIVE export. checker must be fresh and outlive
  // the validator.
  InductiveValidator(TypeChecker* checker, const ExportedDeclaration& decl);

  // Validates the family and fills group with the family, its constructors,
  // its recursor and the recursor's rules. The group is left empty on
  // failure.
  tensorflow::Status Run(DeclarationGroup* group);

  // Available after a successful Run
  bool elim_to_prop() const { return elim_to_prop_; }
  bool dependent_elim() const { return dep_elim_; }
  bool k_like() const { return k_like_; }

 private:
  struct RecursiveField {
    ExprPtr field;
    std::vector<ExprPtr> eps;
    std::vector<ExprPtr> indices;
  };

  struct ConstructorInfo {
    NamePtr name;
    ExprPtr type;
    std::vector<ExprPtr> fields;
    std::vector<bool> field_is_proof;
    std::vector<RecursiveField> recursive;
    // Arguments of the conclusion, parameters included
    std::vector<ExprPtr> conclusion_args;
    std::vector<ExprPtr> indices;
    ExprPtr app;
    ExprPtr minor;
  };

  tensorflow::Status CheckFamily();
  tensorflow::Status CheckConstructor(NamePtr name, ExprPtr type,
                                      ConstructorInfo* info);
  tensorflow::Status CheckField(ExprPtr field, ConstructorInfo* info);
  tensorflow::Status ChooseElimLevel();
  void BuildRecursor();
  void BuildRules();
  tensorflow::Status ValidateRules();

  ExprPtr MotiveApp(const std::vector<ExprPtr>& indices, ExprPtr major) const;
  ExprPtr RecursorApp(const std::vector<ExprPtr>& indices,
                      ExprPtr major) const;

  TypeChecker* checker_;
  const ExportedDeclaration& decl_;
  LocalContext* locals_;

  std::vector<LevelPtr> univ_levels_;
  ExprPtr family_const_ = nullptr;
  std::vector<ExprPtr> params_;
  std::vector<ExprPtr> indices_;
  LevelPtr result_level_ = nullptr;
  std::vector<ConstructorInfo> constructors_;

  bool elim_to_prop_ = false;
  bool dep_elim_ = false;
  bool k_like_ = false;
  LevelPtr elim_level_ = nullptr;
  std::vector<NamePtr> rec_univ_params_;
  ExprPtr rec_const_ = nullptr;
  ExprPtr motive_ = nullptr;
  ExprPtr major_ = nullptr;
  std::vector<ExprPtr> minors_;
  ExprPtr rec_type_ = nullptr;
  // Expected right-hand side per constructor, over the rule's locals
  std::vector<ExprPtr> expected_rhs_;
  std::vector<std::pair<NamePtr, ReductionRulePtr> > rules_;

  std::unique_ptr<Declaration> family_decl_;
  std::vector<std::unique_ptr<Declaration> > constructor_decls_;
  std::unique_ptr<Declaration> recursor_decl_;

  TF_DISALLOW_COPY_AND_ASSIGN(InductiveValidator);
};

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_INDUCTIVE_H_
