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

#include "kerncheck/kernel/inductive.h"

#include <algorithm>
#include <tuple>
#include <unordered_set>

#include "kerncheck/kernel/error.h"
#include "kerncheck/kernel/general.h"
#include "kerncheck/kernel/printer.h"
#include "tensorflow/core/lib/strings/strcat.h"
#include "tensorflow/core/platform/logging.h"

namespace kerncheck {

using tensorflow::Status;
using tensorflow::strings::StrCat;

InductiveValidator::InductiveValidator(TypeChecker* checker,
                                       const ExportedDeclaration& decl)
    : checker_(checker), decl_(decl), locals_(checker->local_context()) {
  CHECK_EQ(decl.kind, ExportedDeclaration::INDUCTIVE);
  for (NamePtr param : decl.univ_params) {
    univ_levels_.push_back(mk_param(param));
  }
  family_const_ = mk_const(decl.name, univ_levels_);
}

Status InductiveValidator::Run(DeclarationGroup* group) {
  TF_RETURN_IF_ERROR(CheckFamily());
  for (const auto& constructor : decl_.constructors) {
    constructors_.emplace_back();
    TF_RETURN_IF_ERROR(CheckConstructor(constructor.first, constructor.second,
                                        &constructors_.back()));
  }
  TF_RETURN_IF_ERROR(ChooseElimLevel());
  BuildRecursor();
  BuildRules();
  TF_RETURN_IF_ERROR(ValidateRules());

  group->declarations.push_back(std::move(family_decl_));
  for (auto& decl : constructor_decls_) {
    group->declarations.push_back(std::move(decl));
  }
  group->declarations.push_back(std::move(recursor_decl_));
  for (const auto& rule : rules_) group->rules.push_back(rule.second);
  return Status::OK();
}

// The family type must be a telescope ending in a Sort with at least
// num_params binders.
Status InductiveValidator::CheckFamily() {
  LevelPtr level;
  TF_RETURN_IF_ERROR(checker_->InferSortLevel(decl_.type, &level));
  std::vector<ExprPtr> binders;
  ExprPtr codomain = checker_->NormalizePis(decl_.type, &binders);
  if (!codomain->is_sort()) {
    checker_->RecordMismatch(nullptr, codomain);
    return KernelError(kMalformedConstructor, "type of ",
                       decl_.name->to_string(), " does not end in a sort");
  }
  if (binders.size() < decl_.num_params) {
    return KernelError(kMalformedConstructor, decl_.name->to_string(), " has ",
                       binders.size(), " binders but ", decl_.num_params,
                       " parameters");
  }
  result_level_ = codomain->sort_level();
  params_.assign(binders.begin(), binders.begin() + decl_.num_params);
  indices_.assign(binders.begin() + decl_.num_params, binders.end());

  family_decl_.reset(new Declaration);
  family_decl_->kind = Declaration::INDUCTIVE;
  family_decl_->name = decl_.name;
  family_decl_->univ_params = decl_.univ_params;
  family_decl_->type = decl_.type;
  family_decl_->num_params = decl_.num_params;
  family_decl_->num_indices = indices_.size();
  for (const auto& constructor : decl_.constructors) {
    family_decl_->constructors.push_back(constructor.first);
  }
  family_decl_->recursor = name_extend(decl_.name, "rec");
  checker_->AddPending(family_decl_.get());
  return Status::OK();
}

Status InductiveValidator::CheckConstructor(NamePtr name, ExprPtr type,
                                            ConstructorInfo* info) {
  info->name = name;
  info->type = type;
  LevelPtr level;
  TF_RETURN_IF_ERROR(checker_->InferSortLevel(type, &level));

  ExprPtr t = type;
  for (uint64_t i = 0; i < decl_.num_params; ++i) {
    t = checker_->Whnf(t);
    if (!t->is_pi()) {
      return KernelError(kMalformedConstructor, name->to_string(),
                         " takes fewer than ", decl_.num_params,
                         " parameters");
    }
    TF_RETURN_IF_ERROR(checker_->RequireDefEq(
        kMalformedConstructor, params_[i]->local_type(), t->binder_domain(),
        StrCat("parameter ", i, " of ", name->to_string())));
    t = instantiate1(t->binder_body(), params_[i]);
  }

  t = checker_->Whnf(t);
  while (t->is_pi()) {
    ExprPtr field = locals_->mk_local_for(t, t->binder_domain());
    TF_RETURN_IF_ERROR(CheckField(field, info));
    info->fields.push_back(field);
    t = checker_->Whnf(instantiate1(t->binder_body(), field));
  }

  ExprPtr fn;
  std::tie(fn, info->conclusion_args) = strip_app(t);
  if (fn != family_const_ ||
      info->conclusion_args.size() != params_.size() + indices_.size()) {
    checker_->RecordMismatch(
        fold_apps(fold_apps(family_const_, params_), indices_), t);
    return KernelError(kMalformedConstructor, name->to_string(),
                       " does not construct ", to_string(family_const_),
                       " applied to its parameters and indices");
  }
  for (size_t i = 0; i < params_.size(); ++i) {
    TF_RETURN_IF_ERROR(checker_->RequireDefEq(
        kMalformedConstructor, params_[i], info->conclusion_args[i],
        StrCat("parameter ", i, " in the conclusion of ", name->to_string())));
  }
  info->indices.assign(info->conclusion_args.begin() + params_.size(),
                       info->conclusion_args.end());
  info->app = fold_apps(fold_apps(mk_const(name, univ_levels_), params_),
                        info->fields);

  std::unique_ptr<Declaration> decl(new Declaration);
  decl->kind = Declaration::CONSTRUCTOR;
  decl->name = name;
  decl->univ_params = decl_.univ_params;
  decl->type = type;
  decl->inductive = decl_.name;
  decl->num_params = decl_.num_params;
  decl->num_fields = info->fields.size();
  checker_->AddPending(decl.get());
  constructor_decls_.push_back(std::move(decl));
  return Status::OK();
}

Status InductiveValidator::CheckField(ExprPtr field, ConstructorInfo* info) {
  ExprPtr field_type = field->local_type();
  LevelPtr level;
  TF_RETURN_IF_ERROR(checker_->InferSortLevel(field_type, &level));
  if (maybe_nonzero(result_level_) && !leq(level, result_level_)) {
    return KernelError(kMalformedConstructor, "field ",
                       field->local_name()->to_string(), " of ",
                       info->name->to_string(), " lives in universe ",
                       to_string(level), ", above ", to_string(result_level_));
  }
  info->field_is_proof.push_back(is_zero(level));

  RecursiveField recursive;
  ExprPtr head = checker_->NormalizePis(field_type, &recursive.eps);
  ExprPtr fn;
  std::vector<ExprPtr> args;
  std::tie(fn, args) = strip_app(head);
  if (!fn->is_const() || fn->const_name() != decl_.name) return Status::OK();
  if (fn != family_const_ || args.size() != params_.size() + indices_.size()) {
    checker_->RecordMismatch(family_const_, head);
    return KernelError(kMalformedConstructor, "recursive field ",
                       field->local_name()->to_string(), " of ",
                       info->name->to_string(), " has type ",
                       to_string(head));
  }
  for (size_t i = 0; i < params_.size(); ++i) {
    TF_RETURN_IF_ERROR(checker_->RequireDefEq(
        kMalformedConstructor, params_[i], args[i],
        StrCat("parameter ", i, " of recursive field ",
               field->local_name()->to_string())));
  }
  recursive.field = field;
  recursive.indices.assign(args.begin() + params_.size(), args.end());
  info->recursive.push_back(recursive);
  return Status::OK();
}

// A family that may live in Prop only eliminates into Prop unless it has a
// single constructor whose data fields all appear in its conclusion.
Status InductiveValidator::ChooseElimLevel() {
  elim_to_prop_ = false;
  if (maybe_zero(result_level_)) {
    if (constructors_.size() > 1) {
      elim_to_prop_ = true;
    } else if (constructors_.size() == 1) {
      const ConstructorInfo& info = constructors_[0];
      for (size_t i = 0; i < info.fields.size(); ++i) {
        if (info.field_is_proof[i]) continue;
        if (std::find(info.conclusion_args.begin(), info.conclusion_args.end(),
                      info.fields[i]) == info.conclusion_args.end()) {
          elim_to_prop_ = true;
          break;
        }
      }
    }
  }
  dep_elim_ = maybe_nonzero(result_level_);
  k_like_ = constructors_.size() == 1 && constructors_[0].fields.empty() &&
            is_zero(result_level_);

  rec_univ_params_.clear();
  if (elim_to_prop_) {
    elim_level_ = mk_zero();
  } else {
    std::unordered_set<NamePtr> taken(decl_.univ_params.begin(),
                                      decl_.univ_params.end());
    NamePtr fresh = fresh_name(mk_name("l"), taken);
    elim_level_ = mk_param(fresh);
    rec_univ_params_.push_back(fresh);
  }
  rec_univ_params_.insert(rec_univ_params_.end(), decl_.univ_params.begin(),
                          decl_.univ_params.end());
  std::vector<LevelPtr> rec_levels;
  for (NamePtr param : rec_univ_params_) rec_levels.push_back(mk_param(param));
  rec_const_ = mk_const(family_decl_->recursor, rec_levels);
  return Status::OK();
}

ExprPtr InductiveValidator::MotiveApp(const std::vector<ExprPtr>& indices,
                                      ExprPtr major) const {
  ExprPtr app = fold_apps(motive_, indices);
  return dep_elim_ ? mk_app(app, major) : app;
}

ExprPtr InductiveValidator::RecursorApp(const std::vector<ExprPtr>& indices,
                                        ExprPtr major) const {
  ExprPtr app = fold_apps(rec_const_, params_);
  app = mk_app(app, motive_);
  app = fold_apps(app, minors_);
  app = fold_apps(app, indices);
  return mk_app(app, major);
}

void InductiveValidator::BuildRecursor() {
  major_ = locals_->mk_local(
      mk_name("t"), fold_apps(fold_apps(family_const_, params_), indices_));
  std::vector<ExprPtr> motive_binders = indices_;
  if (dep_elim_) motive_binders.push_back(major_);
  motive_ = locals_->mk_local(mk_name("C"),
                              fold_pis(motive_binders, mk_sort(elim_level_)),
                              BINDER_IMPLICIT);

  for (size_t i = 0; i < constructors_.size(); ++i) {
    ConstructorInfo& info = constructors_[i];
    std::vector<ExprPtr> binders = info.fields;
    for (const RecursiveField& recursive : info.recursive) {
      ExprPtr ih_type =
          fold_pis(recursive.eps,
                   MotiveApp(recursive.indices,
                             fold_apps(recursive.field, recursive.eps)));
      binders.push_back(locals_->mk_local(
          name_extend(recursive.field->local_name(), "ih"), ih_type));
    }
    ExprPtr minor_type =
        fold_pis(binders, MotiveApp(info.indices, info.app));
    info.minor =
        locals_->mk_local(name_extend(mk_name("m"), i + 1), minor_type);
    minors_.push_back(info.minor);
  }

  std::vector<ExprPtr> binders = params_;
  binders.push_back(motive_);
  binders.insert(binders.end(), minors_.begin(), minors_.end());
  binders.insert(binders.end(), indices_.begin(), indices_.end());
  binders.push_back(major_);
  rec_type_ = fold_pis(binders, MotiveApp(indices_, major_));

  recursor_decl_.reset(new Declaration);
  recursor_decl_->kind = Declaration::RECURSOR;
  recursor_decl_->name = family_decl_->recursor;
  recursor_decl_->univ_params = rec_univ_params_;
  recursor_decl_->type = rec_type_;
  recursor_decl_->inductive = decl_.name;
  recursor_decl_->num_params = params_.size();
  recursor_decl_->num_indices = indices_.size();
  recursor_decl_->num_motives = 1;
  recursor_decl_->num_minors = minors_.size();
  recursor_decl_->k_like = k_like_;
}

void InductiveValidator::BuildRules() {
  std::vector<ExprPtr> shared = params_;
  shared.push_back(motive_);
  shared.insert(shared.end(), minors_.begin(), minors_.end());
  shared.insert(shared.end(), indices_.begin(), indices_.end());

  if (k_like_) {
    const ConstructorInfo& info = constructors_[0];
    std::vector<std::pair<ExprPtr, ExprPtr> > constraints;
    for (size_t i = 0; i < indices_.size(); ++i) {
      if (info.indices[i] != indices_[i]) {
        constraints.emplace_back(info.indices[i], indices_[i]);
      }
    }
    std::vector<ExprPtr> locals = shared;
    locals.push_back(major_);
    rules_.emplace_back(
        info.name, mk_reduction_rule(locals, RecursorApp(indices_, major_),
                                     info.minor, constraints));
    expected_rhs_.push_back(info.minor);
    recursor_decl_->rules = rules_;
    return;
  }

  for (const ConstructorInfo& info : constructors_) {
    std::vector<ExprPtr> rhs_args = info.fields;
    for (const RecursiveField& recursive : info.recursive) {
      rhs_args.push_back(fold_lambdas(
          recursive.eps,
          RecursorApp(recursive.indices,
                      fold_apps(recursive.field, recursive.eps))));
    }
    ExprPtr rhs = fold_apps(info.minor, rhs_args);
    std::vector<ExprPtr> locals = shared;
    locals.insert(locals.end(), info.fields.begin(), info.fields.end());
    rules_.emplace_back(
        info.name,
        mk_reduction_rule(locals, RecursorApp(indices_, info.app), rhs, {}));
    expected_rhs_.push_back(rhs);
  }
  recursor_decl_->rules = rules_;
}

// Every rule must fire on its own constructor and preserve the type given by
// the motive.
Status InductiveValidator::ValidateRules() {
  checker_->set_univ_params(rec_univ_params_);
  LevelPtr level;
  TF_RETURN_IF_ERROR(checker_->InferSortLevel(rec_type_, &level));
  checker_->AddPending(recursor_decl_.get());
  for (const auto& rule : rules_) checker_->AddPendingRule(rule.second);

  for (size_t i = 0; i < constructors_.size(); ++i) {
    const ConstructorInfo& info = constructors_[i];
    ExprPtr lhs = RecursorApp(info.indices, info.app);
    ExprPtr rhs = expected_rhs_[k_like_ ? 0 : i];
    ExprPtr reduced = checker_->WhnfCore(lhs);
    if (reduced != rhs) {
      checker_->RecordMismatch(rhs, reduced);
      return KernelError(kBadComputationRule, "rule for ",
                         info.name->to_string(), " does not reduce ",
                         to_string(lhs));
    }
    const ExprPtr expected_type = MotiveApp(info.indices, info.app);
    for (ExprPtr side : {lhs, rhs}) {
      ExprPtr type;
      Status status = checker_->Infer(side, &type);
      if (!status.ok()) {
        checker_->RecordMismatch(expected_type, nullptr);
        return KernelError(kBadComputationRule, "rule for ",
                           info.name->to_string(), " is ill-typed: ",
                           status.error_message());
      }
      TF_RETURN_IF_ERROR(checker_->RequireDefEq(
          kBadComputationRule, expected_type, type,
          StrCat("rule for ", info.name->to_string())));
    }
  }
  VLOG(2) << "Derived " << rec_const_ << " : " << rec_type_;
  return Status::OK();
}

}  // namespace kerncheck
