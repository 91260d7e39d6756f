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

#include "kerncheck/kernel/type_checker.h"

#include <algorithm>
#include <functional>
#include <tuple>

#include "kerncheck/kernel/general.h"
#include "kerncheck/kernel/printer.h"
#include "kerncheck/kernel/stack_guard.h"
#include "tensorflow/core/lib/core/errors.h"
#include "tensorflow/core/lib/hash/hash.h"
#include "tensorflow/core/platform/logging.h"

namespace kerncheck {

using tensorflow::Status;

static Status stack_exhausted() {
  return KernelError(kStackExhausted, "stack limit reached");
}

size_t TypeChecker::PairHash::operator()(
    const std::pair<ExprPtr, ExprPtr>& p) const {
  return tensorflow::Hash64Combine(p.first->hash(), p.second->hash());
}

TypeChecker::TypeChecker(const Environment* env)
    : env_(env), local_context_(new LocalContext) {}

void TypeChecker::AddPending(const Declaration* decl) {
  pending_[decl->name] = decl;
}

void TypeChecker::AddPendingRule(ReductionRulePtr rule) {
  pending_rules_[rule->head].Add(std::move(rule));
}

const Declaration* TypeChecker::LookupDeclaration(NamePtr name) const {
  auto it = pending_.find(name);
  if (it != pending_.end()) return it->second;
  return env_->Lookup(name);
}

const ReductionRuleSet* TypeChecker::GetReductionRules(NamePtr head) const {
  auto it = pending_rules_.find(head);
  if (it != pending_rules_.end()) return &it->second;
  return env_->GetReductionRules(head);
}

// Inference

Status TypeChecker::Infer(ExprPtr e, ExprPtr* type) {
  return InferCore(e, false, type);
}

Status TypeChecker::InferOnly(ExprPtr e, ExprPtr* type) {
  return InferCore(e, true, type);
}

Status TypeChecker::InferSortLevel(ExprPtr e, LevelPtr* level) {
  return InferSortLevelCore(e, false, level);
}

Status TypeChecker::CheckType(ExprPtr e, ExprPtr expected) {
  ExprPtr inferred;
  TF_RETURN_IF_ERROR(Infer(e, &inferred));
  return RequireDefEq(kTypeMismatch, expected, inferred,
                      tensorflow::strings::StrCat("type of ", to_string(e)));
}

Status TypeChecker::RequireDefEq(ErrorKind kind, ExprPtr expected,
                                 ExprPtr actual, const std::string& what) {
  if (IsDefEq(expected, actual)) return Status::OK();
  RecordMismatch(expected, actual);
  return KernelError(kind, what, ": expected ", to_string(expected), ", got ",
                     to_string(actual));
}

Status TypeChecker::InferCore(ExprPtr e, bool infer_only, ExprPtr* type) {
  if (StackGuard::near_limit()) {
    Status status = stack_exhausted();
    StackGuard::run_on_new_segment(
        [&] { status = InferCore(e, infer_only, type); });
    return status;
  }
  auto it = infer_cache_.find(e);
  if (it != infer_cache_.end()) {
    *type = it->second;
    return Status::OK();
  }
  if (infer_only) {
    it = infer_only_cache_.find(e);
    if (it != infer_only_cache_.end()) {
      *type = it->second;
      return Status::OK();
    }
  }
  TF_RETURN_IF_ERROR(InferUncached(e, infer_only, type));
  (infer_only ? infer_only_cache_ : infer_cache_)[e] = *type;
  return Status::OK();
}

Status TypeChecker::InferUncached(ExprPtr e, bool infer_only, ExprPtr* type) {
  switch (e->kind()) {
    case Expr::VAR:
      return tensorflow::errors::Internal("inferring the type of loose ",
                                          to_string(e));
    case Expr::SORT:
      TF_RETURN_IF_ERROR(CheckLevel(e->sort_level()));
      *type = mk_sort(mk_succ(e->sort_level()));
      return Status::OK();
    case Expr::CONST:
      return InferConst(e, type);
    case Expr::LOCAL:
      *type = e->local_type();
      return Status::OK();
    case Expr::APP:
      return InferApp(e, infer_only, type);
    case Expr::LAMBDA:
      return InferLambda(e, infer_only, type);
    case Expr::PI:
      return InferPi(e, infer_only, type);
    case Expr::LET:
      return InferLet(e, infer_only, type);
  }
  return tensorflow::errors::Internal("unknown expression kind");
}

Status TypeChecker::CheckLevel(LevelPtr level) {
  if (params_declared(level, univ_params_)) return Status::OK();
  return KernelError(kUnknownReference, "undeclared universe parameter in ",
                     to_string(level));
}

Status TypeChecker::InferConst(ExprPtr e, ExprPtr* type) {
  const Declaration* decl = LookupDeclaration(e->const_name());
  if (decl == nullptr) {
    return KernelError(kUnknownReference, "unknown constant ",
                       e->const_name()->to_string());
  }
  if (decl->univ_params.size() != e->const_levels().size()) {
    return KernelError(kUniverseArityError, e->const_name()->to_string(),
                       " expects ", decl->univ_params.size(),
                       " universe arguments, got ", e->const_levels().size());
  }
  for (LevelPtr level : e->const_levels()) {
    TF_RETURN_IF_ERROR(CheckLevel(level));
  }
  *type = instantiate_lparams(decl->type, decl->univ_params, e->const_levels());
  return Status::OK();
}

Status TypeChecker::InferApp(ExprPtr e, bool infer_only, ExprPtr* type) {
  ExprPtr fn;
  std::vector<ExprPtr> args;
  std::tie(fn, args) = strip_app(e);
  ExprPtr fn_type;
  TF_RETURN_IF_ERROR(InferCore(fn, infer_only, &fn_type));
  for (ExprPtr arg : args) {
    if (!fn_type->is_pi()) fn_type = Whnf(fn_type);
    if (!fn_type->is_pi()) {
      RecordMismatch(nullptr, fn_type);
      return KernelError(kNotAFunction, to_string(fn), " has type ",
                         to_string(fn_type), " and cannot be applied");
    }
    if (!infer_only) {
      ExprPtr arg_type;
      TF_RETURN_IF_ERROR(InferCore(arg, false, &arg_type));
      TF_RETURN_IF_ERROR(RequireDefEq(
          kTypeMismatch, fn_type->binder_domain(), arg_type,
          tensorflow::strings::StrCat("argument ", to_string(arg), " of ",
                                      to_string(fn))));
    }
    fn_type = instantiate1(fn_type->binder_body(), arg);
  }
  *type = fn_type;
  return Status::OK();
}

Status TypeChecker::InferLambda(ExprPtr e, bool infer_only, ExprPtr* type) {
  std::vector<ExprPtr> locals;
  while (e->is_lambda()) {
    ExprPtr domain = instantiate_rev(e->binder_domain(), locals);
    if (!infer_only) {
      LevelPtr level;
      TF_RETURN_IF_ERROR(InferSortLevelCore(domain, false, &level));
    }
    locals.push_back(local_context_->mk_local_for(e, domain));
    e = e->binder_body();
  }
  ExprPtr body_type;
  TF_RETURN_IF_ERROR(
      InferCore(instantiate_rev(e, locals), infer_only, &body_type));
  *type = fold_pis(locals, body_type);
  return Status::OK();
}

Status TypeChecker::InferPi(ExprPtr e, bool infer_only, ExprPtr* type) {
  std::vector<ExprPtr> locals;
  std::vector<LevelPtr> levels;
  while (e->is_pi()) {
    ExprPtr domain = instantiate_rev(e->binder_domain(), locals);
    LevelPtr level;
    TF_RETURN_IF_ERROR(InferSortLevelCore(domain, infer_only, &level));
    levels.push_back(level);
    locals.push_back(local_context_->mk_local_for(e, domain));
    e = e->binder_body();
  }
  LevelPtr result;
  TF_RETURN_IF_ERROR(
      InferSortLevelCore(instantiate_rev(e, locals), infer_only, &result));
  for (size_t i = levels.size(); i-- > 0;) {
    result = mk_imax(levels[i], result);
  }
  *type = mk_sort(simplify(result));
  return Status::OK();
}

Status TypeChecker::InferLet(ExprPtr e, bool infer_only, ExprPtr* type) {
  if (!infer_only) {
    LevelPtr level;
    TF_RETURN_IF_ERROR(InferSortLevelCore(e->let_type(), false, &level));
    TF_RETURN_IF_ERROR(CheckType(e->let_value(), e->let_type()));
  }
  return InferCore(instantiate1(e->let_body(), e->let_value()), infer_only,
                   type);
}

Status TypeChecker::InferSortLevelCore(ExprPtr e, bool infer_only,
                                       LevelPtr* level) {
  ExprPtr type;
  TF_RETURN_IF_ERROR(InferCore(e, infer_only, &type));
  if (!type->is_sort()) type = Whnf(type);
  if (!type->is_sort()) {
    RecordMismatch(nullptr, type);
    return KernelError(kTypeMismatch, to_string(e), " has type ",
                       to_string(type), ", which is not a sort");
  }
  *level = type->sort_level();
  return Status::OK();
}

// Reduction

ExprPtr TypeChecker::WhnfCore(ExprPtr e) {
  switch (e->kind()) {
    case Expr::VAR:
    case Expr::CONST:
    case Expr::LOCAL:
    case Expr::LAMBDA:
    case Expr::PI:
      return e;
    case Expr::SORT:
      return mk_sort(simplify(e->sort_level()));
    case Expr::APP:
    case Expr::LET:
      break;
  }
  if (StackGuard::near_limit()) {
    ExprPtr result = e;
    StackGuard::run_on_new_segment([&] { result = WhnfCore(e); });
    return result;
  }
  auto it = whnf_core_cache_.find(e);
  if (it != whnf_core_cache_.end()) return it->second;
  ExprPtr result = WhnfCoreUncached(e);
  whnf_core_cache_[e] = result;
  return result;
}

ExprPtr TypeChecker::WhnfCoreUncached(ExprPtr e) {
  if (e->is_let()) {
    return WhnfCore(instantiate1(e->let_body(), e->let_value()));
  }
  ExprPtr fn;
  std::vector<ExprPtr> args;
  std::tie(fn, args) = strip_app(e);
  ExprPtr fn_whnf = WhnfCore(fn);
  if (fn_whnf->is_lambda()) {
    size_t consumed = 0;
    ExprPtr body = fn_whnf;
    while (body->is_lambda() && consumed < args.size()) {
      body = body->binder_body();
      consumed++;
    }
    body = instantiate_rev(
        body, std::vector<ExprPtr>(args.begin(), args.begin() + consumed));
    return WhnfCore(fold_apps(
        body, std::vector<ExprPtr>(args.begin() + consumed, args.end())));
  }
  if (fn_whnf != fn) return WhnfCore(fold_apps(fn_whnf, args));
  ExprPtr reduced;
  if (fn->is_const() && ReduceWithRules(fn, args, &reduced)) {
    return WhnfCore(reduced);
  }
  return e;
}

bool TypeChecker::ReduceWithRules(ExprPtr fn, const std::vector<ExprPtr>& args,
                                  ExprPtr* result) {
  const ReductionRuleSet* rules = GetReductionRules(fn->const_name());
  if (rules == nullptr) return false;
  std::vector<ExprPtr> reduced_args = args;
  for (uint64_t major : rules->majors) {
    if (major < args.size()) reduced_args[major] = Whnf(args[major]);
  }
  std::vector<ExprPtr> subst;
  for (const ReductionRulePtr& rule : rules->rules) {
    if (rule->univ_params.size() != fn->const_levels().size()) continue;
    if (!match_rule(*rule, reduced_args, &subst)) continue;
    const InstantiatedRule& inst = InstantiateRule(*rule, fn->const_levels());
    bool constraints_hold = true;
    for (const auto& constraint : inst.def_eq_constraints) {
      if (!IsDefEq(instantiate(constraint.first, subst),
                   instantiate(constraint.second, subst))) {
        constraints_hold = false;
        break;
      }
    }
    if (!constraints_hold) continue;
    *result = fold_apps(
        instantiate(inst.rhs, subst),
        std::vector<ExprPtr>(args.begin() + rule->num_args, args.end()));
    return true;
  }
  return false;
}

const TypeChecker::InstantiatedRule& TypeChecker::InstantiateRule(
    const ReductionRule& rule, const std::vector<LevelPtr>& levels) {
  const auto key = std::make_pair(&rule, levels);
  auto it = rule_cache_.find(key);
  if (it != rule_cache_.end()) return it->second;
  const LevelSubstitution subst = rule_level_subst(rule, levels);
  InstantiatedRule inst;
  inst.rhs = instantiate_lparams(rule.rhs, subst);
  for (const auto& constraint : rule.def_eq_constraints) {
    inst.def_eq_constraints.emplace_back(
        instantiate_lparams(constraint.first, subst),
        instantiate_lparams(constraint.second, subst));
  }
  return rule_cache_.emplace(key, inst).first->second;
}

const Declaration* TypeChecker::UnfoldableHead(ExprPtr e) const {
  ExprPtr fn = get_app_fn(e);
  if (!fn->is_const()) return nullptr;
  const Declaration* decl = LookupDeclaration(fn->const_name());
  if (decl == nullptr || !decl->is_definition()) return nullptr;
  if (decl->univ_params.size() != fn->const_levels().size()) return nullptr;
  return decl;
}

ExprPtr TypeChecker::UnfoldDefinition(ExprPtr e) {
  const Declaration* decl = UnfoldableHead(e);
  if (decl == nullptr) return nullptr;
  ExprPtr fn;
  std::vector<ExprPtr> args;
  std::tie(fn, args) = strip_app(e);
  return fold_apps(
      instantiate_lparams(decl->value, decl->univ_params, fn->const_levels()),
      args);
}

ExprPtr TypeChecker::Whnf(ExprPtr e) {
  switch (e->kind()) {
    case Expr::VAR:
    case Expr::LOCAL:
    case Expr::LAMBDA:
    case Expr::PI:
      return e;
    default:
      break;
  }
  if (StackGuard::near_limit()) {
    ExprPtr result = e;
    StackGuard::run_on_new_segment([&] { result = Whnf(e); });
    return result;
  }
  auto it = whnf_cache_.find(e);
  if (it != whnf_cache_.end()) return it->second;
  ExprPtr result = WhnfUncached(e);
  whnf_cache_[e] = result;
  return result;
}

ExprPtr TypeChecker::WhnfUncached(ExprPtr e) {
  for (;;) {
    ExprPtr reduced = WhnfCore(e);
    ExprPtr unfolded = UnfoldDefinition(reduced);
    if (unfolded == nullptr) return reduced;
    e = unfolded;
  }
}

ExprPtr TypeChecker::NormalizePis(ExprPtr e, std::vector<ExprPtr>* locals) {
  e = Whnf(e);
  while (e->is_pi()) {
    ExprPtr local = local_context_->mk_local_for(e, e->binder_domain());
    locals->push_back(local);
    e = Whnf(instantiate1(e->binder_body(), local));
  }
  return e;
}

// Definitional equality

bool TypeChecker::IsDefEq(ExprPtr a, ExprPtr b) {
  def_eq_depth_++;
  const bool result = IsDefEqCore(a, b);
  if (--def_eq_depth_ == 0) eq_memo_.clear();
  return result;
}

bool TypeChecker::IsDefEqCore(ExprPtr a, ExprPtr b) {
  if (a == b) return true;
  if (StackGuard::near_limit()) {
    bool result = false;
    StackGuard::run_on_new_segment([&] { result = IsDefEqCore(a, b); });
    return result;
  }
  const auto key = std::less<ExprPtr>()(a, b) ? std::make_pair(a, b)
                                              : std::make_pair(b, a);
  if (eq_memo_.count(key) > 0) return true;
  const bool result = IsDefEqUncached(a, b);
  if (result) eq_memo_.insert(key);
  return result;
}

bool TypeChecker::IsProp(ExprPtr type) {
  ExprPtr sort;
  // Types reached here come from well-typed terms, a failure just means the
  // proof irrelevance shortcut does not apply.
  if (!InferOnly(type, &sort).ok()) return false;
  sort = Whnf(sort);
  return sort->is_sort() && is_zero(sort->sort_level());
}

int TypeChecker::IsDefEqProofIrrel(ExprPtr a, ExprPtr b) {
  ExprPtr a_type;
  if (!InferOnly(a, &a_type).ok() || !IsProp(a_type)) return 0;
  ExprPtr b_type;
  if (!InferOnly(b, &b_type).ok()) return 0;
  return IsDefEqCore(a_type, b_type) ? 1 : -1;
}

bool TypeChecker::IsDefEqLevels(const std::vector<LevelPtr>& a,
                                const std::vector<LevelPtr>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!is_equivalent(a[i], b[i])) return false;
  }
  return true;
}

bool TypeChecker::IsDefEqBinding(ExprPtr a, ExprPtr b) {
  const Expr::ExprKind kind = a->kind();
  std::vector<ExprPtr> locals;
  while (a->kind() == kind && b->kind() == kind) {
    ExprPtr domain = instantiate_rev(a->binder_domain(), locals);
    if (a->binder_domain() != b->binder_domain() &&
        !IsDefEqCore(domain, instantiate_rev(b->binder_domain(), locals))) {
      return false;
    }
    locals.push_back(local_context_->mk_local_for(a, domain));
    a = a->binder_body();
    b = b->binder_body();
  }
  return IsDefEqCore(instantiate_rev(a, locals), instantiate_rev(b, locals));
}

bool TypeChecker::IsDefEqApp(ExprPtr a, ExprPtr b) {
  if (!a->is_app() || !b->is_app()) return false;
  ExprPtr a_fn, b_fn;
  std::vector<ExprPtr> a_args, b_args;
  std::tie(a_fn, a_args) = strip_app(a);
  std::tie(b_fn, b_args) = strip_app(b);
  if (a_args.size() != b_args.size()) return false;
  if (a_fn->is_const() && b_fn->is_const()) {
    if (a_fn->const_name() != b_fn->const_name() ||
        !IsDefEqLevels(a_fn->const_levels(), b_fn->const_levels())) {
      return false;
    }
  } else if (!IsDefEqCore(a_fn, b_fn)) {
    return false;
  }
  for (size_t i = 0; i < a_args.size(); ++i) {
    if (!IsDefEqCore(a_args[i], b_args[i])) return false;
  }
  return true;
}

bool TypeChecker::TryEta(ExprPtr lambda, ExprPtr other) {
  ExprPtr other_type;
  if (!InferOnly(other, &other_type).ok()) return false;
  other_type = Whnf(other_type);
  if (!other_type->is_pi()) return false;
  ExprPtr expanded =
      mk_lambda(other_type->binder_name(), other_type->binder_domain(),
                mk_app(lift_loose_vars(other, 1), mk_var(0)),
                other_type->binder_info());
  return IsDefEqBinding(lambda, expanded);
}

bool TypeChecker::IsDefEqUncached(ExprPtr a, ExprPtr b) {
  const int proof_irrel = IsDefEqProofIrrel(a, b);
  if (proof_irrel != 0) return proof_irrel > 0;

  a = WhnfCore(a);
  b = WhnfCore(b);
  for (;;) {
    if (a == b) return true;
    if (a->is_sort() && b->is_sort()) {
      return is_equivalent(a->sort_level(), b->sort_level());
    }
    if (a->is_binding() && a->kind() == b->kind()) {
      return IsDefEqBinding(a, b);
    }

    // Lazy delta: unfold the side defined later first
    const Declaration* a_head = UnfoldableHead(a);
    const Declaration* b_head = UnfoldableHead(b);
    if (a_head == nullptr && b_head == nullptr) break;
    if (a_head != nullptr && a_head == b_head && IsDefEqApp(a, b)) {
      return true;
    }
    if (a_head != nullptr && b_head != nullptr &&
        a_head->height == b_head->height) {
      a = WhnfCore(UnfoldDefinition(a));
      b = WhnfCore(UnfoldDefinition(b));
    } else if (a_head != nullptr &&
               (b_head == nullptr || a_head->height > b_head->height)) {
      a = WhnfCore(UnfoldDefinition(a));
    } else {
      b = WhnfCore(UnfoldDefinition(b));
    }
  }

  if (a->is_const() && b->is_const()) {
    return a->const_name() == b->const_name() &&
           IsDefEqLevels(a->const_levels(), b->const_levels());
  }
  if (IsDefEqApp(a, b)) return true;
  if (a->is_lambda() && !b->is_lambda()) return TryEta(a, b);
  if (b->is_lambda() && !a->is_lambda()) return TryEta(b, a);
  return false;
}

}  // namespace kerncheck
