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

#include "kerncheck/kernel/quotient.h"

#include <memory>
#include <utility>
#include <vector>

#include "kerncheck/kernel/error.h"
#include "kerncheck/kernel/general.h"
#include "tensorflow/core/lib/strings/strcat.h"

namespace kerncheck {

using tensorflow::Status;

NamePtr quotient_eq_name() {
  static NamePtr name = mk_name("eq");
  return name;
}

static std::unique_ptr<Declaration> mk_quotient_decl(
    const char* name, const std::vector<NamePtr>& univ_params, ExprPtr type) {
  std::unique_ptr<Declaration> decl(new Declaration);
  decl->kind = Declaration::QUOTIENT;
  decl->name = mk_name(name);
  decl->univ_params = univ_params;
  decl->type = type;
  return decl;
}

Status BuildQuotient(TypeChecker* checker, DeclarationGroup* group) {
  LocalContext* locals = checker->local_context();
  NamePtr u_name = mk_name("u");
  NamePtr v_name = mk_name("v");
  LevelPtr u = mk_param(u_name);
  LevelPtr v = mk_param(v_name);

  ExprPtr alpha = locals->mk_local(mk_name("α"), mk_sort(u), BINDER_IMPLICIT);
  ExprPtr rel_type = mk_arrow(alpha, mk_arrow(alpha, mk_prop()));
  ExprPtr r = locals->mk_local(mk_name("r"), rel_type);
  ExprPtr r_implicit = locals->mk_local(mk_name("r"), rel_type, BINDER_IMPLICIT);
  ExprPtr a = locals->mk_local(mk_name("a"), alpha);
  ExprPtr b = locals->mk_local(mk_name("b"), alpha);

  ExprPtr quot = mk_const(mk_name("quot"), {u});
  ExprPtr quot_mk = mk_const(mk_name("quot.mk"), {u});
  ExprPtr quot_lift = mk_const(mk_name("quot.lift"), {u, v});
  ExprPtr quot_ind = mk_const(mk_name("quot.ind"), {u});
  ExprPtr quot_type = fold_apps(quot, {alpha, r_implicit});
  ExprPtr mk_a = fold_apps(quot_mk, {alpha, r_implicit, a});

  // quot.lift
  ExprPtr beta = locals->mk_local(mk_name("β"), mk_sort(v), BINDER_IMPLICIT);
  ExprPtr f = locals->mk_local(mk_name("f"), mk_arrow(alpha, beta));
  ExprPtr f_respects = fold_pis(
      {a, b},
      mk_arrow(fold_apps(r_implicit, {a, b}),
               fold_apps(mk_const(quotient_eq_name(), {v}),
                         {beta, mk_app(f, a), mk_app(f, b)})));
  ExprPtr h = locals->mk_local(mk_name("h"), f_respects);
  ExprPtr q = locals->mk_local(mk_name("q"), quot_type);

  // quot.ind
  ExprPtr motive = locals->mk_local(
      mk_name("β"), mk_arrow(quot_type, mk_prop()), BINDER_IMPLICIT);
  ExprPtr ind_h = locals->mk_local(mk_name("h"),
                                   fold_pis({a}, mk_app(motive, mk_a)));

  std::vector<std::unique_ptr<Declaration> > decls;
  decls.push_back(mk_quotient_decl(
      "quot", {u_name}, fold_pis({alpha, r}, mk_sort(u))));
  decls.push_back(mk_quotient_decl(
      "quot.mk", {u_name},
      fold_pis({alpha, r, a}, fold_apps(quot, {alpha, r}))));
  decls.push_back(mk_quotient_decl(
      "quot.lift", {u_name, v_name},
      fold_pis({alpha, r_implicit, beta, f, h, q}, beta)));
  decls.push_back(mk_quotient_decl(
      "quot.ind", {u_name},
      fold_pis({alpha, r_implicit, motive, ind_h, q}, mk_app(motive, q))));

  checker->set_univ_params({u_name, v_name});
  for (const auto& decl : decls) {
    LevelPtr level;
    TF_RETURN_IF_ERROR(checker->InferSortLevel(decl->type, &level));
    checker->AddPending(decl.get());
  }

  struct RuleSpec {
    std::vector<ExprPtr> locals;
    ExprPtr lhs;
    ExprPtr rhs;
  };
  const RuleSpec specs[] = {
      {{alpha, r_implicit, beta, f, h, a},
       fold_apps(quot_lift, {alpha, r_implicit, beta, f, h, mk_a}),
       mk_app(f, a)},
      {{alpha, r_implicit, motive, ind_h, a},
       fold_apps(quot_ind, {alpha, r_implicit, motive, ind_h, mk_a}),
       mk_app(ind_h, a)},
  };
  for (const RuleSpec& spec : specs) {
    ExprPtr lhs_type, rhs_type;
    TF_RETURN_IF_ERROR(checker->Infer(spec.lhs, &lhs_type));
    TF_RETURN_IF_ERROR(checker->Infer(spec.rhs, &rhs_type));
    TF_RETURN_IF_ERROR(checker->RequireDefEq(
        kBadComputationRule, lhs_type, rhs_type,
        tensorflow::strings::StrCat("rule for ",
                                    get_app_fn(spec.lhs)->const_name()
                                        ->to_string())));
    group->rules.push_back(mk_reduction_rule(spec.locals, spec.lhs, spec.rhs,
                                             {}));
  }
  for (auto& decl : decls) group->declarations.push_back(std::move(decl));
  return Status::OK();
}

}  // namespace kerncheck
