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

#include "kerncheck/kernel/reduction.h"

#include <algorithm>

#include "kerncheck/kernel/general.h"
#include "tensorflow/core/platform/logging.h"

namespace kerncheck {

ReductionRulePtr mk_reduction_rule(
    const std::vector<ExprPtr>& locals, ExprPtr lhs, ExprPtr rhs,
    const std::vector<std::pair<ExprPtr, ExprPtr> >& def_eq_constraints) {
  std::shared_ptr<ReductionRule> rule(new ReductionRule);
  ExprPtr head;
  std::vector<ExprPtr> args;
  std::tie(head, args) = strip_app(lhs);
  CHECK(head->is_const()) << "Rule head is not a constant: " << lhs;
  rule->head = head->const_name();
  for (LevelPtr level : head->const_levels()) {
    CHECK(level->is_param()) << "Rule head levels must be parameters";
    rule->univ_params.push_back(level->param());
  }
  rule->lhs = abstract(lhs, locals);
  rule->rhs = abstract(rhs, locals);
  for (const auto& constraint : def_eq_constraints) {
    rule->def_eq_constraints.emplace_back(abstract(constraint.first, locals),
                                          abstract(constraint.second, locals));
  }
  rule->num_vars = locals.size();
  rule->num_args = args.size();
  for (uint64_t i = 0; i < args.size(); ++i) {
    if (!args[i]->is_local()) rule->majors.push_back(i);
  }
  return rule;
}

void ReductionRuleSet::Add(ReductionRulePtr rule) {
  for (uint64_t major : rule->majors) {
    if (std::find(majors.begin(), majors.end(), major) == majors.end()) {
      majors.push_back(major);
    }
  }
  std::sort(majors.begin(), majors.end());
  rules.push_back(std::move(rule));
}

// Later bindings of a variable overwrite earlier ones. Well-typed redexes
// bind repeated variables to definitionally equal terms.
static bool collect_substs(ExprPtr pattern, ExprPtr e,
                           std::vector<ExprPtr>* subst) {
  switch (pattern->kind()) {
    case Expr::VAR:
      (*subst)[pattern->var_index()] = e;
      return true;
    case Expr::CONST:
      return e->is_const() && e->const_name() == pattern->const_name() &&
             e->const_levels().size() == pattern->const_levels().size();
    case Expr::APP:
      return e->is_app() &&
             collect_substs(pattern->app_fn(), e->app_fn(), subst) &&
             collect_substs(pattern->app_arg(), e->app_arg(), subst);
    default:
      return false;
  }
}

bool match_rule(const ReductionRule& rule, const std::vector<ExprPtr>& args,
                std::vector<ExprPtr>* subst) {
  if (args.size() < rule.num_args) return false;
  subst->assign(rule.num_vars, nullptr);
  ExprPtr pattern = rule.lhs;
  for (uint64_t i = rule.num_args; i-- > 0;) {
    if (!collect_substs(pattern->app_arg(), args[i], subst)) return false;
    pattern = pattern->app_fn();
  }
  for (ExprPtr e : *subst) {
    if (e == nullptr) return false;
  }
  return true;
}

LevelSubstitution rule_level_subst(const ReductionRule& rule,
                                   const std::vector<LevelPtr>& levels) {
  LevelSubstitution subst;
  for (size_t i = 0; i < rule.univ_params.size() && i < levels.size(); ++i) {
    subst.emplace_back(rule.univ_params[i], levels[i]);
  }
  return subst;
}

}  // namespace kerncheck
