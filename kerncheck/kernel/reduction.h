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

#ifndef KERNCHECK_KERNEL_REDUCTION_H_
#define KERNCHECK_KERNEL_REDUCTION_H_

#include <memory>
#include <utility>
#include <vector>

#include "kerncheck/kernel/expr.h"

namespace kerncheck {

// Rewrite rule  c.{ps} p1 ... pn  ~>  rhs
//
// Each pattern pi is either a loose variable, which matches anything, or an
// application of a constant to patterns (a major premise, reduced to weak
// head normal form before matching). Pattern variables are numbered as by
// abstract(): with k variables the j-th bound local is Var(k - 1 - j).
// The rule only fires when every def_eq_constraints pair, instantiated with
// the match, is definitionally equal.
struct ReductionRule {
  NamePtr head;
  std::vector<NamePtr> univ_params;
  ExprPtr lhs;
  ExprPtr rhs;
  std::vector<std::pair<ExprPtr, ExprPtr> > def_eq_constraints;
  uint64_t num_vars;
  uint64_t num_args;
  // Argument positions that are not variables
  std::vector<uint64_t> majors;
};

typedef std::shared_ptr<const ReductionRule> ReductionRulePtr;

// Builds a rule from terms over locals. lhs must be a constant applied to
// arguments and every local must occur in lhs.
ReductionRulePtr mk_reduction_rule(
    const std::vector<ExprPtr>& locals, ExprPtr lhs, ExprPtr rhs,
    const std::vector<std::pair<ExprPtr, ExprPtr> >& def_eq_constraints);

// Rules sharing a head constant
struct ReductionRuleSet {
  std::vector<ReductionRulePtr> rules;
  // Union of the rules' major premise positions, ascending
  std::vector<uint64_t> majors;

  void Add(ReductionRulePtr rule);
};

// Matches the first rule.num_args arguments against the rule's patterns.
// On success fills *subst so that instantiate(x, *subst) maps pattern
// variables to the matched terms.
bool match_rule(const ReductionRule& rule, const std::vector<ExprPtr>& args,
                std::vector<ExprPtr>* subst);

// The rule's universe parameters mapped to the levels of the head constant
// being rewritten
LevelSubstitution rule_level_subst(const ReductionRule& rule,
                                   const std::vector<LevelPtr>& levels);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_REDUCTION_H_
