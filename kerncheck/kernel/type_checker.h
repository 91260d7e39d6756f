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

// Type inference, weak head normalization and definitional equality.
//
// A TypeChecker serves one checking episode: it owns the locals it creates
// and caches every result, so it must not outlive the declaration it checks
// and must not be shared between threads. The environment it reads from may
// grow concurrently.

#ifndef KERNCHECK_KERNEL_TYPE_CHECKER_H_
#define KERNCHECK_KERNEL_TYPE_CHECKER_H_

#include <map>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "kerncheck/kernel/declaration.h"
#include "kerncheck/kernel/environment.h"
#include "kerncheck/kernel/error.h"
#include "kerncheck/kernel/expr.h"
#include "tensorflow/core/lib/core/status.h"
#include "tensorflow/core/platform/macros.h"

namespace kerncheck {

class TypeChecker {
 public:
  explicit TypeChecker(const Environment* env);

  // Universe parameters that Sort and Const levels may mention
  void set_univ_params(const std::vector<NamePtr>& univ_params) {
    univ_params_ = univ_params;
  }
  const std::vector<NamePtr>& univ_params() const { return univ_params_; }

  // Makes decl and rule visible to this checker only, ahead of commit.
  // decl must outlive the checker.
  void AddPending(const Declaration* decl);
  void AddPendingRule(ReductionRulePtr rule);

  // Declaration by name, pending ones first
  const Declaration* LookupDeclaration(NamePtr name) const;

  // Type of a closed term that may contain locals of this checker, checking
  // every typing rule on the way.
  tensorflow::Status Infer(ExprPtr e, ExprPtr* type);
  // As Infer, for terms already known to be well typed: arguments are not
  // checked against domains and binder domains are not checked to be types.
  tensorflow::Status InferOnly(ExprPtr e, ExprPtr* type);

  // Infers the type of e and reduces it to a Sort. TypeMismatch if it is not
  // one.
  tensorflow::Status InferSortLevel(ExprPtr e, LevelPtr* level);

  // Infers the type of e and requires it to be defeq to expected.
  tensorflow::Status CheckType(ExprPtr e, ExprPtr expected);

  // Fails with kind and records (expected, actual) unless they are defeq
  tensorflow::Status RequireDefEq(ErrorKind kind, ExprPtr expected,
                                  ExprPtr actual, const std::string& what);

  // Beta, zeta, iota and quotient reduction of the head, Sort levels
  // simplified. Never unfolds definitions.
  ExprPtr WhnfCore(ExprPtr e);
  // WhnfCore interleaved with unfolding of head definitions
  ExprPtr Whnf(ExprPtr e);

  bool IsDefEq(ExprPtr a, ExprPtr b);

  // Whnf, then opens Pis with fresh locals appended to locals, repeating
  // until the result is no longer a Pi after Whnf.
  ExprPtr NormalizePis(ExprPtr e, std::vector<ExprPtr>* locals);

  LocalContext* local_context() { return local_context_.get(); }
  // Keeps the locals of this checker alive past its destruction
  std::shared_ptr<const LocalContext> shared_local_context() const {
    return local_context_;
  }

  // Terms of the most recent failed requirement, nullptr if none
  ExprPtr mismatch_lhs() const { return mismatch_lhs_; }
  ExprPtr mismatch_rhs() const { return mismatch_rhs_; }
  void RecordMismatch(ExprPtr lhs, ExprPtr rhs) {
    mismatch_lhs_ = lhs;
    mismatch_rhs_ = rhs;
  }

 private:
  struct InstantiatedRule {
    ExprPtr rhs;
    std::vector<std::pair<ExprPtr, ExprPtr> > def_eq_constraints;
  };

  const ReductionRuleSet* GetReductionRules(NamePtr head) const;

  tensorflow::Status InferCore(ExprPtr e, bool infer_only, ExprPtr* type);
  tensorflow::Status InferUncached(ExprPtr e, bool infer_only, ExprPtr* type);
  tensorflow::Status InferConst(ExprPtr e, ExprPtr* type);
  tensorflow::Status InferApp(ExprPtr e, bool infer_only, ExprPtr* type);
  tensorflow::Status InferLambda(ExprPtr e, bool infer_only, ExprPtr* type);
  tensorflow::Status InferPi(ExprPtr e, bool infer_only, ExprPtr* type);
  tensorflow::Status InferLet(ExprPtr e, bool infer_only, ExprPtr* type);
  tensorflow::Status InferSortLevelCore(ExprPtr e, bool infer_only,
                                        LevelPtr* level);
  tensorflow::Status CheckLevel(LevelPtr level);

  ExprPtr WhnfCoreUncached(ExprPtr e);
  ExprPtr WhnfUncached(ExprPtr e);
  // Rewrites fn args with the first matching rule
  bool ReduceWithRules(ExprPtr fn, const std::vector<ExprPtr>& args,
                       ExprPtr* result);
  const InstantiatedRule& InstantiateRule(const ReductionRule& rule,
                                          const std::vector<LevelPtr>& levels);
  // Definition at the head of e that can be unfolded, or nullptr
  const Declaration* UnfoldableHead(ExprPtr e) const;
  ExprPtr UnfoldDefinition(ExprPtr e);

  bool IsDefEqCore(ExprPtr a, ExprPtr b);
  bool IsDefEqUncached(ExprPtr a, ExprPtr b);
  // 1 if a and b are proofs of defeq propositions, -1 if they are proofs of
  // propositions that are not, 0 if they are not both proofs
  int IsDefEqProofIrrel(ExprPtr a, ExprPtr b);
  bool IsProp(ExprPtr type);
  bool IsDefEqBinding(ExprPtr a, ExprPtr b);
  bool IsDefEqApp(ExprPtr a, ExprPtr b);
  bool IsDefEqLevels(const std::vector<LevelPtr>& a,
                     const std::vector<LevelPtr>& b);
  // Compares a lambda with a term that is not one by eta expanding the latter
  bool TryEta(ExprPtr lambda, ExprPtr other);

  const Environment* env_;
  std::vector<NamePtr> univ_params_;
  std::unordered_map<NamePtr, const Declaration*> pending_;
  std::unordered_map<NamePtr, ReductionRuleSet> pending_rules_;
  std::shared_ptr<LocalContext> local_context_;

  std::unordered_map<ExprPtr, ExprPtr> infer_cache_;
  std::unordered_map<ExprPtr, ExprPtr> infer_only_cache_;
  std::unordered_map<ExprPtr, ExprPtr> whnf_core_cache_;
  std::unordered_map<ExprPtr, ExprPtr> whnf_cache_;
  std::map<std::pair<const ReductionRule*, std::vector<LevelPtr> >,
           InstantiatedRule>
      rule_cache_;

  struct PairHash {
    size_t operator()(const std::pair<ExprPtr, ExprPtr>& p) const;
  };
  // Pairs proven equal during the outermost IsDefEq call in progress
  std::unordered_set<std::pair<ExprPtr, ExprPtr>, PairHash> eq_memo_;
  int def_eq_depth_ = 0;

  ExprPtr mismatch_lhs_ = nullptr;
  ExprPtr mismatch_rhs_ = nullptr;

  TF_DISALLOW_COPY_AND_ASSIGN(TypeChecker);
};

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_TYPE_CHECKER_H_
