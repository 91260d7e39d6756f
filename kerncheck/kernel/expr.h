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

#ifndef KERNCHECK_KERNEL_EXPR_H_
#define KERNCHECK_KERNEL_EXPR_H_

#include <stdint.h>

#include <deque>
#include <functional>
#include <memory>
#include <unordered_set>
#include <vector>

#include "kerncheck/kernel/level.h"
#include "kerncheck/kernel/name.h"
#include "tensorflow/core/platform/macros.h"

namespace kerncheck {

class Expr;
class LocalContext;

// Non-local expressions are hash-consed: structurally equal expressions are
// the same pointer.
typedef const Expr* ExprPtr;

// Elaboration hint carried by binders. Never affects typing.
enum BinderInfo {
  BINDER_DEFAULT,
  BINDER_IMPLICIT,
  BINDER_STRICT_IMPLICIT,
  BINDER_INST_IMPLICIT
};

// This corresponds to the grammar:
//
// expr = Var of index                    (loose de Bruijn variable)
//      | Sort of level
//      | Const of name * level list
//      | App of expr * expr
//      | Lambda of binder * expr * expr   (domain, body)
//      | Pi of binder * expr * expr       (domain, body)
//      | Let of name * expr * expr * expr (type, value, body)
//      | Local of serial * name * expr    (free variable with its type)

class Expr final {
  // Private struct for construction purposes
  struct Secret {};

 public:
  enum ExprKind { VAR, SORT, CONST, APP, LAMBDA, PI, LET, LOCAL };

  ExprKind kind() const { return kind_; }
  bool is_var() const { return kind_ == VAR; }
  bool is_sort() const { return kind_ == SORT; }
  bool is_const() const { return kind_ == CONST; }
  bool is_app() const { return kind_ == APP; }
  bool is_lambda() const { return kind_ == LAMBDA; }
  bool is_pi() const { return kind_ == PI; }
  bool is_binding() const { return kind_ == LAMBDA || kind_ == PI; }
  bool is_let() const { return kind_ == LET; }
  bool is_local() const { return kind_ == LOCAL; }

  uint64_t var_index() const { return index_; }
  LevelPtr sort_level() const { return level_; }
  NamePtr const_name() const { return name_; }
  const std::vector<LevelPtr>& const_levels() const { return levels_; }
  ExprPtr app_fn() const { return a_; }
  ExprPtr app_arg() const { return b_; }
  // LAMBDA, PI and LOCAL
  NamePtr binder_name() const { return name_; }
  BinderInfo binder_info() const { return binfo_; }
  ExprPtr binder_domain() const { return a_; }
  ExprPtr binder_body() const { return b_; }
  // LET
  NamePtr let_name() const { return name_; }
  ExprPtr let_type() const { return a_; }
  ExprPtr let_value() const { return b_; }
  ExprPtr let_body() const { return c_; }
  // LOCAL
  uint64_t local_serial() const { return index_; }
  NamePtr local_name() const { return name_; }
  ExprPtr local_type() const { return a_; }

  uint64_t hash() const { return hash_; }
  // One more than the largest loose variable index, 0 if there is none
  uint64_t var_bound() const { return var_bound_; }
  bool has_loose_vars() const { return var_bound_ > 0; }
  bool has_locals() const { return has_locals_; }
  // Contains a universe parameter outside of locals
  bool has_params() const { return has_params_; }

  // Shallow structural equality (children by pointer) used for interning
  bool operator==(const Expr& rhs) const;

  friend ExprPtr mk_var(uint64_t index);
  friend ExprPtr mk_sort(LevelPtr level);
  friend ExprPtr mk_const(NamePtr name, const std::vector<LevelPtr>& levels);
  friend ExprPtr mk_app(ExprPtr fn, ExprPtr arg);
  friend ExprPtr mk_lambda(NamePtr name, ExprPtr domain, ExprPtr body,
                           BinderInfo binfo);
  friend ExprPtr mk_pi(NamePtr name, ExprPtr domain, ExprPtr body,
                       BinderInfo binfo);
  friend ExprPtr mk_let(NamePtr name, ExprPtr type, ExprPtr value,
                        ExprPtr body);
  friend class LocalContext;

  // Public but uncallable
  Expr(ExprKind kind, uint64_t index, LevelPtr level, NamePtr name,
       const std::vector<LevelPtr>& levels, ExprPtr a, ExprPtr b, ExprPtr c,
       BinderInfo binfo, Secret);

 private:
  const ExprKind kind_;
  // Var index or local serial
  const uint64_t index_;
  const LevelPtr level_;
  const NamePtr name_;
  const std::vector<LevelPtr> levels_;
  const ExprPtr a_;
  const ExprPtr b_;
  const ExprPtr c_;
  const BinderInfo binfo_;
  uint64_t hash_;
  uint64_t var_bound_;
  bool has_locals_;
  bool has_params_;
};

ExprPtr mk_var(uint64_t index);
ExprPtr mk_sort(LevelPtr level);
ExprPtr mk_const(NamePtr name, const std::vector<LevelPtr>& levels);
ExprPtr mk_app(ExprPtr fn, ExprPtr arg);
ExprPtr mk_lambda(NamePtr name, ExprPtr domain, ExprPtr body,
                  BinderInfo binfo = BINDER_DEFAULT);
ExprPtr mk_pi(NamePtr name, ExprPtr domain, ExprPtr body,
              BinderInfo binfo = BINDER_DEFAULT);
ExprPtr mk_let(NamePtr name, ExprPtr type, ExprPtr value, ExprPtr body);

// Sort 0
ExprPtr mk_prop();
// Non-dependent Pi with an anonymous binder
ExprPtr mk_arrow(ExprPtr domain, ExprPtr codomain);

// Owns the locals created during one checking episode. Serials start at 0
// and are never reused; locals die with the context.
class LocalContext {
 public:
  LocalContext() = default;

  ExprPtr mk_local(NamePtr name, ExprPtr type,
                   BinderInfo binfo = BINDER_DEFAULT);
  // Local named and typed after the binder of a LAMBDA or PI whose domain
  // has already been instantiated
  ExprPtr mk_local_for(ExprPtr binding, ExprPtr domain);

  uint64_t num_locals() const { return locals_.size(); }

 private:
  std::deque<std::unique_ptr<Expr> > locals_;

  TF_DISALLOW_COPY_AND_ASSIGN(LocalContext);
};

// Callback for replace: returns the replacement of e under offset binders,
// or nullptr to descend into e.
typedef std::function<ExprPtr(ExprPtr e, uint64_t offset)> ReplaceFn;

// Rebuilds e bottom-up with fn applied at every node reached. Results are
// cached per (node, offset) for the duration of the call.
ExprPtr replace(ExprPtr e, const ReplaceFn& fn);

// Visits every node reachable from e, children after parents. fn returns
// false to skip the children of a node.
void for_each(ExprPtr e, const std::function<bool(ExprPtr e)>& fn);

// Loose Var(offset + i) becomes subst[i] lifted by offset, larger loose
// variables are lowered by subst.size().
ExprPtr instantiate(ExprPtr e, const std::vector<ExprPtr>& subst);
ExprPtr instantiate1(ExprPtr e, ExprPtr value);
// As instantiate with subst reversed: Var i becomes subst[n - 1 - i]
ExprPtr instantiate_rev(ExprPtr e, const std::vector<ExprPtr>& subst);

// Replaces locals[j] by the variable bound by the (j + 1)-th enclosing binder
// counted outwards from the last local, so the last local is innermost.
ExprPtr abstract(ExprPtr e, const std::vector<ExprPtr>& locals);

// Adds amount to every loose variable index
ExprPtr lift_loose_vars(ExprPtr e, uint64_t amount);

ExprPtr instantiate_lparams(ExprPtr e, const LevelSubstitution& subst);
ExprPtr instantiate_lparams(ExprPtr e, const std::vector<NamePtr>& params,
                            const std::vector<LevelPtr>& levels);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_EXPR_H_
