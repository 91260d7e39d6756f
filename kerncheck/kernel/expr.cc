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

#include "kerncheck/kernel/expr.h"

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "kerncheck/kernel/intern_table.h"
#include "kerncheck/kernel/stack_guard.h"
#include "tensorflow/core/lib/hash/hash.h"
#include "tensorflow/core/platform/logging.h"

namespace kerncheck {

Expr::Expr(ExprKind kind, uint64_t index, LevelPtr level, NamePtr name,
           const std::vector<LevelPtr>& levels, ExprPtr a, ExprPtr b,
           ExprPtr c, BinderInfo binfo, Secret)
    : kind_(kind),
      index_(index),
      level_(level),
      name_(name),
      levels_(levels),
      a_(a),
      b_(b),
      c_(c),
      binfo_(binfo) {
  // Binder names and infos are hashed so that interning keeps them, even
  // though they are irrelevant to typing.
  uint64_t h = tensorflow::Hash64Combine(0x45787072, kind);
  var_bound_ = 0;
  has_locals_ = false;
  has_params_ = false;
  switch (kind) {
    case VAR:
      h = tensorflow::Hash64Combine(h, index);
      var_bound_ = index + 1;
      break;
    case SORT:
      h = tensorflow::Hash64Combine(h, level->hash());
      has_params_ = level->has_param();
      break;
    case CONST:
      h = tensorflow::Hash64Combine(h, name->hash());
      for (LevelPtr l : levels) {
        h = tensorflow::Hash64Combine(h, l->hash());
        has_params_ = has_params_ || l->has_param();
      }
      break;
    case APP:
      h = tensorflow::Hash64Combine(h, a->hash());
      h = tensorflow::Hash64Combine(h, b->hash());
      var_bound_ = std::max(a->var_bound(), b->var_bound());
      has_locals_ = a->has_locals() || b->has_locals();
      has_params_ = a->has_params() || b->has_params();
      break;
    case LAMBDA:
    case PI:
      h = tensorflow::Hash64Combine(h, name->hash());
      h = tensorflow::Hash64Combine(h, binfo);
      h = tensorflow::Hash64Combine(h, a->hash());
      h = tensorflow::Hash64Combine(h, b->hash());
      var_bound_ = std::max(a->var_bound(),
                            b->var_bound() > 0 ? b->var_bound() - 1 : 0);
      has_locals_ = a->has_locals() || b->has_locals();
      has_params_ = a->has_params() || b->has_params();
      break;
    case LET:
      h = tensorflow::Hash64Combine(h, name->hash());
      h = tensorflow::Hash64Combine(h, a->hash());
      h = tensorflow::Hash64Combine(h, b->hash());
      h = tensorflow::Hash64Combine(h, c->hash());
      var_bound_ = std::max(std::max(a->var_bound(), b->var_bound()),
                            c->var_bound() > 0 ? c->var_bound() - 1 : 0);
      has_locals_ = a->has_locals() || b->has_locals() || c->has_locals();
      has_params_ = a->has_params() || b->has_params() || c->has_params();
      break;
    case LOCAL:
      h = tensorflow::Hash64Combine(h, index);
      has_locals_ = true;
      break;
  }
  hash_ = h;
}

bool Expr::operator==(const Expr& rhs) const {
  return kind_ == rhs.kind_ && index_ == rhs.index_ && level_ == rhs.level_ &&
         name_ == rhs.name_ && a_ == rhs.a_ && b_ == rhs.b_ && c_ == rhs.c_ &&
         binfo_ == rhs.binfo_ && levels_ == rhs.levels_;
}

static InternTable<Expr>* expr_table() {
  static InternTable<Expr>* table = new InternTable<Expr>;
  return table;
}

static const std::vector<LevelPtr> kNoLevels;

ExprPtr mk_var(uint64_t index) {
  return expr_table()->intern(Expr(Expr::VAR, index, nullptr, nullptr,
                                   kNoLevels, nullptr, nullptr, nullptr,
                                   BINDER_DEFAULT, Expr::Secret()));
}

ExprPtr mk_sort(LevelPtr level) {
  return expr_table()->intern(Expr(Expr::SORT, 0, level, nullptr, kNoLevels,
                                   nullptr, nullptr, nullptr, BINDER_DEFAULT,
                                   Expr::Secret()));
}

ExprPtr mk_const(NamePtr name, const std::vector<LevelPtr>& levels) {
  return expr_table()->intern(Expr(Expr::CONST, 0, nullptr, name, levels,
                                   nullptr, nullptr, nullptr, BINDER_DEFAULT,
                                   Expr::Secret()));
}

ExprPtr mk_app(ExprPtr fn, ExprPtr arg) {
  return expr_table()->intern(Expr(Expr::APP, 0, nullptr, nullptr, kNoLevels,
                                   fn, arg, nullptr, BINDER_DEFAULT,
                                   Expr::Secret()));
}

ExprPtr mk_lambda(NamePtr name, ExprPtr domain, ExprPtr body,
                  BinderInfo binfo) {
  return expr_table()->intern(Expr(Expr::LAMBDA, 0, nullptr, name, kNoLevels,
                                   domain, body, nullptr, binfo,
                                   Expr::Secret()));
}

ExprPtr mk_pi(NamePtr name, ExprPtr domain, ExprPtr body, BinderInfo binfo) {
  return expr_table()->intern(Expr(Expr::PI, 0, nullptr, name, kNoLevels,
                                   domain, body, nullptr, binfo,
                                   Expr::Secret()));
}

ExprPtr mk_let(NamePtr name, ExprPtr type, ExprPtr value, ExprPtr body) {
  return expr_table()->intern(Expr(Expr::LET, 0, nullptr, name, kNoLevels,
                                   type, value, body, BINDER_DEFAULT,
                                   Expr::Secret()));
}

ExprPtr mk_prop() {
  static ExprPtr prop = mk_sort(mk_zero());
  return prop;
}

ExprPtr mk_arrow(ExprPtr domain, ExprPtr codomain) {
  return mk_pi(anonymous_name(), domain, lift_loose_vars(codomain, 1));
}

ExprPtr LocalContext::mk_local(NamePtr name, ExprPtr type, BinderInfo binfo) {
  CHECK(!type->has_loose_vars()) << "Local type with loose variables";
  locals_.emplace_back(new Expr(Expr::LOCAL, locals_.size(), nullptr, name,
                                kNoLevels, type, nullptr, nullptr, binfo,
                                Expr::Secret()));
  return locals_.back().get();
}

ExprPtr LocalContext::mk_local_for(ExprPtr binding, ExprPtr domain) {
  return mk_local(binding->binder_name(), domain, binding->binder_info());
}

namespace {

struct OffsetKeyHash {
  size_t operator()(const std::pair<ExprPtr, uint64_t>& key) const {
    return tensorflow::Hash64Combine(reinterpret_cast<uintptr_t>(key.first),
                                     key.second);
  }
};

class Replacer {
 public:
  explicit Replacer(const ReplaceFn& fn) : fn_(fn) {}

  ExprPtr Apply(ExprPtr e, uint64_t offset) {
    if (StackGuard::near_limit()) {
      ExprPtr result = e;
      StackGuard::run_on_new_segment([&] { result = ApplyCore(e, offset); });
      return result;
    }
    return ApplyCore(e, offset);
  }

 private:
  ExprPtr ApplyCore(ExprPtr e, uint64_t offset) {
    const auto key = std::make_pair(e, offset);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
    ExprPtr result = fn_(e, offset);
    if (result == nullptr) {
      switch (e->kind()) {
        case Expr::VAR:
        case Expr::SORT:
        case Expr::CONST:
        case Expr::LOCAL:
          result = e;
          break;
        case Expr::APP: {
          ExprPtr fn = Apply(e->app_fn(), offset);
          ExprPtr arg = Apply(e->app_arg(), offset);
          result = fn == e->app_fn() && arg == e->app_arg()
                       ? e
                       : mk_app(fn, arg);
          break;
        }
        case Expr::LAMBDA:
        case Expr::PI: {
          ExprPtr domain = Apply(e->binder_domain(), offset);
          ExprPtr body = Apply(e->binder_body(), offset + 1);
          if (domain == e->binder_domain() && body == e->binder_body()) {
            result = e;
          } else if (e->is_lambda()) {
            result = mk_lambda(e->binder_name(), domain, body,
                               e->binder_info());
          } else {
            result = mk_pi(e->binder_name(), domain, body, e->binder_info());
          }
          break;
        }
        case Expr::LET: {
          ExprPtr type = Apply(e->let_type(), offset);
          ExprPtr value = Apply(e->let_value(), offset);
          ExprPtr body = Apply(e->let_body(), offset + 1);
          result = type == e->let_type() && value == e->let_value() &&
                           body == e->let_body()
                       ? e
                       : mk_let(e->let_name(), type, value, body);
          break;
        }
      }
    }
    cache_[key] = result;
    return result;
  }

  const ReplaceFn& fn_;
  std::unordered_map<std::pair<ExprPtr, uint64_t>, ExprPtr, OffsetKeyHash>
      cache_;
};

class Visitor {
 public:
  explicit Visitor(const std::function<bool(ExprPtr)>& fn) : fn_(fn) {}

  void Visit(ExprPtr e) {
    if (StackGuard::near_limit()) {
      StackGuard::run_on_new_segment([&] { VisitCore(e); });
      return;
    }
    VisitCore(e);
  }

 private:
  void VisitCore(ExprPtr e) {
    if (!visited_.insert(e).second) return;
    if (!fn_(e)) return;
    switch (e->kind()) {
      case Expr::VAR:
      case Expr::SORT:
      case Expr::CONST:
      case Expr::LOCAL:
        return;
      case Expr::APP:
        Visit(e->app_fn());
        Visit(e->app_arg());
        return;
      case Expr::LAMBDA:
      case Expr::PI:
        Visit(e->binder_domain());
        Visit(e->binder_body());
        return;
      case Expr::LET:
        Visit(e->let_type());
        Visit(e->let_value());
        Visit(e->let_body());
        return;
    }
  }

  const std::function<bool(ExprPtr)>& fn_;
  std::unordered_set<ExprPtr> visited_;
};

}  // namespace

ExprPtr replace(ExprPtr e, const ReplaceFn& fn) {
  Replacer replacer(fn);
  return replacer.Apply(e, 0);
}

void for_each(ExprPtr e, const std::function<bool(ExprPtr e)>& fn) {
  Visitor visitor(fn);
  visitor.Visit(e);
}

ExprPtr lift_loose_vars(ExprPtr e, uint64_t amount) {
  if (amount == 0 || !e->has_loose_vars()) return e;
  return replace(e, [amount](ExprPtr x, uint64_t offset) -> ExprPtr {
    if (x->var_bound() <= offset) return x;
    if (x->is_var()) return mk_var(x->var_index() + amount);
    return nullptr;
  });
}

ExprPtr instantiate(ExprPtr e, const std::vector<ExprPtr>& subst) {
  if (subst.empty() || !e->has_loose_vars()) return e;
  const uint64_t n = subst.size();
  return replace(e, [&subst, n](ExprPtr x, uint64_t offset) -> ExprPtr {
    if (x->var_bound() <= offset) return x;
    if (x->is_var()) {
      const uint64_t index = x->var_index();
      if (index < offset + n) {
        return lift_loose_vars(subst[index - offset], offset);
      }
      return mk_var(index - n);
    }
    return nullptr;
  });
}

ExprPtr instantiate1(ExprPtr e, ExprPtr value) {
  return instantiate(e, std::vector<ExprPtr>{value});
}

ExprPtr instantiate_rev(ExprPtr e, const std::vector<ExprPtr>& subst) {
  return instantiate(e, std::vector<ExprPtr>(subst.rbegin(), subst.rend()));
}

ExprPtr abstract(ExprPtr e, const std::vector<ExprPtr>& locals) {
  if (locals.empty() || !e->has_locals()) return e;
  const uint64_t n = locals.size();
  std::unordered_map<ExprPtr, uint64_t> position;
  for (uint64_t j = 0; j < n; ++j) position[locals[j]] = j;
  return replace(e, [&position, n](ExprPtr x, uint64_t offset) -> ExprPtr {
    if (!x->has_locals()) return x;
    if (x->is_local()) {
      auto it = position.find(x);
      if (it == position.end()) return x;
      return mk_var(offset + n - 1 - it->second);
    }
    return nullptr;
  });
}

ExprPtr instantiate_lparams(ExprPtr e, const LevelSubstitution& subst) {
  if (subst.empty() || !e->has_params()) return e;
  return replace(e, [&subst](ExprPtr x, uint64_t) -> ExprPtr {
    if (!x->has_params()) return x;
    if (x->is_sort()) {
      return mk_sort(instantiate_level(x->sort_level(), subst));
    }
    if (x->is_const()) {
      std::vector<LevelPtr> levels;
      for (LevelPtr l : x->const_levels()) {
        levels.push_back(instantiate_level(l, subst));
      }
      return mk_const(x->const_name(), levels);
    }
    return nullptr;
  });
}

ExprPtr instantiate_lparams(ExprPtr e, const std::vector<NamePtr>& params,
                            const std::vector<LevelPtr>& levels) {
  CHECK_EQ(params.size(), levels.size());
  LevelSubstitution subst;
  for (size_t i = 0; i < params.size(); ++i) {
    subst.emplace_back(params[i], levels[i]);
  }
  return instantiate_lparams(e, subst);
}

}  // namespace kerncheck
