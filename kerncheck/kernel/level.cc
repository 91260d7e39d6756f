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

#include "kerncheck/kernel/level.h"

#include <algorithm>

#include "kerncheck/kernel/intern_table.h"
#include "kerncheck/kernel/stack_guard.h"
#include "tensorflow/core/lib/hash/hash.h"

namespace kerncheck {

static uint64_t level_hash(Level::LevelKind kind, LevelPtr lhs, LevelPtr rhs,
                           NamePtr param) {
  uint64_t h = tensorflow::Hash64Combine(0x4c65766c, kind);
  if (lhs != nullptr) h = tensorflow::Hash64Combine(h, lhs->hash());
  if (rhs != nullptr) h = tensorflow::Hash64Combine(h, rhs->hash());
  if (param != nullptr) h = tensorflow::Hash64Combine(h, param->hash());
  return h;
}

Level::Level(LevelKind kind, LevelPtr lhs, LevelPtr rhs, NamePtr param, Secret)
    : kind_(kind),
      lhs_(lhs),
      rhs_(rhs),
      param_(param),
      has_param_(kind == PARAM || (lhs != nullptr && lhs->has_param()) ||
                 (rhs != nullptr && rhs->has_param())),
      hash_(level_hash(kind, lhs, rhs, param)) {}

bool Level::operator==(const Level& rhs) const {
  return kind_ == rhs.kind_ && lhs_ == rhs.lhs_ && rhs_ == rhs.rhs_ &&
         param_ == rhs.param_;
}

static InternTable<Level>* level_table() {
  static InternTable<Level>* table = new InternTable<Level>;
  return table;
}

LevelPtr mk_zero() {
  static LevelPtr zero = level_table()->intern(
      Level(Level::ZERO, nullptr, nullptr, nullptr, Level::Secret()));
  return zero;
}

LevelPtr mk_succ(LevelPtr level) {
  return level_table()->intern(
      Level(Level::SUCC, level, nullptr, nullptr, Level::Secret()));
}

LevelPtr mk_max(LevelPtr lhs, LevelPtr rhs) {
  return level_table()->intern(
      Level(Level::MAX, lhs, rhs, nullptr, Level::Secret()));
}

LevelPtr mk_imax(LevelPtr lhs, LevelPtr rhs) {
  return level_table()->intern(
      Level(Level::IMAX, lhs, rhs, nullptr, Level::Secret()));
}

LevelPtr mk_param(NamePtr name) {
  return level_table()->intern(
      Level(Level::PARAM, nullptr, nullptr, name, Level::Secret()));
}

LevelPtr mk_level_num(int n) {
  LevelPtr level = mk_zero();
  for (int i = 0; i < n; ++i) level = mk_succ(level);
  return level;
}

// Max of two already simplified levels
static LevelPtr combining(LevelPtr lhs, LevelPtr rhs) {
  if (lhs->is_zero()) return rhs;
  if (rhs->is_zero()) return lhs;
  if (lhs == rhs) return lhs;
  if (lhs->is_succ() && rhs->is_succ()) {
    return mk_succ(combining(lhs->pred(), rhs->pred()));
  }
  return mk_max(lhs, rhs);
}

LevelPtr simplify(LevelPtr level) {
  if (StackGuard::near_limit()) {
    LevelPtr result = level;
    StackGuard::run_on_new_segment([&] { result = simplify(level); });
    return result;
  }
  switch (level->kind()) {
    case Level::ZERO:
    case Level::PARAM:
      return level;
    case Level::SUCC:
      return mk_succ(simplify(level->pred()));
    case Level::MAX:
      return combining(simplify(level->lhs()), simplify(level->rhs()));
    case Level::IMAX: {
      LevelPtr rhs = simplify(level->rhs());
      if (rhs->is_zero()) return rhs;
      LevelPtr lhs = simplify(level->lhs());
      if (rhs->is_succ()) return combining(lhs, rhs);
      if (lhs == rhs) return lhs;
      return mk_imax(lhs, rhs);
    }
  }
  return level;
}

static bool leq_core(LevelPtr lhs, LevelPtr rhs, int diff);

// Splits on whether param is Zero or a successor, which makes every IMax
// whose right operand is param reducible.
static bool ensure_imax_leq(LevelPtr param, LevelPtr lhs, LevelPtr rhs,
                            int diff) {
  const LevelSubstitution zero_subst = {{param->param(), mk_zero()}};
  const LevelSubstitution succ_subst = {{param->param(), mk_succ(param)}};
  for (const LevelSubstitution* subst : {&zero_subst, &succ_subst}) {
    LevelPtr new_lhs = simplify(instantiate_level(lhs, *subst));
    LevelPtr new_rhs = simplify(instantiate_level(rhs, *subst));
    if (!leq_core(new_lhs, new_rhs, diff)) return false;
  }
  return true;
}

// Replaces an IMax whose right operand is itself a Max or IMax by a Max of
// two IMaxes.
static LevelPtr distribute_imax(LevelPtr imax) {
  LevelPtr a = imax->lhs();
  LevelPtr b = imax->rhs();
  if (b->is_imax()) {
    return simplify(mk_max(mk_imax(a, b->rhs()), b));
  }
  return simplify(mk_max(mk_imax(a, b->lhs()), mk_imax(a, b->rhs())));
}

// Decides lhs + diff <= rhs
static bool leq_core_guarded(LevelPtr lhs, LevelPtr rhs, int diff) {
  if (lhs->is_zero() && diff >= 0) return true;
  if (rhs->is_zero() && diff < 0) return false;
  if (lhs->is_param() && rhs->is_param()) {
    return lhs == rhs && diff >= 0;
  }
  if (lhs->is_param() && rhs->is_zero()) return false;
  if (lhs->is_zero() && rhs->is_param()) return diff >= 0;
  if (lhs->is_succ()) return leq_core(lhs->pred(), rhs, diff - 1);
  if (rhs->is_succ()) return leq_core(lhs, rhs->pred(), diff + 1);
  if (lhs->is_max()) {
    return leq_core(lhs->lhs(), rhs, diff) && leq_core(lhs->rhs(), rhs, diff);
  }
  if ((lhs->is_param() || lhs->is_zero()) && rhs->is_max()) {
    return leq_core(lhs, rhs->lhs(), diff) || leq_core(lhs, rhs->rhs(), diff);
  }
  if (lhs->is_imax() && rhs->is_imax() && lhs == rhs) return diff >= 0;
  if (lhs->is_imax() && lhs->rhs()->is_param()) {
    return ensure_imax_leq(lhs->rhs(), lhs, rhs, diff);
  }
  if (rhs->is_imax() && rhs->rhs()->is_param()) {
    return ensure_imax_leq(rhs->rhs(), lhs, rhs, diff);
  }
  if (lhs->is_imax() && lhs->rhs()->is_any_max()) {
    return leq_core(distribute_imax(lhs), rhs, diff);
  }
  if (rhs->is_imax() && rhs->rhs()->is_any_max()) {
    return leq_core(lhs, distribute_imax(rhs), diff);
  }
  return false;
}

static bool leq_core(LevelPtr lhs, LevelPtr rhs, int diff) {
  if (StackGuard::near_limit()) {
    bool result = false;
    StackGuard::run_on_new_segment(
        [&] { result = leq_core_guarded(lhs, rhs, diff); });
    return result;
  }
  return leq_core_guarded(lhs, rhs, diff);
}

bool leq(LevelPtr lhs, LevelPtr rhs) {
  return leq_core(simplify(lhs), simplify(rhs), 0);
}

bool is_equivalent(LevelPtr lhs, LevelPtr rhs) {
  if (lhs == rhs) return true;
  LevelPtr a = simplify(lhs);
  LevelPtr b = simplify(rhs);
  return a == b || (leq_core(a, b, 0) && leq_core(b, a, 0));
}

bool is_zero(LevelPtr level) { return leq(level, mk_zero()); }

bool is_nonzero(LevelPtr level) { return leq(mk_succ(mk_zero()), level); }

bool maybe_zero(LevelPtr level) { return !is_nonzero(level); }

bool maybe_nonzero(LevelPtr level) { return !is_zero(level); }

LevelPtr instantiate_level(LevelPtr level, const LevelSubstitution& subst) {
  if (!level->has_param()) return level;
  switch (level->kind()) {
    case Level::ZERO:
      return level;
    case Level::SUCC:
      return mk_succ(instantiate_level(level->pred(), subst));
    case Level::MAX:
      return mk_max(instantiate_level(level->lhs(), subst),
                    instantiate_level(level->rhs(), subst));
    case Level::IMAX:
      return mk_imax(instantiate_level(level->lhs(), subst),
                     instantiate_level(level->rhs(), subst));
    case Level::PARAM:
      for (const auto& entry : subst) {
        if (entry.first == level->param()) return entry.second;
      }
      return level;
  }
  return level;
}

void collect_level_params(LevelPtr level,
                          std::unordered_set<NamePtr>* params) {
  if (!level->has_param()) return;
  if (level->is_param()) {
    params->insert(level->param());
    return;
  }
  collect_level_params(level->lhs(), params);
  if (level->rhs() != nullptr) collect_level_params(level->rhs(), params);
}

bool params_declared(LevelPtr level, const std::vector<NamePtr>& params) {
  std::unordered_set<NamePtr> used;
  collect_level_params(level, &used);
  for (NamePtr name : used) {
    if (std::find(params.begin(), params.end(), name) == params.end()) {
      return false;
    }
  }
  return true;
}

}  // namespace kerncheck
