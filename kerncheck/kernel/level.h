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

#ifndef KERNCHECK_KERNEL_LEVEL_H_
#define KERNCHECK_KERNEL_LEVEL_H_

#include <stdint.h>

#include <unordered_set>
#include <utility>
#include <vector>

#include "kerncheck/kernel/name.h"

namespace kerncheck {

class Level;

typedef const Level* LevelPtr;

// Simultaneous substitution of universe parameters
typedef std::vector<std::pair<NamePtr, LevelPtr> > LevelSubstitution;

// This corresponds to the grammar:
//
// level = Zero
//       | Succ of level
//       | Max of level * level
//       | IMax of level * level
//       | Param of name
//
// IMax(a, b) is Zero whenever b is Zero and Max(a, b) otherwise; it is the
// universe of a Pi whose domain lives in a and codomain in b.

class Level final {
  // Private struct for construction purposes
  struct Secret {};

 public:
  enum LevelKind { ZERO, SUCC, MAX, IMAX, PARAM };

  LevelKind kind() const { return kind_; }
  bool is_zero() const { return kind_ == ZERO; }
  bool is_succ() const { return kind_ == SUCC; }
  bool is_max() const { return kind_ == MAX; }
  bool is_imax() const { return kind_ == IMAX; }
  bool is_param() const { return kind_ == PARAM; }
  bool is_any_max() const { return kind_ == MAX || kind_ == IMAX; }

  // Argument of SUCC
  LevelPtr pred() const { return lhs_; }
  // Operands of MAX and IMAX
  LevelPtr lhs() const { return lhs_; }
  LevelPtr rhs() const { return rhs_; }
  NamePtr param() const { return param_; }

  bool has_param() const { return has_param_; }
  uint64_t hash() const { return hash_; }

  bool operator==(const Level& rhs) const;

  friend LevelPtr mk_zero();
  friend LevelPtr mk_succ(LevelPtr level);
  friend LevelPtr mk_max(LevelPtr lhs, LevelPtr rhs);
  friend LevelPtr mk_imax(LevelPtr lhs, LevelPtr rhs);
  friend LevelPtr mk_param(NamePtr name);

  // Public but uncallable
  Level(LevelKind kind, LevelPtr lhs, LevelPtr rhs, NamePtr param, Secret);

 private:
  const LevelKind kind_;
  const LevelPtr lhs_;
  const LevelPtr rhs_;
  const NamePtr param_;
  const bool has_param_;
  const uint64_t hash_;
};

LevelPtr mk_zero();
LevelPtr mk_succ(LevelPtr level);
LevelPtr mk_max(LevelPtr lhs, LevelPtr rhs);
LevelPtr mk_imax(LevelPtr lhs, LevelPtr rhs);
LevelPtr mk_param(NamePtr name);

// Succ applied n times to zero
LevelPtr mk_level_num(int n);

// Normal form used before every comparison: IMax with a Zero or Succ right
// operand is eliminated, Zero is absorbed by Max, Max of two successors
// becomes the successor of the Max and duplicate operands collapse.
LevelPtr simplify(LevelPtr level);

// Decides lhs <= rhs for every assignment of the parameters. Incomplete in
// the conservative direction: false may mean "could not show".
bool leq(LevelPtr lhs, LevelPtr rhs);

// leq in both directions
bool is_equivalent(LevelPtr lhs, LevelPtr rhs);

// Provably Zero / provably at least one under every assignment
bool is_zero(LevelPtr level);
bool is_nonzero(LevelPtr level);

// Some assignment makes the level Zero / some assignment makes it nonzero
bool maybe_zero(LevelPtr level);
bool maybe_nonzero(LevelPtr level);

// Replaces parameters by their image in subst. The result is not simplified.
LevelPtr instantiate_level(LevelPtr level, const LevelSubstitution& subst);

void collect_level_params(LevelPtr level, std::unordered_set<NamePtr>* params);

// True if every parameter in level is one of params
bool params_declared(LevelPtr level, const std::vector<NamePtr>& params);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_LEVEL_H_
