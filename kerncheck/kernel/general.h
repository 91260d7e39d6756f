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

#ifndef KERNCHECK_KERNEL_GENERAL_H_
#define KERNCHECK_KERNEL_GENERAL_H_

#include <tuple>
#include <unordered_set>
#include <vector>

#include "kerncheck/kernel/expr.h"

namespace kerncheck {

// f a1 ... an  ->  (f, [a1, ..., an])
std::tuple<ExprPtr, std::vector<ExprPtr> > strip_app(ExprPtr e);

ExprPtr get_app_fn(ExprPtr e);

ExprPtr fold_apps(ExprPtr fn, const std::vector<ExprPtr>& args);

// Closes body over the given locals, last local innermost
ExprPtr fold_pis(const std::vector<ExprPtr>& locals, ExprPtr body);
ExprPtr fold_lambdas(const std::vector<ExprPtr>& locals, ExprPtr body);

void collect_const_names(ExprPtr e, std::unordered_set<NamePtr>* names);
void collect_level_params(ExprPtr e, std::unordered_set<NamePtr>* params);

// Const nodes reachable from e, each once
std::vector<ExprPtr> collect_consts(ExprPtr e);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_GENERAL_H_
