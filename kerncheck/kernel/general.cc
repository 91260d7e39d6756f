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

#include <algorithm>

#include "kerncheck/kernel/general.h"

namespace kerncheck {

std::tuple<ExprPtr, std::vector<ExprPtr> > strip_app(ExprPtr e) {
  std::vector<ExprPtr> ret;
  while (e->is_app()) {
    ret.push_back(e->app_arg());
    e = e->app_fn();
  }
  std::reverse(ret.begin(), ret.end());
  return std::make_tuple(e, ret);
}

ExprPtr get_app_fn(ExprPtr e) {
  while (e->is_app()) e = e->app_fn();
  return e;
}

ExprPtr fold_apps(ExprPtr fn, const std::vector<ExprPtr>& args) {
  for (ExprPtr arg : args) fn = mk_app(fn, arg);
  return fn;
}

static ExprPtr fold_binders(bool pi, const std::vector<ExprPtr>& locals,
                            ExprPtr body) {
  ExprPtr ret = abstract(body, locals);
  for (uint64_t i = locals.size(); i-- > 0;) {
    ExprPtr local = locals[i];
    // The domain may mention the locals bound further out
    std::vector<ExprPtr> outer(locals.begin(), locals.begin() + i);
    ExprPtr domain = abstract(local->local_type(), outer);
    ret = pi ? mk_pi(local->local_name(), domain, ret, local->binder_info())
             : mk_lambda(local->local_name(), domain, ret,
                         local->binder_info());
  }
  return ret;
}

ExprPtr fold_pis(const std::vector<ExprPtr>& locals, ExprPtr body) {
  return fold_binders(true, locals, body);
}

ExprPtr fold_lambdas(const std::vector<ExprPtr>& locals, ExprPtr body) {
  return fold_binders(false, locals, body);
}

void collect_const_names(ExprPtr e, std::unordered_set<NamePtr>* names) {
  for_each(e, [names](ExprPtr x) {
    if (x->is_const()) names->insert(x->const_name());
    return !x->is_local();
  });
}

void collect_level_params(ExprPtr e, std::unordered_set<NamePtr>* params) {
  for_each(e, [params](ExprPtr x) {
    if (!x->has_params()) return false;
    if (x->is_sort()) collect_level_params(x->sort_level(), params);
    if (x->is_const()) {
      for (LevelPtr l : x->const_levels()) collect_level_params(l, params);
    }
    return true;
  });
}

std::vector<ExprPtr> collect_consts(ExprPtr e) {
  std::vector<ExprPtr> ret;
  for_each(e, [&ret](ExprPtr x) {
    if (x->is_const()) ret.push_back(x);
    return !x->is_local();
  });
  return ret;
}

}  // namespace kerncheck
