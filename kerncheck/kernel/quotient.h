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

// Builtin quotient types:
//
//   quot.{u}      : Π {α : Sort u}, (α → α → Prop) → Sort u
//   quot.mk.{u}   : Π {α : Sort u} (r : α → α → Prop), α → @quot α r
//   quot.lift.{u v} : Π {α : Sort u} {r : α → α → Prop} {β : Sort v}
//                     (f : α → β), (Π a b : α, r a b → f a = f b) →
//                     @quot α r → β
//   quot.ind.{u}  : Π {α : Sort u} {r : α → α → Prop}
//                   {β : @quot α r → Prop},
//                   (Π a : α, β (@quot.mk α r a)) → Π q : @quot α r, β q
//
// with the computation rules
//
//   quot.lift α r β f h (quot.mk α r a)  ~>  f a
//   quot.ind α r β h (quot.mk α r a)     ~>  h a

#ifndef KERNCHECK_KERNEL_QUOTIENT_H_
#define KERNCHECK_KERNEL_QUOTIENT_H_

#include "kerncheck/kernel/environment.h"
#include "kerncheck/kernel/type_checker.h"
#include "tensorflow/core/lib/core/status.h"

namespace kerncheck {

// Name of the equality type quot.lift refers to
NamePtr quotient_eq_name();

// Checks the quotient declarations against the environment checker reads
// from (which must already contain eq) and fills group with them and their
// rules.
tensorflow::Status BuildQuotient(TypeChecker* checker,
                                 DeclarationGroup* group);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_QUOTIENT_H_
