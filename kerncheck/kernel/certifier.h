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

// Certifies exported declarations into an environment.
//
// Certification is split in two stages so that bodies can be checked off
// the main path:
//
//   signature: universe params distinct, type closed and a type, commit.
//              Inductives and the quotient are fully validated here.
//   body:      definitions only, the value has the declared type.
//
// A definition is committed by its signature stage, value included, so later
// declarations may unfold it before its body has been checked. Certify runs
// both stages back to back.
//
// Each stage returns a non-OK status only for failures that are not kernel
// rejections. A rejection is reported through *rejection, which is left
// null when the stage succeeds.

#ifndef KERNCHECK_KERNEL_CERTIFIER_H_
#define KERNCHECK_KERNEL_CERTIFIER_H_

#include <memory>

#include "kerncheck/kernel/declaration.h"
#include "kerncheck/kernel/environment.h"
#include "kerncheck/kernel/error.h"
#include "tensorflow/core/lib/core/status.h"
#include "tensorflow/core/platform/macros.h"

namespace kerncheck {

class Certifier {
 public:
  explicit Certifier(Environment* env) : env_(env) {}

  tensorflow::Status CertifySignature(const ExportedDeclaration& decl,
                                      std::unique_ptr<Rejection>* rejection);

  // May run concurrently with other bodies and with signature stages
  tensorflow::Status CertifyBody(const ExportedDeclaration& decl,
                                 std::unique_ptr<Rejection>* rejection) const;

  tensorflow::Status Certify(const ExportedDeclaration& decl,
                             std::unique_ptr<Rejection>* rejection);

 private:
  Environment* env_;

  TF_DISALLOW_COPY_AND_ASSIGN(Certifier);
};

// Height of a definition with the given value: one more than the greatest
// height of the committed definitions it mentions.
uint32_t DefinitionHeight(const Environment& env, ExprPtr value);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_CERTIFIER_H_
