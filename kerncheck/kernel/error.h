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

// Kernel rejections as tensorflow::Status values.
//
// The message of a rejection starts with the name of its kind followed by
// ": ", which is how GetErrorKind recovers the kind after the status has
// been propagated with TF_RETURN_IF_ERROR.

#ifndef KERNCHECK_KERNEL_ERROR_H_
#define KERNCHECK_KERNEL_ERROR_H_

#include <memory>
#include <string>

#include "kerncheck/kernel/expr.h"
#include "tensorflow/core/lib/core/status.h"
#include "tensorflow/core/lib/strings/strcat.h"

namespace kerncheck {

enum ErrorKind {
  kUnknownReference,
  kDuplicateName,
  kUniverseArityError,
  kNotAFunction,
  kTypeMismatch,
  kMalformedConstructor,
  kBadComputationRule,
  kStackExhausted,
};

const char* ErrorKindName(ErrorKind kind);
tensorflow::error::Code ErrorKindCode(ErrorKind kind);

template <typename... Args>
tensorflow::Status KernelError(ErrorKind kind, Args... args) {
  return tensorflow::Status(
      ErrorKindCode(kind),
      tensorflow::strings::StrCat(ErrorKindName(kind), ": ", args...));
}

// Returns false for OK and for statuses that are not kernel rejections
bool GetErrorKind(const tensorflow::Status& status, ErrorKind* kind);

// Final verdict on a declaration that failed to certify
struct Rejection {
  ErrorKind kind;
  NamePtr name;
  // Offending terms, or nullptr when the failure is not about a pair of
  // terms. For TypeMismatch lhs is the expected type and rhs the inferred one.
  ExprPtr lhs;
  ExprPtr rhs;
  std::string message;
  // Owner of the locals lhs and rhs may mention
  std::shared_ptr<const LocalContext> locals;
};

// Multi-line human readable report
std::string RejectionReport(const Rejection& rejection);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_ERROR_H_
