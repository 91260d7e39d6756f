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

#include "kerncheck/kernel/error.h"

#include "kerncheck/kernel/printer.h"
#include "tensorflow/core/lib/strings/str_util.h"

namespace kerncheck {

static const ErrorKind kAllKinds[] = {
    kUnknownReference,    kDuplicateName,       kUniverseArityError,
    kNotAFunction,        kTypeMismatch,        kMalformedConstructor,
    kBadComputationRule,  kStackExhausted};

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case kUnknownReference:
      return "UnknownReference";
    case kDuplicateName:
      return "DuplicateName";
    case kUniverseArityError:
      return "UniverseArityError";
    case kNotAFunction:
      return "NotAFunction";
    case kTypeMismatch:
      return "TypeMismatch";
    case kMalformedConstructor:
      return "MalformedConstructor";
    case kBadComputationRule:
      return "BadComputationRule";
    case kStackExhausted:
      return "StackExhausted";
  }
  return "Unknown";
}

tensorflow::error::Code ErrorKindCode(ErrorKind kind) {
  switch (kind) {
    case kUnknownReference:
      return tensorflow::error::NOT_FOUND;
    case kDuplicateName:
      return tensorflow::error::ALREADY_EXISTS;
    case kStackExhausted:
      return tensorflow::error::RESOURCE_EXHAUSTED;
    case kUniverseArityError:
    case kNotAFunction:
    case kTypeMismatch:
    case kMalformedConstructor:
    case kBadComputationRule:
      break;
  }
  return tensorflow::error::INVALID_ARGUMENT;
}

bool GetErrorKind(const tensorflow::Status& status, ErrorKind* kind) {
  if (status.ok()) return false;
  for (ErrorKind candidate : kAllKinds) {
    if (status.code() != ErrorKindCode(candidate)) continue;
    const std::string prefix =
        tensorflow::strings::StrCat(ErrorKindName(candidate), ": ");
    if (tensorflow::str_util::StartsWith(status.error_message(), prefix)) {
      *kind = candidate;
      return true;
    }
  }
  return false;
}

std::string RejectionReport(const Rejection& rejection) {
  std::string report = tensorflow::strings::StrCat(
      "declaration ", rejection.name == nullptr ? std::string("<none>")
                                                : rejection.name->to_string(),
      " rejected: ", ErrorKindName(rejection.kind), "\n  ", rejection.message);
  if (rejection.lhs != nullptr) {
    tensorflow::strings::StrAppend(&report, "\n  expected: ",
                                   to_string(rejection.lhs));
  }
  if (rejection.rhs != nullptr) {
    tensorflow::strings::StrAppend(&report, "\n  actual:   ",
                                   to_string(rejection.rhs));
  }
  return report;
}

}  // namespace kerncheck
