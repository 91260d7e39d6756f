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

#ifndef KERNCHECK_DRIVER_DECLARATION_SOURCE_H_
#define KERNCHECK_DRIVER_DECLARATION_SOURCE_H_

#include "kerncheck/kernel/declaration.h"
#include "tensorflow/core/lib/core/status.h"

namespace kerncheck {

// Ordered stream of exported declarations
class DeclarationSource {
 public:
  virtual ~DeclarationSource() {}

  // Fills decl with the next declaration, or sets *done at the end of the
  // stream.
  virtual tensorflow::Status Next(ExportedDeclaration* decl, bool* done) = 0;
};

}  // namespace kerncheck

#endif  // KERNCHECK_DRIVER_DECLARATION_SOURCE_H_
