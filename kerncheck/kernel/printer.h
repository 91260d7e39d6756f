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

#ifndef KERNCHECK_KERNEL_PRINTER_H_
#define KERNCHECK_KERNEL_PRINTER_H_

#include <iosfwd>
#include <string>

#include "kerncheck/kernel/expr.h"

namespace kerncheck {

std::ostream& operator<<(std::ostream& out, NamePtr name);
std::ostream& operator<<(std::ostream& out, LevelPtr level);
std::ostream& operator<<(std::ostream& out, ExprPtr expr);

std::string to_string(LevelPtr level);
std::string to_string(ExprPtr expr);

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_PRINTER_H_
