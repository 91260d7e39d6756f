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

// Growable stack for the recursive parts of the kernel.
//
// Recursive routines call near_limit() on entry. When it returns true they
// rerun themselves through run_on_new_segment(), which executes the closure on
// a fresh thread with a larger stack and waits for it. The usual shape is
//
//   if (StackGuard::near_limit()) {
//     Result r = fallback;
//     StackGuard::run_on_new_segment([&] { r = f(args); });
//     return r;
//   }
//
// Once the configured ceiling is reached the closure is not run, the fallback
// is returned and the calling thread is marked exhausted until
// clear_exhausted().

#ifndef KERNCHECK_KERNEL_STACK_GUARD_H_
#define KERNCHECK_KERNEL_STACK_GUARD_H_

#include <stddef.h>

#include <functional>

namespace kerncheck {

class StackGuard {
 public:
  // Process-wide limits. Call before any checking thread starts.
  static void Configure(size_t red_zone, size_t segment_size,
                        size_t max_total);

  // True if less than the red zone is left on the current stack
  static bool near_limit();

  // Runs fn on a new segment and returns true, or returns false without
  // running it if the segment would push the chain past the ceiling.
  static bool run_on_new_segment(const std::function<void()>& fn);

  // Sticky per-thread flag set when a segment was refused on this thread or
  // on any segment it waited for.
  static bool exhausted();
  static void clear_exhausted();
};

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_STACK_GUARD_H_
