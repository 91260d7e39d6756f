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

// Drives certification of a declaration stream into an environment.
//
// With one thread every declaration is certified fully before the next is
// read. With more, the calling thread certifies signatures in stream order
// and hands definition bodies to a pool. In both modes the run stops
// registering work at the first failure it sees and reports the failure
// with the smallest stream index, so verdicts do not depend on the number
// of threads.

#ifndef KERNCHECK_DRIVER_ORCHESTRATOR_H_
#define KERNCHECK_DRIVER_ORCHESTRATOR_H_

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <vector>

#include "kerncheck/driver/declaration_source.h"
#include "kerncheck/kernel/certifier.h"
#include "kerncheck/kernel/environment.h"
#include "kerncheck/kernel/error.h"
#include "tensorflow/core/lib/core/status.h"
#include "tensorflow/core/platform/macros.h"
#include "tensorflow/core/platform/mutex.h"
#include "tensorflow/core/platform/thread_annotations.h"

namespace kerncheck {

struct CheckerOptions {
  // 1 certifies sequentially in stream order, N > 1 uses N body workers
  int num_threads = 1;
  // Maximum number of definitions whose bodies are registered but not yet
  // certified
  int lookahead = 1024;
  // Remaining stack below which recursion moves to a new segment
  size_t stack_red_zone = 256 << 10;
  // First extra segment; each further one doubles
  size_t stack_segment_size = 64 << 20;
  // Ceiling on the segments of one chain
  size_t max_stack_total = size_t(16) << 30;
};

struct CheckReport {
  // Names of the certified exported declarations, in stream order
  std::vector<NamePtr> certified;
  // First rejection in stream order, null if everything certified
  std::unique_ptr<Rejection> rejection;
  uint64_t rejection_index = 0;
};

class Orchestrator {
 public:
  // Configures the stack guard from options
  Orchestrator(Environment* env, const CheckerOptions& options);

  // Certifies source until it ends or a declaration is rejected. Parse and
  // I/O failures are returned as errors; rejections go in report.
  tensorflow::Status Run(DeclarationSource* source, CheckReport* report);

 private:
  tensorflow::Status RunSequential(DeclarationSource* source,
                                   CheckReport* report);
  tensorflow::Status RunParallel(DeclarationSource* source,
                                 CheckReport* report);

  // Keeps the failure with the smallest index
  void RecordFailure(uint64_t index, const tensorflow::Status& status,
                     std::unique_ptr<Rejection> rejection)
      EXCLUSIVE_LOCKS_REQUIRED(mu_);

  const CheckerOptions options_;
  Certifier certifier_;

  tensorflow::mutex mu_;
  tensorflow::condition_variable body_done_;
  int outstanding_ GUARDED_BY(mu_) = 0;
  bool failed_ GUARDED_BY(mu_) = false;
  uint64_t failure_index_ GUARDED_BY(mu_) = 0;
  tensorflow::Status failure_status_ GUARDED_BY(mu_);
  std::unique_ptr<Rejection> failure_rejection_ GUARDED_BY(mu_);

  TF_DISALLOW_COPY_AND_ASSIGN(Orchestrator);
};

}  // namespace kerncheck

#endif  // KERNCHECK_DRIVER_ORCHESTRATOR_H_
