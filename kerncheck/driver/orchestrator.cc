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

#include "kerncheck/driver/orchestrator.h"

#include <algorithm>
#include <utility>

#include "kerncheck/kernel/printer.h"
#include "kerncheck/kernel/stack_guard.h"
#include "tensorflow/core/lib/core/threadpool.h"
#include "tensorflow/core/platform/env.h"
#include "tensorflow/core/platform/logging.h"

namespace kerncheck {

using tensorflow::Status;
using tensorflow::mutex_lock;

Orchestrator::Orchestrator(Environment* env, const CheckerOptions& options)
    : options_(options), certifier_(env) {
  StackGuard::Configure(options.stack_red_zone, options.stack_segment_size,
                        options.max_stack_total);
}

Status Orchestrator::Run(DeclarationSource* source, CheckReport* report) {
  report->certified.clear();
  report->rejection.reset();
  report->rejection_index = 0;
  if (options_.num_threads <= 1) return RunSequential(source, report);
  return RunParallel(source, report);
}

Status Orchestrator::RunSequential(DeclarationSource* source,
                                   CheckReport* report) {
  for (uint64_t index = 0;; ++index) {
    ExportedDeclaration decl;
    bool done;
    TF_RETURN_IF_ERROR(source->Next(&decl, &done));
    if (done) break;
    std::unique_ptr<Rejection> rejection;
    TF_RETURN_IF_ERROR(certifier_.Certify(decl, &rejection));
    if (rejection != nullptr) {
      report->rejection = std::move(rejection);
      report->rejection_index = index;
      break;
    }
    VLOG(1) << "Certified " << decl.name;
    report->certified.push_back(decl.name);
  }
  return Status::OK();
}

void Orchestrator::RecordFailure(uint64_t index, const Status& status,
                                 std::unique_ptr<Rejection> rejection) {
  if (failed_ && failure_index_ <= index) return;
  failed_ = true;
  failure_index_ = index;
  failure_status_ = status;
  failure_rejection_ = std::move(rejection);
}

Status Orchestrator::RunParallel(DeclarationSource* source,
                                 CheckReport* report) {
  {
    mutex_lock lock(mu_);
    outstanding_ = 0;
    failed_ = false;
    failure_status_ = Status::OK();
    failure_rejection_.reset();
  }
  const int lookahead = std::max(options_.lookahead, 1);
  std::vector<NamePtr> names;
  Status source_status;
  {
    tensorflow::thread::ThreadPool pool(tensorflow::Env::Default(), "kerncheck",
                                        options_.num_threads);
    for (uint64_t index = 0;; ++index) {
      {
        mutex_lock lock(mu_);
        while (!failed_ && outstanding_ >= lookahead) body_done_.wait(lock);
        if (failed_) break;
      }
      std::shared_ptr<ExportedDeclaration> decl(new ExportedDeclaration);
      bool done;
      source_status = source->Next(decl.get(), &done);
      if (!source_status.ok() || done) break;
      names.push_back(decl->name);

      std::unique_ptr<Rejection> rejection;
      Status status = certifier_.CertifySignature(*decl, &rejection);
      if (!status.ok() || rejection != nullptr) {
        mutex_lock lock(mu_);
        RecordFailure(index, status, std::move(rejection));
        break;
      }
      if (decl->kind != ExportedDeclaration::DEFINITION) continue;

      {
        mutex_lock lock(mu_);
        ++outstanding_;
      }
      VLOG(2) << "Scheduling body " << index << " " << decl->name;
      pool.Schedule([this, decl, index]() {
        std::unique_ptr<Rejection> rejection;
        Status status = certifier_.CertifyBody(*decl, &rejection);
        mutex_lock lock(mu_);
        if (!status.ok() || rejection != nullptr) {
          RecordFailure(index, status, std::move(rejection));
        }
        --outstanding_;
        body_done_.notify_all();
      });
    }
    // Leaving the scope waits for the bodies still running
  }

  mutex_lock lock(mu_);
  if (failed_) {
    TF_RETURN_IF_ERROR(failure_status_);
    report->rejection = std::move(failure_rejection_);
    report->rejection_index = failure_index_;
    report->certified.assign(names.begin(), names.begin() + failure_index_);
    return Status::OK();
  }
  TF_RETURN_IF_ERROR(source_status);
  report->certified = names;
  return Status::OK();
}

}  // namespace kerncheck
