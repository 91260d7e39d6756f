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

// Certifies export files, each into a fresh environment.

// Example invocation:
//   kerncheck --threads=8 --print_names core.out
//
// Exit status is 0 if every file certifies, 1 if a declaration is rejected
// and 2 on usage, I/O or parse errors.

#include <stdlib.h>

#include <iostream>
#include <string>
#include <vector>

#include "kerncheck/driver/export_reader.h"
#include "kerncheck/driver/orchestrator.h"
#include "kerncheck/kernel/environment.h"
#include "kerncheck/kernel/error.h"
#include "kerncheck/kernel/printer.h"
#include "tensorflow/core/platform/env.h"
#include "tensorflow/core/platform/init_main.h"
#include "tensorflow/core/platform/logging.h"
#include "tensorflow/core/platform/types.h"
#include "tensorflow/core/util/command_line_flags.h"

namespace kerncheck {
namespace {

enum ExitCode { kOk = 0, kRejected = 1, kUsage = 2 };

ExitCode CheckFile(const std::string& path, const CheckerOptions& options,
                   bool print_names) {
  ExportReader reader;
  tensorflow::Status status = reader.Open(path);
  if (!status.ok()) {
    LOG(ERROR) << status;
    return kUsage;
  }

  Environment env;
  Orchestrator orchestrator(&env, options);
  CheckReport report;
  const tensorflow::uint64 start = tensorflow::Env::Default()->NowMicros();
  status = orchestrator.Run(&reader, &report);
  const double seconds =
      (tensorflow::Env::Default()->NowMicros() - start) * 1e-6;
  if (!status.ok()) {
    LOG(ERROR) << status;
    return kUsage;
  }
  if (print_names) {
    for (NamePtr name : report.certified) std::cout << name << "\n";
    std::cout << std::flush;
  }
  if (report.rejection != nullptr) {
    LOG(ERROR) << path << ": declaration " << report.rejection_index << "\n"
               << RejectionReport(*report.rejection);
    return kRejected;
  }
  LOG(INFO) << path << ": certified " << report.certified.size()
            << " declarations (" << env.size() << " environment entries) in "
            << seconds << "s";
  return kOk;
}

}  // namespace
}  // namespace kerncheck

int main(int argc, char** argv) {
  tensorflow::int32 threads = 1;
  tensorflow::int32 lookahead = 1024;
  tensorflow::int64 stack_red_zone_kb = 256;
  tensorflow::int64 stack_segment_mb = 64;
  tensorflow::int64 max_stack_mb = 16 << 10;
  bool print_names = false;
  bool verbose = false;
  std::vector<tensorflow::Flag> flag_list = {
      tensorflow::Flag("threads", &threads,
                       "1 checks sequentially, N > 1 uses N body workers"),
      tensorflow::Flag("lookahead", &lookahead,
                       "Maximum number of definitions awaiting body checks"),
      tensorflow::Flag("stack_red_zone_kb", &stack_red_zone_kb,
                       "Remaining stack at which recursion moves to a new "
                       "segment"),
      tensorflow::Flag("stack_segment_mb", &stack_segment_mb,
                       "Size of the first extra stack segment"),
      tensorflow::Flag("max_stack_mb", &max_stack_mb,
                       "Ceiling on the stack segments of one checking thread"),
      tensorflow::Flag("print_names", &print_names,
                       "Print the names of certified declarations"),
      tensorflow::Flag("verbose", &verbose, "Log every certified declaration"),
  };
  const std::string usage = tensorflow::Flags::Usage(argv[0], flag_list);
  const bool parse_ok = tensorflow::Flags::Parse(&argc, argv, flag_list);
  if (!parse_ok || argc < 2 || threads < 1 || lookahead < 1 ||
      stack_red_zone_kb < 1 || stack_segment_mb < 1 || max_stack_mb < 1) {
    std::cerr << usage << "\nusage: " << argv[0] << " [flags] FILE...\n";
    return kerncheck::kUsage;
  }
  // Read by the logging library on its first VLOG
  if (verbose) setenv("TF_CPP_MIN_VLOG_LEVEL", "1", 0);
  tensorflow::port::InitMain(argv[0], &argc, &argv);

  kerncheck::CheckerOptions options;
  options.num_threads = threads;
  options.lookahead = lookahead;
  options.stack_red_zone = static_cast<size_t>(stack_red_zone_kb) << 10;
  options.stack_segment_size = static_cast<size_t>(stack_segment_mb) << 20;
  options.max_stack_total = static_cast<size_t>(max_stack_mb) << 20;

  for (int i = 1; i < argc; ++i) {
    const auto code = kerncheck::CheckFile(argv[i], options, print_names);
    if (code != kerncheck::kOk) return code;
  }
  return kerncheck::kOk;
}
