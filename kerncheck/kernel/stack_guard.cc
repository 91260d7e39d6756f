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

#include "kerncheck/kernel/stack_guard.h"

#include <pthread.h>
#include <stdint.h>
#include <string.h>

#include <atomic>

#include "tensorflow/core/platform/logging.h"

namespace kerncheck {
namespace {

std::atomic<size_t> red_zone(256 << 10);
std::atomic<size_t> segment_size(64 << 20);
std::atomic<size_t> max_total(static_cast<size_t>(16) << 30);

// Per-thread view of the segment chain the thread belongs to
struct ThreadStack {
  bool initialized;
  bool bounds_known;
  uintptr_t low;
  size_t next_segment;
  size_t chain_total;
  bool exhausted;
};

thread_local ThreadStack current = {false, false, 0, 0, 0, false};

void init_bounds(ThreadStack* stack) {
  stack->initialized = true;
  pthread_attr_t attr;
  if (pthread_getattr_np(pthread_self(), &attr) != 0) return;
  void* addr = nullptr;
  size_t size = 0;
  if (pthread_attr_getstack(&attr, &addr, &size) == 0) {
    stack->low = reinterpret_cast<uintptr_t>(addr);
    stack->bounds_known = true;
  }
  pthread_attr_destroy(&attr);
  if (!stack->bounds_known) {
    LOG(WARNING) << "Stack bounds unavailable, stack guard disabled on thread";
  }
}

ThreadStack* thread_stack() {
  if (!current.initialized) {
    init_bounds(&current);
    if (current.next_segment == 0) current.next_segment = segment_size;
  }
  return &current;
}

struct Segment {
  const std::function<void()>* fn;
  size_t chain_total;
  size_t next_segment;
  bool exhausted;
};

void* segment_main(void* arg) {
  Segment* segment = static_cast<Segment*>(arg);
  current.chain_total = segment->chain_total;
  current.next_segment = segment->next_segment;
  current.exhausted = false;
  thread_stack();
  (*segment->fn)();
  segment->exhausted = current.exhausted;
  return nullptr;
}

}  // namespace

void StackGuard::Configure(size_t new_red_zone, size_t new_segment_size,
                           size_t new_max_total) {
  red_zone = new_red_zone;
  segment_size = new_segment_size;
  max_total = new_max_total;
}

bool StackGuard::near_limit() {
  ThreadStack* stack = thread_stack();
  if (!stack->bounds_known) return false;
  char probe;
  const uintptr_t sp = reinterpret_cast<uintptr_t>(&probe);
  return sp < stack->low + red_zone;
}

bool StackGuard::run_on_new_segment(const std::function<void()>& fn) {
  ThreadStack* stack = thread_stack();
  if (stack->exhausted) return false;
  const size_t size = stack->next_segment;
  if (stack->chain_total + size > max_total) {
    VLOG(2) << "Stack ceiling reached at " << stack->chain_total << " bytes";
    stack->exhausted = true;
    return false;
  }
  Segment segment = {&fn, stack->chain_total + size, 2 * size, false};

  pthread_attr_t attr;
  pthread_attr_init(&attr);
  int error = pthread_attr_setstacksize(&attr, size);
  pthread_t thread;
  if (error == 0) {
    error = pthread_create(&thread, &attr, &segment_main, &segment);
  }
  pthread_attr_destroy(&attr);
  if (error != 0) {
    LOG(WARNING) << "Could not start stack segment of " << size
                 << " bytes: " << strerror(error);
    stack->exhausted = true;
    return false;
  }
  VLOG(2) << "Running on stack segment of " << size << " bytes";
  pthread_join(thread, nullptr);
  if (segment.exhausted) stack->exhausted = true;
  return true;
}

bool StackGuard::exhausted() { return thread_stack()->exhausted; }

void StackGuard::clear_exhausted() { thread_stack()->exhausted = false; }

}  // namespace kerncheck
