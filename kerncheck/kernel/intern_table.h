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

// Sharded hash-consing table shared by names, levels and expressions.
//
// Nodes are owned by the table and live until process exit, so a node pointer
// is a stable handle and structural equality of interned nodes is pointer
// equality.

#ifndef KERNCHECK_KERNEL_INTERN_TABLE_H_
#define KERNCHECK_KERNEL_INTERN_TABLE_H_

#include <stddef.h>

#include <unordered_set>
#include <utility>

#include "tensorflow/core/platform/macros.h"
#include "tensorflow/core/platform/mutex.h"
#include "tensorflow/core/platform/thread_annotations.h"

namespace kerncheck {

// Node must expose hash() and a shallow structural operator== that compares
// children by pointer.
template <typename Node>
class InternTable {
 public:
  InternTable() = default;

  // Returns the canonical node structurally equal to candidate.
  const Node* intern(Node&& candidate) {
    Shard& shard = shards_[candidate.hash() % kNumShards];
    tensorflow::mutex_lock lock(shard.mu);
    auto it = shard.nodes.find(&candidate);
    if (it != shard.nodes.end()) return *it;
    const Node* node = new Node(std::move(candidate));
    shard.nodes.insert(node);
    return node;
  }

  size_t size() const {
    size_t total = 0;
    for (const Shard& shard : shards_) {
      tensorflow::mutex_lock lock(shard.mu);
      total += shard.nodes.size();
    }
    return total;
  }

 private:
  struct NodeHash {
    size_t operator()(const Node* node) const { return node->hash(); }
  };
  struct NodeEq {
    bool operator()(const Node* a, const Node* b) const { return *a == *b; }
  };
  struct Shard {
    mutable tensorflow::mutex mu;
    std::unordered_set<const Node*, NodeHash, NodeEq> nodes GUARDED_BY(mu);
  };

  static const int kNumShards = 64;
  Shard shards_[kNumShards];

  TF_DISALLOW_COPY_AND_ASSIGN(InternTable);
};

}  // namespace kerncheck

#endif  // KERNCHECK_KERNEL_INTERN_TABLE_H_
