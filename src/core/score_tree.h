// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/functional/function_ref.h>

#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string_view>

#include "core/string_pool.h"

namespace gzset {

// An item of the score tree. Ordered by score and then by the bytes of the member name.
struct ScoreKey {
  double score;
  MemberId id;
};

// A (score, member) position that does not have to be in the tree.
struct ScoreProbe {
  double score;
  std::string_view member;
};

/**
 * @brief ScoreTree is a B-tree of ScoreKey items that knows the number of items under every node,
 * so it finds the rank of an item and the item at a rank in O(log n).
 *
 * Member names are read from the pool for tie breaks, so every id in the tree must stay live
 * until it is deleted from the tree. Nodes are fixed size blocks taken from the memory resource.
 * Leaves hold more items than inner nodes because they have no child pointers.
 */
class ScoreTree {
  ScoreTree(const ScoreTree&) = delete;
  ScoreTree& operator=(const ScoreTree&) = delete;

 public:
  using ItemCb = absl::FunctionRef<bool(ScoreKey)>;

  ScoreTree(const StringPool* pool, std::pmr::memory_resource* mr);

  ~ScoreTree() {
    Clear();
  }

  // Returns false if key is already in the tree.
  bool Insert(ScoreKey key);

  // Returns false if key is not in the tree.
  bool Delete(ScoreKey key);

  // Returns the number of items that precede key, or that follow it if reverse is set.
  std::optional<uint32_t> GetRank(ScoreKey key, bool reverse = false) const;

  // rank must be less than Size().
  ScoreKey AtRank(uint32_t rank) const;

  // Number of items less or equal to probe. This is the rank of the first item that is
  // strictly greater than probe.
  uint32_t UpperBoundRank(const ScoreProbe& probe) const;

  // Calls cb for items with ascending ranks in [rank_start, rank_end] while cb returns true.
  // rank_end may exceed the last rank. Returns false if cb stopped the iteration.
  bool Iterate(uint32_t rank_start, uint32_t rank_end, ItemCb cb) const;

  // Same as Iterate but ranks are counted from the greatest item and items come in
  // descending order.
  bool IterateReverse(uint32_t rank_start, uint32_t rank_end, ItemCb cb) const;

  void Clear();

  uint32_t Size() const {
    return root_ ? root_->count : 0;
  }

  unsigned Height() const {
    return height_;
  }

  size_t NodeCount() const {
    return num_leaves_ + num_inner_;
  }

  // Bytes requested from the memory resource for nodes.
  size_t MallocUsed() const;

  int Compare(const ScoreKey& a, const ScoreKey& b) const;
  int Compare(const ScoreProbe& a, const ScoreKey& b) const;

  // Checks ordering, subtree counts, fill factors and leaf depth. Linear, for tests.
  bool DEBUG_Validate() const;

 private:
  static constexpr size_t kNodeBytes = 256;

  struct Node {
    explicit Node(bool is_leaf) : leaf(is_leaf) {
    }

    // Items in the subtree rooted at this node, including its own.
    uint32_t count = 0;
    uint8_t num_keys = 0;
    bool leaf;
  };

  static constexpr unsigned kLeafKeys = (kNodeBytes - sizeof(Node)) / sizeof(ScoreKey);
  static constexpr unsigned kInnerKeys =
      (kNodeBytes - sizeof(Node) - sizeof(Node*)) / (sizeof(ScoreKey) + sizeof(Node*));

  // A node below the root never has fewer items than this. Merging two minimal siblings
  // with their separator must fit a single node.
  static constexpr unsigned kMinLeafKeys = kLeafKeys / 2;
  static constexpr unsigned kMinInnerKeys = (kInnerKeys - 1) / 2;

  struct Leaf : public Node {
    Leaf() : Node(true) {
    }

    ScoreKey items[kLeafKeys];
  };

  struct Inner : public Node {
    Inner() : Node(false) {
    }

    ScoreKey items[kInnerKeys];
    Node* children[kInnerKeys + 1];
  };

  static_assert(sizeof(Leaf) <= kNodeBytes);
  static_assert(sizeof(Inner) <= kNodeBytes);
  static_assert(2 * kMinLeafKeys + 1 <= kLeafKeys);
  static_assert(2 * kMinInnerKeys + 1 <= kInnerKeys);

  static ScoreKey* Items(Node* node) {
    return node->leaf ? static_cast<Leaf*>(node)->items : static_cast<Inner*>(node)->items;
  }

  static const ScoreKey* Items(const Node* node) {
    return node->leaf ? static_cast<const Leaf*>(node)->items
                      : static_cast<const Inner*>(node)->items;
  }

  static Inner* AsInner(Node* node) {
    return static_cast<Inner*>(node);
  }

  static const Inner* AsInner(const Node* node) {
    return static_cast<const Inner*>(node);
  }

  static unsigned Capacity(const Node* node) {
    return node->leaf ? kLeafKeys : kInnerKeys;
  }

  static unsigned MinKeys(const Node* node) {
    return node->leaf ? kMinLeafKeys : kMinInnerKeys;
  }

  // Index of the first item in node that is not less than q. Sets *found if it equals q.
  template <typename Q> unsigned LowerBound(const Node* node, const Q& q, bool* found) const;

  // Number of tree items less than q.
  template <typename Q> uint32_t CountLess(const Q& q, bool* found) const;

  Leaf* NewLeaf();
  Inner* NewInner();
  void FreeNode(Node* node);
  void FreeSubtree(Node* node);

  // Splits the full child at pos of a non-full parent and lifts its median into the parent.
  void SplitChild(Inner* parent, unsigned pos);

  // Moves the separator at pos and the whole right sibling into the left child at pos.
  Node* MergeChildren(Inner* parent, unsigned pos);

  // Makes sure the child at pos can lose an item and returns the child that now covers
  // its key range.
  Node* FillChild(Inner* parent, unsigned pos);

  // key must be in the subtree and node must be able to lose an item unless it is the root.
  void EraseFrom(Node* node, ScoreKey key);

  bool Walk(const Node* node, uint32_t skip, uint32_t* budget, ItemCb cb) const;
  bool WalkReverse(const Node* node, uint32_t skip, uint32_t* budget, ItemCb cb) const;

  // Returns the depth of the leaves under node, or -1 if the subtree is broken.
  int ValidateSubtree(const Node* node, const ScoreKey* lo, const ScoreKey* hi,
                      bool is_root) const;

  const StringPool* pool_;
  std::pmr::memory_resource* mr_;
  Node* root_ = nullptr;
  unsigned height_ = 0;
  size_t num_leaves_ = 0;
  size_t num_inner_ = 0;
};

}  // namespace gzset
