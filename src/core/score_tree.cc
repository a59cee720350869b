// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/score_tree.h"

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <new>

namespace gzset {

using namespace std;

namespace {

template <typename T> void InsertAt(T* arr, unsigned len, unsigned pos, T val) {
  copy_backward(arr + pos, arr + len, arr + len + 1);
  arr[pos] = val;
}

template <typename T> void EraseAt(T* arr, unsigned len, unsigned pos) {
  copy(arr + pos + 1, arr + len, arr + pos);
}

}  // namespace

ScoreTree::ScoreTree(const StringPool* pool, pmr::memory_resource* mr) : pool_(pool), mr_(mr) {
}

int ScoreTree::Compare(const ScoreKey& a, const ScoreKey& b) const {
  DCHECK(!isnan(a.score) && !isnan(b.score));

  if (a.id == b.id) {
    DCHECK_EQ(a.score, b.score);
    return 0;
  }

  if (a.score != b.score)
    return a.score < b.score ? -1 : 1;

  int res = pool_->Resolve(a.id).compare(pool_->Resolve(b.id));
  DCHECK_NE(res, 0) << "member interned twice";
  return res < 0 ? -1 : 1;
}

int ScoreTree::Compare(const ScoreProbe& a, const ScoreKey& b) const {
  if (a.score != b.score)
    return a.score < b.score ? -1 : 1;

  int res = a.member.compare(pool_->Resolve(b.id));
  return res < 0 ? -1 : (res > 0 ? 1 : 0);
}

template <typename Q>
unsigned ScoreTree::LowerBound(const Node* node, const Q& q, bool* found) const {
  const ScoreKey* items = Items(node);
  unsigned lo = 0, hi = node->num_keys;
  *found = false;

  while (lo < hi) {
    unsigned mid = (lo + hi) / 2;
    int res = Compare(q, items[mid]);
    if (res == 0) {
      *found = true;
      return mid;
    }
    if (res < 0) {
      hi = mid;
    } else {
      lo = mid + 1;
    }
  }
  return lo;
}

template <typename Q> uint32_t ScoreTree::CountLess(const Q& q, bool* found) const {
  uint32_t res = 0;
  *found = false;

  for (const Node* node = root_; node;) {
    unsigned pos = LowerBound(node, q, found);
    res += pos;
    if (node->leaf)
      break;

    const Inner* inner = AsInner(node);
    for (unsigned i = 0; i < pos; ++i)
      res += inner->children[i]->count;

    if (*found)
      return res + inner->children[pos]->count;
    node = inner->children[pos];
  }

  return res;
}

ScoreTree::Leaf* ScoreTree::NewLeaf() {
  void* ptr = mr_->allocate(sizeof(Leaf), alignof(Leaf));
  ++num_leaves_;
  return new (ptr) Leaf;
}

ScoreTree::Inner* ScoreTree::NewInner() {
  void* ptr = mr_->allocate(sizeof(Inner), alignof(Inner));
  ++num_inner_;
  return new (ptr) Inner;
}

void ScoreTree::FreeNode(Node* node) {
  if (node->leaf) {
    --num_leaves_;
    mr_->deallocate(node, sizeof(Leaf), alignof(Leaf));
  } else {
    --num_inner_;
    mr_->deallocate(node, sizeof(Inner), alignof(Inner));
  }
}

void ScoreTree::FreeSubtree(Node* node) {
  if (!node->leaf) {
    Inner* inner = AsInner(node);
    for (unsigned i = 0; i <= inner->num_keys; ++i)
      FreeSubtree(inner->children[i]);
  }
  FreeNode(node);
}

void ScoreTree::Clear() {
  if (root_)
    FreeSubtree(root_);

  root_ = nullptr;
  height_ = 0;
  DCHECK_EQ(0u, NodeCount());
}

size_t ScoreTree::MallocUsed() const {
  return num_leaves_ * sizeof(Leaf) + num_inner_ * sizeof(Inner);
}

void ScoreTree::SplitChild(Inner* parent, unsigned pos) {
  Node* left = parent->children[pos];
  DCHECK_EQ(left->num_keys, Capacity(left));
  DCHECK_LT(parent->num_keys, kInnerKeys);

  const unsigned mid = left->num_keys / 2;
  Node* right = left->leaf ? static_cast<Node*>(NewLeaf()) : NewInner();

  ScoreKey* src = Items(left);
  ScoreKey median = src[mid];
  copy(src + mid + 1, src + left->num_keys, Items(right));
  right->num_keys = left->num_keys - mid - 1;
  right->count = right->num_keys;

  if (!left->leaf) {
    Node** from = AsInner(left)->children;
    copy(from + mid + 1, from + left->num_keys + 1, AsInner(right)->children);
    for (unsigned i = 0; i <= right->num_keys; ++i)
      right->count += AsInner(right)->children[i]->count;
  }

  left->num_keys = mid;
  left->count -= right->count + 1;

  InsertAt(parent->items, parent->num_keys, pos, median);
  InsertAt(parent->children, parent->num_keys + 1, pos + 1, right);
  ++parent->num_keys;
}

bool ScoreTree::Insert(ScoreKey key) {
  if (!root_) {
    root_ = NewLeaf();
    height_ = 1;
  }

  bool found;
  CountLess(key, &found);
  if (found)
    return false;

  if (root_->num_keys == Capacity(root_)) {
    Inner* new_root = NewInner();
    new_root->children[0] = root_;
    new_root->count = root_->count;
    root_ = new_root;
    ++height_;
    SplitChild(new_root, 0);
  }

  // Full nodes are split on the way down so a split never propagates upwards.
  Node* node = root_;
  while (true) {
    ++node->count;
    unsigned pos = LowerBound(node, key, &found);
    DCHECK(!found);

    if (node->leaf) {
      InsertAt(Items(node), node->num_keys, pos, key);
      ++node->num_keys;
      break;
    }

    Inner* inner = AsInner(node);
    if (inner->children[pos]->num_keys == Capacity(inner->children[pos])) {
      SplitChild(inner, pos);
      if (Compare(key, inner->items[pos]) > 0)
        ++pos;
    }
    node = inner->children[pos];
  }

  return true;
}

ScoreTree::Node* ScoreTree::MergeChildren(Inner* parent, unsigned pos) {
  Node* left = parent->children[pos];
  Node* right = parent->children[pos + 1];
  DCHECK_EQ(left->leaf, right->leaf);
  DCHECK_LE(left->num_keys + right->num_keys + 1u, Capacity(left));

  ScoreKey* dest = Items(left);
  dest[left->num_keys] = parent->items[pos];
  copy(Items(right), Items(right) + right->num_keys, dest + left->num_keys + 1);

  if (!left->leaf) {
    Node** from = AsInner(right)->children;
    copy(from, from + right->num_keys + 1, AsInner(left)->children + left->num_keys + 1);
  }

  left->num_keys += right->num_keys + 1;
  left->count += right->count + 1;

  EraseAt(parent->items, parent->num_keys, pos);
  EraseAt(parent->children, parent->num_keys + 1, pos + 1);
  --parent->num_keys;

  FreeNode(right);
  return left;
}

ScoreTree::Node* ScoreTree::FillChild(Inner* parent, unsigned pos) {
  Node* child = parent->children[pos];
  if (child->num_keys > MinKeys(child))
    return child;

  // Borrow through the parent from the left sibling.
  if (pos > 0) {
    Node* left = parent->children[pos - 1];
    if (left->num_keys > MinKeys(left)) {
      InsertAt(Items(child), child->num_keys, 0, parent->items[pos - 1]);
      parent->items[pos - 1] = Items(left)[left->num_keys - 1];

      uint32_t moved = 1;
      if (!child->leaf) {
        Node* grandchild = AsInner(left)->children[left->num_keys];
        InsertAt(AsInner(child)->children, child->num_keys + 1, 0, grandchild);
        moved += grandchild->count;
      }

      ++child->num_keys;
      --left->num_keys;
      child->count += moved;
      left->count -= moved;
      return child;
    }
  }

  // Borrow through the parent from the right sibling.
  if (pos < parent->num_keys) {
    Node* right = parent->children[pos + 1];
    if (right->num_keys > MinKeys(right)) {
      Items(child)[child->num_keys] = parent->items[pos];
      parent->items[pos] = Items(right)[0];
      EraseAt(Items(right), right->num_keys, 0);

      uint32_t moved = 1;
      if (!child->leaf) {
        Node* grandchild = AsInner(right)->children[0];
        AsInner(child)->children[child->num_keys + 1] = grandchild;
        EraseAt(AsInner(right)->children, right->num_keys + 1, 0);
        moved += grandchild->count;
      }

      ++child->num_keys;
      --right->num_keys;
      child->count += moved;
      right->count -= moved;
      return child;
    }
  }

  if (pos < parent->num_keys)
    return MergeChildren(parent, pos);

  return MergeChildren(parent, pos - 1);
}

void ScoreTree::EraseFrom(Node* node, ScoreKey key) {
  // The subtree of node keeps the same items through the rebalancing below, minus key.
  --node->count;

  bool found;
  unsigned pos = LowerBound(node, key, &found);

  if (node->leaf) {
    DCHECK(found);
    EraseAt(Items(node), node->num_keys, pos);
    --node->num_keys;
    return;
  }

  Inner* inner = AsInner(node);
  if (!found) {
    EraseFrom(FillChild(inner, pos), key);
    return;
  }

  // key separates two children. Replace it with its neighbour from a child that can spare an
  // item, otherwise merge both children around it and continue in the merged node.
  Node* left = inner->children[pos];
  if (left->num_keys > MinKeys(left)) {
    Node* leaf = left;
    while (!leaf->leaf)
      leaf = AsInner(leaf)->children[leaf->num_keys];
    ScoreKey pred = Items(leaf)[leaf->num_keys - 1];

    EraseFrom(left, pred);
    inner->items[pos] = pred;
    return;
  }

  Node* right = inner->children[pos + 1];
  if (right->num_keys > MinKeys(right)) {
    Node* leaf = right;
    while (!leaf->leaf)
      leaf = AsInner(leaf)->children[0];
    ScoreKey succ = Items(leaf)[0];

    EraseFrom(right, succ);
    inner->items[pos] = succ;
    return;
  }

  EraseFrom(MergeChildren(inner, pos), key);
}

bool ScoreTree::Delete(ScoreKey key) {
  bool found;
  CountLess(key, &found);
  if (!found)
    return false;

  EraseFrom(root_, key);

  if (root_->num_keys == 0) {
    Node* old_root = root_;
    root_ = root_->leaf ? nullptr : AsInner(root_)->children[0];
    FreeNode(old_root);
    --height_;
  }

  return true;
}

optional<uint32_t> ScoreTree::GetRank(ScoreKey key, bool reverse) const {
  bool found;
  uint32_t rank = CountLess(key, &found);
  if (!found)
    return nullopt;

  return reverse ? Size() - 1 - rank : rank;
}

uint32_t ScoreTree::UpperBoundRank(const ScoreProbe& probe) const {
  bool found;
  uint32_t rank = CountLess(probe, &found);
  return found ? rank + 1 : rank;
}

ScoreKey ScoreTree::AtRank(uint32_t rank) const {
  DCHECK_LT(rank, Size());

  const Node* node = root_;
  while (!node->leaf) {
    const Inner* inner = AsInner(node);
    unsigned i = 0;
    for (; i < inner->num_keys; ++i) {
      uint32_t cnt = inner->children[i]->count;
      if (rank < cnt)
        break;
      if (rank == cnt)
        return inner->items[i];
      rank -= cnt + 1;
    }
    node = inner->children[i];
  }

  DCHECK_LT(rank, node->num_keys);
  return Items(node)[rank];
}

// Items of an inner node interleave with its children: child 0, item 0, child 1, ...
// skip is the number of leading items of the subtree to pass over, budget is the number of
// items left to report.
bool ScoreTree::Walk(const Node* node, uint32_t skip, uint32_t* budget, ItemCb cb) const {
  if (node->leaf) {
    const ScoreKey* items = Items(node);
    for (unsigned i = skip; i < node->num_keys && *budget > 0; ++i) {
      --*budget;
      if (!cb(items[i]))
        return false;
    }
    return true;
  }

  const Inner* inner = AsInner(node);
  for (unsigned i = 0; i <= inner->num_keys && *budget > 0; ++i) {
    const Node* child = inner->children[i];
    if (skip >= child->count) {
      skip -= child->count;
    } else {
      if (!Walk(child, skip, budget, cb))
        return false;
      skip = 0;
    }

    if (i == inner->num_keys || *budget == 0)
      break;

    if (skip > 0) {
      --skip;
      continue;
    }

    --*budget;
    if (!cb(inner->items[i]))
      return false;
  }

  return true;
}

bool ScoreTree::WalkReverse(const Node* node, uint32_t skip, uint32_t* budget, ItemCb cb) const {
  if (node->leaf) {
    const ScoreKey* items = Items(node);
    for (int i = int(node->num_keys) - 1 - int(skip); i >= 0 && *budget > 0; --i) {
      --*budget;
      if (!cb(items[i]))
        return false;
    }
    return true;
  }

  const Inner* inner = AsInner(node);
  for (int i = inner->num_keys; i >= 0 && *budget > 0; --i) {
    const Node* child = inner->children[i];
    if (skip >= child->count) {
      skip -= child->count;
    } else {
      if (!WalkReverse(child, skip, budget, cb))
        return false;
      skip = 0;
    }

    if (i == 0 || *budget == 0)
      break;

    if (skip > 0) {
      --skip;
      continue;
    }

    --*budget;
    if (!cb(inner->items[i - 1]))
      return false;
  }

  return true;
}

bool ScoreTree::Iterate(uint32_t rank_start, uint32_t rank_end, ItemCb cb) const {
  if (rank_start >= Size() || rank_start > rank_end)
    return true;

  uint32_t budget = min(rank_end, Size() - 1) - rank_start + 1;
  return Walk(root_, rank_start, &budget, cb);
}

bool ScoreTree::IterateReverse(uint32_t rank_start, uint32_t rank_end, ItemCb cb) const {
  if (rank_start >= Size() || rank_start > rank_end)
    return true;

  uint32_t budget = min(rank_end, Size() - 1) - rank_start + 1;
  return WalkReverse(root_, rank_start, &budget, cb);
}

int ScoreTree::ValidateSubtree(const Node* node, const ScoreKey* lo, const ScoreKey* hi,
                               bool is_root) const {
  const ScoreKey* items = Items(node);

  if (node->num_keys > Capacity(node) || (!is_root && node->num_keys < MinKeys(node))) {
    LOG(ERROR) << "Bad fill " << unsigned(node->num_keys) << " leaf " << node->leaf;
    return -1;
  }

  for (unsigned i = 0; i < node->num_keys; ++i) {
    const ScoreKey* prev = i > 0 ? &items[i - 1] : lo;
    if (prev && Compare(*prev, items[i]) >= 0) {
      LOG(ERROR) << "Out of order item " << items[i].id << " at " << i;
      return -1;
    }
  }
  if (hi && node->num_keys > 0 && Compare(items[node->num_keys - 1], *hi) >= 0) {
    LOG(ERROR) << "Item " << items[node->num_keys - 1].id << " above its upper bound";
    return -1;
  }

  uint32_t count = node->num_keys;
  int depth = 0;
  if (!node->leaf) {
    const Inner* inner = AsInner(node);
    for (unsigned i = 0; i <= inner->num_keys; ++i) {
      const ScoreKey* child_lo = i > 0 ? &items[i - 1] : lo;
      const ScoreKey* child_hi = i < inner->num_keys ? &items[i] : hi;
      int child_depth = ValidateSubtree(inner->children[i], child_lo, child_hi, false);
      if (child_depth < 0 || (i > 0 && child_depth != depth))
        return -1;
      depth = child_depth;
      count += inner->children[i]->count;
    }
  }

  if (count != node->count) {
    LOG(ERROR) << "Expected subtree count " << count << " got " << node->count;
    return -1;
  }

  return depth + 1;
}

bool ScoreTree::DEBUG_Validate() const {
  if (!root_)
    return height_ == 0 && NodeCount() == 0;

  int depth = ValidateSubtree(root_, nullptr, nullptr, true);
  if (depth != int(height_)) {
    LOG(ERROR) << "Leaf depth " << depth << ", height " << height_;
    return false;
  }
  return true;
}

}  // namespace gzset
